#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

constexpr const char*  CSRF_DEFAULT_HEADER_NAME = "X-Csrf-Token";
constexpr const char*  CSRF_DEFAULT_COOKIE_NAME = "csrf-token";
constexpr const size_t CSRF_TOKEN_LENGTH        = 32; // raw random bytes per token
constexpr const char   CSRF_TOKEN_DELIMITER     = '-';

enum eSigningAlgorithm : uint8_t {
    SIGNING_ALGORITHM_HMAC_SHA1 = 0,
    SIGNING_ALGORITHM_HMAC_SHA256,
};

// reasons a token was refused. Never sent to the client.
enum eTokenError : uint8_t {
    TOKEN_ERROR_MALFORMED = 0,
    TOKEN_ERROR_BAD_SIGNATURE,
    TOKEN_ERROR_MISSING,
    TOKEN_ERROR_MISMATCH,
};

enum eGateAction : uint8_t {
    GATE_ACTION_NONE = 0,
    GATE_ACTION_EMBED,
    GATE_ACTION_ROTATE,
    GATE_ACTION_REJECT,
    GATE_ACTION_ABSENT,
};

class CInvalidKeyError : public std::runtime_error {
  public:
    explicit CInvalidKeyError(const std::string& what) : std::runtime_error(what) {
        ;
    }
};

namespace NCsrfTypes {
    const char* tokenErrorToString(eTokenError e);
    const char* gateActionToString(eGateAction a);
    const char* algorithmToString(eSigningAlgorithm a);
    const char* algorithmDigestName(eSigningAlgorithm a);
    size_t      algorithmKeyLength(eSigningAlgorithm a);
};
