#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "CsrfTypes.hpp"
#include "GateResponse.hpp"
#include "Message.hpp"
#include "SecureRandom.hpp"
#include "Signer.hpp"
#include "TokenFactory.hpp"
#include "Validator.hpp"

// nullopt means the downstream had nothing for this request
using DownstreamFn    = std::function<std::optional<CGateResponse>(const IGateRequest&)>;
using SafetyPredicate = std::function<bool(const IGateRequest&)>;

struct SGateOptions {
    std::string     headerName = CSRF_DEFAULT_HEADER_NAME;
    std::string     cookieName = CSRF_DEFAULT_COOKIE_NAME;

    ClockFn         clock;  // system clock if empty
    SafetyPredicate isSafe; // RFC 9110 safe methods if empty

    // the cookie must stay readable by scripts, they echo it in the header
    std::string     cookiePath     = "/";
    std::string     cookieDomain   = "";
    std::string     cookieSameSite = "Lax";
    bool            cookieSecure   = false;
    bool            cookieHttpOnly = false;
};

struct SGateResult {
    eGateAction   action = GATE_ACTION_NONE;
    CGateResponse response;
};

/*
    Double-submit cookie gate.

    Safe requests are forwarded and get a token cookie: a fresh one on first
    visit, a re-signed copy of the existing one otherwise. Unsafe requests
    need the cookie and the header, both validly signed and carrying the same
    raw value, before they are forwarded. Every forwarded request leaves with
    a newly signed cookie so the wire value never repeats (BREACH).

    Anything wrong with the tokens ends in a bare 401, the downstream is not
    called and no cookie is set. Exceptions from the downstream propagate.
*/
class CRequestGate {
  public:
    // throws CInvalidKeyError
    CRequestGate(SGateOptions options, CSigningKey key, CSecureRandom& random);

    CRequestGate(const CRequestGate&)            = delete;
    CRequestGate& operator=(const CRequestGate&) = delete;

    static std::unique_ptr<CRequestGate> withGeneratedKey(SGateOptions options, CSecureRandom& random, eSigningAlgorithm algorithm = SIGNING_ALGORITHM_HMAC_SHA256);
    static std::unique_ptr<CRequestGate> withKeyBytes(std::span<const uint8_t> keyBytes, SGateOptions options, CSecureRandom& random,
                                                      eSigningAlgorithm algorithm = SIGNING_ALGORITHM_HMAC_SHA256);

    SGateResult                          handle(const IGateRequest& req, const DownstreamFn& downstream) const;

    // downstream wrapped so it runs behind handle(). The gate must outlive the result.
    DownstreamFn                         protect(DownstreamFn downstream) const;

    // stamps a fresh token on a response, e.g. right after login. nullopt becomes a 404.
    CGateResponse                        embedNew(std::optional<CGateResponse> response) const;
    DownstreamFn                         withNewToken(DownstreamFn downstream) const;

    std::string                          newToken() const;
    std::optional<std::string>           extractRaw(std::string_view token) const;

    const SGateOptions&                  options() const;

  private:
    SGateResult                          validateOrEmbed(const IGateRequest& req, const DownstreamFn& downstream) const;
    SGateResult                          checkCsrf(const IGateRequest& req, const DownstreamFn& downstream) const;

    SGateResult                          reject(const IGateRequest& req, eTokenError why, const char* what) const;
    SGateResult                          forwardAndStamp(const IGateRequest& req, const DownstreamFn& downstream, const std::optional<std::string>& raw) const;
    SCookie                              makeCookie(const std::string& token) const;

    SGateOptions                         m_options;
    std::shared_ptr<const CSigner>       m_signer;
    CTokenFactory                        m_factory;
    CValidator                           m_validator;
};

inline std::unique_ptr<CRequestGate> g_pRequestGate;
