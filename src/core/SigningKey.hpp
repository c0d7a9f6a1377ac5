#pragma once

#include <vector>
#include <span>
#include <cstdint>

#include "CsrfTypes.hpp"

// HMAC key material. Never log bytes().
class CSigningKey {
  public:
    ~CSigningKey();
    CSigningKey(const CSigningKey& other) = default;
    CSigningKey(CSigningKey&& other)      = default;

    // fresh random key of the algorithm's length
    static CSigningKey        generate(eSigningAlgorithm algorithm = SIGNING_ALGORITHM_HMAC_SHA256);

    /*
        Builds a key from externally supplied bytes, e.g. from a config file.
        Input longer than the algorithm's key length is truncated, shorter input throws CInvalidKeyError.
    */
    static CSigningKey        fromBytes(std::span<const uint8_t> bytes, eSigningAlgorithm algorithm = SIGNING_ALGORITHM_HMAC_SHA256);

    std::span<const uint8_t>  bytes() const;
    eSigningAlgorithm         algorithm() const;

  private:
    CSigningKey(std::vector<uint8_t>&& bytes, eSigningAlgorithm algorithm);

    std::vector<uint8_t>      m_bytes;
    eSigningAlgorithm         m_algorithm = SIGNING_ALGORITHM_HMAC_SHA256;
};
