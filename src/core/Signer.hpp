#pragma once

#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

#include <openssl/evp.h>

#include "SigningKey.hpp"

class CSigner {
  public:
    // throws std::runtime_error if HMAC is unavailable
    explicit CSigner(CSigningKey key);
    ~CSigner();

    CSigner(const CSigner&)            = delete;
    CSigner& operator=(const CSigner&) = delete;

    // throws std::runtime_error if the MAC backend fails
    std::vector<uint8_t> sign(std::string_view material) const;
    bool                 verify(std::string_view material, std::span<const uint8_t> signature) const;

    eSigningAlgorithm    algorithm() const;
    size_t               signatureLength() const;

  private:
    CSigningKey          m_key;
    EVP_MAC*             m_mac = nullptr;
};
