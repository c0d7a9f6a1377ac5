#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

// wire form of a signed token: raw-nonce-signature
class CToken {
  public:
    CToken(const std::string& raw, uint64_t nonce, const std::string& signature);

    // nullopt unless the string is exactly three non-empty segments with a decimal nonce
    static std::optional<CToken> fromString(std::string_view token);

    // what gets signed
    static std::string           signedMaterial(std::string_view raw, uint64_t nonce);

    std::string                  tokenString() const;
    std::string                  signedMaterial() const;

    const std::string&           raw() const;
    uint64_t                     nonce() const;
    const std::string&           signature() const;

  private:
    std::string                  m_raw, m_signature;
    uint64_t                     m_nonce = 0;
};
