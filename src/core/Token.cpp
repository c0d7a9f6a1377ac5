#include "Token.hpp"
#include "CsrfTypes.hpp"

#include "../helpers/Encoding.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/format.h>

CToken::CToken(const std::string& raw, uint64_t nonce, const std::string& signature) : m_raw(raw), m_signature(signature), m_nonce(nonce) {
    ;
}

std::optional<CToken> CToken::fromString(std::string_view token) {
    if (std::count(token.begin(), token.end(), CSRF_TOKEN_DELIMITER) != 2)
        return std::nullopt;

    const auto FIRST  = token.find(CSRF_TOKEN_DELIMITER);
    const auto SECOND = token.find(CSRF_TOKEN_DELIMITER, FIRST + 1);

    const auto RAW       = token.substr(0, FIRST);
    const auto NONCE     = token.substr(FIRST + 1, SECOND - FIRST - 1);
    const auto SIGNATURE = token.substr(SECOND + 1);

    if (RAW.empty() || NONCE.empty() || SIGNATURE.empty())
        return std::nullopt;

    // from_chars alone would take a leading '-' on signed types, and we want no leftovers
    if (!NEncoding::isDigits(NONCE))
        return std::nullopt;

    // the signature covers the printed nonce, so only one spelling of it may parse
    if (NONCE.size() > 1 && NONCE.front() == '0')
        return std::nullopt;

    uint64_t   nonce = 0;
    const auto RES   = std::from_chars(NONCE.data(), NONCE.data() + NONCE.size(), nonce);
    if (RES.ec != std::errc{} || RES.ptr != NONCE.data() + NONCE.size())
        return std::nullopt;

    return CToken(std::string{RAW}, nonce, std::string{SIGNATURE});
}

std::string CToken::signedMaterial(std::string_view raw, uint64_t nonce) {
    return fmt::format("{}{}{}", raw, CSRF_TOKEN_DELIMITER, nonce);
}

std::string CToken::tokenString() const {
    return fmt::format("{}{}{}", signedMaterial(), CSRF_TOKEN_DELIMITER, m_signature);
}

std::string CToken::signedMaterial() const {
    return signedMaterial(m_raw, m_nonce);
}

const std::string& CToken::raw() const {
    return m_raw;
}

uint64_t CToken::nonce() const {
    return m_nonce;
}

const std::string& CToken::signature() const {
    return m_signature;
}
