#include "Validator.hpp"
#include "Token.hpp"
#include "Crypto.hpp"

#include "../helpers/Encoding.hpp"

#include <stdexcept>

CValidator::CValidator(std::shared_ptr<const CSigner> signer) : m_signer(std::move(signer)) {
    if (!m_signer)
        throw std::invalid_argument("CValidator: no signer");
}

std::expected<std::string, eTokenError> CValidator::verify(std::string_view token) const {
    const auto TOKEN = CToken::fromString(token);
    if (!TOKEN)
        return std::unexpected(TOKEN_ERROR_MALFORMED);

    const auto SIGNATURE = NEncoding::fromBase64(TOKEN->signature());
    if (!SIGNATURE)
        return std::unexpected(TOKEN_ERROR_MALFORMED);

    if (!m_signer->verify(TOKEN->signedMaterial(), *SIGNATURE))
        return std::unexpected(TOKEN_ERROR_BAD_SIGNATURE);

    return TOKEN->raw();
}

std::optional<std::string> CValidator::extractRaw(std::string_view token) const {
    auto result = verify(token);
    if (!result)
        return std::nullopt;

    return std::move(*result);
}

bool CValidator::tokensMatch(std::string_view a, std::string_view b) const {
    const auto RAWA = extractRaw(a);
    if (!RAWA)
        return false;

    const auto RAWB = extractRaw(b);
    if (!RAWB)
        return false;

    return rawEquals(*RAWA, *RAWB);
}

bool CValidator::rawEquals(std::string_view a, std::string_view b) {
    return NCrypto::constantTimeEquals(a, b);
}
