#include "TokenFactory.hpp"
#include "Token.hpp"
#include "CsrfTypes.hpp"

#include "../helpers/Encoding.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

CTokenFactory::CTokenFactory(std::shared_ptr<const CSigner> signer, CSecureRandom& random, ClockFn clock) :
    m_signer(std::move(signer)), m_random(random), m_clock(std::move(clock)) {
    if (!m_signer)
        throw std::invalid_argument("CTokenFactory: no signer");

    if (!m_clock)
        m_clock = [] { return std::chrono::system_clock::now(); };
}

std::string CTokenFactory::generateRaw() const {
    std::array<uint8_t, CSRF_TOKEN_LENGTH> bytes;
    m_random.fill(bytes);
    return NEncoding::toHex(bytes);
}

std::string CTokenFactory::newToken() const {
    return signExisting(generateRaw());
}

std::string CTokenFactory::signExisting(const std::string& raw) const {
    const auto NONCE     = nextNonce();
    const auto SIGNATURE = m_signer->sign(CToken::signedMaterial(raw, NONCE));

    return CToken(raw, NONCE, NEncoding::toBase64(SIGNATURE)).tokenString();
}

uint64_t CTokenFactory::nextNonce() const {
    const auto NOW  = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(m_clock().time_since_epoch()).count();

    // the clock can repeat (same millisecond, frozen or stepped back), the nonce can't
    uint64_t   last = m_lastNonce.load();
    uint64_t   next = 0;
    do {
        next = std::max(NOW, last + 1);
    } while (!m_lastNonce.compare_exchange_weak(last, next));

    return next;
}
