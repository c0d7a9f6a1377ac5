#include "Crypto.hpp"

#include <algorithm>

#include <openssl/crypto.h>
#include <openssl/err.h>

bool NCrypto::constantTimeEquals(std::string_view a, std::string_view b) {
    return constantTimeEquals(std::span<const uint8_t>{(const uint8_t*)a.data(), a.size()}, std::span<const uint8_t>{(const uint8_t*)b.data(), b.size()});
}

bool NCrypto::constantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() == b.size())
        return a.empty() || CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;

    const size_t     LONGEST = std::max(a.size(), b.size());
    volatile uint8_t diff    = 1;

    for (size_t i = 0; i < LONGEST; ++i) {
        const uint8_t A = i < a.size() ? a[i] : 0;
        const uint8_t B = i < b.size() ? b[i] : 0;
        diff            = diff | (A ^ B);
    }

    return diff == 0;
}

std::string NCrypto::lastOpenSSLError() {
    const auto ERRCODE = ERR_get_error();
    if (ERRCODE == 0)
        return "no error";

    char buf[256];
    ERR_error_string_n(ERRCODE, buf, sizeof(buf));
    return buf;
}
