#include "SecureRandom.hpp"
#include "Crypto.hpp"

#include "../debug/log.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/params.h>

constexpr const unsigned int DRBG_STRENGTH    = 256;
constexpr const size_t       DRBG_MAX_REQUEST = 1 << 16;

CSecureRandom::CSecureRandom() {
    EVP_RAND* rand = EVP_RAND_fetch(nullptr, "CTR-DRBG", nullptr);
    if (!rand) {
        Debug::log(CRIT, "CSecureRandom: EVP_RAND_fetch: err {}", NCrypto::lastOpenSSLError());
        throw std::runtime_error("CTR-DRBG unavailable");
    }

    // no parent: seeded straight from the OS entropy source
    m_ctx = EVP_RAND_CTX_new(rand, nullptr);
    EVP_RAND_free(rand);

    if (!m_ctx) {
        Debug::log(CRIT, "CSecureRandom: EVP_RAND_CTX_new: err {}", NCrypto::lastOpenSSLError());
        throw std::runtime_error("DRBG context failed");
    }

    char             cipher[] = "AES-256-CTR";
    const OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_DRBG_PARAM_CIPHER, cipher, 0),
        OSSL_PARAM_construct_end(),
    };

    if (!EVP_RAND_instantiate(m_ctx, DRBG_STRENGTH, 0, nullptr, 0, params)) {
        Debug::log(CRIT, "CSecureRandom: EVP_RAND_instantiate: err {}", NCrypto::lastOpenSSLError());
        EVP_RAND_CTX_free(m_ctx);
        m_ctx = nullptr;
        throw std::runtime_error("DRBG instantiate failed");
    }

    // warm-up, first draw is discarded
    std::array<uint8_t, 20> discard;
    fill(discard);

    Debug::log(LOG, "Secure random generator seeded");
}

CSecureRandom::~CSecureRandom() {
    if (m_ctx)
        EVP_RAND_CTX_free(m_ctx);
}

void CSecureRandom::fill(std::span<uint8_t> out) {
    std::lock_guard<std::mutex> lg(m_mutex);

    size_t                      done = 0;
    while (done < out.size()) {
        const size_t CHUNK = std::min(out.size() - done, DRBG_MAX_REQUEST);
        if (!EVP_RAND_generate(m_ctx, out.data() + done, CHUNK, DRBG_STRENGTH, 0, nullptr, 0)) {
            Debug::log(ERR, "CSecureRandom::fill: EVP_RAND_generate: err {}", NCrypto::lastOpenSSLError());
            throw std::runtime_error("DRBG generate failed");
        }
        done += CHUNK;
    }
}

std::vector<uint8_t> CSecureRandom::bytes(size_t len) {
    std::vector<uint8_t> out;
    out.resize(len);
    fill(out);
    return out;
}
