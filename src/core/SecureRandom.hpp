#pragma once

#include <memory>
#include <mutex>
#include <span>
#include <vector>
#include <cstdint>

#include <openssl/evp.h>

/*
    Process-wide CTR-DRBG. Seeded once from the OS at construction, then only
    reseeded by the DRBG itself on its own schedule. Draws are serialized.
*/
class CSecureRandom {
  public:
    CSecureRandom();
    ~CSecureRandom();

    CSecureRandom(const CSecureRandom&)            = delete;
    CSecureRandom& operator=(const CSecureRandom&) = delete;

    // throws std::runtime_error if the DRBG fails
    void                 fill(std::span<uint8_t> out);
    std::vector<uint8_t> bytes(size_t len);

  private:
    EVP_RAND_CTX* m_ctx = nullptr;
    std::mutex    m_mutex;
};

inline std::unique_ptr<CSecureRandom> g_pSecureRandom;
