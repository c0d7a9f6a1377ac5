#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "Signer.hpp"
#include "SecureRandom.hpp"

using ClockFn = std::function<std::chrono::system_clock::time_point()>;

class CTokenFactory {
  public:
    CTokenFactory(std::shared_ptr<const CSigner> signer, CSecureRandom& random, ClockFn clock);

    // fresh random raw value, signed
    std::string newToken() const;

    // same raw value, new nonce and signature. Used to rotate a validated token.
    std::string signExisting(const std::string& raw) const;

    // CSRF_TOKEN_LENGTH random bytes, hex
    std::string generateRaw() const;

  private:
    uint64_t                         nextNonce() const;

    std::shared_ptr<const CSigner>   m_signer;
    CSecureRandom&                   m_random;
    ClockFn                          m_clock;

    mutable std::atomic<uint64_t>    m_lastNonce = 0;
};
