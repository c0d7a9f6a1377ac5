#pragma once

#include <string>
#include <string_view>
#include <span>
#include <cstdint>

namespace NCrypto {
    /*
        Compares without branching on content. Inputs of different length
        are walked to the longer length before failing, so a shared prefix
        takes as long as a mismatch on the first byte.
    */
    bool        constantTimeEquals(std::string_view a, std::string_view b);
    bool        constantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b);

    // last openssl error queue entry, for logs
    std::string lastOpenSSLError();
};
