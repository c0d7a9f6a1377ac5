#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <span>
#include <cstdint>

namespace NEncoding {
    std::string                         toHex(std::span<const uint8_t> bytes);
    std::optional<std::vector<uint8_t>> fromHex(std::string_view hex);

    // standard alphabet, padded
    std::string toBase64(std::span<const uint8_t> bytes);
    // only accepts the canonical encoding, i.e. what toBase64 would produce
    std::optional<std::vector<uint8_t>> fromBase64(std::string_view b64);

    bool                                isLowerHex(std::string_view s);
    bool                                isDigits(std::string_view s);
};
