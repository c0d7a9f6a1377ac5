#include "Encoding.hpp"

#include <charconv>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <openssl/evp.h>

std::string NEncoding::toHex(std::span<const uint8_t> bytes) {
    return fmt::format("{:02x}", fmt::join(bytes, ""));
}

std::optional<std::vector<uint8_t>> NEncoding::fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0)
        return std::nullopt;

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        uint8_t    byte = 0;
        const auto PAIR = hex.substr(i, 2);
        const auto RES  = std::from_chars(PAIR.data(), PAIR.data() + PAIR.size(), byte, 16);
        if (RES.ec != std::errc{} || RES.ptr != PAIR.data() + PAIR.size())
            return std::nullopt;
        bytes.emplace_back(byte);
    }

    return bytes;
}

std::string NEncoding::toBase64(std::span<const uint8_t> bytes) {
    if (bytes.empty())
        return "";

    std::string out;
    out.resize(4 * ((bytes.size() + 2) / 3));

    const int LEN = EVP_EncodeBlock((unsigned char*)out.data(), bytes.data(), (int)bytes.size());
    out.resize(LEN < 0 ? 0 : LEN);

    return out;
}

std::optional<std::vector<uint8_t>> NEncoding::fromBase64(std::string_view b64) {
    if (b64.empty() || b64.size() % 4 != 0)
        return std::nullopt;

    std::vector<uint8_t> out;
    out.resize(b64.size() / 4 * 3);

    const int LEN = EVP_DecodeBlock(out.data(), (const unsigned char*)b64.data(), (int)b64.size());
    if (LEN < 0)
        return std::nullopt;

    // EVP_DecodeBlock keeps the padding as zero bytes
    size_t padding = 0;
    if (b64.back() == '=')
        padding++;
    if (b64.size() > 1 && b64[b64.size() - 2] == '=')
        padding++;

    if ((size_t)LEN < padding)
        return std::nullopt;

    out.resize(LEN - padding);

    // EVP_DecodeBlock tolerates whitespace and non-zero trailing bits
    if (toBase64(out) != b64)
        return std::nullopt;

    return out;
}

bool NEncoding::isLowerHex(std::string_view s) {
    for (const auto& c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
            return false;
    }
    return true;
}

bool NEncoding::isDigits(std::string_view s) {
    for (const auto& c : s) {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}
