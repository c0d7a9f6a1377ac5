#pragma once

#include <expected>
#include <string>

#include "../core/SigningKey.hpp"

class CConfig;

namespace NKeyFile {
    // hex key in a file. Generated and written with owner-only permissions if the file doesn't exist.
    std::expected<CSigningKey, std::string> loadOrCreate(const std::string& path, eSigningAlgorithm algorithm);

    // csrf.signing_key if set, data_dir/csrf.key_file otherwise
    std::expected<CSigningKey, std::string> fromConfig(const CConfig& config);
};
