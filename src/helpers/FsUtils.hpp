#pragma once

#include <string>
#include <expected>

namespace NFsUtils {
    bool                                    isAbsolute(const std::string& path);
    std::expected<std::string, std::string> readFileAsString(const std::string& path);
    std::expected<void, std::string>        writePrivateFile(const std::string& path, const std::string& contents);
    // relative paths are resolved against the working directory
    std::string                             resolve(const std::string& path);
};
