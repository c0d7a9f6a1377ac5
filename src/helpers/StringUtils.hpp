#pragma once

#include <string>
#include <string_view>

namespace NStringUtils {
    bool             equalsIgnoreCase(std::string_view a, std::string_view b);
    std::string_view trim(std::string_view s);
    std::string      toLower(std::string_view s);
};
