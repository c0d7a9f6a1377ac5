#pragma once

#include <string_view>

namespace NMethodUtils {
    // RFC 9110 safe methods: GET, HEAD, OPTIONS, TRACE. Methods are case-sensitive.
    bool isSafe(std::string_view method);
};
