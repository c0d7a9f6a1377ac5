#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <utility>
#include <cstdint>

struct SCookie {
    std::string              name, value;
    std::string              path, domain, sameSite;
    bool                     secure   = false;
    bool                     httpOnly = false;
    std::optional<int64_t>   maxAge;
    std::vector<std::string> extensions; // other attributes, verbatim (Expires=..., Partitioned, ...)
};

namespace NCookieUtils {
    // "a=1; b=2" -> {{a, 1}, {b, 2}}, in order, duplicates kept
    std::vector<std::pair<std::string, std::string>> parseCookieHeader(std::string_view header);
    // first cookie with that name
    std::optional<std::string>                       findCookie(std::string_view header, std::string_view name);

    // value for a Set-Cookie header
    std::string                                      formatSetCookie(const SCookie& cookie);
    std::optional<SCookie>                           parseSetCookie(std::string_view setCookie);
};
