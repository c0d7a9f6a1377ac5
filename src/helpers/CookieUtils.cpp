#include "CookieUtils.hpp"
#include "StringUtils.hpp"

#include <charconv>

#include <fmt/format.h>

std::vector<std::pair<std::string, std::string>> NCookieUtils::parseCookieHeader(std::string_view header) {
    std::vector<std::pair<std::string, std::string>> cookies;

    while (!header.empty()) {
        const auto       SEMI = header.find(';');
        std::string_view pair = NStringUtils::trim(header.substr(0, SEMI));
        header                = SEMI == std::string_view::npos ? std::string_view{} : header.substr(SEMI + 1);

        const auto EQ = pair.find('=');
        if (EQ == std::string_view::npos || EQ == 0)
            continue;

        auto value = NStringUtils::trim(pair.substr(EQ + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);

        cookies.emplace_back(std::string{NStringUtils::trim(pair.substr(0, EQ))}, std::string{value});
    }

    return cookies;
}

std::optional<std::string> NCookieUtils::findCookie(std::string_view header, std::string_view name) {
    for (auto& [k, v] : parseCookieHeader(header)) {
        if (k == name)
            return v;
    }

    return std::nullopt;
}

std::string NCookieUtils::formatSetCookie(const SCookie& cookie) {
    std::string out = fmt::format("{}={}", cookie.name, cookie.value);

    if (!cookie.domain.empty())
        out += fmt::format("; Domain={}", cookie.domain);
    if (!cookie.path.empty())
        out += fmt::format("; Path={}", cookie.path);
    if (cookie.maxAge)
        out += fmt::format("; Max-Age={}", *cookie.maxAge);
    if (cookie.secure)
        out += "; Secure";
    if (cookie.httpOnly)
        out += "; HttpOnly";
    if (!cookie.sameSite.empty())
        out += fmt::format("; SameSite={}", cookie.sameSite);
    for (const auto& e : cookie.extensions) {
        out += fmt::format("; {}", e);
    }

    return out;
}

std::optional<SCookie> NCookieUtils::parseSetCookie(std::string_view setCookie) {
    SCookie    cookie;

    const auto FIRSTSEMI = setCookie.find(';');
    const auto PAIR      = NStringUtils::trim(setCookie.substr(0, FIRSTSEMI));
    const auto EQ        = PAIR.find('=');

    if (EQ == std::string_view::npos || EQ == 0)
        return std::nullopt;

    cookie.name  = NStringUtils::trim(PAIR.substr(0, EQ));
    cookie.value = NStringUtils::trim(PAIR.substr(EQ + 1));

    std::string_view rest = FIRSTSEMI == std::string_view::npos ? std::string_view{} : setCookie.substr(FIRSTSEMI + 1);

    while (!rest.empty()) {
        const auto SEMI = rest.find(';');
        const auto ATTR = NStringUtils::trim(rest.substr(0, SEMI));
        rest            = SEMI == std::string_view::npos ? std::string_view{} : rest.substr(SEMI + 1);

        if (ATTR.empty())
            continue;

        const auto ATTREQ = ATTR.find('=');
        const auto KEY    = NStringUtils::trim(ATTR.substr(0, ATTREQ));
        const auto VAL    = ATTREQ == std::string_view::npos ? std::string_view{} : NStringUtils::trim(ATTR.substr(ATTREQ + 1));

        if (NStringUtils::equalsIgnoreCase(KEY, "Domain"))
            cookie.domain = VAL;
        else if (NStringUtils::equalsIgnoreCase(KEY, "Path"))
            cookie.path = VAL;
        else if (NStringUtils::equalsIgnoreCase(KEY, "SameSite"))
            cookie.sameSite = VAL;
        else if (NStringUtils::equalsIgnoreCase(KEY, "Secure"))
            cookie.secure = true;
        else if (NStringUtils::equalsIgnoreCase(KEY, "HttpOnly"))
            cookie.httpOnly = true;
        else if (NStringUtils::equalsIgnoreCase(KEY, "Max-Age")) {
            int64_t    age = 0;
            const auto RES = std::from_chars(VAL.data(), VAL.data() + VAL.size(), age);
            if (RES.ec == std::errc{} && RES.ptr == VAL.data() + VAL.size())
                cookie.maxAge = age;
            else
                cookie.extensions.emplace_back(ATTR);
        } else
            cookie.extensions.emplace_back(ATTR);
    }

    return cookie;
}
