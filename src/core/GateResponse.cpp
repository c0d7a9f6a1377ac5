#include "GateResponse.hpp"

#include "../helpers/StringUtils.hpp"

#include <algorithm>

CGateResponse::CGateResponse(uint16_t code, const std::string& body) : m_code(code), m_body(body) {
    ;
}

uint16_t CGateResponse::code() const {
    return m_code;
}

void CGateResponse::setCode(uint16_t code) {
    m_code = code;
}

const std::string& CGateResponse::body() const {
    return m_body;
}

void CGateResponse::setBody(const std::string& body) {
    m_body = body;
}

std::optional<std::string> CGateResponse::header(const std::string& name) const {
    for (const auto& [k, v] : m_headers) {
        if (NStringUtils::equalsIgnoreCase(k, name))
            return v;
    }

    return std::nullopt;
}

void CGateResponse::addHeader(const std::string& name, const std::string& value) {
    m_headers.emplace_back(name, value);
}

const std::vector<std::pair<std::string, std::string>>& CGateResponse::headers() const {
    return m_headers;
}

std::optional<std::string> CGateResponse::cookie(const std::string& name) const {
    const auto C = cookieEntry(name);
    if (!C)
        return std::nullopt;

    return C->value;
}

void CGateResponse::addCookie(const SCookie& cookie) {
    std::erase_if(m_cookies, [&cookie](const SCookie& c) { return c.name == cookie.name; });
    m_cookies.emplace_back(cookie);
}

std::optional<SCookie> CGateResponse::cookieEntry(const std::string& name) const {
    const auto IT = std::find_if(m_cookies.begin(), m_cookies.end(), [&name](const SCookie& c) { return c.name == name; });
    if (IT == m_cookies.end())
        return std::nullopt;

    return *IT;
}

const std::vector<SCookie>& CGateResponse::cookies() const {
    return m_cookies;
}
