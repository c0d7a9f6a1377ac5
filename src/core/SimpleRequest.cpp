#include "SimpleRequest.hpp"

#include "../helpers/StringUtils.hpp"

#include <algorithm>

CSimpleRequest::CSimpleRequest(const std::string& method, const std::string& resource) : m_method(method), m_resource(resource) {
    ;
}

CSimpleRequest CSimpleRequest::fromRawHeaders(const std::string& method, const std::string& resource, const std::vector<std::pair<std::string, std::string>>& headers) {
    CSimpleRequest req(method, resource);

    for (const auto& [k, v] : headers) {
        if (NStringUtils::equalsIgnoreCase(k, "Cookie")) {
            for (auto& [name, value] : NCookieUtils::parseCookieHeader(v)) {
                req.withCookie(name, value);
            }
            continue;
        }

        req.withHeader(k, v);
    }

    return req;
}

CSimpleRequest& CSimpleRequest::withHeader(const std::string& name, const std::string& value) {
    m_headers.emplace_back(name, value);
    return *this;
}

CSimpleRequest& CSimpleRequest::withCookie(const std::string& name, const std::string& value) {
    m_cookies.emplace_back(name, value);
    return *this;
}

std::string CSimpleRequest::method() const {
    return m_method;
}

std::string CSimpleRequest::resource() const {
    return m_resource;
}

std::optional<std::string> CSimpleRequest::header(const std::string& name) const {
    for (const auto& [k, v] : m_headers) {
        if (NStringUtils::equalsIgnoreCase(k, name))
            return v;
    }

    return std::nullopt;
}

std::optional<std::string> CSimpleRequest::cookie(const std::string& name) const {
    for (const auto& [k, v] : m_cookies) {
        if (k == name)
            return v;
    }

    return std::nullopt;
}

void CSimpleRequest::addCookie(const SCookie& cookie) {
    std::erase_if(m_cookies, [&cookie](const auto& c) { return c.first == cookie.name; });
    m_cookies.emplace_back(cookie.name, cookie.value);
}
