#include "PistacheRequest.hpp"

#include "../helpers/RequestUtils.hpp"

#include <algorithm>
#include <sstream>

CPistacheRequest::CPistacheRequest(const Pistache::Http::Request& req) : m_req(req) {
    ;
}

std::string CPistacheRequest::method() const {
    return NRequestUtils::methodForRequest(m_req);
}

std::string CPistacheRequest::resource() const {
    return m_req.resource();
}

std::optional<std::string> CPistacheRequest::header(const std::string& name) const {
    // custom headers like ours are only kept raw, registered ones only typed
    try {
        return m_req.headers().getRaw(name).value();
    } catch (std::exception& e) {
        ; // not raw
    }

    const auto TYPED = m_req.headers().tryGet(name);
    if (!TYPED)
        return std::nullopt;

    std::stringstream ss;
    TYPED->write(ss);
    return ss.str();
}

std::optional<std::string> CPistacheRequest::cookie(const std::string& name) const {
    const auto IT = std::find_if(m_addedCookies.begin(), m_addedCookies.end(), [&name](const auto& c) { return c.first == name; });
    if (IT != m_addedCookies.end())
        return IT->second;

    if (!m_req.cookies().has(name))
        return std::nullopt;

    return m_req.cookies().get(name).value;
}

void CPistacheRequest::addCookie(const SCookie& cookie) {
    std::erase_if(m_addedCookies, [&cookie](const auto& c) { return c.first == cookie.name; });
    m_addedCookies.emplace_back(cookie.name, cookie.value);
}
