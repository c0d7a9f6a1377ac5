#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Message.hpp"

class CGateResponse : public ICookieBearing, public IHeaderBearing {
  public:
    CGateResponse(uint16_t code = 200, const std::string& body = "");

    uint16_t                                                code() const;
    void                                                    setCode(uint16_t code);

    const std::string&                                      body() const;
    void                                                    setBody(const std::string& body);

    std::optional<std::string>                              header(const std::string& name) const override;
    void                                                    addHeader(const std::string& name, const std::string& value);
    const std::vector<std::pair<std::string, std::string>>& headers() const;

    std::optional<std::string>                              cookie(const std::string& name) const override;
    void                                                    addCookie(const SCookie& cookie) override;
    std::optional<SCookie>                                  cookieEntry(const std::string& name) const;
    const std::vector<SCookie>&                             cookies() const;

  private:
    uint16_t                                         m_code = 200;
    std::string                                      m_body;
    std::vector<std::pair<std::string, std::string>> m_headers;
    std::vector<SCookie>                             m_cookies;
};
