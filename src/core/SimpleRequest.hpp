#pragma once

#include <string>
#include <utility>
#include <vector>

#include "Message.hpp"

// in-memory request, for hosts that already parsed the request line and headers
class CSimpleRequest : public IGateRequest {
  public:
    CSimpleRequest(const std::string& method, const std::string& resource = "/");

    // Cookie headers are split into cookies, everything else is kept as a header
    static CSimpleRequest                            fromRawHeaders(const std::string& method, const std::string& resource,
                                                                    const std::vector<std::pair<std::string, std::string>>& headers);

    CSimpleRequest&                                  withHeader(const std::string& name, const std::string& value);
    CSimpleRequest&                                  withCookie(const std::string& name, const std::string& value);

    std::string                                      method() const override;
    std::string                                      resource() const override;
    std::optional<std::string>                       header(const std::string& name) const override;
    std::optional<std::string>                       cookie(const std::string& name) const override;
    void                                             addCookie(const SCookie& cookie) override;

  private:
    std::string                                      m_method, m_resource;
    std::vector<std::pair<std::string, std::string>> m_headers;
    std::vector<std::pair<std::string, std::string>> m_cookies;
};
