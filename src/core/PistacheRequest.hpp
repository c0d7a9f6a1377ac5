#pragma once

#include <string>
#include <utility>
#include <vector>

#include <pistache/http.h>

#include "Message.hpp"

// IGateRequest view of a Pistache request. The request must outlive it.
class CPistacheRequest : public IGateRequest {
  public:
    explicit CPistacheRequest(const Pistache::Http::Request& req);

    std::string                method() const override;
    std::string                resource() const override;
    std::optional<std::string> header(const std::string& name) const override;
    std::optional<std::string> cookie(const std::string& name) const override;
    // Pistache's jar is read-only, added cookies shadow it
    void                       addCookie(const SCookie& cookie) override;

  private:
    const Pistache::Http::Request&                   m_req;
    std::vector<std::pair<std::string, std::string>> m_addedCookies;
};
