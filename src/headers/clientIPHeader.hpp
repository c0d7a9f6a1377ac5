#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

#include <string>

inline constexpr char CF_CONNECTING_IP_HEADER[] = "cf-connecting-ip";
inline constexpr char X_REAL_IP_HEADER[]        = "X-Real-IP";

// set by a fronting proxy to the original client address
template <const char* HEADER_NAME>
class CClientIPHeader : public Pistache::Http::Header::Header {
  public:
    NAME(HEADER_NAME);

    CClientIPHeader() = default;

    void parse(const std::string& str) override {
        m_ip = str;
    }

    void write(std::ostream& os) const override {
        os << m_ip;
    }

    std::string ip() const {
        return m_ip;
    }

  private:
    std::string m_ip = "";
};

using CFConnectingIPHeader = CClientIPHeader<CF_CONNECTING_IP_HEADER>;
using XRealIPHeader        = CClientIPHeader<X_REAL_IP_HEADER>;
