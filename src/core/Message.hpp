#pragma once

#include <optional>
#include <string>

#include "../helpers/CookieUtils.hpp"

/*
    What the gate needs to know about the host's request and response types.
    Hosts adapt their own types to these, see PistacheRequest and SimpleRequest.
*/

class IClassifiable {
  public:
    virtual ~IClassifiable() = default;

    virtual std::string method() const   = 0;
    virtual std::string resource() const = 0;
};

class ICookieBearing {
  public:
    virtual ~ICookieBearing() = default;

    virtual std::optional<std::string> cookie(const std::string& name) const = 0;
    // replaces a cookie with the same name
    virtual void                       addCookie(const SCookie& cookie) = 0;
};

class IHeaderBearing {
  public:
    virtual ~IHeaderBearing() = default;

    // case-insensitive
    virtual std::optional<std::string> header(const std::string& name) const = 0;
};

class IGateRequest : public IClassifiable, public ICookieBearing, public IHeaderBearing {
  public:
    virtual ~IGateRequest() = default;
};
