#pragma once

#include <string>

#include <pistache/http.h>

namespace NRequestUtils {
    std::string ipForRequest(const Pistache::Http::Request& req);
    std::string methodForRequest(const Pistache::Http::Request& req);
};
