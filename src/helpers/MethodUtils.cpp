#include "MethodUtils.hpp"

bool NMethodUtils::isSafe(std::string_view method) {
    return method == "GET" || method == "HEAD" || method == "OPTIONS" || method == "TRACE";
}
