#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>

bool NStringUtils::equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) { return std::tolower((unsigned char)x) == std::tolower((unsigned char)y); });
}

std::string_view NStringUtils::trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

std::string NStringUtils::toLower(std::string_view s) {
    std::string LC{s};
    std::transform(LC.begin(), LC.end(), LC.begin(), ::tolower);
    return LC;
}
