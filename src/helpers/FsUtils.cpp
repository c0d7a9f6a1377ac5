#include "FsUtils.hpp"

#include <fstream>
#include <filesystem>


bool NFsUtils::isAbsolute(const std::string& sv) {
    return sv.size() > 0 && (*sv.begin() == '/' || *sv.begin() == '~');
}

std::expected<std::string, std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.good())
        return std::unexpected("No file");
    auto res = std::string((std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>()));
    if (!res.empty() && res.back() == '\n')
        res.pop_back();
    return res;
}

std::expected<void, std::string> NFsUtils::writePrivateFile(const std::string& path, const std::string& contents) {
    {
        std::ofstream ofs(path, std::ios::trunc);
        if (!ofs.good())
            return std::unexpected("Can't open " + path + " for writing");
        ofs << contents << "\n";
        if (!ofs.good())
            return std::unexpected("Failed writing " + path);
    }

    std::error_code ec;
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write, std::filesystem::perm_options::replace, ec);
    if (ec)
        return std::unexpected("Can't restrict permissions of " + path + ": " + ec.message());

    return {};
}

std::string NFsUtils::resolve(const std::string& path) {
    return isAbsolute(path) ? path : (std::filesystem::current_path() / path).string();
}
