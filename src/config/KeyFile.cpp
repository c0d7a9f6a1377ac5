#include "KeyFile.hpp"
#include "Config.hpp"

#include "../debug/log.hpp"
#include "../helpers/Encoding.hpp"
#include "../helpers/FsUtils.hpp"

#include <filesystem>

std::expected<CSigningKey, std::string> NKeyFile::loadOrCreate(const std::string& path, eSigningAlgorithm algorithm) {
    if (!std::filesystem::exists(path)) {
        Debug::log(LOG, "No signing key at {}, generating one.", path);

        try {
            auto       key     = CSigningKey::generate(algorithm);
            const auto WRITTEN = NFsUtils::writePrivateFile(path, NEncoding::toHex(key.bytes()));
            if (!WRITTEN)
                return std::unexpected(WRITTEN.error());
            return key;
        } catch (CInvalidKeyError& e) { return std::unexpected(std::string{"Keygen failed: "} + e.what()); }
    }

    const auto CONTENTS = NFsUtils::readFileAsString(path);
    if (!CONTENTS)
        return std::unexpected("Couldn't read the key at " + path);

    const auto BYTES = NEncoding::fromHex(CONTENTS.value());
    if (!BYTES)
        return std::unexpected("Key at " + path + " is not hex");

    try {
        auto key = CSigningKey::fromBytes(*BYTES, algorithm);
        Debug::log(LOG, "Read signing key from {}", path);
        return key;
    } catch (CInvalidKeyError& e) { return std::unexpected(std::string{"Bad key at "} + path + ": " + e.what()); }
}

std::expected<CSigningKey, std::string> NKeyFile::fromConfig(const CConfig& config) {
    if (!config.m_config.csrf.signing_key.empty()) {
        const auto BYTES = NEncoding::fromHex(config.m_config.csrf.signing_key);
        if (!BYTES)
            return std::unexpected("csrf.signing_key is not hex");

        try {
            return CSigningKey::fromBytes(*BYTES, config.signingAlgorithm());
        } catch (CInvalidKeyError& e) { return std::unexpected(std::string{"Bad csrf.signing_key: "} + e.what()); }
    }

    const auto DATADIR = NFsUtils::resolve(config.m_config.data_dir);
    const auto KEYFILE = NFsUtils::isAbsolute(config.m_config.csrf.key_file) ? config.m_config.csrf.key_file : DATADIR + "/" + config.m_config.csrf.key_file;

    return loadOrCreate(KEYFILE, config.signingAlgorithm());
}
