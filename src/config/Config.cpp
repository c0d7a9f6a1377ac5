#include "Config.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>

#include "../helpers/FsUtils.hpp"
#include "../helpers/Encoding.hpp"
#include "../helpers/StringUtils.hpp"

#include "../debug/log.hpp"

static std::expected<eSigningAlgorithm, std::string> strToAlgorithm(const std::string& s) {
    const auto LC = NStringUtils::toLower(s);

    if (LC == "sha1" || LC == "hmacsha1")
        return SIGNING_ALGORITHM_HMAC_SHA1;
    if (LC == "sha256" || LC == "hmacsha256")
        return SIGNING_ALGORITHM_HMAC_SHA256;

    return std::unexpected("Invalid signing algorithm: " + s);
}

CConfig::CConfig(const std::string& path) {
    const auto CONTENTS = NFsUtils::readFileAsString(path);

    if (!CONTENTS.has_value())
        Debug::die("No config at {}", path);

    const auto RESULT = parse(CONTENTS.value());

    if (!RESULT.has_value())
        Debug::die("Config has bad format: {}", RESULT.error());
}

std::expected<void, std::string> CConfig::parse(const std::string& jsonc) {
    auto json = glz::read_jsonc<SConfig>(jsonc);

    if (!json.has_value())
        return std::unexpected(glz::format_error(json.error(), jsonc));

    m_config = json.value();

    // parse some datas
    const auto ALGO = strToAlgorithm(m_config.csrf.signing_algorithm);
    if (!ALGO.has_value())
        return std::unexpected(ALGO.error());
    m_parsedConfigDatas.signingAlgorithm = ALGO.value();

    if (m_config.csrf.header_name.empty() || m_config.csrf.cookie_name.empty())
        return std::unexpected("csrf.header_name and csrf.cookie_name can't be empty");

    if (!m_config.csrf.signing_key.empty()) {
        const auto KEY = NEncoding::fromHex(m_config.csrf.signing_key);
        if (!KEY)
            return std::unexpected("csrf.signing_key is not valid hex");
        if (KEY->size() < NCsrfTypes::algorithmKeyLength(m_parsedConfigDatas.signingAlgorithm))
            return std::unexpected(fmt::format("csrf.signing_key is too short for {}, need {} bytes", NCsrfTypes::algorithmToString(m_parsedConfigDatas.signingAlgorithm),
                                               NCsrfTypes::algorithmKeyLength(m_parsedConfigDatas.signingAlgorithm)));
    }

    m_parsedConfigDatas.exemptResources.clear();
    for (const auto& r : m_config.csrf.exempt_resources) {
        auto re = std::make_unique<re2::RE2>(r);
        if (re->error_code() != RE2::NoError) {
            Debug::log(CRIT, "Regex \"{}\" failed to parse", r);
            return std::unexpected(fmt::format("Failed to parse regex \"{}\": {}", r, re->error()));
        }

        m_parsedConfigDatas.exemptResources.emplace_back(std::move(re));
    }

    return {};
}

bool CConfig::isSafeMethod(const std::string& method) const {
    return std::find(m_config.csrf.safe_methods.begin(), m_config.csrf.safe_methods.end(), method) != m_config.csrf.safe_methods.end();
}

bool CConfig::isExemptResource(const std::string& resource) const {
    for (const auto& re : m_parsedConfigDatas.exemptResources) {
        if (RE2::FullMatch(resource, *re))
            return true;
    }

    return false;
}

eSigningAlgorithm CConfig::signingAlgorithm() const {
    return m_parsedConfigDatas.signingAlgorithm;
}
