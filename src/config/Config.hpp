#pragma once

#include <string>
#include <memory>
#include <vector>
#include <expected>

#include <re2/re2.h>

#include "../core/CsrfTypes.hpp"

class CConfig {
  public:
    // defaults only
    CConfig() = default;
    // reads and parses a file, dies on any error
    CConfig(const std::string& path);

    struct SProxyRule {
        std::string host        = "";
        std::string destination = "";
    };

    struct SCsrfConfig {
        std::string              header_name       = CSRF_DEFAULT_HEADER_NAME;
        std::string              cookie_name       = CSRF_DEFAULT_COOKIE_NAME;
        std::string              signing_algorithm = "sha256";
        std::string              signing_key       = ""; // hex, takes precedence over key_file
        std::string              key_file          = "csrf.key";
        std::vector<std::string> safe_methods      = {"GET", "HEAD", "OPTIONS", "TRACE"};
        std::vector<std::string> exempt_resources  = {};
        std::string              cookie_path       = "/";
        std::string              cookie_domain     = "";
        bool                     cookie_secure     = true;
        std::string              cookie_same_site  = "Lax";
    };

    struct SLoggingConfig {
        bool        log_traffic        = false;
        std::string traffic_log_schema = "epoch,ip,method,resource,action";
        std::string traffic_log_file   = "";
    };

    struct SConfig {
        int                     port              = 3001;
        std::string             forward_address   = "127.0.0.1:3000";
        std::string             data_dir          = "";
        unsigned long int       max_request_size  = 10000000; // 10MB
        unsigned long int       proxy_timeout_sec = 120;      // 2 minutes
        bool                    trace_logging     = false;
        bool                    async_proxy       = true;
        std::vector<SProxyRule> proxy_rules;
        SCsrfConfig             csrf;
        SLoggingConfig          logging;
    } m_config;

    // parses jsonc and validates what the gate will need
    std::expected<void, std::string> parse(const std::string& jsonc);

    bool                             isSafeMethod(const std::string& method) const;
    bool                             isExemptResource(const std::string& resource) const;
    eSigningAlgorithm                signingAlgorithm() const;

  private:
    struct {
        std::vector<std::unique_ptr<re2::RE2>> exemptResources;
        eSigningAlgorithm                      signingAlgorithm = SIGNING_ALGORITHM_HMAC_SHA256;
    } m_parsedConfigDatas;
};

inline std::unique_ptr<CConfig> g_pConfig;
