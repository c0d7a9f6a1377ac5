#include <iostream>
#include <pistache/common.h>
#include <pistache/cookie.h>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/http_headers.h>
#include <pistache/net.h>
#include <pistache/peer.h>

#include "headers/clientIPHeader.hpp"

#include "debug/log.hpp"

#include "core/Handler.hpp"
#include "core/RequestGate.hpp"
#include "core/SecureRandom.hpp"

#include "config/Config.hpp"
#include "config/KeyFile.hpp"

#include "helpers/FsUtils.hpp"

#include "logging/TrafficLogger.hpp"

#include <signal.h>

static SGateOptions gateOptionsFromConfig(const CConfig& config) {
    SGateOptions opts;
    opts.headerName     = config.m_config.csrf.header_name;
    opts.cookieName     = config.m_config.csrf.cookie_name;
    opts.cookiePath     = config.m_config.csrf.cookie_path;
    opts.cookieDomain   = config.m_config.csrf.cookie_domain;
    opts.cookieSameSite = config.m_config.csrf.cookie_same_site;
    opts.cookieSecure   = config.m_config.csrf.cookie_secure;

    // g_pConfig lives until exit, same as the gate
    opts.isSafe = [&config](const IGateRequest& req) { return config.isSafeMethod(req.method()) || config.isExemptResource(req.resource()); };

    return opts;
}

int main(int argc, char** argv) {

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    std::string configPath;

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i] == "--help" || ARGS[i] == "-h") {
            std::cout << "-c [config]\n";
            return 0;
        } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
            configPath = ARGS[i + 1];
            i++;
        } else {
            std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
            continue;
        }
    }

    if (configPath.empty()) {
        Debug::log(CRIT, "Missing --config");
        return 1;
    }

    g_pConfig = std::make_unique<CConfig>(NFsUtils::resolve(configPath));

    Debug::trace = g_pConfig->m_config.trace_logging;

    sigset_t signals;
    if (sigemptyset(&signals) != 0 || sigaddset(&signals, SIGTERM) != 0 || sigaddset(&signals, SIGINT) != 0 || sigaddset(&signals, SIGQUIT) != 0 ||
        sigaddset(&signals, SIGPIPE) != 0 || sigaddset(&signals, SIGALRM) != 0 || sigprocmask(SIG_BLOCK, &signals, nullptr) != 0)
        return 1;

    // before anything draws from it
    try {
        g_pSecureRandom = std::make_unique<CSecureRandom>();
    } catch (std::exception& e) { Debug::die("Couldn't seed the random generator: {}", e.what()); }

    auto key = NKeyFile::fromConfig(*g_pConfig);
    if (!key)
        Debug::die("No usable signing key: {}", key.error());

    try {
        g_pRequestGate = std::make_unique<CRequestGate>(gateOptionsFromConfig(*g_pConfig), std::move(key.value()), *g_pSecureRandom);
    } catch (std::exception& e) { Debug::die("Couldn't set up the CSRF gate: {}", e.what()); }

    g_pTrafficLogger = std::make_unique<CTrafficLogger>();

    int               threads = 1;
    Pistache::Address address = {Pistache::Ipv4::any(), (uint16_t)g_pConfig->m_config.port};
    Debug::log(LOG, "Starting the server on {}:{}\n", address.host(), address.port().toString());

    Pistache::Http::Header::Registry::instance().registerHeader<CFConnectingIPHeader>();
    Pistache::Http::Header::Registry::instance().registerHeader<XRealIPHeader>();

    auto endpoint = std::make_unique<Pistache::Http::Endpoint>(address);
    auto opts     = Pistache::Http::Endpoint::options().threads(threads).flags(Pistache::Tcp::Options::ReuseAddr | Pistache::Tcp::Options::ReusePort);
    opts.maxRequestSize(g_pConfig->m_config.max_request_size);
    endpoint->init(opts);
    auto handler = Pistache::Http::make_handler<CServerHandler>();
    endpoint->setHandler(handler);

    endpoint->serveThreaded();

    bool terminate = false;
    while (!terminate) {
        int number = 0;
        int status = sigwait(&signals, &number);
        if (status != 0) {
            Debug::log(CRIT, "sigwait threw {} :(", status);
            break;
        }

        Debug::log(LOG, "Caught signal {}", number);

        switch (number) {
            case SIGINT: terminate = true; break;
            case SIGTERM: terminate = true; break;
            case SIGQUIT: terminate = true; break;
            case SIGPIPE: break;
            case SIGALRM: break;
        }
    }

    sigprocmask(SIG_UNBLOCK, &signals, nullptr);

    Debug::log(LOG, "Shutting down, bye!");

    endpoint->shutdown();
    endpoint = nullptr;

    // detached requests may still be running, the gate and the DRBG stay up until exit

    return 0;
}
