#include "TrafficLogger.hpp"

#include <sstream>
#include <fmt/format.h>

#include "../config/Config.hpp"
#include "../debug/log.hpp"
#include "../helpers/FsUtils.hpp"
#include "../helpers/RequestUtils.hpp"

CTrafficLogger::CTrafficLogger() {
    if (!g_pConfig->m_config.logging.log_traffic)
        return;

    const auto& SCHEMA = g_pConfig->m_config.logging.traffic_log_schema;

    // parse the schema
    size_t pos = 0;
    while (pos <= SCHEMA.size()) {
        const auto NEXT = SCHEMA.find(',', pos);
        const auto CURR = std::string_view{SCHEMA}.substr(pos, NEXT == std::string::npos ? std::string::npos : NEXT - pos);

        if (CURR == "ip")
            m_logSchema.emplace_back(TRAFFIC_IP);
        else if (CURR == "epoch")
            m_logSchema.emplace_back(TRAFFIC_EPOCH);
        else if (CURR == "domain")
            m_logSchema.emplace_back(TRAFFIC_DOMAIN);
        else if (CURR == "resource")
            m_logSchema.emplace_back(TRAFFIC_RESOURCE);
        else if (CURR == "method")
            m_logSchema.emplace_back(TRAFFIC_METHOD);
        else if (CURR == "useragent")
            m_logSchema.emplace_back(TRAFFIC_USERAGENT);
        else if (CURR == "action")
            m_logSchema.emplace_back(TRAFFIC_ACTION);
        else
            Debug::log(WARN, "TrafficLogger: unknown column \"{}\", skipping", CURR);

        if (NEXT == std::string::npos)
            break;

        pos = NEXT + 1;
    }

    const auto PATH = NFsUtils::resolve(g_pConfig->m_config.logging.traffic_log_file);

    m_file.open(PATH, std::ios::app);

    if (!m_file.good())
        Debug::die("TrafficLogger: bad file {}", PATH);
}

CTrafficLogger::~CTrafficLogger() {
    if (m_file.is_open())
        m_file.close();
}

static std::string sanitize(const std::string& s) {
    if (s.empty())
        return s;

    std::string cpy = s;
    size_t      pos = 0;
    while ((pos = cpy.find('"', pos)) != std::string::npos) {
        cpy.replace(pos, 1, "\\\"");
        pos += 2;
    }

    return cpy;
}

void CTrafficLogger::logTraffic(const Pistache::Http::Request& req, eGateAction actionTaken) {
    if (!g_pConfig->m_config.logging.log_traffic)
        return;

    std::stringstream ss;

    for (const auto& t : m_logSchema) {
        switch (t) {
            case TRAFFIC_EPOCH: {
                ss << fmt::format("{},", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
                break;
            }

            case TRAFFIC_DOMAIN: {
                try {
                    const auto HOST = Pistache::Http::Header::header_cast<Pistache::Http::Header::Host>(req.headers().get("Host"));
                    ss << fmt::format("\"{}\",", sanitize(HOST->host()));
                } catch (std::exception& e) { ss << "\"<no data>\","; }
                break;
            }

            case TRAFFIC_IP: {
                ss << fmt::format("{},", NRequestUtils::ipForRequest(req));
                break;
            }

            case TRAFFIC_RESOURCE: {
                ss << fmt::format("\"{}\",", sanitize(req.resource()));
                break;
            }

            case TRAFFIC_METHOD: {
                ss << fmt::format("{},", NRequestUtils::methodForRequest(req));
                break;
            }

            case TRAFFIC_USERAGENT: {
                if (!req.headers().has("User-Agent")) {
                    ss << "\"<no data>\",";
                    break;
                }
                const auto UA = Pistache::Http::Header::header_cast<Pistache::Http::Header::UserAgent>(req.headers().get("User-Agent"));
                ss << fmt::format("\"{}\",", sanitize(UA->agent()));
                break;
            }

            case TRAFFIC_ACTION: {
                ss << fmt::format("{},", NCsrfTypes::gateActionToString(actionTaken));
                break;
            }
        }
    }

    std::string trafficLine = ss.str();
    if (trafficLine.empty())
        return;

    // replace , with \n
    trafficLine.back() = '\n';

    std::lock_guard<std::mutex> lg(m_fileMutex);
    m_file << trafficLine;
    m_file.flush();
}
