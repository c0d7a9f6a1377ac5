#include "Handler.hpp"
#include "RequestGate.hpp"
#include "PistacheRequest.hpp"
#include "../debug/log.hpp"
#include "../config/Config.hpp"
#include "../helpers/CookieUtils.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../logging/TrafficLogger.hpp"

#include <sstream>

constexpr const uint16_t HTTP_GATEWAY_TIMEOUT = 504;

void CServerHandler::onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) {
    std::shared_ptr<const Pistache::Http::Header::Host>      hostHeader;
    std::shared_ptr<const Pistache::Http::Header::UserAgent> userAgentHeader;

    try {
        hostHeader = Pistache::Http::Header::header_cast<Pistache::Http::Header::Host>(req.headers().get("Host"));
    } catch (std::exception& e) {
        Debug::log(ERR, "Request has no Host header?");
        response.send(Pistache::Http::Code::Bad_Request, "Bad Request");
        return;
    }

    try {
        userAgentHeader = Pistache::Http::Header::header_cast<Pistache::Http::Header::UserAgent>(req.headers().get("User-Agent"));
    } catch (std::exception& e) {
        ; // silent ignore
    }

    Debug::log(LOG, "New request: {} {}:{}{}", NRequestUtils::methodForRequest(req), hostHeader->host(), hostHeader->port().toString(), req.resource());

    Debug::log(LOG, " | Request author: IP {}, direct: {}", NRequestUtils::ipForRequest(req), req.address().host());

    if (userAgentHeader)
        Debug::log(LOG, " | UA: {}", userAgentHeader->agent());

    if (g_pConfig->m_config.async_proxy) {
        handleAsync(req, response);
        return;
    }

    handleInternal(req, response);
}

void CServerHandler::onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) {
    response.send(Pistache::Http::Code::Request_Timeout, "Timeout").then([=](ssize_t) {}, PrintException());
}

void CServerHandler::handleAsync(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response) {
    std::shared_ptr<SProxiedRequest> proxiedRequest;
    {
        std::lock_guard<std::mutex> lg(*m_asyncProxyQueue.queueMutex);
        proxiedRequest = m_asyncProxyQueue.queue.emplace_back(std::make_shared<SProxiedRequest>(req, response));
        Debug::log(TRACE, "handleAsync: new request, queue size {}", m_asyncProxyQueue.queue.size());
    }

    proxiedRequest->requestThread = std::thread([proxiedRequest, this]() {
        handleInternal(proxiedRequest->req, proxiedRequest->response);
        std::lock_guard<std::mutex> lg(*m_asyncProxyQueue.queueMutex);
        std::erase(m_asyncProxyQueue.queue, proxiedRequest);
        Debug::log(TRACE, "handleAsync: request done, queue size {}", m_asyncProxyQueue.queue.size());
    });
    proxiedRequest->requestThread.detach();
}

void CServerHandler::handleInternal(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response) {
    CPistacheRequest gateRequest(req);

    try {
        const auto RESULT = g_pRequestGate->handle(gateRequest, [this, &req](const IGateRequest&) { return proxyPass(req); });

        Debug::log(LOG, " | Action: {}", NCsrfTypes::gateActionToString(RESULT.action));

        if (g_pTrafficLogger)
            g_pTrafficLogger->logTraffic(req, RESULT.action);

        sendResponse(req, RESULT.response, response);
    } catch (std::exception& e) {
        Debug::log(ERR, "Proxy failed: {}", e.what());
        response.send(Pistache::Http::Code::Internal_Server_Error, "Internal Proxy Error");
    }
}

std::string CServerHandler::forwardAddressFor(const Pistache::Http::Request& req) {
    const auto HOST = Pistache::Http::Header::header_cast<Pistache::Http::Header::Host>(req.headers().get("Host"));

    for (const auto& R : g_pConfig->m_config.proxy_rules) {
        if (R.host.contains(":")) {
            if (R.host == HOST->host() + ":" + HOST->port().toString())
                return R.destination;
        } else if (HOST->host() == R.host)
            return R.destination;
    }

    return g_pConfig->m_config.forward_address;
}

std::optional<CGateResponse> CServerHandler::proxyPass(const Pistache::Http::Request& req) {
    const std::string forwardAddress = forwardAddressFor(req);

    Debug::log(TRACE, "Method ({}): Forwarding to {}", NRequestUtils::methodForRequest(req), forwardAddress + req.resource());

    Pistache::Http::Experimental::Client client;
    client.init(Pistache::Http::Experimental::Client::options().maxConnectionsPerHost(32).maxResponseSize(g_pConfig->m_config.max_request_size).threads(4));

    auto builder = client.prepareRequest(forwardAddress + req.resource(), req.method());
    builder.body(req.body());
    for (auto it = req.cookies().begin(); it != req.cookies().end(); ++it) {
        builder.cookie(*it);
    }
    builder.params(req.query());
    const auto HEADERS = req.headers().list();
    for (auto& h : HEADERS) {
        const auto HNAME = std::string_view{h->name()};
        if (HNAME == "Cache-Control" || HNAME == "Connection" || HNAME == "Content-Length" || HNAME == "Accept-Encoding") {
            Debug::log(TRACE, "Header in: {} (DROPPED)", h->name());
            continue;
        }

        // FIXME: this should be possible once pistache allows for live reading of T-E?
        if (HNAME == "Accept") {
            std::stringstream ss;
            h->write(ss);
            if (ss.str().contains("text/event-stream")) {
                client.shutdown();
                throw std::runtime_error("text/event-stream is not supported");
            }
        }

        Debug::log(TRACE, "Header in: {}", h->name());
        builder.header(h);
    }
    builder.header(std::make_shared<Pistache::Http::Header::Connection>(Pistache::Http::ConnectionControl::KeepAlive));

    builder.timeout(std::chrono::seconds(g_pConfig->m_config.proxy_timeout_sec));

    std::optional<CGateResponse> result;
    std::exception_ptr           failure;

    auto                         resp = builder.send();
    resp.then(
        [&](Pistache::Http::Response upstream) {
            CGateResponse gateResponse((uint16_t)upstream.code(), upstream.body());

            for (auto& h : upstream.headers().list()) {
                const auto HNAME = std::string_view{h->name()};
                if (HNAME == "Transfer-Encoding" || HNAME == "Content-Length") {
                    Debug::log(TRACE, "Header out: {} (DROPPED)", h->name());
                    continue;
                }

                std::stringstream ss;
                h->write(ss);
                Debug::log(TRACE, "Header out: {}: {}", h->name(), ss.str());
                gateResponse.addHeader(h->name(), ss.str());
            }

            for (auto it = upstream.cookies().begin(); it != upstream.cookies().end(); ++it) {
                std::stringstream ss;
                ss << *it;

                const auto COOKIE = NCookieUtils::parseSetCookie(ss.str());
                if (!COOKIE) {
                    Debug::log(WARN, "Upstream sent a cookie we can't parse, dropping it");
                    continue;
                }

                gateResponse.addCookie(*COOKIE);
                Debug::log(TRACE, "Header out: Set-Cookie: {}", COOKIE->name);
            }

            result = std::move(gateResponse);
        },
        [&](std::exception_ptr e) { failure = e; });
    Pistache::Async::Barrier<Pistache::Http::Response> b(resp);
    b.wait_for(std::chrono::seconds(g_pConfig->m_config.proxy_timeout_sec));

    client.shutdown();

    if (failure)
        std::rethrow_exception(failure);

    if (!result) {
        Debug::log(ERR, "Upstream {} didn't answer in {}s", forwardAddress, g_pConfig->m_config.proxy_timeout_sec);
        return CGateResponse(HTTP_GATEWAY_TIMEOUT, "Gateway Timeout");
    }

    return result;
}

void CServerHandler::sendResponse(const Pistache::Http::Request& req, const CGateResponse& gateResponse, Pistache::Http::ResponseWriter& response) {
    for (const auto& [NAME, VALUE] : gateResponse.headers()) {
        response.headers().addRaw(Pistache::Http::Header::Raw(NAME, VALUE));
    }

    for (const auto& c : gateResponse.cookies()) {
        response.cookies().add(Pistache::Http::Cookie::fromString(NCookieUtils::formatSetCookie(c)));
    }

    auto enc = req.getBestAcceptEncoding();
    response.setCompression(enc);
    response.send(static_cast<Pistache::Http::Code>(gateResponse.code()), gateResponse.body());
}
