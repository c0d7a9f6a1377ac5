#pragma once

#include <pistache/http.h>
#include <pistache/client.h>

#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "GateResponse.hpp"

// runs every request through the CSRF gate, forwarding passed ones to the upstream
class CServerHandler : public Pistache::Http::Handler {

    HTTP_PROTOTYPE(CServerHandler)

    void onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response);

    void onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response);

  private:
    void                         handleInternal(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response);
    void                         handleAsync(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter& response);

    // the gate's downstream. Throws if the upstream fails.
    std::optional<CGateResponse> proxyPass(const Pistache::Http::Request& req);
    std::string                  forwardAddressFor(const Pistache::Http::Request& req);
    void                         sendResponse(const Pistache::Http::Request& req, const CGateResponse& gateResponse, Pistache::Http::ResponseWriter& response);

    struct SProxiedRequest {
        SProxiedRequest(const Pistache::Http::Request& r, Pistache::Http::ResponseWriter& resp) : req(r), response(std::move(resp)) {
            ;
        }

        Pistache::Http::Request        req;
        Pistache::Http::ResponseWriter response;
        std::thread                    requestThread;
    };

    struct {
        std::vector<std::shared_ptr<SProxiedRequest>> queue;
        std::shared_ptr<std::mutex>                   queueMutex = std::make_shared<std::mutex>();
    } m_asyncProxyQueue;
};
