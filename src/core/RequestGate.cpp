#include "RequestGate.hpp"

#include "../debug/log.hpp"
#include "../helpers/MethodUtils.hpp"

#include <stdexcept>

constexpr const uint16_t HTTP_UNAUTHORIZED = 401;
constexpr const uint16_t HTTP_NOT_FOUND    = 404;

CRequestGate::CRequestGate(SGateOptions options, CSigningKey key, CSecureRandom& random) :
    m_options(std::move(options)), m_signer(std::make_shared<const CSigner>(std::move(key))), m_factory(m_signer, random, m_options.clock), m_validator(m_signer) {
    if (!m_options.isSafe)
        m_options.isSafe = [](const IGateRequest& req) { return NMethodUtils::isSafe(req.method()); };

    if (m_options.headerName.empty() || m_options.cookieName.empty())
        throw std::invalid_argument("CRequestGate: header and cookie names can't be empty");

    Debug::log(LOG, "CSRF gate: cookie \"{}\", header \"{}\"", m_options.cookieName, m_options.headerName);
}

std::unique_ptr<CRequestGate> CRequestGate::withGeneratedKey(SGateOptions options, CSecureRandom& random, eSigningAlgorithm algorithm) {
    return std::make_unique<CRequestGate>(std::move(options), CSigningKey::generate(algorithm), random);
}

std::unique_ptr<CRequestGate> CRequestGate::withKeyBytes(std::span<const uint8_t> keyBytes, SGateOptions options, CSecureRandom& random, eSigningAlgorithm algorithm) {
    return std::make_unique<CRequestGate>(std::move(options), CSigningKey::fromBytes(keyBytes, algorithm), random);
}

SGateResult CRequestGate::handle(const IGateRequest& req, const DownstreamFn& downstream) const {
    if (m_options.isSafe(req))
        return validateOrEmbed(req, downstream);

    return checkCsrf(req, downstream);
}

SGateResult CRequestGate::validateOrEmbed(const IGateRequest& req, const DownstreamFn& downstream) const {
    const auto COOKIE = req.cookie(m_options.cookieName);

    if (!COOKIE) {
        Debug::log(TRACE, "CSRF: {} {}: no token cookie, embedding a new one", req.method(), req.resource());
        return forwardAndStamp(req, downstream, std::nullopt);
    }

    // a tampered cookie is suspicious even on a safe request
    const auto RAW = m_validator.verify(*COOKIE);
    if (!RAW)
        return reject(req, RAW.error(), "cookie");

    return forwardAndStamp(req, downstream, *RAW);
}

SGateResult CRequestGate::checkCsrf(const IGateRequest& req, const DownstreamFn& downstream) const {
    const auto COOKIE = req.cookie(m_options.cookieName);
    if (!COOKIE)
        return reject(req, TOKEN_ERROR_MISSING, "cookie");

    const auto HEADER = req.header(m_options.headerName);
    if (!HEADER)
        return reject(req, TOKEN_ERROR_MISSING, "header");

    const auto RAWCOOKIE = m_validator.verify(*COOKIE);
    if (!RAWCOOKIE)
        return reject(req, RAWCOOKIE.error(), "cookie");

    const auto RAWHEADER = m_validator.verify(*HEADER);
    if (!RAWHEADER)
        return reject(req, RAWHEADER.error(), "header");

    if (!CValidator::rawEquals(*RAWCOOKIE, *RAWHEADER))
        return reject(req, TOKEN_ERROR_MISMATCH, "cookie vs header");

    return forwardAndStamp(req, downstream, *RAWCOOKIE);
}

SGateResult CRequestGate::reject(const IGateRequest& req, eTokenError why, const char* what) const {
    Debug::log(TRACE, "CSRF: {} {}: rejected, {} {}", req.method(), req.resource(), what, NCsrfTypes::tokenErrorToString(why));

    return SGateResult{GATE_ACTION_REJECT, CGateResponse(HTTP_UNAUTHORIZED, "Unauthorized")};
}

SGateResult CRequestGate::forwardAndStamp(const IGateRequest& req, const DownstreamFn& downstream, const std::optional<std::string>& raw) const {
    auto response = downstream(req);

    if (!response) {
        Debug::log(TRACE, "CSRF: {} {}: downstream had no response", req.method(), req.resource());
        return SGateResult{GATE_ACTION_ABSENT, CGateResponse(HTTP_NOT_FOUND, "Not Found")};
    }

    // signed after the downstream ran, same as a fresh embed
    const auto TOKEN = raw ? m_factory.signExisting(*raw) : m_factory.newToken();
    response->addCookie(makeCookie(TOKEN));

    return SGateResult{raw ? GATE_ACTION_ROTATE : GATE_ACTION_EMBED, std::move(*response)};
}

DownstreamFn CRequestGate::protect(DownstreamFn downstream) const {
    return [this, downstream = std::move(downstream)](const IGateRequest& req) -> std::optional<CGateResponse> { return handle(req, downstream).response; };
}

CGateResponse CRequestGate::embedNew(std::optional<CGateResponse> response) const {
    if (!response)
        return CGateResponse(HTTP_NOT_FOUND, "Not Found");

    response->addCookie(makeCookie(m_factory.newToken()));
    return std::move(*response);
}

DownstreamFn CRequestGate::withNewToken(DownstreamFn downstream) const {
    return [this, downstream = std::move(downstream)](const IGateRequest& req) -> std::optional<CGateResponse> { return embedNew(downstream(req)); };
}

std::string CRequestGate::newToken() const {
    return m_factory.newToken();
}

std::optional<std::string> CRequestGate::extractRaw(std::string_view token) const {
    return m_validator.extractRaw(token);
}

const SGateOptions& CRequestGate::options() const {
    return m_options;
}

SCookie CRequestGate::makeCookie(const std::string& token) const {
    SCookie cookie;
    cookie.name     = m_options.cookieName;
    cookie.value    = token;
    cookie.path     = m_options.cookiePath;
    cookie.domain   = m_options.cookieDomain;
    cookie.sameSite = m_options.cookieSameSite;
    cookie.secure   = m_options.cookieSecure;
    cookie.httpOnly = m_options.cookieHttpOnly;
    return cookie;
}
