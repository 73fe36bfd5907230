//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/toolgate/HTTPTransport.cpp
// Purpose: HTTP/HTTPS client transport using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "toolgate/EnvelopeCodec.h"
#include "toolgate/HTTPTransport.hpp"
#include "toolgate/JSONRPCTypes.h"
#include "toolgate/Protocol.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace toolgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

const char* transportErrorKindName(TransportError::Kind kind) {
    switch (kind) {
        case TransportError::Kind::Unreachable: return "unreachable";
        case TransportError::Kind::Timeout: return "timeout";
        case TransportError::Kind::HttpStatus: return "http-status";
        case TransportError::Kind::InvalidResponse: return "invalid-response";
        case TransportError::Kind::Closed: return "closed";
        default: return "unknown";
    }
}

namespace {

struct HttpReply {
    unsigned int status{0};
    std::string body;
    std::string contentType;
    std::string sessionId;
};

// Data payloads of the "message" events in a text/event-stream body, in order.
std::vector<std::string> extractEventMessages(const std::string& body) {
    std::vector<std::string> out;
    std::string eventName;
    std::string data;
    bool haveData = false;
    auto flush = [&]() {
        if (haveData && (eventName.empty() || eventName == "message")) {
            out.push_back(data);
        }
        eventName.clear();
        data.clear();
        haveData = false;
    };
    std::size_t pos = 0;
    while (pos <= body.size()) {
        std::size_t eol = body.find('\n', pos);
        std::string line = body.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            flush();
        } else if (line.front() != ':') {
            const auto colon = line.find(':');
            const std::string field = line.substr(0, colon);
            std::string value = colon == std::string::npos ? std::string() : line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ') {
                value.erase(0, 1);
            }
            if (field == "event") {
                eventName = value;
            } else if (field == "data") {
                if (haveData) data.push_back('\n');
                data += value;
                haveData = true;
            }
        }
        if (eol == std::string::npos) {
            break;
        }
        pos = eol + 1;
    }
    flush();
    return out;
}

std::optional<JSONRPCResponse> decodeResponse(const std::string& text) {
    DecodeResult r = DecodeEnvelope(text);
    if (!r.ok() || ClassifyEnvelope(r.envelope.value()) != MessageKind::Response) {
        return std::nullopt;
    }
    return std::get<JSONRPCResponse>(r.envelope.value());
}

} // namespace

class HTTPTransport::Impl {
public:
    HTTPTransport::Options opts;
    std::atomic<bool> connected{false};

    mutable std::mutex sessionMutex;
    std::string sessionId;
    std::string protocolVersion;

    std::unique_ptr<ssl::context> sslCtx; // present when https
    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;

    HTTPTransport::ErrorHandler errorHandler;
    std::atomic<std::uint64_t> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::uint64_t, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::uint64_t, std::promise<void>> pendingNotifications;
    bool caInitOk{true};

    explicit Impl(const HTTPTransport::Options& o) : opts(o), sessionId(o.sessionId), protocolVersion(o.protocolVersion) {
        if (opts.scheme != "http" && opts.scheme != "https") {
            throw std::invalid_argument("HTTPTransport: unsupported scheme: " + opts.scheme);
        }
        if (opts.serverName.empty()) {
            opts.serverName = opts.host;
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::ERR_clear_error();
            const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
            if (userProvidedCA) {
                try {
                    if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                    if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
                } catch (const std::exception& e) {
                    LOG_ERROR("HTTPS: failed to load user-provided CA file/path: {}", e.what());
                    caInitOk = false;
                }
            } else {
                try {
                    sslCtx->set_default_verify_paths();
                } catch (const std::exception& e) {
                    LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    std::string generateRequestId() { return std::string("http-req-") + std::to_string(++requestCounter); }

    TransportError classify(const boost::system::error_code& ec) const {
        if (ec == beast::error::timeout) {
            return TransportError(TransportError::Kind::Timeout, "HTTP exchange timed out: " + ec.message());
        }
        if (ec == net::error::operation_aborted && !connected.load()) {
            return TransportError(TransportError::Kind::Closed, "Transport closed");
        }
        return TransportError(TransportError::Kind::Unreachable,
                              "Cannot reach " + opts.host + ":" + opts.port + ": " + ec.message());
    }

    template <class Stream>
    net::awaitable<HttpReply> exchange(Stream& stream, http::request<http::string_body>& req) {
        beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
        co_await http::async_write(stream, req, net::use_awaitable);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        HttpReply reply;
        reply.status = res.result_int();
        reply.contentType = std::string(res[http::field::content_type]);
        reply.sessionId = std::string(res[Headers::SessionId]);
        reply.body = std::move(res.body());
        co_return reply;
    }

    // Coroutine: POST one payload and return the raw HTTP reply. Transport failures throw TransportError.
    net::awaitable<HttpReply> coPostJson(const std::string body) {
        http::request<http::string_body> req{http::verb::post, opts.rpcPath, 11};
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        req.set(http::field::connection, "close");
        req.set(http::field::host, opts.scheme == "https" ? opts.serverName : opts.host);
        {
            std::lock_guard<std::mutex> lk(sessionMutex);
            if (!sessionId.empty()) {
                req.set(Headers::SessionId, sessionId);
            }
            if (!protocolVersion.empty()) {
                req.set(Headers::ProtocolVersion, protocolVersion);
            }
        }
        if (!opts.responseMode.empty()) {
            req.set(Headers::ResponseMode, opts.responseMode);
        }
        req.body() = body;
        req.prepare_payload();

        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);

            if (opts.scheme == "https") {
                if (!caInitOk) {
                    throw TransportError(TransportError::Kind::Unreachable, "HTTPS: CA initialization failed (bad caFile/caPath)");
                }
                beast::ssl_stream<beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
                if (!::SSL_set_tlsext_host_name(stream.native_handle(), opts.serverName.c_str())) {
                    throw TransportError(TransportError::Kind::Unreachable, "HTTPS: failed to set SNI hostname");
                }
                if (::SSL_set1_host(stream.native_handle(), opts.serverName.c_str()) != 1) {
                    throw TransportError(TransportError::Kind::Unreachable, "HTTPS: failed to set verification hostname");
                }
                stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
                co_await stream.next_layer().async_connect(results, net::use_awaitable);
                co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
                HttpReply reply = co_await exchange(stream, req);
                boost::system::error_code ec;
                stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
                co_return reply;
            }

            beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);
            HttpReply reply = co_await exchange(stream, req);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return reply;
        } catch (const boost::system::system_error& e) {
            throw classify(e.code());
        }
    }

    void captureSession(const HttpReply& reply) {
        if (reply.sessionId.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lk(sessionMutex);
        if (sessionId != reply.sessionId) {
            LOG_DEBUG("HTTPTransport: remote session {}", reply.sessionId);
        }
        sessionId = reply.sessionId;
    }

    static void requireSuccessStatus(const HttpReply& reply) {
        if (reply.status < 200u || reply.status >= 300u) {
            throw TransportError(TransportError::Kind::HttpStatus,
                                 "HTTP status " + std::to_string(reply.status), static_cast<int>(reply.status), reply.body);
        }
    }

    std::unique_ptr<JSONRPCResponse> interpretReply(const HttpReply& reply, const JSONRPCId& expectedId) {
        captureSession(reply);
        requireSuccessStatus(reply);
        if (reply.body.empty()) {
            throw TransportError(TransportError::Kind::InvalidResponse,
                                 "HTTP " + std::to_string(reply.status) + " without a response body",
                                 static_cast<int>(reply.status));
        }

        std::optional<JSONRPCResponse> resp;
        if (reply.contentType.find("text/event-stream") != std::string::npos) {
            for (const auto& data : extractEventMessages(reply.body)) {
                resp = decodeResponse(data);
                if (resp.has_value()) {
                    break;
                }
            }
        } else {
            resp = decodeResponse(reply.body);
        }
        if (!resp.has_value()) {
            throw TransportError(TransportError::Kind::InvalidResponse, "Response body is not a JSON-RPC response",
                                 static_cast<int>(reply.status), reply.body);
        }
        if (!std::holds_alternative<std::nullptr_t>(resp->id) && resp->id != expectedId) {
            throw TransportError(TransportError::Kind::InvalidResponse,
                                 "Response id " + idToString(resp->id) + " does not match request id " + idToString(expectedId),
                                 static_cast<int>(reply.status), reply.body);
        }
        return std::make_unique<JSONRPCResponse>(std::move(resp.value()));
    }

    std::optional<std::promise<std::unique_ptr<JSONRPCResponse>>> takeRequest(std::uint64_t key) {
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pendingRequests.find(key);
        if (it == pendingRequests.end()) {
            return std::nullopt;
        }
        std::promise<std::unique_ptr<JSONRPCResponse>> p = std::move(it->second);
        pendingRequests.erase(it);
        return p;
    }

    std::optional<std::promise<void>> takeNotification(std::uint64_t key) {
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pendingNotifications.find(key);
        if (it == pendingNotifications.end()) {
            return std::nullopt;
        }
        std::promise<void> p = std::move(it->second);
        pendingNotifications.erase(it);
        return p;
    }
};

HTTPTransport::HTTPTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPTransport::~HTTPTransport() {
    if (pImpl->connected.load()) {
        Close().get();
    }
}

HTTPTransport::Options HTTPTransport::OptionsFromUrl(const std::string& url) {
    Options opts;
    std::size_t pos = 0;

    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        opts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        opts.scheme = "http";
    }
    if (opts.scheme != "http" && opts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + opts.scheme);
    }

    const std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        opts.rpcPath = "/mcp";
    } else {
        hostPort = url.substr(pos, slash - pos);
        opts.rpcPath = url.substr(slash);
    }

    std::string portPart;
    if (!hostPort.empty() && hostPort.front() == '[') {
        const auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host in URL: " + url);
        }
        opts.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            portPart = hostPort.substr(rb + 2);
        }
    } else {
        const std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            opts.host = hostPort;
        } else {
            opts.host = hostPort.substr(0, colon);
            portPart = hostPort.substr(colon + 1);
        }
    }
    if (opts.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    if (portPart.empty()) {
        opts.port = opts.scheme == "https" ? "443" : "80";
    } else {
        opts.port = portPart;
    }
    opts.serverName = opts.host;
    return opts;
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->connected.load()) {
        ready.set_value();
        return fut;
    }
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    if (pImpl->ioc.stopped()) {
        pImpl->ioc.restart();
    }
    pImpl->connected.store(true);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        pr.set_value();
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPTransport I/O thread error: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    pImpl->connected.store(false);
    if (pImpl->workGuard) {
        pImpl->workGuard->reset(); pImpl->workGuard.reset();
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable() && pImpl->ioThread.get_id() != std::this_thread::get_id()) {
        pImpl->ioThread.join();
    }

    // Fail exchanges whose completion handlers will never run
    std::unordered_map<std::uint64_t, std::promise<std::unique_ptr<JSONRPCResponse>>> requests;
    std::unordered_map<std::uint64_t, std::promise<void>> notifications;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        requests.swap(pImpl->pendingRequests);
        notifications.swap(pImpl->pendingNotifications);
    }
    for (auto& kv : requests) {
        kv.second.set_exception(std::make_exception_ptr(TransportError(TransportError::Kind::Closed, "Transport closed")));
    }
    for (auto& kv : notifications) {
        kv.second.set_exception(std::make_exception_ptr(TransportError(TransportError::Kind::Closed, "Transport closed")));
    }
    done.set_value();
    return fut;
}

bool HTTPTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string HTTPTransport::GetSessionId() const {
    std::lock_guard<std::mutex> lk(pImpl->sessionMutex);
    return pImpl->sessionId;
}

void HTTPTransport::SetSessionId(const std::string& sessionId) {
    std::lock_guard<std::mutex> lk(pImpl->sessionMutex);
    pImpl->sessionId = sessionId;
}

void HTTPTransport::SetProtocolVersion(const std::string& version) {
    std::lock_guard<std::mutex> lk(pImpl->sessionMutex);
    pImpl->protocolVersion = version;
}

const HTTPTransport::Options& HTTPTransport::GetOptions() const {
    return pImpl->opts;
}

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();

    if (!request) {
        promise.set_exception(std::make_exception_ptr(std::invalid_argument("HTTPTransport: null request")));
        return fut;
    }
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(TransportError(TransportError::Kind::Closed, "Transport not connected")));
        return fut;
    }

    // Ensure request id present
    const bool needsId = std::visit([](const auto& idVal) {
        using T = std::decay_t<decltype(idVal)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return idVal.empty();
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return false;
        } else {
            return true;
        }
    }, request->id);
    if (needsId) {
        request->id = pImpl->generateRequestId();
    }
    const JSONRPCId expectedId = request->id;
    std::string payload = request->Serialize();

    const std::uint64_t key = ++pImpl->requestCounter;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        pImpl->pendingRequests.emplace(key, std::move(promise));
    }

    net::co_spawn(pImpl->ioc, pImpl->coPostJson(std::move(payload)),
        [this, key, expectedId](std::exception_ptr eptr, HttpReply reply) {
            std::exception_ptr failure = eptr;
            std::unique_ptr<JSONRPCResponse> out;
            if (!failure) {
                try {
                    out = pImpl->interpretReply(reply, expectedId);
                } catch (const TransportError& e) {
                    failure = std::current_exception();
                }
            }
            if (failure) {
                try {
                    std::rethrow_exception(failure);
                } catch (const std::exception& e) {
                    LOG_DEBUG("HTTPTransport request {} failed: {}", idToString(expectedId), e.what());
                    pImpl->setError(e.what());
                }
            }
            auto pr = pImpl->takeRequest(key);
            if (!pr.has_value()) {
                return;
            }
            if (failure) {
                pr->set_exception(failure);
            } else {
                pr->set_value(std::move(out));
            }
        });

    return fut;
}

std::future<void> HTTPTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    if (!notification) {
        done.set_exception(std::make_exception_ptr(std::invalid_argument("HTTPTransport: null notification")));
        return fut;
    }
    if (!pImpl->connected.load()) {
        done.set_exception(std::make_exception_ptr(TransportError(TransportError::Kind::Closed, "Transport not connected")));
        return fut;
    }
    std::string payload = notification->Serialize();

    const std::uint64_t key = ++pImpl->requestCounter;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        pImpl->pendingNotifications.emplace(key, std::move(done));
    }

    net::co_spawn(pImpl->ioc, pImpl->coPostJson(std::move(payload)),
        [this, key](std::exception_ptr eptr, HttpReply reply) {
            std::exception_ptr failure = eptr;
            if (!failure) {
                pImpl->captureSession(reply);
                try {
                    Impl::requireSuccessStatus(reply);
                } catch (const TransportError&) {
                    failure = std::current_exception();
                }
            }
            auto pr = pImpl->takeNotification(key);
            if (!pr.has_value()) {
                return;
            }
            if (failure) {
                pr->set_exception(failure);
            } else {
                pr->set_value();
            }
        });

    return fut;
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

//==========================================================================================================
// HTTPTransportFactory::CreateTransport
// Purpose: Parse a URL or semicolon-delimited key=value config into Options and create transport.
//==========================================================================================================
std::unique_ptr<ITransport> HTTPTransportFactory::CreateTransport(const std::string& config) {
    auto trim = [](std::string s) -> std::string {
        std::size_t b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t')) {
            ++b;
        }
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
            --e;
        }
        return s.substr(b, e - b);
    };
    auto toUnsigned = [](const std::string& key, const std::string& val) -> unsigned int {
        try {
            return static_cast<unsigned int>(std::stoul(val));
        } catch (const std::logic_error&) {
            throw std::invalid_argument("HTTPTransportFactory: invalid " + key + " '" + val + "'");
        }
    };

    const std::string cfg = trim(config);
    if (cfg.rfind("http://", 0) == 0 || cfg.rfind("https://", 0) == 0) {
        return std::make_unique<HTTPTransport>(HTTPTransport::OptionsFromUrl(cfg));
    }

    HTTPTransport::Options opts;
    std::size_t start = 0;
    while (start < cfg.size()) {
        std::size_t sep = cfg.find(';', start);
        if (sep == std::string::npos) { sep = cfg.size(); }
        std::string kv = trim(cfg.substr(start, sep - start));
        start = sep + 1;
        const std::size_t eq = kv.find('=');
        if (kv.empty() || eq == std::string::npos) {
            continue;
        }
        const std::string key = trim(kv.substr(0, eq));
        const std::string val = trim(kv.substr(eq + 1));
        if (key == "url") {
            // Later keys may still override individual fields
            const HTTPTransport::Options fromUrl = HTTPTransport::OptionsFromUrl(val);
            opts.scheme = fromUrl.scheme;
            opts.host = fromUrl.host;
            opts.port = fromUrl.port;
            opts.rpcPath = fromUrl.rpcPath;
            opts.serverName = fromUrl.serverName;
        } else if (key == "scheme") {
            opts.scheme = val;
        } else if (key == "host") {
            opts.host = val;
        } else if (key == "port") {
            opts.port = val;
        } else if (key == "rpcPath") {
            opts.rpcPath = val;
        } else if (key == "serverName") {
            opts.serverName = val;
        } else if (key == "caFile") {
            opts.caFile = val;
        } else if (key == "caPath") {
            opts.caPath = val;
        } else if (key == "connectTimeoutMs") {
            opts.connectTimeoutMs = toUnsigned(key, val);
        } else if (key == "readTimeoutMs") {
            opts.readTimeoutMs = toUnsigned(key, val);
        } else if (key == "sessionId") {
            opts.sessionId = val;
        } else if (key == "protocolVersion") {
            opts.protocolVersion = val;
        } else if (key == "responseMode") {
            opts.responseMode = val;
        }
    }
    return std::make_unique<HTTPTransport>(opts);
}

} // namespace toolgate
