//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/toolgate/HTTPServer.cpp
// Purpose: HTTP/HTTPS gateway endpoint using Boost.Beast coroutines (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <chrono>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "toolgate/Dispatcher.h"
#include "toolgate/HTTPServer.hpp"
#include "toolgate/Protocol.h"
#include "toolgate/ToolRegistry.h"
#include "ResponseWriter.hpp"

#include <openssl/ssl.h>

namespace toolgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using detail::ReplyMeta;
using detail::IResponseWriter;
using detail::BufferedResponseWriter;
using detail::EventStreamResponseWriter;

namespace {

// Request target without its query string.
std::string pathOf(beast::string_view target) {
    std::string t(target);
    const auto q = t.find('?');
    if (q != std::string::npos) {
        t.erase(q);
    }
    return t;
}

bool iequals(const std::string& a, const char* b) {
    const std::string bs(b);
    if (a.size() != bs.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(bs[i]))) return false;
    }
    return true;
}

std::string trimmed(std::string s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string simpleError(const std::string& msg) {
    JSONValue::Object o;
    o["error"] = std::make_shared<JSONValue>(msg);
    return serializeJSONValue(JSONValue{o});
}

} // namespace

class HTTPServer::Impl {
public:
    Dispatcher& dispatcher;
    HTTPServer::Options opts;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::vector<std::thread> ioThreads;
    std::atomic<std::uint16_t> boundPort{0};

    // Counters reported by /mcp/stats
    std::atomic<std::uint64_t> requestsTotal{0};
    std::atomic<std::uint64_t> envelopeRequests{0};
    std::atomic<std::uint64_t> executeRequests{0};
    std::chrono::steady_clock::time_point startedAt{std::chrono::steady_clock::now()};

    ErrorHandler errorHandler;

    Impl(Dispatcher& d, const HTTPServer::Options& o) : dispatcher(d), opts(o) {
        if (opts.threads == 0u) {
            throw std::invalid_argument("HTTPServer: threads must be at least 1");
        }
        if (opts.rpcPath.empty() || opts.rpcPath.front() != '/') {
            throw std::invalid_argument("HTTPServer: rpcPath must start with '/': " + opts.rpcPath);
        }
        if (opts.scheme != "http" && opts.scheme != "https") {
            throw std::invalid_argument("HTTPServer: unsupported scheme: " + opts.scheme);
        }
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        shutdown();
    }

    void setError(const std::string& msg) {
        LOG_WARN("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void shutdown() {
        running.store(false);
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
            if (ec) {
                LOG_DEBUG("HTTPServer: acceptor close: {}", ec.message());
            }
        }
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
                t.join();
            } else if (t.joinable()) {
                t.detach();
            }
        }
        ioThreads.clear();
    }

    //////////////////////////////////////// Connection handling ////////////////////////////////////////
    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer plain session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer plain session error: ") + e.what());
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer plain session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer plain session error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<beast::tcp_stream> tls(std::move(socket), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            boost::system::error_code ec;
            beast::get_lowest_layer(tls).expires_after(std::chrono::seconds(5));
            co_await tls.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer TLS session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer TLS session error: ") + e.what());
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer TLS session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer TLS session error: ") + e.what());
            }
        }
        co_return;
    }

    // Reads requests until the peer closes or a reply ends the connection.
    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        beast::flat_buffer buffer;
        for (;;) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(opts.maxBodyBytes);
            beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            boost::system::error_code ec;
            co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec == http::error::body_limit) {
                LOG_WARN("HTTPServer: request body exceeds {} bytes", opts.maxBodyBytes);
                http::response<http::string_body> res{http::status::payload_too_large, parser.get().version()};
                res.set(http::field::content_type, "application/json");
                detail::applyCommonHeaders(res, ReplyMeta{});
                res.keep_alive(false);
                res.body() = simpleError("Request body too large");
                res.prepare_payload();
                co_await http::async_write(stream, res, net::use_awaitable);
                break;
            }
            if (ec) {
                LOG_DEBUG("HTTPServer read ended: {}", ec.message());
                break;
            }
            beast::get_lowest_layer(stream).expires_never();
            const bool keepAlive = co_await handleRequest(stream, parser.get());
            if (!keepAlive || !running.load()) {
                break;
            }
        }
        co_return;
    }

    // Routes one request. Returns whether the connection may be reused.
    template <class Stream>
    net::awaitable<bool> handleRequest(Stream& stream, http::request<http::string_body>& req) {
        const std::string target = pathOf(req.target());
        const bool keepAlive = req.keep_alive();
        ++requestsTotal;
        ReplyMeta meta;
        meta.keepAlive = keepAlive;
        BufferedResponseWriter<Stream> buffered(stream, req.version());

        if (req.method() == http::verb::options) {
            http::response<http::empty_body> res{http::status::no_content, req.version()};
            detail::applyCommonHeaders(res, meta);
            res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
            res.set(http::field::access_control_allow_headers,
                    std::string("Content-Type, Accept, ") + Headers::SessionId + ", " + Headers::ResponseMode + ", " +
                    Headers::ProtocolVersion);
            res.set(http::field::access_control_max_age, "86400");
            res.keep_alive(keepAlive);
            res.content_length(0);
            co_await http::async_write(stream, res, net::use_awaitable);
            co_return keepAlive;
        }

        // /messages is an alias of the envelope endpoint
        if (target == opts.rpcPath || target == "/messages") {
            if (req.method() == http::verb::post) {
                ++envelopeRequests;
                co_return co_await handlePost(stream, req);
            }
            if (req.method() == http::verb::get) {
                const std::string accept(req[http::field::accept]);
                if (accept.find("text/event-stream") != std::string::npos) {
                    meta.sessionId = lookupSession(req, meta.protocolVersion);
                    co_await streamKeepalive(stream, req.version(), meta);
                    co_return false;
                }
                co_await buffered.WriteReply(http::status::ok, discoveryDocument(req), meta);
                co_return keepAlive;
            }
            co_await writeMethodNotAllowed(stream, req.version(), "GET, POST, OPTIONS", meta);
            co_return keepAlive;
        }

        if (target == "/mcp/execute") {
            if (req.method() != http::verb::post) {
                co_await writeMethodNotAllowed(stream, req.version(), "POST, OPTIONS", meta);
                co_return keepAlive;
            }
            ++executeRequests;
            auto executed = executeTool(req.body());
            co_await buffered.WriteReply(executed.first, std::move(executed.second), meta);
            co_return keepAlive;
        }
        if (target == "/mcp/tools" || target == "/mcp/capabilities" || target == "/mcp/stats") {
            if (req.method() != http::verb::get) {
                co_await writeMethodNotAllowed(stream, req.version(), "GET, OPTIONS", meta);
                co_return keepAlive;
            }
            std::string doc = target == "/mcp/tools" ? toolsDocument()
                            : target == "/mcp/capabilities" ? capabilitiesDocument()
                                                            : statsDocument();
            co_await buffered.WriteReply(http::status::ok, std::move(doc), meta);
            co_return keepAlive;
        }

        const bool wellKnown = target == "/health" || target == "/.well-known/oauth-protected-resource" ||
                               target == "/.well-known/mcp";
        if (!wellKnown) {
            co_await buffered.WriteReply(http::status::not_found, simpleError("Not found"), meta);
            co_return keepAlive;
        }
        if (req.method() != http::verb::get) {
            co_await writeMethodNotAllowed(stream, req.version(), "GET, OPTIONS", meta);
            co_return keepAlive;
        }
        if (target == "/health") {
            co_await buffered.WriteReply(http::status::ok, healthDocument(), meta);
        } else if (target == "/.well-known/oauth-protected-resource") {
            co_await buffered.WriteReply(http::status::ok, protectedResourceDocument(req), meta);
        } else {
            co_await buffered.WriteReply(http::status::ok, discoveryDocument(req), meta);
        }
        co_return keepAlive;
    }

    template <class Stream>
    net::awaitable<bool> handlePost(Stream& stream, http::request<http::string_body>& req) {
        ConnectionContext ctx;
        ctx.ownsSession = false;
        const std::string sid = trimmed(std::string(req[Headers::SessionId]));
        if (!sid.empty()) {
            ctx.sessionId = sid;
        }

        DispatchResult result = dispatcher.HandlePayload(req.body(), ctx);

        // Notification-only payloads never validate the header, so resolve it here for the reply
        ReplyMeta meta;
        meta.keepAlive = req.keep_alive();
        if (ctx.sessionId.has_value()) {
            auto s = dispatcher.Sessions().Find(ctx.sessionId.value());
            if (s.has_value()) {
                meta.sessionId = s->id;
                meta.protocolVersion = s->protocolVersion;
            }
        }

        BufferedResponseWriter<Stream> buffered(stream, req.version());
        EventStreamResponseWriter<Stream> events(stream, req.version());
        const bool streamMode = iequals(trimmed(std::string(req[Headers::ResponseMode])), "stream");
        IResponseWriter& writer = streamMode ? static_cast<IResponseWriter&>(events)
                                             : static_cast<IResponseWriter&>(buffered);

        if (result.malformed) {
            co_await buffered.WriteReply(http::status::bad_request, result.reply.value_or(std::string()), meta);
            co_return meta.keepAlive;
        }
        if (!result.reply.has_value()) {
            co_await writer.WriteAccepted(meta);
            co_return meta.keepAlive;
        }
        co_await writer.WriteReply(http::status::ok, std::move(result.reply.value()), meta);
        co_return streamMode ? false : meta.keepAlive;
    }

    template <class Stream>
    net::awaitable<void> writeMethodNotAllowed(Stream& stream, unsigned version, const char* allow, const ReplyMeta& meta) {
        http::response<http::string_body> res{http::status::method_not_allowed, version};
        res.set(http::field::content_type, "application/json");
        res.set(http::field::allow, allow);
        detail::applyCommonHeaders(res, meta);
        res.keep_alive(meta.keepAlive);
        res.body() = simpleError("Method not allowed");
        res.prepare_payload();
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    // Server-push channel: a connection event, then a ping event every keepaliveMs until shutdown.
    template <class Stream>
    net::awaitable<void> streamKeepalive(Stream& stream, unsigned version, const ReplyMeta& meta) {
        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        detail::applyCommonHeaders(res, meta);
        res.keep_alive(false);
        res.chunked(true);
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, net::use_awaitable);

        const std::string hello = EventStreamResponseWriter<Stream>::formatEvent("connection", "{\"status\":\"connected\"}");
        co_await net::async_write(stream, http::make_chunk(net::buffer(hello)), net::use_awaitable);

        const std::string ping = EventStreamResponseWriter<Stream>::formatEvent("ping", "{}");
        net::steady_timer timer(co_await net::this_coro::executor);
        while (running.load()) {
            timer.expires_after(std::chrono::milliseconds(opts.keepaliveMs));
            co_await timer.async_wait(net::use_awaitable);
            if (!running.load()) {
                break;
            }
            co_await net::async_write(stream, http::make_chunk(net::buffer(ping)), net::use_awaitable);
        }
        co_await net::async_write(stream, http::make_chunk_last(), net::use_awaitable);
    }

    std::optional<std::string> lookupSession(const http::request<http::string_body>& req,
                                             std::optional<std::string>& protocolVersion) {
        const std::string sid = trimmed(std::string(req[Headers::SessionId]));
        if (sid.empty()) {
            return std::nullopt;
        }
        auto s = dispatcher.Sessions().Find(sid);
        if (!s.has_value()) {
            return std::nullopt;
        }
        protocolVersion = s->protocolVersion;
        return s->id;
    }

    //////////////////////////////////////// Discovery documents ////////////////////////////////////////
    // The configured public URL verbatim, else scheme://Host + path.
    std::string endpointUrl(const http::request<http::string_body>& req) const {
        if (!opts.publicUrl.empty()) {
            return opts.publicUrl;
        }
        std::string host(req[http::field::host]);
        if (host.empty()) {
            host = opts.address + ":" + std::to_string(boundPort.load());
        }
        return opts.scheme + "://" + host + opts.rpcPath;
    }

    std::string protectedResourceDocument(const http::request<http::string_body>& req) const {
        JSONValue::Object o;
        o["resource"] = std::make_shared<JSONValue>(endpointUrl(req));
        o["authorization_servers"] = std::make_shared<JSONValue>(JSONValue::Array{});
        return serializeJSONValue(JSONValue{o});
    }

    std::string discoveryDocument(const http::request<http::string_body>& req) const {
        const auto& info = dispatcher.GetOptions().serverInfo;
        JSONValue::Object server;
        server["name"] = std::make_shared<JSONValue>(info.name);
        server["version"] = std::make_shared<JSONValue>(info.version);

        JSONValue::Array methods;
        for (const char* m : {Methods::Initialize, Methods::Ping, Methods::ListTools, Methods::CallTool}) {
            methods.push_back(std::make_shared<JSONValue>(m));
        }

        JSONValue::Object o;
        o["endpoint"] = std::make_shared<JSONValue>(endpointUrl(req));
        o["transport"] = std::make_shared<JSONValue>(std::string("streamable-http"));
        o["server"] = std::make_shared<JSONValue>(std::move(server));
        o["capabilities"] = std::make_shared<JSONValue>(dispatcher.ServerCapabilitiesJSON());
        o["methods"] = std::make_shared<JSONValue>(std::move(methods));
        o["sessionHeader"] = std::make_shared<JSONValue>(std::string(Headers::SessionId));
        return serializeJSONValue(JSONValue{o});
    }

    std::string healthDocument() const {
        const auto& info = dispatcher.GetOptions().serverInfo;
        JSONValue::Object o;
        o["status"] = std::make_shared<JSONValue>(std::string("healthy"));
        o["server"] = std::make_shared<JSONValue>(info.name);
        o["version"] = std::make_shared<JSONValue>(info.version);
        o["sessions"] = std::make_shared<JSONValue>(static_cast<int64_t>(dispatcher.Sessions().Count()));
        return serializeJSONValue(JSONValue{o});
    }

    //////////////////////////////////////// REST tool surface ////////////////////////////////////////
    // These routes bypass sessions; they answer with plain JSON instead of envelopes.
    std::string toolsDocument() const {
        JSONValue::Array list;
        for (const Tool& t : dispatcher.Tools().List()) {
            JSONValue::Object o;
            o["name"] = std::make_shared<JSONValue>(t.name);
            o["description"] = std::make_shared<JSONValue>(t.description);
            o["parameters"] = std::make_shared<JSONValue>(t.inputSchema);
            list.push_back(std::make_shared<JSONValue>(std::move(o)));
        }
        JSONValue::Object doc;
        doc["tools"] = std::make_shared<JSONValue>(std::move(list));
        return serializeJSONValue(JSONValue{doc});
    }

    std::string capabilitiesDocument() const {
        JSONValue::Array names;
        for (const Tool& t : dispatcher.Tools().List()) {
            names.push_back(std::make_shared<JSONValue>(t.name));
        }
        JSONValue::Object tools;
        tools["count"] = std::make_shared<JSONValue>(static_cast<int64_t>(names.size()));
        tools["list"] = std::make_shared<JSONValue>(std::move(names));
        JSONValue::Object unsupported;
        unsupported["supported"] = std::make_shared<JSONValue>(false);
        JSONValue::Object caps;
        caps["tools"] = std::make_shared<JSONValue>(std::move(tools));
        caps["prompts"] = std::make_shared<JSONValue>(unsupported);
        caps["resources"] = std::make_shared<JSONValue>(unsupported);
        JSONValue::Object doc;
        doc["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
        return serializeJSONValue(JSONValue{doc});
    }

    std::string statsDocument() const {
        const auto& info = dispatcher.GetOptions().serverInfo;
        const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt);
        JSONValue::Object server;
        server["name"] = std::make_shared<JSONValue>(info.name);
        server["version"] = std::make_shared<JSONValue>(info.version);
        server["tools_count"] = std::make_shared<JSONValue>(static_cast<int64_t>(dispatcher.Tools().Size()));
        server["uptime_seconds"] = std::make_shared<JSONValue>(static_cast<int64_t>(uptime.count()));
        JSONValue::Object sessions;
        sessions["active"] = std::make_shared<JSONValue>(static_cast<int64_t>(dispatcher.Sessions().Count()));
        JSONValue::Object requests;
        requests["total"] = std::make_shared<JSONValue>(static_cast<int64_t>(requestsTotal.load()));
        requests["envelope"] = std::make_shared<JSONValue>(static_cast<int64_t>(envelopeRequests.load()));
        requests["execute"] = std::make_shared<JSONValue>(static_cast<int64_t>(executeRequests.load()));
        JSONValue::Object doc;
        doc["server"] = std::make_shared<JSONValue>(std::move(server));
        doc["sessions"] = std::make_shared<JSONValue>(std::move(sessions));
        doc["requests"] = std::make_shared<JSONValue>(std::move(requests));
        return serializeJSONValue(JSONValue{doc});
    }

    //======================================================================================================
    // executeTool
    // Purpose: Runs {"tool": name, "arguments" | "parameters": {...}} through the registry.
    // Returns:
    //   200 with {"success", "result", "error"}; error is the failure message or null. 400 for an
    //   unusable body, 404 for an unknown tool.
    //======================================================================================================
    std::pair<http::status, std::string> executeTool(const std::string& body) const {
        JSONValue parsed;
        try {
            parsed = parseJSON(body);
        } catch (const std::exception& e) {
            return {http::status::bad_request, simpleError(std::string("Invalid JSON: ") + e.what())};
        }
        const JSONValue* tool = parsed.IsObject() ? parsed.Find("tool") : nullptr;
        if (tool == nullptr || !tool->IsString() || std::get<std::string>(tool->value).empty()) {
            return {http::status::bad_request, simpleError("Request requires a tool name")};
        }
        const std::string& name = std::get<std::string>(tool->value);
        JSONValue args{JSONValue::Object{}};
        const JSONValue* a = parsed.Find("arguments");
        if (a == nullptr || a->IsNull()) {
            a = parsed.Find("parameters");
        }
        if (a != nullptr && !a->IsNull()) {
            args = *a;
        }

        const ToolRegistry& tools = dispatcher.Tools();
        if (!tools.Contains(name)) {
            return {http::status::not_found, simpleError("Tool '" + name + "' not found")};
        }
        ToolInvocationResult r = tools.Invoke(name, args);
        if (!r.success) {
            LOG_WARN("REST execute of '{}' failed: {}", name, r.error.has_value() ? r.error->message : std::string("unknown error"));
        }
        JSONValue::Object o;
        o["success"] = std::make_shared<JSONValue>(r.success);
        o["result"] = std::make_shared<JSONValue>(r.success ? r.result : JSONValue{nullptr});
        o["error"] = std::make_shared<JSONValue>(
            r.success ? JSONValue{nullptr}
                      : JSONValue{r.error.has_value() ? r.error->message : std::string("Tool invocation failed")});
        return {http::status::ok, serializeJSONValue(JSONValue{o})};
    }

    //////////////////////////////////////// Accept loop ////////////////////////////////////////
    void bindAndListen() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::invalid_argument("HTTPServer invalid port: empty");
        }
        const bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5u || std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port: " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        if (r.empty()) {
            throw std::runtime_error("HTTPServer: cannot resolve " + opts.address);
        }
        tcp::endpoint ep = *r.begin();

        auto a = std::make_unique<tcp::acceptor>(ioc);
        a->open(ep.protocol());
        a->set_option(tcp::acceptor::reuse_address(true));
        a->bind(ep);
        a->listen();
        boundPort.store(a->local_endpoint().port());
        acceptor = std::move(a);
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::make_strand(ioc), net::use_awaitable);
                auto ex = socket.get_executor();
                if (opts.scheme == "https") {
                    net::co_spawn(ex, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ex, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                // operation_aborted when the acceptor is closed
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(Dispatcher& dispatcher, const Options& opts)
    : pImpl(std::make_unique<Impl>(dispatcher, opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_exception(std::make_exception_ptr(std::logic_error("HTTPServer already running")));
        return fut;
    }
    try {
        pImpl->bindAndListen();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->acceptor.reset();
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    pImpl->startedAt = std::chrono::steady_clock::now();
    if (pImpl->ioc.stopped()) {
        pImpl->ioc.restart();
    }
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    for (unsigned int i = 0; i < pImpl->opts.threads; ++i) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc.run();
            } catch (const std::exception& e) {
                pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
            }
        });
    }
    LOG_INFO("HTTPServer listening on {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), pImpl->opts.rpcPath);
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    LOG_INFO("Stopping HTTPServer");
    pImpl->shutdown();
    done.set_value();
    return fut;
}

bool HTTPServer::IsRunning() const {
    return pImpl->running.load();
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::uint16_t HTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

const HTTPServer::Options& HTTPServer::GetOptions() const {
    return pImpl->opts;
}

HTTPServer::Options HTTPServerFactory::ParseOptions(const std::string& config) {
    HTTPServer::Options opts;
    std::string cfg = trimmed(config);

    // Detect scheme
    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Path component selects the endpoint
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        const std::string path = hostPortPath.substr(slash);
        if (path.size() > 1u) {
            opts.rpcPath = path;
        }
    }
    hostPort = trimmed(hostPort);

    // Parse host[:port] including IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        opts.address = trimmed(opts.address);
        opts.port = trimmed(opts.port);
        if (opts.port.empty()) opts.port = "8000"; // default
    }

    // Parse query parameters: cert, key
    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") {
                opts.certFile = val;
            } else if (key == "key") {
                opts.keyFile = val;
            }
        }
    }
    return opts;
}

std::unique_ptr<ITransportAdapter> HTTPServerFactory::CreateTransportAdapter(const std::string& config,
                                                                             Dispatcher& dispatcher) {
    return std::make_unique<HTTPServer>(dispatcher, ParseOptions(config));
}

} // namespace toolgate
