//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseWriter.hpp
// Purpose: HTTP reply writers for the network adapter: one buffered JSON body or a one-event stream
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "toolgate/Protocol.h"

namespace toolgate {
namespace detail {

namespace net = boost::asio;
namespace http = boost::beast::http;

//==========================================================================================================
// ReplyMeta
// Purpose: Per-reply header values derived from the connection's session.
//==========================================================================================================
struct ReplyMeta {
    std::optional<std::string> sessionId;
    std::optional<std::string> protocolVersion;
    bool keepAlive{false};
};

// CORS and session headers shared by every reply the server writes.
inline void applyCommonHeaders(http::response_header<>& h, const ReplyMeta& meta) {
    h.set(http::field::server, "toolgate");
    h.set(http::field::access_control_allow_origin, "*");
    h.set(http::field::access_control_expose_headers,
          std::string(Headers::SessionId) + ", " + Headers::ProtocolVersion);
    if (meta.sessionId.has_value()) {
        h.set(Headers::SessionId, meta.sessionId.value());
    }
    if (meta.protocolVersion.has_value()) {
        h.set(Headers::ProtocolVersion, meta.protocolVersion.value());
    }
}

//==========================================================================================================
// IResponseWriter
// Purpose: Delivers the outcome of one POST. The dispatcher never sees which writer is in use.
//==========================================================================================================
class IResponseWriter {
public:
    virtual ~IResponseWriter() = default;

    // Writes a reply envelope (or batch array) with the given status.
    virtual net::awaitable<void> WriteReply(http::status status, std::string payload, const ReplyMeta& meta) = 0;

    // Writes 202 Accepted with an empty body.
    virtual net::awaitable<void> WriteAccepted(const ReplyMeta& meta) = 0;
};

//==========================================================================================================
// BufferedResponseWriter
// Purpose: application/json reply with Content-Length.
//==========================================================================================================
template <class Stream>
class BufferedResponseWriter : public IResponseWriter {
public:
    BufferedResponseWriter(Stream& stream, unsigned version) : stream(stream), version(version) {}

    net::awaitable<void> WriteReply(http::status status, std::string payload, const ReplyMeta& meta) override {
        http::response<http::string_body> res{status, version};
        res.set(http::field::content_type, "application/json");
        applyCommonHeaders(res, meta);
        res.keep_alive(meta.keepAlive);
        res.body() = std::move(payload);
        res.prepare_payload();
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> WriteAccepted(const ReplyMeta& meta) override {
        http::response<http::empty_body> res{http::status::accepted, version};
        applyCommonHeaders(res, meta);
        res.keep_alive(meta.keepAlive);
        res.content_length(0);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

private:
    Stream& stream;
    unsigned version;
};

//==========================================================================================================
// EventStreamResponseWriter
// Purpose: text/event-stream reply using chunked transfer encoding. The reply is sent as a single
//          "message" event, then the stream is terminated. Acknowledgements stay plain 202 responses.
//==========================================================================================================
template <class Stream>
class EventStreamResponseWriter : public IResponseWriter {
public:
    EventStreamResponseWriter(Stream& stream, unsigned version) : stream(stream), buffered(stream, version), version(version) {}

    net::awaitable<void> WriteReply(http::status status, std::string payload, const ReplyMeta& meta) override {
        http::response<http::empty_body> res{status, version};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        applyCommonHeaders(res, meta);
        res.keep_alive(false);
        res.chunked(true);
        http::response_serializer<http::empty_body> sr{res};
        co_await http::async_write_header(stream, sr, net::use_awaitable);

        const std::string event = formatEvent("message", payload);
        co_await net::async_write(stream, http::make_chunk(net::buffer(event)), net::use_awaitable);
        co_await net::async_write(stream, http::make_chunk_last(), net::use_awaitable);
    }

    net::awaitable<void> WriteAccepted(const ReplyMeta& meta) override {
        co_await buffered.WriteAccepted(meta);
    }

    // Serialized envelopes never contain raw newlines, so a single data line suffices.
    static std::string formatEvent(const std::string& name, const std::string& data) {
        return "event: " + name + "\ndata: " + data + "\n\n";
    }

private:
    Stream& stream;
    BufferedResponseWriter<Stream> buffered;
    unsigned version;
};

} // namespace detail
} // namespace toolgate
