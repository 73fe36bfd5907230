//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/MiniServer.h
// Purpose: Scripted single-threaded HTTP server for client transport tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"

namespace toolgate {
namespace testing {

// Answers one request per connection with whatever the handler fills into the response.
class MiniServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Handler = std::function<void(const Request&, Response&)>;

    explicit MiniServer(Handler h) : handler(std::move(h)) {}
    ~MiniServer() { stop(); }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                serveOne();
            }
        });
    }

    void stop() {
        if (!running.exchange(false)) {
            return;
        }
        boost::system::error_code ec;
        {
            // Wake the blocking accept
            boost::asio::ip::tcp::socket poke{io};
            poke.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        }
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    unsigned short port{0};
    std::atomic<int> requests{0};

private:
    void serveOne() {
        namespace http = boost::beast::http;
        using boost::asio::ip::tcp;
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) {
                return;
            }
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buffer;
            Request req;
            http::read(stream, buffer, req);
            ++requests;
            Response res{http::status::ok, req.version()};
            res.set(http::field::content_type, "application/json");
            handler(req, res);
            res.keep_alive(false);
            res.prepare_payload();
            http::write(stream, res);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception& e) {
            LOG_DEBUG("MiniServer: {}", e.what());
        }
    }

    Handler handler;
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
};

// Port with nothing listening on it.
inline unsigned short closedPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor a{io, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    const unsigned short p = a.local_endpoint().port();
    a.close();
    return p;
}

} // namespace testing
} // namespace toolgate
