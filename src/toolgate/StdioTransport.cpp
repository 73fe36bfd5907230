//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Newline-delimited stdio adapter
//==========================================================================================================

#include "toolgate/StdioTransport.hpp"

#include <unistd.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <errno.h>
#include <cstring>

#include <array>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "toolgate/Dispatcher.h"

namespace toolgate {

class StdioTransport::Impl {
public:
    Impl(Dispatcher& d, std::istream* i, int fd, std::ostream& o) : dispatcher(d), in(i), inFd(fd), out(o) {
        if (inFd >= 0) {
            wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
            if (wakeEventFd < 0) {
                LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
            }
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
            wakeEventFd = -1;
        }
    }

    Dispatcher& dispatcher;
    std::istream* in;
    int inFd;
    std::ostream& out;
    int wakeEventFd{-1};
    std::string pending;
    std::size_t pendingPos{0};
    std::mutex writeMutex;
    std::thread readerThread;
    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};
    std::atomic<std::size_t> maxLineBytes{DefaultMaxLineBytes};
    ErrorHandler errorHandler;
    ConnectionContext ctx;

    enum class ReadStatus { Line, Oversize, Eof };

    static constexpr int Eof = std::char_traits<char>::eof();
    // Without a wake fd the reader rechecks stopRequested at this interval.
    static constexpr int FallbackPollMs = 200;

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        const uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void drainWake() {
        uint64_t v = 0;
        ssize_t r;
        do {
            r = ::read(wakeEventFd, &v, sizeof(v));
        } while (r < 0 && errno == EINTR);
        if (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: wake event read failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    //======================================================================================================
    // fill
    // Purpose: Waits until inFd is readable or Stop() is requested, then reads one chunk into pending.
    // Returns:
    //   false on EOF, stop or a read error.
    //======================================================================================================
    bool fill() {
        pending.clear();
        pendingPos = 0;
        std::array<char, 4096> tmp{};
        while (!stopRequested.load()) {
            pollfd pfds[2];
            pfds[0].fd = inFd;
            pfds[0].events = POLLIN;
            pfds[0].revents = 0;
            nfds_t nfds = 1;
            if (wakeEventFd >= 0) {
                pfds[1].fd = wakeEventFd;
                pfds[1].events = POLLIN;
                pfds[1].revents = 0;
                nfds = 2;
            }
            const int rc = ::poll(pfds, nfds, wakeEventFd >= 0 ? -1 : FallbackPollMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                reportError(std::string("poll failed: ") + ::strerror(errno));
                return false;
            }
            if (rc == 0) {
                continue;
            }
            if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                drainWake();
                LOG_DEBUG("StdioTransport: reader woken for stop");
                continue;
            }
            if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
                ssize_t n;
                do {
                    n = ::read(inFd, tmp.data(), tmp.size());
                } while (n < 0 && errno == EINTR);
                if (n > 0) {
                    pending.assign(tmp.data(), static_cast<std::size_t>(n));
                    return true;
                }
                if (n == 0) {
                    return false;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }
                reportError(std::string("read error: ") + ::strerror(errno));
                return false;
            }
        }
        return false;
    }

    int nextByte() {
        if (inFd < 0) {
            std::streambuf* sb = in != nullptr ? in->rdbuf() : nullptr;
            if (sb == nullptr) {
                return Eof;
            }
            const int ch = sb->sbumpc();
            if (ch == Eof) {
                in->setstate(std::ios::eofbit);
            }
            return ch;
        }
        if (pendingPos >= pending.size() && !fill()) {
            return Eof;
        }
        return static_cast<unsigned char>(pending[pendingPos++]);
    }

    // Reads up to '\n' without buffering more than maxLineBytes; the rest of an oversize line is skipped.
    ReadStatus readLine(std::string& line) {
        line.clear();
        const std::size_t limit = maxLineBytes.load();
        bool oversize = false;
        bool sawAny = false;
        for (;;) {
            const int ch = nextByte();
            if (ch == Eof) {
                if (!sawAny || stopRequested.load()) return ReadStatus::Eof;
                break;
            }
            sawAny = true;
            if (ch == '\n') {
                break;
            }
            if (oversize) {
                continue;
            }
            if (line.size() >= limit) {
                oversize = true;
                line.clear();
                continue;
            }
            line.push_back(static_cast<char>(ch));
        }
        if (oversize) {
            return ReadStatus::Oversize;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return ReadStatus::Line;
    }

    void reportError(const std::string& msg) {
        LOG_WARN("StdioTransport: {}", msg);
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void writeLine(const std::string& payload) {
        std::lock_guard<std::mutex> lock(writeMutex);
        out << payload << '\n';
        out.flush();
        if (!out.good()) {
            reportError("output stream failure");
        }
    }

    static bool isBlank(const std::string& s) {
        for (char c : s) {
            if (c != ' ' && c != '\t' && c != '\r') return false;
        }
        return true;
    }

    void loop() {
        running = true;
        std::string line;
        while (!stopRequested.load()) {
            const ReadStatus st = readLine(line);
            if (st == ReadStatus::Eof) {
                LOG_INFO("StdioTransport: {}", stopRequested.load() ? "stop requested" : "input closed");
                break;
            }
            if (st == ReadStatus::Oversize) {
                reportError("line exceeds " + std::to_string(maxLineBytes.load()) + " bytes; discarded");
                continue;
            }
            if (isBlank(line)) {
                continue;
            }
            DispatchResult r = dispatcher.HandlePayload(line, ctx);
            if (r.malformed) {
                LOG_DEBUG("StdioTransport: dropping malformed line without id");
                continue;
            }
            if (r.reply.has_value()) {
                writeLine(r.reply.value());
            }
        }
        dispatcher.CloseConnection(ctx);
        running = false;
    }

    void requestStop() {
        stopRequested = true;
        wake();
    }
};

StdioTransport::StdioTransport(Dispatcher& dispatcher)
    : pImpl(std::make_unique<Impl>(dispatcher, nullptr, STDIN_FILENO, std::cout)) {
    // stdout carries envelopes only
    Logger::setUseStderr(true);
}

StdioTransport::StdioTransport(Dispatcher& dispatcher, std::istream& in, std::ostream& out)
    : pImpl(std::make_unique<Impl>(dispatcher, &in, -1, out)) {}

StdioTransport::StdioTransport(Dispatcher& dispatcher, int inputFd, std::ostream& out)
    : pImpl(std::make_unique<Impl>(dispatcher, nullptr, inputFd, out)) {
    if (inputFd < 0) {
        throw std::invalid_argument("StdioTransport: invalid input descriptor");
    }
}

StdioTransport::~StdioTransport() {
    pImpl->requestStop();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->readerThread.joinable() || pImpl->running.load()) {
        promise.set_exception(std::make_exception_ptr(std::logic_error("StdioTransport already started")));
        return promise.get_future();
    }
    LOG_INFO("Starting StdioTransport");
    pImpl->stopRequested = false;
    pImpl->running = true;
    pImpl->readerThread = std::thread([this]() { pImpl->loop(); });
    promise.set_value();
    return promise.get_future();
}

std::future<void> StdioTransport::Stop() {
    FUNC_SCOPE();
    LOG_INFO("Stopping StdioTransport");
    pImpl->requestStop();
    if (pImpl->readerThread.joinable() && pImpl->readerThread.get_id() != std::this_thread::get_id()) {
        pImpl->readerThread.join();
    }
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool StdioTransport::IsRunning() const {
    return pImpl->running.load();
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void StdioTransport::Run() {
    pImpl->stopRequested = false;
    pImpl->loop();
}

void StdioTransport::SetMaxLineBytes(std::size_t maxBytes) {
    if (maxBytes == 0) {
        throw std::invalid_argument("StdioTransport: maxLineBytes must be positive");
    }
    pImpl->maxLineBytes = maxBytes;
}

std::unique_ptr<ITransportAdapter> StdioTransportFactory::CreateTransportAdapter(const std::string& config,
                                                                                 Dispatcher& dispatcher) {
    auto t = std::make_unique<StdioTransport>(dispatcher);
    const std::string key = "maxLineBytes=";
    const auto pos = config.find(key);
    if (pos != std::string::npos) {
        const auto end = config.find(';', pos);
        const std::string v = config.substr(pos + key.size(), end == std::string::npos ? std::string::npos : end - pos - key.size());
        try {
            t->SetMaxLineBytes(static_cast<std::size_t>(std::stoull(v)));
        } catch (const std::logic_error&) {
            throw std::invalid_argument("StdioTransportFactory: invalid maxLineBytes '" + v + "'");
        }
    }
    return t;
}

} // namespace toolgate
