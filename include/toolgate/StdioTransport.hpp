//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Local process adapter: newline-delimited envelopes on stdin/stdout
//==========================================================================================================
#pragma once

#include "toolgate/Transport.h"
#include <cstddef>
#include <iosfwd>
#include <memory>

namespace toolgate {

//==========================================================================================================
// StdioTransport
// Purpose: Serves one caller over a pair of streams, one envelope per line.
// Notes:
//   - One connection per process: at most one session, removed when input reaches EOF or on Stop().
//   - Replies are written in processing order, one line each, and flushed. Notifications write nothing.
//   - File-descriptor input (stdin, a pipe) is read with poll() alongside an eventfd, so Stop() wakes a
//     reader that is waiting for data. std::istream input is only checked for Stop() between lines.
//==========================================================================================================
class StdioTransport : public ITransportAdapter {
public:
    static constexpr std::size_t DefaultMaxLineBytes = 4u * 1024u * 1024u;

    // Reads STDIN_FILENO, writes std::cout and routes logging to stderr.
    explicit StdioTransport(Dispatcher& dispatcher);

    // Streams must outlive the transport.
    StdioTransport(Dispatcher& dispatcher, std::istream& in, std::ostream& out);

    // Reads from inputFd, which stays owned by the caller and must outlive the transport.
    StdioTransport(Dispatcher& dispatcher, int inputFd, std::ostream& out);
    ~StdioTransport() override;

    ////////////////////////////////////////// ITransportAdapter //////////////////////////////////////////
    // Spawns the reader loop on a background thread.
    std::future<void> Start() override;

    //==========================================================================================================
    // Requests the loop to stop, wakes a reader blocked on fd input and waits for the reader thread.
    //==========================================================================================================
    std::future<void> Stop() override;

    bool IsRunning() const override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // Run
    // Purpose: Runs the reader loop on the calling thread until EOF or Stop().
    //==========================================================================================================
    void Run();

    //==========================================================================================================
    // SetMaxLineBytes
    // Purpose: Lines longer than maxBytes are discarded and reported through the error handler.
    //==========================================================================================================
    void SetMaxLineBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates stdio adapters. The configuration string is ignored apart from "maxLineBytes=N".
//==========================================================================================================
class StdioTransportFactory : public ITransportAdapterFactory {
public:
    std::unique_ptr<ITransportAdapter> CreateTransportAdapter(const std::string& config,
                                                              Dispatcher& dispatcher) override;
};

} // namespace toolgate
