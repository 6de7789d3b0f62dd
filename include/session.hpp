#pragma once

#include <string>
#include <memory>
#include <functional>
#include "config.hpp"
#include "transfer.hpp"

namespace networking {

using StatusCallback = std::function<void(const std::string&)>;
using ProgressCallback = transfer::TransferProgressCallback;

// Outcome of one accepted connection.
struct SessionReport {
    std::string peer;
    uint8_t opcode = 0;
    transfer::TransferResult result;
};

struct ServerCallbacks {
    std::function<void(unsigned short port)> on_ready;
    StatusCallback on_status;
    ProgressCallback on_progress;
    std::function<void(const SessionReport&)> on_session_complete;
    std::function<void(const std::string&)> on_error;
};

// Last path component of a peer-supplied name, with both separator styles
// honoured. Empty when nothing usable is left ("", ".", "..", "dir/").
std::string base_name(const std::string& requested);

// Server side of one connection:
// AwaitOpcode -> Downloading | Uploading -> Closed.
class Session {
public:
    Session(std::unique_ptr<transfer::TlsStream> stream, const config::Config& cfg,
            const ServerCallbacks& callbacks);

    // Drives the connection to completion. Never throws; failures are in
    // the returned report.
    SessionReport run();

private:
    void handle_download();
    void handle_upload();

    void status(const std::string& message) const;
    void warn(const std::string& message) const;

    std::unique_ptr<transfer::TlsStream> stream_;
    const config::Config& cfg_;
    const ServerCallbacks& callbacks_;
    SessionReport report_;
};

} // namespace networking
