#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <memory>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "config.hpp"
#include "discovery.hpp"
#include "session.hpp"
#include "transfer.hpp"

namespace networking {

struct ClientCallbacks {
    StatusCallback on_status;
    ProgressCallback on_progress;
    std::function<void(const transfer::TransferResult&)> on_complete;
    std::function<void(const std::string&)> on_error;
};

// TLS file server. One detached thread per accepted connection, plus the
// discovery responder on its own thread.
class Server {
public:
    Server(const config::Config& cfg, boost::asio::ssl::context& ssl_ctx,
           ServerCallbacks callbacks = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds the listening socket (throws boost::system::system_error on
    // failure) and starts discovery, which is allowed to fail.
    void start();

    // Accept loop; returns after stop().
    void run();
    void stop();

    unsigned short port() const { return port_; }
    bool discovery_running() const { return discovery_ && discovery_->is_running(); }
    std::size_t active_sessions() const;
    std::size_t completed_sessions() const;

    // Blocks until `count` sessions have finished or the timeout expires.
    bool wait_for_sessions(std::size_t count, std::chrono::milliseconds timeout) const;

private:
    void do_accept();
    void spawn_session(boost::asio::ip::tcp::socket socket);
    void status(const std::string& message) const;
    void error(const std::string& message) const;

    const config::Config& cfg_;
    boost::asio::ssl::context& ssl_ctx_;
    ServerCallbacks callbacks_;

    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::unique_ptr<DiscoveryResponder> discovery_;

    mutable std::mutex sessions_mutex_;
    mutable std::condition_variable sessions_cv_;
    std::size_t active_sessions_ = 0;
    std::size_t completed_sessions_ = 0;
};

// One transfer per call, strictly sequential: discovery, TLS connect,
// request, stream, verify.
class Client {
public:
    Client(const config::Config& cfg, boost::asio::ssl::context& ssl_ctx,
           ClientCallbacks callbacks = {});

    // Resolve the server through discovery first; no connection is attempted
    // when nothing answers.
    transfer::TransferResult download(const std::string& filename);
    transfer::TransferResult upload(const std::string& filepath);

    transfer::TransferResult download_from(const ServerAddress& address, const std::string& filename);
    transfer::TransferResult upload_to(const ServerAddress& address, const std::string& filepath);

private:
    void connect(transfer::TlsStream& stream, const ServerAddress& address);
    transfer::TransferResult finish(transfer::TransferResult result);
    void status(const std::string& message) const;

    const config::Config& cfg_;
    boost::asio::ssl::context& ssl_ctx_;
    ClientCallbacks callbacks_;
};

} // namespace networking
