#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "networking.hpp"
#include "security.hpp"
#include "transfer.hpp"

namespace testing_support {

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("lanferry_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string random_bytes(std::size_t size, unsigned seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string data(size, '\0');
    for (auto& c : data) c = static_cast<char>(dist(gen));
    return data;
}

// Config for tests: ephemeral TCP port, discovery off unless asked for.
inline config::Config make_config(const std::string& storage_dir, const std::string& download_dir) {
    config::Config cfg;
    cfg.tcp_port = 0;
    cfg.discovery_enabled = false;
    cfg.storage_dir = storage_dir;
    cfg.download_dir = download_dir;
    cfg.buffer_size = 16 * 1024;
    return cfg;
}

inline networking::ClientCallbacks quiet_client() {
    networking::ClientCallbacks callbacks;
    callbacks.on_status = [](const std::string&) {};
    callbacks.on_error = [](const std::string&) {};
    return callbacks;
}

// Runs a Server on its own thread and records every session report.
class ServerHarness {
public:
    explicit ServerHarness(const config::Config& cfg)
        : cfg_(cfg), ssl_ctx_(security::create_transport_context()) {
        networking::ServerCallbacks callbacks;
        callbacks.on_status = [](const std::string&) {};
        callbacks.on_error = [](const std::string&) {};
        callbacks.on_session_complete = [this](const networking::SessionReport& report) {
            std::lock_guard<std::mutex> lock(mutex_);
            reports_.push_back(report);
        };

        server_ = std::make_unique<networking::Server>(cfg_, *ssl_ctx_, callbacks);
        server_->start();
        thread_ = std::thread([this]() { server_->run(); });
    }

    ~ServerHarness() {
        server_->stop();
        if (thread_.joinable()) thread_.join();
        server_.reset();
    }

    networking::Server& server() { return *server_; }

    networking::ServerAddress address() const {
        return {boost::asio::ip::address_v4::loopback(), server_->port()};
    }

    bool wait_for_sessions(std::size_t count) {
        return server_->wait_for_sessions(count, std::chrono::seconds(30));
    }

    std::vector<networking::SessionReport> reports() {
        std::lock_guard<std::mutex> lock(mutex_);
        return reports_;
    }

private:
    config::Config cfg_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::unique_ptr<networking::Server> server_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<networking::SessionReport> reports_;
};

// Raw TLS connection for driving the wire protocol by hand.
class RawConnection {
public:
    explicit RawConnection(const networking::ServerAddress& address)
        : ssl_ctx_(security::create_transport_context()),
          stream_(io_context_, *ssl_ctx_) {
        stream_.lowest_layer().connect(address.endpoint());
        stream_.handshake(boost::asio::ssl::stream_base::client);
    }

    transfer::TlsStream& stream() { return stream_; }

    void write(const void* data, std::size_t size) {
        boost::asio::write(stream_, boost::asio::buffer(data, size));
    }

    void close() { transfer::close_stream(stream_); }

private:
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    transfer::TlsStream stream_;
};

} // namespace testing_support
