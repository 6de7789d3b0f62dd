#include "networking.hpp"
#include "protocol/packet.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(const config::Config& cfg, boost::asio::ssl::context& ssl_ctx, ServerCallbacks callbacks)
    : cfg_(cfg), ssl_ctx_(ssl_ctx), callbacks_(std::move(callbacks)), acceptor_(io_context_) {}

Server::~Server() {
    stop();
    boost::system::error_code ec;
    acceptor_.close(ec);
    discovery_.reset();

    // Sessions borrow the io_context and config; they have no deadline, so a
    // stalled peer keeps the server alive until it goes away.
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    sessions_cv_.wait(lock, [this]() { return active_sessions_ == 0; });
}

void Server::status(const std::string& message) const {
    if (callbacks_.on_status) {
        callbacks_.on_status(message);
    } else {
        std::cout << message << "\n";
    }
}

void Server::error(const std::string& message) const {
    if (callbacks_.on_error) {
        callbacks_.on_error(message);
    } else {
        std::cerr << message << "\n";
    }
}

void Server::start() {
    std::error_code fs_ec;
    fs::create_directories(cfg_.storage_dir, fs_ec);
    if (!fs::is_directory(cfg_.storage_dir, fs_ec)) {
        throw std::runtime_error("Storage directory unavailable: " + cfg_.storage_dir);
    }

    tcp::endpoint endpoint(tcp::v4(), cfg_.tcp_port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    status("Secure file server listening on :" + std::to_string(port_) + " (TLS enabled)");

    if (cfg_.discovery_enabled) {
        discovery_ = std::make_unique<DiscoveryResponder>(cfg_, port_, callbacks_.on_status);
        // Failure leaves the file service running without discovery
        discovery_->start();
    }

    if (callbacks_.on_ready) callbacks_.on_ready(port_);
    do_accept();
}

void Server::run() {
    io_context_.run();
}

void Server::stop() {
    io_context_.stop();
    if (discovery_) discovery_->stop();
}

void Server::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (!ec) {
            spawn_session(std::move(socket));
        } else if (ec == boost::asio::error::operation_aborted) {
            return;
        } else {
            error("Error accepting connection: " + ec.message());
        }
        if (acceptor_.is_open()) do_accept();
    });
}

void Server::spawn_session(tcp::socket socket) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        ++active_sessions_;
    }

    auto stream = std::make_unique<transfer::TlsStream>(std::move(socket), ssl_ctx_);
    std::thread([this, stream = std::move(stream)]() mutable {
        {
            // Everything registered with io_context_ dies here, before the
            // destructor can observe active_sessions_ == 0.
            Session session(std::move(stream), cfg_, callbacks_);
            SessionReport report = session.run();

            if (callbacks_.on_session_complete) {
                callbacks_.on_session_complete(report);
            }
        }

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        --active_sessions_;
        ++completed_sessions_;
        sessions_cv_.notify_all();
    }).detach();
}

std::size_t Server::active_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return active_sessions_;
}

std::size_t Server::completed_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return completed_sessions_;
}

bool Server::wait_for_sessions(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    return sessions_cv_.wait_for(lock, timeout, [this, count]() { return completed_sessions_ >= count; });
}

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client(const config::Config& cfg, boost::asio::ssl::context& ssl_ctx, ClientCallbacks callbacks)
    : cfg_(cfg), ssl_ctx_(ssl_ctx), callbacks_(std::move(callbacks)) {}

void Client::status(const std::string& message) const {
    if (callbacks_.on_status) {
        callbacks_.on_status(message);
    } else {
        std::cout << message << "\n";
    }
}

transfer::TransferResult Client::finish(transfer::TransferResult result) {
    if (!result.ok()) {
        if (callbacks_.on_error) {
            callbacks_.on_error(result.error);
        } else {
            std::cerr << "Client error: " << result.error << "\n";
        }
    }
    if (callbacks_.on_complete) callbacks_.on_complete(result);
    return result;
}

void Client::connect(transfer::TlsStream& stream, const ServerAddress& address) {
    status("Connecting to " + address.to_string() + "...");
    stream.lowest_layer().connect(address.endpoint());
    stream.handshake(boost::asio::ssl::stream_base::client);
    status("Connected to server (TLS)");
}

transfer::TransferResult Client::download(const std::string& filename) {
    auto address = find_server_address(cfg_);
    if (!address) {
        transfer::TransferResult result;
        result.error = "No servers found. Discovery failed or timed out.";
        return finish(result);
    }
    return download_from(*address, filename);
}

transfer::TransferResult Client::upload(const std::string& filepath) {
    auto address = find_server_address(cfg_);
    if (!address) {
        transfer::TransferResult result;
        result.error = "No servers found. Discovery failed or timed out.";
        return finish(result);
    }
    return upload_to(*address, filepath);
}

transfer::TransferResult Client::download_from(const ServerAddress& address, const std::string& filename) {
    transfer::TransferResult result;
    try {
        std::string local_name = base_name(filename);
        if (local_name.empty()) {
            throw std::runtime_error("Invalid file name: '" + filename + "'");
        }

        boost::asio::io_context io_context;
        transfer::TlsStream stream(io_context, ssl_ctx_);
        connect(stream, address);

        transfer::MessageSender::send_opcode(stream, protocol::OpCode::DOWNLOAD);
        status("Requesting file: " + filename);
        transfer::MessageSender::send_request(stream, filename);

        status("Waiting for response...");
        protocol::TransferHeader header = transfer::MessageReceiver::receive_header(stream, cfg_.max_filename_length);
        status("File found: " + header.filename + " (" + std::to_string(header.file_size) + " bytes)");
        status("Server checksum: " + protocol::to_hex(header.checksum));

        fs::path out_path = fs::path(cfg_.download_dir) / (cfg_.download_prefix + local_name);
        result.path = out_path.string();

        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Could not create local file: " + out_path.string());
        }

        // The server-declared size bounds the copy.
        protocol::Hasher hasher;
        try {
            result.bytes = transfer::MessageReceiver::receive_exact(
                stream, out, static_cast<uint64_t>(header.file_size), hasher, local_name,
                cfg_.buffer_size, callbacks_.on_progress);
            out.close();
            if (out.fail()) {
                throw std::runtime_error("Could not finish writing " + out_path.string());
            }
        } catch (const std::exception&) {
            out.close();
            std::error_code ec;
            fs::remove(out_path, ec);
            throw;
        }
        result.checksum = hasher.finish();
        transfer::close_stream(stream);

        status("Downloaded " + std::to_string(result.bytes) + " bytes");
        status("Client checksum: " + protocol::to_hex(result.checksum));

        if (result.checksum == header.checksum) {
            result.state = transfer::TransferState::COMPLETED;
            status("Integrity verified: checksum matches");
        } else {
            result.state = transfer::TransferState::CHECKSUM_MISMATCH;
            result.error = "Integrity failure: checksum mismatch";
            std::error_code ec;
            fs::remove(out_path, ec);
        }
    } catch (const std::exception& e) {
        result.state = transfer::TransferState::FAILED;
        result.error = e.what();
    }
    return finish(result);
}

transfer::TransferResult Client::upload_to(const ServerAddress& address, const std::string& filepath) {
    transfer::TransferResult result;
    result.path = filepath;
    try {
        std::error_code ec;
        if (!fs::is_regular_file(filepath, ec)) {
            throw std::runtime_error("Not a regular file: " + filepath);
        }
        std::string name = base_name(filepath);
        if (name.empty()) {
            throw std::runtime_error("Invalid file name: '" + filepath + "'");
        }

        std::ifstream file(filepath, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open file for reading: " + filepath);
        }
        uint64_t file_size = fs::file_size(filepath);

        status("Computing checksum...");
        result.checksum = protocol::compute_checksum(filepath);

        boost::asio::io_context io_context;
        transfer::TlsStream stream(io_context, ssl_ctx_);
        connect(stream, address);

        transfer::MessageSender::send_opcode(stream, protocol::OpCode::UPLOAD);
        status("Sending file header (size: " + std::to_string(file_size) + " bytes)");
        transfer::MessageSender::send_header(stream, name, static_cast<int64_t>(file_size), result.checksum);

        result.bytes = transfer::MessageSender::send_file(
            stream, file, name, file_size, cfg_.buffer_size, callbacks_.on_progress);

        // Closing is the only end-of-stream marker the server gets.
        transfer::close_stream(stream);

        result.state = transfer::TransferState::COMPLETED;
        status("Successfully uploaded " + filepath + " (" + std::to_string(result.bytes) + " bytes)");
    } catch (const std::exception& e) {
        result.state = transfer::TransferState::FAILED;
        result.error = e.what();
    }
    return finish(result);
}

} // namespace networking
