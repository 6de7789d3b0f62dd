#include "session.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <sodium.h>

namespace fs = std::filesystem;

namespace networking {

namespace {

// Private name next to the destination, so concurrent uploads of the same
// file never write into each other; the last one to finish is renamed last.
fs::path part_path_for(const fs::path& final_path) {
    unsigned char random[8];
    char hex[sizeof(random) * 2 + 1];
    randombytes_buf(random, sizeof(random));
    sodium_bin2hex(hex, sizeof(hex), random, sizeof(random));

    fs::path part = final_path;
    part += std::string(".part-") + hex;
    return part;
}

} // namespace

std::string base_name(const std::string& requested) {
    std::string path = requested;
    std::replace(path.begin(), path.end(), '\\', '/');
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    size_t slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == ".." || name.find('\0') != std::string::npos) {
        return "";
    }
    return name;
}

Session::Session(std::unique_ptr<transfer::TlsStream> stream, const config::Config& cfg,
                 const ServerCallbacks& callbacks)
    : stream_(std::move(stream)), cfg_(cfg), callbacks_(callbacks) {}

void Session::status(const std::string& message) const {
    if (callbacks_.on_status) {
        callbacks_.on_status(message);
    } else {
        std::cout << "[" << report_.peer << "] " << message << "\n";
    }
}

void Session::warn(const std::string& message) const {
    if (callbacks_.on_error) {
        callbacks_.on_error(message);
    } else {
        std::cerr << "[" << report_.peer << "] " << message << "\n";
    }
}

SessionReport Session::run() {
    boost::system::error_code ec;
    auto remote = stream_->lowest_layer().remote_endpoint(ec);
    report_.peer = ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());
    report_.result.state = transfer::TransferState::FAILED;

    try {
        stream_->handshake(boost::asio::ssl::stream_base::server);
        status("Accepted connection");

        report_.opcode = transfer::MessageReceiver::receive_opcode(*stream_);
        if (!protocol::is_known_opcode(report_.opcode)) {
            // No error frame exists, the peer just sees the connection close
            report_.result.error = "Unknown operation code: " + std::to_string(report_.opcode);
            warn(report_.result.error);
        } else if (static_cast<protocol::OpCode>(report_.opcode) == protocol::OpCode::DOWNLOAD) {
            handle_download();
        } else {
            handle_upload();
        }
    } catch (const std::exception& e) {
        report_.result.state = transfer::TransferState::FAILED;
        report_.result.error = e.what();
        warn("Session failed: " + report_.result.error);
    }

    transfer::close_stream(*stream_);
    return report_;
}

void Session::handle_download() {
    std::string requested = transfer::MessageReceiver::receive_request(*stream_, cfg_.max_filename_length);
    std::string name = base_name(requested);
    if (name.empty()) {
        throw std::runtime_error("Rejected download request for '" + requested + "'");
    }
    status("Client requested file: " + name);

    fs::path path = fs::path(cfg_.storage_dir) / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("File not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for reading: " + path.string());
    }
    uint64_t file_size = fs::file_size(path);

    status("Computing checksum...");
    protocol::Checksum checksum = protocol::compute_checksum(path.string());

    report_.result.path = path.string();
    report_.result.checksum = checksum;

    status("Sending file header (size: " + std::to_string(file_size) + " bytes)");
    transfer::MessageSender::send_header(*stream_, name, static_cast<int64_t>(file_size), checksum);

    report_.result.bytes = transfer::MessageSender::send_file(
        *stream_, file, name, file_size, cfg_.buffer_size, callbacks_.on_progress);
    report_.result.state = transfer::TransferState::COMPLETED;
    status("Sent " + std::to_string(report_.result.bytes) + " bytes for file " + name);
}

void Session::handle_upload() {
    status("Client initiating upload...");
    protocol::TransferHeader header =
        transfer::MessageReceiver::receive_header(*stream_, cfg_.max_filename_length);

    std::string name = base_name(header.filename);
    if (name.empty()) {
        throw std::runtime_error("Rejected upload name '" + header.filename + "'");
    }
    status("Receiving file: " + name + " (" + std::to_string(header.file_size) + " bytes)");

    fs::path final_path = fs::path(cfg_.storage_dir) / (cfg_.upload_prefix + name);
    fs::path part_path = part_path_for(final_path);
    report_.result.path = final_path.string();

    std::ofstream file(part_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Could not create file: " + part_path.string());
    }

    protocol::Checksum local_checksum{};
    try {
        // Read to connection close; the declared size is not trusted as a bound.
        report_.result.bytes = transfer::MessageReceiver::receive_until_close(
            *stream_, file, name, static_cast<uint64_t>(header.file_size),
            cfg_.buffer_size, callbacks_.on_progress);
        file.close();
        if (file.fail()) {
            throw std::runtime_error("Could not finish writing " + part_path.string());
        }

        local_checksum = protocol::compute_checksum(part_path.string());
        fs::rename(part_path, final_path);
    } catch (const std::exception&) {
        if (file.is_open()) file.close();
        std::error_code ec;
        fs::remove(part_path, ec);
        throw;
    }

    report_.result.checksum = local_checksum;

    if (local_checksum == header.checksum) {
        report_.result.state = transfer::TransferState::COMPLETED;
        status("Successfully received " + final_path.string() + " (" +
               std::to_string(report_.result.bytes) + " bytes). Integrity verified.");
    } else {
        report_.result.state = transfer::TransferState::CHECKSUM_MISMATCH;
        report_.result.error = "Checksum mismatch";
        warn("WARNING: Checksum mismatch for " + final_path.string());
    }
}

} // namespace networking
