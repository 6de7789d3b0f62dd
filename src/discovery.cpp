#include "discovery.hpp"
#include <iostream>
#include <array>
#include <chrono>
#include <cctype>

using boost::asio::ip::udp;

namespace networking {

std::string make_port_payload(unsigned short port) {
    return ":" + std::to_string(port);
}

std::optional<unsigned short> parse_port_payload(const std::string& payload) {
    if (payload.size() < 2 || payload.size() > 6 || payload[0] != ':') {
        return std::nullopt;
    }

    unsigned long port = 0;
    for (size_t i = 1; i < payload.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(payload[i]))) {
            return std::nullopt;
        }
        port = port * 10 + static_cast<unsigned long>(payload[i] - '0');
    }
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<unsigned short>(port);
}

// ─── DiscoveryResponder ─────────────────────────────────────────────────────

DiscoveryResponder::DiscoveryResponder(const config::Config& cfg, unsigned short service_port,
                                       StatusCallback on_status)
    : cfg_(cfg),
      payload_(make_port_payload(service_port)),
      on_status_(std::move(on_status)),
      socket_(io_context_) {}

DiscoveryResponder::~DiscoveryResponder() {
    stop();
}

void DiscoveryResponder::log(const std::string& message) const {
    if (on_status_) {
        on_status_(message);
    } else {
        std::cout << message << "\n";
    }
}

bool DiscoveryResponder::start() {
    if (running_) return true;

    boost::system::error_code ec;
    // No reuse_address: a second responder on the same host must fail to bind.
    socket_.open(udp::v4(), ec);
    if (!ec) socket_.bind(udp::endpoint(udp::v4(), cfg_.discovery_port), ec);
    if (!ec) socket_.non_blocking(true, ec);

    if (ec) {
        log("Warning: UDP discovery disabled (error binding " +
            std::to_string(cfg_.discovery_port) + ": " + ec.message() + ")");
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    bound_port_ = socket_.local_endpoint(ec).port();
    running_ = true;
    log("Discovery responder listening on UDP " + std::to_string(bound_port_));

    thread_ = std::thread([this]() { run(); });
    return true;
}

void DiscoveryResponder::run() {
    std::array<char, 1024> recv_buf;

    while (running_) {
        udp::endpoint sender_endpoint;
        boost::system::error_code ec;
        size_t len = socket_.receive_from(boost::asio::buffer(recv_buf), sender_endpoint, 0, ec);

        if (ec == boost::asio::error::would_block) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            log("Error reading discovery datagram: " + ec.message());
            continue;
        }

        std::string message(recv_buf.data(), len);
        if (message != cfg_.discovery_token) continue;

        log("Received discovery request from " + sender_endpoint.address().to_string() +
            ":" + std::to_string(sender_endpoint.port()));
        socket_.send_to(boost::asio::buffer(payload_), sender_endpoint, 0, ec);
        if (ec) {
            log("Error sending discovery response: " + ec.message());
        }
    }
}

void DiscoveryResponder::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    boost::system::error_code ignored;
    socket_.close(ignored);
}

// ─── Requester ──────────────────────────────────────────────────────────────

std::optional<ServerAddress> find_server_address(const config::Config& cfg) {
    try {
        boost::asio::io_context io_context;
        udp::socket socket(io_context, udp::endpoint(udp::v4(), 0));
        socket.set_option(boost::asio::socket_base::broadcast(true));

        std::cout << "Broadcasting for servers...\n";

        const auto& token = cfg.discovery_token;
        boost::system::error_code ec;
        udp::endpoint broadcast_ep(boost::asio::ip::make_address_v4(cfg.broadcast_address, ec),
                                   cfg.discovery_port);
        if (!ec) {
            socket.send_to(boost::asio::buffer(token), broadcast_ep, 0, ec);
        }
        if (ec) {
            // Broadcast can be unavailable in containers and sandboxes
            std::cerr << "Broadcast failed (" << ec.message() << "), trying localhost...\n";
            udp::endpoint local_ep(boost::asio::ip::address_v4::loopback(), cfg.discovery_port);
            socket.send_to(boost::asio::buffer(token), local_ep);
        }

        socket.non_blocking(true);
        auto deadline = std::chrono::steady_clock::now() + cfg.discovery_timeout;

        std::array<char, 1024> recv_buf;
        udp::endpoint sender_endpoint;
        size_t len = 0;
        while (true) {
            len = socket.receive_from(boost::asio::buffer(recv_buf), sender_endpoint, 0, ec);
            if (!ec) break;
            if (ec != boost::asio::error::would_block && ec != boost::asio::error::connection_refused) {
                std::cerr << "Discovery failed: " << ec.message() << "\n";
                return std::nullopt;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                std::cerr << "Discovery timed out after " << cfg.discovery_timeout.count() << " ms\n";
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        if (!sender_endpoint.address().is_v4()) {
            std::cerr << "Could not get IPv4 address from discovery response\n";
            return std::nullopt;
        }

        std::string payload(recv_buf.data(), len);
        auto port = parse_port_payload(payload);
        if (!port) {
            std::cerr << "Malformed discovery response: " << payload << "\n";
            return std::nullopt;
        }

        ServerAddress address{sender_endpoint.address().to_v4(), *port};
        std::cout << "Found server at " << address.to_string() << "\n";
        return address;
    } catch (const boost::system::system_error& e) {
        std::cerr << "Discovery Exception: " << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace networking
