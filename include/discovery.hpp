#pragma once

#include <string>
#include <optional>
#include <functional>
#include <thread>
#include <atomic>
#include <boost/asio.hpp>
#include "config.hpp"

namespace networking {

// Where the file server can be reached: the responder's source address
// paired with the port it advertised.
struct ServerAddress {
    boost::asio::ip::address_v4 ip;
    unsigned short port = 0;

    boost::asio::ip::tcp::endpoint endpoint() const { return {ip, port}; }
    std::string to_string() const { return ip.to_string() + ":" + std::to_string(port); }

    bool operator==(const ServerAddress& other) const { return ip == other.ip && port == other.port; }
    bool operator!=(const ServerAddress& other) const { return !(*this == other); }
};

// ":<port>" text carried by a discovery response.
std::string make_port_payload(unsigned short port);

// Port from a ":<port>" response payload, or nullopt when malformed.
std::optional<unsigned short> parse_port_payload(const std::string& payload);

// Answers discovery datagrams with the server's TCP port. Runs on its own
// thread; a bind failure only disables discovery.
class DiscoveryResponder {
public:
    using StatusCallback = std::function<void(const std::string&)>;

    DiscoveryResponder(const config::Config& cfg, unsigned short service_port,
                       StatusCallback on_status = nullptr);
    ~DiscoveryResponder();

    // Returns false if the UDP port could not be bound.
    bool start();
    void stop();
    bool is_running() const { return running_; }
    unsigned short port() const { return bound_port_; }

private:
    void run();
    void log(const std::string& message) const;

    const config::Config& cfg_;
    std::string payload_;
    StatusCallback on_status_;
    boost::asio::io_context io_context_;
    boost::asio::ip::udp::socket socket_;
    std::atomic<bool> running_{false};
    unsigned short bound_port_ = 0;
    std::thread thread_;
};

// Broadcasts the discovery token and waits for the first answer, at most
// cfg.discovery_timeout. Empty result means no usable server was found.
std::optional<ServerAddress> find_server_address(const config::Config& cfg);

} // namespace networking
