#include <gtest/gtest.h>
#include <array>
#include <chrono>
#include <thread>

#include "discovery.hpp"

using boost::asio::ip::udp;

namespace {

config::Config discovery_config(unsigned short discovery_port) {
    config::Config cfg;
    cfg.discovery_port = discovery_port;
    // Unicast to loopback so tests do not depend on broadcast routing
    cfg.broadcast_address = "127.0.0.1";
    cfg.discovery_timeout = std::chrono::milliseconds(2000);
    return cfg;
}

auto quiet = [](const std::string&) {};

} // namespace

TEST(DiscoveryTest, PortPayloadParsing) {
    EXPECT_EQ(networking::make_port_payload(9000), ":9000");
    EXPECT_EQ(networking::parse_port_payload(":9000"), 9000);
    EXPECT_EQ(networking::parse_port_payload(":65535"), 65535);
    EXPECT_FALSE(networking::parse_port_payload("9000"));
    EXPECT_FALSE(networking::parse_port_payload(":"));
    EXPECT_FALSE(networking::parse_port_payload(":0"));
    EXPECT_FALSE(networking::parse_port_payload(":65536"));
    EXPECT_FALSE(networking::parse_port_payload(":90a0"));
    EXPECT_FALSE(networking::parse_port_payload(""));
}

TEST(DiscoveryTest, ServerAddressComposition) {
    networking::ServerAddress address{boost::asio::ip::make_address_v4("192.168.1.20"), 9000};
    EXPECT_EQ(address.to_string(), "192.168.1.20:9000");
    EXPECT_EQ(address.endpoint().port(), 9000);
}

TEST(DiscoveryTest, RequesterFindsResponder) {
    auto cfg = discovery_config(47811);
    networking::DiscoveryResponder responder(cfg, 9123, quiet);
    ASSERT_TRUE(responder.start());

    auto address = networking::find_server_address(cfg);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ip, boost::asio::ip::address_v4::loopback());
    EXPECT_EQ(address->port, 9123);
}

TEST(DiscoveryTest, BackToBackRequestsResolveToSameServer) {
    auto cfg = discovery_config(47812);
    networking::DiscoveryResponder responder(cfg, 9124, quiet);
    ASSERT_TRUE(responder.start());

    auto first = networking::find_server_address(cfg);
    auto second = networking::find_server_address(cfg);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(DiscoveryTest, TimesOutWithoutResponder) {
    auto cfg = discovery_config(47813);
    cfg.discovery_timeout = std::chrono::milliseconds(300);

    auto start = std::chrono::steady_clock::now();
    auto address = networking::find_server_address(cfg);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(address.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(DiscoveryTest, ResponderIgnoresForeignPayloads) {
    auto cfg = discovery_config(47814);
    networking::DiscoveryResponder responder(cfg, 9125, quiet);
    ASSERT_TRUE(responder.start());

    boost::asio::io_context io;
    udp::socket socket(io, udp::endpoint(udp::v4(), 0));
    udp::endpoint target(boost::asio::ip::address_v4::loopback(), 47814);
    socket.send_to(boost::asio::buffer(std::string("HELLO")), target);

    socket.non_blocking(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    std::array<char, 64> buf;
    udp::endpoint sender;
    boost::system::error_code ec;
    socket.receive_from(boost::asio::buffer(buf), sender, 0, ec);
    EXPECT_TRUE(ec == boost::asio::error::would_block);

    // still answering real requests afterwards
    auto address = networking::find_server_address(cfg);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->port, 9125);
}

TEST(DiscoveryTest, MalformedResponseGivesEmptyResult) {
    auto cfg = discovery_config(47815);

    boost::asio::io_context io;
    udp::socket fake(io, udp::endpoint(udp::v4(), 47815));
    std::thread responder([&fake]() {
        std::array<char, 64> buf;
        udp::endpoint sender;
        fake.receive_from(boost::asio::buffer(buf), sender);
        fake.send_to(boost::asio::buffer(std::string("port nine thousand")), sender);
    });

    EXPECT_FALSE(networking::find_server_address(cfg).has_value());
    responder.join();
}

TEST(DiscoveryTest, BindFailureIsNotFatal) {
    auto cfg = discovery_config(47816);

    // Occupy the port so the responder cannot bind it
    boost::asio::io_context io;
    udp::socket blocker(io, udp::endpoint(udp::v4(), 47816));

    networking::DiscoveryResponder responder(cfg, 9126, quiet);
    EXPECT_FALSE(responder.start());
    EXPECT_FALSE(responder.is_running());
}

TEST(DiscoveryTest, SecondResponderOnSamePortFailsToBind) {
    auto cfg = discovery_config(47817);
    networking::DiscoveryResponder first(cfg, 9127, quiet);
    ASSERT_TRUE(first.start());

    networking::DiscoveryResponder second(cfg, 9128, quiet);
    EXPECT_FALSE(second.start());

    auto address = networking::find_server_address(cfg);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->port, 9127);
}

TEST(DiscoveryTest, UnusableBroadcastAddressFallsBackToLoopback) {
    auto cfg = discovery_config(47818);
    networking::DiscoveryResponder responder(cfg, 9129, quiet);
    ASSERT_TRUE(responder.start());

    cfg.broadcast_address = "not-an-address";
    auto address = networking::find_server_address(cfg);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ip, boost::asio::ip::address_v4::loopback());
    EXPECT_EQ(address->port, 9129);
}
