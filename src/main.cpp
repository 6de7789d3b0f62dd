#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <csignal>
#include <thread>
#include <boost/asio.hpp>
#include "config.hpp"
#include "security.hpp"
#include "networking.hpp"

namespace {

void print_usage() {
    std::cout << "Usage:\n"
              << "  lanferry serve [--config FILE]        Run the TLS file server\n"
              << "  lanferry get <file> [--config FILE]   Discover a server and download <file>\n"
              << "  lanferry put <file> [--config FILE]   Discover a server and upload <file>\n"
              << "  lanferry config [--config FILE]       Print the effective configuration\n";
}

// CLI mode: single line with percent, speed and ETA
void print_progress(const std::string& label, uint64_t done, uint64_t total, double speed_mbps) {
    int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
    double speed_bps = speed_mbps * 1024.0 * 1024.0;
    uint64_t remaining = (total > done) ? total - done : 0;
    double eta_seconds = (speed_bps > 0) ? (remaining / speed_bps) : 0;
    int eta_min = static_cast<int>(eta_seconds) / 60;
    int eta_sec = static_cast<int>(eta_seconds) % 60;

    std::cout << "\r" << label << " " << percent << "% | "
              << std::fixed << std::setprecision(1) << speed_mbps << " MB/s | "
              << "ETA " << std::setfill('0') << std::setw(2) << eta_min << ":"
              << std::setfill('0') << std::setw(2) << eta_sec << "    " << std::flush;
    if (done >= total) std::cout << "\n";
}

int serve(const config::Config& cfg) {
    auto ssl_ctx = security::create_transport_context();

    networking::ServerCallbacks callbacks;
    callbacks.on_session_complete = [](const networking::SessionReport& report) {
        std::cout << "[" << report.peer << "] Session " << transfer::to_string(report.result.state);
        if (!report.result.error.empty()) std::cout << ": " << report.result.error;
        std::cout << "\n";
    };

    networking::Server server(cfg, *ssl_ctx, callbacks);
    server.start();

    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code&, int) { server.stop(); });
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    server.run();

    signal_io.stop();
    signal_thread.join();
    return 0;
}

int transfer_file(const config::Config& cfg, const std::string& file, bool upload) {
    auto ssl_ctx = security::create_transport_context();

    networking::ClientCallbacks callbacks;
    callbacks.on_progress = [upload](const std::string&, uint64_t done, uint64_t total, double speed) {
        print_progress(upload ? "Uploading..." : "Downloading...", done, total, speed);
    };

    networking::Client client(cfg, *ssl_ctx, callbacks);
    transfer::TransferResult result = upload ? client.upload(file) : client.download(file);
    return result.ok() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    try {
        config::Config cfg = config_path.empty() ? config::Config{} : config::load_config(config_path);
        const std::string& command = args[0];

        if (command == "serve") {
            return serve(cfg);
        } else if (command == "config") {
            nlohmann::json j = cfg;
            std::cout << j.dump(2) << "\n";
            return 0;
        } else if ((command == "get" || command == "put") && args.size() >= 2) {
            return transfer_file(cfg, args[1], command == "put");
        }

        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
