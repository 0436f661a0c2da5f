// meter/main.cpp
#include "broadcast_server.hpp"
#include "config_store.hpp"
#include "coordinator.hpp"
#include "logger.hpp"
#include "mosquitto_transport.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

std::atomic<BroadcastServer*> server_instance{nullptr};

void signal_handler(int) {
    BroadcastServer* server = server_instance.load();
    if (server) {
        server->request_stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -p, --port PORT             Live broadcast/control port (default: 5000)\n"
              << "  -c, --config FILE           Configuration file (default: config.json)\n"
              << "      --cert-dir DIR          Directory holding MQTT CA certificates (default: certs)\n"
              << "      --threads N             Live client worker threads (default: 8)\n"
              << "      --quiet                 Do not log every reading\n"
              << "      --verbose               Enable debug logs\n"
              << "  -h, --help                  Show this help\n";
}

int main(int argc, char* argv[]) {
    int port = DEFAULT_BROADCAST_PORT;
    std::string config_file = DEFAULT_CONFIG_FILE;
    std::string cert_dir = DEFAULT_CERT_DIR;
    size_t threads = 8;
    bool quiet = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                port = std::stoi(argv[++i]);
            } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_file = argv[++i];
            } else if (arg == "--cert-dir" && i + 1 < argc) {
                cert_dir = argv[++i];
            } else if (arg == "--threads" && i + 1 < argc) {
                threads = std::stoull(argv[++i]);
            } else if (arg == "--quiet") {
                quiet = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    Logger::set_verbose(verbose);

    std::cout << CYAN BOLD "Mock Energy Meter v1.0" RESET << std::endl;
    std::cout << CYAN "Configuration: Port=" << port
              << ", Config=" << config_file
              << ", Cert Dir=" << cert_dir
              << ", Threads=" << threads
              << RESET << std::endl;

    ConfigStore config_store(config_file);
    BroadcastServer server(port, threads);
    MosquittoTransportFactory transports;
    Coordinator coordinator(config_store, server, transports, cert_dir);

    coordinator.set_log_readings(!quiet);
    server.attach(coordinator);
    if (!server.start()) return 1;

    server_instance.store(&server);
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    coordinator.start();
    server.run();

    server_instance.store(nullptr);
    Logger::info("Shutting down");
    return 0;
}
