// ============================================================
// server/main.cpp -- minitftp server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <root_dir> [ip] [port] [options]\n"
        << "\n"
        << "  root_dir         directory served to clients\n"
        << "  ip               IPv4 address to listen on (default: 0.0.0.0)\n"
        << "  port             UDP port (default: 69)\n"
        << "\nOptions:\n"
        << "  --timeout-ms N   retransmission timeout in ms (default: 1000)\n"
        << "  --retries N      retransmissions per block before giving up (default: 5)\n"
        << "  --overwrite      let write requests replace existing files\n"
        << "  --no-dally       don't linger after the final ACK of a write\n"
        << "  --log-file PATH  also append log lines to PATH\n"
        << "  --error-log PATH append aborted-session reports to PATH\n"
        << "  --instrument     count buffers, datagrams and sessions\n"
        << "  --log-level L    debug, info, warn or error (default: info)\n"
        << "  --verbose        same as --log-level debug\n"
        << "\nExample:\n"
        << "  " << prog << " /srv/tftp 0.0.0.0 6969 --timeout-ms 500\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    int port_int = TFTP_PORT;
    int positional = 0;
    std::string log_file;
    std::string error_log;
    LogLevel level = LogLevel::INFO;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
            cfg.timeout_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--retries") == 0 && i + 1 < argc) {
            cfg.max_retries = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--overwrite") == 0) {
            cfg.allow_overwrite = true;
        } else if (std::strcmp(argv[i], "--no-dally") == 0) {
            cfg.dally = false;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--error-log") == 0 && i + 1 < argc) {
            error_log = argv[++i];
        } else if (std::strcmp(argv[i], "--instrument") == 0) {
            cfg.instrument = true;
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            if (!parse_log_level(argv[++i], level)) {
                std::cerr << "ERROR: Invalid log level: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            level = LogLevel::DEBUG;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (positional == 0) {
            cfg.root_dir = argv[i];
            ++positional;
        } else if (positional == 1) {
            cfg.listen_ip = argv[i];
            ++positional;
        } else if (positional == 2) {
            port_int = std::atoi(argv[i]);
            ++positional;
        } else {
            std::cerr << "Unexpected argument: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional == 0 || !utils::validate_path(cfg.root_dir)) {
        std::cerr << "ERROR: Invalid root_dir\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (cfg.timeout_ms < 10 || cfg.timeout_ms > 60000) {
        std::cerr << "ERROR: --timeout-ms must be 10-60000\n";
        return 1;
    }
    if (cfg.max_retries < 1 || cfg.max_retries > 100) {
        std::cerr << "ERROR: --retries must be 1-100\n";
        return 1;
    }

    cfg.listen_port = (u16)port_int;
    Logger::get().set_level(level);
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: Cannot open log file: " << log_file << "\n";
        return 1;
    }
    if (!error_log.empty() && !Logger::get().set_session_error_file(error_log)) {
        std::cerr << "ERROR: Cannot open error log: " << error_log << "\n";
        return 1;
    }

    try {
        ServerApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
