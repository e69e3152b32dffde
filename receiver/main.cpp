// ============================================================
// receiver/main.cpp -- swiftcp receiver entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include "receiver_app.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <filesystem>
#include <thread>

// Set by the signal handler; a watcher thread turns it into app.stop()
static volatile std::sig_atomic_t g_signalled = 0;

static void sig_handler(int /*sig*/) {
    g_signalled = 1;
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [address] [dst_dir] [options]\n"
        << "\n"
        << "  address           host:port to listen on (default: 0.0.0.0:8080)\n"
        << "  dst_dir           directory received files are written to (default: .)\n"
        << "\nOptions:\n"
        << "  --max-sessions N  cap on concurrent receive sessions (default: unbounded)\n"
        << "  --log-file PATH   also append log lines to PATH\n"
        << "  --error-log PATH  append failed transfers to PATH\n"
        << "  --no-progress     don't draw the progress bar\n"
        << "  --verbose         enable debug logging\n"
        << "\nEvery accepted connection carries one file. Files with the same name\n"
        << "are overwritten. A failed transfer may leave a partial file behind.\n"
        << "\nExample:\n"
        << "  " << prog << " 0.0.0.0:9000 /srv/incoming\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    ReceiverConfig cfg;
    std::string address = "0.0.0.0:" + std::to_string(SWIFTCP_DEFAULT_PORT);
    bool show_progress = true;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--max-sessions") == 0 && i + 1 < argc) {
            cfg.max_sessions = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--error-log") == 0 && i + 1 < argc) {
            Logger::get().set_transfer_error_log(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-progress") == 0) {
            show_progress = false;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (positional == 0) {
            address = argv[i];
            ++positional;
        } else if (positional == 1) {
            cfg.dest_dir = argv[i];
            ++positional;
        } else {
            std::cerr << "Unexpected argument: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        cfg.listen = parse_endpoint(address, true);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    if (!utils::validate_path(cfg.dest_dir)) {
        std::cerr << "ERROR: Invalid dst_dir\n";
        return 1;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(cfg.dest_dir, ec)) {
        std::cerr << "ERROR: dst_dir is not a directory: " << cfg.dest_dir << "\n";
        return 1;
    }
    if (cfg.max_sessions < 0) {
        std::cerr << "ERROR: --max-sessions must be >= 0\n";
        return 1;
    }

    std::shared_ptr<Tui> tui;
    if (show_progress) tui = std::make_shared<Tui>(0, "Received");

    try {
        ReceiverApp app(std::move(cfg), tui);
        app.bind();

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        std::atomic<bool> serving{true};
        std::thread watcher([&] {
            while (serving.load()) {
                if (g_signalled) {
                    app.stop();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        if (tui) tui->start();
        int rc = 2;
        try {
            rc = app.serve();
        } catch (const std::exception& e) {
            std::cerr << "FATAL: " << e.what() << "\n";
        }
        serving.store(false);
        watcher.join();
        if (tui) tui->stop();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
