// ============================================================
// sender/main.cpp -- swiftcp sender entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include "sender_app.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <cstring>
#include <vector>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <address> <file> [file ...] [options]\n"
        << "\n"
        << "  address          receiver host:port (e.g. 192.168.1.10:8080)\n"
        << "  file             regular file to send; only its base name is transmitted\n"
        << "\nOptions:\n"
        << "  --parallel N     files transferred at the same time (default: "
        << MAX_PARALLEL_TRANSFERS << ")\n"
        << "  --no-progress    don't draw the progress bar\n"
        << "  --log-file PATH  also append log lines to PATH\n"
        << "  --error-log PATH append failed transfers to PATH\n"
        << "  --verbose        enable debug logging\n"
        << "\nEach file is sent over its own connection; a failed file does not\n"
        << "stop the others. Exit status is 3 if any file failed.\n"
        << "\nExample:\n"
        << "  " << prog << " 192.168.1.10:8080 report.bin photos.tar\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    SenderConfig cfg;
    std::string address;
    std::vector<std::string> paths;
    bool show_progress = true;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--parallel") == 0 && i + 1 < argc) {
            cfg.max_parallel = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-progress") == 0) {
            show_progress = false;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--error-log") == 0 && i + 1 < argc) {
            Logger::get().set_transfer_error_log(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (address.empty()) {
            address = argv[i];
        } else {
            paths.emplace_back(argv[i]);
        }
    }

    if (address.empty() || paths.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    try {
        cfg.target = parse_endpoint(address);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    for (const auto& p : paths) {
        if (!utils::validate_path(p)) {
            std::cerr << "ERROR: Invalid file path: '" << p << "'\n";
            return 1;
        }
    }
    if (cfg.max_parallel < 1 || cfg.max_parallel > 64) {
        std::cerr << "ERROR: --parallel must be 1-64\n";
        return 1;
    }

    try {
        std::unique_ptr<Tui> tui;
        if (show_progress) {
            tui = std::make_unique<Tui>((u32)paths.size());
            tui->start();
        }

        SenderApp app(std::move(cfg), nullptr, tui.get());
        std::vector<TransferResult> results = app.send_all(paths);
        if (tui) tui->stop();

        int failed = 0;
        for (const auto& r : results) {
            if (r.ok()) {
                const TransferOutcome& o = *r.outcome;
                LOG_INFO("OK    " + r.file_name + "  " + utils::format_bytes(o.bytes_transferred) +
                         "  " + utils::format_elapsed(o.elapsed) +
                         "  " + utils::format_speed(o.average_throughput));
            } else {
                ++failed;
                LOG_ERROR("FAIL  " + r.file_name + "  " + error_kind_str(r.error_kind) +
                          ": " + r.error);
            }
        }
        return failed == 0 ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
