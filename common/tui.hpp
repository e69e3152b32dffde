#pragma once

// ============================================================
// tui.hpp -- ANSI progress display fed by session callbacks
// ============================================================

#include "platform.hpp"
#include "progress.hpp"
#include <string>
#include <atomic>
#include <thread>
#include <mutex>
#include <map>
#include <vector>
#include <chrono>

struct TuiState {
    std::atomic<u64> bytes_done{0};
    std::atomic<u64> bytes_total{0};
    std::atomic<u32> files_done{0};
    std::atomic<u32> files_failed{0};
    std::atomic<u32> files_total{0};
    std::string transfer_label{"Sent"};
};

// One in-flight transfer as shown under the aggregate bar
struct ActiveTransfer {
    u64 done{0};
    u64 total{0};
};

class Tui : public ProgressObserver {
public:
    // files_total 0 means the count is open-ended (a listener)
    explicit Tui(u32 files_total, std::string label = "Sent");
    ~Tui() override;

    // Start background refresh thread (100ms interval)
    void start();

    // Stop and print final line
    void stop();

    // Render one frame to stdout
    void render();

    // ProgressObserver
    void on_start(const std::string& file, u64 total_bytes) override;
    void on_progress(const std::string& file, u64 bytes_done, u64 total_bytes) override;
    void on_finish(const TransferResult& result) override;

    const TuiState& state() const { return state_; }

    static bool is_tty();

private:
    TuiState state_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    // Files between on_start and on_finish, keyed by session display name
    std::map<std::string, ActiveTransfer> active_;
    std::mutex active_mutex_;

    // For speed calculation
    u64 last_bytes_{0};
    std::chrono::steady_clock::time_point last_time_;
    double smooth_speed_{0.0};

    int lines_printed_{0};

    void clear_lines(int n);
    std::string build_progress_bar(double pct, int width) const;
    std::vector<std::string> active_lines();
};
