// ============================================================
// tui.cpp -- ANSI progress display implementation
// ============================================================

#include "tui.hpp"
#include "utils.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdio>
#include <utility>

#ifdef _WIN32
#  include <io.h>
#  define ISATTY _isatty
#  define FILENO _fileno
#else
#  include <unistd.h>
#  define ISATTY isatty
#  define FILENO fileno
#endif

bool Tui::is_tty() {
    return ISATTY(FILENO(stdout)) != 0;
}

Tui::Tui(u32 files_total, std::string label)
    : last_time_(std::chrono::steady_clock::now())
{
    state_.files_total.store(files_total);
    state_.transfer_label = std::move(label);
}

Tui::~Tui() {
    if (running_.load()) stop();
}

void Tui::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this] {
        while (running_.load()) {
            // Non-TTY output only gets the final summary
            if (is_tty()) render();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void Tui::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (is_tty()) {
        clear_lines(lines_printed_);
    }
    render();
    std::cout.flush();
}

void Tui::on_start(const std::string& file, u64 total_bytes) {
    state_.bytes_total.fetch_add(total_bytes);
    std::lock_guard<std::mutex> lk(active_mutex_);
    active_[file] = ActiveTransfer{0, total_bytes};
}

void Tui::on_progress(const std::string& file, u64 bytes_done, u64 /*total_bytes*/) {
    u64 delta = 0;
    {
        // Callbacks carry cumulative counts; the aggregate wants deltas
        std::lock_guard<std::mutex> lk(active_mutex_);
        auto it = active_.find(file);
        if (it == active_.end()) return;
        if (bytes_done > it->second.done) delta = bytes_done - it->second.done;
        it->second.done = bytes_done;
    }
    state_.bytes_done.fetch_add(delta);
}

void Tui::on_finish(const TransferResult& result) {
    if (result.ok()) {
        state_.files_done.fetch_add(1);
    } else {
        state_.files_failed.fetch_add(1);
    }
    std::lock_guard<std::mutex> lk(active_mutex_);
    active_.erase(result.file_name);
}

std::vector<std::string> Tui::active_lines() {
    std::vector<std::string> lines;
    std::lock_guard<std::mutex> lk(active_mutex_);
    for (const auto& kv : active_) {
        std::string name = kv.first;
        if (name.size() > 40) name = "..." + name.substr(name.size() - 37);
        std::ostringstream ss;
        ss << "  > " << std::left << std::setw(40) << name << std::right
           << " " << std::setw(6) << utils::format_percent(kv.second.done, kv.second.total)
           << "  " << utils::format_bytes(kv.second.done)
           << "/" << utils::format_bytes(kv.second.total);
        lines.push_back(ss.str());
    }
    return lines;
}

void Tui::clear_lines(int n) {
    for (int i = 0; i < n; ++i) {
        // Move cursor up one line, then clear line
        std::cout << "\x1b[A\x1b[2K";
    }
    if (n > 0) {
        std::cout << "\r";
        std::cout.flush();
    }
    lines_printed_ = 0;
}

std::string Tui::build_progress_bar(double pct, int width) const {
    if (width < 4) return "";
    int fill = (int)(pct / 100.0 * width);
    fill = utils::clamp(fill, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < fill)          bar += '#';
        else if (i == fill)    bar += '>';
        else                   bar += '-';
    }
    bar += "]";
    return bar;
}

void Tui::render() {
    auto now = std::chrono::steady_clock::now();
    double elapsed_s = std::chrono::duration<double>(now - last_time_).count();

    u64 bytes_done   = state_.bytes_done.load();
    u64 bytes_total  = state_.bytes_total.load();
    u32 files_done   = state_.files_done.load();
    u32 files_failed = state_.files_failed.load();
    u32 files_total  = state_.files_total.load();

    // Speed (EWMA)
    if (elapsed_s >= 0.05) {
        double instant_speed = (double)(bytes_done - last_bytes_) / elapsed_s;
        if (last_bytes_ == 0) {
            smooth_speed_ = instant_speed;
        } else {
            smooth_speed_ = 0.7 * smooth_speed_ + 0.3 * instant_speed;
        }
        last_bytes_ = bytes_done;
        last_time_  = now;
    }

    double pct = bytes_total > 0 ? (double)bytes_done / bytes_total * 100.0 : 0.0;
    pct = utils::clamp(pct, 0.0, 100.0);

    std::string eta_str;
    if (smooth_speed_ > 0 && bytes_done < bytes_total) {
        u64 eta_s = (u64)((bytes_total - bytes_done) / smooth_speed_);
        eta_str = "ETA " + utils::format_duration_s(eta_s);
    }

    std::ostringstream ss;
    ss << std::fixed;
    ss << build_progress_bar(pct, 40) << " " << std::setw(5) << std::setprecision(1) << pct << "%";
    std::string line1 = ss.str();
    ss.str("");

    ss << "  Files: " << files_done;
    if (files_total > 0) ss << "/" << files_total;
    if (files_failed > 0) ss << " (" << files_failed << " failed)";
    ss << "  " << state_.transfer_label << ": " << utils::format_bytes(bytes_done)
       << "/" << utils::format_bytes(bytes_total)
       << "  Speed: " << utils::format_speed(smooth_speed_)
       << "  " << eta_str;
    std::string line2 = ss.str();

    if (!is_tty()) {
        std::cout << line2 << "\n";
        return;
    }

    std::vector<std::string> active = active_lines();
    clear_lines(lines_printed_);
    std::cout << line1 << "\n" << line2 << "\n";
    for (const auto& l : active) std::cout << l << "\n";
    std::cout.flush();
    lines_printed_ = 2 + (int)active.size();
}
