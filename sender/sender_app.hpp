#pragma once

// ============================================================
// sender_app.hpp -- Sends a list of files to one receiver
//
// Every file gets its own connection and SendSession. Sessions run
// concurrently on a thread pool, but each must hold a unit of the
// ConcurrencyBudget for its whole life, so at most max_parallel are
// ever connected at once. A failing file never affects the others.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/connector.hpp"
#include "../common/concurrency_budget.hpp"
#include "../common/progress.hpp"
#include "../common/transfer_result.hpp"
#include <memory>
#include <string>
#include <vector>

struct SenderConfig {
    Endpoint target;
    int      max_parallel{MAX_PARALLEL_TRANSFERS};
};

class SenderApp {
public:
    // A null connector means plain TCP
    explicit SenderApp(SenderConfig config,
                       std::shared_ptr<Connector> connector = nullptr,
                       ProgressObserver* observer = nullptr);

    // One result per path, in input order. Does not throw for per-file failures.
    std::vector<TransferResult> send_all(const std::vector<std::string>& paths);

    const ConcurrencyBudget& budget() const { return budget_; }
    const SenderConfig& config() const { return config_; }

private:
    SenderConfig               config_;
    std::shared_ptr<Connector> connector_;
    ProgressObserver*          observer_;
    ConcurrencyBudget          budget_;

    TransferResult send_one(const std::string& path);
    TransferResult failed_result(const std::string& path, ErrorKind kind,
                                 const std::string& msg);
};
