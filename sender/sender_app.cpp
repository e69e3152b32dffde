// ============================================================
// sender_app.cpp
// ============================================================

#include "sender_app.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/transfer_session.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <future>
#include <utility>

// Upper bound on worker threads; the budget still decides how many run
static constexpr size_t MAX_DISPATCH_THREADS = 64;

SenderApp::SenderApp(SenderConfig config,
                     std::shared_ptr<Connector> connector,
                     ProgressObserver* observer)
    : config_(std::move(config))
    , connector_(connector ? std::move(connector) : std::make_shared<TcpConnector>())
    , observer_(observer)
    , budget_((size_t)std::max(1, config_.max_parallel))
{}

std::vector<TransferResult> SenderApp::send_all(const std::vector<std::string>& paths) {
    std::vector<TransferResult> results;
    if (paths.empty()) return results;

    LOG_INFO("Sending " + std::to_string(paths.size()) + " file(s) to " +
             config_.target.str() + " (max " + std::to_string(budget_.capacity()) +
             " in parallel)");

    std::vector<std::future<TransferResult>> pending;
    pending.reserve(paths.size());
    {
        ThreadPool pool(std::min(paths.size(), MAX_DISPATCH_THREADS));
        for (const auto& path : paths) {
            pending.push_back(pool.submit([this, path] { return send_one(path); }));
        }
        // ~ThreadPool drains the queue before returning
    }

    results.reserve(paths.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            results.push_back(pending[i].get());
        } catch (const std::exception& e) {
            results.push_back(failed_result(paths[i], ErrorKind::IO, e.what()));
        }
    }

    size_t ok = (size_t)std::count_if(results.begin(), results.end(),
                                      [](const TransferResult& r) { return r.ok(); });
    LOG_INFO("Done: " + std::to_string(ok) + "/" + std::to_string(results.size()) +
             " file(s) sent");
    return results;
}

TransferResult SenderApp::send_one(const std::string& path) {
    ConcurrencyBudget::Permit permit(budget_);

    std::unique_ptr<ByteStream> conn;
    try {
        conn = connector_->connect(config_.target);
    } catch (const TransferError& e) {
        return failed_result(path, e.kind(), e.what());
    } catch (const std::exception& e) {
        return failed_result(path, ErrorKind::CONNECTION, e.what());
    }
    LOG_DEBUG("Connected to " + conn->peer_name() + " for " + path);

    SendSession session(*conn, path, observer_);
    TransferResult r = session.execute();
    conn->close();
    return r;
}

TransferResult SenderApp::failed_result(const std::string& path, ErrorKind kind,
                                        const std::string& msg) {
    TransferResult r;
    r.file_name  = path;
    r.peer       = config_.target.str();
    r.state      = SessionState::FAILED;
    r.error_kind = kind;
    r.error      = msg;
    Logger::get().transfer_error(path + " (" + r.peer + "): " +
                                 error_kind_str(kind) + ": " + msg);
    if (observer_) observer_->on_finish(r);
    return r;
}
