// ============================================================
// receiver_app.cpp
// ============================================================

#include "receiver_app.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/transfer_session.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

ReceiverApp::ReceiverApp(ReceiverConfig config,
                         std::shared_ptr<ProgressObserver> observer,
                         std::shared_ptr<AdmissionPolicy> admission)
    : config_(std::move(config))
    , shared_(std::make_shared<Shared>())
{
    shared_->dest_dir = config_.dest_dir.empty() ? std::string(".") : config_.dest_dir;
    shared_->observer = std::move(observer);
    if (admission) {
        shared_->admission = std::move(admission);
    } else if (config_.max_sessions > 0) {
        shared_->admission = std::make_shared<BoundedAdmission>((size_t)config_.max_sessions);
    } else {
        shared_->admission = std::make_shared<UnboundedAdmission>();
    }
}

ReceiverApp::~ReceiverApp() {
    stop();
}

void ReceiverApp::bind() {
    if (bound_.load()) return;
    listen_sock_.bind_and_listen(config_.listen.host, config_.listen.port);
    bound_port_ = listen_sock_.local_port();
    bound_.store(true);
}

int ReceiverApp::serve() {
    bind();

    LOG_INFO("Receiver listening on " + config_.listen.host + ":" +
             std::to_string(bound_port_) + ", saving to " +
             fs::absolute(shared_->dest_dir).string() +
             " (sessions: " + shared_->admission->describe() + ")");

    accept_loop();
    LOG_INFO("Receiver stopped");
    return 0;
}

void ReceiverApp::stop() {
    if (stop_requested_.exchange(true)) return;
    shared_->admission->cancel();
    // The listener is only closed by the destructor, never while
    // accept_loop() may still be using it
    listen_sock_.shutdown();
}

std::chrono::milliseconds ReceiverApp::accept_retry_delay(u32 consecutive_failures) {
    if (consecutive_failures == 0) return std::chrono::milliseconds(0);
    u32 shift = consecutive_failures - 1;
    if (shift > 7) shift = 7;
    return std::chrono::milliseconds(std::min<u64>(10ULL << shift, 1000));
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop. Each accepted socket goes to its own session
//   thread, so a slow or stalled peer never holds up the listener.
// ---------------------------------------------------------------
void ReceiverApp::accept_loop() {
    u32 failures = 0;
    while (!stop_requested_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            failures = 0;
            sock.tune();
            LOG_DEBUG("Accepted connection from " + sock.peer_addr());
            spawn_session(std::move(sock));
        } catch (const std::exception& e) {
            if (stop_requested_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            // EMFILE and friends persist; do not spin on them
            std::this_thread::sleep_for(accept_retry_delay(++failures));
        }
    }
}

void ReceiverApp::spawn_session(TcpSocket sock) {
    if (!shared_->admission->admit()) {
        LOG_DEBUG("Receiver stopping, dropping connection from " + sock.peer_addr());
        return;
    }
    ++sessions_started_;
    try {
        std::thread(&ReceiverApp::session_main, shared_, std::move(sock)).detach();
    } catch (const std::system_error& e) {
        shared_->admission->release();
        LOG_ERROR("Cannot start session thread: " + std::string(e.what()));
    }
}

void ReceiverApp::session_main(std::shared_ptr<Shared> shared, TcpSocket sock) {
    ReceiveSession session(sock, fs::path(shared->dest_dir), shared->observer.get());
    TransferResult r = session.execute();
    if (r.ok()) {
        LOG_INFO("File received and saved to " + r.outcome->destination_path);
    }
    sock.close();
    shared->admission->release();
}
