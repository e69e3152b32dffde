#pragma once

// ============================================================
// receiver_app.hpp -- Listener: one ReceiveSession per connection
//
// Concurrency model:
//   accept_loop() -> accepts one socket at a time, asks the
//                    AdmissionPolicy for room, then hands the socket
//                    to a detached session thread.
//   session thread -> runs ReceiveSession to completion; a failure is
//                     logged and reported, the listener keeps going.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/progress.hpp"
#include "admission_policy.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

struct ReceiverConfig {
    Endpoint    listen{"0.0.0.0", SWIFTCP_DEFAULT_PORT};
    std::string dest_dir{"."};
    int         max_sessions{0};  // 0 = unbounded
};

class ReceiverApp {
public:
    // A null admission policy is chosen from config.max_sessions
    explicit ReceiverApp(ReceiverConfig config,
                         std::shared_ptr<ProgressObserver> observer = nullptr,
                         std::shared_ptr<AdmissionPolicy> admission = nullptr);
    ~ReceiverApp();

    // Bind and listen; throws TransferError(CONNECTION)
    void bind();

    // Binds if needed, then accepts until stop(). Returns 0 after stop().
    int serve();

    // Safe from another thread. Wakes accept() and any connection
    // waiting for admission; sessions already running finish on their own.
    void stop();

    // Pause before the next accept() after 'consecutive_failures' errors in
    // a row: 10ms doubling up to 1s
    static std::chrono::milliseconds accept_retry_delay(u32 consecutive_failures);

    // Valid after bind()
    u16 bound_port() const { return bound_port_; }

    u64 sessions_started() const { return sessions_started_.load(); }

    ReceiverApp(const ReceiverApp&) = delete;
    ReceiverApp& operator=(const ReceiverApp&) = delete;

private:
    // State every detached session thread keeps alive on its own
    struct Shared {
        std::string                       dest_dir;
        std::shared_ptr<ProgressObserver> observer;
        std::shared_ptr<AdmissionPolicy>  admission;
    };

    ReceiverConfig          config_;
    std::shared_ptr<Shared> shared_;
    TcpSocket               listen_sock_;
    std::atomic<bool>       stop_requested_{false};
    std::atomic<bool>       bound_{false};
    u16                     bound_port_{0};
    std::atomic<u64>        sessions_started_{0};

    void accept_loop();
    void spawn_session(TcpSocket sock);

    static void session_main(std::shared_ptr<Shared> shared, TcpSocket sock);
};
