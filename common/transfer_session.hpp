#pragma once

// ============================================================
// transfer_session.hpp -- One file over one connection
//
//   Idle -> HeaderExchanged -> Streaming -> IntegrityChecked
//        -> Completed | Failed
//
// Send:    header, payload from the local file, SHA-256 trailer.
// Receive: header, destination created/truncated, payload into it,
//          trailer compared with the local digest. A mismatch still
//          completes (integrity_verified = false) and the file stays.
// Any error goes straight to Failed. Nothing is retried and partial
// destination files are left in place.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "protocol_io.hpp"
#include "progress.hpp"
#include "stream.hpp"
#include "transfer_result.hpp"
#include <atomic>
#include <string>
#include <filesystem>

class TransferSession {
public:
    virtual ~TransferSession() = default;

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Runs the state machine; throws TransferError on failure
    TransferOutcome run();

    // Session boundary: runs, converts any failure into a FAILED result,
    // logs it and reports it to the observer. Never throws TransferError.
    TransferResult execute();

    SessionState state() const { return state_.load(); }

    // Payload bytes moved so far
    u64 bytes_transferred() const { return bytes_.load(); }

protected:
    TransferSession(ByteStream& conn, ProgressObserver* observer, proto::HeaderCodec codec);

    virtual TransferOutcome run_impl() = 0;

    // Name used in results and log lines
    virtual std::string display_name() const = 0;

    void set_state(SessionState s);
    void report_progress(const std::string& name, u64 done, u64 total);

    ByteStream&         conn_;
    ProgressObserver*   observer_;
    proto::HeaderCodec  codec_;
    std::atomic<u64>    bytes_{0};

private:
    std::atomic<SessionState> state_{SessionState::IDLE};
};

class SendSession : public TransferSession {
public:
    SendSession(ByteStream& conn,
                std::string local_path,
                ProgressObserver* observer = nullptr,
                proto::HeaderCodec codec = proto::HeaderCodec());

protected:
    TransferOutcome run_impl() override;
    std::string display_name() const override { return local_path_; }

private:
    std::string local_path_;
};

class ReceiveSession : public TransferSession {
public:
    ReceiveSession(ByteStream& conn,
                   std::filesystem::path dest_dir,
                   ProgressObserver* observer = nullptr,
                   proto::HeaderCodec codec = proto::HeaderCodec());

protected:
    TransferOutcome run_impl() override;
    std::string display_name() const override;

private:
    std::filesystem::path dest_dir_;
    std::string           received_name_;
};
