// ============================================================
// transfer_session.cpp
// ============================================================

#include "transfer_session.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "stream_pump.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

// ---------------------------------------------------------------
// TransferSession
// ---------------------------------------------------------------

TransferSession::TransferSession(ByteStream& conn,
                                 ProgressObserver* observer,
                                 proto::HeaderCodec codec)
    : conn_(conn)
    , observer_(observer)
    , codec_(std::move(codec))
{}

void TransferSession::set_state(SessionState s) {
    state_.store(s);
    LOG_DEBUG("[" + display_name() + "] -> " + session_state_str(s));
}

void TransferSession::report_progress(const std::string& name, u64 done, u64 total) {
    bytes_.store(done);
    if (observer_) observer_->on_progress(name, done, total);
}

TransferOutcome TransferSession::run() {
    try {
        return run_impl();
    } catch (const TransferError& e) {
        bytes_.store(std::max(bytes_.load(), e.bytes_transferred()));
        set_state(SessionState::FAILED);
        throw;
    } catch (...) {
        set_state(SessionState::FAILED);
        throw;
    }
}

TransferResult TransferSession::execute() {
    TransferResult r;
    r.peer = conn_.peer_name();
    try {
        TransferOutcome o = run();
        r.state             = SessionState::COMPLETED;
        r.bytes_transferred = o.bytes_transferred;
        r.outcome           = std::move(o);
    } catch (const TransferError& e) {
        r.state      = SessionState::FAILED;
        r.error_kind = e.kind();
        r.error      = e.what();
    } catch (const std::exception& e) {
        // Anything unclassified comes from local resources (filesystem, OpenSSL)
        r.state      = SessionState::FAILED;
        r.error_kind = ErrorKind::IO;
        r.error      = e.what();
    }
    r.file_name = display_name();
    if (!r.ok()) {
        r.bytes_transferred = bytes_.load();
        Logger::get().transfer_error(r.file_name + " (" + r.peer + "): " +
                                     error_kind_str(r.error_kind) + ": " + r.error +
                                     " after " + std::to_string(r.bytes_transferred) + " bytes");
    }
    if (observer_) observer_->on_finish(r);
    return r;
}

// ---------------------------------------------------------------
// SendSession
// ---------------------------------------------------------------

SendSession::SendSession(ByteStream& conn,
                         std::string local_path,
                         ProgressObserver* observer,
                         proto::HeaderCodec codec)
    : TransferSession(conn, observer, std::move(codec))
    , local_path_(std::move(local_path))
{}

TransferOutcome SendSession::run_impl() {
    std::string name = file_io::wire_name(local_path_);
    if (name.empty()) {
        throw TransferError(ErrorKind::IO, "No file name in path: " + local_path_);
    }

    // Name first, then open and stat the file, then the size. The receiver
    // creates the destination between the two reads.
    codec_.write_name(conn_, name);
    file_io::FileReader reader(local_path_);
    TransferHeader hdr;
    hdr.file_name = name;
    hdr.file_size = reader.size();
    codec_.write_size(conn_, hdr.file_size);
    set_state(SessionState::HEADER_EXCHANGED);
    if (observer_) observer_->on_start(local_path_, hdr.file_size);

    digest::IntegrityAccumulator acc;
    auto start = Clock::now();
    set_state(SessionState::STREAMING);
    PumpResult pr = pump(reader, conn_, hdr.file_size, acc,
        [&](u64 done) { report_progress(local_path_, done, hdr.file_size); });
    auto elapsed = Clock::now() - start;
    bytes_.store(pr.bytes_moved);

    if (!pr.complete) {
        throw TransferError(ErrorKind::SHORT_TRANSFER,
            "File ended after " + std::to_string(pr.bytes_moved) + " of " +
            std::to_string(hdr.file_size) + " bytes", pr.bytes_moved);
    }

    Digest d = acc.finalize();
    conn_.write_all(d.data(), d.size());
    set_state(SessionState::INTEGRITY_CHECKED);

    TransferOutcome o;
    o.file_name          = name;
    o.bytes_transferred  = pr.bytes_moved;
    o.elapsed            = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
    o.average_throughput = utils::throughput(o.bytes_transferred, o.elapsed);
    o.integrity_verified = true;
    o.digest             = d;

    LOG_INFO("Sent '" + name + "' to " + conn_.peer_name() + ": " +
             utils::format_bytes(o.bytes_transferred) + " in " +
             utils::format_elapsed(o.elapsed) + " (" +
             utils::format_speed(o.average_throughput) + ")");
    set_state(SessionState::COMPLETED);
    return o;
}

// ---------------------------------------------------------------
// ReceiveSession
// ---------------------------------------------------------------

ReceiveSession::ReceiveSession(ByteStream& conn,
                               fs::path dest_dir,
                               ProgressObserver* observer,
                               proto::HeaderCodec codec)
    : TransferSession(conn, observer, std::move(codec))
    , dest_dir_(std::move(dest_dir))
{}

std::string ReceiveSession::display_name() const {
    return received_name_.empty() ? std::string("<unnamed>") : received_name_;
}

TransferOutcome ReceiveSession::run_impl() {
    // Destination is opened between the name and the size, as on the wire
    received_name_ = codec_.read_name(conn_);
    fs::path dest = file_io::resolve_destination(dest_dir_, received_name_);
    file_io::FileWriter writer(dest.string());
    u64 file_size = codec_.read_size(conn_);
    set_state(SessionState::HEADER_EXCHANGED);

    LOG_INFO("Receiving '" + received_name_ + "' (" + utils::format_bytes(file_size) +
             ") from " + conn_.peer_name());
    if (observer_) observer_->on_start(received_name_, file_size);

    digest::IntegrityAccumulator acc;
    auto start = Clock::now();
    set_state(SessionState::STREAMING);
    PumpResult pr = pump(conn_, writer, file_size, acc,
        [&](u64 done) { report_progress(received_name_, done, file_size); });
    auto elapsed = Clock::now() - start;
    bytes_.store(pr.bytes_moved);

    if (!pr.complete) {
        throw TransferError(ErrorKind::SHORT_TRANSFER,
            "Connection closed after " + std::to_string(pr.bytes_moved) + " of " +
            std::to_string(file_size) + " bytes; partial file left at " + dest.string(),
            pr.bytes_moved);
    }
    writer.close();

    Digest received{};
    size_t got = read_exact(conn_, received.data(), received.size());
    if (got != received.size()) {
        throw TransferError(ErrorKind::PROTOCOL,
            "Connection closed inside digest trailer (" + std::to_string(got) + "/" +
            std::to_string(DIGEST_LEN) + " bytes)", pr.bytes_moved);
    }
    Digest local = acc.finalize();
    set_state(SessionState::INTEGRITY_CHECKED);

    TransferOutcome o;
    o.file_name          = received_name_;
    o.bytes_transferred  = pr.bytes_moved;
    o.elapsed            = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
    o.average_throughput = utils::throughput(o.bytes_transferred, o.elapsed);
    o.integrity_verified = (local == received);
    o.digest             = local;
    o.destination_path   = dest.string();

    LOG_INFO("Received '" + received_name_ + "': " +
             utils::format_bytes(o.bytes_transferred) + " in " +
             utils::format_elapsed(o.elapsed) + " (" +
             utils::format_speed(o.average_throughput) + ")");
    if (o.integrity_verified) {
        LOG_INFO("File integrity verified: " + o.destination_path);
    } else {
        LOG_WARN("File integrity check failed for " + o.destination_path +
                 " (local " + digest::to_hex(local) +
                 ", sender " + digest::to_hex(received) + "); file kept");
    }
    set_state(SessionState::COMPLETED);
    return o;
}
