#pragma once

// ============================================================
// transfer_result.hpp -- What one session reports upward
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "errors.hpp"
#include <chrono>
#include <optional>
#include <string>

enum class SessionState : u8 {
    IDLE              = 0,
    HEADER_EXCHANGED  = 1,
    STREAMING         = 2,
    INTEGRITY_CHECKED = 3,
    COMPLETED         = 4,
    FAILED            = 5,
};

inline const char* session_state_str(SessionState s) {
    switch (s) {
        case SessionState::IDLE:              return "Idle";
        case SessionState::HEADER_EXCHANGED:  return "HeaderExchanged";
        case SessionState::STREAMING:         return "Streaming";
        case SessionState::INTEGRITY_CHECKED: return "IntegrityChecked";
        case SessionState::COMPLETED:         return "Completed";
        case SessionState::FAILED:            return "Failed";
    }
    return "?";
}

// Produced once per completed session
struct TransferOutcome {
    std::string              file_name;
    u64                      bytes_transferred{0};
    std::chrono::nanoseconds elapsed{0};
    double                   average_throughput{0.0}; // bytes/sec
    bool                     integrity_verified{false};
    Digest                   digest{};                // locally computed
    std::string              destination_path;        // receiver only
};

struct TransferResult {
    std::string                    file_name;  // local path (sender) or received name
    std::string                    peer;
    SessionState                   state{SessionState::IDLE};
    std::optional<TransferOutcome> outcome;    // set when COMPLETED
    ErrorKind                      error_kind{ErrorKind::NONE};
    std::string                    error;
    u64                            bytes_transferred{0};

    bool ok() const { return state == SessionState::COMPLETED; }
};
