#pragma once

// ============================================================
// errors.hpp -- Classified transfer failures
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

enum class ErrorKind : u8 {
    NONE          = 0,
    CONNECTION    = 1,  // resolve/bind/connect/accept, socket send/recv
    IO            = 2,  // local file open/read/write, unsafe destination
    PROTOCOL      = 3,  // short header or trailer, oversized name
    SHORT_TRANSFER = 4, // payload ended before the announced size
};

inline const char* error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:           return "none";
        case ErrorKind::CONNECTION:     return "connection error";
        case ErrorKind::IO:             return "I/O error";
        case ErrorKind::PROTOCOL:       return "protocol error";
        case ErrorKind::SHORT_TRANSFER: return "short transfer";
    }
    return "unknown";
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& msg, u64 bytes_transferred = 0)
        : std::runtime_error(msg)
        , kind_(kind)
        , bytes_transferred_(bytes_transferred)
    {}

    ErrorKind kind() const { return kind_; }

    // Payload bytes moved before the failure
    u64 bytes_transferred() const { return bytes_transferred_; }

private:
    ErrorKind kind_;
    u64       bytes_transferred_;
};
