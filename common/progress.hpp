#pragma once

// ============================================================
// progress.hpp -- Observer the transfer engine reports to
// ============================================================

#include "platform.hpp"
#include "transfer_result.hpp"
#include <string>

// Callbacks may arrive concurrently from several sessions. 'file' is the
// session's display name (the local path when sending, the received name
// when receiving); on_finish carries the same string in result.file_name.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;

    virtual void on_start(const std::string& /*file*/, u64 /*total_bytes*/) {}

    // Once per chunk
    virtual void on_progress(const std::string& /*file*/, u64 /*bytes_done*/, u64 /*total_bytes*/) {}

    virtual void on_finish(const TransferResult& /*result*/) {}
};
