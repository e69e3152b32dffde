#pragma once

// ============================================================
// stream_pump.hpp -- Chunked copy source -> sink with digest
//                    feed-through and progress reporting
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "stream.hpp"
#include "digest.hpp"
#include <functional>

// Called after every chunk with the cumulative byte count
using ProgressFn = std::function<void(u64 bytes_done)>;

struct PumpResult {
    u64  bytes_moved{0};
    bool complete{false};  // false: source ended before total_bytes
};

// Moves exactly 'total_bytes' unless the source ends first. Every byte is
// written to 'sink' and fed to 'acc' in order. Read/write failures
// propagate as TransferError; nothing is retried.
PumpResult pump(ByteSource& source,
                ByteSink& sink,
                u64 total_bytes,
                digest::IntegrityAccumulator& acc,
                const ProgressFn& on_progress = nullptr,
                size_t chunk_size = CHUNK_SIZE);
