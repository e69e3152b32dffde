// ============================================================
// stream_pump.cpp
// ============================================================

#include "stream_pump.hpp"
#include "errors.hpp"
#include <algorithm>
#include <vector>

PumpResult pump(ByteSource& source,
                ByteSink& sink,
                u64 total_bytes,
                digest::IntegrityAccumulator& acc,
                const ProgressFn& on_progress,
                size_t chunk_size)
{
    PumpResult result;
    if (total_bytes == 0) {
        result.complete = true;
        return result;
    }
    if (chunk_size == 0) chunk_size = CHUNK_SIZE;

    std::vector<u8> buf((size_t)std::min<u64>(chunk_size, total_bytes));

    while (result.bytes_moved < total_bytes) {
        size_t want = (size_t)std::min<u64>(buf.size(), total_bytes - result.bytes_moved);
        size_t n;
        try {
            n = source.read_some(buf.data(), want);
        } catch (const TransferError& e) {
            throw TransferError(e.kind(), e.what(), result.bytes_moved);
        }
        if (n == 0) {
            return result; // source closed early: short transfer
        }
        try {
            sink.write_all(buf.data(), n);
        } catch (const TransferError& e) {
            throw TransferError(e.kind(), e.what(), result.bytes_moved);
        }
        acc.update(buf.data(), n);
        result.bytes_moved += n;
        if (on_progress) on_progress(result.bytes_moved);
    }

    result.complete = true;
    return result;
}
