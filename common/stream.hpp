#pragma once

// ============================================================
// stream.hpp -- Byte source/sink interfaces shared by sockets,
//               files and in-memory test pipes
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <string>

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read at most 'len' bytes. Returns 0 only on end of stream.
    // Throws TransferError on failure.
    virtual size_t read_some(void* buf, size_t len) = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Write exactly 'len' bytes or throw TransferError
    virtual void write_all(const void* buf, size_t len) = 0;
};

// A bidirectional connection (one transfer session runs over one of these)
class ByteStream : public ByteSource, public ByteSink {
public:
    // Human-readable peer description for logs and results
    virtual std::string peer_name() const = 0;

    virtual void close() = 0;
};

// Fill 'len' bytes from 'src'. Returns the number of bytes actually read,
// which is less than 'len' only if the stream ended first.
inline size_t read_exact(ByteSource& src, void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t got = 0;
    while (got < len) {
        size_t n = src.read_some(p + got, len - got);
        if (n == 0) break;
        got += n;
    }
    return got;
}
