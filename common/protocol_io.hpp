#pragma once

// ============================================================
// protocol_io.hpp -- Header framing: name bytes + u64 size
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "stream.hpp"
#include <cstring>
#include <memory>
#include <vector>

// Linux: htobe64 and be64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

inline void put_be64(u64 v, u8 out[8]) {
    u64 be = hton64(v);
    std::memcpy(out, &be, 8);
}

inline u64 get_be64(const u8 in[8]) {
    u64 be;
    std::memcpy(&be, in, 8);
    return ntoh64(be);
}

// ---- Name framing strategy ----
//
// The name field carries no length. The receiver takes whatever a single
// read returns (at most MAX_NAME_LEN bytes) as the name. If the stream
// fragments the name, the tail is lost; if the name read also picks up
// size bytes, the name is garbled. Both are properties of the wire format
// and are kept for compatibility.
class NameFraming {
public:
    virtual ~NameFraming() = default;

    // Throws TransferError(PROTOCOL) if 'name' can't be framed
    virtual void write_name(ByteSink& sink, const std::string& name) const = 0;

    // Throws TransferError(PROTOCOL) when the stream ends before any name byte
    virtual std::string read_name(ByteSource& src) const = 0;
};

// Raw name bytes, single opportunistic read on the receiving side
class RawNameFraming : public NameFraming {
public:
    void write_name(ByteSink& sink, const std::string& name) const override;
    std::string read_name(ByteSource& src) const override;
};

// Lossy UTF-8 decode + trim of the raw bytes of one name read
std::string decode_name(const u8* data, size_t len);

// ---- Header codec ----

class HeaderCodec {
public:
    HeaderCodec();
    explicit HeaderCodec(std::shared_ptr<const NameFraming> framing);

    // Name bytes followed by the big-endian size, as one buffer
    std::vector<u8> encode(const TransferHeader& hdr) const;

    // Puts the header on the wire as two writes: name, then size
    void write(ByteSink& sink, const TransferHeader& hdr) const;

    // The two halves of write(), for senders that act between them
    void write_name(ByteSink& sink, const std::string& name) const;
    void write_size(ByteSink& sink, u64 file_size) const;

    // Name: one read of up to MAX_NAME_LEN bytes. Size: exactly 8 bytes.
    TransferHeader read(ByteSource& src) const;

    // The two halves of read(), for callers that act between them
    std::string read_name(ByteSource& src) const;
    u64 read_size(ByteSource& src) const;

private:
    std::shared_ptr<const NameFraming> framing_;
};

// Free-function forms of the codec with the default (raw) framing
std::vector<u8> encode_header(const std::string& file_name, u64 file_size);
TransferHeader  decode_header(ByteSource& src);

// Decode a header that is already fully in memory: 'name_len' name bytes
// followed by 8 size bytes. Throws TransferError(PROTOCOL) if too short.
TransferHeader  decode_header_bytes(const u8* data, size_t len, size_t name_len);

} // namespace proto
