#pragma once

// protocol.hpp -- Wire protocol constants and types for swiftcp
//
// Per connection, sender -> receiver, one file:
//   name     raw UTF-8 base name, no length prefix, no terminator
//   size     u64 big-endian payload length
//   payload  exactly 'size' bytes
//   trailer  SHA-256 of the payload (32 bytes)

#include "platform.hpp"
#include <array>
#include <string>

static constexpr u16    SWIFTCP_DEFAULT_PORT = 8080;

// Largest name the receiver accepts in its single header read
static constexpr size_t MAX_NAME_LEN   = 256;
static constexpr size_t SIZE_FIELD_LEN = 8;
static constexpr size_t DIGEST_LEN     = 32;

// Payload pump granularity
static constexpr size_t CHUNK_SIZE = 1u * 1024u * 1024u;

// Sender-side cap on transfers in flight
static constexpr int MAX_PARALLEL_TRANSFERS = 5;

using Digest = std::array<u8, DIGEST_LEN>;

struct TransferHeader {
    std::string file_name;
    u64         file_size{0};
};
