// ============================================================
// protocol_io.cpp -- Header framing implementation
// ============================================================

#include "protocol_io.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <string>

namespace proto {

// ---------------------------------------------------------------
// RawNameFraming
// ---------------------------------------------------------------

void RawNameFraming::write_name(ByteSink& sink, const std::string& name) const {
    if (name.size() > MAX_NAME_LEN) {
        throw TransferError(ErrorKind::PROTOCOL,
            "File name is " + std::to_string(name.size()) +
            " bytes; the receiver reads at most " + std::to_string(MAX_NAME_LEN));
    }
    sink.write_all(name.data(), name.size());
}

std::string RawNameFraming::read_name(ByteSource& src) const {
    u8 buf[MAX_NAME_LEN];
    size_t n = src.read_some(buf, sizeof(buf));
    if (n == 0) {
        throw TransferError(ErrorKind::PROTOCOL, "Connection closed before file name");
    }
    return decode_name(buf, n);
}

std::string decode_name(const u8* data, size_t len) {
    return utils::trim_name(utils::utf8_lossy(data, len));
}

// ---------------------------------------------------------------
// HeaderCodec
// ---------------------------------------------------------------

HeaderCodec::HeaderCodec()
    : framing_(std::make_shared<RawNameFraming>())
{}

HeaderCodec::HeaderCodec(std::shared_ptr<const NameFraming> framing)
    : framing_(std::move(framing))
{}

std::vector<u8> HeaderCodec::encode(const TransferHeader& hdr) const {
    std::vector<u8> out(hdr.file_name.begin(), hdr.file_name.end());
    u8 size_buf[SIZE_FIELD_LEN];
    put_be64(hdr.file_size, size_buf);
    out.insert(out.end(), size_buf, size_buf + SIZE_FIELD_LEN);
    return out;
}

void HeaderCodec::write(ByteSink& sink, const TransferHeader& hdr) const {
    write_name(sink, hdr.file_name);
    write_size(sink, hdr.file_size);
}

void HeaderCodec::write_name(ByteSink& sink, const std::string& name) const {
    framing_->write_name(sink, name);
}

void HeaderCodec::write_size(ByteSink& sink, u64 file_size) const {
    u8 size_buf[SIZE_FIELD_LEN];
    put_be64(file_size, size_buf);
    sink.write_all(size_buf, sizeof(size_buf));
}

TransferHeader HeaderCodec::read(ByteSource& src) const {
    TransferHeader hdr;
    hdr.file_name = read_name(src);
    hdr.file_size = read_size(src);
    return hdr;
}

std::string HeaderCodec::read_name(ByteSource& src) const {
    return framing_->read_name(src);
}

u64 HeaderCodec::read_size(ByteSource& src) const {
    u8 size_buf[SIZE_FIELD_LEN];
    size_t got = read_exact(src, size_buf, sizeof(size_buf));
    if (got != sizeof(size_buf)) {
        throw TransferError(ErrorKind::PROTOCOL,
            "Connection closed inside size field (" + std::to_string(got) + "/8 bytes)");
    }
    return get_be64(size_buf);
}

// ---------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------

std::vector<u8> encode_header(const std::string& file_name, u64 file_size) {
    TransferHeader hdr;
    hdr.file_name = file_name;
    hdr.file_size = file_size;
    return HeaderCodec().encode(hdr);
}

TransferHeader decode_header(ByteSource& src) {
    return HeaderCodec().read(src);
}

TransferHeader decode_header_bytes(const u8* data, size_t len, size_t name_len) {
    if (name_len > MAX_NAME_LEN || len < name_len + SIZE_FIELD_LEN) {
        throw TransferError(ErrorKind::PROTOCOL, "Truncated header buffer");
    }
    TransferHeader hdr;
    hdr.file_name = decode_name(data, name_len);
    hdr.file_size = get_be64(data + name_len);
    return hdr;
}

} // namespace proto
