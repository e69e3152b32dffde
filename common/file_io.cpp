// ============================================================
// file_io.cpp -- FileReader / FileWriter implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

using namespace file_io;

static std::string errno_str() {
    return std::string(std::strerror(errno)) + " (errno=" + std::to_string(errno) + ")";
}

// ============================================================
// FileReader
// ============================================================

FileReader::FileReader(const std::string& path) : path_(path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw TransferError(ErrorKind::IO, "Not a regular file: " + path);
    }
    fp_ = std::fopen(path.c_str(), "rb");
    if (!fp_) {
        throw TransferError(ErrorKind::IO, "Cannot open file: " + path + ": " + errno_str());
    }
    auto sz = fs::file_size(path, ec);
    if (ec) {
        std::fclose(fp_);
        fp_ = nullptr;
        throw TransferError(ErrorKind::IO, "Cannot stat file: " + path + ": " + ec.message());
    }
    size_ = (u64)sz;
}

FileReader::~FileReader() {
    close();
}

size_t FileReader::read_some(void* buf, size_t len) {
    if (!fp_) throw TransferError(ErrorKind::IO, "Read from closed file: " + path_);
    size_t n = std::fread(buf, 1, len, fp_);
    if (n == 0 && std::ferror(fp_)) {
        throw TransferError(ErrorKind::IO, "Read failed: " + path_ + ": " + errno_str());
    }
    return n;
}

void FileReader::close() {
    if (fp_) {
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

// ============================================================
// FileWriter
// ============================================================

FileWriter::FileWriter(const std::string& path) : path_(path) {
    fp_ = std::fopen(path.c_str(), "wb");
    if (!fp_) {
        throw TransferError(ErrorKind::IO, "Cannot create file: " + path + ": " + errno_str());
    }
}

FileWriter::~FileWriter() {
    if (fp_) {
        // Errors here were already reported by write_all or an explicit close()
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

void FileWriter::write_all(const void* buf, size_t len) {
    if (!fp_) throw TransferError(ErrorKind::IO, "Write to closed file: " + path_);
    if (len == 0) return;
    if (std::fwrite(buf, 1, len, fp_) != len) {
        throw TransferError(ErrorKind::IO, "Write failed: " + path_ + ": " + errno_str());
    }
}

void FileWriter::close() {
    if (!fp_) return;
    std::FILE* fp = fp_;
    fp_ = nullptr;
    if (std::fclose(fp) != 0) {
        throw TransferError(ErrorKind::IO, "Close failed: " + path_ + ": " + errno_str());
    }
}

// ============================================================
// Names and paths
// ============================================================

std::string file_io::wire_name(const std::string& path) {
    return fs::path(path).filename().string();
}

fs::path file_io::resolve_destination(const fs::path& dest_dir, const std::string& name) {
    if (name.empty()) {
        throw TransferError(ErrorKind::IO, "Empty file name in header");
    }
    if (name[0] == '/' || name[0] == '\\' || fs::path(name).has_root_name()) {
        throw TransferError(ErrorKind::IO, "Absolute path rejected: " + name);
    }
    // Only a whole ".." component climbs out; "v1..2.tar" is an ordinary name
    size_t begin = 0;
    while (begin <= name.size()) {
        size_t end = name.find_first_of("/\\", begin);
        if (end == std::string::npos) end = name.size();
        if (name.compare(begin, end - begin, "..") == 0) {
            throw TransferError(ErrorKind::IO, "Path traversal rejected: " + name);
        }
        begin = end + 1;
    }
    return (dest_dir / fs::path(name)).lexically_normal();
}
