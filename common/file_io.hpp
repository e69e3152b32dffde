#pragma once

// ============================================================
// file_io.hpp -- Sequential file source/sink for the pump
// ============================================================

#include "platform.hpp"
#include "stream.hpp"
#include <cstdio>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// Sequential reader over a local file (send path)
class FileReader : public ByteSource {
public:
    explicit FileReader(const std::string& path);
    ~FileReader() override;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    size_t read_some(void* buf, size_t len) override;

    // Size at open time
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

    void close();

private:
    std::FILE*  fp_{nullptr};
    std::string path_;
    u64         size_{0};
};

// Creates or truncates the destination (receive path)
class FileWriter : public ByteSink {
public:
    explicit FileWriter(const std::string& path);
    ~FileWriter() override;

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    void write_all(const void* buf, size_t len) override;

    // Flush and close; throws TransferError(IO) if buffered data can't be written
    void close();

    const std::string& path() const { return path_; }

private:
    std::FILE*  fp_{nullptr};
    std::string path_;
};

// Base name of 'path' as the sender announces it; empty for "dir/" or "/"
std::string wire_name(const std::string& path);

// Join a received name onto the destination directory.
// Throws TransferError(IO) for absolute names and names with "..".
fs::path resolve_destination(const fs::path& dest_dir, const std::string& name);

} // namespace file_io
