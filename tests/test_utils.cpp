// Endpoint parsing, formatting helpers and name handling

#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "common/file_io.hpp"
#include "common/socket.hpp"
#include "common/utils.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

TEST(EndpointTest, ParsesHostAndPort) {
    Endpoint ep = parse_endpoint("192.168.1.10:8080");
    EXPECT_EQ(ep.host, "192.168.1.10");
    EXPECT_EQ(ep.port, 8080);
    EXPECT_EQ(ep.str(), "192.168.1.10:8080");

    ep = parse_endpoint("localhost:1");
    EXPECT_EQ(ep.host, "localhost");
    EXPECT_EQ(ep.port, 1);
}

TEST(EndpointTest, RejectsMalformedInput) {
    EXPECT_THROW(parse_endpoint("no-port"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint(":8080"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("host:"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("host:80a"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("host:65536"), std::invalid_argument);
    EXPECT_THROW(parse_endpoint("host:123456"), std::invalid_argument);
}

TEST(EndpointTest, PortZeroOnlyWhenAllowed) {
    EXPECT_THROW(parse_endpoint("0.0.0.0:0"), std::invalid_argument);
    EXPECT_EQ(parse_endpoint("0.0.0.0:0", true).port, 0);
}

TEST(FormatTest, Bytes) {
    EXPECT_EQ(utils::format_bytes(0), "0 B");
    EXPECT_EQ(utils::format_bytes(1023), "1023 B");
    EXPECT_EQ(utils::format_bytes(1536), "1.50 KB");
    EXPECT_EQ(utils::format_bytes(3ULL * 1024 * 1024), "3.00 MB");
    EXPECT_EQ(utils::format_bytes(5ULL * 1024 * 1024 * 1024), "5.00 GB");
}

TEST(FormatTest, SpeedAndDurations) {
    EXPECT_EQ(utils::format_speed(512.0), "512.0 B/s");
    EXPECT_EQ(utils::format_speed(2.0 * 1024 * 1024), "2.00 MB/s");
    EXPECT_EQ(utils::format_duration_s(45), "45s");
    EXPECT_EQ(utils::format_duration_s(125), "2m 5s");
    EXPECT_EQ(utils::format_duration_s(3725), "1h 2m 5s");
    EXPECT_EQ(utils::format_elapsed(std::chrono::milliseconds(850)), "850ms");
    EXPECT_EQ(utils::format_elapsed(std::chrono::milliseconds(1234)), "1.234s");
    EXPECT_EQ(utils::format_percent(1, 4), "25.0%");
    EXPECT_EQ(utils::format_percent(0, 0), "100%");
}

TEST(FormatTest, ThroughputHandlesZeroElapsed) {
    EXPECT_DOUBLE_EQ(utils::throughput(1000, std::chrono::seconds(2)), 500.0);
    EXPECT_GT(utils::throughput(10, std::chrono::nanoseconds(0)), 0.0);
}

TEST(NameTest, Utf8LossyKeepsValidText) {
    const std::string s = "r\xC3\xA9sum\xC3\xA9.pdf";
    EXPECT_EQ(utils::utf8_lossy(reinterpret_cast<const u8*>(s.data()), s.size()), s);
}

TEST(NameTest, Utf8LossyReplacesInvalidSequences) {
    const std::string fffd = "\xEF\xBF\xBD";
    const u8 lone_continuation[] = {'a', 0x80, 'b'};
    EXPECT_EQ(utils::utf8_lossy(lone_continuation, 3), "a" + fffd + "b");

    const u8 truncated[] = {'a', 0xE2, 0x82};
    EXPECT_EQ(utils::utf8_lossy(truncated, 3), "a" + fffd);

    const u8 overlong[] = {0xC0, 0xAF};
    EXPECT_EQ(utils::utf8_lossy(overlong, 2), fffd + fffd);

    const u8 surrogate[] = {0xED, 0xA0, 0x80};
    EXPECT_EQ(utils::utf8_lossy(surrogate, 3), fffd + fffd + fffd);
}

TEST(NameTest, TrimStripsWhitespaceAndControls) {
    EXPECT_EQ(utils::trim_name("  a b.txt \r\n"), "a b.txt");
    EXPECT_EQ(utils::trim_name(std::string("\x00x\x7f", 3)), "x");
    EXPECT_EQ(utils::trim_name(" \t "), "");
}

TEST(NameTest, WireNameIsBaseName) {
    EXPECT_EQ(file_io::wire_name("/data/out/report.bin"), "report.bin");
    EXPECT_EQ(file_io::wire_name("report.bin"), "report.bin");
    EXPECT_EQ(file_io::wire_name("dir/"), "");
}

TEST(NameTest, DestinationStaysInsideDirectory) {
    fs::path dest = file_io::resolve_destination("/srv/in", "a.txt");
    EXPECT_EQ(dest, fs::path("/srv/in/a.txt"));

    auto kind = [](const std::string& name) {
        try {
            file_io::resolve_destination("/srv/in", name);
        } catch (const TransferError& e) {
            return e.kind();
        }
        return ErrorKind::NONE;
    };
    EXPECT_EQ(kind(""), ErrorKind::IO);
    EXPECT_EQ(kind("/etc/passwd"), ErrorKind::IO);
    EXPECT_EQ(kind("../up.txt"), ErrorKind::IO);
    EXPECT_EQ(kind("a/../../b"), ErrorKind::IO);
    EXPECT_EQ(kind("sub/.."), ErrorKind::IO);
    EXPECT_EQ(kind("..\\up.txt"), ErrorKind::IO);
}

TEST(NameTest, DoubleDotsInsideAComponentAreOrdinary) {
    EXPECT_EQ(file_io::resolve_destination("/srv/in", "v1..2.tar"), fs::path("/srv/in/v1..2.tar"));
    EXPECT_EQ(file_io::resolve_destination("/srv/in", "notes..txt"), fs::path("/srv/in/notes..txt"));
    EXPECT_EQ(file_io::resolve_destination("/srv/in", "..hidden"), fs::path("/srv/in/..hidden"));
    EXPECT_EQ(file_io::resolve_destination("/srv/in", "..."), fs::path("/srv/in/..."));
}
