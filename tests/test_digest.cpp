// Tests for the SHA-256 integrity accumulator

#include <gtest/gtest.h>

#include "common/digest.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

TEST(DigestTest, EmptyInputMatchesKnownVector) {
    digest::IntegrityAccumulator acc;
    EXPECT_EQ(digest::to_hex(acc.finalize()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(acc.bytes_fed(), 0u);
}

TEST(DigestTest, AbcMatchesKnownVector) {
    const std::string abc = "abc";
    EXPECT_EQ(digest::to_hex(digest::sha256(abc.data(), abc.size())),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, IncrementalEqualsOneShot) {
    std::vector<u8> data(3 * 1024 * 1024 + 17);
    for (size_t i = 0; i < data.size(); ++i) data[i] = (u8)(i * 31 + 7);

    digest::IntegrityAccumulator acc;
    size_t off = 0;
    size_t step = 1;
    while (off < data.size()) {
        size_t n = std::min(step, data.size() - off);
        acc.update(data.data() + off, n);
        off += n;
        step = step * 3 + 1;
    }
    EXPECT_EQ(acc.bytes_fed(), data.size());
    EXPECT_EQ(acc.finalize(), digest::sha256(data.data(), data.size()));
}

TEST(DigestTest, ZeroLengthUpdateIsNoOp) {
    const std::string abc = "abc";
    digest::IntegrityAccumulator acc;
    acc.update(abc.data(), 0);
    acc.update(abc.data(), abc.size());
    acc.update(nullptr, 0);
    EXPECT_EQ(acc.finalize(), digest::sha256(abc.data(), abc.size()));
}

TEST(DigestTest, UseAfterFinalizeThrows) {
    digest::IntegrityAccumulator acc;
    acc.finalize();
    EXPECT_THROW(acc.finalize(), std::logic_error);
    u8 b = 1;
    EXPECT_THROW(acc.update(&b, 1), std::logic_error);
}
