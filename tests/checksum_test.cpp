#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>

#include "protocol/checksum.hpp"
#include "test_support.hpp"

using namespace testing_support;

TEST(ChecksumTest, KnownDigests) {
    std::istringstream hello("hello");
    EXPECT_EQ(protocol::to_hex(protocol::compute_checksum(hello)),
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

    std::istringstream empty("");
    EXPECT_EQ(protocol::to_hex(protocol::compute_checksum(empty)),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ChecksumTest, FileDigestIsDeterministic) {
    TempDir dir;
    auto path = dir.path() / "data.bin";
    write_file(path, random_bytes(200 * 1024));

    auto first = protocol::compute_checksum(path.string());
    auto second = protocol::compute_checksum(path.string());
    EXPECT_EQ(first, second);
}

TEST(ChecksumTest, SingleByteChangeChangesDigest) {
    TempDir dir;
    auto path = dir.path() / "data.bin";
    std::string data = random_bytes(100 * 1024);
    write_file(path, data);
    auto before = protocol::compute_checksum(path.string());

    data[data.size() / 2] ^= 0x01;
    write_file(path, data);
    EXPECT_NE(before, protocol::compute_checksum(path.string()));
}

TEST(ChecksumTest, IncrementalHasherMatchesWholeFile) {
    std::string data = random_bytes(150000, 7);

    protocol::Hasher hasher;
    for (std::size_t offset = 0; offset < data.size(); offset += 4096) {
        std::size_t n = std::min<std::size_t>(4096, data.size() - offset);
        hasher.update(data.data() + offset, n);
    }

    std::istringstream in(data);
    EXPECT_EQ(hasher.finish(), protocol::compute_checksum(in));
}

TEST(ChecksumTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(protocol::compute_checksum((dir.path() / "absent").string()), protocol::ChecksumError);
}
