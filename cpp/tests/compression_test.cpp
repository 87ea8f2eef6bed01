#include <vector>

#include <gtest/gtest.h>

#include "test_util.hpp"
#include "zff/storage/compression.hpp"

using zff::core::u8;

TEST(StorageCompression, ZstdRoundTrip) {
    std::vector<u8> raw(64 * 1024);
    for (size_t i = 0; i < raw.size(); ++i) {
        raw[i] = static_cast<u8>("forensic"[i % 8]);
    }
    const zff::storage::ZstdCompressor zstd;
    EXPECT_EQ(zstd.id(), zff::core::CompressionId::Zstd);

    std::vector<u8> packed;
    ASSERT_TRUE(zff::core::is_ok(zstd.compress({raw.data(), raw.size()}, 3, &packed)));
    EXPECT_LT(packed.size(), raw.size() / 10);

    std::vector<u8> back;
    ASSERT_TRUE(zff::core::is_ok(zstd.decompress({packed.data(), packed.size()}, raw.size(), &back)));
    EXPECT_EQ(back, raw);
}

TEST(StorageCompression, FrameLargerThanLimitIsCorrupt) {
    const std::vector<u8> raw(8192, 0x41);
    const zff::storage::ZstdCompressor zstd;
    std::vector<u8> packed;
    ASSERT_TRUE(zff::core::is_ok(zstd.compress({raw.data(), raw.size()}, 1, &packed)));

    std::vector<u8> back;
    const zff::core::Status s = zstd.decompress({packed.data(), packed.size()}, 4096, &back);
    EXPECT_EQ(s.code, zff::core::StatusCode::Corrupt);
}

TEST(StorageCompression, GarbageIsCorrupt) {
    const std::vector<u8> junk = zff::test::pattern_bytes(200);
    const zff::storage::ZstdCompressor zstd;
    std::vector<u8> back;
    const zff::core::Status s = zstd.decompress({junk.data(), junk.size()}, 4096, &back);
    EXPECT_EQ(s.code, zff::core::StatusCode::Corrupt);
    EXPECT_EQ(s.domain, zff::core::StatusDomain::Storage);
}

TEST(StorageCompression, LevelRange) {
    EXPECT_TRUE(zff::storage::zstd_level_valid(1));
    EXPECT_TRUE(zff::storage::zstd_level_valid(19));
    EXPECT_FALSE(zff::storage::zstd_level_valid(1000));
}
