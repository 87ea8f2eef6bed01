#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "test_util.hpp"
#include "zff/codec/record.hpp"
#include "zff/io/container_reader.hpp"
#include "zff/io/container_writer.hpp"
#include "zff/security/crypto.hpp"
#include "zff/storage/hashing.hpp"

using namespace zff::io;
using zff::core::StatusCode;
using zff::core::u64;
using zff::core::u8;

namespace {

ObjectConfig small_chunks() {
    ObjectConfig cfg{};
    cfg.chunk_size = 4096;
    return cfg;
}

ContainerConfig one_mib_segments() {
    ContainerConfig cfg{};
    cfg.max_segment_size = zff::core::kMinSegmentSize;
    return cfg;
}

// Writes one physical object with id 1 and closes the container.
void write_physical(const std::string& base, const ContainerConfig& ccfg, const ObjectConfig& ocfg,
    const std::vector<u8>& data) {
    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, ccfg, &w)));
    ObjectWriter* obj = nullptr;
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(1, ocfg, &obj)));
    ASSERT_TRUE(zff::core::is_ok(obj->write(zff::codec::view_of(data))));
    ASSERT_TRUE(zff::core::is_ok(w->close()));
}

std::unique_ptr<ContainerReader> open_reader(const std::string& base, const ReaderOptions& opts = {}) {
    std::unique_ptr<ContainerReader> r;
    const zff::core::Status s = ContainerReader::open_base(base, opts, &r);
    EXPECT_TRUE(zff::core::is_ok(s)) << static_cast<int>(s.code);
    return r;
}

std::vector<u8> slice(const std::vector<u8>& v, u64 off, u64 len) {
    return std::vector<u8>(v.begin() + static_cast<std::ptrdiff_t>(off),
        v.begin() + static_cast<std::ptrdiff_t>(off + len));
}

zff::security::Key256 make_key256_seq(u8 start) {
    zff::security::Key256 k{};
    for (size_t i = 0; i < 32; ++i) {
        k.b[i] = static_cast<u8>(start + static_cast<u8>(i));
    }
    return k;
}

} // namespace

//====
// Physical objects
//====

TEST(Container, PhysicalRoundTrip) {
    zff::test::TempDir dir;
    const std::string base = dir.file("img");
    const std::vector<u8> data = zff::test::pattern_bytes(10 * 4096 + 123);

    ContainerConfig ccfg = one_mib_segments();
    ccfg.description[zff::codec::kDescCaseNumber] = "case-17";
    ObjectConfig ocfg = small_chunks();
    ocfg.hashes = {zff::core::HashId::Sha256, zff::core::HashId::Blake3};
    ocfg.description[zff::codec::kDescExaminer] = "jd";
    write_physical(base, ccfg, ocfg, data);

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->version(), zff::core::FormatVersion::V2);
    EXPECT_EQ(r->segment_count(), 1u);
    EXPECT_EQ(r->description().at(zff::codec::kDescCaseNumber), "case-17");
    ASSERT_EQ(r->objects(), std::vector<u64>{1});

    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    EXPECT_EQ(info.kind, zff::core::ObjectKind::Physical);
    EXPECT_EQ(info.data_length, data.size());
    EXPECT_EQ(info.first_chunk, 1u);
    EXPECT_EQ(info.chunk_count, 11u);
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.digests.size(), 2u);
    EXPECT_EQ(info.chunking.description.at(zff::codec::kDescExaminer), "jd");

    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);

    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.chunks_checked, 11u);
    EXPECT_EQ(report.digests_checked, 2u);
    EXPECT_EQ(report.digests_mismatched, 0u);
    EXPECT_FALSE(report.main_footer_signed);
}

TEST(Container, RandomAccessAcrossChunkBoundaries) {
    zff::test::TempDir dir;
    const std::string base = dir.file("img");
    const std::vector<u8> data = zff::test::pattern_bytes(5 * 4096 + 7, 3);
    write_physical(base, one_mib_segments(), small_chunks(), data);

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 4000, 200, &out)));
    EXPECT_EQ(out, slice(data, 4000, 200));
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 4096, 4096 * 2 + 1, &out)));
    EXPECT_EQ(out, slice(data, 4096, 4096 * 2 + 1));
    ASSERT_TRUE(zff::core::is_ok(r->read(1, data.size() - 7, 7, &out)));
    EXPECT_EQ(out, slice(data, data.size() - 7, 7));
    ASSERT_TRUE(zff::core::is_ok(r->read(1, data.size(), 0, &out)));
    EXPECT_TRUE(out.empty());

    EXPECT_EQ(r->read(1, data.size() - 1, 2, &out).code, StatusCode::OutOfRange);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(r->read(1, data.size() + 1, 0, &out).code, StatusCode::OutOfRange);
}

TEST(Container, UnknownObjectIsNotFound) {
    zff::test::TempDir dir;
    const std::string base = dir.file("img");
    write_physical(base, one_mib_segments(), small_chunks(), zff::test::pattern_bytes(100));

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    ObjectInfo info{};
    EXPECT_EQ(r->object_info(99, &info).code, StatusCode::NotFound);
    std::vector<u8> out;
    const zff::core::Status s = r->read(99, 0, 1, &out);
    EXPECT_EQ(s.domain, zff::core::StatusDomain::Reader);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    zff::storage::ChunkLocation loc{};
    EXPECT_EQ(r->chunk_info(2, &loc).code, StatusCode::NotFound);
}

TEST(Container, EmptyObject) {
    zff::test::TempDir dir;
    const std::string base = dir.file("img");
    ObjectConfig ocfg = small_chunks();
    ocfg.hashes = {zff::core::HashId::Sha256};
    write_physical(base, one_mib_segments(), ocfg, {});

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    EXPECT_EQ(info.data_length, 0u);
    EXPECT_EQ(info.chunk_count, 0u);
    ASSERT_EQ(info.digests.size(), 1u);
    EXPECT_EQ(zff::test::hex(info.digests[0].digest),
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());
}

TEST(Container, SpansSegments) {
    zff::test::TempDir dir;
    const std::string base = dir.file("big");
    const std::vector<u8> data = zff::test::pattern_bytes(5 * 1024 * 1024 + 17, 5);
    ObjectConfig ocfg{};
    ocfg.chunk_size = 64 * 1024;
    ocfg.hashes = {zff::core::HashId::Sha256};

    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(1, ocfg, &obj)));
    // Uneven writes exercise the chunk buffering.
    u64 pos = 0;
    u64 step = 1000;
    while (pos < data.size()) {
        const u64 n = std::min<u64>(step, data.size() - pos);
        ASSERT_TRUE(zff::core::is_ok(obj->write(zff::codec::BufferView{data.data() + pos, n})));
        pos += n;
        step = step * 3 % 200000 + 1;
    }
    ASSERT_TRUE(zff::core::is_ok(w->close()));
    const u64 written_segments = w->segment_count();
    EXPECT_GE(written_segments, 6u);

    for (u64 n = 1; n <= written_segments; ++n) {
        const std::vector<u8> seg = zff::test::read_file(zff::storage::segment_path(base, n));
        EXPECT_LE(seg.size(), zff::core::kMinSegmentSize) << "segment " << n;
    }

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->segment_count(), written_segments);
    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);

    // A range that straddles a segment boundary.
    zff::storage::ChunkLocation loc{};
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    u64 boundary_chunk = 0;
    for (u64 k = info.first_chunk; k + 1 < info.first_chunk + info.chunk_count; ++k) {
        zff::storage::ChunkLocation next{};
        ASSERT_TRUE(zff::core::is_ok(r->chunk_info(k, &loc)));
        ASSERT_TRUE(zff::core::is_ok(r->chunk_info(k + 1, &next)));
        if (next.segment != loc.segment) {
            boundary_chunk = k;
            break;
        }
    }
    ASSERT_NE(boundary_chunk, 0u);
    const u64 off = boundary_chunk * ocfg.chunk_size - 10;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, off, 20, &out)));
    EXPECT_EQ(out, slice(data, off, 20));

    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());
}

TEST(Container, OpenWithExplicitPaths) {
    zff::test::TempDir dir;
    const std::string base = dir.file("img");
    const std::vector<u8> data = zff::test::pattern_bytes(3 * 1024 * 1024, 8);
    ObjectConfig ocfg{};
    ocfg.chunk_size = 64 * 1024;
    write_physical(base, one_mib_segments(), ocfg, data);

    // Order of the paths does not matter.
    std::vector<std::string> paths;
    for (u64 n = 1;; ++n) {
        const std::string p = zff::storage::segment_path(base, n);
        if (zff::test::read_file(p).empty()) {
            break;
        }
        paths.insert(paths.begin(), p);
    }
    ASSERT_GE(paths.size(), 2u);
    std::unique_ptr<ContainerReader> r;
    ASSERT_TRUE(zff::core::is_ok(ContainerReader::open(paths, ReaderOptions{}, &r)));
    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);

    // Dropping a segment is detected against the main footer.
    paths.pop_back();
    std::unique_ptr<ContainerReader> partial;
    EXPECT_FALSE(zff::core::is_ok(ContainerReader::open(paths, ReaderOptions{}, &partial)));
}

TEST(Container, OpenBaseWithoutSegments) {
    zff::test::TempDir dir;
    std::unique_ptr<ContainerReader> r;
    EXPECT_EQ(ContainerReader::open_base(dir.file("nothing"), ReaderOptions{}, &r).code, StatusCode::NotFound);
}

TEST(Container, CompressionAndSameBytes) {
    zff::test::TempDir dir;
    const std::string base = dir.file("img");
    std::vector<u8> data;
    const std::string text = "the quick brown fox jumps over the lazy dog. ";
    while (data.size() < 4096) {
        data.insert(data.end(), text.begin(), text.end());
    }
    data.resize(4096);
    data.insert(data.end(), 4096, u8{0});
    data.insert(data.end(), 4096, u8{0x5A});

    ObjectConfig ocfg = small_chunks();
    ocfg.compression.algo = zff::core::CompressionId::Zstd;
    ocfg.detect_same_bytes = true;
    write_physical(base, one_mib_segments(), ocfg, data);

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    zff::storage::ChunkLocation loc{};
    ASSERT_TRUE(zff::core::is_ok(r->chunk_info(1, &loc)));
    EXPECT_NE(loc.flags & zff::codec::kChunkCompressed, 0);
    EXPECT_LT(loc.stored_size, 4096u);
    ASSERT_TRUE(zff::core::is_ok(r->chunk_info(2, &loc)));
    EXPECT_EQ(loc.flags, zff::codec::kChunkEmpty);
    EXPECT_EQ(loc.stored_size, 0u);
    ASSERT_TRUE(zff::core::is_ok(r->chunk_info(3, &loc)));
    EXPECT_EQ(loc.flags, zff::codec::kChunkSameBytes);
    EXPECT_EQ(loc.stored_size, 1u);

    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);
}

TEST(Container, SharableReaderServesThreads) {
    zff::test::TempDir dir;
    const std::string base = dir.file("img");
    const std::vector<u8> data = zff::test::pattern_bytes(64 * 4096, 11);
    write_physical(base, one_mib_segments(), small_chunks(), data);

    ReaderOptions opts{};
    opts.sharable = true;
    opts.cache_chunks = 4;
    auto r = open_reader(base, opts);
    ASSERT_NE(r, nullptr);

    std::vector<int> failures(4, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            std::vector<u8> out;
            for (u64 i = 0; i < 64; ++i) {
                const u64 off = ((i * 7 + static_cast<u64>(t) * 13) % 63) * 4096 + 100;
                if (!zff::core::is_ok(r->read(1, off, 5000, &out)) || out != slice(data, off, 5000)) {
                    ++failures[static_cast<size_t>(t)];
                }
            }
        });
    }
    for (std::thread& th : threads) {
        th.join();
    }
    for (int f : failures) {
        EXPECT_EQ(f, 0);
    }
}

TEST(Container, SmallZstdObjectMatchesIndependentDigest) {
    zff::test::TempDir dir;
    const std::string base = dir.file("mod251");
    std::vector<u8> data(70000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<u8>(i % 251);
    }
    ObjectConfig ocfg{};
    ocfg.chunk_size = 32 * 1024;
    ocfg.compression.algo = zff::core::CompressionId::Zstd;
    ocfg.compression.level = 3;
    ocfg.hashes = {zff::core::HashId::Sha256};
    write_physical(base, ContainerConfig{}, ocfg, data);

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->segment_count(), 1u);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    EXPECT_EQ(info.chunk_count, 3u);
    EXPECT_EQ(info.data_length, 70000u);

    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);

    std::vector<u8> expected;
    ASSERT_TRUE(zff::core::is_ok(zff::storage::hash_compute(zff::core::HashId::Sha256, zff::codec::view_of(data), &expected)));
    ASSERT_EQ(expected.size(), 32u);
    ASSERT_EQ(info.digests.size(), 1u);
    EXPECT_EQ(info.digests[0].hash, zff::core::HashId::Sha256);
    EXPECT_EQ(info.digests[0].digest, expected);
}

TEST(Container, TenMebibytesOverTwoMebibyteSegments) {
    zff::test::TempDir dir;
    const std::string base = dir.file("multi");
    const std::vector<u8> data = zff::test::pattern_bytes(10 * 1024 * 1024, 15);
    ContainerConfig ccfg{};
    ccfg.max_segment_size = 2 * 1024 * 1024;
    ObjectConfig ocfg{};
    ocfg.chunk_size = 64 * 1024;
    write_physical(base, ccfg, ocfg, data);

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    EXPECT_GE(r->segment_count(), 5u);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    ASSERT_EQ(info.chunk_count, 160u);
    zff::storage::ChunkLocation loc{};
    for (u64 k = 1; k <= 160; ++k) {
        ASSERT_TRUE(zff::core::is_ok(r->chunk_info(k, &loc))) << k;
    }
    EXPECT_EQ(r->chunk_info(161, &loc).code, StatusCode::NotFound);

    std::vector<u8> out;
    for (u64 off : {u64{0}, u64{1}, u64{65535}, u64{65536}, u64{10485759}}) {
        ASSERT_TRUE(zff::core::is_ok(r->read(1, off, 1, &out))) << off;
        ASSERT_EQ(out.size(), 1u);
        EXPECT_EQ(out[0], data[static_cast<size_t>(off)]) << off;
    }
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 65530, 12, &out)));
    EXPECT_EQ(out, slice(data, 65530, 12));
}

TEST(Container, ZeroAndRepeatedHalvesStoreAlmostNothing) {
    zff::test::TempDir dir;
    const std::string base = dir.file("fill");
    std::vector<u8> data(1024 * 1024, 0x00);
    data.insert(data.end(), 1024 * 1024, 0xAA);
    ObjectConfig ocfg{};
    ocfg.chunk_size = 32 * 1024;
    ocfg.detect_same_bytes = true;
    write_physical(base, ContainerConfig{}, ocfg, data);

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    ASSERT_EQ(info.chunk_count, 64u);

    u64 stored = 0;
    for (u64 i = 0; i < info.chunk_count; ++i) {
        zff::storage::ChunkLocation loc{};
        ASSERT_TRUE(zff::core::is_ok(r->chunk_info(info.first_chunk + i, &loc)));
        EXPECT_EQ(loc.flags, i < 32 ? zff::codec::kChunkEmpty : zff::codec::kChunkSameBytes) << i;
        stored += loc.stored_size;
    }
    EXPECT_LE(stored, 64u);

    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 1024 * 1024 - 2, 4, &out)));
    EXPECT_EQ(out, (std::vector<u8>{0x00, 0x00, 0xAA, 0xAA}));
}

TEST(Container, VirtualOverlayWithHole) {
    zff::test::TempDir dir;
    const std::string base = dir.file("overlay");
    const std::vector<u8> a(1024 * 1024, 0x11);

    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, ContainerConfig{}, &w)));
    ObjectWriter* obj = nullptr;
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(1, ObjectConfig{}, &obj)));
    ASSERT_TRUE(zff::core::is_ok(obj->write(zff::codec::view_of(a))));
    const std::vector<zff::codec::VirtualMapEntry> entries = {
        {0, 512 * 1024, 1, 0},
        {768 * 1024, 256 * 1024, 1, 0},
    };
    ASSERT_TRUE(zff::core::is_ok(w->add_virtual_object(2, entries, {})));
    ASSERT_TRUE(zff::core::is_ok(w->close()));

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(2, &info)));
    EXPECT_EQ(info.data_length, 1024u * 1024);

    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(2, 0, 1, &out)));
    EXPECT_EQ(out, std::vector<u8>{0x11});
    ASSERT_TRUE(zff::core::is_ok(r->read(2, 524288, 1, &out)));
    EXPECT_EQ(out, std::vector<u8>{0x00});
    ASSERT_TRUE(zff::core::is_ok(r->read(2, 786432, 1, &out)));
    EXPECT_EQ(out, std::vector<u8>{0x11});
}

//====
// Encryption
//====

TEST(ContainerEncryption, RawKey) {
    zff::test::TempDir dir;
    const std::string base = dir.file("enc");
    const std::vector<u8> data = zff::test::pattern_bytes(3 * 4096 + 5, 21);
    ObjectConfig ocfg = small_chunks();
    ocfg.aead = zff::core::AeadId::Aes256Gcm;
    ocfg.key = zff::security::key_from_raw(make_key256_seq(1));
    ocfg.hashes = {zff::core::HashId::Sha256};
    write_physical(base, one_mib_segments(), ocfg, data);

    // Without the key only the object header and the chunk range from the
    // main footer are visible.
    auto locked = open_reader(base);
    ASSERT_NE(locked, nullptr);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(locked->object_info(1, &info)));
    EXPECT_FALSE(info.footer_open);
    EXPECT_TRUE(info.complete);
    EXPECT_EQ(info.data_length, 0u);
    EXPECT_TRUE(info.digests.empty());
    EXPECT_EQ(info.chunk_count, 4u);
    EXPECT_EQ(info.chunking.encryption.aead, zff::core::AeadId::Aes256Gcm);
    EXPECT_EQ(info.chunking.encryption.kdf.kdf, zff::core::KdfId::None);
    std::vector<u8> out;
    EXPECT_EQ(locked->read(1, 0, 10, &out).code, StatusCode::Unavailable);
    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(locked->verify(&report)));
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.chunks_failed, 4u);

    ReaderOptions opts{};
    opts.keys.set_default(zff::security::key_from_raw(make_key256_seq(1)));
    auto r = open_reader(base, opts);
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    EXPECT_TRUE(info.footer_open);
    EXPECT_EQ(info.data_length, data.size());
    ASSERT_EQ(info.digests.size(), 1u);
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());

    ReaderOptions wrong{};
    wrong.keys.set_default(zff::security::key_from_raw(make_key256_seq(2)));
    auto bad = open_reader(base, wrong);
    ASSERT_NE(bad, nullptr);
    ASSERT_TRUE(zff::core::is_ok(bad->object_info(1, &info)));
    EXPECT_FALSE(info.footer_open);
    EXPECT_EQ(bad->read(1, 0, 10, &out).code, StatusCode::DecryptError);
}

TEST(ContainerEncryption, PasswordWithPbkdf2) {
    zff::test::TempDir dir;
    const std::string base = dir.file("enc");
    const std::vector<u8> data = zff::test::pattern_bytes(2 * 4096, 22);
    ObjectConfig ocfg = small_chunks();
    ocfg.aead = zff::core::AeadId::ChaCha20Poly1305;
    ocfg.key = zff::security::key_from_password("correct horse");
    ocfg.kdf.kdf = zff::core::KdfId::Pbkdf2Sha256;
    ocfg.kdf.iterations = 1000;
    ocfg.kdf.salt.assign(16, 0x33);
    write_physical(base, one_mib_segments(), ocfg, data);

    ReaderOptions opts{};
    opts.keys.set_for_object(1, zff::security::key_from_password("correct horse"));
    auto r = open_reader(base, opts);
    ASSERT_NE(r, nullptr);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    EXPECT_EQ(info.chunking.encryption.kdf.kdf, zff::core::KdfId::Pbkdf2Sha256);
    EXPECT_EQ(info.chunking.encryption.kdf.iterations, 1000u);
    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);

    ReaderOptions wrong{};
    wrong.keys.set_default(zff::security::key_from_password("battery staple"));
    auto bad = open_reader(base, wrong);
    ASSERT_NE(bad, nullptr);
    const zff::core::Status s = bad->read(1, 0, 10, &out);
    EXPECT_EQ(s.domain, zff::core::StatusDomain::Storage);
    EXPECT_EQ(s.code, StatusCode::DecryptError);
    EXPECT_EQ(s.aux, 0u); // the object footer fails before any chunk
}

TEST(ContainerEncryption, FileRecordsAreSealed) {
    zff::test::TempDir dir;
    const std::string base = dir.file("enc");
    const std::string name = "quarterly-ledger-draft.xlsx";
    const std::string owner = "owner-account-name";

    MemoryFileSource src;
    FileEntry entry{};
    entry.name = name;
    entry.metadata["owner"] = owner;
    src.add(entry, "ledger contents");

    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    ObjectConfig ocfg = small_chunks();
    ocfg.aead = zff::core::AeadId::Aes256Gcm;
    ocfg.key = zff::security::key_from_raw(make_key256_seq(7));
    ASSERT_TRUE(zff::core::is_ok(w->add_logical_object(3, ocfg, &obj)));
    ASSERT_TRUE(zff::core::is_ok(obj->add_files(src)));
    ASSERT_TRUE(zff::core::is_ok(w->close()));

    const std::vector<u8> raw = zff::test::read_file(base + ".z01");
    ASSERT_FALSE(raw.empty());
    const std::string bytes(raw.begin(), raw.end());
    EXPECT_EQ(bytes.find(name), std::string::npos);
    EXPECT_EQ(bytes.find(owner), std::string::npos);

    ReaderOptions opts{};
    opts.keys.set_default(zff::security::key_from_raw(make_key256_seq(7)));
    auto r = open_reader(base, opts);
    ASSERT_NE(r, nullptr);
    std::vector<FileInfo> files;
    ASSERT_TRUE(zff::core::is_ok(r->files(3, &files)));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].name, name);
    EXPECT_EQ(files[0].metadata.at("owner"), owner);
    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read_file(3, 1, 0, files[0].data_length, &out)));
    EXPECT_EQ(std::string(out.begin(), out.end()), "ledger contents");

    auto locked = open_reader(base);
    ASSERT_NE(locked, nullptr);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(locked->object_info(3, &info)));
    EXPECT_FALSE(info.footer_open);
    EXPECT_EQ(info.file_count, 0u);
    EXPECT_EQ(locked->files(3, &files).code, StatusCode::Unavailable);
    EXPECT_EQ(locked->read_file(3, 1, 0, 1, &out).code, StatusCode::Unavailable);
}

//====
// Signatures
//====

TEST(ContainerSigning, SignedContainerVerifies) {
    zff::test::TempDir dir;
    const std::string base = dir.file("signed");
    const std::vector<u8> data = zff::test::pattern_bytes(4 * 4096, 31);

    ContainerConfig ccfg = one_mib_segments();
    zff::security::VerifyKey vk{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::signing_keypair_generate(&ccfg.signing_key, &vk)));
    ccfg.sign = true;
    ObjectConfig ocfg = small_chunks();
    ocfg.hashes = {zff::core::HashId::Sha512};
    write_physical(base, ccfg, ocfg, data);

    ReaderOptions opts{};
    opts.has_trusted_key = true;
    opts.trusted_key = vk;
    auto r = open_reader(base, opts);
    ASSERT_NE(r, nullptr);

    zff::storage::ChunkLocation loc{};
    ASSERT_TRUE(zff::core::is_ok(r->chunk_info(1, &loc)));
    EXPECT_NE(loc.flags & zff::codec::kChunkSignaturePresent, 0);

    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(1, &info)));
    ASSERT_EQ(info.digests.size(), 1u);
    EXPECT_EQ(info.digests[0].signature.size(), zff::codec::kSignatureBytes);

    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.main_footer_signed);
    EXPECT_TRUE(report.main_footer_ok);
    // main footer plus the one digest
    EXPECT_EQ(report.signatures_checked, 2u);
}

TEST(ContainerSigning, UntrustedKeyIsRejected) {
    zff::test::TempDir dir;
    const std::string base = dir.file("signed");
    ContainerConfig ccfg = one_mib_segments();
    zff::security::VerifyKey vk{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::signing_keypair_generate(&ccfg.signing_key, &vk)));
    ccfg.sign = true;
    write_physical(base, ccfg, small_chunks(), zff::test::pattern_bytes(4096, 32));

    zff::security::SigningKey other_sk{};
    zff::security::VerifyKey other_vk{};
    ASSERT_TRUE(zff::core::is_ok(zff::security::signing_keypair_generate(&other_sk, &other_vk)));
    ReaderOptions opts{};
    opts.has_trusted_key = true;
    opts.trusted_key = other_vk;
    std::unique_ptr<ContainerReader> r;
    EXPECT_EQ(ContainerReader::open_base(base, opts, &r).code, StatusCode::SignatureInvalid);

    // Without signature checks the container still opens.
    opts.verify_signatures = false;
    EXPECT_TRUE(zff::core::is_ok(ContainerReader::open_base(base, opts, &r)));

    ReaderOptions zero{};
    zero.has_trusted_key = true;
    EXPECT_EQ(ContainerReader::open_base(base, zero, &r).code, StatusCode::Invalid);
}

//====
// Logical objects
//====

TEST(ContainerLogical, FilesRoundTrip) {
    zff::test::TempDir dir;
    const std::string base = dir.file("files");
    const std::vector<u8> big = zff::test::pattern_bytes(3 * 4096 + 1, 41);

    MemoryFileSource src;
    FileEntry etc{};
    etc.type = zff::core::FileType::Directory;
    etc.name = "etc";
    src.add(etc, "");
    FileEntry hosts{};
    hosts.parent = 1;
    hosts.name = "hosts";
    hosts.metadata["mode"] = "420";
    src.add(hosts, "127.0.0.1 localhost\n");
    FileEntry blob{};
    blob.parent = 1;
    blob.name = "blob";
    src.add(blob, std::string(big.begin(), big.end()));
    FileEntry link{};
    link.type = zff::core::FileType::Symlink;
    link.name = "hosts-link";
    src.add(link, "etc/hosts");
    FileEntry empty{};
    empty.parent = 1;
    empty.name = "empty";
    src.add(empty, "");

    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    ObjectConfig ocfg = small_chunks();
    ocfg.hashes = {zff::core::HashId::Sha256};
    ASSERT_TRUE(zff::core::is_ok(w->add_logical_object(5, ocfg, &obj)));
    EXPECT_EQ(obj->write(zff::codec::view_of(big)).code, StatusCode::Invalid);
    ASSERT_TRUE(zff::core::is_ok(obj->add_files(src)));
    ASSERT_TRUE(zff::core::is_ok(w->close()));

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(5, &info)));
    EXPECT_EQ(info.kind, zff::core::ObjectKind::Logical);
    EXPECT_EQ(info.file_count, 5u);

    std::vector<FileInfo> files;
    ASSERT_TRUE(zff::core::is_ok(r->files(5, &files)));
    ASSERT_EQ(files.size(), 5u);
    EXPECT_EQ(files[0].type, zff::core::FileType::Directory);
    EXPECT_EQ(files[1].name, "hosts");
    EXPECT_EQ(files[1].parent, 1u);
    EXPECT_EQ(files[1].metadata.at("mode"), "420");
    EXPECT_EQ(files[2].data_length, big.size());
    EXPECT_EQ(files[2].chunk_count, 4u);
    EXPECT_EQ(files[3].type, zff::core::FileType::Symlink);
    EXPECT_EQ(files[4].data_length, 0u);
    EXPECT_EQ(files[4].chunk_count, 0u);

    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read_file(5, 2, 0, files[1].data_length, &out)));
    EXPECT_EQ(std::string(out.begin(), out.end()), "127.0.0.1 localhost\n");
    ASSERT_TRUE(zff::core::is_ok(r->read_file(5, 3, 4090, 20, &out)));
    EXPECT_EQ(out, slice(big, 4090, 20));
    ASSERT_TRUE(zff::core::is_ok(r->read_file(5, 4, 0, files[3].data_length, &out)));
    EXPECT_EQ(std::string(out.begin(), out.end()), "etc/hosts");
    ASSERT_TRUE(zff::core::is_ok(r->read_file(5, 5, 0, 0, &out)));
    EXPECT_TRUE(out.empty());

    EXPECT_EQ(r->read_file(5, 9, 0, 1, &out).code, StatusCode::NotFound);
    EXPECT_EQ(r->read_file(5, 2, 0, 1000, &out).code, StatusCode::OutOfRange);
    EXPECT_EQ(r->read(5, 0, 1, &out).code, StatusCode::Invalid);

    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.files_checked, 5u);
}

TEST(ContainerLogical, ParentMustBeAnEarlierDirectory) {
    zff::test::TempDir dir;
    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(dir.file("files"), one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    ASSERT_TRUE(zff::core::is_ok(w->add_logical_object(1, small_chunks(), &obj)));

    FileEntry orphan{};
    orphan.parent = 3;
    orphan.name = "x";
    EXPECT_EQ(obj->add_file(orphan, nullptr, nullptr).code, StatusCode::Invalid);

    FileEntry plain{};
    plain.name = "a";
    u64 number = 0;
    ASSERT_TRUE(zff::core::is_ok(obj->add_file(plain, nullptr, &number)));
    EXPECT_EQ(number, 1u);
    FileEntry child{};
    child.parent = 1;
    child.name = "b";
    EXPECT_EQ(obj->add_file(child, nullptr, nullptr).code, StatusCode::Invalid);
    ASSERT_TRUE(zff::core::is_ok(w->close()));
}

//====
// Virtual objects
//====

TEST(ContainerVirtual, ReadsThroughSourcesAndGaps) {
    zff::test::TempDir dir;
    const std::string base = dir.file("virt");
    const std::vector<u8> a = zff::test::pattern_bytes(5 * 4096, 51);
    const std::vector<u8> b = zff::test::pattern_bytes(3 * 4096, 52);

    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(1, small_chunks(), &obj)));
    ASSERT_TRUE(zff::core::is_ok(obj->write(zff::codec::view_of(a))));
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(2, small_chunks(), &obj)));
    ASSERT_TRUE(zff::core::is_ok(obj->write(zff::codec::view_of(b))));

    // Object 2 is still open here.
    const std::vector<zff::codec::VirtualMapEntry> entries = {
        {5000, 2000, 2, 100},
        {0, 1000, 1, 500},
    };
    ASSERT_TRUE(zff::core::is_ok(w->add_virtual_object(3, entries, {})));
    // A virtual object over another virtual object.
    ASSERT_TRUE(zff::core::is_ok(w->add_virtual_object(4, {{0, 1500, 3, 200}}, {})));

    EXPECT_EQ(w->add_virtual_object(6, {{0, 10, 1, a.size() - 5}}, {}).code, StatusCode::Inconsistent);
    EXPECT_EQ(w->add_virtual_object(6, {{0, 10, 42, 0}}, {}).code, StatusCode::Inconsistent);
    EXPECT_EQ(w->add_virtual_object(6, {{0, 10, 6, 0}}, {}).code, StatusCode::Inconsistent);
    EXPECT_EQ(w->add_virtual_object(6, {{0, 10, 1, 0}, {5, 10, 1, 0}}, {}).code, StatusCode::Inconsistent);
    EXPECT_EQ(w->add_virtual_object(6, {{0, 0, 1, 0}}, {}).code, StatusCode::Invalid);
    EXPECT_EQ(w->add_virtual_object(3, {{0, 10, 1, 0}}, {}).code, StatusCode::Duplicate);
    ASSERT_TRUE(zff::core::is_ok(w->close()));

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->objects(), (std::vector<u64>{1, 2, 3, 4}));
    ObjectInfo info{};
    ASSERT_TRUE(zff::core::is_ok(r->object_info(3, &info)));
    EXPECT_EQ(info.kind, zff::core::ObjectKind::Virtual);
    EXPECT_EQ(info.data_length, 7000u);

    std::vector<u8> want = slice(a, 500, 1000);
    want.insert(want.end(), 4000, u8{0});
    const std::vector<u8> tail = slice(b, 100, 2000);
    want.insert(want.end(), tail.begin(), tail.end());

    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(3, 0, 7000, &out)));
    EXPECT_EQ(out, want);
    ASSERT_TRUE(zff::core::is_ok(r->read(4, 0, 1500, &out)));
    EXPECT_EQ(out, slice(want, 200, 1500));
    EXPECT_EQ(r->read(3, 6999, 2, &out).code, StatusCode::OutOfRange);

    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());
}

//====
// Format v1
//====

TEST(ContainerV1, SingleImplicitObject) {
    zff::test::TempDir dir;
    const std::string base = dir.file("old");
    const std::vector<u8> data = zff::test::pattern_bytes(6 * 4096 + 9, 61);

    ContainerConfig ccfg = one_mib_segments();
    ccfg.version = zff::core::FormatVersion::V1;
    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, ccfg, &w)));

    ObjectWriter* obj = nullptr;
    EXPECT_EQ(w->add_physical_object(2, small_chunks(), &obj).code, StatusCode::Invalid);
    EXPECT_EQ(w->add_logical_object(1, small_chunks(), &obj).code, StatusCode::Invalid);
    ObjectConfig ocfg = small_chunks();
    ocfg.hashes = {zff::core::HashId::Sha256};
    ocfg.description[zff::codec::kDescCaseNumber] = "v1-case";
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(1, ocfg, &obj)));
    ASSERT_TRUE(zff::core::is_ok(obj->write(zff::codec::view_of(data))));
    EXPECT_EQ(w->add_physical_object(3, small_chunks(), &obj).code, StatusCode::Invalid);
    EXPECT_EQ(w->add_virtual_object(3, {{0, 10, 1, 0}}, {}).code, StatusCode::Invalid);
    ASSERT_TRUE(zff::core::is_ok(w->close()));

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->version(), zff::core::FormatVersion::V1);
    EXPECT_EQ(r->uuid(), w->uuid());
    EXPECT_EQ(r->description().at(zff::codec::kDescCaseNumber), "v1-case");
    ASSERT_EQ(r->objects(), std::vector<u64>{1});
    std::vector<u8> out;
    ASSERT_TRUE(zff::core::is_ok(r->read(1, 0, data.size(), &out)));
    EXPECT_EQ(out, data);

    VerifyReport report{};
    ASSERT_TRUE(zff::core::is_ok(r->verify(&report)));
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.digests_checked, 1u);
}

TEST(ContainerV1, CloseWithoutObjectIsInvalid) {
    zff::test::TempDir dir;
    ContainerConfig ccfg = one_mib_segments();
    ccfg.version = zff::core::FormatVersion::V1;
    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(dir.file("old"), ccfg, &w)));
    EXPECT_EQ(w->close().code, StatusCode::Invalid);
}

//====
// Writer rules
//====

TEST(ContainerWriterRules, ObjectIds) {
    zff::test::TempDir dir;
    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(dir.file("ids"), one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    EXPECT_EQ(w->add_physical_object(0, small_chunks(), &obj).code, StatusCode::Invalid);
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(7, small_chunks(), &obj)));
    EXPECT_EQ(obj->id(), 7u);
    const zff::core::Status dup = w->add_logical_object(7, small_chunks(), &obj);
    EXPECT_EQ(dup.domain, zff::core::StatusDomain::Writer);
    EXPECT_EQ(dup.code, StatusCode::Duplicate);
    // Ids need not be dense or ascending.
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(3, small_chunks(), &obj)));
    ASSERT_TRUE(zff::core::is_ok(w->close()));
    EXPECT_TRUE(w->closed());
    EXPECT_EQ(w->add_physical_object(9, small_chunks(), &obj).code, StatusCode::Invalid);

    auto r = open_reader(dir.file("ids"));
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->objects(), (std::vector<u64>{7, 3}));
}

TEST(ContainerWriterRules, FinishedObjectRejectsWrites) {
    zff::test::TempDir dir;
    std::unique_ptr<ContainerWriter> w;
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(dir.file("fin"), one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    ASSERT_TRUE(zff::core::is_ok(w->add_physical_object(1, small_chunks(), &obj)));
    const std::vector<u8> data = zff::test::pattern_bytes(10);
    ASSERT_TRUE(zff::core::is_ok(obj->write(zff::codec::view_of(data))));
    ASSERT_TRUE(zff::core::is_ok(obj->finish()));
    EXPECT_TRUE(zff::core::is_ok(obj->finish()));
    EXPECT_EQ(obj->write(zff::codec::view_of(data)).code, StatusCode::Invalid);
    ASSERT_TRUE(zff::core::is_ok(w->close()));
}

TEST(ContainerWriterRules, ConfigValidation) {
    ContainerConfig ccfg{};
    EXPECT_TRUE(zff::core::is_ok(validate(ccfg)));
    ccfg.max_segment_size = zff::core::kMinSegmentSize - 1;
    EXPECT_EQ(validate(ccfg).code, StatusCode::Invalid);
    ccfg.max_segment_size = zff::core::kMinSegmentSize;
    ccfg.version = static_cast<zff::core::FormatVersion>(3);
    EXPECT_EQ(validate(ccfg).code, StatusCode::UnsupportedVersion);

    zff::test::TempDir dir;
    std::unique_ptr<ContainerWriter> w;
    EXPECT_EQ(ContainerWriter::create(dir.file("x"), ccfg, &w).code, StatusCode::UnsupportedVersion);
    EXPECT_EQ(w, nullptr);

    ObjectConfig ocfg{};
    EXPECT_TRUE(zff::core::is_ok(validate(ocfg)));
    ocfg.chunk_size = 6000;
    EXPECT_EQ(validate(ocfg).code, StatusCode::Invalid);
    ocfg.chunk_size = 2048;
    EXPECT_EQ(validate(ocfg).code, StatusCode::Invalid);
    ocfg.chunk_size = 4096;

    ocfg.compression.algo = zff::core::CompressionId::Zstd;
    ocfg.compression.level = 99;
    EXPECT_EQ(validate(ocfg).code, StatusCode::Invalid);
    ocfg.compression.level = 3;

    ocfg.hashes = {static_cast<zff::core::HashId>(9)};
    EXPECT_EQ(validate(ocfg).code, StatusCode::UnsupportedAlgorithm);
    ocfg.hashes.clear();

    ocfg.aead = zff::core::AeadId::Aes256Gcm;
    EXPECT_EQ(validate(ocfg).code, StatusCode::Invalid);
    ocfg.key = zff::security::key_from_password("pw");
    EXPECT_EQ(validate(ocfg).code, StatusCode::Invalid);
    ocfg.kdf.kdf = zff::core::KdfId::Scrypt;
    EXPECT_TRUE(zff::core::is_ok(validate(ocfg)));
    ocfg.key = zff::security::key_from_raw(make_key256_seq(1));
    ocfg.kdf.kdf = zff::core::KdfId::None;
    EXPECT_TRUE(zff::core::is_ok(validate(ocfg)));
}

TEST(ContainerWriterRules, MapKeysMustFitTheRecordFormat) {
    const std::string too_long(256, 'k');
    zff::test::TempDir dir;

    ContainerConfig ccfg{};
    ccfg.description[""] = "x";
    EXPECT_EQ(validate(ccfg).code, StatusCode::Invalid);
    std::unique_ptr<ContainerWriter> w;
    EXPECT_EQ(ContainerWriter::create(dir.file("bad"), ccfg, &w).code, StatusCode::Invalid);
    EXPECT_EQ(w, nullptr);

    ObjectConfig ocfg = small_chunks();
    ocfg.description[too_long] = "x";
    EXPECT_EQ(validate(ocfg).code, StatusCode::Invalid);

    const std::string base = dir.file("keys");
    ASSERT_TRUE(zff::core::is_ok(ContainerWriter::create(base, one_mib_segments(), &w)));
    ObjectWriter* obj = nullptr;
    EXPECT_EQ(w->add_physical_object(1, ocfg, &obj).code, StatusCode::Invalid);
    EXPECT_EQ(w->add_virtual_object(1, {{0, 1, 2, 0}}, {{too_long, "x"}}).code, StatusCode::Invalid);

    ASSERT_TRUE(zff::core::is_ok(w->add_logical_object(2, small_chunks(), &obj)));
    FileEntry unnamed_key{};
    unnamed_key.name = "a";
    unnamed_key.metadata[""] = "v";
    EXPECT_EQ(obj->add_file(unnamed_key, nullptr, nullptr).code, StatusCode::Invalid);

    // The longest key the encoding holds is accepted and survives the round trip.
    const std::string longest(255, 'k');
    FileEntry entry{};
    entry.name = "a";
    entry.metadata[longest] = "v";
    ASSERT_TRUE(zff::core::is_ok(obj->add_file(entry, nullptr, nullptr)));
    ASSERT_TRUE(zff::core::is_ok(w->close()));

    auto r = open_reader(base);
    ASSERT_NE(r, nullptr);
    std::vector<FileInfo> files;
    ASSERT_TRUE(zff::core::is_ok(r->files(2, &files)));
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].metadata.at(longest), "v");
}

TEST(ContainerWriterRules, ExistingSegmentIsNotOverwritten) {
    zff::test::TempDir dir;
    const std::string base = dir.file("taken");
    zff::test::write_file(zff::storage::segment_path(base, 1), "occupied");
    std::unique_ptr<ContainerWriter> w;
    EXPECT_EQ(ContainerWriter::create(base, one_mib_segments(), &w).code, StatusCode::Io);
    const std::vector<u8> kept = zff::test::read_file(zff::storage::segment_path(base, 1));
    EXPECT_EQ(std::string(kept.begin(), kept.end()), "occupied");
}
