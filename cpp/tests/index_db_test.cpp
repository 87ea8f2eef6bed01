#include <gtest/gtest.h>

#include <memory>

#include "test_util.hpp"
#include "zff/db/index_db.hpp"

using namespace zff::db;
using zff::core::StatusCode;

namespace {

zff::core::Uuid make_uuid(zff::core::u8 fill) {
    zff::core::Uuid u{};
    u.b.fill(fill);
    return u;
}

IndexSnapshot make_snapshot(zff::core::u8 fill) {
    IndexSnapshot snap{};
    snap.uuid = make_uuid(fill);

    IndexedSegment s1{};
    s1.number = 1;
    s1.file_size = 4096;
    s1.has_main_header = false;
    IndexedSegment s2{};
    s2.number = 2;
    s2.file_size = 1024;
    s2.has_main_footer = true;
    s2.main_footer_offset = 900;
    snap.segments = {s1, s2};

    for (zff::core::u64 n = 1; n <= 3; ++n) {
        zff::storage::ChunkLocation loc{};
        loc.segment = n < 3 ? 1 : 2;
        loc.offset = 40 + n * 100;
        loc.stored_size = 60 + n;
        loc.flags = static_cast<zff::core::u8>(n == 2 ? 1 : 0);
        loc.crc32 = 0xDEADBEEFu + static_cast<zff::core::u32>(n);
        EXPECT_TRUE(zff::core::is_ok(snap.chunks.insert(n, loc)));
    }

    IndexedObject o1{};
    o1.object_id = 7;
    o1.header_segment = 1;
    o1.header_offset = 40;
    o1.has_footer = true;
    o1.footer_segment = 2;
    o1.footer_offset = 500;
    IndexedObject o2{};
    o2.object_id = 3;
    o2.header_segment = 2;
    o2.header_offset = 600;
    snap.objects = {o1, o2};
    return snap;
}

} // namespace

//====
// Lifecycle
//====

TEST(ChunkIndexDb, OpenInMemory) {
    std::unique_ptr<ChunkIndexDb> db;
    ASSERT_TRUE(zff::core::is_ok(ChunkIndexDb::open(":memory:", &db)));
    ASSERT_NE(db, nullptr);
}

TEST(ChunkIndexDb, LoadUnknownIsNotFound) {
    std::unique_ptr<ChunkIndexDb> db;
    ASSERT_TRUE(zff::core::is_ok(ChunkIndexDb::open(":memory:", &db)));
    IndexSnapshot out{};
    const zff::core::Status s = db->load(make_uuid(1), &out);
    EXPECT_EQ(s.domain, zff::core::StatusDomain::Db);
    EXPECT_EQ(s.code, StatusCode::NotFound);
}

//====
// Store / load
//====

TEST(ChunkIndexDb, StoreLoadKeepsEveryRow) {
    std::unique_ptr<ChunkIndexDb> db;
    ASSERT_TRUE(zff::core::is_ok(ChunkIndexDb::open(":memory:", &db)));
    const IndexSnapshot snap = make_snapshot(1);
    ASSERT_TRUE(zff::core::is_ok(db->store(snap)));

    IndexSnapshot out{};
    ASSERT_TRUE(zff::core::is_ok(db->load(snap.uuid, &out)));
    EXPECT_EQ(out.uuid, snap.uuid);

    ASSERT_EQ(out.segments.size(), 2u);
    EXPECT_EQ(out.segments[0].number, 1u);
    EXPECT_EQ(out.segments[0].file_size, 4096u);
    EXPECT_FALSE(out.segments[0].has_main_header);
    EXPECT_FALSE(out.segments[0].has_main_footer);
    EXPECT_TRUE(out.segments[1].has_main_footer);
    EXPECT_EQ(out.segments[1].main_footer_offset, 900u);

    ASSERT_EQ(out.chunks.size(), 3u);
    const zff::storage::ChunkLocation* two = out.chunks.find(2);
    ASSERT_NE(two, nullptr);
    EXPECT_EQ(two->segment, 1u);
    EXPECT_EQ(two->offset, 240u);
    EXPECT_EQ(two->stored_size, 62u);
    EXPECT_EQ(two->flags, 1);
    EXPECT_EQ(two->crc32, 0xDEADBEF1u);

    // Object order is the stored order, not id order.
    ASSERT_EQ(out.objects.size(), 2u);
    EXPECT_EQ(out.objects[0].object_id, 7u);
    EXPECT_TRUE(out.objects[0].has_footer);
    EXPECT_EQ(out.objects[0].footer_offset, 500u);
    EXPECT_EQ(out.objects[1].object_id, 3u);
    EXPECT_FALSE(out.objects[1].has_footer);
}

TEST(ChunkIndexDb, StoreReplacesEarlierSnapshot) {
    std::unique_ptr<ChunkIndexDb> db;
    ASSERT_TRUE(zff::core::is_ok(ChunkIndexDb::open(":memory:", &db)));
    IndexSnapshot snap = make_snapshot(1);
    ASSERT_TRUE(zff::core::is_ok(db->store(snap)));

    snap.segments.pop_back();
    snap.objects.pop_back();
    snap.chunks = zff::storage::ChunkMap{};
    ASSERT_TRUE(zff::core::is_ok(db->store(snap)));

    IndexSnapshot out{};
    ASSERT_TRUE(zff::core::is_ok(db->load(snap.uuid, &out)));
    EXPECT_EQ(out.segments.size(), 1u);
    EXPECT_EQ(out.objects.size(), 1u);
    EXPECT_TRUE(out.chunks.empty());
}

TEST(ChunkIndexDb, ContainersAreSeparate) {
    std::unique_ptr<ChunkIndexDb> db;
    ASSERT_TRUE(zff::core::is_ok(ChunkIndexDb::open(":memory:", &db)));
    ASSERT_TRUE(zff::core::is_ok(db->store(make_snapshot(1))));
    ASSERT_TRUE(zff::core::is_ok(db->store(make_snapshot(2))));

    ASSERT_TRUE(zff::core::is_ok(db->remove(make_uuid(1))));
    IndexSnapshot out{};
    EXPECT_EQ(db->load(make_uuid(1), &out).code, StatusCode::NotFound);
    ASSERT_TRUE(zff::core::is_ok(db->load(make_uuid(2), &out)));
    EXPECT_EQ(out.chunks.size(), 3u);
}

TEST(ChunkIndexDb, PersistsAcrossConnections) {
    zff::test::TempDir dir;
    const std::string path = dir.file("index.sqlite");
    {
        std::unique_ptr<ChunkIndexDb> db;
        ASSERT_TRUE(zff::core::is_ok(ChunkIndexDb::open(path, &db)));
        ASSERT_TRUE(zff::core::is_ok(db->store(make_snapshot(9))));
    }
    std::unique_ptr<ChunkIndexDb> db;
    ASSERT_TRUE(zff::core::is_ok(ChunkIndexDb::open(path, &db)));
    IndexSnapshot out{};
    ASSERT_TRUE(zff::core::is_ok(db->load(make_uuid(9), &out)));
    EXPECT_EQ(out.segments.size(), 2u);
    EXPECT_EQ(out.objects.size(), 2u);
}
