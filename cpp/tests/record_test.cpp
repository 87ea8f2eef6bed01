#include <gtest/gtest.h>

#include <cstring>
#include <vector>

#include "zff/codec/record.hpp"

using namespace zff::codec;
using zff::core::StatusCode;

TEST(RecordHeader, WriteReadRoundTrip) {
    u8 buf[kRecordHeaderBytes];
    const RecordHeader h{RecordKind::ObjectFooter, 2, 0x1122334455ull};
    ASSERT_EQ(record_write_header(h, BufferMut{buf, sizeof(buf)}), kRecordHeaderBytes);
    EXPECT_EQ(std::memcmp(buf, "zffo", 4), 0);
    EXPECT_EQ(buf[4], 2);
    EXPECT_EQ(get_u64_le(buf + 5), 0x1122334455ull);

    RecordHeader back{};
    ASSERT_EQ(record_read_header(BufferView{buf, sizeof(buf)}, &back), RecordParseResult::Ok);
    EXPECT_EQ(back.kind, RecordKind::ObjectFooter);
    EXPECT_EQ(back.version, 2);
    EXPECT_EQ(back.length, 0x1122334455ull);
}

TEST(RecordHeader, ShortInputNeedsMore) {
    u8 buf[kRecordHeaderBytes - 1] = {'z', 'f', 'f', 'C'};
    RecordHeader h{};
    EXPECT_EQ(record_read_header(BufferView{buf, sizeof(buf)}, &h), RecordParseResult::NeedMore);
}

TEST(RecordHeader, UnknownMagicIsInvalid) {
    u8 buf[kRecordHeaderBytes] = {'Z', 'F', 'F', 'X'};
    RecordHeader h{};
    EXPECT_EQ(record_read_header(BufferView{buf, sizeof(buf)}, &h), RecordParseResult::Invalid);
}

TEST(RecordHeader, MagicsAreDistinct) {
    const RecordKind kinds[] = {RecordKind::MainHeader, RecordKind::MainFooter, RecordKind::SegmentHeader,
        RecordKind::SegmentFooter, RecordKind::ObjectHeader, RecordKind::ObjectFooter, RecordKind::Chunk,
        RecordKind::FileHeader, RecordKind::FileFooter, RecordKind::VirtualMap};
    for (RecordKind a : kinds) {
        RecordKind back{};
        ASSERT_TRUE(record_kind_from_magic(reinterpret_cast<const u8*>(record_magic(a)), &back));
        EXPECT_EQ(back, a);
    }
}

TEST(RecordVersion, OnlyOneAndTwo) {
    EXPECT_EQ(check_record_version(0).code, StatusCode::UnsupportedVersion);
    EXPECT_TRUE(zff::core::is_ok(check_record_version(1)));
    EXPECT_TRUE(zff::core::is_ok(check_record_version(2)));
    const zff::core::Status s = check_record_version(3);
    EXPECT_EQ(s.code, StatusCode::UnsupportedVersion);
    EXPECT_EQ(s.aux, 3u);
}

//=============================================================================
// Map records
//=============================================================================

TEST(MapRecord, RoundTripAndKindCheck) {
    ValueMap m;
    m.set_u64("id", 9);
    std::vector<u8> rec;
    encode_map_record(RecordKind::ObjectHeader, 2, m, &rec);
    EXPECT_EQ(rec.size(), map_record_size(m));

    ValueMap back;
    RecordHeader h{};
    ASSERT_TRUE(zff::core::is_ok(decode_map_record(view_of(rec), RecordKind::ObjectHeader, &h, &back)));
    EXPECT_EQ(h.length, m.encoded_size());

    EXPECT_EQ(decode_map_record(view_of(rec), RecordKind::ObjectFooter, nullptr, &back).code,
        StatusCode::Malformed);
}

TEST(MapRecord, UnsupportedVersionIsReported) {
    ValueMap m;
    m.set_u8("x", 1);
    std::vector<u8> rec;
    encode_map_record(RecordKind::FileHeader, 7, m, &rec);
    ValueMap back;
    const zff::core::Status s = decode_map_record(view_of(rec), RecordKind::FileHeader, nullptr, &back);
    EXPECT_EQ(s.code, StatusCode::UnsupportedVersion);
    EXPECT_EQ(s.aux, 7u);
}

TEST(MapRecord, LengthMismatchIsMalformed) {
    ValueMap m;
    m.set_u8("x", 1);
    std::vector<u8> rec;
    encode_map_record(RecordKind::FileHeader, 2, m, &rec);
    rec.push_back(0);
    ValueMap back;
    EXPECT_EQ(decode_map_record(view_of(rec), RecordKind::FileHeader, nullptr, &back).code, StatusCode::Malformed);
}

//=============================================================================
// Chunk records
//=============================================================================

TEST(ChunkRecord, LayoutWithoutSignature) {
    ChunkHeader h{};
    h.chunk_number = 5;
    h.flags = kChunkCompressed;
    h.crc32 = 0xdeadbeef;
    const std::vector<u8> payload = {1, 2, 3};
    h.stored_size = payload.size();

    std::vector<u8> rec;
    encode_chunk_record(h, 2, view_of(payload), &rec);
    ASSERT_EQ(rec.size(), chunk_record_size(3, false));
    EXPECT_EQ(rec.size(), kRecordHeaderBytes + kChunkFixedBytes + 3);
    EXPECT_EQ(get_u64_le(rec.data() + kRecordHeaderBytes), 5u);
    EXPECT_EQ(rec[kRecordHeaderBytes + 8], kChunkCompressed);
    EXPECT_EQ(get_u64_le(rec.data() + kRecordHeaderBytes + 9), 3u);
    EXPECT_EQ(get_u32_le(rec.data() + kRecordHeaderBytes + 17), 0xdeadbeefu);

    ChunkHeader back{};
    BufferView body{};
    ASSERT_TRUE(zff::core::is_ok(decode_chunk_record(view_of(rec), &back, &body)));
    EXPECT_EQ(back.chunk_number, 5u);
    EXPECT_EQ(back.stored_size, 3u);
    ASSERT_EQ(body.len, 3u);
    EXPECT_EQ(body.data[2], 3);
}

TEST(ChunkRecord, SignatureSitsBeforePayload) {
    ChunkHeader h{};
    h.chunk_number = 1;
    h.flags = kChunkSignaturePresent;
    h.signature.fill(0xab);
    const std::vector<u8> payload(10, 0x11);
    h.stored_size = payload.size();

    std::vector<u8> rec;
    encode_chunk_record(h, 2, view_of(payload), &rec);
    ASSERT_EQ(rec.size(), chunk_record_size(10, true));

    ChunkHeader back{};
    BufferView body{};
    ASSERT_TRUE(zff::core::is_ok(decode_chunk_record(view_of(rec), &back, &body)));
    EXPECT_EQ(back.signature[63], 0xab);
    EXPECT_EQ(body.len, 10u);
    EXPECT_EQ(body.data[0], 0x11);
}

TEST(ChunkRecord, UnknownFlagsAreMalformed) {
    ChunkHeader h{};
    h.chunk_number = 2;
    h.flags = 0x80;
    std::vector<u8> rec;
    const std::vector<u8> payload = {1};
    h.stored_size = 1;
    encode_chunk_record(h, 2, view_of(payload), &rec);
    ChunkHeader back{};
    BufferView body{};
    EXPECT_EQ(decode_chunk_record(view_of(rec), &back, &body).code, StatusCode::Malformed);
}

TEST(ChunkRecord, TruncatedPayloadIsMalformed) {
    ChunkHeader h{};
    h.chunk_number = 3;
    const std::vector<u8> payload(8, 1);
    h.stored_size = payload.size();
    std::vector<u8> rec;
    encode_chunk_record(h, 2, view_of(payload), &rec);
    rec.resize(rec.size() - 2);
    ChunkHeader back{};
    BufferView body{};
    EXPECT_EQ(decode_chunk_record(view_of(rec), &back, &body).code, StatusCode::Malformed);
}
