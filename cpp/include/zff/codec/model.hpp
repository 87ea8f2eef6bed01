#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

#include "zff/core/algorithms.hpp"
#include "zff/core/types.hpp"

namespace zff::codec {
    using zff::core::u8;
    using zff::core::u32;
    using zff::core::u64;
    using zff::core::i32;
    using zff::core::i64;

    using Description = std::map<std::string, std::string>;

    // Well-known description keys.
    inline constexpr const char* kDescCaseNumber = "cn";
    inline constexpr const char* kDescEvidenceNumber = "ev";
    inline constexpr const char* kDescExaminer = "ex";
    inline constexpr const char* kDescNotes = "no";

    struct CompressionParams {
        zff::core::CompressionId algo{zff::core::CompressionId::None};
        i32 level{3};
        // raw/compressed ratio a chunk must reach to stay compressed, in
        // thousandths; 0 keeps any chunk that shrinks.
        u32 threshold_milli{0};
    };

    struct EncryptionParams {
        zff::core::AeadId aead{zff::core::AeadId::None};
        zff::core::KdfParams kdf;
    };

    struct DigestEntry {
        zff::core::HashId hash{zff::core::HashId::Sha256};
        std::vector<u8> digest;
        std::vector<u8> signature; // empty unless hash signing is on
    };

    // Settings shared by v2 object headers and the v1 main header.
    struct ChunkingDescriptor {
        u64 chunk_size{zff::core::kDefaultChunkSize};
        CompressionParams compression;
        EncryptionParams encryption;
        std::vector<zff::core::HashId> hashes;
        bool detect_same_bytes{false};
        std::vector<u8> verify_key; // ed25519 public key, empty when unsigned
        Description description;
    };

    // -------------------------------------------------------------------------
    // Segment level
    // -------------------------------------------------------------------------

    struct SegmentHeader {
        zff::core::Uuid uuid{};
        u64 segment_number{0};
        u64 max_segment_size{0};
    };

    struct SegmentChunkRow {
        u64 chunk_number{0};
        u64 offset{0};
        u64 stored_size{0};
        u8 flags{0};
        u32 crc32{0};
    };
    inline constexpr u64 kChunkRowBytes = 29;

    // Object header or footer location inside the owning segment.
    struct ObjectOffsetRow {
        u64 object_id{0};
        u64 offset{0};
    };
    inline constexpr u64 kObjectOffsetRowBytes = 16;

    struct SegmentFooter {
        u64 segment_number{0};
        u64 footer_offset{0};
        std::vector<SegmentChunkRow> chunks;
        std::vector<ObjectOffsetRow> object_headers;
        std::vector<ObjectOffsetRow> object_footers;
        bool has_main_header{false};
        u64 main_header_offset{0};
        bool has_main_footer{false};
        u64 main_footer_offset{0};
    };

    // -------------------------------------------------------------------------
    // Objects (v2)
    // -------------------------------------------------------------------------

    struct ObjectHeader {
        u64 object_id{0};
        zff::core::ObjectKind kind{zff::core::ObjectKind::Physical};
        ChunkingDescriptor chunking;
    };

    struct FileLocation {
        u64 file_number{0};
        u64 header_segment{0};
        u64 header_offset{0};
        u64 footer_segment{0};
        u64 footer_offset{0};
    };
    inline constexpr u64 kFileLocationRowBytes = 40;

    struct ObjectFooter {
        u64 object_id{0};
        zff::core::ObjectKind kind{zff::core::ObjectKind::Physical};
        u64 data_length{0};
        u64 first_chunk{0};   // 0 when the object holds no chunks
        u64 chunk_count{0};
        zff::core::Timestamp acquisition_start{0};
        zff::core::Timestamp acquisition_end{0};
        std::vector<DigestEntry> digests;
        std::vector<FileLocation> files;    // logical
        u64 virtual_map_segment{0};         // virtual
        u64 virtual_map_offset{0};
    };

    struct FileHeader {
        u64 object_id{0};
        u64 file_number{0};
        zff::core::FileType type{zff::core::FileType::File};
        u64 parent{0};
        std::string name;
        std::map<std::string, std::string> metadata;
    };

    struct FileFooter {
        u64 object_id{0};
        u64 file_number{0};
        u64 data_length{0};
        u64 first_chunk{0};
        u64 chunk_count{0};
        zff::core::Timestamp acquisition_start{0};
        zff::core::Timestamp acquisition_end{0};
        std::vector<DigestEntry> digests;
    };

    struct VirtualMapEntry {
        u64 virtual_start{0};
        u64 length{0};
        u64 source_object{0};
        u64 source_start{0};
    };
    inline constexpr u64 kVirtualEntryBytes = 32;

    struct VirtualMap {
        u64 object_id{0};
        u64 length{0};
        std::vector<VirtualMapEntry> entries;
    };

    // File header, file footer or object footer of an encrypted object. The
    // record keeps its kind; object id and number stay readable so the
    // record can be located and matched before it is opened. 'sealed' holds
    // ciphertext||tag of the whole plain framed record.
    struct SealedRecord {
        u64 object_id{0};
        u64 number{0}; // file number, 0 for the object footer
        std::vector<u8> sealed;
    };

    // -------------------------------------------------------------------------
    // Container level
    // -------------------------------------------------------------------------

    struct ObjectTableRow {
        u64 object_id{0};
        u64 first_segment{0};
        u64 first_chunk{0};
        u64 last_chunk{0};
    };
    inline constexpr u64 kObjectTableRowBytes = 32;

    struct MainFooter {
        zff::core::Uuid uuid{};
        zff::core::Timestamp created{0};
        std::vector<ObjectTableRow> objects;
        std::map<u64, std::string> segments; // number -> file name hint
        Description description;
        std::vector<u8> verify_key;
        std::vector<u8> signature; // over the footer encoded without it
    };

    // v1 only: one implicit physical stream.
    struct MainHeaderV1 {
        zff::core::Uuid uuid{};
        zff::core::Timestamp created{0};
        u64 max_segment_size{0};
        ChunkingDescriptor chunking;
    };

    struct MainFooterV1 {
        std::map<u64, std::string> segments;
        u64 data_length{0};
        u64 first_chunk{0};
        u64 chunk_count{0};
        zff::core::Timestamp acquisition_start{0};
        zff::core::Timestamp acquisition_end{0};
        std::vector<DigestEntry> digests;
    };

} // namespace zff::codec
