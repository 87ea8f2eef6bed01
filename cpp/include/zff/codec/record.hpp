#pragma once

#include <array>
#include <type_traits>
#include <vector>

#include "zff/codec/buffer.hpp"
#include "zff/codec/value.hpp"
#include "zff/core/errors.hpp"

namespace zff::codec {

    enum class RecordKind : u8 {
        MainHeader = 1,
        MainFooter,
        SegmentHeader,
        SegmentFooter,
        ObjectHeader,
        ObjectFooter,
        Chunk,
        FileHeader,
        FileFooter,
        VirtualMap,
    };

    struct RecordHeader {
        RecordKind kind{RecordKind::Chunk};
        u8 version{2};
        u64 length{0};
    };

    // Layout: magic[4] | version(u8) | length(u64 LE).
    inline constexpr u64 kRecordHeaderBytes = 13;

    enum class RecordParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    [[nodiscard]] const char* record_magic(RecordKind kind) noexcept;
    [[nodiscard]] bool record_kind_from_magic(const u8 magic[4], RecordKind* out) noexcept;

    // Returns bytes written (0 on failure).
    [[nodiscard]] u64 record_write_header(const RecordHeader& h, BufferMut out) noexcept;

    // Parses a header from the first bytes of 'in' (does not consume). The
    // version byte is returned as-is; callers decide which versions they accept.
    [[nodiscard]] RecordParseResult record_read_header(BufferView in, RecordHeader* out) noexcept;

    // UnsupportedVersion unless v is 1 or 2.
    [[nodiscard]] zff::core::Status check_record_version(u8 v) noexcept;

    void append_record_header(RecordKind kind, u8 version, u64 length, std::vector<u8>* out);

    // Framed map record: header followed by the encoded map.
    void encode_map_record(RecordKind kind, u8 version, const ValueMap& map, std::vector<u8>* out);

    [[nodiscard]] u64 map_record_size(const ValueMap& map) noexcept;

    // 'record' must hold exactly one framed record of the expected kind.
    [[nodiscard]] zff::core::Status decode_map_record(BufferView record,
        RecordKind expect,
        RecordHeader* header,
        ValueMap* out) noexcept;

    // ---------------------------------------------------------------------
    // Chunk records
    //
    // Payload: chunk_number(u64) | flags(u8) | stored_size(u64) | crc32(u32)
    //          | signature[64] if SignaturePresent | stored bytes.
    // ---------------------------------------------------------------------

    inline constexpr u8 kChunkCompressed = 1u << 0;
    inline constexpr u8 kChunkEncrypted = 1u << 1;
    inline constexpr u8 kChunkSameBytes = 1u << 2;
    inline constexpr u8 kChunkEmpty = 1u << 3;
    inline constexpr u8 kChunkSignaturePresent = 1u << 4;
    inline constexpr u8 kChunkKnownFlags = 0x1f;

    inline constexpr u64 kChunkFixedBytes = 21;
    inline constexpr u64 kSignatureBytes = 64;

    struct ChunkHeader {
        u64 chunk_number{0};
        u8 flags{0};
        u64 stored_size{0};
        u32 crc32{0};
        std::array<u8, 64> signature{};
    };

    [[nodiscard]] constexpr bool chunk_has_signature(u8 flags) noexcept {
        return (flags & kChunkSignaturePresent) != 0;
    }

    // Full framed size of a chunk record.
    [[nodiscard]] constexpr u64 chunk_record_size(u64 stored_size, bool has_signature) noexcept {
        return kRecordHeaderBytes + kChunkFixedBytes + (has_signature ? kSignatureBytes : 0) + stored_size;
    }

    void encode_chunk_record(const ChunkHeader& h, u8 version, BufferView payload, std::vector<u8>* out);

    // Malformed if framing, flags or the declared stored size do not match.
    // 'payload' points into 'record'.
    [[nodiscard]] zff::core::Status decode_chunk_record(BufferView record,
        ChunkHeader* out,
        BufferView* payload) noexcept;

    static_assert(std::is_trivially_copyable_v<RecordHeader>);
    static_assert(std::is_standard_layout_v<RecordHeader>);
    static_assert(std::is_trivially_copyable_v<ChunkHeader>);

} // namespace zff::codec
