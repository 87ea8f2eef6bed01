#include "zff/codec/record.hpp"

#include <cstring>

#include "zff/core/algorithms.hpp"

namespace zff::codec {
    namespace {
        using zff::core::Status;
        using zff::core::StatusCode;
        using zff::core::StatusDomain;

        struct MagicEntry {
            RecordKind kind;
            const char* magic;
        };

        constexpr MagicEntry kMagics[] = {
            {RecordKind::MainHeader, "zffM"},
            {RecordKind::MainFooter, "zffm"},
            {RecordKind::SegmentHeader, "zffS"},
            {RecordKind::SegmentFooter, "zffs"},
            {RecordKind::ObjectHeader, "zffO"},
            {RecordKind::ObjectFooter, "zffo"},
            {RecordKind::Chunk, "zffC"},
            {RecordKind::FileHeader, "zffH"},
            {RecordKind::FileFooter, "zffh"},
            {RecordKind::VirtualMap, "zffV"},
        };

        [[nodiscard]] Status malformed(const char* where, u64 aux = 0) noexcept {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Malformed, aux, where);
        }
    } // namespace

    const char* record_magic(RecordKind kind) noexcept {
        for (const MagicEntry& e : kMagics) {
            if (e.kind == kind) {
                return e.magic;
            }
        }
        return nullptr;
    }

    bool record_kind_from_magic(const u8 magic[4], RecordKind* out) noexcept {
        for (const MagicEntry& e : kMagics) {
            if (std::memcmp(magic, e.magic, 4) == 0) {
                *out = e.kind;
                return true;
            }
        }
        return false;
    }

    u64 record_write_header(const RecordHeader& h, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kRecordHeaderBytes) {
            return 0;
        }
        const char* magic = record_magic(h.kind);
        if (magic == nullptr) {
            return 0;
        }
        std::memcpy(out.data, magic, 4);
        out.data[4] = h.version;
        put_u64_le(out.data + 5, h.length);
        return kRecordHeaderBytes;
    }

    RecordParseResult record_read_header(BufferView in, RecordHeader* out) noexcept {
        if (out == nullptr) return RecordParseResult::Invalid;
        if (in.data == nullptr) return RecordParseResult::NeedMore;
        if (in.len < kRecordHeaderBytes) return RecordParseResult::NeedMore;

        RecordHeader h{};
        if (!record_kind_from_magic(in.data, &h.kind)) return RecordParseResult::Invalid;
        h.version = in.data[4];
        h.length = get_u64_le(in.data + 5);

        *out = h;
        return RecordParseResult::Ok;
    }

    zff::core::Status check_record_version(u8 v) noexcept {
        if (!zff::core::format_version_known(v)) {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::UnsupportedVersion, v);
        }
        return zff::core::ok_status();
    }

    void append_record_header(RecordKind kind, u8 version, u64 length, std::vector<u8>* out) {
        u8 hdr[kRecordHeaderBytes];
        const RecordHeader h{kind, version, length};
        (void)record_write_header(h, BufferMut{hdr, kRecordHeaderBytes});
        out->insert(out->end(), hdr, hdr + kRecordHeaderBytes);
    }

    void encode_map_record(RecordKind kind, u8 version, const ValueMap& map, std::vector<u8>* out) {
        out->reserve(out->size() + static_cast<size_t>(map_record_size(map)));
        append_record_header(kind, version, map.encoded_size(), out);
        map.encode(out);
    }

    u64 map_record_size(const ValueMap& map) noexcept {
        return kRecordHeaderBytes + map.encoded_size();
    }

    zff::core::Status decode_map_record(BufferView record,
        RecordKind expect,
        RecordHeader* header,
        ValueMap* out) noexcept {
        if (out == nullptr) {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        RecordHeader h{};
        const RecordParseResult r = record_read_header(record, &h);
        if (r == RecordParseResult::NeedMore) return malformed("truncated record header");
        if (r != RecordParseResult::Ok) return malformed("bad record magic");
        if (h.kind != expect) return malformed("unexpected record kind", static_cast<u64>(h.kind));

        const Status vs = check_record_version(h.version);
        if (!zff::core::is_ok(vs)) return vs;

        if (record.len - kRecordHeaderBytes != h.length) return malformed("record length mismatch", h.length);

        const Status s = ValueMap::decode(subview(record, kRecordHeaderBytes, h.length), out);
        if (!zff::core::is_ok(s)) return s;
        if (header != nullptr) *header = h;
        return zff::core::ok_status();
    }

    void encode_chunk_record(const ChunkHeader& h, u8 version, BufferView payload, std::vector<u8>* out) {
        const bool sig = chunk_has_signature(h.flags);
        const u64 total = chunk_record_size(payload.len, sig);
        out->reserve(out->size() + static_cast<size_t>(total));

        append_record_header(RecordKind::Chunk, version, total - kRecordHeaderBytes, out);
        ByteWriter w(out);
        w.put_u64(h.chunk_number);
        w.put_u8(h.flags);
        w.put_u64(payload.len);
        w.put_u32(h.crc32);
        if (sig) {
            w.put_bytes(h.signature.data(), h.signature.size());
        }
        w.put_bytes(payload);
    }

    zff::core::Status decode_chunk_record(BufferView record, ChunkHeader* out, BufferView* payload) noexcept {
        if (out == nullptr || payload == nullptr) {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        RecordHeader h{};
        const RecordParseResult r = record_read_header(record, &h);
        if (r == RecordParseResult::NeedMore) return malformed("truncated chunk header");
        if (r != RecordParseResult::Ok || h.kind != RecordKind::Chunk) return malformed("bad chunk magic");

        const Status vs = check_record_version(h.version);
        if (!zff::core::is_ok(vs)) return vs;
        if (record.len - kRecordHeaderBytes < h.length) return malformed("truncated chunk record", h.length);

        ByteReader rd(subview(record, kRecordHeaderBytes, h.length));
        ChunkHeader c{};
        if (!rd.get_u64(&c.chunk_number) || !rd.get_u8(&c.flags) || !rd.get_u64(&c.stored_size) ||
            !rd.get_u32(&c.crc32)) {
            return malformed("truncated chunk fields");
        }
        if ((c.flags & ~kChunkKnownFlags) != 0) return malformed("unknown chunk flags", c.chunk_number);
        if (chunk_has_signature(c.flags)) {
            BufferView sig{};
            if (!rd.get_view(kSignatureBytes, &sig)) return malformed("truncated chunk signature", c.chunk_number);
            std::memcpy(c.signature.data(), sig.data, kSignatureBytes);
        }
        if (rd.remaining() != c.stored_size) return malformed("chunk stored size mismatch", c.chunk_number);

        BufferView body{};
        if (!rd.get_view(c.stored_size, &body)) return malformed("truncated chunk payload", c.chunk_number);
        *out = c;
        *payload = body;
        return zff::core::ok_status();
    }

} // namespace zff::codec
