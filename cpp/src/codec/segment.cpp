#include "zff/codec/format.hpp"

#include "fields.hpp"

namespace zff::codec {
    namespace {
        using zff::core::Status;

        void put_chunk_rows(const std::vector<SegmentChunkRow>& rows, std::vector<u8>* out) {
            out->reserve(rows.size() * kChunkRowBytes);
            ByteWriter w(out);
            for (const SegmentChunkRow& r : rows) {
                w.put_u64(r.chunk_number);
                w.put_u64(r.offset);
                w.put_u64(r.stored_size);
                w.put_u8(r.flags);
                w.put_u32(r.crc32);
            }
        }

        void put_offset_rows(const std::vector<ObjectOffsetRow>& rows, std::vector<u8>* out) {
            out->reserve(rows.size() * kObjectOffsetRowBytes);
            ByteWriter w(out);
            for (const ObjectOffsetRow& r : rows) {
                w.put_u64(r.object_id);
                w.put_u64(r.offset);
            }
        }

        Status get_offset_rows(const ValueMap& m, const char* key, std::vector<ObjectOffsetRow>* out) noexcept {
            std::vector<u8> raw;
            u64 rows = 0;
            const Status s = detail::get_table(m, key, kObjectOffsetRowBytes, &raw, &rows);
            if (!zff::core::is_ok(s)) return s;
            out->resize(static_cast<size_t>(rows));
            ByteReader rd(view_of(raw));
            for (ObjectOffsetRow& r : *out) {
                (void)rd.get_u64(&r.object_id);
                (void)rd.get_u64(&r.offset);
            }
            return zff::core::ok_status();
        }

        ValueMap footer_map(const SegmentFooter& f) {
            ValueMap m;
            m.set_u64("seg", f.segment_number);
            m.set_u64("foff", f.footer_offset);

            std::vector<u8> raw;
            put_chunk_rows(f.chunks, &raw);
            m.set_bytes("ch", raw);
            raw.clear();
            put_offset_rows(f.object_headers, &raw);
            m.set_bytes("oh", raw);
            raw.clear();
            put_offset_rows(f.object_footers, &raw);
            m.set_bytes("of", raw);

            if (f.has_main_header) m.set_u64("mh", f.main_header_offset);
            if (f.has_main_footer) m.set_u64("mf", f.main_footer_offset);
            return m;
        }
    } // namespace

    void encode_segment_header(const SegmentHeader& h, u8 version, std::vector<u8>* out) {
        ValueMap m;
        m.set_bytes("uuid", BufferView{h.uuid.b.data(), h.uuid.b.size()});
        m.set_u64("seg", h.segment_number);
        m.set_u64("max", h.max_segment_size);
        encode_map_record(RecordKind::SegmentHeader, version, m, out);
    }

    Status decode_segment_header(BufferView record, SegmentHeader* out, u8* version) noexcept {
        RecordHeader rh{};
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::SegmentHeader, &rh, &m);
        if (!zff::core::is_ok(s)) return s;

        SegmentHeader h{};
        s = detail::get_uuid(m, "uuid", &h.uuid);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("seg", &h.segment_number);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("max", &h.max_segment_size);
        if (!zff::core::is_ok(s)) return s;

        *out = h;
        if (version != nullptr) *version = rh.version;
        return zff::core::ok_status();
    }

    void encode_segment_footer(const SegmentFooter& f, u8 version, std::vector<u8>* out) {
        encode_map_record(RecordKind::SegmentFooter, version, footer_map(f), out);
    }

    Status decode_segment_footer(BufferView record, SegmentFooter* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::SegmentFooter, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        SegmentFooter f{};
        s = m.get_u64("seg", &f.segment_number);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("foff", &f.footer_offset);
        if (!zff::core::is_ok(s)) return s;

        std::vector<u8> raw;
        u64 rows = 0;
        s = detail::get_table(m, "ch", kChunkRowBytes, &raw, &rows);
        if (!zff::core::is_ok(s)) return s;
        f.chunks.resize(static_cast<size_t>(rows));
        ByteReader rd(view_of(raw));
        for (SegmentChunkRow& r : f.chunks) {
            (void)rd.get_u64(&r.chunk_number);
            (void)rd.get_u64(&r.offset);
            (void)rd.get_u64(&r.stored_size);
            (void)rd.get_u8(&r.flags);
            (void)rd.get_u32(&r.crc32);
        }

        s = get_offset_rows(m, "oh", &f.object_headers);
        if (!zff::core::is_ok(s)) return s;
        s = get_offset_rows(m, "of", &f.object_footers);
        if (!zff::core::is_ok(s)) return s;

        if (m.has("mh")) {
            f.has_main_header = true;
            s = m.get_u64("mh", &f.main_header_offset);
            if (!zff::core::is_ok(s)) return s;
        }
        if (m.has("mf")) {
            f.has_main_footer = true;
            s = m.get_u64("mf", &f.main_footer_offset);
            if (!zff::core::is_ok(s)) return s;
        }

        *out = std::move(f);
        return zff::core::ok_status();
    }

    u64 segment_footer_record_size(u64 chunk_rows,
        u64 header_rows,
        u64 footer_rows,
        bool main_header,
        bool main_footer) noexcept {
        // Every field is fixed width, so an empty footer gives the base size.
        SegmentFooter empty{};
        empty.has_main_header = main_header;
        empty.has_main_footer = main_footer;
        const u64 base = map_record_size(footer_map(empty));
        return base + chunk_rows * kChunkRowBytes + (header_rows + footer_rows) * kObjectOffsetRowBytes;
    }

} // namespace zff::codec
