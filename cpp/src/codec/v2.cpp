#include "zff/codec/format.hpp"

#include "fields.hpp"

namespace zff::codec::v2 {
    namespace {
        using zff::core::Status;
        using zff::core::StatusCode;
        using zff::core::StatusDomain;

        [[nodiscard]] Status malformed(const char* where, u64 aux = 0) noexcept {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Malformed, aux, where);
        }

        Status get_kind(const ValueMap& m, zff::core::ObjectKind* out) noexcept {
            u8 kind = 0;
            const Status s = m.get_u8("kind", &kind);
            if (!zff::core::is_ok(s)) return s;
            if (!zff::core::object_kind_known(kind)) return malformed("object kind", kind);
            *out = static_cast<zff::core::ObjectKind>(kind);
            return zff::core::ok_status();
        }

        void put_chunking(const ChunkingDescriptor& c, ValueMap* m) {
            m->set_u64("cs", c.chunk_size);
            m->set_map("cmp", detail::encode_compression(c.compression));
            m->set_map("enc", detail::encode_encryption(c.encryption));
            m->set_bytes("ha", detail::encode_hash_list(c.hashes));
            m->set_bool("sb", c.detect_same_bytes);
            if (!c.verify_key.empty()) {
                m->set_bytes("pk", c.verify_key);
            }
            m->set_string_map("desc", c.description);
        }

        Status get_chunking(const ValueMap& m, ChunkingDescriptor* out) noexcept {
            ChunkingDescriptor c{};
            Status s = m.get_u64("cs", &c.chunk_size);
            if (!zff::core::is_ok(s)) return s;

            ValueMap sub;
            s = m.get_map("cmp", &sub);
            if (!zff::core::is_ok(s)) return s;
            s = detail::decode_compression(sub, &c.compression);
            if (!zff::core::is_ok(s)) return s;

            s = m.get_map("enc", &sub);
            if (!zff::core::is_ok(s)) return s;
            s = detail::decode_encryption(sub, &c.encryption);
            if (!zff::core::is_ok(s)) return s;

            std::vector<u8> raw;
            s = m.get_bytes("ha", &raw);
            if (!zff::core::is_ok(s)) return s;
            s = detail::decode_hash_list(raw, &c.hashes);
            if (!zff::core::is_ok(s)) return s;

            s = m.get_bool("sb", &c.detect_same_bytes);
            if (!zff::core::is_ok(s)) return s;
            s = detail::get_opt_bytes(m, "pk", &c.verify_key);
            if (!zff::core::is_ok(s)) return s;
            s = detail::get_opt_string_map(m, "desc", &c.description);
            if (!zff::core::is_ok(s)) return s;

            if (c.chunk_size == 0) return malformed("chunk size");
            *out = std::move(c);
            return zff::core::ok_status();
        }

        ValueMap main_footer_map(const MainFooter& f, bool with_signature) {
            ValueMap m;
            m.set_bytes("uuid", BufferView{f.uuid.b.data(), f.uuid.b.size()});
            m.set_i64("ct", f.created);

            std::vector<u8> raw;
            raw.reserve(f.objects.size() * kObjectTableRowBytes);
            ByteWriter w(&raw);
            for (const ObjectTableRow& r : f.objects) {
                w.put_u64(r.object_id);
                w.put_u64(r.first_segment);
                w.put_u64(r.first_chunk);
                w.put_u64(r.last_chunk);
            }
            m.set_bytes("obj", raw);
            m.set_map("seg", detail::encode_segment_table(f.segments));
            if (!f.description.empty()) {
                m.set_string_map("desc", f.description);
            }
            if (!f.verify_key.empty()) {
                m.set_bytes("pk", f.verify_key);
            }
            if (with_signature && !f.signature.empty()) {
                m.set_bytes("sig", f.signature);
            }
            return m;
        }
    } // namespace

    void encode_object_header(const ObjectHeader& h, std::vector<u8>* out) {
        ValueMap m;
        m.set_u64("id", h.object_id);
        m.set_u8("kind", static_cast<u8>(h.kind));
        put_chunking(h.chunking, &m);
        encode_map_record(RecordKind::ObjectHeader, kVersion, m, out);
    }

    Status decode_object_header(BufferView record, ObjectHeader* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::ObjectHeader, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        ObjectHeader h{};
        s = m.get_u64("id", &h.object_id);
        if (!zff::core::is_ok(s)) return s;
        s = get_kind(m, &h.kind);
        if (!zff::core::is_ok(s)) return s;
        s = get_chunking(m, &h.chunking);
        if (!zff::core::is_ok(s)) return s;
        *out = std::move(h);
        return zff::core::ok_status();
    }

    void encode_object_footer(const ObjectFooter& f, std::vector<u8>* out) {
        ValueMap m;
        m.set_u64("id", f.object_id);
        m.set_u8("kind", static_cast<u8>(f.kind));
        m.set_u64("len", f.data_length);
        m.set_u64("fc", f.first_chunk);
        m.set_u64("nc", f.chunk_count);
        m.set_i64("as", f.acquisition_start);
        m.set_i64("ae", f.acquisition_end);
        detail::encode_digests(f.digests, "dig", "dsig", &m);

        if (f.kind == zff::core::ObjectKind::Logical) {
            std::vector<u8> raw;
            raw.reserve(f.files.size() * kFileLocationRowBytes);
            ByteWriter w(&raw);
            for (const FileLocation& l : f.files) {
                w.put_u64(l.file_number);
                w.put_u64(l.header_segment);
                w.put_u64(l.header_offset);
                w.put_u64(l.footer_segment);
                w.put_u64(l.footer_offset);
            }
            m.set_bytes("ft", raw);
        }
        if (f.kind == zff::core::ObjectKind::Virtual) {
            m.set_u64("vms", f.virtual_map_segment);
            m.set_u64("vmo", f.virtual_map_offset);
        }
        encode_map_record(RecordKind::ObjectFooter, kVersion, m, out);
    }

    Status decode_object_footer(BufferView record, ObjectFooter* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::ObjectFooter, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        ObjectFooter f{};
        s = m.get_u64("id", &f.object_id);
        if (!zff::core::is_ok(s)) return s;
        s = get_kind(m, &f.kind);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("len", &f.data_length);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("fc", &f.first_chunk);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("nc", &f.chunk_count);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_i64(m, "as", &f.acquisition_start);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_i64(m, "ae", &f.acquisition_end);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_digests(m, "dig", "dsig", &f.digests);
        if (!zff::core::is_ok(s)) return s;

        if (f.kind == zff::core::ObjectKind::Logical) {
            std::vector<u8> raw;
            u64 rows = 0;
            s = detail::get_table(m, "ft", kFileLocationRowBytes, &raw, &rows);
            if (!zff::core::is_ok(s)) return s;
            f.files.resize(static_cast<size_t>(rows));
            ByteReader rd(view_of(raw));
            for (FileLocation& l : f.files) {
                (void)rd.get_u64(&l.file_number);
                (void)rd.get_u64(&l.header_segment);
                (void)rd.get_u64(&l.header_offset);
                (void)rd.get_u64(&l.footer_segment);
                (void)rd.get_u64(&l.footer_offset);
            }
        }
        if (f.kind == zff::core::ObjectKind::Virtual) {
            s = m.get_u64("vms", &f.virtual_map_segment);
            if (!zff::core::is_ok(s)) return s;
            s = m.get_u64("vmo", &f.virtual_map_offset);
            if (!zff::core::is_ok(s)) return s;
        }
        if (f.chunk_count > 0 && f.first_chunk == 0) return malformed("object chunk range", f.object_id);

        *out = std::move(f);
        return zff::core::ok_status();
    }

    void encode_file_header(const FileHeader& h, std::vector<u8>* out) {
        ValueMap m;
        m.set_u64("obj", h.object_id);
        m.set_u64("no", h.file_number);
        m.set_u8("ft", static_cast<u8>(h.type));
        m.set_u64("par", h.parent);
        m.set_string("nm", h.name);
        m.set_string_map("md", h.metadata);
        encode_map_record(RecordKind::FileHeader, kVersion, m, out);
    }

    Status decode_file_header(BufferView record, FileHeader* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::FileHeader, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        FileHeader h{};
        s = m.get_u64("obj", &h.object_id);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("no", &h.file_number);
        if (!zff::core::is_ok(s)) return s;
        u8 type = 0;
        s = m.get_u8("ft", &type);
        if (!zff::core::is_ok(s)) return s;
        if (!zff::core::file_type_known(type)) return malformed("file type", type);
        h.type = static_cast<zff::core::FileType>(type);
        s = m.get_u64("par", &h.parent);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_string("nm", &h.name);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_string_map(m, "md", &h.metadata);
        if (!zff::core::is_ok(s)) return s;
        if (h.file_number == 0) return malformed("file number");

        *out = std::move(h);
        return zff::core::ok_status();
    }

    void encode_file_footer(const FileFooter& f, std::vector<u8>* out) {
        ValueMap m;
        m.set_u64("obj", f.object_id);
        m.set_u64("no", f.file_number);
        m.set_u64("len", f.data_length);
        m.set_u64("fc", f.first_chunk);
        m.set_u64("nc", f.chunk_count);
        m.set_i64("as", f.acquisition_start);
        m.set_i64("ae", f.acquisition_end);
        detail::encode_digests(f.digests, "dig", "dsig", &m);
        encode_map_record(RecordKind::FileFooter, kVersion, m, out);
    }

    Status decode_file_footer(BufferView record, FileFooter* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::FileFooter, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        FileFooter f{};
        s = m.get_u64("obj", &f.object_id);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("no", &f.file_number);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("len", &f.data_length);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("fc", &f.first_chunk);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("nc", &f.chunk_count);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_i64(m, "as", &f.acquisition_start);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_i64(m, "ae", &f.acquisition_end);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_digests(m, "dig", "dsig", &f.digests);
        if (!zff::core::is_ok(s)) return s;

        *out = std::move(f);
        return zff::core::ok_status();
    }

    void encode_virtual_map(const VirtualMap& v, std::vector<u8>* out) {
        ValueMap m;
        m.set_u64("obj", v.object_id);
        m.set_u64("len", v.length);
        std::vector<u8> raw;
        raw.reserve(v.entries.size() * kVirtualEntryBytes);
        ByteWriter w(&raw);
        for (const VirtualMapEntry& e : v.entries) {
            w.put_u64(e.virtual_start);
            w.put_u64(e.length);
            w.put_u64(e.source_object);
            w.put_u64(e.source_start);
        }
        m.set_bytes("ent", raw);
        encode_map_record(RecordKind::VirtualMap, kVersion, m, out);
    }

    Status decode_virtual_map(BufferView record, VirtualMap* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::VirtualMap, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        VirtualMap v{};
        s = m.get_u64("obj", &v.object_id);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("len", &v.length);
        if (!zff::core::is_ok(s)) return s;
        std::vector<u8> raw;
        u64 rows = 0;
        s = detail::get_table(m, "ent", kVirtualEntryBytes, &raw, &rows);
        if (!zff::core::is_ok(s)) return s;
        v.entries.resize(static_cast<size_t>(rows));
        ByteReader rd(view_of(raw));
        for (VirtualMapEntry& e : v.entries) {
            (void)rd.get_u64(&e.virtual_start);
            (void)rd.get_u64(&e.length);
            (void)rd.get_u64(&e.source_object);
            (void)rd.get_u64(&e.source_start);
        }
        *out = std::move(v);
        return zff::core::ok_status();
    }

    void encode_sealed_record(RecordKind kind, const SealedRecord& r, std::vector<u8>* out) {
        ValueMap m;
        m.set_u64("obj", r.object_id);
        m.set_u64("no", r.number);
        m.set_bytes("sealed", r.sealed);
        encode_map_record(kind, kVersion, m, out);
    }

    Status decode_sealed_record(BufferView record, RecordKind expect, SealedRecord* out, bool* sealed) noexcept {
        if (out == nullptr || sealed == nullptr) {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        ValueMap m;
        Status s = decode_map_record(record, expect, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;
        if (!m.has("sealed")) {
            *sealed = false;
            return zff::core::ok_status();
        }

        SealedRecord r{};
        s = m.get_u64("obj", &r.object_id);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("no", &r.number);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_bytes("sealed", &r.sealed);
        if (!zff::core::is_ok(s)) return s;
        if (r.sealed.empty()) return malformed("sealed record body");
        *out = std::move(r);
        *sealed = true;
        return zff::core::ok_status();
    }

    void encode_main_footer(const MainFooter& f, std::vector<u8>* out) {
        encode_map_record(RecordKind::MainFooter, kVersion, main_footer_map(f, true), out);
    }

    void main_footer_signed_bytes(const MainFooter& f, std::vector<u8>* out) {
        main_footer_map(f, false).encode(out);
    }

    Status decode_main_footer(BufferView record, MainFooter* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::MainFooter, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        MainFooter f{};
        s = detail::get_uuid(m, "uuid", &f.uuid);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_i64("ct", &f.created);
        if (!zff::core::is_ok(s)) return s;

        std::vector<u8> raw;
        u64 rows = 0;
        s = detail::get_table(m, "obj", kObjectTableRowBytes, &raw, &rows);
        if (!zff::core::is_ok(s)) return s;
        f.objects.resize(static_cast<size_t>(rows));
        ByteReader rd(view_of(raw));
        for (ObjectTableRow& r : f.objects) {
            (void)rd.get_u64(&r.object_id);
            (void)rd.get_u64(&r.first_segment);
            (void)rd.get_u64(&r.first_chunk);
            (void)rd.get_u64(&r.last_chunk);
        }

        ValueMap seg;
        s = m.get_map("seg", &seg);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_segment_table(seg, &f.segments);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_string_map(m, "desc", &f.description);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_bytes(m, "pk", &f.verify_key);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_bytes(m, "sig", &f.signature);
        if (!zff::core::is_ok(s)) return s;

        *out = std::move(f);
        return zff::core::ok_status();
    }

} // namespace zff::codec::v2
