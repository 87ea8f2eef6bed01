#include "zff/codec/format.hpp"

#include "fields.hpp"

// v1 has no object records: the main header describes the single stream and
// the main footer closes it.
namespace zff::codec::v1 {
    using zff::core::Status;

    void encode_main_header(const MainHeaderV1& h, std::vector<u8>* out) {
        ValueMap m;
        m.set_bytes("uuid", BufferView{h.uuid.b.data(), h.uuid.b.size()});
        m.set_i64("created", h.created);
        m.set_u64("segment_size", h.max_segment_size);
        m.set_u64("chunk_size", h.chunking.chunk_size);
        m.set_map("compression", detail::encode_compression(h.chunking.compression));
        m.set_map("encryption", detail::encode_encryption(h.chunking.encryption));
        m.set_bytes("hash_types", detail::encode_hash_list(h.chunking.hashes));
        m.set_bool("same_bytes", h.chunking.detect_same_bytes);
        if (!h.chunking.verify_key.empty()) {
            m.set_bytes("public_key", h.chunking.verify_key);
        }
        m.set_string_map("description", h.chunking.description);
        encode_map_record(RecordKind::MainHeader, kVersion, m, out);
    }

    Status decode_main_header(BufferView record, MainHeaderV1* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::MainHeader, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        MainHeaderV1 h{};
        s = detail::get_uuid(m, "uuid", &h.uuid);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_i64("created", &h.created);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("segment_size", &h.max_segment_size);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("chunk_size", &h.chunking.chunk_size);
        if (!zff::core::is_ok(s)) return s;

        ValueMap sub;
        s = m.get_map("compression", &sub);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_compression(sub, &h.chunking.compression);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_map("encryption", &sub);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_encryption(sub, &h.chunking.encryption);
        if (!zff::core::is_ok(s)) return s;

        std::vector<u8> raw;
        s = m.get_bytes("hash_types", &raw);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_hash_list(raw, &h.chunking.hashes);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_bool("same_bytes", &h.chunking.detect_same_bytes);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_bytes(m, "public_key", &h.chunking.verify_key);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_string_map(m, "description", &h.chunking.description);
        if (!zff::core::is_ok(s)) return s;

        if (h.chunking.chunk_size == 0) {
            return zff::core::make_status(zff::core::StatusDomain::Codec, zff::core::StatusCode::Malformed, 0,
                "chunk_size");
        }
        *out = std::move(h);
        return zff::core::ok_status();
    }

    void encode_main_footer(const MainFooterV1& f, std::vector<u8>* out) {
        ValueMap m;
        m.set_map("segments", detail::encode_segment_table(f.segments));
        m.set_u64("length_of_data", f.data_length);
        m.set_u64("first_chunk", f.first_chunk);
        m.set_u64("number_of_chunks", f.chunk_count);
        m.set_i64("acquisition_start", f.acquisition_start);
        m.set_i64("acquisition_end", f.acquisition_end);
        detail::encode_digests(f.digests, "hash_values", "hash_signatures", &m);
        encode_map_record(RecordKind::MainFooter, kVersion, m, out);
    }

    Status decode_main_footer(BufferView record, MainFooterV1* out) noexcept {
        ValueMap m;
        Status s = decode_map_record(record, RecordKind::MainFooter, nullptr, &m);
        if (!zff::core::is_ok(s)) return s;

        MainFooterV1 f{};
        ValueMap seg;
        s = m.get_map("segments", &seg);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_segment_table(seg, &f.segments);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("length_of_data", &f.data_length);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("first_chunk", &f.first_chunk);
        if (!zff::core::is_ok(s)) return s;
        s = m.get_u64("number_of_chunks", &f.chunk_count);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_i64(m, "acquisition_start", &f.acquisition_start);
        if (!zff::core::is_ok(s)) return s;
        s = detail::get_opt_i64(m, "acquisition_end", &f.acquisition_end);
        if (!zff::core::is_ok(s)) return s;
        s = detail::decode_digests(m, "hash_values", "hash_signatures", &f.digests);
        if (!zff::core::is_ok(s)) return s;

        *out = std::move(f);
        return zff::core::ok_status();
    }

} // namespace zff::codec::v1
