#include "fields.hpp"

#include <cstdlib>
#include <cstring>

namespace zff::codec::detail {
    using zff::core::Status;
    using zff::core::StatusCode;
    using zff::core::StatusDomain;

    namespace {
        [[nodiscard]] Status malformed(const char* where) noexcept {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Malformed, 0, where);
        }
    } // namespace

    Status unsupported(u64 id, const char* what) noexcept {
        return zff::core::make_status(StatusDomain::Codec, StatusCode::UnsupportedAlgorithm, id, what);
    }

    ValueMap encode_compression(const CompressionParams& c) {
        ValueMap m;
        m.set_u8("a", static_cast<u8>(c.algo));
        m.set_i32("l", c.level);
        m.set_u32("t", c.threshold_milli);
        return m;
    }

    Status decode_compression(const ValueMap& m, CompressionParams* out) noexcept {
        u8 algo = 0;
        Status s = m.get_u8("a", &algo);
        if (!zff::core::is_ok(s)) return s;
        if (!zff::core::compression_id_known(algo)) return unsupported(algo, "compression");

        CompressionParams c{};
        c.algo = static_cast<zff::core::CompressionId>(algo);
        s = m.get_i32("l", &c.level);
        if (!zff::core::is_ok(s)) return s;
        if (m.has("t")) {
            s = m.get_u32("t", &c.threshold_milli);
            if (!zff::core::is_ok(s)) return s;
        }
        *out = c;
        return zff::core::ok_status();
    }

    ValueMap encode_encryption(const EncryptionParams& e) {
        ValueMap m;
        m.set_u8("a", static_cast<u8>(e.aead));
        if (e.aead != zff::core::AeadId::None) {
            ValueMap k;
            k.set_u8("id", static_cast<u8>(e.kdf.kdf));
            if (e.kdf.kdf != zff::core::KdfId::None) {
                k.set_bytes("salt", e.kdf.salt);
                k.set_u32("it", e.kdf.iterations);
                k.set_u8("n", e.kdf.log_n);
                k.set_u32("r", e.kdf.r);
                k.set_u32("p", e.kdf.p);
                k.set_u32("m", e.kdf.memory_kib);
                k.set_u32("ln", e.kdf.lanes);
            }
            m.set_map("kdf", k);
        }
        return m;
    }

    Status decode_encryption(const ValueMap& m, EncryptionParams* out) noexcept {
        u8 aead = 0;
        Status s = m.get_u8("a", &aead);
        if (!zff::core::is_ok(s)) return s;
        if (!zff::core::aead_id_known(aead)) return unsupported(aead, "aead");

        EncryptionParams e{};
        e.aead = static_cast<zff::core::AeadId>(aead);
        if (e.aead == zff::core::AeadId::None) {
            *out = e;
            return zff::core::ok_status();
        }

        ValueMap k;
        s = m.get_map("kdf", &k);
        if (!zff::core::is_ok(s)) return s;
        u8 kdf = 0;
        s = k.get_u8("id", &kdf);
        if (!zff::core::is_ok(s)) return s;
        if (!zff::core::kdf_id_known(kdf)) return unsupported(kdf, "kdf");
        e.kdf.kdf = static_cast<zff::core::KdfId>(kdf);
        if (e.kdf.kdf != zff::core::KdfId::None) {
            s = k.get_bytes("salt", &e.kdf.salt);
            if (!zff::core::is_ok(s)) return s;
            s = k.get_u32("it", &e.kdf.iterations);
            if (!zff::core::is_ok(s)) return s;
            s = k.get_u8("n", &e.kdf.log_n);
            if (!zff::core::is_ok(s)) return s;
            s = k.get_u32("r", &e.kdf.r);
            if (!zff::core::is_ok(s)) return s;
            s = k.get_u32("p", &e.kdf.p);
            if (!zff::core::is_ok(s)) return s;
            s = k.get_u32("m", &e.kdf.memory_kib);
            if (!zff::core::is_ok(s)) return s;
            s = k.get_u32("ln", &e.kdf.lanes);
            if (!zff::core::is_ok(s)) return s;
        }
        *out = std::move(e);
        return zff::core::ok_status();
    }

    std::vector<u8> encode_hash_list(const std::vector<zff::core::HashId>& hashes) {
        std::vector<u8> out;
        out.reserve(hashes.size());
        for (zff::core::HashId h : hashes) {
            out.push_back(static_cast<u8>(h));
        }
        return out;
    }

    Status decode_hash_list(const std::vector<u8>& raw, std::vector<zff::core::HashId>* out) noexcept {
        out->clear();
        for (u8 b : raw) {
            if (!zff::core::hash_id_known(b)) return unsupported(b, "hash");
            out->push_back(static_cast<zff::core::HashId>(b));
        }
        return zff::core::ok_status();
    }

    void encode_digests(const std::vector<DigestEntry>& d, const char* dig_key, const char* sig_key, ValueMap* m) {
        ValueMap dig;
        ValueMap sig;
        for (const DigestEntry& e : d) {
            dig.set_bytes(zff::core::hash_name(e.hash), e.digest);
            if (!e.signature.empty()) {
                sig.set_bytes(zff::core::hash_name(e.hash), e.signature);
            }
        }
        m->set_map(dig_key, dig);
        if (!sig.empty()) {
            m->set_map(sig_key, sig);
        }
    }

    Status decode_digests(const ValueMap& m,
        const char* dig_key,
        const char* sig_key,
        std::vector<DigestEntry>* out) noexcept {
        out->clear();
        if (!m.has(dig_key)) {
            return zff::core::ok_status();
        }
        ValueMap dig;
        Status s = m.get_map(dig_key, &dig);
        if (!zff::core::is_ok(s)) return s;
        ValueMap sig;
        if (m.has(sig_key)) {
            s = m.get_map(sig_key, &sig);
            if (!zff::core::is_ok(s)) return s;
        }
        for (const MapEntry& e : dig.entries()) {
            zff::core::HashId id{};
            if (!zff::core::hash_from_name(e.key.c_str(), &id)) {
                continue; // digest of an algorithm this build does not know
            }
            DigestEntry d{};
            d.hash = id;
            s = dig.get_bytes(e.key.c_str(), &d.digest);
            if (!zff::core::is_ok(s)) return s;
            if (sig.has(e.key)) {
                s = sig.get_bytes(e.key.c_str(), &d.signature);
                if (!zff::core::is_ok(s)) return s;
            }
            out->push_back(std::move(d));
        }
        return zff::core::ok_status();
    }

    ValueMap encode_segment_table(const std::map<u64, std::string>& segments) {
        ValueMap m;
        for (const auto& [number, hint] : segments) {
            m.set_string(std::to_string(number), hint);
        }
        return m;
    }

    Status decode_segment_table(const ValueMap& m, std::map<u64, std::string>* out) noexcept {
        out->clear();
        for (const MapEntry& e : m.entries()) {
            if (e.value.tag != ValueTag::String) return malformed("segment table entry");
            char* end = nullptr;
            const unsigned long long n = std::strtoull(e.key.c_str(), &end, 10);
            if (end == e.key.c_str() || *end != '\0' || n == 0) return malformed("segment table key");
            (*out)[static_cast<u64>(n)] = std::string(e.value.bytes_v.begin(), e.value.bytes_v.end());
        }
        return zff::core::ok_status();
    }

    Status get_uuid(const ValueMap& m, const char* key, zff::core::Uuid* out) noexcept {
        std::vector<u8> raw;
        const Status s = m.get_bytes(key, &raw);
        if (!zff::core::is_ok(s)) return s;
        if (raw.size() != out->b.size()) return malformed(key);
        std::memcpy(out->b.data(), raw.data(), raw.size());
        return zff::core::ok_status();
    }

    Status get_opt_u64(const ValueMap& m, const char* key, u64* out) noexcept {
        if (!m.has(key)) return zff::core::ok_status();
        return m.get_u64(key, out);
    }

    Status get_opt_i64(const ValueMap& m, const char* key, i64* out) noexcept {
        if (!m.has(key)) return zff::core::ok_status();
        return m.get_i64(key, out);
    }

    Status get_opt_bytes(const ValueMap& m, const char* key, std::vector<u8>* out) noexcept {
        if (!m.has(key)) return zff::core::ok_status();
        return m.get_bytes(key, out);
    }

    Status get_opt_string_map(const ValueMap& m, const char* key, std::map<std::string, std::string>* out) noexcept {
        if (!m.has(key)) return zff::core::ok_status();
        return m.get_string_map(key, out);
    }

    Status get_table(const ValueMap& m, const char* key, u64 row_bytes, std::vector<u8>* raw, u64* rows) noexcept {
        const Status s = m.get_bytes(key, raw);
        if (!zff::core::is_ok(s)) return s;
        if (raw->size() % row_bytes != 0) return malformed(key);
        *rows = static_cast<u64>(raw->size()) / row_bytes;
        return zff::core::ok_status();
    }

} // namespace zff::codec::detail
