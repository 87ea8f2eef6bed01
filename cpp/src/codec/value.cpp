#include "zff/codec/value.hpp"

#include <limits>

namespace zff::codec {
    namespace {
        using zff::core::Status;
        using zff::core::StatusCode;
        using zff::core::StatusDomain;

        [[nodiscard]] Status malformed(const char* where) noexcept {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Malformed, 0, where);
        }

        [[nodiscard]] Status missing(const char* key) noexcept {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::MissingField, 0, key);
        }

        [[nodiscard]] bool is_unsigned(ValueTag t) noexcept {
            return t == ValueTag::U8 || t == ValueTag::U16 || t == ValueTag::U32 || t == ValueTag::U64;
        }

        [[nodiscard]] bool is_signed(ValueTag t) noexcept {
            return t == ValueTag::I8 || t == ValueTag::I16 || t == ValueTag::I32 || t == ValueTag::I64;
        }

        void encode_entries(const std::vector<MapEntry>& entries, ByteWriter* w);

        void encode_value(const Value& v, ByteWriter* w) {
            w->put_u8(static_cast<u8>(v.tag));
            switch (v.tag) {
                case ValueTag::U8: w->put_u8(static_cast<u8>(v.uint_v)); break;
                case ValueTag::U16: w->put_u16(static_cast<u16>(v.uint_v)); break;
                case ValueTag::U32: w->put_u32(static_cast<u32>(v.uint_v)); break;
                case ValueTag::U64: w->put_u64(v.uint_v); break;
                case ValueTag::I8: w->put_u8(static_cast<u8>(static_cast<i8>(v.int_v))); break;
                case ValueTag::I16: w->put_u16(static_cast<u16>(static_cast<i16>(v.int_v))); break;
                case ValueTag::I32: w->put_u32(static_cast<u32>(static_cast<i32>(v.int_v))); break;
                case ValueTag::I64: w->put_u64(static_cast<u64>(v.int_v)); break;
                case ValueTag::Bool: w->put_u8(v.uint_v != 0 ? 1 : 0); break;
                case ValueTag::Bytes:
                case ValueTag::String:
                    w->put_u64(static_cast<u64>(v.bytes_v.size()));
                    w->put_bytes(v.bytes_v.data(), v.bytes_v.size());
                    break;
                case ValueTag::Map: encode_entries(v.map_v, w); break;
            }
        }

        void encode_entries(const std::vector<MapEntry>& entries, ByteWriter* w) {
            w->put_u64(static_cast<u64>(entries.size()));
            for (const MapEntry& e : entries) {
                w->put_u8(static_cast<u8>(e.key.size()));
                w->put_bytes(reinterpret_cast<const u8*>(e.key.data()), e.key.size());
                encode_value(e.value, w);
            }
        }

        u64 entries_size(const std::vector<MapEntry>& entries) noexcept;

        u64 value_size(const Value& v) noexcept {
            switch (v.tag) {
                case ValueTag::U8:
                case ValueTag::I8:
                case ValueTag::Bool: return 1 + 1;
                case ValueTag::U16:
                case ValueTag::I16: return 1 + 2;
                case ValueTag::U32:
                case ValueTag::I32: return 1 + 4;
                case ValueTag::U64:
                case ValueTag::I64: return 1 + 8;
                case ValueTag::Bytes:
                case ValueTag::String: return 1 + 8 + static_cast<u64>(v.bytes_v.size());
                case ValueTag::Map: return 1 + entries_size(v.map_v);
            }
            return 0;
        }

        u64 entries_size(const std::vector<MapEntry>& entries) noexcept {
            u64 n = 8;
            for (const MapEntry& e : entries) {
                n += 1 + static_cast<u64>(e.key.size()) + value_size(e.value);
            }
            return n;
        }

        Status decode_entries(ByteReader* r, u32 depth, std::vector<MapEntry>* out) noexcept;

        Status decode_value(ByteReader* r, u32 depth, Value* out) noexcept {
            u8 tag = 0;
            if (!r->get_u8(&tag)) return malformed("value tag");
            out->tag = static_cast<ValueTag>(tag);
            switch (out->tag) {
                case ValueTag::U8:
                case ValueTag::Bool: {
                    u8 v = 0;
                    if (!r->get_u8(&v)) return malformed("u8 value");
                    if (out->tag == ValueTag::Bool && v > 1) return malformed("bool value");
                    out->uint_v = v;
                    return zff::core::ok_status();
                }
                case ValueTag::U16: {
                    u16 v = 0;
                    if (!r->get_u16(&v)) return malformed("u16 value");
                    out->uint_v = v;
                    return zff::core::ok_status();
                }
                case ValueTag::U32: {
                    u32 v = 0;
                    if (!r->get_u32(&v)) return malformed("u32 value");
                    out->uint_v = v;
                    return zff::core::ok_status();
                }
                case ValueTag::U64: {
                    u64 v = 0;
                    if (!r->get_u64(&v)) return malformed("u64 value");
                    out->uint_v = v;
                    return zff::core::ok_status();
                }
                case ValueTag::I8: {
                    u8 v = 0;
                    if (!r->get_u8(&v)) return malformed("i8 value");
                    out->int_v = static_cast<i8>(v);
                    return zff::core::ok_status();
                }
                case ValueTag::I16: {
                    u16 v = 0;
                    if (!r->get_u16(&v)) return malformed("i16 value");
                    out->int_v = static_cast<i16>(v);
                    return zff::core::ok_status();
                }
                case ValueTag::I32: {
                    u32 v = 0;
                    if (!r->get_u32(&v)) return malformed("i32 value");
                    out->int_v = static_cast<i32>(v);
                    return zff::core::ok_status();
                }
                case ValueTag::I64: {
                    u64 v = 0;
                    if (!r->get_u64(&v)) return malformed("i64 value");
                    out->int_v = static_cast<i64>(v);
                    return zff::core::ok_status();
                }
                case ValueTag::Bytes:
                case ValueTag::String: {
                    u64 len = 0;
                    BufferView body{};
                    if (!r->get_u64(&len)) return malformed("byte string length");
                    if (!r->get_view(len, &body)) return malformed("byte string body");
                    out->bytes_v.assign(body.data, body.data + body.len);
                    return zff::core::ok_status();
                }
                case ValueTag::Map:
                    if (depth + 1 > kMaxMapDepth) return malformed("map nesting");
                    return decode_entries(r, depth + 1, &out->map_v);
            }
            return malformed("unknown value tag");
        }

        Status decode_entries(ByteReader* r, u32 depth, std::vector<MapEntry>* out) noexcept {
            u64 count = 0;
            if (!r->get_u64(&count)) return malformed("map count");
            // Each entry needs at least klen + 1 key byte + tag + 1 value byte.
            if (count > r->remaining() / 4) return malformed("map count");
            out->clear();
            out->reserve(static_cast<size_t>(count));
            for (u64 i = 0; i < count; ++i) {
                u8 klen = 0;
                BufferView key{};
                if (!r->get_u8(&klen)) return malformed("key length");
                if (klen == 0) return malformed("zero key length");
                if (!r->get_view(klen, &key)) return malformed("key bytes");
                MapEntry e;
                e.key.assign(reinterpret_cast<const char*>(key.data), static_cast<size_t>(key.len));
                const Status s = decode_value(r, depth, &e.value);
                if (!zff::core::is_ok(s)) return s;
                out->push_back(std::move(e));
            }
            return zff::core::ok_status();
        }

        [[nodiscard]] Value make_uint(ValueTag tag, u64 v) {
            Value out;
            out.tag = tag;
            out.uint_v = v;
            return out;
        }

        [[nodiscard]] Value make_int(ValueTag tag, i64 v) {
            Value out;
            out.tag = tag;
            out.int_v = v;
            return out;
        }
    } // namespace

    bool key_valid(const std::string& key) noexcept {
        return !key.empty() && key.size() <= kMaxKeyBytes;
    }

    bool keys_valid(const std::map<std::string, std::string>& m) noexcept {
        for (const auto& kv : m) {
            if (!key_valid(kv.first)) {
                return false;
            }
        }
        return true;
    }

    Value* ValueMap::slot(const std::string& key) {
        if (!key_valid(key)) {
            return nullptr;
        }
        for (MapEntry& e : entries_) {
            if (e.key == key) {
                return &e.value;
            }
        }
        entries_.push_back(MapEntry{key, Value{}});
        return &entries_.back().value;
    }

    namespace {
        bool store(Value* slot, Value v) {
            if (slot == nullptr) {
                return false;
            }
            *slot = std::move(v);
            return true;
        }
    } // namespace

    bool ValueMap::set_u8(const std::string& key, u8 v) { return store(slot(key), make_uint(ValueTag::U8, v)); }
    bool ValueMap::set_u16(const std::string& key, u16 v) { return store(slot(key), make_uint(ValueTag::U16, v)); }
    bool ValueMap::set_u32(const std::string& key, u32 v) { return store(slot(key), make_uint(ValueTag::U32, v)); }
    bool ValueMap::set_u64(const std::string& key, u64 v) { return store(slot(key), make_uint(ValueTag::U64, v)); }
    bool ValueMap::set_i32(const std::string& key, i32 v) { return store(slot(key), make_int(ValueTag::I32, v)); }
    bool ValueMap::set_i64(const std::string& key, i64 v) { return store(slot(key), make_int(ValueTag::I64, v)); }
    bool ValueMap::set_bool(const std::string& key, bool v) {
        return store(slot(key), make_uint(ValueTag::Bool, v ? 1 : 0));
    }

    bool ValueMap::set_bytes(const std::string& key, BufferView v) {
        Value out;
        out.tag = ValueTag::Bytes;
        if (v.len > 0) {
            out.bytes_v.assign(v.data, v.data + v.len);
        }
        return store(slot(key), std::move(out));
    }

    bool ValueMap::set_bytes(const std::string& key, const std::vector<u8>& v) {
        return set_bytes(key, view_of(v));
    }

    bool ValueMap::set_string(const std::string& key, const std::string& v) {
        Value out;
        out.tag = ValueTag::String;
        out.bytes_v.assign(v.begin(), v.end());
        return store(slot(key), std::move(out));
    }

    bool ValueMap::set_map(const std::string& key, const ValueMap& v) {
        Value out;
        out.tag = ValueTag::Map;
        out.map_v = v.entries_;
        return store(slot(key), std::move(out));
    }

    bool ValueMap::set_string_map(const std::string& key, const std::map<std::string, std::string>& v) {
        if (!key_valid(key) || !keys_valid(v)) {
            return false;
        }
        ValueMap nested;
        for (const auto& [k, val] : v) {
            nested.set_string(k, val);
        }
        return set_map(key, nested);
    }

    bool ValueMap::has(const std::string& key) const noexcept {
        return find(key) != nullptr;
    }

    const Value* ValueMap::find(const std::string& key) const noexcept {
        for (const MapEntry& e : entries_) {
            if (e.key == key) {
                return &e.value;
            }
        }
        return nullptr;
    }

    bool ValueMap::erase(const std::string& key) noexcept {
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->key == key) {
                entries_.erase(it);
                return true;
            }
        }
        return false;
    }

    zff::core::Status ValueMap::get_u64(const char* key, u64* out) const noexcept {
        const Value* v = find(key);
        if (v == nullptr) return missing(key);
        if (!is_unsigned(v->tag)) return malformed(key);
        *out = v->uint_v;
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_u32(const char* key, u32* out) const noexcept {
        u64 v = 0;
        const Status s = get_u64(key, &v);
        if (!zff::core::is_ok(s)) return s;
        if (v > std::numeric_limits<u32>::max()) return malformed(key);
        *out = static_cast<u32>(v);
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_u8(const char* key, u8* out) const noexcept {
        u64 v = 0;
        const Status s = get_u64(key, &v);
        if (!zff::core::is_ok(s)) return s;
        if (v > 0xffu) return malformed(key);
        *out = static_cast<u8>(v);
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_i64(const char* key, i64* out) const noexcept {
        const Value* v = find(key);
        if (v == nullptr) return missing(key);
        if (!is_signed(v->tag)) return malformed(key);
        *out = v->int_v;
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_i32(const char* key, i32* out) const noexcept {
        i64 v = 0;
        const Status s = get_i64(key, &v);
        if (!zff::core::is_ok(s)) return s;
        if (v < std::numeric_limits<i32>::min() || v > std::numeric_limits<i32>::max()) return malformed(key);
        *out = static_cast<i32>(v);
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_bool(const char* key, bool* out) const noexcept {
        const Value* v = find(key);
        if (v == nullptr) return missing(key);
        if (v->tag != ValueTag::Bool) return malformed(key);
        *out = v->uint_v != 0;
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_bytes(const char* key, std::vector<u8>* out) const noexcept {
        const Value* v = find(key);
        if (v == nullptr) return missing(key);
        if (v->tag != ValueTag::Bytes) return malformed(key);
        *out = v->bytes_v;
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_string(const char* key, std::string* out) const noexcept {
        const Value* v = find(key);
        if (v == nullptr) return missing(key);
        if (v->tag != ValueTag::String) return malformed(key);
        out->assign(v->bytes_v.begin(), v->bytes_v.end());
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_map(const char* key, ValueMap* out) const noexcept {
        const Value* v = find(key);
        if (v == nullptr) return missing(key);
        if (v->tag != ValueTag::Map) return malformed(key);
        out->entries_ = v->map_v;
        return zff::core::ok_status();
    }

    zff::core::Status ValueMap::get_string_map(const char* key,
        std::map<std::string, std::string>* out) const noexcept {
        ValueMap nested;
        const Status s = get_map(key, &nested);
        if (!zff::core::is_ok(s)) return s;
        out->clear();
        for (const MapEntry& e : nested.entries_) {
            if (e.value.tag != ValueTag::String) return malformed(key);
            (*out)[e.key] = std::string(e.value.bytes_v.begin(), e.value.bytes_v.end());
        }
        return zff::core::ok_status();
    }

    void ValueMap::encode(std::vector<u8>* out) const {
        ByteWriter w(out);
        encode_entries(entries_, &w);
    }

    u64 ValueMap::encoded_size() const noexcept {
        return entries_size(entries_);
    }

    zff::core::Status ValueMap::decode(BufferView in, ValueMap* out) noexcept {
        if (out == nullptr) {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        if (in.len > 0 && in.data == nullptr) {
            return zff::core::make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        ByteReader r(in);
        std::vector<MapEntry> entries;
        const Status s = decode_entries(&r, 0, &entries);
        if (!zff::core::is_ok(s)) return s;
        if (r.remaining() != 0) return malformed("trailing bytes after map");
        out->entries_ = std::move(entries);
        return zff::core::ok_status();
    }

} // namespace zff::codec
