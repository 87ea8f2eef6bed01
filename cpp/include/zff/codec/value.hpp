#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "zff/codec/buffer.hpp"
#include "zff/core/errors.hpp"

namespace zff::codec {
    using i8 = zff::core::i8;
    using i16 = zff::core::i16;
    using i32 = zff::core::i32;

    enum class ValueTag : u8 {
        U8 = 0x01,
        U16 = 0x02,
        U32 = 0x03,
        U64 = 0x04,
        I8 = 0x05,
        I16 = 0x06,
        I32 = 0x07,
        I64 = 0x08,
        Bool = 0x09,
        Bytes = 0x0a,
        String = 0x0b,
        Map = 0x0c,
    };

    // Nested maps deeper than this are rejected as Malformed.
    inline constexpr u32 kMaxMapDepth = 8;

    // Keys carry a one byte length and may not be empty.
    inline constexpr std::size_t kMaxKeyBytes = 255;

    [[nodiscard]] bool key_valid(const std::string& key) noexcept;
    [[nodiscard]] bool keys_valid(const std::map<std::string, std::string>& m) noexcept;

    struct MapEntry;

    struct Value {
        ValueTag tag{ValueTag::U64};
        u64 uint_v{0};
        i64 int_v{0};
        std::vector<u8> bytes_v;     // Bytes and String
        std::vector<MapEntry> map_v; // Map
    };

    struct MapEntry {
        std::string key;
        Value value;
    };

    // Ordered key/value map; the wire payload of every structured record.
    //
    // Layout: count(u64) then count x [klen(u8) | key | tag(u8) | value].
    // Integers are fixed width LE, Bytes/String carry a u64 length prefix,
    // Bool is one byte, Map nests the same layout.
    //
    // Encoding keeps insertion order, so decode(encode(m)) re-encodes to the
    // same bytes. Setting an existing key replaces its value in place.
    // Setters return false and leave the map unchanged for a key that fails
    // key_valid(), so every encoded map decodes again.
    class ValueMap {
    public:
        ValueMap() = default;

        bool set_u8(const std::string& key, u8 v);
        bool set_u16(const std::string& key, u16 v);
        bool set_u32(const std::string& key, u32 v);
        bool set_u64(const std::string& key, u64 v);
        bool set_i32(const std::string& key, i32 v);
        bool set_i64(const std::string& key, i64 v);
        bool set_bool(const std::string& key, bool v);
        bool set_bytes(const std::string& key, BufferView v);
        bool set_bytes(const std::string& key, const std::vector<u8>& v);
        bool set_string(const std::string& key, const std::string& v);
        bool set_map(const std::string& key, const ValueMap& v);
        bool set_string_map(const std::string& key, const std::map<std::string, std::string>& v);

        [[nodiscard]] bool has(const std::string& key) const noexcept;
        [[nodiscard]] const Value* find(const std::string& key) const noexcept;
        bool erase(const std::string& key) noexcept;

        // Required getters: MissingField(key) if absent, Malformed if the
        // stored tag cannot represent the requested type.
        [[nodiscard]] zff::core::Status get_u8(const char* key, u8* out) const noexcept;
        [[nodiscard]] zff::core::Status get_u32(const char* key, u32* out) const noexcept;
        [[nodiscard]] zff::core::Status get_u64(const char* key, u64* out) const noexcept;
        [[nodiscard]] zff::core::Status get_i32(const char* key, i32* out) const noexcept;
        [[nodiscard]] zff::core::Status get_i64(const char* key, i64* out) const noexcept;
        [[nodiscard]] zff::core::Status get_bool(const char* key, bool* out) const noexcept;
        [[nodiscard]] zff::core::Status get_bytes(const char* key, std::vector<u8>* out) const noexcept;
        [[nodiscard]] zff::core::Status get_string(const char* key, std::string* out) const noexcept;
        [[nodiscard]] zff::core::Status get_map(const char* key, ValueMap* out) const noexcept;
        [[nodiscard]] zff::core::Status get_string_map(const char* key,
            std::map<std::string, std::string>* out) const noexcept;

        [[nodiscard]] const std::vector<MapEntry>& entries() const noexcept { return entries_; }
        [[nodiscard]] u64 size() const noexcept { return static_cast<u64>(entries_.size()); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        void encode(std::vector<u8>* out) const;
        [[nodiscard]] u64 encoded_size() const noexcept;

        // Fails Malformed on unknown tag, truncation, zero key length,
        // trailing bytes or excessive nesting.
        [[nodiscard]] static zff::core::Status decode(BufferView in, ValueMap* out) noexcept;

    private:
        Value* slot(const std::string& key);

        std::vector<MapEntry> entries_;
    };

} // namespace zff::codec
