#pragma once

#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

#include "zff/core/types.hpp"

namespace zff::codec {
    using u8 = zff::core::u8;
    using u16 = zff::core::u16;
    using u32 = zff::core::u32;
    using u64 = zff::core::u64;
    using i64 = zff::core::i64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] inline BufferView view_of(const std::vector<u8>& v) noexcept {
        return BufferView{v.data(), static_cast<u64>(v.size())};
    }

    [[nodiscard]] inline BufferView view_of(const std::string& s) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u64>(s.size())};
    }

    [[nodiscard]] constexpr BufferView subview(BufferView v, u64 off, u64 len) noexcept {
        if (off > v.len) {
            return BufferView{nullptr, 0};
        }
        if (len > v.len - off) {
            len = v.len - off;
        }
        return BufferView{v.data + off, len};
    }

    // Little-endian scalar helpers (the whole container format is LE).
    inline void put_u16_le(u8* out, u16 v) noexcept {
        out[0] = static_cast<u8>((v >> 0) & 0xffu);
        out[1] = static_cast<u8>((v >> 8) & 0xffu);
    }

    inline void put_u32_le(u8* out, u32 v) noexcept {
        out[0] = static_cast<u8>((v >> 0) & 0xffu);
        out[1] = static_cast<u8>((v >> 8) & 0xffu);
        out[2] = static_cast<u8>((v >> 16) & 0xffu);
        out[3] = static_cast<u8>((v >> 24) & 0xffu);
    }

    inline void put_u64_le(u8* out, u64 v) noexcept {
        for (int i = 0; i < 8; ++i) {
            out[i] = static_cast<u8>((v >> (8 * i)) & 0xffu);
        }
    }

    [[nodiscard]] inline u16 get_u16_le(const u8* in) noexcept {
        return static_cast<u16>(static_cast<u16>(in[0]) | (static_cast<u16>(in[1]) << 8));
    }

    [[nodiscard]] inline u32 get_u32_le(const u8* in) noexcept {
        return (static_cast<u32>(in[0]) << 0) | (static_cast<u32>(in[1]) << 8) | (static_cast<u32>(in[2]) << 16) |
               (static_cast<u32>(in[3]) << 24);
    }

    [[nodiscard]] inline u64 get_u64_le(const u8* in) noexcept {
        u64 v = 0;
        for (int i = 7; i >= 0; --i) {
            v = (v << 8) | static_cast<u64>(in[i]);
        }
        return v;
    }

    // Appends to a caller-owned vector.
    class ByteWriter {
    public:
        explicit ByteWriter(std::vector<u8>* out) noexcept : out_(out) {}

        void put_u8(u8 v) { out_->push_back(v); }

        void put_u16(u16 v) {
            u8 b[2];
            put_u16_le(b, v);
            out_->insert(out_->end(), b, b + 2);
        }

        void put_u32(u32 v) {
            u8 b[4];
            put_u32_le(b, v);
            out_->insert(out_->end(), b, b + 4);
        }

        void put_u64(u64 v) {
            u8 b[8];
            put_u64_le(b, v);
            out_->insert(out_->end(), b, b + 8);
        }

        void put_bytes(const u8* data, u64 len) {
            if (len > 0) {
                out_->insert(out_->end(), data, data + len);
            }
        }

        void put_bytes(BufferView v) { put_bytes(v.data, v.len); }

        [[nodiscard]] u64 size() const noexcept { return static_cast<u64>(out_->size()); }

    private:
        std::vector<u8>* out_;
    };

    // Bounds-checked cursor; every getter returns false on truncation and
    // leaves the position untouched.
    class ByteReader {
    public:
        explicit ByteReader(BufferView in) noexcept : in_(in) {}

        [[nodiscard]] bool get_u8(u8* out) noexcept {
            if (remaining() < 1) return false;
            *out = in_.data[pos_];
            pos_ += 1;
            return true;
        }

        [[nodiscard]] bool get_u16(u16* out) noexcept {
            if (remaining() < 2) return false;
            *out = get_u16_le(in_.data + pos_);
            pos_ += 2;
            return true;
        }

        [[nodiscard]] bool get_u32(u32* out) noexcept {
            if (remaining() < 4) return false;
            *out = get_u32_le(in_.data + pos_);
            pos_ += 4;
            return true;
        }

        [[nodiscard]] bool get_u64(u64* out) noexcept {
            if (remaining() < 8) return false;
            *out = get_u64_le(in_.data + pos_);
            pos_ += 8;
            return true;
        }

        [[nodiscard]] bool get_view(u64 len, BufferView* out) noexcept {
            if (remaining() < len) return false;
            *out = BufferView{in_.data + pos_, len};
            pos_ += len;
            return true;
        }

        [[nodiscard]] bool skip(u64 len) noexcept {
            if (remaining() < len) return false;
            pos_ += len;
            return true;
        }

        [[nodiscard]] u64 remaining() const noexcept { return in_.len - pos_; }
        [[nodiscard]] u64 position() const noexcept { return pos_; }

    private:
        BufferView in_;
        u64 pos_{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace zff::codec
