#pragma once

#include <memory>
#include <vector>

#include "zff/codec/buffer.hpp"
#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"

namespace zff::storage {
    using u8 = zff::core::u8;
    using u32 = zff::core::u32;
    using u64 = zff::core::u64;
    using zff::codec::BufferMut;
    using zff::codec::BufferView;
    using zff::core::HashId;

    // Streaming digest. init() may be called again to reuse the instance.
    class Hasher {
    public:
        virtual ~Hasher() = default;

        [[nodiscard]] virtual HashId id() const noexcept = 0;
        [[nodiscard]] virtual u32 digest_size() const noexcept = 0;
        [[nodiscard]] virtual zff::core::Status init() noexcept = 0;
        [[nodiscard]] virtual zff::core::Status update(BufferView data) noexcept = 0;
        [[nodiscard]] virtual zff::core::Status finalize(std::vector<u8>* out) noexcept = 0;
    };

    // UnsupportedAlgorithm for ids this build cannot hash with.
    [[nodiscard]] zff::core::Status make_hasher(HashId id, std::unique_ptr<Hasher>* out) noexcept;

    [[nodiscard]] zff::core::Status hash_compute(HashId id, BufferView data, std::vector<u8>* out) noexcept;

    // IEEE CRC32 (zlib polynomial); crc32_update chains from a previous value.
    [[nodiscard]] u32 crc32_ieee(BufferView data) noexcept;
    [[nodiscard]] u32 crc32_update(u32 crc, BufferView data) noexcept;

    [[nodiscard]] constexpr bool digest_is_zero(const std::vector<u8>& d) noexcept {
        for (u8 b : d) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

} // namespace zff::storage
