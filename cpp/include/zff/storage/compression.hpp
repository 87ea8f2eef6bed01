#pragma once

#include <vector>

#include "zff/codec/buffer.hpp"
#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"

namespace zff::storage {
    using zff::codec::BufferView;
    using zff::core::CompressionId;

    class Compressor {
    public:
        virtual ~Compressor() = default;

        [[nodiscard]] virtual CompressionId id() const noexcept = 0;

        // Replaces *out with the compressed form of 'in'.
        [[nodiscard]] virtual zff::core::Status compress(BufferView in,
            zff::core::i32 level,
            std::vector<zff::core::u8>* out) const noexcept = 0;

        // Corrupt if the frame is damaged or would exceed max_out bytes.
        [[nodiscard]] virtual zff::core::Status decompress(BufferView in,
            zff::core::u64 max_out,
            std::vector<zff::core::u8>* out) const noexcept = 0;
    };

    class ZstdCompressor final : public Compressor {
    public:
        [[nodiscard]] CompressionId id() const noexcept override { return CompressionId::Zstd; }

        [[nodiscard]] zff::core::Status compress(BufferView in,
            zff::core::i32 level,
            std::vector<zff::core::u8>* out) const noexcept override;

        [[nodiscard]] zff::core::Status decompress(BufferView in,
            zff::core::u64 max_out,
            std::vector<zff::core::u8>* out) const noexcept override;
    };

    // Valid zstd levels for the linked library.
    [[nodiscard]] bool zstd_level_valid(zff::core::i32 level) noexcept;

} // namespace zff::storage
