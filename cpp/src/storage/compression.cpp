#include "zff/storage/compression.hpp"

#include <zstd.h>

namespace zff::storage {
    using zff::core::i32;
    using zff::core::u64;
    using zff::core::u8;

    bool zstd_level_valid(i32 level) noexcept {
        return level >= ZSTD_minCLevel() && level <= ZSTD_maxCLevel();
    }

    zff::core::Status ZstdCompressor::compress(BufferView in, i32 level, std::vector<u8>* out) const noexcept {
        if (out == nullptr || (in.len > 0 && in.data == nullptr)) {
            return zff::core::make_status(zff::core::StatusDomain::Storage, zff::core::StatusCode::Invalid);
        }
        const size_t bound = ZSTD_compressBound(static_cast<size_t>(in.len));
        out->resize(bound);
        const size_t n = ZSTD_compress(out->data(), bound, in.data, static_cast<size_t>(in.len), level);
        if (ZSTD_isError(n)) {
            out->clear();
            return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unknown, 0,
                ZSTD_getErrorName(n));
        }
        out->resize(n);
        return zff::core::ok_status();
    }

    zff::core::Status ZstdCompressor::decompress(BufferView in, u64 max_out, std::vector<u8>* out) const noexcept {
        if (out == nullptr || (in.len > 0 && in.data == nullptr)) {
            return zff::core::make_status(zff::core::StatusDomain::Storage, zff::core::StatusCode::Invalid);
        }
        const unsigned long long declared = ZSTD_getFrameContentSize(in.data, static_cast<size_t>(in.len));
        if (declared == ZSTD_CONTENTSIZE_ERROR) {
            return zff::core::make_status(zff::core::StatusDomain::Storage, zff::core::StatusCode::Corrupt, 0,
                "zstd frame");
        }
        if (declared != ZSTD_CONTENTSIZE_UNKNOWN && declared > max_out) {
            return zff::core::make_status(zff::core::StatusDomain::Storage, zff::core::StatusCode::Corrupt, declared,
                "zstd frame too large");
        }

        out->resize(static_cast<size_t>(max_out));
        const size_t n = ZSTD_decompress(out->data(), out->size(), in.data, static_cast<size_t>(in.len));
        if (ZSTD_isError(n)) {
            out->clear();
            return zff::core::make_status(zff::core::StatusDomain::Storage, zff::core::StatusCode::Corrupt, 0,
                ZSTD_getErrorName(n));
        }
        out->resize(n);
        return zff::core::ok_status();
    }

} // namespace zff::storage
