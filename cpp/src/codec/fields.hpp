#pragma once

// Field helpers shared by the v1 and v2 record codecs.

#include <map>
#include <string>
#include <vector>

#include "zff/codec/model.hpp"
#include "zff/codec/value.hpp"
#include "zff/core/errors.hpp"

namespace zff::codec::detail {

    [[nodiscard]] zff::core::Status unsupported(u64 id, const char* what) noexcept;

    [[nodiscard]] ValueMap encode_compression(const CompressionParams& c);
    [[nodiscard]] zff::core::Status decode_compression(const ValueMap& m, CompressionParams* out) noexcept;

    [[nodiscard]] ValueMap encode_encryption(const EncryptionParams& e);
    [[nodiscard]] zff::core::Status decode_encryption(const ValueMap& m, EncryptionParams* out) noexcept;

    [[nodiscard]] std::vector<u8> encode_hash_list(const std::vector<zff::core::HashId>& hashes);
    [[nodiscard]] zff::core::Status decode_hash_list(const std::vector<u8>& raw,
        std::vector<zff::core::HashId>* out) noexcept;

    // Digests go in two nested maps keyed by hash name: digest and signature.
    void encode_digests(const std::vector<DigestEntry>& d, const char* dig_key, const char* sig_key, ValueMap* m);
    [[nodiscard]] zff::core::Status decode_digests(const ValueMap& m,
        const char* dig_key,
        const char* sig_key,
        std::vector<DigestEntry>* out) noexcept;

    [[nodiscard]] ValueMap encode_segment_table(const std::map<u64, std::string>& segments);
    [[nodiscard]] zff::core::Status decode_segment_table(const ValueMap& m,
        std::map<u64, std::string>* out) noexcept;

    [[nodiscard]] zff::core::Status get_uuid(const ValueMap& m, const char* key, zff::core::Uuid* out) noexcept;

    // Reads an optional key; absent leaves *out untouched.
    [[nodiscard]] zff::core::Status get_opt_u64(const ValueMap& m, const char* key, u64* out) noexcept;
    [[nodiscard]] zff::core::Status get_opt_i64(const ValueMap& m, const char* key, i64* out) noexcept;
    [[nodiscard]] zff::core::Status get_opt_bytes(const ValueMap& m, const char* key, std::vector<u8>* out) noexcept;
    [[nodiscard]] zff::core::Status get_opt_string_map(const ValueMap& m,
        const char* key,
        std::map<std::string, std::string>* out) noexcept;

    // Packed row table stored as a bytes value.
    [[nodiscard]] zff::core::Status get_table(const ValueMap& m,
        const char* key,
        u64 row_bytes,
        std::vector<u8>* raw,
        u64* rows) noexcept;

} // namespace zff::codec::detail
