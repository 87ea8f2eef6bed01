#pragma once

#include <string>
#include <type_traits>

#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"
#include "zff/security/crypto.hpp"

namespace zff::security {
    using zff::core::KdfId;
    using zff::core::KdfParams;

    inline constexpr u32 kKdfSaltBytes = 16;

    // Keyed BLAKE3 expansion (domain-separated, no allocations).
    [[nodiscard]] zff::core::Status hkdf_expand(const Key256& ikm,
        BufferView salt,
        BufferView info,
        Key256* out_key) noexcept;

    // Parameters with a fresh random salt. Costs follow the libraries'
    // interactive presets.
    [[nodiscard]] zff::core::Status default_kdf_params(KdfId kdf, KdfParams* out) noexcept;

    // Invalid for KdfId::None or out-of-range parameters.
    [[nodiscard]] zff::core::Status derive_password_key(const KdfParams& params,
        const std::string& password,
        Key256* out_key) noexcept;

    // Per object chunk key from the container level key.
    [[nodiscard]] zff::core::Status derive_object_key(const Key256& master,
        zff::core::u64 object_id,
        Key256* out_key) noexcept;

} // namespace zff::security
