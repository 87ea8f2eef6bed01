#pragma once

#include <cstring>
#include <vector>

#include "zff/core/types.hpp"

namespace zff::core {

    // Wire identifiers. Values are persisted in headers and must never change.
    enum class CompressionId : u8 {
        None = 0,
        Zstd = 1,
    };

    enum class HashId : u8 {
        Blake2b512 = 0,
        Sha256 = 1,
        Sha512 = 2,
        Sha3_256 = 3,
        Blake3 = 4,
    };

    enum class AeadId : u8 {
        None = 0,
        Aes256Gcm = 1,
        ChaCha20Poly1305 = 2,
    };

    enum class KdfId : u8 {
        None = 0,
        Pbkdf2Sha256 = 1,
        Scrypt = 2,
        Argon2id = 3,
    };

    enum class FormatVersion : u8 {
        V1 = 1,
        V2 = 2,
    };

    enum class ObjectKind : u8 {
        Physical = 1,
        Logical = 2,
        Virtual = 3,
    };

    enum class FileType : u8 {
        File = 1,
        Directory = 2,
        Symlink = 3,
        Hardlink = 4,
        Special = 5,
    };

    // Password based key derivation parameters as stored in object headers.
    // Unused fields stay zero for the selected kdf.
    struct KdfParams {
        KdfId kdf{KdfId::None};
        std::vector<u8> salt;
        u32 iterations{0};  // pbkdf2 rounds, argon2 time cost
        u8 log_n{0};        // scrypt
        u32 r{0};           // scrypt
        u32 p{0};           // scrypt
        u32 memory_kib{0};  // argon2
        u32 lanes{0};       // argon2
    };

    [[nodiscard]] constexpr bool format_version_known(u8 v) noexcept {
        return v == static_cast<u8>(FormatVersion::V1) || v == static_cast<u8>(FormatVersion::V2);
    }

    [[nodiscard]] constexpr bool compression_id_known(u8 v) noexcept {
        return v <= static_cast<u8>(CompressionId::Zstd);
    }

    [[nodiscard]] constexpr bool hash_id_known(u8 v) noexcept {
        return v <= static_cast<u8>(HashId::Blake3);
    }

    [[nodiscard]] constexpr bool aead_id_known(u8 v) noexcept {
        return v <= static_cast<u8>(AeadId::ChaCha20Poly1305);
    }

    [[nodiscard]] constexpr bool kdf_id_known(u8 v) noexcept {
        return v <= static_cast<u8>(KdfId::Argon2id);
    }

    [[nodiscard]] constexpr bool object_kind_known(u8 v) noexcept {
        return v >= static_cast<u8>(ObjectKind::Physical) && v <= static_cast<u8>(ObjectKind::Virtual);
    }

    [[nodiscard]] constexpr bool file_type_known(u8 v) noexcept {
        return v >= static_cast<u8>(FileType::File) && v <= static_cast<u8>(FileType::Special);
    }

    [[nodiscard]] constexpr const char* hash_name(HashId id) noexcept {
        switch (id) {
            case HashId::Blake2b512: return "blake2b-512";
            case HashId::Sha256: return "sha256";
            case HashId::Sha512: return "sha512";
            case HashId::Sha3_256: return "sha3-256";
            case HashId::Blake3: return "blake3";
        }
        return "unknown";
    }

    [[nodiscard]] inline bool hash_from_name(const char* name, HashId* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (u8 i = 0; i <= static_cast<u8>(HashId::Blake3); ++i) {
            const HashId id = static_cast<HashId>(i);
            if (std::strcmp(name, hash_name(id)) == 0) {
                *out = id;
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] constexpr const char* compression_name(CompressionId id) noexcept {
        switch (id) {
            case CompressionId::None: return "none";
            case CompressionId::Zstd: return "zstd";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* aead_name(AeadId id) noexcept {
        switch (id) {
            case AeadId::None: return "none";
            case AeadId::Aes256Gcm: return "aes256-gcm";
            case AeadId::ChaCha20Poly1305: return "chacha20-poly1305";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* kdf_name(KdfId id) noexcept {
        switch (id) {
            case KdfId::None: return "none";
            case KdfId::Pbkdf2Sha256: return "pbkdf2-sha256";
            case KdfId::Scrypt: return "scrypt";
            case KdfId::Argon2id: return "argon2id";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* object_kind_name(ObjectKind k) noexcept {
        switch (k) {
            case ObjectKind::Physical: return "physical";
            case ObjectKind::Logical: return "logical";
            case ObjectKind::Virtual: return "virtual";
        }
        return "unknown";
    }

    [[nodiscard]] constexpr const char* file_type_name(FileType t) noexcept {
        switch (t) {
            case FileType::File: return "file";
            case FileType::Directory: return "directory";
            case FileType::Symlink: return "symlink";
            case FileType::Hardlink: return "hardlink";
            case FileType::Special: return "special";
        }
        return "unknown";
    }

} // namespace zff::core
