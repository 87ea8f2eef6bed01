#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"
#include "zff/security/crypto.hpp"
#include "zff/security/kdf.hpp"
#include "zff/storage/compression.hpp"
#include "zff/storage/hashing.hpp"

namespace zff::storage {

    // Appends ciphertext||tag; open strips and checks the tag.
    class Aead {
    public:
        virtual ~Aead() = default;
        [[nodiscard]] virtual zff::core::AeadId id() const noexcept = 0;
        [[nodiscard]] virtual zff::core::Status seal(const security::Key256& key,
            const security::Nonce12& nonce,
            BufferView aad,
            BufferView pt,
            std::vector<u8>* out) const noexcept = 0;
        [[nodiscard]] virtual zff::core::Status open(const security::Key256& key,
            const security::Nonce12& nonce,
            BufferView aad,
            BufferView ct,
            std::vector<u8>* out) const noexcept = 0;
    };

    class Kdf {
    public:
        virtual ~Kdf() = default;
        [[nodiscard]] virtual zff::core::KdfId id() const noexcept = 0;
        [[nodiscard]] virtual zff::core::Status derive(const zff::core::KdfParams& params,
            const std::string& password,
            security::Key256* out) const noexcept = 0;
    };

    class Signer {
    public:
        virtual ~Signer() = default;
        [[nodiscard]] virtual zff::core::Status sign(BufferView msg, security::Signature64* out) const noexcept = 0;
        [[nodiscard]] virtual zff::core::Status verify(BufferView msg,
            const security::Signature64& sig) const noexcept = 0;
        [[nodiscard]] virtual security::VerifyKey verify_key() const noexcept = 0;
    };

    // ed25519 via libsodium. A verify-only instance refuses to sign.
    class Ed25519Signer final : public Signer {
    public:
        explicit Ed25519Signer(const security::SigningKey& sk) noexcept;
        explicit Ed25519Signer(const security::VerifyKey& vk) noexcept;

        [[nodiscard]] zff::core::Status sign(BufferView msg, security::Signature64* out) const noexcept override;
        [[nodiscard]] zff::core::Status verify(BufferView msg,
            const security::Signature64& sig) const noexcept override;
        [[nodiscard]] security::VerifyKey verify_key() const noexcept override { return vk_; }

    private:
        bool can_sign_{false};
        security::SigningKey sk_{};
        security::VerifyKey vk_{};
    };

    using HasherFactory = std::function<zff::core::Status(std::unique_ptr<Hasher>*)>;

    // Per-session table of algorithm implementations keyed by wire id.
    // Lookups of unregistered ids fail UnsupportedAlgorithm.
    class AlgorithmRegistry {
    public:
        // zstd, every HashId, AES-256-GCM, ChaCha20-Poly1305, PBKDF2, scrypt, argon2id.
        [[nodiscard]] static std::shared_ptr<const AlgorithmRegistry> defaults();

        void register_compressor(std::shared_ptr<const Compressor> c);
        void register_hasher(HashId id, HasherFactory factory);
        void register_aead(std::shared_ptr<const Aead> a);
        void register_kdf(std::shared_ptr<const Kdf> k);

        [[nodiscard]] zff::core::Status compressor(CompressionId id, const Compressor** out) const noexcept;
        [[nodiscard]] zff::core::Status make_hasher(HashId id, std::unique_ptr<Hasher>* out) const noexcept;
        [[nodiscard]] zff::core::Status aead(zff::core::AeadId id, const Aead** out) const noexcept;
        [[nodiscard]] zff::core::Status kdf(zff::core::KdfId id, const Kdf** out) const noexcept;

    private:
        std::map<CompressionId, std::shared_ptr<const Compressor>> compressors_;
        std::map<HashId, HasherFactory> hashers_;
        std::map<zff::core::AeadId, std::shared_ptr<const Aead>> aeads_;
        std::map<zff::core::KdfId, std::shared_ptr<const Kdf>> kdfs_;
    };

} // namespace zff::storage
