#include "zff/storage/registry.hpp"

#include <cstring>

namespace zff::storage {
    namespace {
        using zff::core::AeadId;
        using zff::core::KdfId;
        using zff::core::Status;

        [[nodiscard]] Status unsupported(u64 id, const char* what) noexcept {
            return zff::core::make_status(zff::core::StatusDomain::Storage, zff::core::StatusCode::UnsupportedAlgorithm,
                id, what);
        }

        class LibraryAead final : public Aead {
        public:
            explicit LibraryAead(AeadId id) noexcept : id_(id) {}

            AeadId id() const noexcept override { return id_; }

            Status seal(const security::Key256& key,
                const security::Nonce12& nonce,
                BufferView aad,
                BufferView pt,
                std::vector<u8>* out) const noexcept override {
                out->resize(static_cast<size_t>(pt.len) + security::kAeadTagBytes);
                security::Tag16 tag{};
                const Status s = security::aead_seal(id_, key, nonce, aad, pt, BufferMut{out->data(), pt.len}, &tag);
                if (!zff::core::is_ok(s)) {
                    out->clear();
                    return s;
                }
                std::memcpy(out->data() + pt.len, tag.b, sizeof(tag.b));
                return zff::core::ok_status();
            }

            Status open(const security::Key256& key,
                const security::Nonce12& nonce,
                BufferView aad,
                BufferView ct,
                std::vector<u8>* out) const noexcept override {
                if (ct.len < security::kAeadTagBytes) {
                    return zff::core::make_status(zff::core::StatusDomain::Security,
                        zff::core::StatusCode::DecryptError);
                }
                const u64 body = ct.len - security::kAeadTagBytes;
                security::Tag16 tag{};
                std::memcpy(tag.b, ct.data + body, sizeof(tag.b));
                out->resize(static_cast<size_t>(body));
                const Status s = security::aead_open(id_, key, nonce, aad, BufferView{ct.data, body}, tag,
                    BufferMut{out->data(), body});
                if (!zff::core::is_ok(s)) {
                    out->clear();
                }
                return s;
            }

        private:
            AeadId id_;
        };

        class LibraryKdf final : public Kdf {
        public:
            explicit LibraryKdf(KdfId id) noexcept : id_(id) {}

            KdfId id() const noexcept override { return id_; }

            Status derive(const zff::core::KdfParams& params,
                const std::string& password,
                security::Key256* out) const noexcept override {
                if (params.kdf != id_) {
                    return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Invalid);
                }
                return security::derive_password_key(params, password, out);
            }

        private:
            KdfId id_;
        };
    } // namespace

    Ed25519Signer::Ed25519Signer(const security::SigningKey& sk) noexcept : can_sign_(true), sk_(sk) {
        security::verify_key_of(sk_, &vk_);
    }

    Ed25519Signer::Ed25519Signer(const security::VerifyKey& vk) noexcept : vk_(vk) {}

    Status Ed25519Signer::sign(BufferView msg, security::Signature64* out) const noexcept {
        if (!can_sign_) {
            return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Invalid, 0,
                "verify-only key");
        }
        return security::sign_detached(sk_, msg, out);
    }

    Status Ed25519Signer::verify(BufferView msg, const security::Signature64& sig) const noexcept {
        return security::verify_detached(vk_, msg, sig);
    }

    std::shared_ptr<const AlgorithmRegistry> AlgorithmRegistry::defaults() {
        auto r = std::make_shared<AlgorithmRegistry>();
        r->register_compressor(std::make_shared<ZstdCompressor>());
        for (u8 i = 0; i <= static_cast<u8>(HashId::Blake3); ++i) {
            const HashId id = static_cast<HashId>(i);
            r->register_hasher(id, [id](std::unique_ptr<Hasher>* out) { return storage::make_hasher(id, out); });
        }
        r->register_aead(std::make_shared<LibraryAead>(AeadId::Aes256Gcm));
        r->register_aead(std::make_shared<LibraryAead>(AeadId::ChaCha20Poly1305));
        r->register_kdf(std::make_shared<LibraryKdf>(KdfId::Pbkdf2Sha256));
        r->register_kdf(std::make_shared<LibraryKdf>(KdfId::Scrypt));
        r->register_kdf(std::make_shared<LibraryKdf>(KdfId::Argon2id));
        return r;
    }

    void AlgorithmRegistry::register_compressor(std::shared_ptr<const Compressor> c) {
        const CompressionId id = c->id();
        compressors_[id] = std::move(c);
    }

    void AlgorithmRegistry::register_hasher(HashId id, HasherFactory factory) {
        hashers_[id] = std::move(factory);
    }

    void AlgorithmRegistry::register_aead(std::shared_ptr<const Aead> a) {
        const AeadId id = a->id();
        aeads_[id] = std::move(a);
    }

    void AlgorithmRegistry::register_kdf(std::shared_ptr<const Kdf> k) {
        const KdfId id = k->id();
        kdfs_[id] = std::move(k);
    }

    Status AlgorithmRegistry::compressor(CompressionId id, const Compressor** out) const noexcept {
        const auto it = compressors_.find(id);
        if (it == compressors_.end()) return unsupported(static_cast<u64>(id), "compression");
        *out = it->second.get();
        return zff::core::ok_status();
    }

    Status AlgorithmRegistry::make_hasher(HashId id, std::unique_ptr<Hasher>* out) const noexcept {
        const auto it = hashers_.find(id);
        if (it == hashers_.end()) return unsupported(static_cast<u64>(id), "hash");
        return it->second(out);
    }

    Status AlgorithmRegistry::aead(AeadId id, const Aead** out) const noexcept {
        const auto it = aeads_.find(id);
        if (it == aeads_.end()) return unsupported(static_cast<u64>(id), "aead");
        *out = it->second.get();
        return zff::core::ok_status();
    }

    Status AlgorithmRegistry::kdf(KdfId id, const Kdf** out) const noexcept {
        const auto it = kdfs_.find(id);
        if (it == kdfs_.end()) return unsupported(static_cast<u64>(id), "kdf");
        *out = it->second.get();
        return zff::core::ok_status();
    }

} // namespace zff::storage
