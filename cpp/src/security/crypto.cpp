#include "zff/security/crypto.hpp"

#include <cstddef>
#include <cstring>

#include <sodium.h>
#include <openssl/evp.h>

#include <blake3.h>

namespace zff::security {
    namespace {
        [[nodiscard]] bool buffer_ok(BufferView b) noexcept {
            return (b.len == 0) || (b.data != nullptr);
        }

        [[nodiscard]] bool buffer_ok_mut(BufferMut b) noexcept {
            return (b.len == 0) || (b.data != nullptr);
        }

        [[nodiscard]] zff::core::Status invalid() noexcept {
            return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Invalid);
        }

        zff::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unavailable);
            }
            return zff::core::ok_status();
        }

        // OpenSSL lengths are int.
        [[nodiscard]] bool fits_int(u64 v) noexcept {
            return v <= 0x7fffffffu;
        }

        zff::core::Status gcm_seal(const Key256& key,
            const Nonce12& nonce,
            BufferView aad,
            BufferView pt,
            BufferMut ct_out,
            Tag16* tag_out) noexcept {
            if (!fits_int(aad.len) || !fits_int(pt.len)) {
                return invalid();
            }
            EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
            if (!ctx) {
                return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unavailable);
            }

            int ok = 1;
            ok &= EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
            ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, 12, nullptr);
            ok &= EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.b, nonce.b);

            int out_len = 0;
            if (aad.len > 0) {
                ok &= EVP_EncryptUpdate(ctx, nullptr, &out_len, aad.data, static_cast<int>(aad.len));
            }

            int ct_written = 0;
            if (pt.len > 0) {
                ok &= EVP_EncryptUpdate(ctx, ct_out.data, &out_len, pt.data, static_cast<int>(pt.len));
                ct_written += out_len;
            }

            ok &= EVP_EncryptFinal_ex(ctx, ct_out.data + ct_written, &out_len);
            ct_written += out_len;

            ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, 16, tag_out->b);
            EVP_CIPHER_CTX_free(ctx);

            if (!ok || static_cast<u64>(ct_written) != pt.len) {
                return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Unknown);
            }
            return zff::core::ok_status();
        }

        zff::core::Status gcm_open(const Key256& key,
            const Nonce12& nonce,
            BufferView aad,
            BufferView ct,
            const Tag16& tag,
            BufferMut pt_out) noexcept {
            if (!fits_int(aad.len) || !fits_int(ct.len)) {
                return invalid();
            }
            EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
            if (!ctx) {
                return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unavailable);
            }

            int ok = 1;
            ok &= EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
            ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, 12, nullptr);
            ok &= EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.b, nonce.b);

            int out_len = 0;
            if (aad.len > 0) {
                ok &= EVP_DecryptUpdate(ctx, nullptr, &out_len, aad.data, static_cast<int>(aad.len));
            }

            int pt_written = 0;
            if (ct.len > 0) {
                ok &= EVP_DecryptUpdate(ctx, pt_out.data, &out_len, ct.data, static_cast<int>(ct.len));
                pt_written += out_len;
            }

            ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, 16, const_cast<u8*>(tag.b));
            const int final_ok = EVP_DecryptFinal_ex(ctx, pt_out.data + pt_written, &out_len);
            EVP_CIPHER_CTX_free(ctx);

            if (!ok || final_ok <= 0) {
                return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::DecryptError);
            }
            pt_written += out_len;
            if (static_cast<u64>(pt_written) != ct.len) {
                return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::DecryptError);
            }
            return zff::core::ok_status();
        }
    } // namespace

    zff::core::Status aead_seal(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept {
        if (tag_out == nullptr) {
            return invalid();
        }
        if (!buffer_ok(aad) || !buffer_ok(pt) || !buffer_ok_mut(ct_out)) {
            return invalid();
        }
        if (ct_out.len < pt.len) {
            return invalid();
        }

        switch (aead) {
            case AeadId::Aes256Gcm:
                return gcm_seal(key, nonce, aad, pt, ct_out, tag_out);
            case AeadId::ChaCha20Poly1305: {
                const zff::core::Status init = ensure_sodium();
                if (!zff::core::is_ok(init)) {
                    return init;
                }

                unsigned long long mac_len = 0;

                const int rc = crypto_aead_chacha20poly1305_ietf_encrypt_detached(
                    ct_out.data,
                    tag_out->b,
                    &mac_len,
                    pt.data,
                    static_cast<unsigned long long>(pt.len),
                    aad.data,
                    static_cast<unsigned long long>(aad.len),
                    nullptr,
                    nonce.b,
                    key.b);

                if (rc != 0 || mac_len != sizeof(tag_out->b)) {
                    return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Unknown);
                }
                return zff::core::ok_status();
            }
            case AeadId::None:
                break;
        }
        return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::UnsupportedAlgorithm,
            static_cast<u64>(aead));
    }

    zff::core::Status aead_open(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept {
        if (!buffer_ok(aad) || !buffer_ok(ct) || !buffer_ok_mut(pt_out)) {
            return invalid();
        }
        if (pt_out.len < ct.len) {
            return invalid();
        }

        switch (aead) {
            case AeadId::Aes256Gcm:
                return gcm_open(key, nonce, aad, ct, tag, pt_out);
            case AeadId::ChaCha20Poly1305: {
                const zff::core::Status init = ensure_sodium();
                if (!zff::core::is_ok(init)) {
                    return init;
                }

                const int rc = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
                    pt_out.data,
                    nullptr,
                    ct.data,
                    static_cast<unsigned long long>(ct.len),
                    tag.b,
                    aad.data,
                    static_cast<unsigned long long>(aad.len),
                    nonce.b,
                    key.b);

                if (rc != 0) {
                    return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::DecryptError);
                }
                return zff::core::ok_status();
            }
            case AeadId::None:
                break;
        }
        return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::UnsupportedAlgorithm,
            static_cast<u64>(aead));
    }

    void derive_chunk_nonce(u64 object_id, u64 chunk_number, Nonce12* out) noexcept {
        blake3_hasher h;
        blake3_hasher_init(&h);

        static constexpr char kLabel[] = "zff.chunk_nonce.v1";
        blake3_hasher_update(&h, kLabel, sizeof(kLabel) - 1);

        u8 b[8];
        zff::codec::put_u64_le(b, object_id);
        blake3_hasher_update(&h, b, sizeof(b));
        zff::codec::put_u64_le(b, chunk_number);
        blake3_hasher_update(&h, b, sizeof(b));

        blake3_hasher_finalize(&h, out->b, sizeof(out->b));
    }

    void make_chunk_aad(u64 chunk_number, u8 flags, u8 out[kChunkAadBytes]) noexcept {
        zff::codec::put_u64_le(out, chunk_number);
        out[8] = flags;
    }

    void derive_record_nonce(u64 object_id, u8 kind, u64 number, Nonce12* out) noexcept {
        blake3_hasher h;
        blake3_hasher_init(&h);

        static constexpr char kLabel[] = "zff.record_nonce.v1";
        blake3_hasher_update(&h, kLabel, sizeof(kLabel) - 1);

        u8 b[8];
        zff::codec::put_u64_le(b, object_id);
        blake3_hasher_update(&h, b, sizeof(b));
        blake3_hasher_update(&h, &kind, 1);
        zff::codec::put_u64_le(b, number);
        blake3_hasher_update(&h, b, sizeof(b));

        blake3_hasher_finalize(&h, out->b, sizeof(out->b));
    }

    void make_record_aad(u8 kind, u64 number, u8 out[kRecordAadBytes]) noexcept {
        out[0] = kind;
        zff::codec::put_u64_le(out + 1, number);
    }

    zff::core::Status signing_keypair_generate(SigningKey* sk, VerifyKey* vk) noexcept {
        if (sk == nullptr || vk == nullptr) {
            return invalid();
        }
        const zff::core::Status init = ensure_sodium();
        if (!zff::core::is_ok(init)) {
            return init;
        }
        if (crypto_sign_ed25519_keypair(vk->b, sk->b) != 0) {
            return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Unknown);
        }
        return zff::core::ok_status();
    }

    zff::core::Status signing_keypair_from_seed(const u8 seed[32], SigningKey* sk, VerifyKey* vk) noexcept {
        if (seed == nullptr || sk == nullptr || vk == nullptr) {
            return invalid();
        }
        const zff::core::Status init = ensure_sodium();
        if (!zff::core::is_ok(init)) {
            return init;
        }
        if (crypto_sign_ed25519_seed_keypair(vk->b, sk->b, seed) != 0) {
            return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Unknown);
        }
        return zff::core::ok_status();
    }

    void verify_key_of(const SigningKey& sk, VerifyKey* out) noexcept {
        std::memcpy(out->b, sk.b + 32, sizeof(out->b));
    }

    zff::core::Status sign_detached(const SigningKey& sk, BufferView msg, Signature64* out) noexcept {
        if (out == nullptr || !buffer_ok(msg)) {
            return invalid();
        }
        const zff::core::Status init = ensure_sodium();
        if (!zff::core::is_ok(init)) {
            return init;
        }
        unsigned long long sig_len = 0;
        const int rc = crypto_sign_ed25519_detached(out->b, &sig_len, msg.data,
            static_cast<unsigned long long>(msg.len), sk.b);
        if (rc != 0 || sig_len != sizeof(out->b)) {
            return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Unknown);
        }
        return zff::core::ok_status();
    }

    zff::core::Status verify_detached(const VerifyKey& vk, BufferView msg, const Signature64& sig) noexcept {
        if (!buffer_ok(msg)) {
            return invalid();
        }
        const zff::core::Status init = ensure_sodium();
        if (!zff::core::is_ok(init)) {
            return init;
        }
        const int rc = crypto_sign_ed25519_verify_detached(sig.b, msg.data,
            static_cast<unsigned long long>(msg.len), vk.b);
        if (rc != 0) {
            return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::SignatureInvalid);
        }
        return zff::core::ok_status();
    }

    zff::core::Status random_bytes(BufferMut out) noexcept {
        if (!buffer_ok_mut(out)) {
            return invalid();
        }
        const zff::core::Status init = ensure_sodium();
        if (!zff::core::is_ok(init)) {
            return init;
        }
        if (out.len > 0) {
            randombytes_buf(out.data, static_cast<size_t>(out.len));
        }
        return zff::core::ok_status();
    }

    zff::core::Status generate_uuid(zff::core::Uuid* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        const zff::core::Status s = random_bytes(BufferMut{out->b.data(), out->b.size()});
        if (!zff::core::is_ok(s)) {
            return s;
        }
        out->b[6] = static_cast<u8>((out->b[6] & 0x0fu) | 0x40u);
        out->b[8] = static_cast<u8>((out->b[8] & 0x3fu) | 0x80u);
        return zff::core::ok_status();
    }
} // namespace zff::security
