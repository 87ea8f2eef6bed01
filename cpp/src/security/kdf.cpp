#include "zff/security/kdf.hpp"

#include <cstddef>

#include <blake3.h>
#include <openssl/evp.h>
#include <sodium.h>

namespace zff::security {
    namespace {
        [[nodiscard]] bool buffer_ok(BufferView b) noexcept {
            return (b.len == 0) || (b.data != nullptr);
        }

        [[nodiscard]] zff::core::Status invalid(const char* what = nullptr) noexcept {
            return zff::core::make_status(zff::core::StatusDomain::Security, zff::core::StatusCode::Invalid, 0, what);
        }

        void hasher_update_u64_le(blake3_hasher* h, u64 v) noexcept {
            u8 b[8];
            zff::codec::put_u64_le(b, v);
            blake3_hasher_update(h, b, sizeof(b));
        }

        void hasher_update_lenprefixed(blake3_hasher* h, BufferView b) noexcept {
            hasher_update_u64_le(h, b.len);
            if (b.len > 0) {
                blake3_hasher_update(h, b.data, static_cast<size_t>(b.len));
            }
        }

        zff::core::Status pbkdf2(const KdfParams& p, const std::string& password, Key256* out) noexcept {
            if (p.iterations == 0 || p.iterations > 0x7fffffffu) {
                return invalid("pbkdf2 iterations");
            }
            const int rc = PKCS5_PBKDF2_HMAC(password.data(),
                static_cast<int>(password.size()),
                p.salt.data(),
                static_cast<int>(p.salt.size()),
                static_cast<int>(p.iterations),
                EVP_sha256(),
                static_cast<int>(sizeof(out->b)),
                out->b);
            if (rc != 1) {
                return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unknown);
            }
            return zff::core::ok_status();
        }

        zff::core::Status scrypt(const KdfParams& p, const std::string& password, Key256* out) noexcept {
            if (p.log_n == 0 || p.log_n > 30 || p.r == 0 || p.p == 0) {
                return invalid("scrypt parameters");
            }
            const u64 n = u64{1} << p.log_n;
            // 128 * r * N bytes of working memory plus slack.
            const u64 maxmem = 128ull * p.r * n + (32ull << 20);
            const int rc = EVP_PBE_scrypt(password.data(),
                password.size(),
                p.salt.data(),
                p.salt.size(),
                n,
                p.r,
                p.p,
                maxmem,
                out->b,
                sizeof(out->b));
            if (rc != 1) {
                return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unknown);
            }
            return zff::core::ok_status();
        }

        zff::core::Status argon2id(const KdfParams& p, const std::string& password, Key256* out) noexcept {
            if (sodium_init() < 0) {
                return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unavailable);
            }
            // libsodium runs argon2id with a single lane and a 16 byte salt.
            if (p.salt.size() != crypto_pwhash_SALTBYTES || p.lanes != 1) {
                return invalid("argon2 salt or lanes");
            }
            if (p.iterations < crypto_pwhash_OPSLIMIT_MIN || p.memory_kib == 0) {
                return invalid("argon2 cost");
            }
            const int rc = crypto_pwhash(out->b,
                sizeof(out->b),
                password.data(),
                password.size(),
                p.salt.data(),
                p.iterations,
                static_cast<size_t>(p.memory_kib) * 1024u,
                crypto_pwhash_ALG_ARGON2ID13);
            if (rc != 0) {
                return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unavailable);
            }
            return zff::core::ok_status();
        }
    } // namespace

    zff::core::Status hkdf_expand(const Key256& ikm,
        BufferView salt,
        BufferView info,
        Key256* out_key) noexcept {
        if (out_key == nullptr) {
            return invalid();
        }
        if (!buffer_ok(salt) || !buffer_ok(info)) {
            return invalid();
        }

        blake3_hasher h;
        blake3_hasher_init_keyed(&h, ikm.b);

        static constexpr char kLabel[] = "zff.kdf.expand.v1";
        blake3_hasher_update(&h, kLabel, sizeof(kLabel) - 1);

        hasher_update_lenprefixed(&h, salt);
        hasher_update_lenprefixed(&h, info);

        blake3_hasher_finalize(&h, out_key->b, sizeof(out_key->b));
        return zff::core::ok_status();
    }

    zff::core::Status default_kdf_params(KdfId kdf, KdfParams* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        KdfParams p{};
        p.kdf = kdf;
        switch (kdf) {
            case KdfId::None:
                *out = p;
                return zff::core::ok_status();
            case KdfId::Pbkdf2Sha256:
                p.iterations = 310000;
                break;
            case KdfId::Scrypt:
                p.log_n = 15;
                p.r = 8;
                p.p = 1;
                break;
            case KdfId::Argon2id:
                p.iterations = static_cast<u32>(crypto_pwhash_OPSLIMIT_INTERACTIVE);
                p.memory_kib = static_cast<u32>(crypto_pwhash_MEMLIMIT_INTERACTIVE / 1024u);
                p.lanes = 1;
                break;
        }
        p.salt.resize(kKdfSaltBytes);
        const zff::core::Status s = random_bytes(BufferMut{p.salt.data(), p.salt.size()});
        if (!zff::core::is_ok(s)) {
            return s;
        }
        *out = std::move(p);
        return zff::core::ok_status();
    }

    zff::core::Status derive_password_key(const KdfParams& params,
        const std::string& password,
        Key256* out_key) noexcept {
        if (out_key == nullptr) {
            return invalid();
        }
        switch (params.kdf) {
            case KdfId::Pbkdf2Sha256: return pbkdf2(params, password, out_key);
            case KdfId::Scrypt: return scrypt(params, password, out_key);
            case KdfId::Argon2id: return argon2id(params, password, out_key);
            case KdfId::None: break;
        }
        return invalid("no kdf configured");
    }

    zff::core::Status derive_object_key(const Key256& master,
        zff::core::u64 object_id,
        Key256* out_key) noexcept {
        static constexpr char kSalt[] = "zff.object_key.v1";
        u8 info[8];
        zff::codec::put_u64_le(info, object_id);
        return hkdf_expand(master,
            BufferView{reinterpret_cast<const u8*>(kSalt), sizeof(kSalt) - 1},
            BufferView{info, sizeof(info)},
            out_key);
    }
} // namespace zff::security
