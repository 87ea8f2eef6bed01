#include "zff/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>
#include <openssl/evp.h>
#include <zlib.h>

namespace zff::storage {
    namespace {
        [[nodiscard]] zff::core::Status invalid() noexcept {
            return zff::core::make_status(zff::core::StatusDomain::Storage, zff::core::StatusCode::Invalid);
        }

        [[nodiscard]] zff::core::Status backend_failure() noexcept {
            return zff::core::make_status(zff::core::StatusDomain::External, zff::core::StatusCode::Unavailable);
        }

        class EvpHasher final : public Hasher {
        public:
            EvpHasher(HashId id, const EVP_MD* md) noexcept : id_(id), md_(md), ctx_(EVP_MD_CTX_new()) {}
            ~EvpHasher() override { EVP_MD_CTX_free(ctx_); }

            EvpHasher(const EvpHasher&) = delete;
            EvpHasher& operator=(const EvpHasher&) = delete;

            HashId id() const noexcept override { return id_; }
            u32 digest_size() const noexcept override { return static_cast<u32>(EVP_MD_size(md_)); }

            zff::core::Status init() noexcept override {
                if (ctx_ == nullptr || md_ == nullptr) return backend_failure();
                if (EVP_DigestInit_ex(ctx_, md_, nullptr) != 1) return backend_failure();
                return zff::core::ok_status();
            }

            zff::core::Status update(BufferView data) noexcept override {
                if (data.len > 0 && data.data == nullptr) return invalid();
                if (data.len == 0) return zff::core::ok_status();
                if (EVP_DigestUpdate(ctx_, data.data, static_cast<size_t>(data.len)) != 1) return backend_failure();
                return zff::core::ok_status();
            }

            zff::core::Status finalize(std::vector<u8>* out) noexcept override {
                if (out == nullptr) return invalid();
                u8 buf[EVP_MAX_MD_SIZE];
                unsigned int len = 0;
                if (EVP_DigestFinal_ex(ctx_, buf, &len) != 1) return backend_failure();
                out->assign(buf, buf + len);
                return zff::core::ok_status();
            }

        private:
            HashId id_;
            const EVP_MD* md_;
            EVP_MD_CTX* ctx_;
        };

        class Blake3Hasher final : public Hasher {
        public:
            HashId id() const noexcept override { return HashId::Blake3; }
            u32 digest_size() const noexcept override { return BLAKE3_OUT_LEN; }

            zff::core::Status init() noexcept override {
                blake3_hasher_init(&hasher_);
                return zff::core::ok_status();
            }

            zff::core::Status update(BufferView data) noexcept override {
                if (data.len > 0 && data.data == nullptr) return invalid();
                if (data.len > 0) {
                    blake3_hasher_update(&hasher_, data.data, static_cast<size_t>(data.len));
                }
                return zff::core::ok_status();
            }

            zff::core::Status finalize(std::vector<u8>* out) noexcept override {
                if (out == nullptr) return invalid();
                out->resize(BLAKE3_OUT_LEN);
                blake3_hasher_finalize(&hasher_, out->data(), out->size());
                return zff::core::ok_status();
            }

        private:
            blake3_hasher hasher_{};
        };

        const EVP_MD* evp_for(HashId id) noexcept {
            switch (id) {
                case HashId::Blake2b512: return EVP_blake2b512();
                case HashId::Sha256: return EVP_sha256();
                case HashId::Sha512: return EVP_sha512();
                case HashId::Sha3_256: return EVP_sha3_256();
                case HashId::Blake3: return nullptr;
            }
            return nullptr;
        }
    } // namespace

    zff::core::Status make_hasher(HashId id, std::unique_ptr<Hasher>* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        std::unique_ptr<Hasher> h;
        if (id == HashId::Blake3) {
            h = std::make_unique<Blake3Hasher>();
        } else {
            const EVP_MD* md = evp_for(id);
            if (md == nullptr) {
                return zff::core::make_status(zff::core::StatusDomain::Storage,
                    zff::core::StatusCode::UnsupportedAlgorithm, static_cast<u64>(id));
            }
            h = std::make_unique<EvpHasher>(id, md);
        }
        const zff::core::Status s = h->init();
        if (!zff::core::is_ok(s)) {
            return s;
        }
        *out = std::move(h);
        return zff::core::ok_status();
    }

    zff::core::Status hash_compute(HashId id, BufferView data, std::vector<u8>* out) noexcept {
        if (out == nullptr) {
            return invalid();
        }
        if (data.len > 0 && data.data == nullptr) {
            return invalid();
        }

        std::unique_ptr<Hasher> h;
        zff::core::Status s = make_hasher(id, &h);
        if (!zff::core::is_ok(s)) return s;
        s = h->update(data);
        if (!zff::core::is_ok(s)) return s;
        return h->finalize(out);
    }

    u32 crc32_update(u32 crc, BufferView data) noexcept {
        uLong c = crc;
        const u8* p = data.data;
        u64 left = data.len;
        // zlib takes uInt lengths.
        while (left > 0) {
            const uInt n = left > 0x40000000u ? 0x40000000u : static_cast<uInt>(left);
            c = ::crc32(c, p, n);
            p += n;
            left -= n;
        }
        return static_cast<u32>(c);
    }

    u32 crc32_ieee(BufferView data) noexcept {
        return crc32_update(0, data);
    }
} // namespace zff::storage
