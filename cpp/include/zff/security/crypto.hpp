#pragma once
#include <cstdint>
#include <type_traits>

#include "zff/codec/buffer.hpp"
#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"
#include "zff/core/types.hpp"

namespace zff::security {
    using u8 = zff::core::u8;
    using u32 = zff::core::u32;
    using u64 = zff::core::u64;
    using zff::codec::BufferMut;
    using zff::codec::BufferView;
    using zff::core::AeadId;

    struct Key256 {
        u8 b[32]{};
    };

    struct Nonce12 {
        u8 b[12]{};
    };

    struct Tag16 {
        u8 b[16]{};
    };

    // ed25519 (libsodium layout: 32 byte seed followed by the public key).
    struct SigningKey {
        u8 b[64]{};
    };

    struct VerifyKey {
        u8 b[32]{};
    };

    struct Signature64 {
        u8 b[64]{};
    };

    inline constexpr u32 kAeadTagBytes = 16;

    // Chunk AAD: chunk_number(u64 LE) | flags(u8).
    inline constexpr u32 kChunkAadBytes = 9;

    // Object record AAD: record kind(u8) | number(u64 LE).
    inline constexpr u32 kRecordAadBytes = 9;

    // Nonce rules: never reuse (key, nonce). Chunk nonces come from
    // derive_chunk_nonce and object keys are unique per object.
    [[nodiscard]] zff::core::Status aead_seal(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept;

    [[nodiscard]] zff::core::Status aead_open(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept;

    // BLAKE3("zff.chunk_nonce.v1" | object_id LE | chunk_number LE), first 12 bytes.
    void derive_chunk_nonce(u64 object_id, u64 chunk_number, Nonce12* out) noexcept;

    void make_chunk_aad(u64 chunk_number, u8 flags, u8 out[kChunkAadBytes]) noexcept;

    // Nonces of sealed file headers, file footers and object footers.
    // BLAKE3("zff.record_nonce.v1" | object_id LE | kind | number LE), first
    // 12 bytes; the label keeps them apart from chunk nonces under the same key.
    void derive_record_nonce(u64 object_id, u8 kind, u64 number, Nonce12* out) noexcept;

    void make_record_aad(u8 kind, u64 number, u8 out[kRecordAadBytes]) noexcept;

    [[nodiscard]] zff::core::Status signing_keypair_generate(SigningKey* sk, VerifyKey* vk) noexcept;
    [[nodiscard]] zff::core::Status signing_keypair_from_seed(const u8 seed[32], SigningKey* sk, VerifyKey* vk) noexcept;
    void verify_key_of(const SigningKey& sk, VerifyKey* out) noexcept;

    [[nodiscard]] zff::core::Status sign_detached(const SigningKey& sk, BufferView msg, Signature64* out) noexcept;

    // SignatureInvalid on mismatch.
    [[nodiscard]] zff::core::Status verify_detached(const VerifyKey& vk, BufferView msg, const Signature64& sig) noexcept;

    [[nodiscard]] zff::core::Status random_bytes(BufferMut out) noexcept;

    // Random (version 4) uuid.
    [[nodiscard]] zff::core::Status generate_uuid(zff::core::Uuid* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Key256>);
    static_assert(std::is_trivially_copyable_v<Nonce12>);
    static_assert(std::is_trivially_copyable_v<Tag16>);
    static_assert(std::is_trivially_copyable_v<SigningKey>);
    static_assert(std::is_trivially_copyable_v<VerifyKey>);
    static_assert(std::is_trivially_copyable_v<Signature64>);

} // namespace zff::security
