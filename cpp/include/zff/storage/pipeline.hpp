#pragma once

#include <memory>
#include <vector>

#include "zff/codec/model.hpp"
#include "zff/codec/record.hpp"
#include "zff/core/errors.hpp"
#include "zff/security/crypto.hpp"
#include "zff/security/keyring.hpp"
#include "zff/storage/registry.hpp"

namespace zff::storage {

    // Everything needed to transform the chunks of one object.
    struct ChunkCodecConfig {
        u64 object_id{0};
        u64 chunk_size{zff::core::kDefaultChunkSize};
        codec::CompressionParams compression;
        zff::core::AeadId aead{zff::core::AeadId::None};
        security::Key256 key{};
        bool detect_same_bytes{false};
        const Signer* signer{nullptr};   // signs on encode, verifies on decode
        bool verify_signatures{true};
    };

    struct EncodedChunk {
        codec::ChunkHeader header;
        std::vector<u8> payload;
    };

    // Per chunk transform in both directions.
    //
    // encode: empty / same-bytes detection, compression (kept only when it
    // shrinks the chunk and meets the ratio threshold), AEAD with a nonce
    // derived from (object id, chunk number) and AAD = chunk number | flags,
    // CRC32 of the stored bytes, optional ed25519 signature of those bytes.
    //
    // decode runs the checks in reverse: signature (SignatureInvalid), CRC
    // (Corrupt), decryption (DecryptError), decompression, expansion.
    // Failures carry the chunk number in aux.
    class ChunkCodec {
    public:
        ChunkCodec(std::shared_ptr<const AlgorithmRegistry> registry, const ChunkCodecConfig& cfg);

        // Resolves the configured algorithms; UnsupportedAlgorithm otherwise.
        [[nodiscard]] zff::core::Status prepare() noexcept;

        [[nodiscard]] zff::core::Status encode(u64 chunk_number, BufferView raw, EncodedChunk* out) noexcept;

        // raw_len is the expected decoded length. With exact == false the
        // decoded chunk may be shorter (used when the length is unknown).
        [[nodiscard]] zff::core::Status decode(const codec::ChunkHeader& h,
            BufferView payload,
            u64 raw_len,
            bool exact,
            std::vector<u8>* out) const noexcept;

        // File headers, file footers (number = file number) and the object
        // footer (number = 0) of an encrypted object, sealed with the chunk
        // key under record nonces. open_record fails with DecryptError and
        // the number in aux.
        [[nodiscard]] zff::core::Status seal_record(codec::RecordKind kind,
            u64 number,
            BufferView plain,
            std::vector<u8>* out) const noexcept;
        [[nodiscard]] zff::core::Status open_record(codec::RecordKind kind,
            u64 number,
            BufferView sealed,
            std::vector<u8>* out) const noexcept;

        [[nodiscard]] bool encrypted() const noexcept { return aead_ != nullptr; }
        [[nodiscard]] const ChunkCodecConfig& config() const noexcept { return cfg_; }

    private:
        std::shared_ptr<const AlgorithmRegistry> registry_;
        ChunkCodecConfig cfg_;
        const Compressor* compressor_{nullptr};
        const Aead* aead_{nullptr};
        std::vector<u8> scratch_;
    };

    // The configured set of digests over one byte stream.
    class HashSet {
    public:
        [[nodiscard]] zff::core::Status init(const AlgorithmRegistry& registry,
            const std::vector<HashId>& hashes) noexcept;
        [[nodiscard]] zff::core::Status update(BufferView data) noexcept;
        [[nodiscard]] zff::core::Status finalize(std::vector<codec::DigestEntry>* out) noexcept;
        [[nodiscard]] bool empty() const noexcept { return hashers_.empty(); }

    private:
        std::vector<std::unique_ptr<Hasher>> hashers_;
    };

    // Destination of encoded chunks. Numbers come from the container so they
    // stay dense across objects.
    class ChunkSink {
    public:
        virtual ~ChunkSink() = default;
        [[nodiscard]] virtual zff::core::Status allocate_chunk_number(u64* out) noexcept = 0;
        [[nodiscard]] virtual zff::core::Status store_chunk(const EncodedChunk& chunk) noexcept = 0;
    };

    struct StreamSummary {
        u64 first_chunk{0};
        u64 chunk_count{0};
        u64 length{0};
        std::vector<codec::DigestEntry> digests;
    };

    // Splits a pushed byte stream into chunk_size slices, hashes the raw
    // bytes and hands encoded chunks to the sink.
    class ChunkStream {
    public:
        ChunkStream(ChunkCodec* codec, ChunkSink* sink) noexcept;

        [[nodiscard]] zff::core::Status begin(const AlgorithmRegistry& registry,
            const std::vector<HashId>& hashes) noexcept;
        [[nodiscard]] zff::core::Status write(BufferView data) noexcept;
        [[nodiscard]] zff::core::Status end(StreamSummary* out) noexcept;

        [[nodiscard]] u64 length() const noexcept { return length_; }

    private:
        [[nodiscard]] zff::core::Status emit(BufferView slice) noexcept;

        ChunkCodec* codec_;
        ChunkSink* sink_;
        HashSet hashes_;
        std::vector<u8> pending_;
        EncodedChunk encoded_;
        u64 first_chunk_{0};
        u64 chunk_count_{0};
        u64 length_{0};
        bool open_{false};
    };

    [[nodiscard]] bool all_bytes_equal(BufferView data, u8* value) noexcept;

    // Chunk key of one object: the raw master key, or the password run
    // through the kdf recorded in the header, expanded per object id.
    // Unavailable when no key material was supplied.
    [[nodiscard]] zff::core::Status derive_chunk_key(const AlgorithmRegistry& registry,
        const codec::EncryptionParams& enc,
        const security::KeyMaterial& material,
        u64 object_id,
        security::Key256* out) noexcept;

} // namespace zff::storage
