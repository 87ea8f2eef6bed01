#include "zff/storage/pipeline.hpp"

#include <algorithm>
#include <cstring>

namespace zff::storage {
    namespace {
        using zff::core::Status;
        using zff::core::StatusCode;
        using zff::core::StatusDomain;

        [[nodiscard]] Status chunk_error(StatusCode code, u64 chunk_number, const char* detail = nullptr) noexcept {
            return zff::core::make_status(StatusDomain::Storage, code, chunk_number, detail);
        }

        [[nodiscard]] bool keep_compressed(u64 raw, u64 compressed, u32 threshold_milli) noexcept {
            if (compressed >= raw) {
                return false;
            }
            return threshold_milli == 0 || raw * 1000u >= compressed * threshold_milli;
        }
    } // namespace

    bool all_bytes_equal(BufferView data, u8* value) noexcept {
        if (data.len == 0 || data.data == nullptr) {
            return false;
        }
        const u8 first = data.data[0];
        for (u64 i = 1; i < data.len; ++i) {
            if (data.data[i] != first) {
                return false;
            }
        }
        *value = first;
        return true;
    }

    Status derive_chunk_key(const AlgorithmRegistry& registry,
        const codec::EncryptionParams& enc,
        const security::KeyMaterial& material,
        u64 object_id,
        security::Key256* out) noexcept {
        if (out == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (material.empty()) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Unavailable, object_id, "no key");
        }
        security::Key256 master{};
        if (material.has_raw_key) {
            master = material.raw_key;
        } else {
            if (enc.kdf.kdf == zff::core::KdfId::None) {
                return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, object_id,
                    "password given but no kdf recorded");
            }
            const Kdf* kdf = nullptr;
            Status s = registry.kdf(enc.kdf.kdf, &kdf);
            if (!zff::core::is_ok(s)) return s;
            s = kdf->derive(enc.kdf, material.password, &master);
            if (!zff::core::is_ok(s)) return s;
        }
        return security::derive_object_key(master, object_id, out);
    }

    // ========================================================================
    // ChunkCodec
    // ========================================================================

    ChunkCodec::ChunkCodec(std::shared_ptr<const AlgorithmRegistry> registry, const ChunkCodecConfig& cfg)
        : registry_(std::move(registry)), cfg_(cfg) {}

    Status ChunkCodec::prepare() noexcept {
        if (!registry_) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "no registry");
        }
        if (cfg_.chunk_size == 0) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "chunk size");
        }
        compressor_ = nullptr;
        aead_ = nullptr;
        if (cfg_.compression.algo != zff::core::CompressionId::None) {
            const Status s = registry_->compressor(cfg_.compression.algo, &compressor_);
            if (!zff::core::is_ok(s)) return s;
        }
        if (cfg_.aead != zff::core::AeadId::None) {
            const Status s = registry_->aead(cfg_.aead, &aead_);
            if (!zff::core::is_ok(s)) return s;
        }
        return zff::core::ok_status();
    }

    Status ChunkCodec::encode(u64 chunk_number, BufferView raw, EncodedChunk* out) noexcept {
        if (out == nullptr || raw.len == 0 || raw.data == nullptr || raw.len > cfg_.chunk_size) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, chunk_number);
        }
        codec::ChunkHeader h{};
        h.chunk_number = chunk_number;
        out->payload.clear();

        u8 b = 0;
        if (cfg_.detect_same_bytes && all_bytes_equal(raw, &b)) {
            if (b == 0) {
                h.flags = codec::kChunkEmpty;
            } else {
                h.flags = codec::kChunkSameBytes;
                out->payload.push_back(b);
            }
        } else {
            BufferView stored = raw;
            if (compressor_ != nullptr) {
                const Status s = compressor_->compress(raw, cfg_.compression.level, &scratch_);
                if (!zff::core::is_ok(s)) return s;
                if (keep_compressed(raw.len, scratch_.size(), cfg_.compression.threshold_milli)) {
                    h.flags |= codec::kChunkCompressed;
                    stored = zff::codec::view_of(scratch_);
                }
            }

            if (aead_ != nullptr) {
                h.flags |= codec::kChunkEncrypted;
                security::Nonce12 nonce{};
                security::derive_chunk_nonce(cfg_.object_id, chunk_number, &nonce);
                u8 aad[security::kChunkAadBytes];
                security::make_chunk_aad(chunk_number, h.flags, aad);
                const Status s = aead_->seal(cfg_.key, nonce, BufferView{aad, sizeof(aad)}, stored, &out->payload);
                if (!zff::core::is_ok(s)) return s;
            } else {
                out->payload.assign(stored.data, stored.data + stored.len);
            }
        }

        const BufferView payload = zff::codec::view_of(out->payload);
        h.crc32 = crc32_ieee(payload);
        h.stored_size = payload.len;

        if (cfg_.signer != nullptr) {
            security::Signature64 sig{};
            const Status s = cfg_.signer->sign(payload, &sig);
            if (!zff::core::is_ok(s)) return s;
            std::memcpy(h.signature.data(), sig.b, sizeof(sig.b));
            h.flags |= codec::kChunkSignaturePresent;
        }

        out->header = h;
        return zff::core::ok_status();
    }

    Status ChunkCodec::seal_record(codec::RecordKind kind, u64 number, BufferView plain, std::vector<u8>* out) const noexcept {
        if (out == nullptr || plain.len == 0 || plain.data == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, number);
        }
        if (aead_ == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, number, "object is not encrypted");
        }
        const u8 k = static_cast<u8>(kind);
        security::Nonce12 nonce{};
        security::derive_record_nonce(cfg_.object_id, k, number, &nonce);
        u8 aad[security::kRecordAadBytes];
        security::make_record_aad(k, number, aad);
        return aead_->seal(cfg_.key, nonce, BufferView{aad, sizeof(aad)}, plain, out);
    }

    Status ChunkCodec::open_record(codec::RecordKind kind, u64 number, BufferView sealed, std::vector<u8>* out) const noexcept {
        if (out == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, number);
        }
        if (aead_ == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::DecryptError, number, "object is not encrypted");
        }
        const u8 k = static_cast<u8>(kind);
        security::Nonce12 nonce{};
        security::derive_record_nonce(cfg_.object_id, k, number, &nonce);
        u8 aad[security::kRecordAadBytes];
        security::make_record_aad(k, number, aad);
        const Status s = aead_->open(cfg_.key, nonce, BufferView{aad, sizeof(aad)}, sealed, out);
        if (!zff::core::is_ok(s)) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::DecryptError, number, "object record");
        }
        return zff::core::ok_status();
    }

    Status ChunkCodec::decode(const codec::ChunkHeader& h,
        BufferView payload,
        u64 raw_len,
        bool exact,
        std::vector<u8>* out) const noexcept {
        const u64 k = h.chunk_number;
        if (out == nullptr || raw_len == 0) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, k);
        }
        if (payload.len != h.stored_size) {
            return chunk_error(StatusCode::Corrupt, k, "stored size");
        }

        if (codec::chunk_has_signature(h.flags) && cfg_.verify_signatures && cfg_.signer != nullptr) {
            security::Signature64 sig{};
            std::memcpy(sig.b, h.signature.data(), sizeof(sig.b));
            const Status s = cfg_.signer->verify(payload, sig);
            if (!zff::core::is_ok(s)) {
                return chunk_error(StatusCode::SignatureInvalid, k);
            }
        }

        if (crc32_ieee(payload) != h.crc32) {
            return chunk_error(StatusCode::Corrupt, k, "crc32");
        }

        if ((h.flags & codec::kChunkEmpty) != 0) {
            if (payload.len != 0) return chunk_error(StatusCode::Corrupt, k, "empty chunk payload");
            out->assign(static_cast<size_t>(raw_len), 0);
            return zff::core::ok_status();
        }
        if ((h.flags & codec::kChunkSameBytes) != 0) {
            if (payload.len != 1) return chunk_error(StatusCode::Corrupt, k, "same-bytes payload");
            out->assign(static_cast<size_t>(raw_len), payload.data[0]);
            return zff::core::ok_status();
        }

        std::vector<u8> plain;
        BufferView data = payload;
        if ((h.flags & codec::kChunkEncrypted) != 0) {
            if (aead_ == nullptr) {
                return chunk_error(StatusCode::DecryptError, k, "object is not encrypted");
            }
            security::Nonce12 nonce{};
            security::derive_chunk_nonce(cfg_.object_id, k, &nonce);
            u8 aad[security::kChunkAadBytes];
            security::make_chunk_aad(k, static_cast<u8>(h.flags & ~codec::kChunkSignaturePresent), aad);
            const Status s = aead_->open(cfg_.key, nonce, BufferView{aad, sizeof(aad)}, payload, &plain);
            if (!zff::core::is_ok(s)) {
                return chunk_error(StatusCode::DecryptError, k);
            }
            data = zff::codec::view_of(plain);
        }

        if ((h.flags & codec::kChunkCompressed) != 0) {
            if (compressor_ == nullptr) {
                return chunk_error(StatusCode::Corrupt, k, "object is not compressed");
            }
            const Status s = compressor_->decompress(data, raw_len, out);
            if (!zff::core::is_ok(s)) {
                return chunk_error(StatusCode::Corrupt, k, "decompression");
            }
        } else {
            out->assign(data.data, data.data + data.len);
        }

        if (out->size() > raw_len || (exact && out->size() != raw_len)) {
            return chunk_error(StatusCode::Corrupt, k, "decoded length");
        }
        return zff::core::ok_status();
    }

    // ========================================================================
    // HashSet
    // ========================================================================

    Status HashSet::init(const AlgorithmRegistry& registry, const std::vector<HashId>& hashes) noexcept {
        hashers_.clear();
        for (HashId id : hashes) {
            const bool dup = std::any_of(hashers_.begin(), hashers_.end(),
                [id](const std::unique_ptr<Hasher>& h) { return h->id() == id; });
            if (dup) {
                continue;
            }
            std::unique_ptr<Hasher> h;
            const Status s = registry.make_hasher(id, &h);
            if (!zff::core::is_ok(s)) return s;
            hashers_.push_back(std::move(h));
        }
        return zff::core::ok_status();
    }

    Status HashSet::update(BufferView data) noexcept {
        for (const auto& h : hashers_) {
            const Status s = h->update(data);
            if (!zff::core::is_ok(s)) return s;
        }
        return zff::core::ok_status();
    }

    Status HashSet::finalize(std::vector<codec::DigestEntry>* out) noexcept {
        out->clear();
        for (const auto& h : hashers_) {
            codec::DigestEntry d{};
            d.hash = h->id();
            const Status s = h->finalize(&d.digest);
            if (!zff::core::is_ok(s)) return s;
            out->push_back(std::move(d));
        }
        return zff::core::ok_status();
    }

    // ========================================================================
    // ChunkStream
    // ========================================================================

    ChunkStream::ChunkStream(ChunkCodec* codec, ChunkSink* sink) noexcept : codec_(codec), sink_(sink) {}

    Status ChunkStream::begin(const AlgorithmRegistry& registry, const std::vector<HashId>& hashes) noexcept {
        if (codec_ == nullptr || sink_ == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        const Status s = hashes_.init(registry, hashes);
        if (!zff::core::is_ok(s)) return s;
        pending_.clear();
        pending_.reserve(static_cast<size_t>(codec_->config().chunk_size));
        first_chunk_ = 0;
        chunk_count_ = 0;
        length_ = 0;
        open_ = true;
        return zff::core::ok_status();
    }

    Status ChunkStream::emit(BufferView slice) noexcept {
        Status s = hashes_.update(slice);
        if (!zff::core::is_ok(s)) return s;

        u64 number = 0;
        s = sink_->allocate_chunk_number(&number);
        if (!zff::core::is_ok(s)) return s;
        s = codec_->encode(number, slice, &encoded_);
        if (!zff::core::is_ok(s)) return s;
        s = sink_->store_chunk(encoded_);
        if (!zff::core::is_ok(s)) return s;

        if (chunk_count_ == 0) {
            first_chunk_ = number;
        }
        ++chunk_count_;
        return zff::core::ok_status();
    }

    Status ChunkStream::write(BufferView data) noexcept {
        if (!open_) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "stream not open");
        }
        if (data.len > 0 && data.data == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        const u64 c = codec_->config().chunk_size;
        u64 pos = 0;
        while (pos < data.len) {
            // Whole chunks straight from the caller buffer when nothing is pending.
            if (pending_.empty() && data.len - pos >= c) {
                const Status s = emit(BufferView{data.data + pos, c});
                if (!zff::core::is_ok(s)) return s;
                pos += c;
                length_ += c;
                continue;
            }
            const u64 take = std::min<u64>(c - pending_.size(), data.len - pos);
            pending_.insert(pending_.end(), data.data + pos, data.data + pos + take);
            pos += take;
            length_ += take;
            if (pending_.size() == c) {
                const Status s = emit(zff::codec::view_of(pending_));
                if (!zff::core::is_ok(s)) return s;
                pending_.clear();
            }
        }
        return zff::core::ok_status();
    }

    Status ChunkStream::end(StreamSummary* out) noexcept {
        if (!open_ || out == nullptr) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (!pending_.empty()) {
            const Status s = emit(zff::codec::view_of(pending_));
            if (!zff::core::is_ok(s)) return s;
            pending_.clear();
        }
        open_ = false;

        StreamSummary sum{};
        sum.first_chunk = first_chunk_;
        sum.chunk_count = chunk_count_;
        sum.length = length_;
        const Status s = hashes_.finalize(&sum.digests);
        if (!zff::core::is_ok(s)) return s;
        *out = std::move(sum);
        return zff::core::ok_status();
    }

} // namespace zff::storage
