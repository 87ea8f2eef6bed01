#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "zff/codec/model.hpp"
#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"
#include "zff/io/source.hpp"
#include "zff/security/keyring.hpp"
#include "zff/storage/pipeline.hpp"
#include "zff/storage/registry.hpp"
#include "zff/storage/segment_writer.hpp"

namespace zff::io {

    inline constexpr u64 kDefaultSegmentSize = u64{4} << 30;

    struct ContainerConfig {
        zff::core::FormatVersion version{zff::core::FormatVersion::V2};
        u64 max_segment_size{kDefaultSegmentSize};
        // ed25519 signing of chunks, digests and the main footer.
        bool sign{false};
        security::SigningKey signing_key{};
        codec::Description description; // main footer (v2)
        // nullptr selects AlgorithmRegistry::defaults().
        std::shared_ptr<const storage::AlgorithmRegistry> registry;
    };

    // Per object settings. With aead set, 'key' must hold a raw key or a
    // password; a password needs kdf.kdf != None and an empty salt is
    // replaced by default_kdf_params(). A raw key records KdfId::None.
    struct ObjectConfig {
        u64 chunk_size{zff::core::kDefaultChunkSize};
        codec::CompressionParams compression;
        zff::core::AeadId aead{zff::core::AeadId::None};
        zff::core::KdfParams kdf;
        security::KeyMaterial key;
        std::vector<zff::core::HashId> hashes;
        bool detect_same_bytes{false};
        codec::Description description;
    };

    [[nodiscard]] zff::core::Status validate(const ContainerConfig& cfg) noexcept;
    [[nodiscard]] zff::core::Status validate(const ObjectConfig& cfg) noexcept;

    class ContainerWriter;

    // Handle of the object currently being written. Owned by the container
    // writer; valid until finish(), the next add_*_object() or close().
    class ObjectWriter final : public storage::ChunkSink {
    public:
        ~ObjectWriter() override = default;

        [[nodiscard]] u64 id() const noexcept { return id_; }
        [[nodiscard]] zff::core::ObjectKind kind() const noexcept { return kind_; }

        // Physical objects only.
        [[nodiscard]] zff::core::Status write(BufferView data) noexcept;
        [[nodiscard]] zff::core::Status write_from(ByteSource& src) noexcept;

        // Logical objects only. The assigned file number (1, 2, ...) is
        // returned through file_number when non-null.
        [[nodiscard]] zff::core::Status add_file(const FileEntry& entry, ByteSource* content, u64* file_number) noexcept;
        [[nodiscard]] zff::core::Status add_files(FileSource& files) noexcept;

        [[nodiscard]] zff::core::Status finish() noexcept;

        [[nodiscard]] zff::core::Status allocate_chunk_number(u64* out) noexcept override;
        [[nodiscard]] zff::core::Status store_chunk(const storage::EncodedChunk& chunk) noexcept override;

    private:
        friend class ContainerWriter;

        ObjectWriter(ContainerWriter* owner, u64 id, zff::core::ObjectKind kind, const ObjectConfig& cfg);

        [[nodiscard]] zff::core::Status begin() noexcept;
        [[nodiscard]] zff::core::Status pump(ByteSource& src) noexcept;
        [[nodiscard]] zff::core::Status sign_digests(std::vector<codec::DigestEntry>* digests) noexcept;
        // Seals the framed record first when the object is encrypted.
        [[nodiscard]] zff::core::Status append_object_record(codec::RecordKind kind,
            u64 number,
            std::vector<u8>* rec,
            storage::RecordLocation* where) noexcept;
        [[nodiscard]] zff::core::Status usable() const noexcept;

        ContainerWriter* owner_;
        u64 id_;
        zff::core::ObjectKind kind_;
        ObjectConfig cfg_;
        std::unique_ptr<storage::ChunkCodec> codec_;
        std::unique_ptr<storage::ChunkStream> stream_;
        u64 first_segment_{0};
        u64 first_chunk_{0};
        u64 chunk_count_{0};
        u64 data_length_{0};
        zff::core::Timestamp started_{0};
        std::vector<codec::FileLocation> files_;
        std::map<u64, zff::core::FileType> file_types_;
        bool finished_{false};
    };

    // Streams objects into "<base>.z01", "<base>.z02", ... Objects are added
    // one at a time; adding the next one or closing finishes the open one.
    // After a failed write every call returns Interrupted.
    class ContainerWriter {
    public:
        [[nodiscard]] static zff::core::Status create(const std::string& base_path,
            const ContainerConfig& cfg,
            std::unique_ptr<ContainerWriter>* out) noexcept;

        ContainerWriter(const ContainerWriter&) = delete;
        ContainerWriter& operator=(const ContainerWriter&) = delete;
        ~ContainerWriter();

        // Duplicate if the id was used before; Invalid for id 0.
        [[nodiscard]] zff::core::Status add_physical_object(u64 id, const ObjectConfig& cfg, ObjectWriter** out) noexcept;
        [[nodiscard]] zff::core::Status add_logical_object(u64 id, const ObjectConfig& cfg, ObjectWriter** out) noexcept;

        // Writes a complete virtual object. Entries must reference objects
        // already written, stay inside them and not overlap (Inconsistent).
        [[nodiscard]] zff::core::Status add_virtual_object(u64 id,
            const std::vector<codec::VirtualMapEntry>& entries,
            const codec::Description& description) noexcept;

        // Finishes the open object, writes the main footer and the last
        // segment footer.
        [[nodiscard]] zff::core::Status close() noexcept;

        [[nodiscard]] const zff::core::Uuid& uuid() const noexcept { return uuid_; }
        [[nodiscard]] u64 segment_count() const noexcept { return segments_.segments().size(); }
        [[nodiscard]] bool closed() const noexcept { return closed_; }

    private:
        friend class ObjectWriter;

        struct WrittenObject {
            zff::core::ObjectKind kind{zff::core::ObjectKind::Physical};
            u64 length{0};
            codec::ObjectTableRow row;
        };

        ContainerWriter() = default;

        [[nodiscard]] zff::core::Status start_object(u64 id, zff::core::ObjectKind kind, const ObjectConfig& cfg,
            ObjectWriter** out) noexcept;
        [[nodiscard]] zff::core::Status finish_active() noexcept;
        [[nodiscard]] zff::core::Status guard() const noexcept;
        [[nodiscard]] zff::core::Status fail(zff::core::Status s) noexcept;
        [[nodiscard]] zff::core::Status open_segments(std::vector<u8> main_header) noexcept;
        [[nodiscard]] zff::core::Status write_main_footer_v2() noexcept;
        [[nodiscard]] zff::core::Status write_main_footer_v1() noexcept;
        void record_object(const ObjectWriter& w);

        std::string base_path_;
        ContainerConfig cfg_;
        std::shared_ptr<const storage::AlgorithmRegistry> registry_;
        std::unique_ptr<storage::Ed25519Signer> signer_;
        zff::core::Uuid uuid_{};
        zff::core::Timestamp created_{0};
        storage::SegmentWriter segments_;
        bool segments_open_{false};
        std::unique_ptr<ObjectWriter> active_;
        std::set<u64> used_ids_;
        std::vector<u64> order_;
        std::map<u64, WrittenObject> written_;
        u64 next_chunk_{zff::core::kFirstChunkNumber};
        // v1: the single implicit object
        codec::MainFooterV1 v1_footer_;
        bool v1_object_added_{false};
        bool failed_{false};
        bool closed_{false};
    };

} // namespace zff::io
