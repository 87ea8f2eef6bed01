#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "zff/codec/model.hpp"
#include "zff/codec/record.hpp"
#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"
#include "zff/db/index_db.hpp"
#include "zff/io/virtual_map.hpp"
#include "zff/security/keyring.hpp"
#include "zff/storage/chunk_cache.hpp"
#include "zff/storage/chunk_map.hpp"
#include "zff/storage/pipeline.hpp"
#include "zff/storage/registry.hpp"
#include "zff/storage/segment_file.hpp"

namespace zff::io {
    using zff::codec::BufferMut;
    using zff::codec::BufferView;
    using zff::core::u64;
    using zff::core::u8;

    struct ReaderOptions {
        // Chunk signatures, hash signatures and the main footer signature.
        bool verify_signatures{true};
        // When set, signatures are checked against this key instead of the
        // one stored in the container.
        bool has_trusted_key{false};
        security::VerifyKey trusted_key{};
        security::KeyRing keys;
        // Decoded chunks kept per reader; 0 disables the cache.
        std::size_t cache_chunks{64};
        // Mutexes around the cache and the segment handles.
        bool sharable{false};
        // Rebuild the chunk map from segments that lost their footer.
        bool resync{false};
        // Optional SQLite chunk index reused across opens.
        std::string index_db_path;
        // nullptr selects AlgorithmRegistry::defaults().
        std::shared_ptr<const storage::AlgorithmRegistry> registry;
    };

    [[nodiscard]] zff::core::Status validate(const ReaderOptions& opts) noexcept;

    struct ObjectInfo {
        u64 id{0};
        zff::core::ObjectKind kind{zff::core::ObjectKind::Physical};
        u64 data_length{0};
        u64 first_chunk{0};
        u64 chunk_count{0};
        u64 first_segment{0};
        codec::ChunkingDescriptor chunking;
        zff::core::Timestamp acquisition_start{0};
        zff::core::Timestamp acquisition_end{0};
        std::vector<codec::DigestEntry> digests;
        u64 file_count{0};
        // false for objects rebuilt by resync without their footer
        bool complete{true};
        // false for an encrypted object opened without a usable key: its
        // footer stays sealed, so data_length, digests and files are unknown
        bool footer_open{true};
    };

    struct FileInfo {
        u64 file_number{0};
        zff::core::FileType type{zff::core::FileType::File};
        u64 parent{0};
        std::string name;
        std::map<std::string, std::string> metadata;
        u64 data_length{0};
        u64 first_chunk{0};
        u64 chunk_count{0};
        zff::core::Timestamp acquisition_start{0};
        zff::core::Timestamp acquisition_end{0};
        std::vector<codec::DigestEntry> digests;
    };

    struct RecoveryReport {
        bool recovered{false};
        u64 segments_scanned{0};
        u64 chunks_recovered{0};
        u64 chunks_dropped{0};
        u64 objects_incomplete{0};
        u64 last_chunk{0};
    };

    struct VerifyIssue {
        zff::core::Status status;
        u64 object_id{0};
        u64 file_number{0};
        u64 chunk_number{0};
    };

    struct VerifyReport {
        u64 objects_checked{0};
        u64 files_checked{0};
        u64 chunks_checked{0};
        u64 chunks_failed{0};
        u64 digests_checked{0};
        u64 digests_mismatched{0};
        u64 signatures_checked{0};
        bool main_footer_signed{false};
        bool main_footer_ok{true};
        std::vector<VerifyIssue> issues;

        [[nodiscard]] bool ok() const noexcept { return issues.empty(); }
    };

    // Read side of a container. After open() the reader is immutable apart
    // from its chunk cache; in sharable mode read(), read_file() and
    // verify() may be called from several threads.
    //
    // open() returns PartiallyRecovered together with a usable reader when
    // resync had to rebuild part of the chunk map.
    class ContainerReader {
    public:
        [[nodiscard]] static zff::core::Status open(const std::vector<std::string>& paths,
            const ReaderOptions& opts,
            std::unique_ptr<ContainerReader>* out) noexcept;

        // Opens "<base>.z01", "<base>.z02", ... up to the first missing number.
        [[nodiscard]] static zff::core::Status open_base(const std::string& base_path,
            const ReaderOptions& opts,
            std::unique_ptr<ContainerReader>* out) noexcept;

        ContainerReader(const ContainerReader&) = delete;
        ContainerReader& operator=(const ContainerReader&) = delete;
        ~ContainerReader();

        [[nodiscard]] zff::core::FormatVersion version() const noexcept { return version_; }
        [[nodiscard]] const zff::core::Uuid& uuid() const noexcept { return uuid_; }
        [[nodiscard]] zff::core::Timestamp created() const noexcept { return created_; }
        [[nodiscard]] const codec::Description& description() const noexcept { return description_; }
        [[nodiscard]] u64 segment_count() const noexcept { return static_cast<u64>(segments_.size()); }
        [[nodiscard]] const RecoveryReport& recovery() const noexcept { return recovery_; }

        // Object ids in write order.
        [[nodiscard]] std::vector<u64> objects() const;

        [[nodiscard]] zff::core::Status object_info(u64 object_id, ObjectInfo* out) const noexcept;
        [[nodiscard]] zff::core::Status files(u64 object_id, std::vector<FileInfo>* out) const noexcept;
        [[nodiscard]] zff::core::Status chunk_info(u64 chunk_number, storage::ChunkLocation* out) const noexcept;

        // Physical and virtual objects. OutOfRange unless the whole range
        // lies inside the object.
        [[nodiscard]] zff::core::Status read(u64 object_id, u64 offset, u64 length, std::vector<u8>* out) const noexcept;

        [[nodiscard]] zff::core::Status read_file(u64 object_id,
            u64 file_number,
            u64 offset,
            u64 length,
            std::vector<u8>* out) const noexcept;

        // Decodes every chunk and recomputes every digest; never fails fast.
        [[nodiscard]] zff::core::Status verify(VerifyReport* out) const noexcept;

    private:
        struct Segment {
            u64 number{0};
            u64 file_size{0};
            std::unique_ptr<storage::SegmentFile> file;
        };

        struct ObjectState {
            ObjectInfo info;
            std::unique_ptr<storage::Ed25519Signer> signer;
            std::unique_ptr<storage::ChunkCodec> codec;
            zff::core::Status codec_status;
            std::vector<FileInfo> files;
            VirtualMapIndex vmap;
        };

        // Object header or footer position found in a segment.
        struct PlacedRecord {
            u64 object_id{0};
            u64 segment{0};
            u64 offset{0};
        };

        // One contiguous run of chunks decoded to data_length bytes.
        struct Stream {
            u64 first_chunk{0};
            u64 chunk_count{0};
            u64 data_length{0};
        };

        ContainerReader() = default;

        [[nodiscard]] zff::core::Status open_segments(const std::vector<std::string>& paths) noexcept;
        [[nodiscard]] zff::core::Status load_snapshot(db::IndexSnapshot* snap) noexcept;
        [[nodiscard]] zff::core::Status snapshot_from_footers(db::IndexSnapshot* snap) noexcept;
        [[nodiscard]] zff::core::Status scan_segment(const Segment& seg,
            db::IndexedSegment* row,
            storage::ChunkMap* chunks,
            std::vector<PlacedRecord>* headers,
            std::vector<PlacedRecord>* footers) noexcept;
        [[nodiscard]] zff::core::Status read_footer(const Segment& seg, codec::SegmentFooter* out) const noexcept;
        [[nodiscard]] zff::core::Status read_record(u64 segment,
            u64 offset,
            codec::RecordKind expect,
            std::vector<u8>* out) const noexcept;

        [[nodiscard]] zff::core::Status load_main_v2(const db::IndexSnapshot& snap) noexcept;
        [[nodiscard]] zff::core::Status load_main_v1(const db::IndexSnapshot& snap) noexcept;
        [[nodiscard]] zff::core::Status load_object_v2(const db::IndexedObject& row, ObjectState* out) noexcept;
        [[nodiscard]] zff::core::Status load_files(const codec::ObjectFooter& footer, ObjectState* st) noexcept;
        // Replaces a sealed record with the plain one; checks that records
        // of encrypted objects are sealed and the others are not.
        [[nodiscard]] zff::core::Status open_object_record(const ObjectState& st,
            codec::RecordKind kind,
            u64 number,
            std::vector<u8>* rec) const noexcept;
        [[nodiscard]] zff::core::Status seal_unopened(zff::core::Status why, ObjectState* st) noexcept;
        [[nodiscard]] zff::core::Status finish_objects() noexcept;
        [[nodiscard]] zff::core::Status prepare_object(ObjectState* st) noexcept;
        [[nodiscard]] zff::core::Status check_main_signature(const codec::MainFooter& f) const noexcept;

        [[nodiscard]] const ObjectState* find_object(u64 object_id) const noexcept;
        [[nodiscard]] zff::core::Status read_object(u64 object_id,
            u64 offset,
            u64 length,
            int depth,
            std::vector<u8>* out) const noexcept;
        [[nodiscard]] zff::core::Status read_stream(const ObjectState& st,
            const Stream& stream,
            u64 offset,
            u64 length,
            std::vector<u8>* out) const noexcept;
        [[nodiscard]] zff::core::Status load_chunk(const ObjectState& st,
            u64 chunk_number,
            u64 raw_len,
            bool exact,
            storage::ChunkData* out) const noexcept;
        void verify_stream(const ObjectState& st,
            const Stream& stream,
            const std::vector<codec::DigestEntry>& digests,
            u64 file_number,
            VerifyReport* report) const noexcept;

        ReaderOptions opts_;
        std::shared_ptr<const storage::AlgorithmRegistry> registry_;
        zff::core::FormatVersion version_{zff::core::FormatVersion::V2};
        zff::core::Uuid uuid_{};
        zff::core::Timestamp created_{0};
        codec::Description description_;
        std::map<u64, Segment> segments_;
        storage::ChunkMap chunks_;
        std::map<u64, std::unique_ptr<ObjectState>> objects_;
        std::vector<u64> order_;
        bool has_main_footer_{false};
        codec::MainFooter main_footer_;
        RecoveryReport recovery_;
        std::unique_ptr<storage::ChunkCache> cache_;
    };

} // namespace zff::io
