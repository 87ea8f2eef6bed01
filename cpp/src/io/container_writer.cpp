#include "zff/io/container_writer.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>

#include "zff/codec/format.hpp"
#include "zff/security/crypto.hpp"
#include "zff/security/kdf.hpp"
#include "zff/storage/compression.hpp"

namespace zff::io {
    namespace {
        using zff::core::FormatVersion;
        using zff::core::ObjectKind;
        using zff::core::Status;
        using zff::core::StatusCode;
        using zff::core::StatusDomain;

        [[nodiscard]] Status invalid(const char* what, u64 aux = 0) noexcept {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Invalid, aux, what);
        }

        [[nodiscard]] zff::core::Timestamp now() noexcept {
            return static_cast<zff::core::Timestamp>(std::time(nullptr));
        }
    } // namespace

    // ========================================================================
    // Configuration
    // ========================================================================

    Status validate(const ContainerConfig& cfg) noexcept {
        if (!zff::core::format_version_known(static_cast<u8>(cfg.version))) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::UnsupportedVersion,
                static_cast<u64>(cfg.version));
        }
        if (cfg.max_segment_size < zff::core::kMinSegmentSize) {
            return invalid("max_segment_size", cfg.max_segment_size);
        }
        if (!codec::keys_valid(cfg.description)) {
            return invalid("description key");
        }
        return zff::core::ok_status();
    }

    Status validate(const ObjectConfig& cfg) noexcept {
        if (!zff::core::is_power_of_two(cfg.chunk_size) || cfg.chunk_size < zff::core::kMinChunkSize) {
            return invalid("chunk_size", cfg.chunk_size);
        }
        if (!zff::core::compression_id_known(static_cast<u8>(cfg.compression.algo))) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::UnsupportedAlgorithm,
                static_cast<u64>(cfg.compression.algo), "compression");
        }
        if (cfg.compression.algo == zff::core::CompressionId::Zstd && !storage::zstd_level_valid(cfg.compression.level)) {
            return invalid("compression level", static_cast<u64>(cfg.compression.level));
        }
        if (!codec::keys_valid(cfg.description)) {
            return invalid("description key");
        }
        for (zff::core::HashId h : cfg.hashes) {
            if (!zff::core::hash_id_known(static_cast<u8>(h))) {
                return zff::core::make_status(StatusDomain::Writer, StatusCode::UnsupportedAlgorithm,
                    static_cast<u64>(h), "hash");
            }
        }
        if (!zff::core::aead_id_known(static_cast<u8>(cfg.aead))) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::UnsupportedAlgorithm,
                static_cast<u64>(cfg.aead), "aead");
        }
        if (cfg.aead != zff::core::AeadId::None) {
            if (cfg.key.empty()) {
                return invalid("encryption needs a key or password");
            }
            if (!cfg.key.has_raw_key) {
                if (!zff::core::kdf_id_known(static_cast<u8>(cfg.kdf.kdf))) {
                    return zff::core::make_status(StatusDomain::Writer, StatusCode::UnsupportedAlgorithm,
                        static_cast<u64>(cfg.kdf.kdf), "kdf");
                }
                if (cfg.kdf.kdf == zff::core::KdfId::None) {
                    return invalid("password needs a kdf");
                }
            }
        }
        return zff::core::ok_status();
    }

    // ========================================================================
    // ObjectWriter
    // ========================================================================

    ObjectWriter::ObjectWriter(ContainerWriter* owner, u64 id, ObjectKind kind, const ObjectConfig& cfg)
        : owner_(owner), id_(id), kind_(kind), cfg_(cfg) {}

    Status ObjectWriter::usable() const noexcept {
        const Status s = owner_->guard();
        if (!zff::core::is_ok(s)) return s;
        if (finished_) {
            return invalid("object already finished", id_);
        }
        return zff::core::ok_status();
    }

    Status ObjectWriter::begin() noexcept {
        codec::ChunkingDescriptor d{};
        d.chunk_size = cfg_.chunk_size;
        d.compression = cfg_.compression;
        d.encryption.aead = cfg_.aead;
        d.hashes = cfg_.hashes;
        d.detect_same_bytes = cfg_.detect_same_bytes;
        d.description = cfg_.description;
        if (owner_->signer_) {
            const security::VerifyKey vk = owner_->signer_->verify_key();
            d.verify_key.assign(vk.b, vk.b + sizeof(vk.b));
        }

        Status s;
        if (cfg_.aead != zff::core::AeadId::None && !cfg_.key.has_raw_key) {
            d.encryption.kdf = cfg_.kdf;
            if (d.encryption.kdf.salt.empty()) {
                s = security::default_kdf_params(cfg_.kdf.kdf, &d.encryption.kdf);
                if (!zff::core::is_ok(s)) return s;
            }
        }

        const bool v1 = owner_->cfg_.version == FormatVersion::V1;
        std::vector<u8> rec;
        if (v1) {
            codec::MainHeaderV1 mh{};
            mh.uuid = owner_->uuid_;
            mh.created = owner_->created_;
            mh.max_segment_size = owner_->cfg_.max_segment_size;
            mh.chunking = d;
            codec::v1::encode_main_header(mh, &rec);
            s = owner_->open_segments(std::move(rec));
            if (!zff::core::is_ok(s)) return s;
            first_segment_ = zff::core::kFirstSegmentNumber;
        } else {
            codec::ObjectHeader oh{};
            oh.object_id = id_;
            oh.kind = kind_;
            oh.chunking = d;
            codec::v2::encode_object_header(oh, &rec);
            storage::RecordLocation where{};
            s = owner_->segments_.append_record(codec::RecordKind::ObjectHeader, id_, codec::view_of(rec), &where);
            if (!zff::core::is_ok(s)) return owner_->fail(s);
            first_segment_ = where.segment;
        }

        storage::ChunkCodecConfig cc{};
        cc.object_id = id_;
        cc.chunk_size = cfg_.chunk_size;
        cc.compression = cfg_.compression;
        cc.aead = cfg_.aead;
        cc.detect_same_bytes = cfg_.detect_same_bytes;
        cc.signer = owner_->signer_.get();
        if (cfg_.aead != zff::core::AeadId::None) {
            s = storage::derive_chunk_key(*owner_->registry_, d.encryption, cfg_.key, id_, &cc.key);
            if (!zff::core::is_ok(s)) return s;
        }
        codec_ = std::make_unique<storage::ChunkCodec>(owner_->registry_, cc);
        s = codec_->prepare();
        if (!zff::core::is_ok(s)) return s;

        started_ = now();
        if (kind_ == ObjectKind::Physical) {
            stream_ = std::make_unique<storage::ChunkStream>(codec_.get(), this);
            s = stream_->begin(*owner_->registry_, cfg_.hashes);
            if (!zff::core::is_ok(s)) return s;
        }
        return zff::core::ok_status();
    }

    Status ObjectWriter::allocate_chunk_number(u64* out) noexcept {
        *out = owner_->next_chunk_++;
        return zff::core::ok_status();
    }

    Status ObjectWriter::store_chunk(const storage::EncodedChunk& chunk) noexcept {
        return owner_->segments_.append_chunk(chunk, nullptr);
    }

    Status ObjectWriter::write(BufferView data) noexcept {
        const Status s = usable();
        if (!zff::core::is_ok(s)) return s;
        if (kind_ != ObjectKind::Physical) {
            return invalid("write() on a non-physical object", id_);
        }
        if (data.len > 0 && data.data == nullptr) {
            return invalid("null data");
        }
        const Status w = stream_->write(data);
        if (!zff::core::is_ok(w)) return owner_->fail(w);
        return zff::core::ok_status();
    }

    Status ObjectWriter::pump(ByteSource& src) noexcept {
        std::vector<u8> buf(static_cast<size_t>(cfg_.chunk_size));
        for (;;) {
            u64 got = 0;
            Status s = src.read(BufferMut{buf.data(), buf.size()}, &got);
            if (!zff::core::is_ok(s)) return owner_->fail(s);
            if (got == 0) {
                return zff::core::ok_status();
            }
            s = stream_->write(BufferView{buf.data(), got});
            if (!zff::core::is_ok(s)) return owner_->fail(s);
        }
    }

    Status ObjectWriter::write_from(ByteSource& src) noexcept {
        const Status s = usable();
        if (!zff::core::is_ok(s)) return s;
        if (kind_ != ObjectKind::Physical) {
            return invalid("write_from() on a non-physical object", id_);
        }
        return pump(src);
    }

    Status ObjectWriter::sign_digests(std::vector<codec::DigestEntry>* digests) noexcept {
        const storage::Signer* signer = owner_->signer_.get();
        if (signer == nullptr) {
            return zff::core::ok_status();
        }
        for (codec::DigestEntry& d : *digests) {
            security::Signature64 sig{};
            const Status s = signer->sign(codec::view_of(d.digest), &sig);
            if (!zff::core::is_ok(s)) return s;
            d.signature.assign(sig.b, sig.b + sizeof(sig.b));
        }
        return zff::core::ok_status();
    }

    Status ObjectWriter::append_object_record(codec::RecordKind kind,
        u64 number,
        std::vector<u8>* rec,
        storage::RecordLocation* where) noexcept {
        if (codec_->encrypted()) {
            codec::SealedRecord sealed{};
            sealed.object_id = id_;
            sealed.number = number;
            const Status s = codec_->seal_record(kind, number, codec::view_of(*rec), &sealed.sealed);
            if (!zff::core::is_ok(s)) return s;
            rec->clear();
            codec::v2::encode_sealed_record(kind, sealed, rec);
        }
        return owner_->segments_.append_record(kind, id_, codec::view_of(*rec), where);
    }

    Status ObjectWriter::add_file(const FileEntry& entry, ByteSource* content, u64* file_number) noexcept {
        Status s = usable();
        if (!zff::core::is_ok(s)) return s;
        if (kind_ != ObjectKind::Logical) {
            return invalid("add_file() on a non-logical object", id_);
        }
        if (!zff::core::file_type_known(static_cast<u8>(entry.type))) {
            return invalid("file type", static_cast<u64>(entry.type));
        }
        if (!codec::keys_valid(entry.metadata)) {
            return invalid("file metadata key");
        }
        if (entry.parent != 0) {
            const auto it = file_types_.find(entry.parent);
            if (it == file_types_.end() || it->second != zff::core::FileType::Directory) {
                return invalid("parent is not a known directory", entry.parent);
            }
        }

        const u64 number = static_cast<u64>(files_.size()) + 1;
        codec::FileHeader fh{};
        fh.object_id = id_;
        fh.file_number = number;
        fh.type = entry.type;
        fh.parent = entry.parent;
        fh.name = entry.name;
        fh.metadata = entry.metadata;
        std::vector<u8> rec;
        codec::v2::encode_file_header(fh, &rec);
        storage::RecordLocation head{};
        s = append_object_record(codec::RecordKind::FileHeader, number, &rec, &head);
        if (!zff::core::is_ok(s)) return owner_->fail(s);

        stream_ = std::make_unique<storage::ChunkStream>(codec_.get(), this);
        s = stream_->begin(*owner_->registry_, cfg_.hashes);
        if (!zff::core::is_ok(s)) return owner_->fail(s);
        const zff::core::Timestamp started = now();
        if (content != nullptr) {
            s = pump(*content);
            if (!zff::core::is_ok(s)) return s;
        }
        storage::StreamSummary sum{};
        s = stream_->end(&sum);
        if (!zff::core::is_ok(s)) return owner_->fail(s);
        stream_.reset();
        s = sign_digests(&sum.digests);
        if (!zff::core::is_ok(s)) return owner_->fail(s);

        codec::FileFooter ff{};
        ff.object_id = id_;
        ff.file_number = number;
        ff.data_length = sum.length;
        ff.first_chunk = sum.first_chunk;
        ff.chunk_count = sum.chunk_count;
        ff.acquisition_start = started;
        ff.acquisition_end = now();
        ff.digests = std::move(sum.digests);
        rec.clear();
        codec::v2::encode_file_footer(ff, &rec);
        storage::RecordLocation foot{};
        s = append_object_record(codec::RecordKind::FileFooter, number, &rec, &foot);
        if (!zff::core::is_ok(s)) return owner_->fail(s);

        files_.push_back(codec::FileLocation{number, head.segment, head.offset, foot.segment, foot.offset});
        file_types_[number] = entry.type;
        data_length_ += sum.length;
        if (first_chunk_ == 0 && sum.chunk_count > 0) {
            first_chunk_ = sum.first_chunk;
        }
        chunk_count_ += sum.chunk_count;
        if (file_number != nullptr) {
            *file_number = number;
        }
        return zff::core::ok_status();
    }

    Status ObjectWriter::add_files(FileSource& files) noexcept {
        for (;;) {
            FileEntry entry{};
            std::unique_ptr<ByteSource> content;
            bool done = false;
            Status s = files.next(&entry, &content, &done);
            if (!zff::core::is_ok(s)) return s;
            if (done) {
                return zff::core::ok_status();
            }
            s = add_file(entry, content.get(), nullptr);
            if (!zff::core::is_ok(s)) return s;
        }
    }

    Status ObjectWriter::finish() noexcept {
        if (finished_) {
            return zff::core::ok_status();
        }
        Status s = usable();
        if (!zff::core::is_ok(s)) return s;

        std::vector<codec::DigestEntry> digests;
        if (kind_ == ObjectKind::Physical) {
            storage::StreamSummary sum{};
            s = stream_->end(&sum);
            if (!zff::core::is_ok(s)) return owner_->fail(s);
            stream_.reset();
            first_chunk_ = sum.first_chunk;
            chunk_count_ = sum.chunk_count;
            data_length_ = sum.length;
            digests = std::move(sum.digests);
            s = sign_digests(&digests);
            if (!zff::core::is_ok(s)) return owner_->fail(s);
        }

        if (owner_->cfg_.version == FormatVersion::V1) {
            codec::MainFooterV1& f = owner_->v1_footer_;
            f.data_length = data_length_;
            f.first_chunk = first_chunk_;
            f.chunk_count = chunk_count_;
            f.acquisition_start = started_;
            f.acquisition_end = now();
            f.digests = std::move(digests);
        } else {
            codec::ObjectFooter of{};
            of.object_id = id_;
            of.kind = kind_;
            of.data_length = data_length_;
            of.first_chunk = first_chunk_;
            of.chunk_count = chunk_count_;
            of.acquisition_start = started_;
            of.acquisition_end = now();
            of.digests = std::move(digests);
            of.files = files_;
            std::vector<u8> rec;
            codec::v2::encode_object_footer(of, &rec);
            s = append_object_record(codec::RecordKind::ObjectFooter, 0, &rec, nullptr);
            if (!zff::core::is_ok(s)) return owner_->fail(s);
        }

        finished_ = true;
        owner_->record_object(*this);
        return zff::core::ok_status();
    }

    // ========================================================================
    // ContainerWriter
    // ========================================================================

    Status ContainerWriter::create(const std::string& base_path,
        const ContainerConfig& cfg,
        std::unique_ptr<ContainerWriter>* out) noexcept {
        if (out == nullptr || base_path.empty()) {
            return invalid("base path");
        }
        Status s = validate(cfg);
        if (!zff::core::is_ok(s)) return s;

        std::unique_ptr<ContainerWriter> w(new ContainerWriter());
        w->base_path_ = base_path;
        w->cfg_ = cfg;
        w->registry_ = cfg.registry ? cfg.registry : storage::AlgorithmRegistry::defaults();
        if (cfg.sign) {
            w->signer_ = std::make_unique<storage::Ed25519Signer>(cfg.signing_key);
        }
        s = security::generate_uuid(&w->uuid_);
        if (!zff::core::is_ok(s)) return s;
        w->created_ = now();

        // v1 opens its first segment together with the main header, which
        // needs the object settings.
        if (cfg.version == FormatVersion::V2) {
            s = w->open_segments({});
            if (!zff::core::is_ok(s)) return s;
        }
        *out = std::move(w);
        return zff::core::ok_status();
    }

    ContainerWriter::~ContainerWriter() = default;

    Status ContainerWriter::guard() const noexcept {
        if (failed_) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Interrupted);
        }
        if (closed_) {
            return invalid("container closed");
        }
        return zff::core::ok_status();
    }

    Status ContainerWriter::fail(Status s) noexcept {
        failed_ = true;
        return s;
    }

    Status ContainerWriter::open_segments(std::vector<u8> main_header) noexcept {
        storage::SegmentWriterConfig sc{};
        sc.base_path = base_path_;
        sc.uuid = uuid_;
        sc.max_segment_size = cfg_.max_segment_size;
        sc.version = static_cast<u8>(cfg_.version);
        sc.main_header = std::move(main_header);
        const Status s = segments_.open(sc);
        if (!zff::core::is_ok(s)) return fail(s);
        segments_open_ = true;
        return zff::core::ok_status();
    }

    void ContainerWriter::record_object(const ObjectWriter& w) {
        WrittenObject o{};
        o.kind = w.kind_;
        o.length = w.data_length_;
        o.row.object_id = w.id_;
        o.row.first_segment = w.first_segment_;
        o.row.first_chunk = w.chunk_count_ > 0 ? w.first_chunk_ : 0;
        o.row.last_chunk = w.chunk_count_ > 0 ? w.first_chunk_ + w.chunk_count_ - 1 : 0;
        written_[w.id_] = o;
    }

    Status ContainerWriter::finish_active() noexcept {
        if (!active_) {
            return zff::core::ok_status();
        }
        const Status s = active_->finish();
        if (!zff::core::is_ok(s)) return s;
        active_.reset();
        return zff::core::ok_status();
    }

    Status ContainerWriter::start_object(u64 id, ObjectKind kind, const ObjectConfig& cfg, ObjectWriter** out) noexcept {
        Status s = guard();
        if (!zff::core::is_ok(s)) return s;
        if (out == nullptr) {
            return invalid("out");
        }
        if (id == 0) {
            return invalid("object id 0");
        }
        if (used_ids_.count(id) != 0) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Duplicate, id, "object id");
        }
        s = validate(cfg);
        if (!zff::core::is_ok(s)) return s;
        if (cfg_.version == FormatVersion::V1) {
            if (kind != ObjectKind::Physical || v1_object_added_) {
                return invalid("v1 containers hold one physical object");
            }
            if (id != zff::core::kV1ImplicitObject.v) {
                return invalid("v1 object id must be 1", id);
            }
        }

        s = finish_active();
        if (!zff::core::is_ok(s)) return s;

        used_ids_.insert(id);
        order_.push_back(id);
        if (cfg_.version == FormatVersion::V1) {
            v1_object_added_ = true;
        }
        active_.reset(new ObjectWriter(this, id, kind, cfg));
        s = active_->begin();
        if (!zff::core::is_ok(s)) {
            active_.reset();
            return fail(s);
        }
        *out = active_.get();
        return zff::core::ok_status();
    }

    Status ContainerWriter::add_physical_object(u64 id, const ObjectConfig& cfg, ObjectWriter** out) noexcept {
        return start_object(id, ObjectKind::Physical, cfg, out);
    }

    Status ContainerWriter::add_logical_object(u64 id, const ObjectConfig& cfg, ObjectWriter** out) noexcept {
        return start_object(id, ObjectKind::Logical, cfg, out);
    }

    Status ContainerWriter::add_virtual_object(u64 id,
        const std::vector<codec::VirtualMapEntry>& entries,
        const codec::Description& description) noexcept {
        Status s = guard();
        if (!zff::core::is_ok(s)) return s;
        if (cfg_.version != FormatVersion::V2) {
            return invalid("virtual objects need format v2");
        }
        if (id == 0) {
            return invalid("object id 0");
        }
        if (used_ids_.count(id) != 0) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Duplicate, id, "object id");
        }
        if (!codec::keys_valid(description)) {
            return invalid("description key");
        }
        // Sources include the object still open, so finish it first.
        s = finish_active();
        if (!zff::core::is_ok(s)) return s;

        std::vector<codec::VirtualMapEntry> sorted = entries;
        std::sort(sorted.begin(), sorted.end(), [](const codec::VirtualMapEntry& a, const codec::VirtualMapEntry& b) {
            return a.virtual_start < b.virtual_start;
        });
        u64 length = 0;
        for (const codec::VirtualMapEntry& e : sorted) {
            if (e.length == 0) {
                return invalid("empty virtual map entry", e.virtual_start);
            }
            if (e.virtual_start + e.length < e.virtual_start || e.source_start + e.length < e.source_start) {
                return invalid("virtual map entry overflows", e.virtual_start);
            }
            if (e.virtual_start < length) {
                return zff::core::make_status(StatusDomain::Writer, StatusCode::Inconsistent, e.virtual_start,
                    "virtual map entries overlap");
            }
            const auto src = written_.find(e.source_object);
            if (src == written_.end() || e.source_object == id) {
                return zff::core::make_status(StatusDomain::Writer, StatusCode::Inconsistent, e.source_object,
                    "unknown source object");
            }
            if (e.source_start + e.length > src->second.length) {
                return zff::core::make_status(StatusDomain::Writer, StatusCode::Inconsistent, e.source_object,
                    "source range past object end");
            }
            length = e.virtual_start + e.length;
        }

        used_ids_.insert(id);
        order_.push_back(id);

        codec::ObjectHeader oh{};
        oh.object_id = id;
        oh.kind = ObjectKind::Virtual;
        oh.chunking.description = description;
        if (signer_) {
            const security::VerifyKey vk = signer_->verify_key();
            oh.chunking.verify_key.assign(vk.b, vk.b + sizeof(vk.b));
        }
        std::vector<u8> rec;
        codec::v2::encode_object_header(oh, &rec);
        storage::RecordLocation head{};
        s = segments_.append_record(codec::RecordKind::ObjectHeader, id, codec::view_of(rec), &head);
        if (!zff::core::is_ok(s)) return fail(s);

        codec::VirtualMap vm{};
        vm.object_id = id;
        vm.length = length;
        vm.entries = std::move(sorted);
        rec.clear();
        codec::v2::encode_virtual_map(vm, &rec);
        storage::RecordLocation map{};
        s = segments_.append_record(codec::RecordKind::VirtualMap, id, codec::view_of(rec), &map);
        if (!zff::core::is_ok(s)) return fail(s);

        const zff::core::Timestamp t = now();
        codec::ObjectFooter of{};
        of.object_id = id;
        of.kind = ObjectKind::Virtual;
        of.data_length = length;
        of.acquisition_start = t;
        of.acquisition_end = t;
        of.virtual_map_segment = map.segment;
        of.virtual_map_offset = map.offset;
        rec.clear();
        codec::v2::encode_object_footer(of, &rec);
        s = segments_.append_record(codec::RecordKind::ObjectFooter, id, codec::view_of(rec), nullptr);
        if (!zff::core::is_ok(s)) return fail(s);

        WrittenObject o{};
        o.kind = ObjectKind::Virtual;
        o.length = length;
        o.row.object_id = id;
        o.row.first_segment = head.segment;
        written_[id] = o;
        return zff::core::ok_status();
    }

    Status ContainerWriter::write_main_footer_v2() noexcept {
        codec::MainFooter f{};
        f.uuid = uuid_;
        f.created = created_;
        for (u64 id : order_) {
            f.objects.push_back(written_[id].row);
        }
        f.description = cfg_.description;
        if (signer_) {
            const security::VerifyKey vk = signer_->verify_key();
            f.verify_key.assign(vk.b, vk.b + sizeof(vk.b));
        }

        // Size with one more segment entry, in case making room rotates.
        codec::MainFooter estimate = f;
        estimate.segments = segments_.segments();
        const u64 next = segments_.segment_number() + 1;
        estimate.segments[next] = storage::path_file_name(storage::segment_path(base_path_, next));
        if (signer_) {
            estimate.signature.assign(codec::kSignatureBytes, 0);
        }
        std::vector<u8> rec;
        codec::v2::encode_main_footer(estimate, &rec);
        Status s = segments_.ensure_room(rec.size());
        if (!zff::core::is_ok(s)) return fail(s);

        f.segments = segments_.segments();
        if (signer_) {
            std::vector<u8> signed_bytes;
            codec::v2::main_footer_signed_bytes(f, &signed_bytes);
            security::Signature64 sig{};
            s = signer_->sign(codec::view_of(signed_bytes), &sig);
            if (!zff::core::is_ok(s)) return fail(s);
            f.signature.assign(sig.b, sig.b + sizeof(sig.b));
        }
        rec.clear();
        codec::v2::encode_main_footer(f, &rec);
        s = segments_.append_record(codec::RecordKind::MainFooter, 0, codec::view_of(rec), nullptr);
        if (!zff::core::is_ok(s)) return fail(s);
        return zff::core::ok_status();
    }

    Status ContainerWriter::write_main_footer_v1() noexcept {
        codec::MainFooterV1 estimate = v1_footer_;
        estimate.segments = segments_.segments();
        const u64 next = segments_.segment_number() + 1;
        estimate.segments[next] = storage::path_file_name(storage::segment_path(base_path_, next));
        std::vector<u8> rec;
        codec::v1::encode_main_footer(estimate, &rec);
        Status s = segments_.ensure_room(rec.size());
        if (!zff::core::is_ok(s)) return fail(s);

        v1_footer_.segments = segments_.segments();
        rec.clear();
        codec::v1::encode_main_footer(v1_footer_, &rec);
        s = segments_.append_record(codec::RecordKind::MainFooter, 0, codec::view_of(rec), nullptr);
        if (!zff::core::is_ok(s)) return fail(s);
        return zff::core::ok_status();
    }

    Status ContainerWriter::close() noexcept {
        Status s = guard();
        if (!zff::core::is_ok(s)) return s;
        s = finish_active();
        if (!zff::core::is_ok(s)) return s;
        if (!segments_open_) {
            return invalid("v1 container has no object");
        }

        s = cfg_.version == FormatVersion::V1 ? write_main_footer_v1() : write_main_footer_v2();
        if (!zff::core::is_ok(s)) return s;
        s = segments_.finish();
        if (!zff::core::is_ok(s)) return fail(s);
        closed_ = true;
        return zff::core::ok_status();
    }

} // namespace zff::io
