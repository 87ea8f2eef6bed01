#include "zff/io/container_reader.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cstring>
#include <set>

#include "zff/codec/format.hpp"
#include "zff/codec/record.hpp"
#include "zff/security/crypto.hpp"
#include "zff/storage/hashing.hpp"

namespace zff::io {
    namespace {
        using zff::core::FormatVersion;
        using zff::core::ObjectKind;
        using zff::core::Status;
        using zff::core::StatusCode;
        using zff::core::StatusDomain;

        constexpr u64 kTailBytes = 8;

        [[nodiscard]] Status reader_error(StatusCode code, u64 aux = 0, const char* detail = nullptr) noexcept {
            return zff::core::make_status(StatusDomain::Reader, code, aux, detail);
        }

        [[nodiscard]] bool path_exists(const std::string& path) noexcept {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0;
        }

        [[nodiscard]] bool key_is_zero(const security::VerifyKey& vk) noexcept {
            for (u8 b : vk.b) {
                if (b != 0) {
                    return false;
                }
            }
            return true;
        }

        // Decoded length of stream chunk 'index' (0 based).
        [[nodiscard]] u64 chunk_raw_len(u64 index, u64 count, u64 data_length, u64 chunk_size) noexcept {
            if (index + 1 < count) {
                return chunk_size;
            }
            return data_length - index * chunk_size;
        }
    } // namespace

    Status validate(const ReaderOptions& opts) noexcept {
        if (opts.has_trusted_key && key_is_zero(opts.trusted_key)) {
            return reader_error(StatusCode::Invalid, 0, "trusted key");
        }
        return zff::core::ok_status();
    }

    ContainerReader::~ContainerReader() = default;

    // ========================================================================
    // Open
    // ========================================================================

    Status ContainerReader::open(const std::vector<std::string>& paths,
        const ReaderOptions& opts,
        std::unique_ptr<ContainerReader>* out) noexcept {
        if (out == nullptr || paths.empty()) {
            return reader_error(StatusCode::Invalid, 0, "no segment paths");
        }
        Status s = validate(opts);
        if (!zff::core::is_ok(s)) return s;

        std::unique_ptr<ContainerReader> r(new ContainerReader());
        r->opts_ = opts;
        r->registry_ = opts.registry ? opts.registry : storage::AlgorithmRegistry::defaults();
        r->cache_ = std::make_unique<storage::ChunkCache>(opts.cache_chunks, opts.sharable);

        s = r->open_segments(paths);
        if (!zff::core::is_ok(s)) return s;

        db::IndexSnapshot snap{};
        s = r->load_snapshot(&snap);
        if (!zff::core::is_ok(s)) return s;
        r->chunks_ = std::move(snap.chunks);
        r->recovery_.last_chunk = r->chunks_.contiguous_end();

        s = r->version_ == FormatVersion::V1 ? r->load_main_v1(snap) : r->load_main_v2(snap);
        if (!zff::core::is_ok(s)) return s;
        s = r->finish_objects();
        if (!zff::core::is_ok(s)) return s;

        const bool recovered = r->recovery_.recovered;
        *out = std::move(r);
        if (recovered) {
            return reader_error(StatusCode::PartiallyRecovered);
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::open_base(const std::string& base_path,
        const ReaderOptions& opts,
        std::unique_ptr<ContainerReader>* out) noexcept {
        std::vector<std::string> paths;
        for (u64 n = zff::core::kFirstSegmentNumber;; ++n) {
            std::string path = storage::segment_path(base_path, n);
            if (!path_exists(path)) {
                break;
            }
            paths.push_back(std::move(path));
        }
        if (paths.empty()) {
            return reader_error(StatusCode::NotFound, 0, "no segments");
        }
        return open(paths, opts, out);
    }

    Status ContainerReader::open_segments(const std::vector<std::string>& paths) noexcept {
        bool first = true;
        for (const std::string& path : paths) {
            auto file = std::make_unique<storage::SegmentFile>();
            Status s = file->open_read(path);
            if (!zff::core::is_ok(s)) return s;
            file->set_shared(opts_.sharable);
            u64 size = 0;
            s = file->size(&size);
            if (!zff::core::is_ok(s)) return s;

            u8 head[codec::kRecordHeaderBytes];
            s = file->read_at(0, BufferMut{head, sizeof(head)});
            if (!zff::core::is_ok(s)) return s;
            codec::RecordHeader rh{};
            if (codec::record_read_header(BufferView{head, sizeof(head)}, &rh) != codec::RecordParseResult::Ok ||
                rh.kind != codec::RecordKind::SegmentHeader) {
                return reader_error(StatusCode::Malformed, 0, "segment header");
            }
            if (rh.length > size - codec::kRecordHeaderBytes) {
                return reader_error(StatusCode::Malformed, 0, "truncated segment header");
            }
            std::vector<u8> rec(static_cast<size_t>(codec::kRecordHeaderBytes + rh.length));
            s = file->read_at(0, BufferMut{rec.data(), rec.size()});
            if (!zff::core::is_ok(s)) return s;

            codec::SegmentHeader h{};
            u8 version = 0;
            s = codec::decode_segment_header(codec::view_of(rec), &h, &version);
            if (!zff::core::is_ok(s)) return s;

            if (first) {
                uuid_ = h.uuid;
                version_ = static_cast<FormatVersion>(version);
                first = false;
            } else if (h.uuid != uuid_) {
                return reader_error(StatusCode::Inconsistent, h.segment_number, "container uuid mismatch");
            } else if (static_cast<FormatVersion>(version) != version_) {
                return reader_error(StatusCode::Inconsistent, h.segment_number, "format version mismatch");
            }
            if (segments_.count(h.segment_number) != 0) {
                return reader_error(StatusCode::Inconsistent, h.segment_number, "duplicate segment number");
            }

            Segment seg{};
            seg.number = h.segment_number;
            seg.file_size = size;
            seg.file = std::move(file);
            segments_[h.segment_number] = std::move(seg);
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::read_record(u64 segment, u64 offset, codec::RecordKind expect, std::vector<u8>* out)
        const noexcept {
        const auto it = segments_.find(segment);
        if (it == segments_.end()) {
            return reader_error(StatusCode::Inconsistent, segment, "record in unknown segment");
        }
        const Segment& seg = it->second;
        if (offset > seg.file_size || seg.file_size - offset < codec::kRecordHeaderBytes) {
            return reader_error(StatusCode::Malformed, offset, "record offset");
        }
        u8 head[codec::kRecordHeaderBytes];
        Status s = seg.file->read_at(offset, BufferMut{head, sizeof(head)});
        if (!zff::core::is_ok(s)) return s;
        codec::RecordHeader rh{};
        if (codec::record_read_header(BufferView{head, sizeof(head)}, &rh) != codec::RecordParseResult::Ok) {
            return reader_error(StatusCode::Malformed, offset, "record header");
        }
        if (rh.kind != expect) {
            return reader_error(StatusCode::Malformed, offset, "unexpected record kind");
        }
        if (rh.length > seg.file_size - offset - codec::kRecordHeaderBytes) {
            return reader_error(StatusCode::Malformed, offset, "record past segment end");
        }
        out->resize(static_cast<size_t>(codec::kRecordHeaderBytes + rh.length));
        return seg.file->read_at(offset, BufferMut{out->data(), out->size()});
    }

    Status ContainerReader::read_footer(const Segment& seg, codec::SegmentFooter* out) const noexcept {
        if (seg.file_size < kTailBytes) {
            return reader_error(StatusCode::Malformed, seg.number, "segment tail");
        }
        const u64 tail_at = seg.file_size - kTailBytes;
        u8 tail[kTailBytes];
        Status s = seg.file->read_at(tail_at, BufferMut{tail, sizeof(tail)});
        if (!zff::core::is_ok(s)) return s;
        const u64 off = codec::get_u64_le(tail);
        if (off > tail_at || tail_at - off < codec::kRecordHeaderBytes) {
            return reader_error(StatusCode::Malformed, seg.number, "segment footer offset");
        }

        std::vector<u8> rec;
        s = read_record(seg.number, off, codec::RecordKind::SegmentFooter, &rec);
        if (!zff::core::is_ok(s)) {
            if (s.code == StatusCode::Io) return s;
            return reader_error(StatusCode::Malformed, seg.number, "segment footer");
        }
        if (static_cast<u64>(rec.size()) != tail_at - off) {
            return reader_error(StatusCode::Malformed, seg.number, "segment footer length");
        }
        s = codec::decode_segment_footer(codec::view_of(rec), out);
        if (!zff::core::is_ok(s)) return s;
        if (out->segment_number != seg.number || out->footer_offset != off) {
            return reader_error(StatusCode::Malformed, seg.number, "segment footer mismatch");
        }
        return zff::core::ok_status();
    }

    // ========================================================================
    // Chunk map and object locations
    // ========================================================================

    Status ContainerReader::load_snapshot(db::IndexSnapshot* snap) noexcept {
        std::unique_ptr<db::ChunkIndexDb> index;
        if (!opts_.index_db_path.empty()) {
            Status s = db::ChunkIndexDb::open(opts_.index_db_path, &index);
            if (!zff::core::is_ok(s)) return s;

            db::IndexSnapshot cached{};
            s = index->load(uuid_, &cached);
            if (zff::core::is_ok(s)) {
                bool matches = cached.segments.size() == segments_.size();
                for (const db::IndexedSegment& row : cached.segments) {
                    const auto it = segments_.find(row.number);
                    if (!matches || it == segments_.end() || it->second.file_size != row.file_size) {
                        matches = false;
                        break;
                    }
                }
                if (matches) {
                    *snap = std::move(cached);
                    return zff::core::ok_status();
                }
            } else if (s.code != StatusCode::NotFound) {
                return s;
            }
        }

        Status s = snapshot_from_footers(snap);
        if (!zff::core::is_ok(s)) return s;

        // Recovered snapshots are never cached; the next open rescans.
        if (index && !recovery_.recovered) {
            s = index->store(*snap);
            if (!zff::core::is_ok(s)) return s;
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::scan_segment(const Segment& seg,
        db::IndexedSegment* row,
        storage::ChunkMap* chunks,
        std::vector<PlacedRecord>* headers,
        std::vector<PlacedRecord>* footers) noexcept {
        std::vector<u8> rec;
        u64 pos = 0;
        while (seg.file_size - pos >= codec::kRecordHeaderBytes) {
            u8 head[codec::kRecordHeaderBytes];
            Status s = seg.file->read_at(pos, BufferMut{head, sizeof(head)});
            if (!zff::core::is_ok(s)) return s;
            codec::RecordHeader rh{};
            if (codec::record_read_header(BufferView{head, sizeof(head)}, &rh) != codec::RecordParseResult::Ok) {
                break;
            }
            if (rh.length > seg.file_size - pos - codec::kRecordHeaderBytes) {
                break; // truncated record
            }
            const u64 total = codec::kRecordHeaderBytes + rh.length;
            if (rh.kind == codec::RecordKind::SegmentFooter) {
                break;
            }

            if (rh.kind == codec::RecordKind::Chunk || rh.kind == codec::RecordKind::ObjectHeader ||
                rh.kind == codec::RecordKind::ObjectFooter) {
                rec.resize(static_cast<size_t>(total));
                s = seg.file->read_at(pos, BufferMut{rec.data(), rec.size()});
                if (!zff::core::is_ok(s)) return s;
            }

            switch (rh.kind) {
                case codec::RecordKind::Chunk: {
                    codec::ChunkHeader h{};
                    BufferView payload{};
                    if (!zff::core::is_ok(codec::decode_chunk_record(codec::view_of(rec), &h, &payload)) ||
                        storage::crc32_ieee(payload) != h.crc32) {
                        ++recovery_.chunks_dropped;
                        break;
                    }
                    storage::ChunkLocation loc{};
                    loc.segment = seg.number;
                    loc.offset = pos;
                    loc.stored_size = h.stored_size;
                    loc.flags = h.flags;
                    loc.crc32 = h.crc32;
                    if (!zff::core::is_ok(chunks->insert(h.chunk_number, loc))) {
                        ++recovery_.chunks_dropped;
                    }
                    break;
                }
                case codec::RecordKind::ObjectHeader: {
                    codec::ObjectHeader oh{};
                    if (zff::core::is_ok(codec::v2::decode_object_header(codec::view_of(rec), &oh))) {
                        headers->push_back(PlacedRecord{oh.object_id, seg.number, pos});
                    }
                    break;
                }
                case codec::RecordKind::ObjectFooter: {
                    codec::SealedRecord sealed{};
                    bool is_sealed = false;
                    if (!zff::core::is_ok(codec::v2::decode_sealed_record(codec::view_of(rec),
                            codec::RecordKind::ObjectFooter,
                            &sealed,
                            &is_sealed))) {
                        break;
                    }
                    if (is_sealed) {
                        footers->push_back(PlacedRecord{sealed.object_id, seg.number, pos});
                        break;
                    }
                    codec::ObjectFooter of{};
                    if (zff::core::is_ok(codec::v2::decode_object_footer(codec::view_of(rec), &of))) {
                        footers->push_back(PlacedRecord{of.object_id, seg.number, pos});
                    }
                    break;
                }
                case codec::RecordKind::MainHeader:
                    row->has_main_header = true;
                    row->main_header_offset = pos;
                    break;
                case codec::RecordKind::MainFooter:
                    row->has_main_footer = true;
                    row->main_footer_offset = pos;
                    break;
                default:
                    break;
            }
            pos += total;
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::snapshot_from_footers(db::IndexSnapshot* snap) noexcept {
        snap->uuid = uuid_;
        std::vector<PlacedRecord> headers;
        std::vector<PlacedRecord> footers;
        std::set<u64> scanned;

        for (const auto& kv : segments_) {
            const Segment& seg = kv.second;
            db::IndexedSegment row{};
            row.number = seg.number;
            row.file_size = seg.file_size;

            codec::SegmentFooter f{};
            Status s = read_footer(seg, &f);
            if (zff::core::is_ok(s)) {
                row.has_main_header = f.has_main_header;
                row.main_header_offset = f.main_header_offset;
                row.has_main_footer = f.has_main_footer;
                row.main_footer_offset = f.main_footer_offset;
                s = snap->chunks.merge_footer(f);
                if (!zff::core::is_ok(s)) return s;
                for (const codec::ObjectOffsetRow& r : f.object_headers) {
                    headers.push_back(PlacedRecord{r.object_id, seg.number, r.offset});
                }
                for (const codec::ObjectOffsetRow& r : f.object_footers) {
                    footers.push_back(PlacedRecord{r.object_id, seg.number, r.offset});
                }
            } else {
                if (s.code == StatusCode::Io) return s;
                if (!opts_.resync) {
                    return reader_error(StatusCode::Malformed, seg.number, "segment footer missing");
                }
                s = scan_segment(seg, &row, &snap->chunks, &headers, &footers);
                if (!zff::core::is_ok(s)) return s;
                scanned.insert(seg.number);
                recovery_.recovered = true;
                ++recovery_.segments_scanned;
            }
            snap->segments.push_back(row);
        }

        const bool has_main_footer = std::any_of(snap->segments.begin(), snap->segments.end(),
            [](const db::IndexedSegment& row) { return row.has_main_footer; });
        if (!has_main_footer) {
            if (!opts_.resync) {
                return reader_error(StatusCode::Malformed, 0, "main footer missing");
            }
            recovery_.recovered = true;
        }

        if (recovery_.recovered) {
            // Keep the run 1..N; anything after the first gap is unusable.
            const u64 end = snap->chunks.contiguous_end();
            storage::ChunkMap kept;
            for (const auto& kv : snap->chunks.entries()) {
                if (kv.first > end) {
                    ++recovery_.chunks_dropped;
                    continue;
                }
                if (scanned.count(kv.second.segment) != 0) {
                    ++recovery_.chunks_recovered;
                }
                const Status s = kept.insert(kv.first, kv.second);
                if (!zff::core::is_ok(s)) return s;
            }
            snap->chunks = std::move(kept);
        } else {
            const Status s = snap->chunks.check_dense();
            if (!zff::core::is_ok(s)) return s;
        }

        std::sort(headers.begin(), headers.end(), [](const PlacedRecord& a, const PlacedRecord& b) {
            return a.segment != b.segment ? a.segment < b.segment : a.offset < b.offset;
        });
        std::map<u64, PlacedRecord> footer_by_id;
        for (const PlacedRecord& f : footers) {
            if (!footer_by_id.emplace(f.object_id, f).second) {
                return reader_error(StatusCode::Inconsistent, f.object_id, "duplicate object footer");
            }
        }
        std::set<u64> seen;
        for (const PlacedRecord& h : headers) {
            if (!seen.insert(h.object_id).second) {
                return reader_error(StatusCode::Inconsistent, h.object_id, "duplicate object header");
            }
            db::IndexedObject o{};
            o.object_id = h.object_id;
            o.header_segment = h.segment;
            o.header_offset = h.offset;
            const auto it = footer_by_id.find(h.object_id);
            if (it != footer_by_id.end()) {
                o.has_footer = true;
                o.footer_segment = it->second.segment;
                o.footer_offset = it->second.offset;
            }
            snap->objects.push_back(o);
        }
        for (const auto& kv : footer_by_id) {
            if (seen.count(kv.first) == 0) {
                return reader_error(StatusCode::Inconsistent, kv.first, "object footer without header");
            }
        }
        return zff::core::ok_status();
    }

    // ========================================================================
    // Main records and objects
    // ========================================================================

    Status ContainerReader::check_main_signature(const codec::MainFooter& f) const noexcept {
        security::VerifyKey vk{};
        if (opts_.has_trusted_key) {
            vk = opts_.trusted_key;
        } else if (f.verify_key.size() == sizeof(vk.b)) {
            std::memcpy(vk.b, f.verify_key.data(), sizeof(vk.b));
        } else {
            return reader_error(StatusCode::SignatureInvalid, 0, "main footer key");
        }
        if (f.signature.size() != codec::kSignatureBytes) {
            return reader_error(StatusCode::SignatureInvalid, 0, "main footer signature");
        }
        security::Signature64 sig{};
        std::memcpy(sig.b, f.signature.data(), sizeof(sig.b));
        std::vector<u8> signed_bytes;
        codec::v2::main_footer_signed_bytes(f, &signed_bytes);
        if (!zff::core::is_ok(security::verify_detached(vk, codec::view_of(signed_bytes), sig))) {
            return reader_error(StatusCode::SignatureInvalid, 0, "main footer");
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::open_object_record(const ObjectState& st,
        codec::RecordKind kind,
        u64 number,
        std::vector<u8>* rec) const noexcept {
        codec::SealedRecord sealed{};
        bool is_sealed = false;
        Status s = codec::v2::decode_sealed_record(codec::view_of(*rec), kind, &sealed, &is_sealed);
        if (!zff::core::is_ok(s)) return s;

        const bool encrypted = st.info.chunking.encryption.aead != zff::core::AeadId::None;
        if (is_sealed != encrypted) {
            return reader_error(StatusCode::Malformed, st.info.id,
                encrypted ? "plain record in an encrypted object" : "sealed record in a plain object");
        }
        if (!is_sealed) {
            return zff::core::ok_status();
        }
        if (sealed.object_id != st.info.id || sealed.number != number) {
            return reader_error(StatusCode::Inconsistent, st.info.id, "sealed record mismatch");
        }
        if (!zff::core::is_ok(st.codec_status)) {
            return st.codec_status;
        }
        if (!st.codec) {
            return reader_error(StatusCode::Unavailable, st.info.id, "no key");
        }
        std::vector<u8> plain;
        s = st.codec->open_record(kind, number, codec::view_of(sealed.sealed), &plain);
        if (!zff::core::is_ok(s)) return s;
        *rec = std::move(plain);
        return zff::core::ok_status();
    }

    // Encrypted object whose footer cannot be opened with the supplied key.
    // The object stays listed; the chunk range comes from the main footer
    // and everything else waits for the right key.
    Status ContainerReader::seal_unopened(Status why, ObjectState* st) noexcept {
        ObjectInfo& info = st->info;
        st->codec_status = why;
        st->codec.reset();
        info.footer_open = false;

        if (has_main_footer_) {
            for (const codec::ObjectTableRow& t : main_footer_.objects) {
                if (t.object_id != info.id) {
                    continue;
                }
                if (t.first_chunk != 0) {
                    if (t.last_chunk < t.first_chunk) {
                        return reader_error(StatusCode::Inconsistent, info.id, "object table chunk range");
                    }
                    info.first_chunk = t.first_chunk;
                    info.chunk_count = t.last_chunk - t.first_chunk + 1;
                }
                return zff::core::ok_status();
            }
        }
        info.complete = false;
        ++recovery_.objects_incomplete;
        return zff::core::ok_status();
    }

    Status ContainerReader::load_files(const codec::ObjectFooter& footer, ObjectState* st) noexcept {
        std::vector<u8> rec;
        for (const codec::FileLocation& loc : footer.files) {
            codec::FileHeader fh{};
            Status s = read_record(loc.header_segment, loc.header_offset, codec::RecordKind::FileHeader, &rec);
            if (!zff::core::is_ok(s)) return s;
            s = open_object_record(*st, codec::RecordKind::FileHeader, loc.file_number, &rec);
            if (!zff::core::is_ok(s)) return s;
            s = codec::v2::decode_file_header(codec::view_of(rec), &fh);
            if (!zff::core::is_ok(s)) return s;

            codec::FileFooter ff{};
            s = read_record(loc.footer_segment, loc.footer_offset, codec::RecordKind::FileFooter, &rec);
            if (!zff::core::is_ok(s)) return s;
            s = open_object_record(*st, codec::RecordKind::FileFooter, loc.file_number, &rec);
            if (!zff::core::is_ok(s)) return s;
            s = codec::v2::decode_file_footer(codec::view_of(rec), &ff);
            if (!zff::core::is_ok(s)) return s;

            if (fh.object_id != footer.object_id || ff.object_id != footer.object_id ||
                fh.file_number != loc.file_number || ff.file_number != loc.file_number) {
                return reader_error(StatusCode::Inconsistent, loc.file_number, "file record mismatch");
            }

            FileInfo fi{};
            fi.file_number = loc.file_number;
            fi.type = fh.type;
            fi.parent = fh.parent;
            fi.name = std::move(fh.name);
            fi.metadata = std::move(fh.metadata);
            fi.data_length = ff.data_length;
            fi.first_chunk = ff.first_chunk;
            fi.chunk_count = ff.chunk_count;
            fi.acquisition_start = ff.acquisition_start;
            fi.acquisition_end = ff.acquisition_end;
            fi.digests = std::move(ff.digests);
            st->files.push_back(std::move(fi));
        }
        st->info.file_count = static_cast<u64>(st->files.size());
        return zff::core::ok_status();
    }

    Status ContainerReader::load_object_v2(const db::IndexedObject& row, ObjectState* st) noexcept {
        std::vector<u8> rec;
        Status s = read_record(row.header_segment, row.header_offset, codec::RecordKind::ObjectHeader, &rec);
        if (!zff::core::is_ok(s)) return s;
        codec::ObjectHeader oh{};
        s = codec::v2::decode_object_header(codec::view_of(rec), &oh);
        if (!zff::core::is_ok(s)) return s;
        if (oh.object_id != row.object_id) {
            return reader_error(StatusCode::Inconsistent, row.object_id, "object header id");
        }

        ObjectInfo& info = st->info;
        info.id = oh.object_id;
        info.kind = oh.kind;
        info.chunking = std::move(oh.chunking);
        info.first_segment = row.header_segment;

        s = prepare_object(st);
        if (!zff::core::is_ok(s)) return s;

        if (!row.has_footer) {
            if (!recovery_.recovered) {
                return reader_error(StatusCode::Inconsistent, row.object_id, "object footer missing");
            }
            info.complete = false;
            ++recovery_.objects_incomplete;
            return zff::core::ok_status();
        }

        s = read_record(row.footer_segment, row.footer_offset, codec::RecordKind::ObjectFooter, &rec);
        if (!zff::core::is_ok(s)) return s;
        s = open_object_record(*st, codec::RecordKind::ObjectFooter, 0, &rec);
        if (!zff::core::is_ok(s)) {
            const bool key_problem = s.code == StatusCode::DecryptError ||
                (s.code == st->codec_status.code && s.domain == st->codec_status.domain);
            if (info.chunking.encryption.aead == zff::core::AeadId::None || !key_problem) {
                return s;
            }
            return seal_unopened(s, st);
        }
        codec::ObjectFooter of{};
        s = codec::v2::decode_object_footer(codec::view_of(rec), &of);
        if (!zff::core::is_ok(s)) return s;
        if (of.object_id != row.object_id || of.kind != info.kind) {
            return reader_error(StatusCode::Inconsistent, row.object_id, "object footer mismatch");
        }
        info.data_length = of.data_length;
        info.first_chunk = of.first_chunk;
        info.chunk_count = of.chunk_count;
        info.acquisition_start = of.acquisition_start;
        info.acquisition_end = of.acquisition_end;
        info.digests = of.digests;

        switch (info.kind) {
            case ObjectKind::Logical:
                return load_files(of, st);
            case ObjectKind::Virtual: {
                s = read_record(of.virtual_map_segment, of.virtual_map_offset, codec::RecordKind::VirtualMap, &rec);
                if (!zff::core::is_ok(s)) return s;
                codec::VirtualMap vm{};
                s = codec::v2::decode_virtual_map(codec::view_of(rec), &vm);
                if (!zff::core::is_ok(s)) return s;
                if (vm.object_id != info.id || vm.length != info.data_length) {
                    return reader_error(StatusCode::Inconsistent, info.id, "virtual map mismatch");
                }
                return st->vmap.build(vm);
            }
            case ObjectKind::Physical:
                break;
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::load_main_v2(const db::IndexSnapshot& snap) noexcept {
        const db::IndexedSegment* mf = nullptr;
        for (const db::IndexedSegment& row : snap.segments) {
            if (row.has_main_footer) {
                mf = &row;
            }
        }

        if (mf != nullptr) {
            std::vector<u8> rec;
            Status s = read_record(mf->number, mf->main_footer_offset, codec::RecordKind::MainFooter, &rec);
            if (!zff::core::is_ok(s)) return s;
            s = codec::v2::decode_main_footer(codec::view_of(rec), &main_footer_);
            if (!zff::core::is_ok(s)) return s;
            if (main_footer_.uuid != uuid_) {
                return reader_error(StatusCode::Inconsistent, 0, "main footer uuid");
            }
            has_main_footer_ = true;
            created_ = main_footer_.created;
            description_ = main_footer_.description;

            if (!recovery_.recovered) {
                for (const auto& kv : main_footer_.segments) {
                    if (segments_.count(kv.first) == 0) {
                        return reader_error(StatusCode::Inconsistent, kv.first, "segment missing");
                    }
                }
            }
            if (opts_.verify_signatures && !main_footer_.signature.empty()) {
                s = check_main_signature(main_footer_);
                if (!zff::core::is_ok(s)) return s;
            }
        }

        for (const db::IndexedObject& row : snap.objects) {
            auto st = std::make_unique<ObjectState>();
            const Status s = load_object_v2(row, st.get());
            if (!zff::core::is_ok(s)) return s;
            order_.push_back(row.object_id);
            objects_[row.object_id] = std::move(st);
        }

        if (has_main_footer_) {
            for (const codec::ObjectTableRow& t : main_footer_.objects) {
                const ObjectState* st = find_object(t.object_id);
                if (st == nullptr) {
                    return reader_error(StatusCode::Inconsistent, t.object_id, "object table entry without object");
                }
                if (!st->info.complete) {
                    continue;
                }
                const bool has_chunks = st->info.chunk_count > 0;
                const u64 first = has_chunks ? st->info.first_chunk : 0;
                const u64 last = has_chunks ? st->info.first_chunk + st->info.chunk_count - 1 : 0;
                if (t.first_chunk != first || t.last_chunk != last) {
                    return reader_error(StatusCode::Inconsistent, t.object_id, "object table chunk range");
                }
            }
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::load_main_v1(const db::IndexSnapshot& snap) noexcept {
        const db::IndexedSegment* first = nullptr;
        const db::IndexedSegment* mf = nullptr;
        for (const db::IndexedSegment& row : snap.segments) {
            if (row.number == zff::core::kFirstSegmentNumber) {
                first = &row;
            }
            if (row.has_main_footer) {
                mf = &row;
            }
        }
        if (first == nullptr || !first->has_main_header) {
            return reader_error(StatusCode::Malformed, zff::core::kFirstSegmentNumber, "main header missing");
        }

        std::vector<u8> rec;
        Status s = read_record(first->number, first->main_header_offset, codec::RecordKind::MainHeader, &rec);
        if (!zff::core::is_ok(s)) return s;
        codec::MainHeaderV1 mh{};
        s = codec::v1::decode_main_header(codec::view_of(rec), &mh);
        if (!zff::core::is_ok(s)) return s;
        if (mh.uuid != uuid_) {
            return reader_error(StatusCode::Inconsistent, 0, "main header uuid");
        }
        created_ = mh.created;
        description_ = mh.chunking.description;

        auto st = std::make_unique<ObjectState>();
        ObjectInfo& info = st->info;
        info.id = zff::core::kV1ImplicitObject.v;
        info.kind = ObjectKind::Physical;
        info.chunking = std::move(mh.chunking);
        info.first_segment = zff::core::kFirstSegmentNumber;
        s = prepare_object(st.get());
        if (!zff::core::is_ok(s)) return s;

        if (mf != nullptr) {
            s = read_record(mf->number, mf->main_footer_offset, codec::RecordKind::MainFooter, &rec);
            if (!zff::core::is_ok(s)) return s;
            codec::MainFooterV1 f{};
            s = codec::v1::decode_main_footer(codec::view_of(rec), &f);
            if (!zff::core::is_ok(s)) return s;
            if (!recovery_.recovered) {
                for (const auto& kv : f.segments) {
                    if (segments_.count(kv.first) == 0) {
                        return reader_error(StatusCode::Inconsistent, kv.first, "segment missing");
                    }
                }
            }
            info.data_length = f.data_length;
            info.first_chunk = f.first_chunk;
            info.chunk_count = f.chunk_count;
            info.acquisition_start = f.acquisition_start;
            info.acquisition_end = f.acquisition_end;
            info.digests = std::move(f.digests);
        } else {
            info.complete = false;
            ++recovery_.objects_incomplete;
        }

        order_.push_back(info.id);
        objects_[info.id] = std::move(st);
        return zff::core::ok_status();
    }

    Status ContainerReader::prepare_object(ObjectState* st) noexcept {
        const ObjectInfo& info = st->info;
        const codec::ChunkingDescriptor& d = info.chunking;

        if (opts_.has_trusted_key) {
            st->signer = std::make_unique<storage::Ed25519Signer>(opts_.trusted_key);
        } else if (d.verify_key.size() == sizeof(security::VerifyKey::b)) {
            security::VerifyKey vk{};
            std::memcpy(vk.b, d.verify_key.data(), sizeof(vk.b));
            st->signer = std::make_unique<storage::Ed25519Signer>(vk);
        }
        if (info.kind == ObjectKind::Virtual) {
            return zff::core::ok_status();
        }
        if (!zff::core::is_power_of_two(d.chunk_size) || d.chunk_size < zff::core::kMinChunkSize) {
            return reader_error(StatusCode::Malformed, info.id, "chunk size");
        }

        storage::ChunkCodecConfig cc{};
        cc.object_id = info.id;
        cc.chunk_size = d.chunk_size;
        cc.compression = d.compression;
        cc.aead = d.encryption.aead;
        cc.detect_same_bytes = d.detect_same_bytes;
        cc.signer = st->signer.get();
        cc.verify_signatures = opts_.verify_signatures;

        // Missing or unusable keys do not fail the open; reads of the object
        // report codec_status instead.
        if (cc.aead != zff::core::AeadId::None) {
            const security::KeyMaterial* material = opts_.keys.lookup(info.id);
            if (material == nullptr || material->empty()) {
                st->codec_status = reader_error(StatusCode::Unavailable, info.id, "no key");
                return zff::core::ok_status();
            }
            const Status s = storage::derive_chunk_key(*registry_, d.encryption, *material, info.id, &cc.key);
            if (!zff::core::is_ok(s)) {
                st->codec_status = s;
                return zff::core::ok_status();
            }
        }
        st->codec = std::make_unique<storage::ChunkCodec>(registry_, cc);
        st->codec_status = st->codec->prepare();
        return zff::core::ok_status();
    }

    Status ContainerReader::finish_objects() noexcept {
        const u64 end = chunks_.contiguous_end();
        u64 cursor = zff::core::kFirstChunkNumber;
        for (size_t i = 0; i < order_.size(); ++i) {
            ObjectState& st = *objects_[order_[i]];
            ObjectInfo& info = st.info;
            const u64 chunk_size = info.chunking.chunk_size;

            if (info.complete) {
                if (info.chunk_count == 0) {
                    continue;
                }
                const u64 last = info.first_chunk + info.chunk_count - 1;
                if (info.first_chunk == 0 || last < info.first_chunk || last > end) {
                    if (!recovery_.recovered || info.first_chunk == 0 || info.first_chunk > end + 1) {
                        return reader_error(StatusCode::Inconsistent, info.id, "object chunk range");
                    }
                    // Chunks lost to resync: keep the readable prefix.
                    info.complete = false;
                    info.chunk_count = end - info.first_chunk + 1;
                    info.data_length = std::min(info.data_length, info.chunk_count * chunk_size);
                    ++recovery_.objects_incomplete;
                }
                cursor = std::max(cursor, info.first_chunk + info.chunk_count);
                continue;
            }

            // Incomplete: own every chunk up to the next object that has some.
            u64 limit = end;
            for (size_t j = i + 1; j < order_.size(); ++j) {
                const ObjectInfo& next = objects_[order_[j]]->info;
                if (next.complete && next.chunk_count > 0) {
                    limit = next.first_chunk - 1;
                    break;
                }
            }
            if (limit < cursor) {
                continue;
            }
            const u64 count = limit - cursor + 1;
            cursor = limit + 1;
            if (info.kind != ObjectKind::Physical) {
                continue; // logical files are unknown without the footer
            }
            info.first_chunk = limit - count + 1;
            info.chunk_count = count;
            info.data_length = count * chunk_size;

            storage::ChunkData last;
            if (zff::core::is_ok(st.codec_status) && st.codec &&
                zff::core::is_ok(load_chunk(st, limit, chunk_size, false, &last))) {
                info.data_length = (count - 1) * chunk_size + static_cast<u64>(last->size());
            }
        }
        return zff::core::ok_status();
    }

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<u64> ContainerReader::objects() const {
        return order_;
    }

    const ContainerReader::ObjectState* ContainerReader::find_object(u64 object_id) const noexcept {
        const auto it = objects_.find(object_id);
        return it == objects_.end() ? nullptr : it->second.get();
    }

    Status ContainerReader::object_info(u64 object_id, ObjectInfo* out) const noexcept {
        const ObjectState* st = find_object(object_id);
        if (st == nullptr) {
            return reader_error(StatusCode::NotFound, object_id, "object");
        }
        *out = st->info;
        return zff::core::ok_status();
    }

    Status ContainerReader::files(u64 object_id, std::vector<FileInfo>* out) const noexcept {
        const ObjectState* st = find_object(object_id);
        if (st == nullptr) {
            return reader_error(StatusCode::NotFound, object_id, "object");
        }
        if (st->info.kind != ObjectKind::Logical) {
            return reader_error(StatusCode::Invalid, object_id, "not a logical object");
        }
        if (!st->info.footer_open) {
            return st->codec_status;
        }
        *out = st->files;
        return zff::core::ok_status();
    }

    Status ContainerReader::chunk_info(u64 chunk_number, storage::ChunkLocation* out) const noexcept {
        const storage::ChunkLocation* loc = chunks_.find(chunk_number);
        if (loc == nullptr) {
            return reader_error(StatusCode::NotFound, chunk_number, "chunk");
        }
        *out = *loc;
        return zff::core::ok_status();
    }

    // ========================================================================
    // Reads
    // ========================================================================

    Status ContainerReader::load_chunk(const ObjectState& st,
        u64 chunk_number,
        u64 raw_len,
        bool exact,
        storage::ChunkData* out) const noexcept {
        if (exact) {
            storage::ChunkData hit = cache_->get(chunk_number);
            if (hit && static_cast<u64>(hit->size()) == raw_len) {
                *out = std::move(hit);
                return zff::core::ok_status();
            }
        }

        const storage::ChunkLocation* loc = chunks_.find(chunk_number);
        if (loc == nullptr) {
            return reader_error(StatusCode::Inconsistent, chunk_number, "chunk missing");
        }
        const auto seg = segments_.find(loc->segment);
        if (seg == segments_.end()) {
            return reader_error(StatusCode::Inconsistent, loc->segment, "chunk in unknown segment");
        }
        const u64 size = codec::chunk_record_size(loc->stored_size, codec::chunk_has_signature(loc->flags));
        if (loc->offset > seg->second.file_size || size > seg->second.file_size - loc->offset) {
            return reader_error(StatusCode::Corrupt, chunk_number, "chunk past segment end");
        }
        std::vector<u8> rec(static_cast<size_t>(size));
        Status s = seg->second.file->read_at(loc->offset, BufferMut{rec.data(), rec.size()});
        if (!zff::core::is_ok(s)) return s;

        codec::ChunkHeader h{};
        BufferView payload{};
        s = codec::decode_chunk_record(codec::view_of(rec), &h, &payload);
        if (!zff::core::is_ok(s)) {
            return reader_error(StatusCode::Corrupt, chunk_number, "chunk framing");
        }
        if (h.chunk_number != chunk_number || h.stored_size != loc->stored_size || h.flags != loc->flags ||
            h.crc32 != loc->crc32) {
            return reader_error(StatusCode::Corrupt, chunk_number, "chunk header mismatch");
        }

        std::vector<u8> decoded;
        s = st.codec->decode(h, payload, raw_len, exact, &decoded);
        if (!zff::core::is_ok(s)) return s;

        auto data = std::make_shared<const std::vector<u8>>(std::move(decoded));
        if (exact) {
            cache_->put(chunk_number, data);
        }
        *out = std::move(data);
        return zff::core::ok_status();
    }

    Status ContainerReader::read_stream(const ObjectState& st,
        const Stream& stream,
        u64 offset,
        u64 length,
        std::vector<u8>* out) const noexcept {
        if (!st.info.footer_open) {
            return st.codec_status; // length unknown until the footer opens
        }
        if (offset > stream.data_length || length > stream.data_length - offset) {
            return reader_error(StatusCode::OutOfRange, offset);
        }
        if (length == 0) {
            return zff::core::ok_status();
        }
        if (!zff::core::is_ok(st.codec_status)) {
            return st.codec_status;
        }
        if (!st.codec) {
            return reader_error(StatusCode::Unavailable, st.info.id);
        }

        const u64 c = st.info.chunking.chunk_size;
        const u64 i0 = offset / c;
        const u64 ilast = (offset + length - 1) / c;
        if (ilast >= stream.chunk_count) {
            return reader_error(StatusCode::Inconsistent, st.info.id, "length exceeds chunks");
        }
        out->reserve(out->size() + static_cast<size_t>(length));
        for (u64 i = i0; i <= ilast; ++i) {
            const u64 raw_len = chunk_raw_len(i, stream.chunk_count, stream.data_length, c);
            storage::ChunkData data;
            const Status s = load_chunk(st, stream.first_chunk + i, raw_len, true, &data);
            if (!zff::core::is_ok(s)) return s;

            const u64 begin = i == i0 ? offset - i * c : 0;
            const u64 end = std::min(raw_len, offset + length - i * c);
            out->insert(out->end(), data->begin() + static_cast<std::ptrdiff_t>(begin),
                data->begin() + static_cast<std::ptrdiff_t>(end));
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::read_object(u64 object_id, u64 offset, u64 length, int depth, std::vector<u8>* out)
        const noexcept {
        const ObjectState* st = find_object(object_id);
        if (st == nullptr) {
            return reader_error(depth == 0 ? StatusCode::NotFound : StatusCode::Inconsistent, object_id, "object");
        }

        switch (st->info.kind) {
            case ObjectKind::Logical:
                return reader_error(StatusCode::Invalid, object_id, "logical objects are read per file");
            case ObjectKind::Physical: {
                const Stream stream{st->info.first_chunk, st->info.chunk_count, st->info.data_length};
                return read_stream(*st, stream, offset, length, out);
            }
            case ObjectKind::Virtual:
                break;
        }

        if (depth >= kMaxVirtualDepth) {
            return reader_error(StatusCode::Inconsistent, object_id, "virtual chain too deep");
        }
        std::vector<VirtualPiece> pieces;
        const Status s = st->vmap.plan(offset, length, &pieces);
        if (!zff::core::is_ok(s)) return s;
        for (const VirtualPiece& p : pieces) {
            if (p.zero) {
                out->insert(out->end(), static_cast<size_t>(p.length), u8{0});
                continue;
            }
            const Status r = read_object(p.source_object, p.source_offset, p.length, depth + 1, out);
            if (!zff::core::is_ok(r)) return r;
        }
        return zff::core::ok_status();
    }

    Status ContainerReader::read(u64 object_id, u64 offset, u64 length, std::vector<u8>* out) const noexcept {
        if (out == nullptr) {
            return reader_error(StatusCode::Invalid);
        }
        out->clear();
        const Status s = read_object(object_id, offset, length, 0, out);
        if (!zff::core::is_ok(s)) {
            out->clear();
        }
        return s;
    }

    Status ContainerReader::read_file(u64 object_id, u64 file_number, u64 offset, u64 length, std::vector<u8>* out)
        const noexcept {
        if (out == nullptr) {
            return reader_error(StatusCode::Invalid);
        }
        out->clear();
        const ObjectState* st = find_object(object_id);
        if (st == nullptr) {
            return reader_error(StatusCode::NotFound, object_id, "object");
        }
        if (st->info.kind != ObjectKind::Logical) {
            return reader_error(StatusCode::Invalid, object_id, "not a logical object");
        }
        if (!st->info.footer_open) {
            return st->codec_status;
        }
        const auto it = std::find_if(st->files.begin(), st->files.end(),
            [file_number](const FileInfo& f) { return f.file_number == file_number; });
        if (it == st->files.end()) {
            return reader_error(StatusCode::NotFound, file_number, "file");
        }
        const Stream stream{it->first_chunk, it->chunk_count, it->data_length};
        const Status s = read_stream(*st, stream, offset, length, out);
        if (!zff::core::is_ok(s)) {
            out->clear();
        }
        return s;
    }

    // ========================================================================
    // Verify
    // ========================================================================

    void ContainerReader::verify_stream(const ObjectState& st,
        const Stream& stream,
        const std::vector<codec::DigestEntry>& digests,
        u64 file_number,
        VerifyReport* report) const noexcept {
        const u64 id = st.info.id;
        if (stream.chunk_count == 0 && stream.data_length == 0 && digests.empty()) {
            return;
        }
        if (!zff::core::is_ok(st.codec_status) || !st.codec) {
            report->chunks_checked += stream.chunk_count;
            report->chunks_failed += stream.chunk_count;
            const Status s = zff::core::is_ok(st.codec_status) ? reader_error(StatusCode::Unavailable, id)
                                                               : st.codec_status;
            report->issues.push_back(VerifyIssue{s, id, file_number, 0});
            return;
        }

        std::vector<zff::core::HashId> ids;
        for (const codec::DigestEntry& d : digests) {
            ids.push_back(d.hash);
        }
        storage::HashSet hashes;
        Status s = hashes.init(*registry_, ids);
        if (!zff::core::is_ok(s)) {
            report->issues.push_back(VerifyIssue{s, id, file_number, 0});
        }
        bool hashes_usable = zff::core::is_ok(s);

        // Every chunk but the last is full; the last holds 1..C bytes.
        const u64 c = st.info.chunking.chunk_size;
        bool length_ok = stream.chunk_count == 0 ? stream.data_length == 0
                                                 : stream.data_length > (stream.chunk_count - 1) * c &&
                                                       stream.data_length <= stream.chunk_count * c;
        if (!length_ok) {
            report->issues.push_back(
                VerifyIssue{reader_error(StatusCode::Inconsistent, id, "length does not match chunks"), id,
                    file_number, 0});
            hashes_usable = false;
        }
        for (u64 i = 0; i < stream.chunk_count; ++i) {
            const u64 k = stream.first_chunk + i;
            ++report->chunks_checked;
            const u64 raw_len = length_ok ? chunk_raw_len(i, stream.chunk_count, stream.data_length, c) : c;
            storage::ChunkData data;
            s = load_chunk(st, k, raw_len, length_ok, &data);
            if (!zff::core::is_ok(s)) {
                ++report->chunks_failed;
                report->issues.push_back(VerifyIssue{s, id, file_number, k});
                hashes_usable = false;
                continue;
            }
            if (hashes_usable) {
                s = hashes.update(codec::view_of(*data));
                if (!zff::core::is_ok(s)) {
                    report->issues.push_back(VerifyIssue{s, id, file_number, k});
                    hashes_usable = false;
                }
            }
        }

        if (hashes_usable && !digests.empty()) {
            std::vector<codec::DigestEntry> computed;
            s = hashes.finalize(&computed);
            if (!zff::core::is_ok(s)) {
                report->issues.push_back(VerifyIssue{s, id, file_number, 0});
            } else {
                for (const codec::DigestEntry& want : digests) {
                    const auto got = std::find_if(computed.begin(), computed.end(),
                        [&want](const codec::DigestEntry& d) { return d.hash == want.hash; });
                    ++report->digests_checked;
                    if (got == computed.end() || got->digest != want.digest) {
                        ++report->digests_mismatched;
                        report->issues.push_back(VerifyIssue{
                            reader_error(StatusCode::Corrupt, static_cast<u64>(want.hash), "digest mismatch"), id,
                            file_number, 0});
                    }
                }
            }
        }

        if (!opts_.verify_signatures) {
            return;
        }
        for (const codec::DigestEntry& d : digests) {
            if (d.signature.empty()) {
                continue;
            }
            ++report->signatures_checked;
            Status vs = reader_error(StatusCode::SignatureInvalid, static_cast<u64>(d.hash), "digest signature");
            if (st.signer && d.signature.size() == codec::kSignatureBytes) {
                security::Signature64 sig{};
                std::memcpy(sig.b, d.signature.data(), sizeof(sig.b));
                if (zff::core::is_ok(st.signer->verify(codec::view_of(d.digest), sig))) {
                    vs = zff::core::ok_status();
                }
            }
            if (!zff::core::is_ok(vs)) {
                report->issues.push_back(VerifyIssue{vs, id, file_number, 0});
            }
        }
    }

    Status ContainerReader::verify(VerifyReport* out) const noexcept {
        if (out == nullptr) {
            return reader_error(StatusCode::Invalid);
        }
        VerifyReport report{};

        if (has_main_footer_ && !main_footer_.signature.empty()) {
            report.main_footer_signed = true;
            ++report.signatures_checked;
            const Status s = check_main_signature(main_footer_);
            if (!zff::core::is_ok(s)) {
                report.main_footer_ok = false;
                report.issues.push_back(VerifyIssue{s, 0, 0, 0});
            }
        }

        for (u64 id : order_) {
            const ObjectState& st = *objects_.find(id)->second;
            ++report.objects_checked;
            if (!st.info.complete) {
                report.issues.push_back(
                    VerifyIssue{reader_error(StatusCode::PartiallyRecovered, id, "object incomplete"), id, 0, 0});
            }
            if (!st.info.footer_open) {
                report.chunks_checked += st.info.chunk_count;
                report.chunks_failed += st.info.chunk_count;
                report.issues.push_back(VerifyIssue{st.codec_status, id, 0, 0});
                continue;
            }
            switch (st.info.kind) {
                case ObjectKind::Physical:
                    verify_stream(st, Stream{st.info.first_chunk, st.info.chunk_count, st.info.data_length},
                        st.info.digests, 0, &report);
                    break;
                case ObjectKind::Logical:
                    for (const FileInfo& f : st.files) {
                        ++report.files_checked;
                        verify_stream(st, Stream{f.first_chunk, f.chunk_count, f.data_length}, f.digests,
                            f.file_number, &report);
                    }
                    break;
                case ObjectKind::Virtual:
                    for (const codec::VirtualMapEntry& e : st.vmap.entries()) {
                        const ObjectState* src = find_object(e.source_object);
                        if (src == nullptr ||
                            (src->info.footer_open && e.source_start + e.length > src->info.data_length)) {
                            report.issues.push_back(VerifyIssue{
                                reader_error(StatusCode::Inconsistent, e.source_object, "virtual map source"), id,
                                0, 0});
                        }
                    }
                    break;
            }
        }

        if (report.chunks_checked < chunks_.size()) {
            report.issues.push_back(VerifyIssue{
                reader_error(StatusCode::Inconsistent, chunks_.size() - report.chunks_checked,
                    "chunks not owned by any object"),
                0, 0, 0});
        }

        *out = std::move(report);
        return zff::core::ok_status();
    }

} // namespace zff::io
