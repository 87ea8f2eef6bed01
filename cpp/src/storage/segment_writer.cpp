#include "zff/storage/segment_writer.hpp"

#include <algorithm>

#include "zff/codec/format.hpp"

namespace zff::storage {
    namespace {
        using zff::core::Status;
        using zff::core::StatusCode;
        using zff::core::StatusDomain;

        // Segment tail: footer offset as u64 LE.
        constexpr u64 kTailBytes = 8;
    } // namespace

    Status SegmentWriter::guard() const noexcept {
        if (failed_) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Interrupted);
        }
        if (!open_) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Invalid, 0, "segment writer not open");
        }
        return zff::core::ok_status();
    }

    Status SegmentWriter::fail(Status s) noexcept {
        failed_ = true;
        return s;
    }

    Status SegmentWriter::write(BufferView data) noexcept {
        const Status s = file_.write_all(data);
        if (!zff::core::is_ok(s)) return fail(s);
        position_ += data.len;
        return zff::core::ok_status();
    }

    Status SegmentWriter::open(const SegmentWriterConfig& cfg) noexcept {
        if (open_ || failed_) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Invalid, 0, "already opened");
        }
        if (cfg.base_path.empty() || cfg.max_segment_size == 0) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Invalid);
        }
        cfg_ = cfg;
        segments_.clear();
        open_ = true;
        return open_segment(zff::core::kFirstSegmentNumber);
    }

    Status SegmentWriter::open_segment(u64 number) noexcept {
        const std::string path = segment_path(cfg_.base_path, number);
        Status s = file_.create(path);
        if (!zff::core::is_ok(s)) return fail(s);

        footer_ = codec::SegmentFooter{};
        footer_.segment_number = number;
        position_ = 0;
        segments_[number] = path_file_name(path);

        scratch_.clear();
        codec::SegmentHeader h{};
        h.uuid = cfg_.uuid;
        h.segment_number = number;
        h.max_segment_size = cfg_.max_segment_size;
        codec::encode_segment_header(h, cfg_.version, &scratch_);
        s = write(codec::view_of(scratch_));
        if (!zff::core::is_ok(s)) return s;

        if (number == zff::core::kFirstSegmentNumber && !cfg_.main_header.empty()) {
            footer_.has_main_header = true;
            footer_.main_header_offset = position_;
            s = write(codec::view_of(cfg_.main_header));
            if (!zff::core::is_ok(s)) return s;
        }
        header_end_ = position_;
        return zff::core::ok_status();
    }

    Status SegmentWriter::close_segment() noexcept {
        std::sort(footer_.chunks.begin(), footer_.chunks.end(),
            [](const codec::SegmentChunkRow& a, const codec::SegmentChunkRow& b) {
                return a.chunk_number < b.chunk_number;
            });
        footer_.footer_offset = position_;

        scratch_.clear();
        codec::encode_segment_footer(footer_, cfg_.version, &scratch_);
        const size_t body = scratch_.size();
        scratch_.resize(body + kTailBytes);
        codec::put_u64_le(scratch_.data() + body, footer_.footer_offset);

        Status s = write(codec::view_of(scratch_));
        if (!zff::core::is_ok(s)) return s;
        s = file_.sync();
        if (!zff::core::is_ok(s)) return fail(s);
        s = file_.close();
        if (!zff::core::is_ok(s)) return fail(s);
        return zff::core::ok_status();
    }

    Status SegmentWriter::make_room(u64 record_bytes, const Growth& g) noexcept {
        const u64 footer_after = codec::segment_footer_record_size(footer_.chunks.size() + g.chunks,
            footer_.object_headers.size() + g.headers,
            footer_.object_footers.size() + g.footers,
            footer_.has_main_header || g.main_header,
            footer_.has_main_footer || g.main_footer);
        if (position_ + record_bytes + footer_after + kTailBytes <= cfg_.max_segment_size) {
            return zff::core::ok_status();
        }
        if (position_ == header_end_) {
            return zff::core::ok_status(); // oversized record gets a segment of its own
        }
        const u64 next = footer_.segment_number + 1;
        Status s = close_segment();
        if (!zff::core::is_ok(s)) return s;
        return open_segment(next);
    }

    Status SegmentWriter::ensure_room(u64 record_bytes) noexcept {
        const Status s = guard();
        if (!zff::core::is_ok(s)) return s;
        Growth g{};
        g.main_footer = true;
        return make_room(record_bytes, g);
    }

    Status SegmentWriter::append_chunk(const EncodedChunk& chunk, RecordLocation* where) noexcept {
        Status s = guard();
        if (!zff::core::is_ok(s)) return s;

        Growth g{};
        g.chunks = 1;
        s = make_room(codec::chunk_record_size(chunk.payload.size(), codec::chunk_has_signature(chunk.header.flags)), g);
        if (!zff::core::is_ok(s)) return s;
        scratch_.clear();
        codec::encode_chunk_record(chunk.header, cfg_.version, codec::view_of(chunk.payload), &scratch_);

        codec::SegmentChunkRow row{};
        row.chunk_number = chunk.header.chunk_number;
        row.offset = position_;
        row.stored_size = chunk.header.stored_size;
        row.flags = chunk.header.flags;
        row.crc32 = chunk.header.crc32;

        s = write(codec::view_of(scratch_));
        if (!zff::core::is_ok(s)) return s;
        footer_.chunks.push_back(row);
        if (where != nullptr) {
            where->segment = footer_.segment_number;
            where->offset = row.offset;
        }
        return zff::core::ok_status();
    }

    Status SegmentWriter::append_record(codec::RecordKind kind,
        u64 object_id,
        BufferView framed,
        RecordLocation* where) noexcept {
        Status s = guard();
        if (!zff::core::is_ok(s)) return s;
        if (framed.len < codec::kRecordHeaderBytes || kind == codec::RecordKind::Chunk ||
            kind == codec::RecordKind::SegmentHeader || kind == codec::RecordKind::SegmentFooter) {
            return zff::core::make_status(StatusDomain::Writer, StatusCode::Invalid, static_cast<u64>(kind));
        }

        Growth g{};
        switch (kind) {
            case codec::RecordKind::ObjectHeader: g.headers = 1; break;
            case codec::RecordKind::ObjectFooter: g.footers = 1; break;
            case codec::RecordKind::MainHeader: g.main_header = true; break;
            case codec::RecordKind::MainFooter: g.main_footer = true; break;
            default: break;
        }
        s = make_room(framed.len, g);
        if (!zff::core::is_ok(s)) return s;

        const u64 offset = position_;
        s = write(framed);
        if (!zff::core::is_ok(s)) return s;

        switch (kind) {
            case codec::RecordKind::ObjectHeader: footer_.object_headers.push_back({object_id, offset}); break;
            case codec::RecordKind::ObjectFooter: footer_.object_footers.push_back({object_id, offset}); break;
            case codec::RecordKind::MainHeader:
                footer_.has_main_header = true;
                footer_.main_header_offset = offset;
                break;
            case codec::RecordKind::MainFooter:
                footer_.has_main_footer = true;
                footer_.main_footer_offset = offset;
                break;
            default: break;
        }
        if (where != nullptr) {
            where->segment = footer_.segment_number;
            where->offset = offset;
        }
        return zff::core::ok_status();
    }

    Status SegmentWriter::finish() noexcept {
        const Status s = guard();
        if (!zff::core::is_ok(s)) return s;
        open_ = false;
        return close_segment();
    }

} // namespace zff::storage
