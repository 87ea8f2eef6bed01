#pragma once

#include <map>
#include <string>
#include <vector>

#include "zff/codec/model.hpp"
#include "zff/codec/record.hpp"
#include "zff/core/errors.hpp"
#include "zff/storage/pipeline.hpp"
#include "zff/storage/segment_file.hpp"

namespace zff::storage {

    struct SegmentWriterConfig {
        std::string base_path;
        zff::core::Uuid uuid{};
        u64 max_segment_size{0};
        u8 version{2};
        // Framed v1 main header, written after the first segment header and
        // counted as part of that segment's header area.
        std::vector<u8> main_header;
    };

    struct RecordLocation {
        u64 segment{0};
        u64 offset{0};
    };

    // Streams records into "<base>.zNN" files of at most max_segment_size
    // bytes. Records are never split: a record that would push the segment
    // (plus its footer and 8 byte tail) over the limit closes the segment
    // first, unless the segment holds nothing but its header, in which case
    // the record is accepted as is.
    //
    // After the first I/O failure every call returns Interrupted.
    class SegmentWriter {
    public:
        SegmentWriter() = default;

        SegmentWriter(const SegmentWriter&) = delete;
        SegmentWriter& operator=(const SegmentWriter&) = delete;

        [[nodiscard]] zff::core::Status open(const SegmentWriterConfig& cfg) noexcept;

        [[nodiscard]] zff::core::Status append_chunk(const EncodedChunk& chunk, RecordLocation* where) noexcept;

        // Appends one framed map record. Object headers/footers land in the
        // segment's offset tables under object_id; main header/footer set
        // the corresponding footer offsets.
        [[nodiscard]] zff::core::Status append_record(codec::RecordKind kind,
            u64 object_id,
            BufferView framed,
            RecordLocation* where) noexcept;

        // Rotates now unless a record of record_bytes would still fit.
        [[nodiscard]] zff::core::Status ensure_room(u64 record_bytes) noexcept;

        // Writes the last segment footer and closes the file.
        [[nodiscard]] zff::core::Status finish() noexcept;

        [[nodiscard]] u64 segment_number() const noexcept { return footer_.segment_number; }
        [[nodiscard]] u64 position() const noexcept { return position_; }
        [[nodiscard]] bool failed() const noexcept { return failed_; }

        // Every segment opened so far: number -> file name.
        [[nodiscard]] const std::map<u64, std::string>& segments() const noexcept { return segments_; }

    private:
        struct Growth {
            u64 chunks{0};
            u64 headers{0};
            u64 footers{0};
            bool main_header{false};
            bool main_footer{false};
        };

        [[nodiscard]] zff::core::Status make_room(u64 record_bytes, const Growth& g) noexcept;
        [[nodiscard]] zff::core::Status open_segment(u64 number) noexcept;
        [[nodiscard]] zff::core::Status close_segment() noexcept;
        [[nodiscard]] zff::core::Status write(BufferView data) noexcept;
        [[nodiscard]] zff::core::Status fail(zff::core::Status s) noexcept;
        [[nodiscard]] zff::core::Status guard() const noexcept;

        SegmentWriterConfig cfg_;
        SegmentFile file_;
        codec::SegmentFooter footer_;
        std::map<u64, std::string> segments_;
        std::vector<u8> scratch_;
        u64 position_{0};
        u64 header_end_{0};
        bool open_{false};
        bool failed_{false};
    };

} // namespace zff::storage
