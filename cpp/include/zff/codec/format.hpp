#pragma once

#include <vector>

#include "zff/codec/buffer.hpp"
#include "zff/codec/model.hpp"
#include "zff/codec/record.hpp"
#include "zff/core/errors.hpp"

// Record encoders/decoders. Encoders append one framed record to 'out';
// decoders take exactly one framed record. Segment headers, segment footers
// and chunks are shared by both versions; the rest is version specific.
namespace zff::codec {

    void encode_segment_header(const SegmentHeader& h, u8 version, std::vector<u8>* out);
    [[nodiscard]] zff::core::Status decode_segment_header(BufferView record,
        SegmentHeader* out,
        u8* version) noexcept;

    void encode_segment_footer(const SegmentFooter& f, u8 version, std::vector<u8>* out);
    [[nodiscard]] zff::core::Status decode_segment_footer(BufferView record, SegmentFooter* out) noexcept;

    // Framed size of a footer with the given row counts; used by the segment
    // writer to reserve space before appending.
    [[nodiscard]] u64 segment_footer_record_size(u64 chunk_rows,
        u64 header_rows,
        u64 footer_rows,
        bool main_header,
        bool main_footer) noexcept;

    namespace v2 {
        inline constexpr u8 kVersion = 2;

        void encode_object_header(const ObjectHeader& h, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_object_header(BufferView record, ObjectHeader* out) noexcept;

        void encode_object_footer(const ObjectFooter& f, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_object_footer(BufferView record, ObjectFooter* out) noexcept;

        void encode_file_header(const FileHeader& h, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_file_header(BufferView record, FileHeader* out) noexcept;

        void encode_file_footer(const FileFooter& f, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_file_footer(BufferView record, FileFooter* out) noexcept;

        void encode_virtual_map(const VirtualMap& m, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_virtual_map(BufferView record, VirtualMap* out) noexcept;

        void encode_main_footer(const MainFooter& f, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_main_footer(BufferView record, MainFooter* out) noexcept;

        // kind is FileHeader, FileFooter or ObjectFooter. decode succeeds
        // with *sealed == false for a plain record of the expected kind.
        void encode_sealed_record(RecordKind kind, const SealedRecord& r, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_sealed_record(BufferView record,
            RecordKind expect,
            SealedRecord* out,
            bool* sealed) noexcept;

        // Bytes covered by the main footer signature (the footer map without
        // its "sig" entry).
        void main_footer_signed_bytes(const MainFooter& f, std::vector<u8>* out);
    } // namespace v2

    namespace v1 {
        inline constexpr u8 kVersion = 1;

        void encode_main_header(const MainHeaderV1& h, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_main_header(BufferView record, MainHeaderV1* out) noexcept;

        void encode_main_footer(const MainFooterV1& f, std::vector<u8>* out);
        [[nodiscard]] zff::core::Status decode_main_footer(BufferView record, MainFooterV1* out) noexcept;
    } // namespace v1

} // namespace zff::codec
