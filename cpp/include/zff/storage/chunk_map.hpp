#pragma once

#include <map>

#include "zff/codec/model.hpp"
#include "zff/core/errors.hpp"

namespace zff::storage {
    using zff::core::u8;
    using zff::core::u32;
    using zff::core::u64;

    struct ChunkLocation {
        u64 segment{0};
        u64 offset{0}; // start of the framed chunk record
        u64 stored_size{0};
        u8 flags{0};
        u32 crc32{0};
    };

    // chunk number -> location, merged from every segment footer.
    class ChunkMap {
    public:
        // Duplicate (aux = chunk number) if the chunk is already mapped.
        [[nodiscard]] zff::core::Status insert(u64 chunk_number, const ChunkLocation& loc) noexcept;

        // Merges the rows of one segment footer.
        [[nodiscard]] zff::core::Status merge_footer(const codec::SegmentFooter& footer) noexcept;

        [[nodiscard]] const ChunkLocation* find(u64 chunk_number) const noexcept;

        // Inconsistent (aux = first missing number) unless the numbers are
        // exactly 1..size().
        [[nodiscard]] zff::core::Status check_dense() const noexcept;

        // Highest number of the contiguous run starting at 1.
        [[nodiscard]] u64 contiguous_end() const noexcept;

        [[nodiscard]] u64 size() const noexcept { return static_cast<u64>(chunks_.size()); }
        [[nodiscard]] bool empty() const noexcept { return chunks_.empty(); }
        [[nodiscard]] const std::map<u64, ChunkLocation>& entries() const noexcept { return chunks_; }

        void clear() noexcept { chunks_.clear(); }

    private:
        std::map<u64, ChunkLocation> chunks_;
    };

} // namespace zff::storage
