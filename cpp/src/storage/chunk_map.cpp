#include "zff/storage/chunk_map.hpp"

namespace zff::storage {

    using zff::core::Status;
    using zff::core::StatusCode;
    using zff::core::StatusDomain;

    Status ChunkMap::insert(u64 chunk_number, const ChunkLocation& loc) noexcept {
        if (chunk_number == 0) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Malformed, 0, "chunk number 0");
        }
        const auto res = chunks_.emplace(chunk_number, loc);
        if (!res.second) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Duplicate, chunk_number, "chunk");
        }
        return zff::core::ok_status();
    }

    Status ChunkMap::merge_footer(const codec::SegmentFooter& footer) noexcept {
        for (const codec::SegmentChunkRow& r : footer.chunks) {
            ChunkLocation loc{};
            loc.segment = footer.segment_number;
            loc.offset = r.offset;
            loc.stored_size = r.stored_size;
            loc.flags = r.flags;
            loc.crc32 = r.crc32;
            const Status s = insert(r.chunk_number, loc);
            if (!zff::core::is_ok(s)) return s;
        }
        return zff::core::ok_status();
    }

    const ChunkLocation* ChunkMap::find(u64 chunk_number) const noexcept {
        const auto it = chunks_.find(chunk_number);
        return it == chunks_.end() ? nullptr : &it->second;
    }

    u64 ChunkMap::contiguous_end() const noexcept {
        u64 expect = zff::core::kFirstChunkNumber;
        for (const auto& kv : chunks_) {
            if (kv.first != expect) {
                break;
            }
            ++expect;
        }
        return expect - 1;
    }

    Status ChunkMap::check_dense() const noexcept {
        const u64 end = contiguous_end();
        if (end != size()) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::Inconsistent, end + 1,
                "chunk numbers not dense");
        }
        return zff::core::ok_status();
    }

} // namespace zff::storage
