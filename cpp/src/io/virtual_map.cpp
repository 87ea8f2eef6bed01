#include "zff/io/virtual_map.hpp"

#include <algorithm>

namespace zff::io {

    using zff::core::Status;
    using zff::core::StatusCode;
    using zff::core::StatusDomain;
    using zff::core::u64;

    Status VirtualMapIndex::build(const codec::VirtualMap& map) noexcept {
        std::vector<codec::VirtualMapEntry> sorted = map.entries;
        std::sort(sorted.begin(), sorted.end(), [](const codec::VirtualMapEntry& a, const codec::VirtualMapEntry& b) {
            return a.virtual_start < b.virtual_start;
        });
        u64 end = 0;
        for (const codec::VirtualMapEntry& e : sorted) {
            if (e.length == 0 || e.virtual_start < end || e.virtual_start + e.length < e.virtual_start ||
                e.virtual_start + e.length > map.length) {
                return zff::core::make_status(StatusDomain::Reader, StatusCode::Inconsistent, map.object_id,
                    "virtual map entries");
            }
            end = e.virtual_start + e.length;
        }
        entries_ = std::move(sorted);
        length_ = map.length;
        return zff::core::ok_status();
    }

    Status VirtualMapIndex::plan(u64 offset, u64 length, std::vector<VirtualPiece>* out) const noexcept {
        if (out == nullptr) {
            return zff::core::make_status(StatusDomain::Reader, StatusCode::Invalid);
        }
        out->clear();
        if (offset > length_ || length > length_ - offset) {
            return zff::core::make_status(StatusDomain::Reader, StatusCode::OutOfRange, offset);
        }

        // First entry that could cover 'offset'.
        auto it = std::upper_bound(entries_.begin(), entries_.end(), offset,
            [](u64 v, const codec::VirtualMapEntry& e) { return v < e.virtual_start; });
        if (it != entries_.begin()) {
            --it;
        }

        u64 pos = offset;
        const u64 end = offset + length;
        while (pos < end) {
            while (it != entries_.end() && it->virtual_start + it->length <= pos) {
                ++it;
            }
            VirtualPiece p{};
            if (it == entries_.end() || it->virtual_start > pos) {
                const u64 gap_end = it == entries_.end() ? end : std::min(end, it->virtual_start);
                p.zero = true;
                p.length = gap_end - pos;
            } else {
                p.length = std::min(end, it->virtual_start + it->length) - pos;
                p.source_object = it->source_object;
                p.source_offset = it->source_start + (pos - it->virtual_start);
            }
            out->push_back(p);
            pos += p.length;
        }
        return zff::core::ok_status();
    }

} // namespace zff::io
