#pragma once

#include <vector>

#include "zff/codec/model.hpp"
#include "zff/core/errors.hpp"

namespace zff::io {

    // Virtual reads resolve to a chain of pieces: zero fill for gaps, or a
    // range of a source object.
    struct VirtualPiece {
        zff::core::u64 length{0};
        bool zero{false};
        zff::core::u64 source_object{0};
        zff::core::u64 source_offset{0};
    };

    // Maximum number of virtual objects a read may pass through.
    inline constexpr int kMaxVirtualDepth = 8;

    class VirtualMapIndex {
    public:
        // Sorts the entries; Inconsistent if two of them overlap or one runs
        // past the map length.
        [[nodiscard]] zff::core::Status build(const codec::VirtualMap& map) noexcept;

        // OutOfRange unless [offset, offset + length) lies inside the map.
        [[nodiscard]] zff::core::Status plan(zff::core::u64 offset,
            zff::core::u64 length,
            std::vector<VirtualPiece>* out) const noexcept;

        [[nodiscard]] zff::core::u64 length() const noexcept { return length_; }
        [[nodiscard]] const std::vector<codec::VirtualMapEntry>& entries() const noexcept { return entries_; }

    private:
        std::vector<codec::VirtualMapEntry> entries_;
        zff::core::u64 length_{0};
    };

} // namespace zff::io
