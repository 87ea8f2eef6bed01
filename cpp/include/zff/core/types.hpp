#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace zff::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i8 = std::int8_t;
    using i16 = std::int16_t;
    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Seconds since the unix epoch.
    using Timestamp = i64;

    struct Uuid {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const Uuid&, const Uuid&) noexcept = default;
        friend constexpr auto operator<=>(const Uuid&, const Uuid&) noexcept = default;
    };
    static_assert(sizeof(Uuid) == 16);

    [[nodiscard]] constexpr bool uuid_is_nil(const Uuid& u) noexcept {
        for (u8 x : u.b) {
            if (x != 0) {
                return false;
            }
        }
        return true;
    }

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct ObjectIdTag {};
    using ObjectId = Id<ObjectIdTag, u64>;

    // Object id reported for the implicit stream of a v1 container.
    inline constexpr ObjectId kV1ImplicitObject{1};

    // Chunk numbers are dense within a container and start at 1.
    inline constexpr u64 kFirstChunkNumber = 1;
    inline constexpr u64 kFirstSegmentNumber = 1;

    inline constexpr u64 kDefaultChunkSize = 32 * 1024;
    inline constexpr u64 kMinChunkSize = 4096;
    inline constexpr u64 kMinSegmentSize = 1024 * 1024;

    [[nodiscard]] constexpr bool is_power_of_two(u64 v) noexcept {
        return v != 0 && (v & (v - 1)) == 0;
    }

    static_assert(std::is_trivially_copyable_v<ObjectId>);
    static_assert(std::is_standard_layout_v<ObjectId>);
    static_assert(std::is_trivially_copyable_v<Uuid>);

} // namespace zff::core
