#pragma once

#include <type_traits>

#include "zff/core/errors.hpp"
#include "zff/core/types.hpp"

namespace zff::cli {
    using u8 = zff::core::u8;
    using u32 = zff::core::u32;
    using u64 = zff::core::u64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        U64 = 2,
        // Unsigned byte count with an optional k/m/g suffix (powers of 1024).
        Size = 3,
    };

    enum class OptionId : u32 {
        None = 0,
        ChunkSize,
        SegmentSize,
        Compression,
        Level,
        Encryption,
        Kdf,
        Password,
        KeyHex,
        Hash,
        SameBytes,
        SignSeed,
        TrustedKey,
        NoVerify,
        Logical,
        FormatV1,
        Object,
        File,
        Offset,
        Length,
        Resync,
        IndexDb,
        CaseNumber,
        EvidenceNumber,
        Examiner,
        Notes,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        u64 u64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options fails Invalid when it runs out.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options up to the first positional argument or "--".
    // consumed is the number of argv entries taken.
    [[nodiscard]] zff::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // "4k" -> 4096, "2m" -> 2097152, "123" -> 123.
    [[nodiscard]] bool parse_size(const char* s, u64* out) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace zff::cli
