#pragma once

#include <type_traits>

#include "zff/cli/options.hpp"
#include "zff/core/errors.hpp"

namespace zff::cli {

    enum class CommandId : u32 {
        None = 0,
        Help,
        Create,
        Info,
        List,
        Cat,
        Verify,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against the table; args of the invocation are the
    // remaining entries.
    [[nodiscard]] zff::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace zff::cli
