#include "zff/cli/commands.hpp"

#include <cstring>

namespace zff::cli {
    zff::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return zff::core::make_status(zff::core::StatusDomain::Cli, zff::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return zff::core::make_status(zff::core::StatusDomain::Cli, zff::core::StatusCode::Invalid, 0,
                "missing command");
        }
        if (spec_count > 0 && specs == nullptr) {
            return zff::core::make_status(zff::core::StatusDomain::Cli, zff::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return zff::core::make_status(zff::core::StatusDomain::Cli, zff::core::StatusCode::Invalid, 0,
                "option before command");
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                out->id = s.id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return zff::core::ok_status();
            }
        }
        return zff::core::make_status(zff::core::StatusDomain::Cli, zff::core::StatusCode::NotFound, 0,
            "unknown command");
    }
} // namespace zff::cli
