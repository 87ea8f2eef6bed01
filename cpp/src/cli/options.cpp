#include "zff/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace zff::cli {
    namespace {
        using zff::core::Status;

        [[nodiscard]] Status cli_invalid(u64 aux = 0, const char* detail = nullptr) noexcept {
            return zff::core::make_status(zff::core::StatusDomain::Cli, zff::core::StatusCode::Invalid, aux, detail);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name,
            size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            const char* end = s + std::strlen(s);
            u64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end || s == end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return zff::core::ok_status();
                case OptionType::U64:
                    if (!parse_u64(value, &opt->value.u64v)) return cli_invalid(0, spec.long_name);
                    return zff::core::ok_status();
                case OptionType::Size:
                    if (!parse_size(value, &opt->value.u64v)) return cli_invalid(0, spec.long_name);
                    return zff::core::ok_status();
                case OptionType::Flag:
                    break;
            }
            return cli_invalid(0, spec.long_name);
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return cli_invalid(out->cap, "too many options");
            }
            out->data[out->len++] = opt;
            return zff::core::ok_status();
        }
    } // namespace

    bool parse_size(const char* s, u64* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        const size_t len = std::strlen(s);
        if (len == 0) {
            return false;
        }
        u64 shift = 0;
        switch (s[len - 1]) {
            case 'k': case 'K': shift = 10; break;
            case 'm': case 'M': shift = 20; break;
            case 'g': case 'G': shift = 30; break;
            default: break;
        }
        const char* end = shift != 0 ? s + len - 1 : s + len;
        u64 v{};
        const auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end || s == end) {
            return false;
        }
        if (shift != 0 && v > (~u64{0} >> shift)) {
            return false;
        }
        *out = v << shift;
        return true;
    }

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;
        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break; // positional ("-" means stdin)
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - name) : std::strlen(name);
                spec = find_long(specs, spec_count, name, name_len);
                if (spec == nullptr) {
                    return cli_invalid(i, "unknown option");
                }
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec == nullptr) {
                    return cli_invalid(i, "unknown option");
                }
                if (tok[2] != '\0') {
                    if (spec->type == OptionType::Flag) {
                        return cli_invalid(i, "flag takes no value");
                    }
                    value = tok + 2;
                }
            }
            ++i;

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            if (spec->type == OptionType::Flag) {
                if (value != nullptr) {
                    return cli_invalid(i - 1, "flag takes no value");
                }
                opt.value.boolv = 1;
            } else {
                if (value == nullptr) {
                    if (i >= args.argc || args.argv[i] == nullptr) {
                        return cli_invalid(i - 1, "missing value");
                    }
                    value = args.argv[i++];
                }
                const Status s = set_value(*spec, value, &opt);
                if (!zff::core::is_ok(s)) return s;
            }
            const Status s = push_option(out, opt);
            if (!zff::core::is_ok(s)) return s;
        }

        *consumed = i;
        return zff::core::ok_status();
    }

} // namespace zff::cli
