#pragma once
#include <cstdint>
#include <type_traits>

namespace zff::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Io,
        Malformed,
        MissingField,
        UnsupportedVersion,
        UnsupportedAlgorithm,
        Corrupt,
        DecryptError,
        SignatureInvalid,
        Duplicate,
        Inconsistent,
        OutOfRange,
        Interrupted,
        PartiallyRecovered,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Codec,
        Storage,
        Security,
        Writer,
        Reader,
        Db,
        Cli,
        External,
    };

    // aux carries the chunk/segment number, version, algorithm id or errno
    // depending on the code. detail, when set, points at a string literal
    // (field name or location) and is never owned.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 reserved{0};
        u64 aux{0};
        const char* detail{nullptr};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain,
        StatusCode code,
        u64 aux = 0,
        const char* detail = nullptr) noexcept {
        return Status{code, domain, 0, aux, detail};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Io: return "IoError";
            case StatusCode::Malformed: return "Malformed";
            case StatusCode::MissingField: return "MissingField";
            case StatusCode::UnsupportedVersion: return "UnsupportedVersion";
            case StatusCode::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::DecryptError: return "DecryptError";
            case StatusCode::SignatureInvalid: return "SignatureInvalid";
            case StatusCode::Duplicate: return "Duplicate";
            case StatusCode::Inconsistent: return "Inconsistent";
            case StatusCode::OutOfRange: return "OutOfRange";
            case StatusCode::Interrupted: return "Interrupted";
            case StatusCode::PartiallyRecovered: return "PartiallyRecovered";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    [[nodiscard]] constexpr const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Security: return "Security";
            case StatusDomain::Writer: return "Writer";
            case StatusDomain::Reader: return "Reader";
            case StatusDomain::Db: return "Db";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace zff::core
