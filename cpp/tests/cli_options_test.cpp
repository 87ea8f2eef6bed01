#include <array>

#include <gtest/gtest.h>

#include "zff/cli/options.hpp"

TEST(CliOptions, ParsesLongAndShortAndStopsAtPositional) {
    const std::array<zff::cli::OptionSpec, 4> specs = {{
        {zff::cli::OptionId::ChunkSize, zff::cli::OptionType::Size, "chunk-size", 'c'},
        {zff::cli::OptionId::Compression, zff::cli::OptionType::String, "compression", 'z'},
        {zff::cli::OptionId::Level, zff::cli::OptionType::U64, "level", 'l'},
        {zff::cli::OptionId::SameBytes, zff::cli::OptionType::Flag, "same-bytes", 's'},
    }};

    const char* argv[] = {"--same-bytes", "--chunk-size", "64k", "-z", "zstd", "image", "disk.raw"};
    const zff::cli::CliArgs args{argv, 7};

    zff::cli::ParsedOption buf[8]{};
    zff::cli::ParsedOptions out{buf, 0, 8};
    zff::cli::u32 consumed = 0;
    const zff::core::Status s = zff::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, zff::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, zff::cli::OptionId::SameBytes);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, zff::cli::OptionId::ChunkSize);
    EXPECT_EQ(out.data[1].value.u64v, 65536u);

    EXPECT_EQ(out.data[2].id, zff::cli::OptionId::Compression);
    EXPECT_STREQ(out.data[2].value.str, "zstd");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<zff::cli::OptionSpec, 2> specs = {{
        {zff::cli::OptionId::Password, zff::cli::OptionType::String, "password", 'p'},
        {zff::cli::OptionId::Object, zff::cli::OptionType::U64, "object", 'o'},
    }};

    const char* argv[] = {"--password=a=b", "-o123"};
    zff::cli::ParsedOption buf[8]{};
    zff::cli::ParsedOptions out{buf, 0, 8};
    zff::cli::u32 consumed = 0;
    const zff::core::Status s = zff::cli::parse_options({argv, 2}, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, zff::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "a=b");
    EXPECT_EQ(out.data[1].value.u64v, 123u);
}

TEST(CliOptions, StopsAtDoubleDashAndStdinDash) {
    const std::array<zff::cli::OptionSpec, 2> specs = {{
        {zff::cli::OptionId::Object, zff::cli::OptionType::U64, "object", 'o'},
        {zff::cli::OptionId::Resync, zff::cli::OptionType::Flag, "resync", '\0'},
    }};

    zff::cli::ParsedOption buf[8]{};
    zff::cli::ParsedOptions out{buf, 0, 8};
    zff::cli::u32 consumed = 0;
    {
        const char* argv[] = {"--object", "1", "--", "--resync"};
        ASSERT_TRUE(zff::core::is_ok(zff::cli::parse_options({argv, 4}, specs.data(), specs.size(), &out, &consumed)));
        EXPECT_EQ(consumed, 3u);
        ASSERT_EQ(out.len, 1u);
        EXPECT_EQ(out.data[0].value.u64v, 1u);
    }
    {
        const char* argv[] = {"--resync", "-", "out"};
        ASSERT_TRUE(zff::core::is_ok(zff::cli::parse_options({argv, 3}, specs.data(), specs.size(), &out, &consumed)));
        EXPECT_EQ(consumed, 1u);
        EXPECT_EQ(out.len, 1u);
    }
}

TEST(CliOptions, InvalidInputs) {
    const std::array<zff::cli::OptionSpec, 3> specs = {{
        {zff::cli::OptionId::Object, zff::cli::OptionType::U64, "object", 'o'},
        {zff::cli::OptionId::SegmentSize, zff::cli::OptionType::Size, "segment-size", 'S'},
        {zff::cli::OptionId::NoVerify, zff::cli::OptionType::Flag, "no-verify", 'n'},
    }};

    const auto parse = [&specs](const char* const* argv, zff::cli::u32 argc, zff::cli::u32 cap) {
        zff::cli::ParsedOption buf[4]{};
        zff::cli::ParsedOptions out{buf, 0, cap};
        zff::cli::u32 consumed = 0;
        return zff::cli::parse_options({argv, argc}, specs.data(), specs.size(), &out, &consumed);
    };

    const char* unknown[] = {"--nope"};
    EXPECT_EQ(parse(unknown, 1, 4).code, zff::core::StatusCode::Invalid);
    const char* missing[] = {"--object"};
    EXPECT_EQ(parse(missing, 1, 4).code, zff::core::StatusCode::Invalid);
    const char* not_number[] = {"--object", "12x"};
    EXPECT_EQ(parse(not_number, 2, 4).code, zff::core::StatusCode::Invalid);
    const char* flag_value[] = {"--no-verify=1"};
    EXPECT_EQ(parse(flag_value, 1, 4).code, zff::core::StatusCode::Invalid);
    const char* bad_size[] = {"-S", "4t"};
    EXPECT_EQ(parse(bad_size, 2, 4).code, zff::core::StatusCode::Invalid);
    const char* too_many[] = {"-n", "-n"};
    const zff::core::Status s = parse(too_many, 2, 1);
    EXPECT_EQ(s.domain, zff::core::StatusDomain::Cli);
    EXPECT_EQ(s.code, zff::core::StatusCode::Invalid);
}

TEST(CliOptions, ParseSize) {
    zff::cli::u64 v = 0;
    ASSERT_TRUE(zff::cli::parse_size("123", &v));
    EXPECT_EQ(v, 123u);
    ASSERT_TRUE(zff::cli::parse_size("4k", &v));
    EXPECT_EQ(v, 4096u);
    ASSERT_TRUE(zff::cli::parse_size("2M", &v));
    EXPECT_EQ(v, 2u * 1024 * 1024);
    ASSERT_TRUE(zff::cli::parse_size("4g", &v));
    EXPECT_EQ(v, zff::cli::u64{4} << 30);
    EXPECT_FALSE(zff::cli::parse_size("", &v));
    EXPECT_FALSE(zff::cli::parse_size("k", &v));
    EXPECT_FALSE(zff::cli::parse_size("-1", &v));
    EXPECT_FALSE(zff::cli::parse_size("99999999999999999999g", &v));
    EXPECT_FALSE(zff::cli::parse_size("17179869184g", &v));
}
