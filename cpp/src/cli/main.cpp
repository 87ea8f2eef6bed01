#include <cerrno>
#include <csignal>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

#include "zff/cli/commands.hpp"
#include "zff/cli/options.hpp"
#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"
#include "zff/io/container_reader.hpp"
#include "zff/io/container_writer.hpp"
#include "zff/io/source.hpp"
#include "zff/security/crypto.hpp"

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Output Helpers
// ========================================================================

void print_status_error_detailed(const char* context, zff::core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s, domain=%s, aux=%llu%s%s)\n",
            context,
            zff::core::status_code_name(s.code),
            zff::core::status_domain_name(s.domain),
            static_cast<unsigned long long>(s.aux),
            s.detail != nullptr ? ", " : "",
            s.detail != nullptr ? s.detail : "");
    if (s.code == zff::core::StatusCode::Io && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

static std::string to_hex(const zff::core::u8* data, size_t len) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(hex[(data[i] >> 4) & 0xF]);
        out.push_back(hex[data[i] & 0xF]);
    }
    return out;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool parse_hex_exact(const char* s, zff::core::u8* out, size_t len) {
    if (s == nullptr || std::strlen(s) != len * 2) return false;
    for (size_t i = 0; i < len; ++i) {
        const int hi = hex_nibble(s[i * 2]);
        const int lo = hex_nibble(s[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<zff::core::u8>((hi << 4) | lo);
    }
    return true;
}

static bool write_stdout(const std::vector<zff::core::u8>& data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(STDOUT_FILENO, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            fprintf(stderr, "error: write: %s\n", std::strerror(errno));
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

static void print_timestamp(const char* label, zff::core::Timestamp t) {
    char buf[64] = "-";
    if (t != 0) {
        const time_t tt = static_cast<time_t>(t);
        struct tm tm_utc{};
        if (gmtime_r(&tt, &tm_utc) != nullptr) {
            strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        }
    }
    printf("  %-18s %s\n", label, buf);
}

static void print_digests(const char* indent, const std::vector<zff::codec::DigestEntry>& digests) {
    for (const zff::codec::DigestEntry& d : digests) {
        printf("%s%-12s %s%s\n", indent, zff::core::hash_name(d.hash),
               to_hex(d.digest.data(), d.digest.size()).c_str(), d.signature.empty() ? "" : "  (signed)");
    }
}

// ========================================================================
// Interruptible input
// ========================================================================

// Stops the pull loop once SIGINT arrived; the writer then latches the
// failure and the partial container can be recovered with --resync.
class InterruptibleSource final : public zff::io::ByteSource {
public:
    explicit InterruptibleSource(zff::io::ByteSource* inner) noexcept : inner_(inner) {}

    zff::core::Status read(zff::io::BufferMut out, zff::core::u64* got) noexcept override {
        if (!g_running) {
            return zff::core::make_status(zff::core::StatusDomain::Cli, zff::core::StatusCode::Interrupted);
        }
        return inner_->read(out, got);
    }

private:
    zff::io::ByteSource* inner_;
};

// ========================================================================
// Option tables
// ========================================================================

using zff::cli::OptionId;
using zff::cli::OptionSpec;
using zff::cli::OptionType;

static const OptionSpec kCreateOptions[] = {
    {OptionId::ChunkSize, OptionType::Size, "chunk-size", 'c'},
    {OptionId::SegmentSize, OptionType::Size, "segment-size", 's'},
    {OptionId::Compression, OptionType::String, "compression", 'z'},
    {OptionId::Level, OptionType::U64, "level", 'l'},
    {OptionId::Encryption, OptionType::String, "encryption", 'e'},
    {OptionId::Kdf, OptionType::String, "kdf", '\0'},
    {OptionId::Password, OptionType::String, "password", 'p'},
    {OptionId::KeyHex, OptionType::String, "key", 'k'},
    {OptionId::Hash, OptionType::String, "hash", 'H'},
    {OptionId::SameBytes, OptionType::Flag, "same-bytes", '\0'},
    {OptionId::SignSeed, OptionType::String, "sign-seed", '\0'},
    {OptionId::Logical, OptionType::Flag, "logical", 'L'},
    {OptionId::FormatV1, OptionType::Flag, "v1", '\0'},
    {OptionId::CaseNumber, OptionType::String, "case", '\0'},
    {OptionId::EvidenceNumber, OptionType::String, "evidence", '\0'},
    {OptionId::Examiner, OptionType::String, "examiner", '\0'},
    {OptionId::Notes, OptionType::String, "notes", '\0'},
};

static const OptionSpec kReadOptions[] = {
    {OptionId::Password, OptionType::String, "password", 'p'},
    {OptionId::KeyHex, OptionType::String, "key", 'k'},
    {OptionId::TrustedKey, OptionType::String, "trusted-key", '\0'},
    {OptionId::NoVerify, OptionType::Flag, "no-verify", '\0'},
    {OptionId::Resync, OptionType::Flag, "resync", 'r'},
    {OptionId::IndexDb, OptionType::String, "index-db", '\0'},
    {OptionId::Object, OptionType::U64, "object", 'o'},
    {OptionId::File, OptionType::U64, "file", 'f'},
    {OptionId::Offset, OptionType::Size, "offset", '\0'},
    {OptionId::Length, OptionType::Size, "length", 'n'},
};

template <size_t N>
static constexpr zff::core::u32 table_size(const OptionSpec (&)[N]) {
    return static_cast<zff::core::u32>(N);
}

struct ParsedArgs {
    zff::cli::ParsedOption buf[64]{};
    zff::cli::ParsedOptions opts{buf, 0, 64};
    std::vector<const char*> positional;
};

static bool parse_args(const char* context, const zff::cli::CliArgs& args, const OptionSpec* specs,
                       zff::core::u32 spec_count, ParsedArgs* out) {
    zff::core::u32 consumed = 0;
    const zff::core::Status s = zff::cli::parse_options(args, specs, spec_count, &out->opts, &consumed);
    if (!zff::core::is_ok(s)) {
        for (zff::core::u32 i = 0; i < spec_count; ++i) {
            if (s.detail == specs[i].long_name) {
                fprintf(stderr, "error: %s: bad value for --%s\n", context, specs[i].long_name);
                return false;
            }
        }
        if (s.detail != nullptr && s.aux < args.argc) {
            fprintf(stderr, "error: %s: %s: %s\n", context, s.detail, args.argv[s.aux]);
        } else {
            print_status_error_detailed(context, s);
        }
        return false;
    }
    for (zff::core::u32 i = consumed; i < args.argc; ++i) {
        out->positional.push_back(args.argv[i]);
    }
    return true;
}

static const zff::cli::ParsedOption* find_option(const ParsedArgs& a, OptionId id) {
    const zff::cli::ParsedOption* found = nullptr;
    for (zff::core::u32 i = 0; i < a.opts.len; ++i) {
        if (a.opts.data[i].id == id) {
            found = &a.opts.data[i]; // last one wins
        }
    }
    return found;
}

static const char* option_str(const ParsedArgs& a, OptionId id) {
    const zff::cli::ParsedOption* o = find_option(a, id);
    return o != nullptr ? o->value.str : nullptr;
}

static bool option_flag(const ParsedArgs& a, OptionId id) {
    return find_option(a, id) != nullptr;
}

// ========================================================================
// Algorithm names
// ========================================================================

static bool parse_aead(const char* name, zff::core::AeadId* out) {
    for (zff::core::u8 i = 0; i <= static_cast<zff::core::u8>(zff::core::AeadId::ChaCha20Poly1305); ++i) {
        const auto id = static_cast<zff::core::AeadId>(i);
        if (std::strcmp(name, zff::core::aead_name(id)) == 0) {
            *out = id;
            return true;
        }
    }
    return false;
}

static bool parse_kdf(const char* name, zff::core::KdfId* out) {
    for (zff::core::u8 i = 0; i <= static_cast<zff::core::u8>(zff::core::KdfId::Argon2id); ++i) {
        const auto id = static_cast<zff::core::KdfId>(i);
        if (std::strcmp(name, zff::core::kdf_name(id)) == 0) {
            *out = id;
            return true;
        }
    }
    return false;
}

static bool parse_hash_list(const char* list, std::vector<zff::core::HashId>* out) {
    std::string item;
    const std::string s(list);
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i == s.size() || s[i] == ',') {
            zff::core::HashId id{};
            if (item.empty() || !zff::core::hash_from_name(item.c_str(), &id)) {
                fprintf(stderr, "error: unknown hash '%s'\n", item.c_str());
                return false;
            }
            out->push_back(id);
            item.clear();
        } else {
            item.push_back(s[i]);
        }
    }
    return true;
}

// --password / --key into key material; false after printing an error.
static bool key_material(const ParsedArgs& a, zff::security::KeyMaterial* out) {
    if (const char* hex = option_str(a, OptionId::KeyHex)) {
        zff::security::Key256 key{};
        if (!parse_hex_exact(hex, key.b, sizeof(key.b))) {
            fprintf(stderr, "error: --key needs 64 hex characters\n");
            return false;
        }
        *out = zff::security::key_from_raw(key);
        return true;
    }
    if (const char* pw = option_str(a, OptionId::Password)) {
        *out = zff::security::key_from_password(pw);
    }
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: zffcpp <command> [options] <args>\n");
    printf("\n");
    printf("Commands:\n");
    printf("  create [opts] <base> <inputs..>  Acquire inputs into <base>.z01, <base>.z02, ...\n");
    printf("                   One physical object per input ('-' reads stdin), or one\n");
    printf("                   logical object over all inputs with -L/--logical.\n");
    printf("                   Options: -c/--chunk-size 32k, -s/--segment-size 4g,\n");
    printf("                            -z/--compression none|zstd, -l/--level N,\n");
    printf("                            -e/--encryption aes256-gcm|chacha20-poly1305,\n");
    printf("                            --kdf pbkdf2-sha256|scrypt|argon2id, -p/--password, -k/--key <hex>,\n");
    printf("                            -H/--hash sha256,blake3,..., --same-bytes, --sign-seed <hex>,\n");
    printf("                            --v1, --case, --evidence, --examiner, --notes\n");
    printf("  info <base>       Show container and object details\n");
    printf("  ls <base>         List objects, or the files of -o/--object <id>\n");
    printf("  cat <base>        Write object (-o) or file (-o, -f) bytes to stdout\n");
    printf("                   Options: --offset N, -n/--length N\n");
    printf("  verify <base>     Decode every chunk and check digests and signatures\n");
    printf("  help              Show this help\n");
    printf("\n");
    printf("Read options: -p/--password, -k/--key <hex>, --trusted-key <hex>, --no-verify,\n");
    printf("              -r/--resync, --index-db <path>\n");
}

int handle_create(const zff::cli::CliArgs& args) {
    ParsedArgs a;
    if (!parse_args("create", args, kCreateOptions, table_size(kCreateOptions), &a)) {
        return 2;
    }
    if (a.positional.size() < 2) {
        fprintf(stderr, "error: create: need <base> and at least one input\n");
        return 2;
    }
    const std::string base = a.positional[0];

    zff::io::ContainerConfig ccfg{};
    zff::io::ObjectConfig ocfg{};
    ocfg.hashes = {zff::core::HashId::Sha256};
    if (option_flag(a, OptionId::FormatV1)) ccfg.version = zff::core::FormatVersion::V1;
    if (const auto* o = find_option(a, OptionId::SegmentSize)) ccfg.max_segment_size = o->value.u64v;
    if (const auto* o = find_option(a, OptionId::ChunkSize)) ocfg.chunk_size = o->value.u64v;
    if (const char* c = option_str(a, OptionId::Compression)) {
        if (std::strcmp(c, "zstd") == 0) {
            ocfg.compression.algo = zff::core::CompressionId::Zstd;
        } else if (std::strcmp(c, "none") != 0) {
            fprintf(stderr, "error: create: unknown compression '%s'\n", c);
            return 2;
        }
    }
    if (const auto* o = find_option(a, OptionId::Level)) ocfg.compression.level = static_cast<zff::core::i32>(o->value.u64v);
    if (const char* e = option_str(a, OptionId::Encryption)) {
        if (!parse_aead(e, &ocfg.aead)) {
            fprintf(stderr, "error: create: unknown encryption '%s'\n", e);
            return 2;
        }
        ocfg.kdf.kdf = zff::core::KdfId::Argon2id;
    }
    if (const char* k = option_str(a, OptionId::Kdf)) {
        if (!parse_kdf(k, &ocfg.kdf.kdf)) {
            fprintf(stderr, "error: create: unknown kdf '%s'\n", k);
            return 2;
        }
    }
    if (!key_material(a, &ocfg.key)) return 2;
    if (const char* h = option_str(a, OptionId::Hash)) {
        ocfg.hashes.clear();
        if (!parse_hash_list(h, &ocfg.hashes)) return 2;
    }
    ocfg.detect_same_bytes = option_flag(a, OptionId::SameBytes);
    if (const char* seed_hex = option_str(a, OptionId::SignSeed)) {
        zff::core::u8 seed[32];
        zff::security::VerifyKey vk{};
        if (!parse_hex_exact(seed_hex, seed, sizeof(seed)) ||
            !zff::core::is_ok(zff::security::signing_keypair_from_seed(seed, &ccfg.signing_key, &vk))) {
            fprintf(stderr, "error: create: --sign-seed needs 64 hex characters\n");
            return 2;
        }
        ccfg.sign = true;
        fprintf(stderr, "info: verify key %s\n", to_hex(vk.b, sizeof(vk.b)).c_str());
    }
    const std::pair<OptionId, const char*> desc_keys[] = {
        {OptionId::CaseNumber, zff::codec::kDescCaseNumber},
        {OptionId::EvidenceNumber, zff::codec::kDescEvidenceNumber},
        {OptionId::Examiner, zff::codec::kDescExaminer},
        {OptionId::Notes, zff::codec::kDescNotes},
    };
    for (const auto& dk : desc_keys) {
        if (const char* v = option_str(a, dk.first)) {
            ccfg.description[dk.second] = v;
            ocfg.description[dk.second] = v;
        }
    }

    std::unique_ptr<zff::io::ContainerWriter> writer;
    zff::core::Status s = zff::io::ContainerWriter::create(base, ccfg, &writer);
    if (!zff::core::is_ok(s)) {
        print_status_error_detailed("create", s);
        return 1;
    }

    if (option_flag(a, OptionId::Logical)) {
        zff::io::ObjectWriter* obj = nullptr;
        s = writer->add_logical_object(1, ocfg, &obj);
        if (zff::core::is_ok(s)) {
            zff::io::PathListFileSource files(std::vector<std::string>(a.positional.begin() + 1, a.positional.end()));
            s = obj->add_files(files);
        }
        if (!zff::core::is_ok(s)) {
            print_status_error_detailed("create: logical object", s);
            return 1;
        }
        fprintf(stderr, "info: logical object 1 from %zu paths\n", a.positional.size() - 1);
    } else {
        zff::core::u64 id = 1;
        for (size_t i = 1; i < a.positional.size() && g_running; ++i, ++id) {
            const char* input = a.positional[i];
            zff::io::ObjectWriter* obj = nullptr;
            s = writer->add_physical_object(id, ocfg, &obj);
            if (!zff::core::is_ok(s)) {
                print_status_error_detailed("create: add object", s);
                return 1;
            }
            zff::io::FdSource stdin_src(STDIN_FILENO);
            zff::io::PathSource path_src;
            zff::io::ByteSource* src = &stdin_src;
            if (std::strcmp(input, "-") != 0) {
                s = path_src.open(input);
                if (!zff::core::is_ok(s)) {
                    fprintf(stderr, "error: create: cannot open %s\n", input);
                    print_status_error_detailed("create: open input", s);
                    return 1;
                }
                src = &path_src;
            }
            InterruptibleSource guarded(src);
            s = obj->write_from(guarded);
            if (zff::core::is_ok(s)) s = obj->finish();
            if (!zff::core::is_ok(s)) {
                fprintf(stderr, "error: create: acquisition of %s stopped\n", input);
                print_status_error_detailed("create: write", s);
                return 1;
            }
            fprintf(stderr, "info: object %llu <- %s\n", static_cast<unsigned long long>(id), input);
        }
    }

    s = writer->close();
    if (!zff::core::is_ok(s)) {
        print_status_error_detailed("create: close", s);
        return 1;
    }
    fprintf(stderr, "info: wrote %llu segment(s) for %s\n", static_cast<unsigned long long>(writer->segment_count()),
            base.c_str());
    return 0;
}

// Opens <base> with the read options; prints and returns nullptr on failure.
static std::unique_ptr<zff::io::ContainerReader> open_reader(const char* context, const ParsedArgs& a) {
    if (a.positional.size() != 1) {
        fprintf(stderr, "error: %s: need exactly one <base>\n", context);
        return nullptr;
    }
    zff::io::ReaderOptions ropts{};
    ropts.resync = option_flag(a, OptionId::Resync);
    ropts.verify_signatures = !option_flag(a, OptionId::NoVerify);
    if (const char* db = option_str(a, OptionId::IndexDb)) ropts.index_db_path = db;
    if (const char* tk = option_str(a, OptionId::TrustedKey)) {
        if (!parse_hex_exact(tk, ropts.trusted_key.b, sizeof(ropts.trusted_key.b))) {
            fprintf(stderr, "error: %s: --trusted-key needs 64 hex characters\n", context);
            return nullptr;
        }
        ropts.has_trusted_key = true;
    }
    zff::security::KeyMaterial km{};
    if (!key_material(a, &km)) return nullptr;
    if (!km.empty()) ropts.keys.set_default(km);

    std::unique_ptr<zff::io::ContainerReader> reader;
    const zff::core::Status s = zff::io::ContainerReader::open_base(a.positional[0], ropts, &reader);
    if (s.code == zff::core::StatusCode::PartiallyRecovered) {
        const zff::io::RecoveryReport& r = reader->recovery();
        fprintf(stderr,
                "info: partially recovered: %llu segment(s) scanned, %llu chunk(s) recovered, %llu dropped, "
                "last chunk %llu\n",
                static_cast<unsigned long long>(r.segments_scanned),
                static_cast<unsigned long long>(r.chunks_recovered),
                static_cast<unsigned long long>(r.chunks_dropped),
                static_cast<unsigned long long>(r.last_chunk));
        return reader;
    }
    if (!zff::core::is_ok(s)) {
        print_status_error_detailed(context, s);
        return nullptr;
    }
    return reader;
}

int handle_info(const zff::cli::CliArgs& args) {
    ParsedArgs a;
    if (!parse_args("info", args, kReadOptions, table_size(kReadOptions), &a)) return 2;
    auto reader = open_reader("info", a);
    if (!reader) return 1;

    printf("container %s\n", to_hex(reader->uuid().b.data(), reader->uuid().b.size()).c_str());
    printf("  %-18s %u\n", "version", static_cast<unsigned>(reader->version()));
    printf("  %-18s %llu\n", "segments", static_cast<unsigned long long>(reader->segment_count()));
    print_timestamp("created", reader->created());
    for (const auto& kv : reader->description()) {
        printf("  %-18s %s\n", kv.first.c_str(), kv.second.c_str());
    }

    for (zff::core::u64 id : reader->objects()) {
        zff::io::ObjectInfo info{};
        const zff::core::Status s = reader->object_info(id, &info);
        if (!zff::core::is_ok(s)) {
            print_status_error_detailed("info: object", s);
            return 1;
        }
        const zff::codec::ChunkingDescriptor& d = info.chunking;
        printf("object %llu (%s)%s%s\n", static_cast<unsigned long long>(id), zff::core::object_kind_name(info.kind),
               info.complete ? "" : " incomplete", info.footer_open ? "" : " sealed, key required");
        printf("  %-18s %llu\n", "length", static_cast<unsigned long long>(info.data_length));
        if (info.kind != zff::core::ObjectKind::Virtual) {
            printf("  %-18s %llu\n", "chunk size", static_cast<unsigned long long>(d.chunk_size));
            printf("  %-18s %llu (first %llu)\n", "chunks", static_cast<unsigned long long>(info.chunk_count),
                   static_cast<unsigned long long>(info.first_chunk));
            printf("  %-18s %s\n", "compression", zff::core::compression_name(d.compression.algo));
            printf("  %-18s %s", "encryption", zff::core::aead_name(d.encryption.aead));
            if (d.encryption.aead != zff::core::AeadId::None) {
                printf(" (kdf %s)", zff::core::kdf_name(d.encryption.kdf.kdf));
            }
            printf("\n");
        }
        if (info.kind == zff::core::ObjectKind::Logical) {
            printf("  %-18s %llu\n", "files", static_cast<unsigned long long>(info.file_count));
        }
        if (!d.verify_key.empty()) {
            printf("  %-18s %s\n", "verify key", to_hex(d.verify_key.data(), d.verify_key.size()).c_str());
        }
        print_timestamp("acquired", info.acquisition_start);
        print_timestamp("finished", info.acquisition_end);
        print_digests("  ", info.digests);
    }
    return 0;
}

int handle_list(const zff::cli::CliArgs& args) {
    ParsedArgs a;
    if (!parse_args("ls", args, kReadOptions, table_size(kReadOptions), &a)) return 2;
    auto reader = open_reader("ls", a);
    if (!reader) return 1;

    const zff::cli::ParsedOption* obj = find_option(a, OptionId::Object);
    if (obj == nullptr) {
        printf("%-8s  %-9s  %-14s  %s\n", "ID", "Kind", "Length", "Chunks");
        for (zff::core::u64 id : reader->objects()) {
            zff::io::ObjectInfo info{};
            if (!zff::core::is_ok(reader->object_info(id, &info))) continue;
            printf("%-8llu  %-9s  %-14llu  %llu\n", static_cast<unsigned long long>(id),
                   zff::core::object_kind_name(info.kind), static_cast<unsigned long long>(info.data_length),
                   static_cast<unsigned long long>(info.chunk_count));
        }
        return 0;
    }

    std::vector<zff::io::FileInfo> files;
    const zff::core::Status s = reader->files(obj->value.u64v, &files);
    if (!zff::core::is_ok(s)) {
        print_status_error_detailed("ls", s);
        return 1;
    }
    printf("%-8s  %-8s  %-10s  %-14s  %s\n", "File", "Parent", "Type", "Length", "Name");
    for (const zff::io::FileInfo& f : files) {
        printf("%-8llu  %-8llu  %-10s  %-14llu  %s\n", static_cast<unsigned long long>(f.file_number),
               static_cast<unsigned long long>(f.parent), zff::core::file_type_name(f.type),
               static_cast<unsigned long long>(f.data_length), f.name.c_str());
    }
    return 0;
}

int handle_cat(const zff::cli::CliArgs& args) {
    ParsedArgs a;
    if (!parse_args("cat", args, kReadOptions, table_size(kReadOptions), &a)) return 2;
    const zff::cli::ParsedOption* obj = find_option(a, OptionId::Object);
    if (obj == nullptr) {
        fprintf(stderr, "error: cat: -o/--object is required\n");
        return 2;
    }
    auto reader = open_reader("cat", a);
    if (!reader) return 1;

    const zff::cli::ParsedOption* file = find_option(a, OptionId::File);
    zff::core::u64 total = 0;
    if (file != nullptr) {
        std::vector<zff::io::FileInfo> files;
        const zff::core::Status s = reader->files(obj->value.u64v, &files);
        if (!zff::core::is_ok(s)) {
            print_status_error_detailed("cat", s);
            return 1;
        }
        bool found = false;
        for (const zff::io::FileInfo& f : files) {
            if (f.file_number == file->value.u64v) {
                total = f.data_length;
                found = true;
            }
        }
        if (!found) {
            fprintf(stderr, "error: cat: no file %llu\n", static_cast<unsigned long long>(file->value.u64v));
            return 1;
        }
    } else {
        zff::io::ObjectInfo info{};
        const zff::core::Status s = reader->object_info(obj->value.u64v, &info);
        if (!zff::core::is_ok(s)) {
            print_status_error_detailed("cat", s);
            return 1;
        }
        total = info.data_length;
    }

    const zff::cli::ParsedOption* off_opt = find_option(a, OptionId::Offset);
    const zff::cli::ParsedOption* len_opt = find_option(a, OptionId::Length);
    zff::core::u64 offset = off_opt != nullptr ? off_opt->value.u64v : 0;
    zff::core::u64 remaining = 0;
    if (len_opt != nullptr) {
        remaining = len_opt->value.u64v;
    } else if (offset <= total) {
        remaining = total - offset;
    }

    // Bounded slices keep memory independent of the object size.
    constexpr zff::core::u64 kSlice = 1u << 20;
    std::vector<zff::core::u8> buf;
    do {
        const zff::core::u64 n = remaining < kSlice ? remaining : kSlice;
        const zff::core::Status s = file != nullptr
            ? reader->read_file(obj->value.u64v, file->value.u64v, offset, n, &buf)
            : reader->read(obj->value.u64v, offset, n, &buf);
        if (!zff::core::is_ok(s)) {
            print_status_error_detailed("cat: read", s);
            return 1;
        }
        if (!write_stdout(buf)) return 1;
        offset += n;
        remaining -= n;
    } while (remaining > 0 && g_running);
    return g_running ? 0 : 1;
}

int handle_verify(const zff::cli::CliArgs& args) {
    ParsedArgs a;
    if (!parse_args("verify", args, kReadOptions, table_size(kReadOptions), &a)) return 2;
    auto reader = open_reader("verify", a);
    if (!reader) return 1;

    zff::io::VerifyReport report{};
    const zff::core::Status s = reader->verify(&report);
    if (!zff::core::is_ok(s)) {
        print_status_error_detailed("verify", s);
        return 1;
    }
    for (const zff::io::VerifyIssue& issue : report.issues) {
        fprintf(stderr, "error: object %llu file %llu chunk %llu: %s (aux=%llu%s%s)\n",
                static_cast<unsigned long long>(issue.object_id),
                static_cast<unsigned long long>(issue.file_number),
                static_cast<unsigned long long>(issue.chunk_number),
                zff::core::status_code_name(issue.status.code),
                static_cast<unsigned long long>(issue.status.aux),
                issue.status.detail != nullptr ? ", " : "",
                issue.status.detail != nullptr ? issue.status.detail : "");
    }
    printf("objects %llu, files %llu, chunks %llu (%llu failed), digests %llu (%llu mismatched), signatures %llu\n",
           static_cast<unsigned long long>(report.objects_checked),
           static_cast<unsigned long long>(report.files_checked),
           static_cast<unsigned long long>(report.chunks_checked),
           static_cast<unsigned long long>(report.chunks_failed),
           static_cast<unsigned long long>(report.digests_checked),
           static_cast<unsigned long long>(report.digests_mismatched),
           static_cast<unsigned long long>(report.signatures_checked));
    if (report.main_footer_signed) {
        printf("main footer signature %s\n", report.main_footer_ok ? "ok" : "INVALID");
    }
    printf("%s\n", report.ok() ? "OK" : "FAILED");
    return report.ok() ? 0 : 1;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    signal(SIGINT, sigint_handler);

    const zff::cli::CommandSpec commands[] = {
        {zff::cli::CommandId::Help, "help"},
        {zff::cli::CommandId::Create, "create"},
        {zff::cli::CommandId::Info, "info"},
        {zff::cli::CommandId::List, "ls"},
        {zff::cli::CommandId::Cat, "cat"},
        {zff::cli::CommandId::Verify, "verify"},
    };
    const zff::core::u32 command_count = sizeof(commands) / sizeof(commands[0]);

    const zff::cli::CliArgs args{argv + 1, static_cast<zff::core::u32>(argc > 0 ? argc - 1 : 0)};
    zff::cli::CommandInvocation inv{};
    zff::core::u32 consumed = 0;
    const zff::core::Status s = zff::cli::parse_command(args, commands, command_count, &inv, &consumed);
    if (!zff::core::is_ok(s)) {
        if (args.argc > 0) {
            fprintf(stderr, "error: unknown command '%s'\n", args.argv[0]);
        }
        handle_help();
        return 2;
    }

    switch (inv.id) {
        case zff::cli::CommandId::Help:
            handle_help();
            return 0;
        case zff::cli::CommandId::Create:
            return handle_create(inv.args);
        case zff::cli::CommandId::Info:
            return handle_info(inv.args);
        case zff::cli::CommandId::List:
            return handle_list(inv.args);
        case zff::cli::CommandId::Cat:
            return handle_cat(inv.args);
        case zff::cli::CommandId::Verify:
            return handle_verify(inv.args);
        case zff::cli::CommandId::None:
            break;
    }
    handle_help();
    return 2;
}
