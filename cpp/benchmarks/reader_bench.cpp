#include <cstddef>
#include <memory>
#include <vector>

#include <benchmark/benchmark.h>

#include "test_util.hpp"
#include "zff/io/container_reader.hpp"
#include "zff/io/container_writer.hpp"

namespace {
constexpr zff::core::u64 kImageBytes = 16 * 1024 * 1024;

static bool write_image(const std::string& base, zff::core::CompressionId algo) {
    zff::io::ContainerConfig ccfg{};
    ccfg.max_segment_size = 4 * 1024 * 1024;
    std::unique_ptr<zff::io::ContainerWriter> w;
    if (!zff::core::is_ok(zff::io::ContainerWriter::create(base, ccfg, &w))) {
        return false;
    }
    zff::io::ObjectConfig ocfg{};
    ocfg.compression.algo = algo;
    zff::io::ObjectWriter* obj = nullptr;
    if (!zff::core::is_ok(w->add_physical_object(1, ocfg, &obj))) {
        return false;
    }
    const std::vector<zff::core::u8> data = zff::test::pattern_bytes(kImageBytes, 7);
    return zff::core::is_ok(obj->write({data.data(), data.size()})) && zff::core::is_ok(w->close());
}
} // namespace

// range(0): read size, range(1): cached chunks
static void BM_RandomRead(benchmark::State& state) {
    zff::test::TempDir dir;
    const std::string base = dir.file("bench");
    if (!write_image(base, zff::core::CompressionId::Zstd)) {
        state.SkipWithError("write failed");
        return;
    }
    zff::io::ReaderOptions opts{};
    opts.cache_chunks = static_cast<std::size_t>(state.range(1));
    std::unique_ptr<zff::io::ContainerReader> r;
    if (!zff::core::is_ok(zff::io::ContainerReader::open_base(base, opts, &r))) {
        state.SkipWithError("open failed");
        return;
    }

    const zff::core::u64 n = static_cast<zff::core::u64>(state.range(0));
    zff::core::u64 x = 0x9E3779B97F4A7C15ull;
    std::vector<zff::core::u8> out;
    for (auto _ : state) {
        x ^= x << 13;
        x ^= x >> 7;
        x ^= x << 17;
        const zff::core::u64 off = x % (kImageBytes - n);
        const zff::core::Status s = r->read(1, off, n, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_RandomRead)->ArgsProduct({{512, 64 * 1024}, {0, 64}});

static void BM_OpenContainer(benchmark::State& state) {
    zff::test::TempDir dir;
    const std::string base = dir.file("bench");
    if (!write_image(base, zff::core::CompressionId::None)) {
        state.SkipWithError("write failed");
        return;
    }
    for (auto _ : state) {
        std::unique_ptr<zff::io::ContainerReader> r;
        const zff::core::Status s = zff::io::ContainerReader::open_base(base, zff::io::ReaderOptions{}, &r);
        benchmark::DoNotOptimize(s);
    }
}

BENCHMARK(BM_OpenContainer);
