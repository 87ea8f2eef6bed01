#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "zff/core/errors.hpp"
#include "zff/core/types.hpp"
#include "zff/storage/chunk_map.hpp"

struct sqlite3;

namespace zff::db {
    using zff::core::u64;

    struct IndexedSegment {
        u64 number{0};
        u64 file_size{0};
        bool has_main_header{false};
        u64 main_header_offset{0};
        bool has_main_footer{false};
        u64 main_footer_offset{0};
    };

    struct IndexedObject {
        u64 object_id{0};
        u64 header_segment{0};
        u64 header_offset{0};
        bool has_footer{false};
        u64 footer_segment{0};
        u64 footer_offset{0};
    };

    // Everything the reader learns from the segment footers.
    struct IndexSnapshot {
        zff::core::Uuid uuid{};
        std::vector<IndexedSegment> segments; // ascending by number
        storage::ChunkMap chunks;
        std::vector<IndexedObject> objects;   // ascending by header position
    };

    // SQLite cache of IndexSnapshots keyed by container uuid. One
    // connection per instance, serialized by the instance mutex.
    class ChunkIndexDb {
    public:
        // Creates the schema if needed. ":memory:" opens a private database.
        [[nodiscard]] static zff::core::Status open(const std::string& path, std::unique_ptr<ChunkIndexDb>* out) noexcept;

        ChunkIndexDb(const ChunkIndexDb&) = delete;
        ChunkIndexDb& operator=(const ChunkIndexDb&) = delete;
        ~ChunkIndexDb();

        // NotFound if the uuid was never stored.
        [[nodiscard]] zff::core::Status load(const zff::core::Uuid& uuid, IndexSnapshot* out) noexcept;

        // Replaces any earlier snapshot of the same container.
        [[nodiscard]] zff::core::Status store(const IndexSnapshot& snap) noexcept;

        [[nodiscard]] zff::core::Status remove(const zff::core::Uuid& uuid) noexcept;

    private:
        ChunkIndexDb() = default;

        [[nodiscard]] zff::core::Status exec(const char* sql) noexcept;

        sqlite3* db_{nullptr};
        std::mutex mutex_;
    };

} // namespace zff::db
