#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "zff/core/types.hpp"

namespace zff::storage {

    using ChunkData = std::shared_ptr<const std::vector<zff::core::u8>>;

    // LRU of decoded chunks keyed by chunk number. With 'shared' set every
    // operation takes the cache mutex. Capacity 0 disables caching.
    class ChunkCache {
    public:
        explicit ChunkCache(std::size_t capacity = 0, bool shared = false) noexcept
            : capacity_(capacity), shared_(shared) {}

        ChunkCache(const ChunkCache&) = delete;
        ChunkCache& operator=(const ChunkCache&) = delete;

        [[nodiscard]] ChunkData get(zff::core::u64 chunk_number);
        void put(zff::core::u64 chunk_number, ChunkData data);
        void clear();

        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    private:
        using Entry = std::pair<zff::core::u64, ChunkData>;

        ChunkData get_locked(zff::core::u64 chunk_number);
        void put_locked(zff::core::u64 chunk_number, ChunkData data);

        std::size_t capacity_;
        bool shared_;
        mutable std::mutex mu_;
        std::list<Entry> lru_; // front = most recent
        std::unordered_map<zff::core::u64, std::list<Entry>::iterator> index_;
    };

} // namespace zff::storage
