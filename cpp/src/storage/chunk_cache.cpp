#include "zff/storage/chunk_cache.hpp"

namespace zff::storage {

    ChunkData ChunkCache::get_locked(zff::core::u64 chunk_number) {
        const auto it = index_.find(chunk_number);
        if (it == index_.end()) {
            return nullptr;
        }
        lru_.splice(lru_.begin(), lru_, it->second);
        return it->second->second;
    }

    void ChunkCache::put_locked(zff::core::u64 chunk_number, ChunkData data) {
        const auto it = index_.find(chunk_number);
        if (it != index_.end()) {
            it->second->second = std::move(data);
            lru_.splice(lru_.begin(), lru_, it->second);
            return;
        }
        lru_.emplace_front(chunk_number, std::move(data));
        index_[chunk_number] = lru_.begin();
        while (lru_.size() > capacity_) {
            index_.erase(lru_.back().first);
            lru_.pop_back();
        }
    }

    ChunkData ChunkCache::get(zff::core::u64 chunk_number) {
        if (capacity_ == 0) {
            return nullptr;
        }
        if (shared_) {
            std::lock_guard<std::mutex> lock(mu_);
            return get_locked(chunk_number);
        }
        return get_locked(chunk_number);
    }

    void ChunkCache::put(zff::core::u64 chunk_number, ChunkData data) {
        if (capacity_ == 0 || !data) {
            return;
        }
        if (shared_) {
            std::lock_guard<std::mutex> lock(mu_);
            put_locked(chunk_number, std::move(data));
            return;
        }
        put_locked(chunk_number, std::move(data));
    }

    void ChunkCache::clear() {
        std::lock_guard<std::mutex> lock(mu_);
        lru_.clear();
        index_.clear();
    }

    std::size_t ChunkCache::size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return lru_.size();
    }

} // namespace zff::storage
