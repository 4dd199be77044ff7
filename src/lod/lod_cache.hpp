#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace geoatlas::lod {

using RingSet = std::vector<core::Ring>;
using SharedRingSet = std::shared_ptr<const RingSet>;

// Least-recently-used store of reduced ring sets keyed by (region, detail level).
class LodCache {
public:
    explicit LodCache(std::size_t capacity)
        : capacity_(capacity) {}

    [[nodiscard]] bool enabled() const noexcept { return capacity_ > 0; }

    SharedRingSet lookup(std::size_t region_id, int level) {
        if (!enabled()) {
            return nullptr;
        }

        const auto it = map_.find(CacheKey{region_id, level});
        if (it == map_.end()) {
            ++misses_;
            return nullptr;
        }

        entries_.splice(entries_.begin(), entries_, it->second);
        ++hits_;
        return entries_.front().rings;
    }

    void store(std::size_t region_id, int level, SharedRingSet rings) {
        if (!enabled()) {
            return;
        }

        const CacheKey key{region_id, level};
        const auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->rings = std::move(rings);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        if (map_.size() == capacity_) {
            auto tail = std::prev(entries_.end());
            map_.erase(tail->key);
            entries_.pop_back();
        }

        entries_.push_front(Entry{key, std::move(rings)});
        map_[key] = entries_.begin();
    }

    // Returns the cached set or computes, stores and returns it.
    template <typename Compute>
    SharedRingSet get_or_compute(std::size_t region_id, int level, Compute&& compute) {
        if (SharedRingSet cached = lookup(region_id, level)) {
            return cached;
        }
        SharedRingSet computed = std::make_shared<const RingSet>(compute());
        store(region_id, level, computed);
        return computed;
    }

    void clear() {
        entries_.clear();
        map_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    [[nodiscard]] std::size_t size() const { return map_.size(); }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] std::size_t hits() const { return hits_; }
    [[nodiscard]] std::size_t misses() const { return misses_; }
    [[nodiscard]] bool contains(std::size_t region_id, int level) const {
        return map_.find(CacheKey{region_id, level}) != map_.end();
    }

private:
    struct CacheKey {
        std::size_t region_id;
        int level;

        bool operator==(const CacheKey& other) const {
            return region_id == other.region_id && level == other.level;
        }
    };

    struct Entry {
        CacheKey key;
        SharedRingSet rings;
    };

    struct CacheKeyHasher {
        std::size_t operator()(const CacheKey& key) const noexcept {
            std::size_t hash = std::hash<std::size_t>{}(key.region_id);
            hash ^= std::hash<int>{}(key.level) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
            return hash;
        }
    };

    using CacheList = std::list<Entry>;
    using CacheMap = std::unordered_map<CacheKey, CacheList::iterator, CacheKeyHasher>;

    std::size_t capacity_;
    CacheList entries_;
    CacheMap map_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace geoatlas::lod
