#include "region_index.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <utility>

namespace geoatlas {

void RegionIndex::build(const std::vector<core::BoundedRegion>& regions) {
    clear();

    if (regions.empty()) {
        return;
    }

    if (regions.size() <= options_.rtree_threshold) {
        linear_.reserve(regions.size());
        for (std::size_t i = 0; i < regions.size(); ++i) {
            if (!regions[i].empty()) {
                linear_.insert(i, regions[i].bounds());
            }
        }
        backend_ = Backend::Linear;
    } else {
        std::vector<std::pair<std::size_t, core::Bounds>> entries;
        entries.reserve(regions.size());
        for (std::size_t i = 0; i < regions.size(); ++i) {
            if (!regions[i].empty()) {
                entries.emplace_back(i, regions[i].bounds());
            }
        }
        tree_.bulk_load(std::move(entries));
        backend_ = Backend::RTree;
    }

    built_count_ = regions.size();
}

void RegionIndex::clear() {
    linear_.clear();
    tree_.clear();
    backend_ = Backend::Empty;
    built_count_ = 0;
}

std::optional<std::size_t> RegionIndex::query_point(const std::vector<core::BoundedRegion>& regions,
                                                    double lon, double lat) const {
    if (!in_sync(regions) || !std::isfinite(lon) || !std::isfinite(lat)) {
        return std::nullopt;
    }

    // candidates() is sorted, so the first hit is the first in insertion order
    for (const std::size_t idx : candidates(core::Bounds{lon, lon, lat, lat})) {
        if (regions[idx].contains_point(lon, lat)) {
            return idx;
        }
    }
    return std::nullopt;
}

std::vector<std::size_t> RegionIndex::query_rect(const std::vector<core::BoundedRegion>& regions,
                                                 const core::Bounds& rect) const {
    if (!in_sync(regions) || !rect.is_valid()) {
        return {};
    }
    return candidates(rect);
}

bool RegionIndex::in_sync(const std::vector<core::BoundedRegion>& regions) const {
    const bool synced = regions.size() == built_count_;
    assert(synced && "RegionIndex queried against a collection it was not built from");
    return synced;
}

std::vector<std::size_t> RegionIndex::candidates(const core::Bounds& rect) const {
    std::vector<std::size_t> result;
    switch (backend_) {
        case Backend::Linear:
            result = linear_.query(rect);
            break;
        case Backend::RTree:
            result = tree_.query(rect);
            std::sort(result.begin(), result.end());
            break;
        case Backend::Empty:
            break;
    }
    return result;
}

} // namespace geoatlas
