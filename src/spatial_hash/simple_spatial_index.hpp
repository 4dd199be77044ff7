#pragma once

#include <cstddef>
#include <vector>

#include "core/types.hpp"

namespace geoatlas {

using core::Bounds;

// Linear scan over bounding boxes; results come back in insertion order.
template <typename T>
class SimpleSpatialIndex {
private:
    struct IndexItem {
        T data;
        Bounds bounds;

        IndexItem(const T& item_data, const Bounds& item_bounds)
            : data(item_data), bounds(item_bounds) {}
    };

    std::vector<IndexItem> items_;

public:
    SimpleSpatialIndex() = default;

    void insert(const T& item, const Bounds& bounds) {
        items_.emplace_back(item, bounds);
    }

    void reserve(std::size_t count) {
        items_.reserve(count);
    }

    // Zero-area query boxes are allowed so that point lookups work.
    [[nodiscard]] std::vector<T> query(const Bounds& bounds) const {
        std::vector<T> results;
        if (!bounds.is_valid()) {
            return results;
        }

        for (const auto& item : items_) {
            if (item.bounds.max_lon < bounds.min_lon ||
                item.bounds.min_lon > bounds.max_lon ||
                item.bounds.max_lat < bounds.min_lat ||
                item.bounds.min_lat > bounds.max_lat) {
                continue;
            }
            results.push_back(item.data);
        }
        return results;
    }

    [[nodiscard]] std::vector<T> query_point(double lon, double lat) const {
        return query(Bounds{lon, lon, lat, lat});
    }

    void clear() {
        items_.clear();
    }

    [[nodiscard]] std::size_t size() const {
        return items_.size();
    }

    struct Statistics {
        std::size_t total_items = 0;
        double total_area = 0.0;
        double avg_area = 0.0;
        Bounds bounds = Bounds::empty();
    };

    [[nodiscard]] Statistics get_statistics() const {
        Statistics stats;
        stats.total_items = items_.size();
        if (items_.empty()) {
            return stats;
        }

        for (const auto& item : items_) {
            stats.total_area += item.bounds.area();
            stats.bounds.expand(item.bounds);
        }
        stats.avg_area = stats.total_area / static_cast<double>(stats.total_items);
        return stats;
    }
};

} // namespace geoatlas
