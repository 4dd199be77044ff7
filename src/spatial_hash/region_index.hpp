#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/region.hpp"
#include "rtree.hpp"
#include "simple_spatial_index.hpp"

namespace geoatlas {

/*
 * Region lookup by bounding box. Small collections are scanned linearly; above
 * rtree_threshold regions an R-tree is bulk loaded instead. Both back ends
 * return the same answers.
 */
class RegionIndex {
public:
    struct Options {
        std::size_t rtree_threshold = 256;
    };

    enum class Backend {
        Empty,
        Linear,
        RTree
    };

    RegionIndex() = default;
    explicit RegionIndex(Options options)
        : options_(options) {}

    // Indexes regions by position in the vector; rebuild after the vector changes.
    void build(const std::vector<core::BoundedRegion>& regions);
    void clear();

    // First region (in insertion order) whose ring test confirms the point.
    [[nodiscard]] std::optional<std::size_t> query_point(const std::vector<core::BoundedRegion>& regions,
                                                         double lon, double lat) const;

    // Regions whose box intersects rect, ascending by index. Invalid rects give nothing.
    [[nodiscard]] std::vector<std::size_t> query_rect(const std::vector<core::BoundedRegion>& regions,
                                                      const core::Bounds& rect) const;

    [[nodiscard]] std::size_t size() const { return built_count_; }
    [[nodiscard]] Backend backend() const { return backend_; }
    [[nodiscard]] const Options& options() const { return options_; }

private:
    [[nodiscard]] bool in_sync(const std::vector<core::BoundedRegion>& regions) const;
    [[nodiscard]] std::vector<std::size_t> candidates(const core::Bounds& rect) const;

    Options options_{};
    Backend backend_ = Backend::Empty;
    std::size_t built_count_ = 0;
    SimpleSpatialIndex<std::size_t> linear_;
    RTree<std::size_t> tree_;
};

} // namespace geoatlas
