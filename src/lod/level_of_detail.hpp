#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "core/region.hpp"
#include "lod_cache.hpp"

namespace geoatlas::lod {

enum class Strategy {
    Stride,
    Tolerance
};

[[nodiscard]] const char* to_string(Strategy strategy);
// Accepts "stride" or "tolerance"; returns false for anything else.
[[nodiscard]] bool parse_strategy(std::string_view text, Strategy& out);

// Detail chosen for one zoom value. Band 0 is full detail.
struct DetailLevel {
    Strategy strategy = Strategy::Tolerance;
    int band = 0;
    std::size_t stride = 1;
    double tolerance = 0.0;

    [[nodiscard]] bool full_detail() const { return band == 0; }
};

/*
 * Maps zoom to a ring reduction. The mapping is a pure function of zoom and
 * coarsens monotonically as zoom decreases:
 *
 *   zoom      stride   tolerance (deg)
 *   >= 4.0       1        full
 *   >= 2.0       2        0.1
 *   >= 1.0       4        0.5
 *   >= 0.5       8        1.0
 *   >= 0.3      16        2.0
 *   <  0.3      16        5.0
 *
 * Reduced ring sets are memoized per (region id, band) in an LRU cache.
 */
class LevelOfDetailSelector {
public:
    static constexpr double kFullDetailZoom = 4.0;

    explicit LevelOfDetailSelector(Strategy strategy = Strategy::Tolerance, std::size_t cache_capacity = 512);

    [[nodiscard]] DetailLevel select(double zoom) const;

    // Reduced rings for region at zoom; full detail shares the region's own rings.
    SharedRingSet rings_for(const core::BoundedRegion& region, std::size_t region_id, double zoom);

    [[nodiscard]] static RingSet reduce(const RingSet& rings, const DetailLevel& level);

    // Changing the strategy drops every cached ring set.
    void set_strategy(Strategy strategy);
    [[nodiscard]] Strategy strategy() const { return strategy_; }

    void clear_cache() { cache_.clear(); }
    [[nodiscard]] const LodCache& cache() const { return cache_; }

private:
    Strategy strategy_;
    LodCache cache_;
};

} // namespace geoatlas::lod
