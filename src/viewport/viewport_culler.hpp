#pragma once

#include <cstddef>
#include <vector>

#include "core/region.hpp"
#include "spatial_hash/region_index.hpp"

namespace geoatlas::viewport {

/*
 * Narrows the region collection to the ones worth drawing for a viewport.
 *
 * The view is grown by margin_fraction * view width on every edge before any
 * test, so geometry just off screen is already present while panning.
 * Candidate sets are cached against a query rectangle padded by
 * reuse_epsilon degrees; a later view that still fits inside that rectangle
 * is answered by filtering the cached set, which gives the same result as a
 * fresh query.
 */
class ViewportCuller {
public:
    struct Options {
        double margin_fraction = 0.1;
        double reuse_epsilon = 1.0;
        // Rings shorter than this are never point-culled.
        std::size_t point_cull_min_points = 500;
    };

    struct Stats {
        std::size_t queries = 0;
        std::size_t index_queries = 0;
    };

    ViewportCuller() = default;
    explicit ViewportCuller(Options options)
        : options_(options) {}

    // Margin-expanded view; invalid or zero-area views come back unchanged.
    [[nodiscard]] core::Bounds expand(const core::Bounds& view) const;

    // Indices (ascending) of regions whose box meets the expanded view.
    std::vector<std::size_t> cull(const RegionIndex& index,
                                  const std::vector<core::BoundedRegion>& regions,
                                  const core::Bounds& view, double zoom);

    // Point-level cull of one ring against the expanded view. Each visible run
    // keeps one neighbour on either side; sub-rings under 3 points are dropped.
    [[nodiscard]] static std::vector<core::Ring> clip_ring(const core::Ring& ring, const core::Bounds& expanded);

    // Sutherland-Hodgman clip of a closed ring to box. The result is closed and
    // covers exactly the part of the ring's interior inside box; empty when
    // fewer than 3 points remain.
    [[nodiscard]] static core::Ring clip_polygon(const core::Ring& ring, const core::Bounds& box);

    struct OutlineRun {
        core::Ring points;
        bool closed = true;
    };

    struct ClippedRings {
        std::vector<core::Ring> fill;
        std::vector<OutlineRun> outline;
    };

    // Rings long enough to be worth it are box-clipped for filling and
    // point-culled into open runs for stroking; shorter rings pass through.
    [[nodiscard]] ClippedRings clip_rings(const std::vector<core::Ring>& rings, const core::Bounds& expanded) const;

    void invalidate();

    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] const Stats& stats() const { return stats_; }

    [[nodiscard]] static bool is_degenerate(const core::Bounds& view);

private:
    struct CandidateCache {
        core::Bounds query_rect = core::Bounds::empty();
        double zoom = 0.0;
        std::size_t region_count = 0;
        std::vector<std::size_t> candidates;
        bool is_valid = false;

        bool should_invalidate(const core::Bounds& expanded, double new_zoom, std::size_t new_region_count) const;
        void update(const RegionIndex& index, const std::vector<core::BoundedRegion>& regions,
                    const core::Bounds& rect, double new_zoom);
        void invalidate();
    };

    Options options_{};
    Stats stats_{};
    CandidateCache cache_;
};

} // namespace geoatlas::viewport
