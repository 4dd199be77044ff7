#include "viewport_culler.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace geoatlas::viewport {

namespace {

// One side of the clip box: a vertical (lon) or horizontal (lat) line and
// the side of it that is kept.
struct ClipEdge {
    bool on_lon;
    double value;
    bool keep_above;

    [[nodiscard]] double coordinate(const core::GeoPoint& point) const {
        return on_lon ? point.lon : point.lat;
    }

    [[nodiscard]] bool inside(const core::GeoPoint& point) const {
        return keep_above ? coordinate(point) >= value : coordinate(point) <= value;
    }

    // a and b lie on opposite sides, so the denominator is never zero.
    [[nodiscard]] core::GeoPoint crossing(const core::GeoPoint& a, const core::GeoPoint& b) const {
        const double t = (value - coordinate(a)) / (coordinate(b) - coordinate(a));
        if (on_lon) {
            return core::GeoPoint(value, a.lat + t * (b.lat - a.lat));
        }
        return core::GeoPoint(a.lon + t * (b.lon - a.lon), value);
    }
};

std::array<ClipEdge, 4> clip_edges(const core::Bounds& box) {
    return {ClipEdge{true, box.min_lon, true}, ClipEdge{true, box.max_lon, false},
            ClipEdge{false, box.min_lat, true}, ClipEdge{false, box.max_lat, false}};
}

} // namespace

bool ViewportCuller::is_degenerate(const core::Bounds& view) {
    return !view.is_valid() || view.area() <= 0.0;
}

core::Bounds ViewportCuller::expand(const core::Bounds& view) const {
    if (is_degenerate(view)) {
        return view;
    }
    const double margin = std::max(0.0, options_.margin_fraction) * view.width();
    return view.padded(margin);
}

std::vector<std::size_t> ViewportCuller::cull(const RegionIndex& index,
                                              const std::vector<core::BoundedRegion>& regions,
                                              const core::Bounds& view, double zoom) {
    ++stats_.queries;
    if (is_degenerate(view)) {
        return {};
    }

    const core::Bounds expanded = expand(view);
    if (cache_.should_invalidate(expanded, zoom, regions.size())) {
        cache_.update(index, regions, expanded.padded(std::max(0.0, options_.reuse_epsilon)), zoom);
        ++stats_.index_queries;
    }

    std::vector<std::size_t> visible;
    visible.reserve(cache_.candidates.size());
    for (const std::size_t idx : cache_.candidates) {
        if (regions[idx].bounds().intersects(expanded)) {
            visible.push_back(idx);
        }
    }
    return visible;
}

std::vector<core::Ring> ViewportCuller::clip_ring(const core::Ring& ring, const core::Bounds& expanded) {
    const std::size_t count = ring.size();
    if (count < 3) {
        return {};
    }

    std::vector<bool> inside(count);
    std::size_t inside_count = 0;
    for (std::size_t i = 0; i < count; ++i) {
        inside[i] = expanded.contains(ring[i]);
        if (inside[i]) {
            ++inside_count;
        }
    }

    if (inside_count == count) {
        return {ring};
    }

    if (inside_count == 0) {
        // Edges can still cross the view when no vertex lies in it
        core::Bounds ring_bounds = core::Bounds::empty();
        for (const auto& point : ring) {
            ring_bounds.expand(point);
        }
        if (ring_bounds.intersects(expanded)) {
            return {ring};
        }
        return {};
    }

    // A point is kept if it or either cyclic neighbour is inside
    std::vector<bool> keep(count, false);
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t prev = (i + count - 1) % count;
        const std::size_t next = (i + 1) % count;
        keep[i] = inside[i] || inside[prev] || inside[next];
    }

    // Start the walk just after a dropped point so runs never wrap
    std::size_t start = 0;
    for (std::size_t i = 0; i < count; ++i) {
        if (!keep[i]) {
            start = (i + 1) % count;
            break;
        }
    }

    std::vector<core::Ring> pieces;
    core::Ring current;
    for (std::size_t step = 0; step < count; ++step) {
        const std::size_t i = (start + step) % count;
        if (keep[i]) {
            current.push_back(ring[i]);
        } else if (!current.empty()) {
            if (current.size() >= 3) {
                pieces.push_back(std::move(current));
            }
            current = core::Ring{};
        }
    }
    if (current.size() >= 3) {
        pieces.push_back(std::move(current));
    }
    return pieces;
}

core::Ring ViewportCuller::clip_polygon(const core::Ring& ring, const core::Bounds& box) {
    if (ring.size() < 3 || !box.is_valid()) {
        return {};
    }

    core::Ring output = ring;
    for (const ClipEdge& edge : clip_edges(box)) {
        if (output.empty()) {
            break;
        }
        const core::Ring input = std::move(output);
        output = core::Ring{};
        output.reserve(input.size() + 4);

        core::GeoPoint prev = input.back();
        bool prev_inside = edge.inside(prev);
        for (const auto& point : input) {
            const bool inside = edge.inside(point);
            if (inside != prev_inside) {
                output.push_back(edge.crossing(prev, point));
            }
            if (inside) {
                output.push_back(point);
            }
            prev = point;
            prev_inside = inside;
        }
    }

    if (output.size() < 3) {
        return {};
    }
    return output;
}

ViewportCuller::ClippedRings ViewportCuller::clip_rings(const std::vector<core::Ring>& rings,
                                                        const core::Bounds& expanded) const {
    ClippedRings result;
    result.fill.reserve(rings.size());
    result.outline.reserve(rings.size());
    for (const auto& ring : rings) {
        if (ring.size() < options_.point_cull_min_points) {
            result.fill.push_back(ring);
            result.outline.push_back(OutlineRun{ring, true});
            continue;
        }

        core::Ring filled = clip_polygon(ring, expanded);
        if (!filled.empty()) {
            result.fill.push_back(std::move(filled));
        }
        for (auto& piece : clip_ring(ring, expanded)) {
            // Only a ring kept whole comes back at full length
            const bool whole = piece.size() == ring.size();
            result.outline.push_back(OutlineRun{std::move(piece), whole});
        }
    }
    return result;
}

void ViewportCuller::invalidate() {
    cache_.invalidate();
}

bool ViewportCuller::CandidateCache::should_invalidate(const core::Bounds& expanded, double new_zoom,
                                                       std::size_t new_region_count) const {
    if (!is_valid) {
        return true;
    }
    if (new_zoom != zoom || new_region_count != region_count) {
        return true;
    }
    return !query_rect.contains(expanded);
}

void ViewportCuller::CandidateCache::update(const RegionIndex& index,
                                            const std::vector<core::BoundedRegion>& regions,
                                            const core::Bounds& rect, double new_zoom) {
    query_rect = rect;
    zoom = new_zoom;
    region_count = regions.size();
    candidates = index.query_rect(regions, rect);
    is_valid = true;
}

void ViewportCuller::CandidateCache::invalidate() {
    is_valid = false;
    candidates.clear();
}

} // namespace geoatlas::viewport
