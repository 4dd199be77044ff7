#include "simplify.hpp"

#include <algorithm>
#include <cmath>
#include <stack>
#include <utility>
#include <vector>

namespace geoatlas::lod {

namespace {

double squared_distance(const core::GeoPoint& a, const core::GeoPoint& b) {
    const double dx = a.lon - b.lon;
    const double dy = a.lat - b.lat;
    return dx * dx + dy * dy;
}

// Marks the vertices in (first, last) that survive simplification.
void douglas_peucker(const core::Ring& points, std::size_t first, std::size_t last,
                     double tolerance, std::vector<bool>& keep) {
    std::stack<std::pair<std::size_t, std::size_t>> segments;
    segments.emplace(first, last);

    while (!segments.empty()) {
        const auto [start, end] = segments.top();
        segments.pop();

        if (end <= start + 1) {
            continue;
        }

        double max_distance = -1.0;
        std::size_t farthest = start;
        for (std::size_t i = start + 1; i < end; ++i) {
            const double distance = distance_to_segment(points[i], points[start], points[end]);
            if (distance > max_distance) {
                max_distance = distance;
                farthest = i;
            }
        }

        if (max_distance > tolerance) {
            keep[farthest] = true;
            segments.emplace(start, farthest);
            segments.emplace(farthest, end);
        }
    }
}

} // namespace

double distance_to_segment(const core::GeoPoint& p, const core::GeoPoint& a, const core::GeoPoint& b) {
    const double dx = b.lon - a.lon;
    const double dy = b.lat - a.lat;
    const double length_sq = dx * dx + dy * dy;

    double u = 0.0;
    if (length_sq > 0.0) {
        u = ((p.lon - a.lon) * dx + (p.lat - a.lat) * dy) / length_sq;
        u = std::clamp(u, 0.0, 1.0);
    }

    const double x = a.lon + u * dx;
    const double y = a.lat + u * dy;
    return std::hypot(p.lon - x, p.lat - y);
}

core::Ring simplify_ring(const core::Ring& ring, double tolerance) {
    if (tolerance <= 0.0 || ring.size() <= 3) {
        return ring;
    }

    const bool explicitly_closed = ring.front() == ring.back();
    const std::size_t count = explicitly_closed ? ring.size() - 1 : ring.size();
    if (count <= 3) {
        return ring;
    }

    // Split vertex: farthest from the start of the ring
    std::size_t split = 1;
    double split_distance = -1.0;
    for (std::size_t i = 1; i < count; ++i) {
        const double distance = squared_distance(ring[0], ring[i]);
        if (distance > split_distance) {
            split_distance = distance;
            split = i;
        }
    }

    // Unrolled copy so the second half runs from the split vertex back to vertex 0
    core::Ring unrolled(ring.begin(), ring.begin() + static_cast<std::ptrdiff_t>(count));
    unrolled.push_back(ring[0]);

    std::vector<bool> keep(count + 1, false);
    keep[0] = true;
    keep[split] = true;
    douglas_peucker(unrolled, 0, split, tolerance, keep);
    douglas_peucker(unrolled, split, count, tolerance, keep);
    keep.pop_back();

    std::size_t kept = static_cast<std::size_t>(std::count(keep.begin(), keep.end(), true));
    if (kept < 3) {
        // Degenerate to a line: keep the vertex farthest from the chord as well.
        double best = -1.0;
        std::size_t best_index = 0;
        for (std::size_t i = 1; i < count; ++i) {
            if (i == split) {
                continue;
            }
            const double distance = distance_to_segment(ring[i], ring[0], ring[split]);
            if (distance > best) {
                best = distance;
                best_index = i;
            }
        }
        if (best_index != 0) {
            keep[best_index] = true;
        }
    }

    core::Ring result;
    result.reserve(count + 1);
    for (std::size_t i = 0; i < count; ++i) {
        if (keep[i]) {
            result.push_back(ring[i]);
        }
    }
    if (explicitly_closed) {
        result.push_back(ring.back());
    }
    return result;
}

core::Ring decimate_ring(const core::Ring& ring, std::size_t stride) {
    if (ring.size() < 3 || stride <= 1) {
        return ring;
    }

    std::size_t step = stride;
    while (step > 1 && (ring.size() + step - 1) / step < 3) {
        step /= 2;
    }
    if (step <= 1) {
        return ring;
    }

    core::Ring result;
    result.reserve((ring.size() + step - 1) / step);
    for (std::size_t i = 0; i < ring.size(); i += step) {
        result.push_back(ring[i]);
    }
    return result;
}

} // namespace geoatlas::lod
