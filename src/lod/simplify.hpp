#pragma once

#include <cstddef>

#include "core/types.hpp"

namespace geoatlas::lod {

// Distance in degrees from p to the segment [a, b].
[[nodiscard]] double distance_to_segment(const core::GeoPoint& p, const core::GeoPoint& a, const core::GeoPoint& b);

/*
 * Douglas-Peucker on a closed ring. The ring is split at the vertex farthest
 * from the first one and each half is simplified independently. A ring that
 * started with at least 3 points keeps at least 3. An explicit closing
 * duplicate is preserved at the end. Tolerance <= 0 returns the ring unchanged.
 *
 * The split vertex does not depend on the tolerance, so a smaller tolerance
 * always keeps a superset of the points a larger one keeps.
 */
[[nodiscard]] core::Ring simplify_ring(const core::Ring& ring, double tolerance);

// Keeps ring[0], ring[stride], ring[2 * stride], ...; the stride is halved
// until at least 3 points remain (rings shorter than 3 are returned as-is).
[[nodiscard]] core::Ring decimate_ring(const core::Ring& ring, std::size_t stride);

} // namespace geoatlas::lod
