#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace geoatlas::core {

// Even-odd ray cast against a single implicitly closed ring.
// Rings with fewer than 3 points contain nothing.
[[nodiscard]] bool point_in_ring(const Ring& ring, double lon, double lat);

// A ring is renderable when it has at least 3 points, all finite.
[[nodiscard]] bool is_well_formed(const Ring& ring);

// Base colour in [100, 200] per channel.
[[nodiscard]] Rgb random_region_color(std::mt19937& rng);

// Named multi-ring boundary (a country) with a cached bounding box.
class BoundedRegion {
public:
    // Malformed rings are dropped here; see dropped_ring_count().
    BoundedRegion(std::string name, std::vector<Ring> rings, Rgb base_color, std::int64_t population = 0);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<Ring>& rings() const { return *rings_; }
    [[nodiscard]] std::shared_ptr<const std::vector<Ring>> shared_rings() const { return rings_; }
    [[nodiscard]] const Bounds& bounds() const { return bounds_; }
    [[nodiscard]] std::int64_t population() const { return population_; }
    [[nodiscard]] std::size_t dropped_ring_count() const { return dropped_rings_; }
    [[nodiscard]] std::size_t point_count() const { return point_count_; }
    [[nodiscard]] bool empty() const { return rings_->empty(); }

    [[nodiscard]] bool contains_point(double lon, double lat) const {
        return contains_point(lon, lat, [](const Ring& ring, double x, double y) {
            return point_in_ring(ring, x, y);
        });
    }

    // Bounding-box reject first; ring_test only runs for points inside the box.
    template <typename RingTest>
    [[nodiscard]] bool contains_point(double lon, double lat, RingTest&& ring_test) const {
        if (rings_->empty() || !bounds_.contains(lon, lat)) {
            return false;
        }
        for (const auto& ring : *rings_) {
            if (ring_test(ring, lon, lat)) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] Rgb base_color() const { return base_color_; }
    [[nodiscard]] Rgb get_color(bool selected) const;
    [[nodiscard]] Rgb color() const { return get_color(selected_); }

    [[nodiscard]] bool selected() const { return selected_; }
    void set_selected(bool selected) { selected_ = selected; }

private:
    std::string name_;
    std::shared_ptr<const std::vector<Ring>> rings_;
    Bounds bounds_ = Bounds::empty();
    Rgb base_color_;
    std::int64_t population_ = 0;
    std::size_t dropped_rings_ = 0;
    std::size_t point_count_ = 0;
    bool selected_ = false;
};

} // namespace geoatlas::core
