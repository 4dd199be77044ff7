#include "region.hpp"

#include <algorithm>

namespace geoatlas::core {

namespace {

constexpr int kSelectionBrighten = 50;

std::uint8_t brighten(std::uint8_t channel) {
    return static_cast<std::uint8_t>(std::min(static_cast<int>(channel) + kSelectionBrighten, 255));
}

} // namespace

bool point_in_ring(const Ring& ring, double lon, double lat) {
    const std::size_t count = ring.size();
    if (count < 3) {
        return false;
    }

    bool inside = false;
    std::size_t j = count - 1;
    for (std::size_t i = 0; i < count; ++i) {
        const GeoPoint& pi = ring[i];
        const GeoPoint& pj = ring[j];
        // Horizontal edges (including zero-length ones) never pass the first test,
        // so the division below is never by zero.
        if ((pi.lat > lat) != (pj.lat > lat) &&
            lon < pi.lon + (pj.lon - pi.lon) * (lat - pi.lat) / (pj.lat - pi.lat)) {
            inside = !inside;
        }
        j = i;
    }
    return inside;
}

bool is_well_formed(const Ring& ring) {
    if (ring.size() < 3) {
        return false;
    }
    return std::all_of(ring.begin(), ring.end(), [](const GeoPoint& point) {
        return point.is_finite();
    });
}

Rgb random_region_color(std::mt19937& rng) {
    std::uniform_int_distribution<int> channel(100, 200);
    const int r = channel(rng);
    const int g = channel(rng);
    const int b = channel(rng);
    return Rgb{static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g), static_cast<std::uint8_t>(b)};
}

BoundedRegion::BoundedRegion(std::string name, std::vector<Ring> rings, Rgb base_color, std::int64_t population)
    : name_(std::move(name))
    , base_color_(base_color)
    , population_(std::max<std::int64_t>(population, 0)) {
    std::vector<Ring> kept;
    kept.reserve(rings.size());

    for (auto& ring : rings) {
        if (!is_well_formed(ring)) {
            ++dropped_rings_;
            continue;
        }
        for (const auto& point : ring) {
            bounds_.expand(point);
        }
        point_count_ += ring.size();
        kept.push_back(std::move(ring));
    }

    rings_ = std::make_shared<const std::vector<Ring>>(std::move(kept));
}

Rgb BoundedRegion::get_color(bool selected) const {
    if (!selected) {
        return base_color_;
    }
    return Rgb{brighten(base_color_.r), brighten(base_color_.g), brighten(base_color_.b)};
}

} // namespace geoatlas::core
