#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/log.hpp"
#include "core/region.hpp"
#include "core/types.hpp"
#include "spatial_hash/rtree.hpp"

namespace geoatlas::cities {

enum class VisibilityPolicy {
    // Population floor chosen by viewport width.
    Threshold,
    // Per-region allotment scaled by zoom.
    Quota
};

[[nodiscard]] const char* to_string(VisibilityPolicy policy);
[[nodiscard]] bool parse_policy(std::string_view text, VisibilityPolicy& out);

/*
 * Point index over cities with population ranking per owning region.
 * Within a region, cities are ordered by descending population; equal
 * populations keep load order. The policy is fixed for the index lifetime.
 */
class CityIndex {
public:
    explicit CityIndex(VisibilityPolicy policy = VisibilityPolicy::Threshold);

    // Owners not found among regions are logged and reported by unresolved().
    void build(const std::vector<core::City>& cities,
               const std::vector<core::BoundedRegion>& regions,
               const core::LogCallback& log = {});
    void clear();

    // Indices (ascending) of the cities to draw. Degenerate viewports give nothing.
    [[nodiscard]] std::vector<std::size_t> visible_cities(const core::Bounds& viewport, double zoom) const;

    // All cities inside the viewport, regardless of policy.
    [[nodiscard]] std::vector<std::size_t> cities_in(const core::Bounds& viewport) const;

    [[nodiscard]] static std::int64_t population_floor(double viewport_width_degrees);
    [[nodiscard]] static double quota_fraction(double zoom);
    [[nodiscard]] static std::size_t region_quota(std::int64_t region_population);
    [[nodiscard]] static std::size_t scaled_quota(std::int64_t region_population, double zoom);

    // Ranked city indices of one region; empty for unknown names.
    [[nodiscard]] const std::vector<std::size_t>& ranked_cities(const std::string& region_name) const;
    [[nodiscard]] const std::vector<std::size_t>& unresolved() const { return unresolved_; }
    [[nodiscard]] bool is_resolved(std::size_t city_index) const;

    [[nodiscard]] VisibilityPolicy policy() const { return policy_; }
    [[nodiscard]] std::size_t size() const { return positions_.size(); }

private:
    struct RegionGroup {
        std::int64_t population = 0;
        std::vector<std::size_t> ranked;
    };

    [[nodiscard]] std::vector<std::size_t> threshold_visible(const core::Bounds& viewport) const;
    [[nodiscard]] std::vector<std::size_t> quota_visible(const core::Bounds& viewport, double zoom) const;

    VisibilityPolicy policy_;
    std::vector<core::GeoPoint> positions_;
    std::vector<std::int64_t> populations_;
    std::vector<bool> resolved_;
    std::unordered_map<std::string, RegionGroup> groups_;
    std::vector<std::size_t> unresolved_;
    RTree<std::size_t> tree_;
};

} // namespace geoatlas::cities
