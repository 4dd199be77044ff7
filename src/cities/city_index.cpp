#include "city_index.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace geoatlas::cities {

namespace {

const std::vector<std::size_t> kNoCities;

bool degenerate(const core::Bounds& viewport) {
    return !viewport.is_valid() || viewport.area() <= 0.0;
}

} // namespace

const char* to_string(VisibilityPolicy policy) {
    switch (policy) {
        case VisibilityPolicy::Threshold:
            return "threshold";
        case VisibilityPolicy::Quota:
            return "quota";
    }
    return "unknown";
}

bool parse_policy(std::string_view text, VisibilityPolicy& out) {
    if (text == "threshold") {
        out = VisibilityPolicy::Threshold;
        return true;
    }
    if (text == "quota") {
        out = VisibilityPolicy::Quota;
        return true;
    }
    return false;
}

CityIndex::CityIndex(VisibilityPolicy policy)
    : policy_(policy) {}

void CityIndex::build(const std::vector<core::City>& cities,
                      const std::vector<core::BoundedRegion>& regions,
                      const core::LogCallback& log) {
    clear();

    for (const auto& region : regions) {
        groups_[region.name()].population = region.population();
    }

    positions_.reserve(cities.size());
    populations_.reserve(cities.size());
    resolved_.reserve(cities.size());

    std::vector<std::pair<std::size_t, core::Bounds>> entries;
    entries.reserve(cities.size());

    for (std::size_t i = 0; i < cities.size(); ++i) {
        const auto& city = cities[i];
        positions_.push_back(city.position);
        populations_.push_back(city.population);
        entries.emplace_back(i, core::Bounds{city.position.lon, city.position.lon,
                                             city.position.lat, city.position.lat});

        const auto group = groups_.find(city.owner);
        if (group == groups_.end()) {
            resolved_.push_back(false);
            unresolved_.push_back(i);
            if (log) {
                log("City '" + city.name + "' references unknown region '" + city.owner + "'", true);
            }
            continue;
        }
        resolved_.push_back(true);
        group->second.ranked.push_back(i);
    }

    for (auto& [name, group] : groups_) {
        std::stable_sort(group.ranked.begin(), group.ranked.end(), [this](std::size_t lhs, std::size_t rhs) {
            return populations_[lhs] > populations_[rhs];
        });
    }

    tree_.bulk_load(std::move(entries));
}

void CityIndex::clear() {
    positions_.clear();
    populations_.clear();
    resolved_.clear();
    groups_.clear();
    unresolved_.clear();
    tree_.clear();
}

std::vector<std::size_t> CityIndex::visible_cities(const core::Bounds& viewport, double zoom) const {
    if (degenerate(viewport)) {
        return {};
    }
    if (policy_ == VisibilityPolicy::Quota) {
        return quota_visible(viewport, zoom);
    }
    return threshold_visible(viewport);
}

std::vector<std::size_t> CityIndex::cities_in(const core::Bounds& viewport) const {
    if (!viewport.is_valid()) {
        return {};
    }
    std::vector<std::size_t> result = tree_.query(viewport);
    std::sort(result.begin(), result.end());
    return result;
}

std::int64_t CityIndex::population_floor(double viewport_width_degrees) {
    if (viewport_width_degrees > 180.0) {
        return 5'000'000;  // world
    }
    if (viewport_width_degrees > 60.0) {
        return 2'000'000;  // continent
    }
    if (viewport_width_degrees > 20.0) {
        return 1'000'000;
    }
    if (viewport_width_degrees > 5.0) {
        return 500'000;
    }
    return 100'000;
}

double CityIndex::quota_fraction(double zoom) {
    if (zoom < 0.5) {
        return 0.3;
    }
    if (zoom < 1.0) {
        return 0.5;
    }
    if (zoom < 2.0) {
        return 0.7;
    }
    if (zoom < 4.0) {
        return 0.85;
    }
    return 1.0;
}

std::size_t CityIndex::region_quota(std::int64_t region_population) {
    const std::int64_t millions = std::max<std::int64_t>(region_population, 0) / 1'000'000;
    return static_cast<std::size_t>(std::max<std::int64_t>(3, millions));
}

std::size_t CityIndex::scaled_quota(std::int64_t region_population, double zoom) {
    const double scaled = std::ceil(static_cast<double>(region_quota(region_population)) * quota_fraction(zoom));
    return std::max<std::size_t>(1, static_cast<std::size_t>(scaled));
}

const std::vector<std::size_t>& CityIndex::ranked_cities(const std::string& region_name) const {
    const auto it = groups_.find(region_name);
    return it == groups_.end() ? kNoCities : it->second.ranked;
}

bool CityIndex::is_resolved(std::size_t city_index) const {
    return city_index < resolved_.size() && resolved_[city_index];
}

std::vector<std::size_t> CityIndex::threshold_visible(const core::Bounds& viewport) const {
    const std::int64_t floor = population_floor(viewport.width());

    std::vector<std::size_t> result;
    for (const std::size_t idx : tree_.query(viewport)) {
        if (populations_[idx] >= floor) {
            result.push_back(idx);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::size_t> CityIndex::quota_visible(const core::Bounds& viewport, double zoom) const {
    std::vector<std::size_t> result;
    for (const auto& [name, group] : groups_) {
        const std::size_t quota = std::min(scaled_quota(group.population, zoom), group.ranked.size());
        for (std::size_t rank = 0; rank < quota; ++rank) {
            const std::size_t idx = group.ranked[rank];
            if (viewport.contains(positions_[idx])) {
                result.push_back(idx);
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace geoatlas::cities
