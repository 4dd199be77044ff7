#include "map_data.hpp"

#include <algorithm>
#include <random>
#include <utility>

namespace geoatlas::core {

const char* to_string(LoadIssue::ErrorType type) {
    switch (type) {
        case LoadIssue::ErrorType::MalformedGeometry:
            return "malformed geometry";
        case LoadIssue::ErrorType::EmptyRegion:
            return "empty region";
        case LoadIssue::ErrorType::DuplicateRegion:
            return "duplicate region";
        case LoadIssue::ErrorType::UnresolvedOwner:
            return "unresolved owner";
        case LoadIssue::ErrorType::InvalidCity:
            return "invalid city";
    }
    return "unknown";
}

std::size_t LoadReport::count(LoadIssue::ErrorType type) const {
    return static_cast<std::size_t>(std::count_if(issues.begin(), issues.end(), [type](const LoadIssue& issue) {
        return issue.error_type == type;
    }));
}

MapData::MapData()
    : MapData(Options{}) {}

MapData::MapData(Options options)
    : options_(options)
    , region_index_(RegionIndex::Options{options.rtree_threshold})
    , city_index_(options.city_policy) {}

bool MapData::load(MapSource source, LoadReport& report, const LogCallback& log) {
    unload();
    report = LoadReport{};

    auto add_issue = [&](LoadIssue::ErrorType type, const std::string& subject, const std::string& detail) {
        report.issues.push_back(LoadIssue{type, subject, detail});
        if (log) {
            log(std::string("Warning: ") + to_string(type) + " '" + subject + "': " + detail, true);
        }
    };

    std::mt19937 color_rng(options_.color_seed);
    regions_.reserve(source.regions.size());

    for (auto& record : source.regions) {
        // One draw per source record, rejected or not, so a colour depends only on its record's position
        const Rgb color = random_region_color(color_rng);
        if (region_lookup_.count(record.name) != 0) {
            add_issue(LoadIssue::ErrorType::DuplicateRegion, record.name, "name already loaded");
            continue;
        }

        BoundedRegion region(std::move(record.name), std::move(record.rings), color, record.population);

        if (region.dropped_ring_count() > 0) {
            add_issue(LoadIssue::ErrorType::MalformedGeometry, region.name(),
                      std::to_string(region.dropped_ring_count()) + " ring(s) with fewer than 3 points or non-finite coordinates");
        }
        if (region.empty()) {
            add_issue(LoadIssue::ErrorType::EmptyRegion, region.name(), "no usable rings");
            continue;
        }

        region_lookup_.emplace(region.name(), regions_.size());
        bounds_.expand(region.bounds());
        regions_.push_back(std::move(region));
    }

    cities_.reserve(source.cities.size());
    for (auto& city : source.cities) {
        if (!city.position.is_finite() || city.population < 0) {
            add_issue(LoadIssue::ErrorType::InvalidCity, city.name, "non-finite position or negative population");
            continue;
        }
        if (region_lookup_.count(city.owner) == 0) {
            add_issue(LoadIssue::ErrorType::UnresolvedOwner, city.name, "unknown region '" + city.owner + "'");
        }
        cities_.push_back(std::move(city));
    }

    region_index_.build(regions_);
    // Unresolved owners were already reported above
    city_index_.build(cities_, regions_);

    report.regions_loaded = regions_.size();
    report.cities_loaded = cities_.size();
    success_ = !regions_.empty();
    ++generation_;

    if (log) {
        log("Loaded " + std::to_string(regions_.size()) + " regions, " +
            std::to_string(cities_.size()) + " cities", false);
        if (!success_) {
            log("Error: no usable regions in map data", true);
        }
    }
    return success_;
}

void MapData::unload() {
    selection_.reset();
    regions_.clear();
    cities_.clear();
    region_lookup_.clear();
    region_index_.clear();
    city_index_.clear();
    bounds_ = Bounds::empty();
    success_ = false;
    ++generation_;
}

std::optional<std::size_t> MapData::find_region(const std::string& name) const {
    const auto it = region_lookup_.find(name);
    if (it == region_lookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::size_t> MapData::region_at(double lon, double lat) const {
    return region_index_.query_point(regions_, lon, lat);
}

std::vector<std::size_t> MapData::regions_in_bounds(const Bounds& query) const {
    return region_index_.query_rect(regions_, query);
}

std::vector<std::size_t> MapData::visible_cities(const Bounds& viewport, double zoom) const {
    return city_index_.visible_cities(viewport, zoom);
}

std::optional<std::size_t> MapData::select_at(double lon, double lat) {
    const auto hit = region_at(lon, lat);
    selection_.select(regions_, hit);
    return hit;
}

void MapData::select_region(std::optional<std::size_t> idx) {
    selection_.select(regions_, idx);
}

void MapData::clear_selection() {
    selection_.clear(regions_);
}

} // namespace geoatlas::core
