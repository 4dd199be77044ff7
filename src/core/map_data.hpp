#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cities/city_index.hpp"
#include "log.hpp"
#include "region.hpp"
#include "selection.hpp"
#include "spatial_hash/region_index.hpp"
#include "types.hpp"

namespace geoatlas::core {

// One region as handed over by a loader, before validation.
struct RegionRecord {
    std::string name;
    std::vector<Ring> rings;
    std::int64_t population = 0;
};

struct MapSource {
    std::vector<RegionRecord> regions;
    std::vector<City> cities;
};

struct LoadIssue {
    enum class ErrorType {
        MalformedGeometry,  // ring skipped
        EmptyRegion,        // no usable ring, region skipped
        DuplicateRegion,    // later region with a taken name skipped
        UnresolvedOwner,    // city kept, no owning region
        InvalidCity         // city skipped
    };

    ErrorType error_type;
    std::string subject;
    std::string detail;
};

[[nodiscard]] const char* to_string(LoadIssue::ErrorType type);

struct LoadReport {
    std::size_t regions_loaded = 0;
    std::size_t cities_loaded = 0;
    std::vector<LoadIssue> issues;

    [[nodiscard]] std::size_t count(LoadIssue::ErrorType type) const;
};

/*
 * Owns the loaded regions and cities together with their indexes and the
 * selection. Everything is rebuilt by load(); between loads only the
 * selection changes.
 */
class MapData {
public:
    struct Options {
        std::size_t rtree_threshold = 256;
        cities::VisibilityPolicy city_policy = cities::VisibilityPolicy::Threshold;
        std::uint32_t color_seed = 5489u;
    };

    MapData();
    explicit MapData(Options options);

    // Returns false when no region survived validation. Never throws.
    bool load(MapSource source, LoadReport& report, const LogCallback& log = default_log_callback());
    void unload();

    [[nodiscard]] bool load_success() const { return success_; }
    [[nodiscard]] const Options& options() const { return options_; }
    // Bumped by every load() and unload(); caches keyed on region indices compare it.
    [[nodiscard]] std::uint64_t generation() const { return generation_; }

    // Union of all region boxes; empty() when nothing is loaded.
    [[nodiscard]] Bounds bounds() const { return bounds_; }

    [[nodiscard]] std::size_t region_count() const { return regions_.size(); }
    [[nodiscard]] std::size_t city_count() const { return cities_.size(); }

    [[nodiscard]] const BoundedRegion& region(std::size_t idx) const { return regions_.at(idx); }
    [[nodiscard]] const City& city(std::size_t idx) const { return cities_.at(idx); }
    [[nodiscard]] const std::vector<BoundedRegion>& regions() const { return regions_; }
    [[nodiscard]] const std::vector<City>& cities() const { return cities_; }

    [[nodiscard]] const RegionIndex& region_index() const { return region_index_; }
    [[nodiscard]] const cities::CityIndex& city_index() const { return city_index_; }

    [[nodiscard]] std::optional<std::size_t> find_region(const std::string& name) const;
    [[nodiscard]] std::optional<std::size_t> region_at(double lon, double lat) const;
    [[nodiscard]] std::vector<std::size_t> regions_in_bounds(const Bounds& query) const;
    [[nodiscard]] std::vector<std::size_t> visible_cities(const Bounds& viewport, double zoom) const;

    // Selects the region under the point, or clears the selection if there is none.
    std::optional<std::size_t> select_at(double lon, double lat);
    void select_region(std::optional<std::size_t> idx);
    void clear_selection();

    [[nodiscard]] std::optional<std::size_t> selected_region() const { return selection_.selected(); }
    [[nodiscard]] std::optional<std::string> selected_name() const { return selection_.selected_name(regions_); }

private:
    Options options_;
    bool success_ = false;
    std::uint64_t generation_ = 0;
    Bounds bounds_ = Bounds::empty();

    std::vector<BoundedRegion> regions_;
    std::vector<City> cities_;
    std::unordered_map<std::string, std::size_t> region_lookup_;

    RegionIndex region_index_;
    cities::CityIndex city_index_;
    RegionSelection selection_;
};

} // namespace geoatlas::core
