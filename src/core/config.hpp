#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "cities/city_index.hpp"
#include "coordinates/coordinate_transform.hpp"
#include "core/log.hpp"
#include "lod/level_of_detail.hpp"
#include "types.hpp"

namespace geoatlas::core {

struct ViewerConfig {
    std::string countries_path = "resources/data/countries.geojson";
    std::string cities_path = "resources/data/cities.geojson";

    int window_width = 1200;
    int window_height = 800;

    double initial_zoom = 1.0;
    double min_zoom = zoom_limits::kMinZoom;
    double max_zoom = zoom_limits::kMaxZoom;
    double zoom_step = 1.1;     // per wheel notch or key press
    double pan_step = 20.0;     // pixels per key press

    Rgb water_color{65, 95, 115};

    double cull_margin = 0.1;   // fraction of the view width
    lod::Strategy lod_strategy = lod::Strategy::Tolerance;
    std::size_t lod_cache_capacity = 512;
    std::size_t rtree_threshold = 256;
    cities::VisibilityPolicy city_policy = cities::VisibilityPolicy::Threshold;
    std::uint32_t color_seed = 5489u;
};

/*
 * Overlays GEOATLAS_* environment variables on base:
 *   GEOATLAS_COUNTRIES, GEOATLAS_CITIES        data paths
 *   GEOATLAS_MIN_ZOOM, GEOATLAS_MAX_ZOOM       zoom range (rejected if min > max)
 *   GEOATLAS_LOD_STRATEGY                      stride | tolerance
 *   GEOATLAS_CITY_POLICY                       threshold | quota
 *   GEOATLAS_LOD_CACHE                         entry count
 *   GEOATLAS_COLOR_SEED                        region colour seed
 * Values that do not parse are logged and ignored.
 */
[[nodiscard]] ViewerConfig config_from_environment(ViewerConfig base, const LogCallback& log = default_log_callback());

// Finds a relative data file next to the executable or the working directory.
[[nodiscard]] std::optional<std::filesystem::path> resolve_data_path(const std::string& path);

} // namespace geoatlas::core
