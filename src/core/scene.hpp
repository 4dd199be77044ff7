#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "coordinates/coordinate_transform.hpp"
#include "lod/level_of_detail.hpp"
#include "map_data.hpp"
#include "types.hpp"
#include "viewport/viewport_culler.hpp"

namespace geoatlas::core {

// Screen coordinates are whole pixels.
struct OutlineDraw {
    std::vector<Point2D> points;
    bool closed = true;
};

struct RegionDraw {
    std::size_t region = 0;
    Rgb color;
    std::vector<std::vector<Point2D>> rings;  // filled, implicitly closed
    std::vector<OutlineDraw> outlines;        // stroked; clipped runs stay open
};

struct CityDraw {
    std::size_t city = 0;
    Point2D position;
    std::string label;
};

// Everything the renderer needs for one frame.
struct Frame {
    Bounds viewport = Bounds::empty();
    double zoom = 1.0;
    std::vector<RegionDraw> regions;
    std::vector<CityDraw> cities;
    std::optional<std::string> selected_name;
};

/*
 * Turns the loaded map and the current transform into draw instructions:
 * region cull, LOD reduction, point cull, projection to screen, then city
 * visibility. Caches survive between frames and are dropped when the map
 * is reloaded.
 */
class SceneBuilder {
public:
    struct Options {
        viewport::ViewportCuller::Options culling{};
        lod::Strategy lod_strategy = lod::Strategy::Tolerance;
        std::size_t lod_cache_capacity = 512;
    };

    SceneBuilder();
    explicit SceneBuilder(Options options);

    [[nodiscard]] Frame build(const MapData& map, const CoordinateTransform& transform,
                              double screen_width, double screen_height);

    void reset();

    [[nodiscard]] const lod::LevelOfDetailSelector& lod() const { return lod_; }
    [[nodiscard]] const viewport::ViewportCuller& culler() const { return culler_; }

private:
    void sync_with(const MapData& map);

    lod::LevelOfDetailSelector lod_;
    viewport::ViewportCuller culler_;
    std::optional<std::uint64_t> map_generation_;
};

} // namespace geoatlas::core
