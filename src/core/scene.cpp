#include "scene.hpp"

#include <utility>
#include <vector>

namespace geoatlas::core {

namespace {

Point2D to_point(const PixelPoint& pixel) {
    return Point2D{static_cast<double>(pixel.x), static_cast<double>(pixel.y)};
}

std::vector<Point2D> to_screen(const CoordinateTransform& transform, const Ring& ring) {
    std::vector<Point2D> screen;
    screen.reserve(ring.size());
    for (const auto& point : ring) {
        screen.push_back(to_point(transform.geo_to_pixel(point)));
    }
    return screen;
}

} // namespace

SceneBuilder::SceneBuilder()
    : SceneBuilder(Options{}) {}

SceneBuilder::SceneBuilder(Options options)
    : lod_(options.lod_strategy, options.lod_cache_capacity)
    , culler_(options.culling) {}

Frame SceneBuilder::build(const MapData& map, const CoordinateTransform& transform,
                          double screen_width, double screen_height) {
    sync_with(map);

    Frame frame;
    frame.zoom = transform.zoom();
    frame.viewport = transform.visible_bounds(screen_width, screen_height);
    frame.selected_name = map.selected_name();

    if (viewport::ViewportCuller::is_degenerate(frame.viewport)) {
        return frame;
    }

    const Bounds expanded = culler_.expand(frame.viewport);
    const auto& regions = map.regions();

    for (const std::size_t idx : culler_.cull(map.region_index(), regions, frame.viewport, frame.zoom)) {
        const BoundedRegion& region = regions[idx];
        const lod::SharedRingSet reduced = lod_.rings_for(region, idx, frame.zoom);

        RegionDraw draw;
        draw.region = idx;
        draw.color = region.color();
        const auto clipped = culler_.clip_rings(*reduced, expanded);
        for (const auto& ring : clipped.fill) {
            draw.rings.push_back(to_screen(transform, ring));
        }
        for (const auto& run : clipped.outline) {
            draw.outlines.push_back(OutlineDraw{to_screen(transform, run.points), run.closed});
        }
        if (!draw.rings.empty()) {
            frame.regions.push_back(std::move(draw));
        }
    }

    for (const std::size_t idx : map.visible_cities(frame.viewport, frame.zoom)) {
        const City& city = map.city(idx);
        frame.cities.push_back(CityDraw{idx, to_point(transform.geo_to_pixel(city.position)), city.name});
    }

    return frame;
}

void SceneBuilder::reset() {
    lod_.clear_cache();
    culler_.invalidate();
    map_generation_.reset();
}

void SceneBuilder::sync_with(const MapData& map) {
    if (!map_generation_ || *map_generation_ != map.generation()) {
        lod_.clear_cache();
        culler_.invalidate();
        map_generation_ = map.generation();
    }
}

} // namespace geoatlas::core
