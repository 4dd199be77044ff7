#include "map_data.hpp"
#include "scene.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geoatlas::core {

namespace integration_tests {

const LogCallback kQuiet = [](const std::string&, bool) {};

Ring square(double min_x, double min_y, double max_x, double max_y) {
    return Ring{{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}};
}

City make_city(const std::string& name, double lon, double lat, std::int64_t population, const std::string& owner) {
    City city;
    city.name = name;
    city.position = GeoPoint(lon, lat);
    city.population = population;
    city.owner = owner;
    return city;
}

MapSource two_country_source() {
    MapSource source;
    source.regions.push_back(RegionRecord{"Testland", {square(-10, -10, 10, 10)}, 12'000'000});
    source.regions.push_back(RegionRecord{"Other", {square(20, 20, 30, 30)}, 500'000});
    source.cities.push_back(make_city("Testville", 1, 1, 6'000'000, "Testland"));
    source.cities.push_back(make_city("Otherburg", 25, 25, 300'000, "Other"));
    return source;
}

bool test_end_to_end_scenario() {
    MapData map;
    LoadReport report;
    if (!map.load(two_country_source(), report, kQuiet)) {
        std::cerr << "Two-country map failed to load" << std::endl;
        return false;
    }

    CoordinateTransform transform(1200, 800);
    const Bounds full = transform.visible_bounds();
    if (full.min_lon != -180.0 || full.max_lat != 90.0) {
        return false;
    }

    const auto testland = map.region_at(0, 0);
    const auto other = map.region_at(25, 25);
    if (!testland || map.region(*testland).name() != "Testland" || !other || map.region(*other).name() != "Other") {
        std::cerr << "Point queries did not find the expected regions" << std::endl;
        return false;
    }
    if (map.region_at(100, 100)) {
        std::cerr << "Point in open water should hit nothing" << std::endl;
        return false;
    }

    viewport::ViewportCuller culler;
    const auto visible = culler.cull(map.region_index(), map.regions(), Bounds{15, 35, 15, 35}, 1.0);
    return visible == std::vector<std::size_t>{*other};
}

bool test_load_report() {
    MapSource source = two_country_source();
    source.regions.push_back(RegionRecord{"Testland", {square(50, 50, 60, 60)}, 0});
    source.regions.push_back(RegionRecord{"Sliver", {Ring{{0, 0}, {1, 1}}}, 0});
    source.regions.push_back(RegionRecord{"Partial", {square(70, 0, 80, 10), Ring{{0, 0}}}, 0});
    source.cities.push_back(make_city("Lost", 5, 5, 100, "Atlantis"));
    source.cities.push_back(make_city("Negative", 5, 5, -1, "Testland"));

    MapData map;
    LoadReport report;
    if (!map.load(std::move(source), report, kQuiet)) {
        return false;
    }

    using Type = LoadIssue::ErrorType;
    if (report.count(Type::DuplicateRegion) != 1 || report.count(Type::EmptyRegion) != 1 ||
        report.count(Type::MalformedGeometry) != 2 || report.count(Type::UnresolvedOwner) != 1 ||
        report.count(Type::InvalidCity) != 1) {
        std::cerr << "Unexpected load issue counts" << std::endl;
        return false;
    }

    // The duplicate keeps the first geometry; the unresolved city is kept
    return report.regions_loaded == 3 && report.cities_loaded == 3 && map.region_at(55, 55) == std::nullopt &&
           map.find_region("Partial").has_value() && map.city_index().unresolved().size() == 1;
}

bool test_empty_load_fails() {
    MapSource source;
    source.regions.push_back(RegionRecord{"Dust", {Ring{{0, 0}}}, 0});

    MapData map;
    LoadReport report;
    const bool loaded = map.load(std::move(source), report, kQuiet);
    return !loaded && !map.load_success() && map.region_count() == 0 && !map.region_at(0, 0) &&
           map.bounds().max_lon < map.bounds().min_lon;
}

bool test_colors_reproducible() {
    MapData first;
    MapData second;
    MapData reseeded(MapData::Options{256, cities::VisibilityPolicy::Threshold, 99u});
    LoadReport report;
    first.load(two_country_source(), report, kQuiet);
    second.load(two_country_source(), report, kQuiet);
    reseeded.load(two_country_source(), report, kQuiet);

    return first.region(0).base_color() == second.region(0).base_color() &&
           first.region(1).base_color() == second.region(1).base_color() &&
           !(first.region(0).base_color() == reseeded.region(0).base_color() &&
             first.region(1).base_color() == reseeded.region(1).base_color());
}

bool test_selection_flow() {
    MapData map;
    LoadReport report;
    map.load(two_country_source(), report, kQuiet);

    const auto hit = map.select_at(0, 0);
    if (!hit || map.selected_name() != std::optional<std::string>("Testland") || !map.region(*hit).selected()) {
        return false;
    }

    map.select_at(25, 25);
    if (map.region(0).selected() || !map.region(1).selected()) {
        std::cerr << "Selecting Other should deselect Testland" << std::endl;
        return false;
    }

    // Clicking water clears the selection
    map.select_at(100, 100);
    if (map.selected_region() || map.region(1).selected()) {
        return false;
    }

    map.select_region(0);
    map.clear_selection();
    return !map.selected_name() && !map.region(0).selected();
}

bool test_scene_frame() {
    MapData map;
    LoadReport report;
    map.load(two_country_source(), report, kQuiet);
    map.select_at(0, 0);

    SceneBuilder scene;
    CoordinateTransform transform(1200, 800);
    const Frame frame = scene.build(map, transform, 1200, 800);

    if (frame.regions.size() != 2 || frame.selected_name != std::optional<std::string>("Testland")) {
        std::cerr << "World frame should draw both regions" << std::endl;
        return false;
    }

    const RegionDraw& testland = frame.regions[0];
    if (!(testland.color == map.region(0).get_color(true)) || testland.rings.size() != 1 ||
        testland.rings[0].size() != 4) {
        return false;
    }
    // (-10, 10) projects to x = 170 / 360 * 1200 = 566.67, y = 80 / 180 * 800 = 355.56, truncated for drawing
    const Point2D corner = testland.rings[0][3];
    if (corner.x != 566.0 || corner.y != 355.0) {
        std::cerr << "Region corner projected to (" << corner.x << ", " << corner.y << ")" << std::endl;
        return false;
    }
    if (testland.outlines.size() != 1 || !testland.outlines[0].closed || testland.outlines[0].points.size() != 4) {
        std::cerr << "Short rings should be outlined whole" << std::endl;
        return false;
    }

    // A world-wide view only labels cities above 5M
    return frame.cities.size() == 1 && frame.cities[0].label == "Testville" &&
           frame.cities[0].position.x == 603.0 && frame.cities[0].position.y == 395.0;
}

bool covered(const RegionDraw& draw, double x, double y) {
    bool inside = false;
    for (const auto& ring : draw.rings) {
        for (std::size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
            if ((ring[i].y > y) != (ring[j].y > y) &&
                x < ring[i].x + (ring[j].x - ring[i].x) * (y - ring[i].y) / (ring[j].y - ring[i].y)) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool test_large_region_filled_when_zoomed() {
    // 1000-vertex square, long enough for point-level culling
    Ring coast;
    for (int i = 0; i < 250; ++i) {
        coast.emplace_back(-50.0 + 0.4 * i, -50.0);
    }
    for (int i = 0; i < 250; ++i) {
        coast.emplace_back(50.0, -50.0 + 0.4 * i);
    }
    for (int i = 0; i < 250; ++i) {
        coast.emplace_back(50.0 - 0.4 * i, 50.0);
    }
    for (int i = 0; i < 250; ++i) {
        coast.emplace_back(-50.0, 50.0 - 0.4 * i);
    }

    MapSource source;
    source.regions.push_back(RegionRecord{"Bigland", {coast}, 0});
    MapData map;
    LoadReport report;
    if (!map.load(std::move(source), report, kQuiet)) {
        return false;
    }

    SceneBuilder scene;
    CoordinateTransform transform(1200, 800);
    transform.set_zoom(20.0);
    // Centre on the west coast: the view spans lon -54..-36, lat -4.5..4.5
    const Point2D target = transform.geo_to_screen(-45, 0);
    transform.pan(600.0 - target.x, 400.0 - target.y);

    const Frame frame = scene.build(map, transform, 1200, 800);
    if (frame.regions.size() != 1 || map.region_at(-45, 0) != std::optional<std::size_t>(0)) {
        return false;
    }

    const RegionDraw& draw = frame.regions[0];
    const Point2D land = transform.geo_to_screen(-45, 0);
    const Point2D shore = transform.geo_to_screen(-49.5, 3.0);
    const Point2D sea = transform.geo_to_screen(-52, 0);
    if (!covered(draw, land.x + 0.5, land.y + 0.5) || !covered(draw, shore.x + 0.5, shore.y + 0.5)) {
        std::cerr << "Land inside the view is not covered by the filled rings" << std::endl;
        return false;
    }
    if (covered(draw, sea.x + 0.5, sea.y + 0.5)) {
        std::cerr << "Water west of the coast is filled" << std::endl;
        return false;
    }

    // The coast is stroked as an open run, never closed across the land
    if (draw.outlines.empty()) {
        return false;
    }
    for (const auto& outline : draw.outlines) {
        if (outline.closed || outline.points.size() >= coast.size()) {
            std::cerr << "Clipped coast outline should be an open run" << std::endl;
            return false;
        }
    }
    return true;
}

bool test_colors_survive_rejected_records() {
    MapSource with_duplicate = two_country_source();
    with_duplicate.regions.push_back(RegionRecord{"Other", {square(40, 40, 45, 45)}, 0});
    with_duplicate.regions.push_back(RegionRecord{"Third", {square(50, 50, 55, 55)}, 0});

    MapSource with_empty = two_country_source();
    with_empty.regions.push_back(RegionRecord{"Dust", {Ring{{0, 0}}}, 0});
    with_empty.regions.push_back(RegionRecord{"Third", {square(50, 50, 55, 55)}, 0});

    MapData first;
    MapData second;
    LoadReport report;
    first.load(std::move(with_duplicate), report, kQuiet);
    second.load(std::move(with_empty), report, kQuiet);

    const auto third_first = first.find_region("Third");
    const auto third_second = second.find_region("Third");
    if (!third_first || !third_second) {
        return false;
    }
    // Both rejected records consumed one colour, so Third gets the same one
    return first.region(*third_first).base_color() == second.region(*third_second).base_color() &&
           first.region(0).base_color() == second.region(0).base_color();
}

bool test_scene_follows_view() {
    MapData map;
    LoadReport report;
    map.load(two_country_source(), report, kQuiet);

    SceneBuilder scene;
    CoordinateTransform transform(1200, 800);
    transform.set_zoom(12.0);
    // Centre the view on (25, 25)
    const Point2D target = transform.geo_to_screen(25, 25);
    transform.pan(600.0 - target.x, 400.0 - target.y);

    const Frame frame = scene.build(map, transform, 1200, 800);
    if (frame.regions.size() != 1 || frame.regions[0].region != 1) {
        std::cerr << "Zoomed view on Other should cull Testland" << std::endl;
        return false;
    }
    // 30 degrees wide: the 1M floor hides Otherburg
    return frame.cities.empty() && frame.viewport.width() > 29.0 && frame.viewport.width() < 31.0;
}

bool test_scene_reload() {
    auto map = std::make_unique<MapData>();
    LoadReport report;
    map->load(two_country_source(), report, kQuiet);

    SceneBuilder scene;
    CoordinateTransform transform(1200, 800);
    transform.set_zoom(1.5);
    const Frame before = scene.build(*map, transform, 1200, 800);
    if (before.regions.size() != 2) {
        return false;
    }

    // Same view after a reload with one region: stale caches must not leak through
    MapSource smaller;
    smaller.regions.push_back(RegionRecord{"Solo", {square(-10, -10, 10, 10)}, 0});
    map->load(std::move(smaller), report, kQuiet);

    const Frame after = scene.build(*map, transform, 1200, 800);
    return after.regions.size() == 1 && after.regions[0].region == 0 && after.cities.empty();
}

bool test_degenerate_screen() {
    MapData map;
    LoadReport report;
    map.load(two_country_source(), report, kQuiet);

    SceneBuilder scene;
    CoordinateTransform transform(1200, 800);
    const Frame frame = scene.build(map, transform, 0, 0);
    return frame.regions.empty() && frame.cities.empty();
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"end_to_end_scenario", &test_end_to_end_scenario},
        {"load_report", &test_load_report},
        {"empty_load_fails", &test_empty_load_fails},
        {"colors_reproducible", &test_colors_reproducible},
        {"selection_flow", &test_selection_flow},
        {"scene_frame", &test_scene_frame},
        {"scene_follows_view", &test_scene_follows_view},
        {"large_region_filled_when_zoomed", &test_large_region_filled_when_zoomed},
        {"colors_survive_rejected_records", &test_colors_survive_rejected_records},
        {"scene_reload", &test_scene_reload},
        {"degenerate_screen", &test_degenerate_screen},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace integration_tests

} // namespace geoatlas::core

int main() {
    std::cout << "Testing map data and scene integration..." << std::endl;

    if (geoatlas::core::integration_tests::run_all_tests()) {
        std::cout << "All integration tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Integration tests failed" << std::endl;
    return 1;
}
