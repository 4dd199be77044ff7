#include "geojson_loader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace geoatlas::io {

namespace geojson_tests {

const core::LogCallback kQuiet = [](const std::string&, bool) {};

const char* const kCountries = R"({
  "type": "FeatureCollection",
  "features": [
    {
      "type": "Feature",
      "properties": {"ADMIN": "Squareland", "POP_EST": 1500000.0},
      "geometry": {"type": "Polygon", "coordinates": [
        [[0, 0], [10, 0], [10, 10], [0, 10], [0, 0]],
        [[2, 2], [3, 2], [3, 3], [2, 2]]
      ]}
    },
    {
      "type": "Feature",
      "properties": {"NAME": "Archipelago"},
      "geometry": {"type": "MultiPolygon", "coordinates": [
        [[[20, 0], [22, 0], [22, 2], [20, 0]]],
        [[[30, 0], [32, 0], [32, 2], [30, 0]]]
      ]}
    },
    {
      "type": "Feature",
      "properties": {},
      "geometry": {"type": "Polygon", "coordinates": [[[40, 0], [41, 0], [41, 1]]]}
    },
    {
      "type": "Feature",
      "properties": {"ADMIN": "Line"},
      "geometry": {"type": "LineString", "coordinates": [[0, 0], [1, 1]]}
    },
    {
      "type": "Feature",
      "properties": {"ADMIN": "Nowhere"},
      "geometry": null
    }
  ]
})";

const char* const kCities = R"({
  "type": "FeatureCollection",
  "features": [
    {
      "type": "Feature",
      "properties": {"NAME": "Capital", "POP_MAX": 2500000, "ADM0NAME": "Squareland"},
      "geometry": {"type": "Point", "coordinates": [5.5, 4.5]}
    },
    {
      "type": "Feature",
      "properties": {"name": "Port", "population": 1200, "country": "Archipelago"},
      "geometry": {"type": "Point", "coordinates": [21, 1]}
    },
    {
      "type": "Feature",
      "properties": {"POP_MAX": 10},
      "geometry": {"type": "Point", "coordinates": ["bad", 1]}
    },
    {
      "type": "Feature",
      "properties": {"NAME": "Area"},
      "geometry": {"type": "Polygon", "coordinates": [[[0, 0], [1, 0], [1, 1]]]}
    }
  ]
})";

bool test_parse_countries() {
    std::vector<core::RegionRecord> regions;
    if (!parse_countries_text(kCountries, regions, kQuiet)) {
        std::cerr << "Country document should parse" << std::endl;
        return false;
    }
    if (regions.size() != 3) {
        std::cerr << "Expected 3 polygon features, got " << regions.size() << std::endl;
        return false;
    }

    const auto& square = regions[0];
    // Exterior ring only; the hole is ignored
    if (square.name != "Squareland" || square.population != 1'500'000 || square.rings.size() != 1 ||
        square.rings[0].size() != 5) {
        std::cerr << "Polygon feature parsed incorrectly" << std::endl;
        return false;
    }

    const auto& islands = regions[1];
    if (islands.name != "Archipelago" || islands.rings.size() != 2 || islands.population != 0) {
        std::cerr << "MultiPolygon feature parsed incorrectly" << std::endl;
        return false;
    }
    return regions[2].name == "Region_2" && regions[2].rings.size() == 1;
}

bool test_parse_cities() {
    std::vector<core::City> cities;
    if (!parse_cities_text(kCities, cities, kQuiet)) {
        return false;
    }
    if (cities.size() != 3) {
        std::cerr << "Expected 3 point features, got " << cities.size() << std::endl;
        return false;
    }

    const auto& capital = cities[0];
    if (capital.name != "Capital" || capital.population != 2'500'000 || capital.owner != "Squareland" ||
        capital.position.lon != 5.5 || capital.position.lat != 4.5) {
        std::cerr << "Capital parsed incorrectly" << std::endl;
        return false;
    }
    if (cities[1].name != "Port" || cities[1].owner != "Archipelago" || cities[1].population != 1200) {
        return false;
    }
    // Bad coordinates are kept as non-finite so that validation can report them
    return cities[2].name == "City_2" && !cities[2].position.is_finite() && cities[2].owner.empty();
}

bool test_oversized_population() {
    const char* const document = R"({
      "type": "FeatureCollection",
      "features": [
        {
          "type": "Feature",
          "properties": {"NAME": "Megalopolis", "POP_MAX": 1e30, "ADM0NAME": "Squareland"},
          "geometry": {"type": "Point", "coordinates": [5, 5]}
        },
        {
          "type": "Feature",
          "properties": {"NAME": "Antipolis", "POP_MAX": -1e30, "ADM0NAME": "Squareland"},
          "geometry": {"type": "Point", "coordinates": [6, 6]}
        }
      ]
    })";

    std::vector<core::City> cities;
    if (!parse_cities_text(document, cities, kQuiet) || cities.size() != 2) {
        return false;
    }
    // Out-of-range counts saturate instead of wrapping
    if (cities[0].population < 9'000'000'000'000'000'000 || cities[1].population > -9'000'000'000'000'000'000) {
        std::cerr << "Oversized populations parsed as " << cities[0].population << " and "
                  << cities[1].population << std::endl;
        return false;
    }

    core::MapSource source;
    source.cities = std::move(cities);
    if (!parse_countries_text(kCountries, source.regions, kQuiet)) {
        return false;
    }
    core::MapData map;
    core::LoadReport report;
    return map.load(std::move(source), report, kQuiet) && map.city_count() == 1 &&
           map.city(0).name == "Megalopolis" && report.count(core::LoadIssue::ErrorType::InvalidCity) == 1;
}

bool test_malformed_documents() {
    std::vector<core::RegionRecord> regions;
    std::vector<std::string> errors;
    const core::LogCallback log = [&errors](const std::string& message, bool is_error) {
        if (is_error) {
            errors.push_back(message);
        }
    };

    const bool truncated = parse_countries_text(R"({"type": "FeatureCollection", "features": [)", regions, log);
    const bool no_features = parse_countries_text(R"({"type": "FeatureCollection"})", regions, log);
    const bool not_object = parse_countries_text("[1, 2, 3]", regions, log);

    return !truncated && !no_features && !not_object && regions.empty() && errors.size() == 3;
}

bool test_missing_file() {
    std::vector<core::RegionRecord> regions;
    return !load_countries("/nonexistent/geoatlas/countries.geojson", regions, kQuiet) && regions.empty();
}

bool test_load_map_source() {
    const auto dir = std::filesystem::temp_directory_path() / "geoatlas_geojson_test";
    std::filesystem::create_directories(dir);
    const auto countries_path = dir / "countries.geojson";
    const auto cities_path = dir / "cities.geojson";
    {
        std::ofstream out(countries_path);
        out << kCountries;
    }
    {
        std::ofstream out(cities_path);
        out << kCities;
    }

    core::MapSource with_cities;
    core::MapSource missing_cities;
    core::MapSource no_cities;
    core::MapSource no_countries;
    const bool a = load_map_source(countries_path.string(), cities_path.string(), with_cities, kQuiet);
    const bool b = load_map_source(countries_path.string(), (dir / "missing.geojson").string(), missing_cities, kQuiet);
    const bool c = load_map_source(countries_path.string(), "", no_cities, kQuiet);
    const bool d = load_map_source((dir / "missing.geojson").string(), cities_path.string(), no_countries, kQuiet);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    if (!a || with_cities.regions.size() != 3 || with_cities.cities.size() != 3) {
        std::cerr << "Full load returned wrong contents" << std::endl;
        return false;
    }
    // A missing cities file is only a warning
    return b && missing_cities.regions.size() == 3 && missing_cities.cities.empty() &&
           c && no_cities.cities.empty() && !d;
}

bool test_loaded_source_validates() {
    core::MapSource source;
    if (!parse_countries_text(kCountries, source.regions, kQuiet) ||
        !parse_cities_text(kCities, source.cities, kQuiet)) {
        return false;
    }

    core::MapData map;
    core::LoadReport report;
    if (!map.load(std::move(source), report, kQuiet)) {
        return false;
    }

    // Region_2 has a 3-point exterior and survives; the bad city is rejected
    return map.region_count() == 3 && map.city_count() == 2 &&
           report.count(core::LoadIssue::ErrorType::InvalidCity) == 1 &&
           map.region_at(5, 5) == map.find_region("Squareland") &&
           map.region_at(31, 0.5) == map.find_region("Archipelago");
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"parse_countries", &test_parse_countries},
        {"parse_cities", &test_parse_cities},
        {"oversized_population", &test_oversized_population},
        {"malformed_documents", &test_malformed_documents},
        {"missing_file", &test_missing_file},
        {"load_map_source", &test_load_map_source},
        {"loaded_source_validates", &test_loaded_source_validates},
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

} // namespace geojson_tests

} // namespace geoatlas::io

int main() {
    if (geoatlas::io::geojson_tests::run_all_tests()) {
        std::cout << "All GeoJSON loader tests passed" << std::endl;
        return 0;
    }

    std::cerr << "GeoJSON loader tests failed" << std::endl;
    return 1;
}
