#include "geojson_loader.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <utility>

using json = nlohmann::json;

namespace geoatlas::io {

namespace {

constexpr std::array<const char*, 4> kRegionNameFields = {"ADMIN", "NAME_EN", "NAME", "name"};
constexpr std::array<const char*, 2> kRegionPopulationFields = {"POP_EST", "population"};
constexpr std::array<const char*, 2> kCityNameFields = {"NAME", "name"};
constexpr std::array<const char*, 2> kCityPopulationFields = {"POP_MAX", "population"};
constexpr std::array<const char*, 3> kCityOwnerFields = {"ADM0NAME", "ADMIN", "country"};

// Counts saturate here, just inside the range of std::int64_t.
constexpr double kCountLimit = 9.2e18;

void report(const core::LogCallback& log, const std::string& message, bool is_error) {
    if (log) {
        log(message, is_error);
    }
}

template <std::size_t N>
std::optional<std::string> first_string(const json& props, const std::array<const char*, N>& fields) {
    if (!props.is_object()) {
        return std::nullopt;
    }
    for (const char* field : fields) {
        const auto it = props.find(field);
        if (it != props.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

template <std::size_t N>
std::optional<std::int64_t> first_count(const json& props, const std::array<const char*, N>& fields) {
    if (!props.is_object()) {
        return std::nullopt;
    }
    for (const char* field : fields) {
        const auto it = props.find(field);
        if (it == props.end() || !it->is_number()) {
            continue;
        }
        const double value = it->get<double>();
        if (std::isfinite(value)) {
            return static_cast<std::int64_t>(std::llround(std::clamp(value, -kCountLimit, kCountLimit)));
        }
    }
    return std::nullopt;
}

core::GeoPoint parse_position(const json& position) {
    constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
    if (!position.is_array() || position.size() < 2 || !position[0].is_number() || !position[1].is_number()) {
        return core::GeoPoint(kNaN, kNaN);
    }
    return core::GeoPoint(position[0].get<double>(), position[1].get<double>());
}

// Exterior ring of one GeoJSON polygon ([[lon, lat], ...] per ring).
core::Ring exterior_ring(const json& polygon) {
    core::Ring ring;
    if (!polygon.is_array() || polygon.empty() || !polygon[0].is_array()) {
        return ring;
    }
    const json& exterior = polygon[0];
    ring.reserve(exterior.size());
    for (const auto& position : exterior) {
        ring.push_back(parse_position(position));
    }
    return ring;
}

const json* feature_array(const json& document, const core::LogCallback& log) {
    if (!document.is_object()) {
        report(log, "Error: GeoJSON document is not an object", true);
        return nullptr;
    }
    const auto features = document.find("features");
    if (features == document.end() || !features->is_array()) {
        report(log, "Error: GeoJSON document has no features array", true);
        return nullptr;
    }
    return &*features;
}

const json& properties_of(const json& feature) {
    static const json kEmpty = json::object();
    const auto it = feature.find("properties");
    if (it == feature.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

const json* geometry_of(const json& feature) {
    const auto it = feature.find("geometry");
    if (it == feature.end() || !it->is_object()) {
        return nullptr;
    }
    return &*it;
}

std::string geometry_type(const json& geometry) {
    const auto it = geometry.find("type");
    if (it == geometry.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::optional<json> read_document(const std::string& path, const core::LogCallback& log) {
    std::ifstream in(path);
    if (!in) {
        report(log, "Error: cannot open GeoJSON file: " + path, true);
        return std::nullopt;
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        report(log, "Error: failed to parse GeoJSON file: " + path, true);
        return std::nullopt;
    }
    return document;
}

} // namespace

bool parse_countries(const json& document, std::vector<core::RegionRecord>& out, const core::LogCallback& log) {
    const json* features = feature_array(document, log);
    if (!features) {
        return false;
    }

    std::size_t skipped = 0;
    std::size_t index = 0;
    try {
        for (const auto& feature : *features) {
            const std::size_t feature_index = index++;
            const json* geometry = feature.is_object() ? geometry_of(feature) : nullptr;
            if (!geometry) {
                ++skipped;
                continue;
            }

            const json& props = properties_of(feature);
            core::RegionRecord record;
            record.name = first_string(props, kRegionNameFields).value_or("Region_" + std::to_string(feature_index));
            record.population = std::max<std::int64_t>(0, first_count(props, kRegionPopulationFields).value_or(0));

            const std::string type = geometry_type(*geometry);
            const auto coordinates = geometry->find("coordinates");
            if (coordinates == geometry->end() || !coordinates->is_array()) {
                ++skipped;
                continue;
            }

            if (type == "Polygon") {
                record.rings.push_back(exterior_ring(*coordinates));
            } else if (type == "MultiPolygon") {
                for (const auto& polygon : *coordinates) {
                    record.rings.push_back(exterior_ring(polygon));
                }
            } else {
                ++skipped;
                continue;
            }

            out.push_back(std::move(record));
        }
    } catch (const json::exception& e) {
        report(log, std::string("Error: unexpected GeoJSON structure: ") + e.what(), true);
        return false;
    }

    if (skipped > 0) {
        report(log, "Skipped " + std::to_string(skipped) + " non-polygon country features", false);
    }
    return true;
}

bool parse_cities(const json& document, std::vector<core::City>& out, const core::LogCallback& log) {
    const json* features = feature_array(document, log);
    if (!features) {
        return false;
    }

    std::size_t skipped = 0;
    std::size_t index = 0;
    try {
        for (const auto& feature : *features) {
            const std::size_t feature_index = index++;
            const json* geometry = feature.is_object() ? geometry_of(feature) : nullptr;
            if (!geometry || geometry_type(*geometry) != "Point") {
                ++skipped;
                continue;
            }

            const auto coordinates = geometry->find("coordinates");
            if (coordinates == geometry->end()) {
                ++skipped;
                continue;
            }

            const json& props = properties_of(feature);
            core::City city;
            city.name = first_string(props, kCityNameFields).value_or("City_" + std::to_string(feature_index));
            city.position = parse_position(*coordinates);
            city.population = first_count(props, kCityPopulationFields).value_or(0);
            city.owner = first_string(props, kCityOwnerFields).value_or(std::string{});
            out.push_back(std::move(city));
        }
    } catch (const json::exception& e) {
        report(log, std::string("Error: unexpected GeoJSON structure: ") + e.what(), true);
        return false;
    }

    if (skipped > 0) {
        report(log, "Skipped " + std::to_string(skipped) + " non-point city features", false);
    }
    return true;
}

bool parse_countries_text(std::string_view text, std::vector<core::RegionRecord>& out, const core::LogCallback& log) {
    const json document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        report(log, "Error: failed to parse GeoJSON text", true);
        return false;
    }
    return parse_countries(document, out, log);
}

bool parse_cities_text(std::string_view text, std::vector<core::City>& out, const core::LogCallback& log) {
    const json document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        report(log, "Error: failed to parse GeoJSON text", true);
        return false;
    }
    return parse_cities(document, out, log);
}

bool load_countries(const std::string& path, std::vector<core::RegionRecord>& out, const core::LogCallback& log) {
    const auto document = read_document(path, log);
    if (!document) {
        return false;
    }
    report(log, "Loading countries from " + path, false);
    return parse_countries(*document, out, log);
}

bool load_cities(const std::string& path, std::vector<core::City>& out, const core::LogCallback& log) {
    const auto document = read_document(path, log);
    if (!document) {
        return false;
    }
    report(log, "Loading cities from " + path, false);
    return parse_cities(*document, out, log);
}

bool load_map_source(const std::string& countries_path, const std::string& cities_path,
                     core::MapSource& out, const core::LogCallback& log) {
    out = core::MapSource{};
    if (!load_countries(countries_path, out.regions, log)) {
        return false;
    }

    if (cities_path.empty()) {
        return true;
    }
    if (!load_cities(cities_path, out.cities, log)) {
        out.cities.clear();
        report(log, "Warning: continuing without cities", true);
    }
    return true;
}

} // namespace geoatlas::io
