#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/log.hpp"
#include "core/map_data.hpp"

namespace geoatlas::io {

/*
 * Natural Earth style GeoJSON FeatureCollections.
 *
 * Countries: Polygon and MultiPolygon features. Each polygon contributes its
 * exterior ring only. The name comes from ADMIN, NAME_EN, NAME or name
 * (first string found), else "Region_<feature index>"; POP_EST gives the
 * population when present.
 *
 * Cities: Point features. Name from NAME or name, population from POP_MAX or
 * population, owning region from ADM0NAME, ADMIN or country.
 *
 * Geometry problems are not decided here: bad coordinates become non-finite
 * points and are rejected later by MapData::load. All functions return false
 * and log on unreadable files or documents that are not FeatureCollections.
 */
bool parse_countries(const nlohmann::json& document, std::vector<core::RegionRecord>& out,
                     const core::LogCallback& log = core::default_log_callback());
bool parse_cities(const nlohmann::json& document, std::vector<core::City>& out,
                  const core::LogCallback& log = core::default_log_callback());

bool parse_countries_text(std::string_view text, std::vector<core::RegionRecord>& out,
                          const core::LogCallback& log = core::default_log_callback());
bool parse_cities_text(std::string_view text, std::vector<core::City>& out,
                       const core::LogCallback& log = core::default_log_callback());

bool load_countries(const std::string& path, std::vector<core::RegionRecord>& out,
                    const core::LogCallback& log = core::default_log_callback());
bool load_cities(const std::string& path, std::vector<core::City>& out,
                 const core::LogCallback& log = core::default_log_callback());

// Countries are required; a missing or unreadable cities file is only a warning.
bool load_map_source(const std::string& countries_path, const std::string& cities_path,
                     core::MapSource& out, const core::LogCallback& log = core::default_log_callback());

} // namespace geoatlas::io
