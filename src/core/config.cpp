#include "config.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace geoatlas::core {

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

void report_ignored(const LogCallback& log, const char* name, const char* value, const char* expected) {
    if (log) {
        log(std::string("Ignoring ") + name + "='" + value + "': expected " + expected, true);
    }
}

bool parse_positive_double(const char* text, double& out) {
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !std::isfinite(value) || value <= 0.0) {
        return false;
    }
    out = value;
    return true;
}

bool parse_unsigned(const char* text, unsigned long long& out) {
    if (*text == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

} // namespace

ViewerConfig config_from_environment(ViewerConfig base, const LogCallback& log) {
    if (const char* path = env_value("GEOATLAS_COUNTRIES")) {
        base.countries_path = path;
    }
    if (const char* path = env_value("GEOATLAS_CITIES")) {
        base.cities_path = path;
    }

    double min_zoom = base.min_zoom;
    double max_zoom = base.max_zoom;
    if (const char* text = env_value("GEOATLAS_MIN_ZOOM")) {
        if (!parse_positive_double(text, min_zoom)) {
            report_ignored(log, "GEOATLAS_MIN_ZOOM", text, "a positive number");
        }
    }
    if (const char* text = env_value("GEOATLAS_MAX_ZOOM")) {
        if (!parse_positive_double(text, max_zoom)) {
            report_ignored(log, "GEOATLAS_MAX_ZOOM", text, "a positive number");
        }
    }
    if (min_zoom <= max_zoom) {
        base.min_zoom = min_zoom;
        base.max_zoom = max_zoom;
    } else if (log) {
        log("Ignoring zoom range " + std::to_string(min_zoom) + " > " + std::to_string(max_zoom), true);
    }

    if (const char* text = env_value("GEOATLAS_LOD_STRATEGY")) {
        if (!lod::parse_strategy(text, base.lod_strategy)) {
            report_ignored(log, "GEOATLAS_LOD_STRATEGY", text, "stride or tolerance");
        }
    }
    if (const char* text = env_value("GEOATLAS_CITY_POLICY")) {
        if (!cities::parse_policy(text, base.city_policy)) {
            report_ignored(log, "GEOATLAS_CITY_POLICY", text, "threshold or quota");
        }
    }

    if (const char* text = env_value("GEOATLAS_LOD_CACHE")) {
        unsigned long long value = 0;
        if (parse_unsigned(text, value)) {
            base.lod_cache_capacity = static_cast<std::size_t>(value);
        } else {
            report_ignored(log, "GEOATLAS_LOD_CACHE", text, "a non-negative integer");
        }
    }
    if (const char* text = env_value("GEOATLAS_COLOR_SEED")) {
        unsigned long long value = 0;
        if (parse_unsigned(text, value) && value <= 0xFFFFFFFFull) {
            base.color_seed = static_cast<std::uint32_t>(value);
        } else {
            report_ignored(log, "GEOATLAS_COLOR_SEED", text, "a 32-bit unsigned integer");
        }
    }

    base.initial_zoom = std::max(base.min_zoom, std::min(base.max_zoom, base.initial_zoom));
    return base;
}

std::optional<std::filesystem::path> resolve_data_path(const std::string& path) {
    if (path.empty()) {
        return std::nullopt;
    }

    const std::filesystem::path requested(path);
    std::error_code ec;
    if (requested.is_absolute()) {
        if (std::filesystem::is_regular_file(requested, ec)) {
            return requested;
        }
        return std::nullopt;
    }

    std::filesystem::path exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        exe_path = std::filesystem::current_path();
    }
    const auto exe_dir = exe_path.parent_path();
    const auto cwd = std::filesystem::current_path();

    const std::array<std::filesystem::path, 4> candidates = {
        cwd / requested,
        exe_dir / requested,
        exe_dir / ".." / requested,
        exe_dir / "../.." / requested
    };

    for (const auto& candidate : candidates) {
        std::error_code exists_ec;
        if (std::filesystem::is_regular_file(candidate, exists_ec)) {
            return candidate.lexically_normal();
        }
    }
    return std::nullopt;
}

} // namespace geoatlas::core
