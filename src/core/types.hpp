#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace geoatlas::core {

// Longitude/latitude in degrees on a flat equirectangular plane.
struct GeoPoint {
    double lon = 0.0;
    double lat = 0.0;
    GeoPoint() = default;
    GeoPoint(double lon_val, double lat_val) : lon(lon_val), lat(lat_val) {}

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(lon) && std::isfinite(lat);
    }

    bool operator==(const GeoPoint& other) const {
        return lon == other.lon && lat == other.lat;
    }
};

// Implicitly closed polygon boundary; point order is the boundary order.
using Ring = std::vector<GeoPoint>;

struct Point2D {
    double x = 0.0;
    double y = 0.0;
    Point2D() = default;
    Point2D(double x_val, double y_val) : x(x_val), y(y_val) {}
};

struct PixelPoint {
    int x = 0;
    int y = 0;
};

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

struct Bounds {
    double min_lon = 0.0;
    double max_lon = 0.0;
    double min_lat = 0.0;
    double max_lat = 0.0;

    // Inverted box that any expand() call will overwrite.
    static Bounds empty() {
        return Bounds{std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest(),
                      std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest()};
    }

    [[nodiscard]] bool is_valid() const {
        return std::isfinite(min_lon) && std::isfinite(max_lon) &&
               std::isfinite(min_lat) && std::isfinite(max_lat) &&
               min_lat <= max_lat && min_lon <= max_lon;
    }

    [[nodiscard]] double width() const { return max_lon - min_lon; }
    [[nodiscard]] double height() const { return max_lat - min_lat; }

    [[nodiscard]] double area() const {
        const double w = width();
        const double h = height();
        if (w <= 0.0 || h <= 0.0) {
            return 0.0;
        }
        return w * h;
    }

    [[nodiscard]] GeoPoint center() const {
        return GeoPoint((min_lon + max_lon) * 0.5, (min_lat + max_lat) * 0.5);
    }

    [[nodiscard]] bool contains(double lon, double lat) const {
        return lon >= min_lon && lon <= max_lon && lat >= min_lat && lat <= max_lat;
    }

    [[nodiscard]] bool contains(const GeoPoint& point) const {
        return contains(point.lon, point.lat);
    }

    [[nodiscard]] bool contains(const Bounds& other) const {
        return other.min_lon >= min_lon && other.max_lon <= max_lon &&
               other.min_lat >= min_lat && other.max_lat <= max_lat;
    }

    [[nodiscard]] bool intersects(const Bounds& other) const {
        return !(max_lon < other.min_lon || min_lon > other.max_lon ||
                 max_lat < other.min_lat || min_lat > other.max_lat);
    }

    void expand(const GeoPoint& point) {
        min_lon = std::min(min_lon, point.lon);
        max_lon = std::max(max_lon, point.lon);
        min_lat = std::min(min_lat, point.lat);
        max_lat = std::max(max_lat, point.lat);
    }

    void expand(const Bounds& other) {
        min_lon = std::min(min_lon, other.min_lon);
        max_lon = std::max(max_lon, other.max_lon);
        min_lat = std::min(min_lat, other.min_lat);
        max_lat = std::max(max_lat, other.max_lat);
    }

    // Grows every edge by the same number of degrees.
    [[nodiscard]] Bounds padded(double degrees) const {
        return Bounds{min_lon - degrees, max_lon + degrees, min_lat - degrees, max_lat + degrees};
    }
};

struct City {
    std::string name;
    GeoPoint position;
    std::int64_t population = 0;
    std::string owner;  // region name, not validated against the loaded set
};

} // namespace geoatlas::core
