#pragma once

#include "core/types.hpp"

namespace geoatlas::core {

// Zoom limits from the original viewer
namespace zoom_limits {
    constexpr double kMinZoom = 0.3;
    constexpr double kMaxZoom = 50.0;
}

/*
 * Equirectangular mapping between degrees and screen pixels.
 *
 *   x = (lon + 180) / 360 * viewport_width  * zoom + pan.x
 *   y = (90 - lat)  / 180 * viewport_height * zoom + pan.y
 *
 * The viewport size fixes the scale; it does not follow window resizes.
 */
class CoordinateTransform {
public:
    CoordinateTransform(double viewport_width, double viewport_height,
                        double min_zoom = zoom_limits::kMinZoom,
                        double max_zoom = zoom_limits::kMaxZoom);

    [[nodiscard]] Point2D geo_to_screen(double lon, double lat) const;
    [[nodiscard]] Point2D geo_to_screen(const GeoPoint& point) const { return geo_to_screen(point.lon, point.lat); }
    // Truncated pixel position for drawing.
    [[nodiscard]] PixelPoint geo_to_pixel(double lon, double lat) const;
    [[nodiscard]] PixelPoint geo_to_pixel(const GeoPoint& point) const { return geo_to_pixel(point.lon, point.lat); }
    [[nodiscard]] GeoPoint screen_to_geo(double x, double y) const;

    void pan(double dx, double dy);

    // Returns false when the clamped zoom did not change; pan is then untouched.
    bool zoom_at(double factor, double anchor_x, double anchor_y);

    void set_zoom(double zoom);
    void set_pan(const Point2D& pan) { pan_ = pan; }

    // Geographic rectangle covered by a screen of the given size.
    [[nodiscard]] Bounds visible_bounds(double screen_width, double screen_height) const;
    [[nodiscard]] Bounds visible_bounds() const { return visible_bounds(viewport_width_, viewport_height_); }

    [[nodiscard]] double zoom() const { return zoom_; }
    [[nodiscard]] const Point2D& pan_offset() const { return pan_; }
    [[nodiscard]] double viewport_width() const { return viewport_width_; }
    [[nodiscard]] double viewport_height() const { return viewport_height_; }
    [[nodiscard]] double min_zoom() const { return min_zoom_; }
    [[nodiscard]] double max_zoom() const { return max_zoom_; }

private:
    double viewport_width_;
    double viewport_height_;
    double min_zoom_;
    double max_zoom_;
    double zoom_ = 1.0;
    Point2D pan_{0.0, 0.0};

    [[nodiscard]] double clamp_zoom(double zoom) const;
};

} // namespace geoatlas::core
