#include "coordinate_transform.hpp"

#include <algorithm>
#include <cmath>

namespace geoatlas::core {

CoordinateTransform::CoordinateTransform(double viewport_width, double viewport_height,
                                         double min_zoom, double max_zoom)
    : viewport_width_(viewport_width > 0.0 ? viewport_width : 1.0)
    , viewport_height_(viewport_height > 0.0 ? viewport_height : 1.0)
    , min_zoom_(std::min(min_zoom, max_zoom))
    , max_zoom_(std::max(min_zoom, max_zoom))
    , zoom_(clamp_zoom(1.0)) {}

Point2D CoordinateTransform::geo_to_screen(double lon, double lat) const {
    const double x = (lon + 180.0) / 360.0 * viewport_width_ * zoom_ + pan_.x;
    const double y = (-lat + 90.0) / 180.0 * viewport_height_ * zoom_ + pan_.y;
    return Point2D{x, y};
}

PixelPoint CoordinateTransform::geo_to_pixel(double lon, double lat) const {
    const Point2D screen = geo_to_screen(lon, lat);
    return PixelPoint{static_cast<int>(screen.x), static_cast<int>(screen.y)};
}

GeoPoint CoordinateTransform::screen_to_geo(double x, double y) const {
    const double nx = (x - pan_.x) / (viewport_width_ * zoom_);
    const double ny = (y - pan_.y) / (viewport_height_ * zoom_);
    return GeoPoint(nx * 360.0 - 180.0, -(ny * 180.0 - 90.0));
}

void CoordinateTransform::pan(double dx, double dy) {
    pan_.x += dx;
    pan_.y += dy;
}

bool CoordinateTransform::zoom_at(double factor, double anchor_x, double anchor_y) {
    if (!std::isfinite(factor) || factor <= 0.0) {
        return false;
    }

    const GeoPoint anchor_geo = screen_to_geo(anchor_x, anchor_y);
    const double old_zoom = zoom_;
    zoom_ = clamp_zoom(zoom_ * factor);
    if (zoom_ == old_zoom) {
        return false;
    }

    // Keep the geographic point under the anchor fixed on screen
    const Point2D moved = geo_to_screen(anchor_geo);
    pan_.x += anchor_x - moved.x;
    pan_.y += anchor_y - moved.y;
    return true;
}

void CoordinateTransform::set_zoom(double zoom) {
    if (std::isfinite(zoom) && zoom > 0.0) {
        zoom_ = clamp_zoom(zoom);
    }
}

Bounds CoordinateTransform::visible_bounds(double screen_width, double screen_height) const {
    const GeoPoint top_left = screen_to_geo(0.0, 0.0);
    const GeoPoint bottom_right = screen_to_geo(screen_width, screen_height);

    return Bounds{
        std::min(top_left.lon, bottom_right.lon),
        std::max(top_left.lon, bottom_right.lon),
        std::min(top_left.lat, bottom_right.lat),
        std::max(top_left.lat, bottom_right.lat)
    };
}

double CoordinateTransform::clamp_zoom(double zoom) const {
    return std::max(min_zoom_, std::min(max_zoom_, zoom));
}

} // namespace geoatlas::core
