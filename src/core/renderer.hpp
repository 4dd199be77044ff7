#pragma once

#include <memory>
#include <string>

#include <cairo.h>

#include "scene.hpp"
#include "types.hpp"

namespace geoatlas::rendering {

struct RenderStyle {
    double line_width = 1.0;
    double point_size = 2.0;
    struct Color { double r, g, b, a; } color = {0.0, 0.0, 0.0, 1.0};
    bool filled = false;
    bool stroked = true;
};

// Style presets
namespace styles {
    extern const RenderStyle region_outline;
    extern const RenderStyle city_marker_outer;
    extern const RenderStyle city_marker_ring;
    extern const RenderStyle city_marker_dot;
    extern const RenderStyle label_box;
}

// Outlines are drawn from this zoom upwards.
constexpr double kOutlineMinZoom = 1.0;

// Cairo/Pango renderer for the frames produced by core::SceneBuilder.
class Renderer {
public:
    Renderer();
    ~Renderer();

    void begin_frame(cairo_t* cr, int width, int height);
    void end_frame();

    // Background, regions, cities, then the overlays.
    void draw_frame(const core::Frame& frame, const core::Rgb& water_color);

    void draw_background(const core::Rgb& color);
    void draw_region(const core::RegionDraw& region, bool outlined);
    void draw_city(const core::CityDraw& city);
    void draw_zoom_indicator(double zoom);
    void draw_selected_name(const std::string& name);

private:
    enum class Anchor {
        TopLeft,
        TopRight,
        MidLeft
    };

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void draw_boxed_text(const std::string& text, double x, double y, Anchor anchor);
};

} // namespace geoatlas::rendering
