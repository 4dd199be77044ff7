#include "renderer.hpp"

#include <cairo.h>
#include <pango/pangocairo.h>

#include <cmath>
#include <cstdio>

namespace geoatlas::rendering {

namespace {

constexpr const char* kLabelFont = "Sans 10";
constexpr double kLabelPadX = 4.0;
constexpr double kLabelPadY = 2.0;
constexpr double kOverlayMargin = 10.0;

double channel(std::uint8_t value) {
    return static_cast<double>(value) / 255.0;
}

void set_source(cairo_t* cr, const RenderStyle& style) {
    cairo_set_source_rgba(cr, style.color.r, style.color.g, style.color.b, style.color.a);
}

} // namespace

// RenderStyle definitions
namespace styles {
    const RenderStyle region_outline{
        .line_width = 1.0,
        .color = {0.0, 0.0, 0.0, 1.0},
        .filled = false,
        .stroked = true
    };

    const RenderStyle city_marker_outer{
        .point_size = 4.0,
        .color = {0.0, 0.0, 0.0, 1.0},
        .filled = true,
        .stroked = false
    };

    const RenderStyle city_marker_ring{
        .point_size = 3.0,
        .color = {1.0, 1.0, 1.0, 1.0},
        .filled = true,
        .stroked = false
    };

    const RenderStyle city_marker_dot{
        .point_size = 1.0,
        .color = {0.0, 0.0, 0.0, 1.0},
        .filled = true,
        .stroked = false
    };

    const RenderStyle label_box{
        .line_width = 1.0,
        .color = {1.0, 1.0, 1.0, 1.0},
        .filled = true,
        .stroked = true
    };
}

// Renderer implementation
struct Renderer::Impl {
    cairo_t* cr = nullptr;
    int viewport_width = 0;
    int viewport_height = 0;
};

Renderer::Renderer() : impl_(std::make_unique<Impl>()) {}

Renderer::~Renderer() = default;

void Renderer::begin_frame(cairo_t* cr, int width, int height) {
    impl_->cr = cr;
    impl_->viewport_width = width;
    impl_->viewport_height = height;
}

void Renderer::end_frame() {
    impl_->cr = nullptr;
}

void Renderer::draw_frame(const core::Frame& frame, const core::Rgb& water_color) {
    if (!impl_->cr) return;

    draw_background(water_color);

    const bool outlined = frame.zoom >= kOutlineMinZoom;
    for (const auto& region : frame.regions) {
        draw_region(region, outlined);
    }

    for (const auto& city : frame.cities) {
        // Skip if outside screen
        if (city.position.x < 0.0 || city.position.y < 0.0 ||
            city.position.x > impl_->viewport_width || city.position.y > impl_->viewport_height) {
            continue;
        }
        draw_city(city);
    }

    draw_zoom_indicator(frame.zoom);
    if (frame.selected_name) {
        draw_selected_name(*frame.selected_name);
    }
}

void Renderer::draw_background(const core::Rgb& color) {
    if (!impl_->cr) return;

    cairo_set_source_rgb(impl_->cr, channel(color.r), channel(color.g), channel(color.b));
    cairo_paint(impl_->cr);
}

void Renderer::draw_region(const core::RegionDraw& region, bool outlined) {
    if (!impl_->cr) return;

    cairo_t* cr = impl_->cr;
    cairo_set_source_rgb(cr, channel(region.color.r), channel(region.color.g), channel(region.color.b));
    for (const auto& ring : region.rings) {
        if (ring.size() < 3) continue;

        cairo_new_path(cr);
        cairo_move_to(cr, ring.front().x, ring.front().y);
        for (std::size_t i = 1; i < ring.size(); ++i) {
            cairo_line_to(cr, ring[i].x, ring[i].y);
        }
        cairo_close_path(cr);
        cairo_fill(cr);
    }

    if (!outlined) return;

    set_source(cr, styles::region_outline);
    cairo_set_line_width(cr, styles::region_outline.line_width);
    for (const auto& outline : region.outlines) {
        if (outline.points.size() < 2) continue;

        cairo_new_path(cr);
        cairo_move_to(cr, outline.points.front().x, outline.points.front().y);
        for (std::size_t i = 1; i < outline.points.size(); ++i) {
            cairo_line_to(cr, outline.points[i].x, outline.points[i].y);
        }
        // A clipped run is a stretch of coast; closing it would draw a chord
        if (outline.closed) {
            cairo_close_path(cr);
        }
        cairo_stroke(cr);
    }
}

void Renderer::draw_city(const core::CityDraw& city) {
    if (!impl_->cr) return;

    cairo_t* cr = impl_->cr;
    for (const RenderStyle* style : {&styles::city_marker_outer, &styles::city_marker_ring, &styles::city_marker_dot}) {
        set_source(cr, *style);
        cairo_new_path(cr);
        cairo_arc(cr, city.position.x, city.position.y, style->point_size, 0, 2 * M_PI);
        cairo_fill(cr);
    }

    draw_boxed_text(city.label, city.position.x + 6.0, city.position.y, Anchor::MidLeft);
}

void Renderer::draw_zoom_indicator(double zoom) {
    if (!impl_->cr) return;

    char text[32];
    std::snprintf(text, sizeof(text), "Zoom: %.1fx", zoom);
    draw_boxed_text(text, impl_->viewport_width - kOverlayMargin, kOverlayMargin, Anchor::TopRight);
}

void Renderer::draw_selected_name(const std::string& name) {
    if (!impl_->cr || name.empty()) return;

    draw_boxed_text(name, kOverlayMargin, kOverlayMargin, Anchor::TopLeft);
}

void Renderer::draw_boxed_text(const std::string& text, double x, double y, Anchor anchor) {
    if (!impl_->cr || text.empty()) return;

    cairo_t* cr = impl_->cr;

    // Create Pango layout for text rendering
    PangoLayout* layout = pango_cairo_create_layout(cr);
    PangoFontDescription* font_desc = pango_font_description_from_string(kLabelFont);
    pango_layout_set_font_description(layout, font_desc);
    pango_layout_set_text(layout, text.c_str(), -1);

    int text_width = 0;
    int text_height = 0;
    pango_layout_get_pixel_size(layout, &text_width, &text_height);

    double left = x;
    double top = y;
    switch (anchor) {
        case Anchor::TopLeft:
            break;
        case Anchor::TopRight:
            left = x - text_width;
            break;
        case Anchor::MidLeft:
            top = y - text_height / 2.0;
            break;
    }

    const double box_x = left - kLabelPadX;
    const double box_y = top - kLabelPadY;
    const double box_w = text_width + 2 * kLabelPadX;
    const double box_h = text_height + 2 * kLabelPadY;

    cairo_save(cr);
    cairo_new_path(cr);
    cairo_rectangle(cr, box_x, box_y, box_w, box_h);
    set_source(cr, styles::label_box);
    cairo_fill_preserve(cr);
    cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);
    cairo_set_line_width(cr, styles::label_box.line_width);
    cairo_stroke(cr);

    cairo_move_to(cr, left, top);
    pango_cairo_show_layout(cr, layout);
    cairo_restore(cr);

    // Cleanup
    pango_font_description_free(font_desc);
    g_object_unref(layout);
}

} // namespace geoatlas::rendering
