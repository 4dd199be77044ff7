#include "map_view.hpp"

#include <cmath>
#include <gdk/gdkkeysyms.h>
#include <iostream>
#include <utility>

namespace {

geoatlas::core::SceneBuilder::Options scene_options(const geoatlas::core::ViewerConfig &config)
{
  geoatlas::core::SceneBuilder::Options options;
  options.culling.margin_fraction = config.cull_margin;
  options.lod_strategy = config.lod_strategy;
  options.lod_cache_capacity = config.lod_cache_capacity;
  return options;
}

} // namespace

MapView::MapView(std::shared_ptr<geoatlas::core::MapData> map_data, const geoatlas::core::ViewerConfig &config)
    : drawing_area_(gtk_drawing_area_new())
    , map_data_(std::move(map_data))
    , config_(config)
    , transform_(config.window_width, config.window_height, config.min_zoom, config.max_zoom)
    , scene_(scene_options(config))
    , renderer_(std::make_unique<geoatlas::rendering::Renderer>())
{
  transform_.set_zoom(config_.initial_zoom);

  gtk_widget_set_hexpand(drawing_area_, TRUE);
  gtk_widget_set_vexpand(drawing_area_, TRUE);
  gtk_widget_set_focusable(drawing_area_, TRUE);
  gtk_widget_set_size_request(drawing_area_, config_.window_width / 2, config_.window_height / 2);

  gtk_drawing_area_set_draw_func(GTK_DRAWING_AREA(drawing_area_), MapView::draw_cb, this, nullptr);

  GtkGesture *drag = gtk_gesture_drag_new();
  gtk_gesture_single_set_button(GTK_GESTURE_SINGLE(drag), GDK_BUTTON_PRIMARY);
  gtk_widget_add_controller(drawing_area_, GTK_EVENT_CONTROLLER(drag));
  g_signal_connect(drag, "drag-begin", G_CALLBACK(MapView::drag_begin_cb), this);
  g_signal_connect(drag, "drag-update", G_CALLBACK(MapView::drag_update_cb), this);

  GtkGesture *click = gtk_gesture_click_new();
  gtk_gesture_single_set_button(GTK_GESTURE_SINGLE(click), GDK_BUTTON_SECONDARY);
  gtk_widget_add_controller(drawing_area_, GTK_EVENT_CONTROLLER(click));
  g_signal_connect(click, "pressed", G_CALLBACK(MapView::secondary_click_cb), this);

  GtkEventController *motion = gtk_event_controller_motion_new();
  gtk_widget_add_controller(drawing_area_, motion);
  g_signal_connect(motion, "motion", G_CALLBACK(MapView::motion_cb), this);

  GtkEventController *scroll = gtk_event_controller_scroll_new(GTK_EVENT_CONTROLLER_SCROLL_VERTICAL);
  gtk_widget_add_controller(drawing_area_, scroll);
  g_signal_connect(scroll, "scroll", G_CALLBACK(MapView::scroll_cb), this);

  GtkEventController *key = gtk_event_controller_key_new();
  gtk_widget_add_controller(drawing_area_, key);
  g_signal_connect(key, "key-pressed", G_CALLBACK(MapView::key_press_cb), this);
}

GtkWidget *MapView::widget() const
{
  return drawing_area_;
}

void MapView::set_selection_changed_callback(std::function<void(const std::string &)> callback)
{
  selection_changed_ = std::move(callback);
}

void MapView::draw(cairo_t *cr, int width, int height)
{
  width_ = width;
  height_ = height;

  cairo_save(cr);

  if (!map_data_ || !map_data_->load_success()) {
    draw_placeholder(cr, width, height);
    cairo_restore(cr);
    return;
  }

  const geoatlas::core::Frame frame = scene_.build(*map_data_, transform_, width, height);

  renderer_->begin_frame(cr, width, height);
  renderer_->draw_frame(frame, config_.water_color);
  renderer_->end_frame();

  cairo_restore(cr);
}

void MapView::draw_placeholder(cairo_t *cr, int width, int height)
{
  const auto &water = config_.water_color;
  cairo_set_source_rgb(cr, water.r / 255.0, water.g / 255.0, water.b / 255.0);
  cairo_paint(cr);

  cairo_set_source_rgb(cr, 0.9, 0.9, 0.9);
  cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
  cairo_set_font_size(cr, 24);
  cairo_move_to(cr, width / 2.0 - 60, height / 2.0);
  cairo_show_text(cr, "No map data");
}

void MapView::begin_drag()
{
  drag_start_pan_ = transform_.pan_offset();
  gtk_widget_grab_focus(drawing_area_);
}

void MapView::update_drag(double offset_x, double offset_y)
{
  transform_.set_pan(geoatlas::core::Point2D{drag_start_pan_.x + offset_x, drag_start_pan_.y + offset_y});
  gtk_widget_queue_draw(drawing_area_);
}

bool MapView::handle_scroll(double, double dy)
{
  if(std::abs(dy) < 1e-6) {
    return false;
  }

  // Scrolling up zooms in around the pointer
  const double factor = dy < 0 ? config_.zoom_step : 1.0 / config_.zoom_step;
  if(transform_.zoom_at(factor, pointer_x_, pointer_y_)) {
    gtk_widget_queue_draw(drawing_area_);
  }
  return true;
}

bool MapView::handle_key_press(guint keyval, GdkModifierType)
{
  bool handled = false;
  bool changed = false;
  const double step = config_.pan_step;
  const double center_x = width_ > 0 ? width_ / 2.0 : config_.window_width / 2.0;
  const double center_y = height_ > 0 ? height_ / 2.0 : config_.window_height / 2.0;

  switch(keyval) {
  case GDK_KEY_Up:
  case GDK_KEY_w:
  case GDK_KEY_W:
    transform_.pan(0.0, step);
    handled = changed = true;
    break;
  case GDK_KEY_Down:
  case GDK_KEY_s:
  case GDK_KEY_S:
    transform_.pan(0.0, -step);
    handled = changed = true;
    break;
  case GDK_KEY_Left:
  case GDK_KEY_a:
  case GDK_KEY_A:
    transform_.pan(step, 0.0);
    handled = changed = true;
    break;
  case GDK_KEY_Right:
  case GDK_KEY_d:
  case GDK_KEY_D:
    transform_.pan(-step, 0.0);
    handled = changed = true;
    break;
  case GDK_KEY_plus:
  case GDK_KEY_equal:
  case GDK_KEY_KP_Add:
    changed = transform_.zoom_at(config_.zoom_step, center_x, center_y);
    handled = true;
    break;
  case GDK_KEY_minus:
  case GDK_KEY_KP_Subtract:
    changed = transform_.zoom_at(1.0 / config_.zoom_step, center_x, center_y);
    handled = true;
    break;
  case GDK_KEY_Escape:
    clear_selection();
    handled = true;
    break;
  default:
    break;
  }

  if(changed) {
    gtk_widget_queue_draw(drawing_area_);
  }
  return handled;
}

void MapView::select_at(double x, double y)
{
  if (!map_data_ || !map_data_->load_success()) {
    return;
  }

  const auto geo = transform_.screen_to_geo(x, y);
  const auto hit = map_data_->select_at(geo.lon, geo.lat);
  if (hit) {
    std::cout << "Selected: " << map_data_->region(*hit).name() << std::endl;
  }
  notify_selection();
  gtk_widget_queue_draw(drawing_area_);
}

void MapView::clear_selection()
{
  if (!map_data_ || !map_data_->selected_region()) {
    return;
  }
  map_data_->clear_selection();
  notify_selection();
  gtk_widget_queue_draw(drawing_area_);
}

void MapView::notify_selection()
{
  if (selection_changed_) {
    selection_changed_(map_data_->selected_name().value_or(std::string{}));
  }
}

void MapView::draw_cb(GtkDrawingArea *, cairo_t *cr, int width, int height, gpointer user_data)
{
  auto *self = static_cast<MapView *>(user_data);
  self->draw(cr, width, height);
}

void MapView::drag_begin_cb(GtkGestureDrag *, double, double, gpointer user_data)
{
  auto *self = static_cast<MapView *>(user_data);
  self->begin_drag();
}

void MapView::drag_update_cb(GtkGestureDrag *, double offset_x, double offset_y, gpointer user_data)
{
  auto *self = static_cast<MapView *>(user_data);
  self->update_drag(offset_x, offset_y);
}

void MapView::motion_cb(GtkEventControllerMotion *, double x, double y, gpointer user_data)
{
  auto *self = static_cast<MapView *>(user_data);
  self->pointer_x_ = x;
  self->pointer_y_ = y;
}

gboolean MapView::scroll_cb(GtkEventControllerScroll *, double dx, double dy, gpointer user_data)
{
  auto *self = static_cast<MapView *>(user_data);
  return self->handle_scroll(dx, dy) ? GDK_EVENT_STOP : GDK_EVENT_PROPAGATE;
}

void MapView::secondary_click_cb(GtkGestureClick *, int, double x, double y, gpointer user_data)
{
  auto *self = static_cast<MapView *>(user_data);
  self->select_at(x, y);
}

gboolean MapView::key_press_cb(GtkEventControllerKey *, guint keyval, guint, GdkModifierType state, gpointer user_data)
{
  auto *self = static_cast<MapView *>(user_data);
  return self->handle_key_press(keyval, state) ? GDK_EVENT_STOP : GDK_EVENT_PROPAGATE;
}
