#pragma once

#include <gtk/gtk.h>
#include <functional>
#include <memory>
#include <string>
#include "coordinates/coordinate_transform.hpp"
#include "core/config.hpp"
#include "core/map_data.hpp"
#include "core/renderer.hpp"
#include "core/scene.hpp"

class MapView {
public:
  MapView(std::shared_ptr<geoatlas::core::MapData> map_data, const geoatlas::core::ViewerConfig &config);
  MapView(const MapView &) = delete;
  MapView &operator=(const MapView &) = delete;
  MapView(MapView &&) = delete;
  MapView &operator=(MapView &&) = delete;
  ~MapView() = default;

  GtkWidget *widget() const;

  // Fired after the selection changes; receives the new name or an empty string.
  void set_selection_changed_callback(std::function<void(const std::string &)> callback);

private:
  GtkWidget *drawing_area_;
  std::shared_ptr<geoatlas::core::MapData> map_data_;
  geoatlas::core::ViewerConfig config_;

  geoatlas::core::CoordinateTransform transform_;
  geoatlas::core::SceneBuilder scene_;
  std::unique_ptr<geoatlas::rendering::Renderer> renderer_;

  geoatlas::core::Point2D drag_start_pan_{0.0, 0.0};
  double pointer_x_ = 0.0;
  double pointer_y_ = 0.0;
  int width_ = 0;
  int height_ = 0;

  std::function<void(const std::string &)> selection_changed_;

  void draw(cairo_t *cr, int width, int height);
  void draw_placeholder(cairo_t *cr, int width, int height);
  void begin_drag();
  void update_drag(double offset_x, double offset_y);
  bool handle_scroll(double dx, double dy);
  bool handle_key_press(guint keyval, GdkModifierType state);
  void select_at(double x, double y);
  void clear_selection();
  void notify_selection();

  static void draw_cb(GtkDrawingArea *area, cairo_t *cr, int width, int height, gpointer user_data);
  static void drag_begin_cb(GtkGestureDrag *gesture, double start_x, double start_y, gpointer user_data);
  static void drag_update_cb(GtkGestureDrag *gesture, double offset_x, double offset_y, gpointer user_data);
  static void motion_cb(GtkEventControllerMotion *controller, double x, double y, gpointer user_data);
  static gboolean scroll_cb(GtkEventControllerScroll *controller, double dx, double dy, gpointer user_data);
  static void secondary_click_cb(GtkGestureClick *gesture, int n_press, double x, double y, gpointer user_data);
  static gboolean key_press_cb(GtkEventControllerKey *controller, guint keyval, guint keycode, GdkModifierType state, gpointer user_data);
};
