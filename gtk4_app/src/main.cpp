#include <gtk/gtk.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/map_data.hpp"
#include "data_loader/geojson_loader.hpp"
#include "map_view.hpp"

namespace {

struct AppState {
  GtkApplication *app = nullptr;
  GtkWidget *window = nullptr;
  GtkWidget *map_container = nullptr;
  GtkWidget *status_label = nullptr;
  GtkWidget *loading_box = nullptr;
  GtkWidget *loading_spinner = nullptr;
  MapView *map_view = nullptr;
  std::shared_ptr<geoatlas::core::MapData> map_data;
  geoatlas::core::ViewerConfig config;
  GThread *loading_thread = nullptr;
  std::atomic<bool> loading_cancelled{false};
};

struct LoadMapData {
  AppState *state;
  std::string countries_path;
  std::string cities_path;
  geoatlas::core::MapData::Options options;
  std::shared_ptr<geoatlas::core::MapData> map_data;
  bool success;
};

std::string resolved(const std::string &path) {
  if (path.empty()) {
    return path;
  }
  const auto found = geoatlas::core::resolve_data_path(path);
  return found ? found->string() : path;
}

void remove_loading_box(AppState *state) {
  if (state->loading_box && state->map_container && GTK_IS_WIDGET(state->loading_box)) {
    GtkWidget *parent = gtk_widget_get_parent(state->loading_box);
    if (parent && parent == GTK_WIDGET(state->map_container)) {
      gtk_box_remove(GTK_BOX(state->map_container), state->loading_box);
    }
  }
  state->loading_box = nullptr;
  state->loading_spinner = nullptr; // destroyed with the box
}

void show_error(AppState *state, const std::string &message) {
  remove_loading_box(state);
  GtkWidget *label = gtk_label_new(message.c_str());
  gtk_widget_set_hexpand(label, TRUE);
  gtk_widget_set_vexpand(label, TRUE);
  gtk_label_set_wrap(GTK_LABEL(label), TRUE);
  gtk_box_append(GTK_BOX(state->map_container), label);
}

gboolean map_loading_complete(gpointer user_data) {
  auto *load_data = static_cast<LoadMapData *>(user_data);
  auto *state = load_data->state;

  if (state->loading_thread) {
    g_thread_join(state->loading_thread);
    state->loading_thread = nullptr;
  }

  if (state->loading_cancelled.load()) {
    delete load_data;
    return G_SOURCE_REMOVE;
  }

  if (state->loading_spinner) {
    gtk_spinner_stop(GTK_SPINNER(state->loading_spinner));
  }

  if (!load_data->success) {
    show_error(state, "Failed to load map data from \"" + load_data->countries_path + "\".");
    gtk_label_set_text(GTK_LABEL(state->status_label), "No map loaded");
    delete load_data;
    return G_SOURCE_REMOVE;
  }

  state->map_data = load_data->map_data;
  state->map_view = new MapView(state->map_data, state->config);
  state->map_view->set_selection_changed_callback([state](const std::string &name) {
    gtk_label_set_text(GTK_LABEL(state->status_label), name.empty() ? "No selection" : name.c_str());
  });

  remove_loading_box(state);
  gtk_box_append(GTK_BOX(state->map_container), state->map_view->widget());
  gtk_widget_grab_focus(state->map_view->widget());

  const std::string summary = std::to_string(state->map_data->region_count()) + " regions, " +
                              std::to_string(state->map_data->city_count()) + " cities";
  gtk_label_set_text(GTK_LABEL(state->status_label), summary.c_str());

  delete load_data;
  return G_SOURCE_REMOVE;
}

gpointer load_map_thread_func(gpointer user_data) {
  auto *load_data = static_cast<LoadMapData *>(user_data);

  if (load_data->state->loading_cancelled.load()) {
    load_data->success = false;
    g_idle_add(map_loading_complete, load_data);
    return nullptr;
  }

  geoatlas::core::MapSource source;
  bool success = geoatlas::io::load_map_source(load_data->countries_path, load_data->cities_path, source);

  auto map_data = std::make_shared<geoatlas::core::MapData>(load_data->options);
  if (success && !load_data->state->loading_cancelled.load()) {
    geoatlas::core::LoadReport report;
    success = map_data->load(std::move(source), report);
    if (!report.issues.empty()) {
      geoatlas::core::log_to_console(std::to_string(report.issues.size()) + " load issues, " +
                                         std::to_string(report.count(geoatlas::core::LoadIssue::ErrorType::UnresolvedOwner)) +
                                         " cities without a region",
                                     false);
    }
  }

  load_data->map_data = map_data;
  load_data->success = success;

  g_idle_add(map_loading_complete, load_data);
  return nullptr;
}

void start_loading(AppState *state) {
  state->loading_box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
  gtk_widget_set_halign(state->loading_box, GTK_ALIGN_CENTER);
  gtk_widget_set_valign(state->loading_box, GTK_ALIGN_CENTER);
  gtk_widget_set_hexpand(state->loading_box, TRUE);
  gtk_widget_set_vexpand(state->loading_box, TRUE);

  state->loading_spinner = gtk_spinner_new();
  gtk_spinner_start(GTK_SPINNER(state->loading_spinner));
  gtk_widget_set_size_request(state->loading_spinner, 48, 48);
  gtk_box_append(GTK_BOX(state->loading_box), state->loading_spinner);

  GtkWidget *loading_label = gtk_label_new("Loading map data...");
  gtk_widget_add_css_class(loading_label, "title-3");
  gtk_box_append(GTK_BOX(state->loading_box), loading_label);

  gtk_box_append(GTK_BOX(state->map_container), state->loading_box);

  geoatlas::core::MapData::Options options;
  options.rtree_threshold = state->config.rtree_threshold;
  options.city_policy = state->config.city_policy;
  options.color_seed = state->config.color_seed;

  auto *load_data = new LoadMapData{state,
                                    resolved(state->config.countries_path),
                                    resolved(state->config.cities_path),
                                    options,
                                    nullptr,
                                    false};
  state->loading_thread = g_thread_new("map-loader", load_map_thread_func, load_data);
}

void on_window_destroy(GtkWidget *, gpointer user_data) {
  auto *state = static_cast<AppState *>(user_data);

  // The completion callback may still be queued; it only reads the flag once the thread is gone.
  if (state->loading_thread) {
    state->loading_cancelled.store(true);
    g_thread_join(state->loading_thread);
    state->loading_thread = nullptr;
  }

  delete state->map_view;
  state->map_view = nullptr;
  state->map_data.reset();
}

void on_activate(GtkApplication *app, gpointer user_data) {
  auto *state = static_cast<AppState *>(user_data);
  state->app = app;

  state->window = gtk_application_window_new(app);
  gtk_window_set_title(GTK_WINDOW(state->window), "GeoAtlas");
  gtk_window_set_default_size(GTK_WINDOW(state->window), state->config.window_width, state->config.window_height);

  GtkWidget *page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
  gtk_widget_set_hexpand(page, TRUE);
  gtk_widget_set_vexpand(page, TRUE);

  state->map_container = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);
  gtk_widget_set_hexpand(state->map_container, TRUE);
  gtk_widget_set_vexpand(state->map_container, TRUE);
  gtk_box_append(GTK_BOX(page), state->map_container);

  state->status_label = gtk_label_new("");
  gtk_label_set_xalign(GTK_LABEL(state->status_label), 0.0f);
  gtk_widget_set_margin_top(state->status_label, 4);
  gtk_widget_set_margin_bottom(state->status_label, 4);
  gtk_widget_set_margin_start(state->status_label, 12);
  gtk_widget_set_margin_end(state->status_label, 12);
  gtk_box_append(GTK_BOX(page), state->status_label);

  gtk_window_set_child(GTK_WINDOW(state->window), page);
  g_signal_connect(state->window, "destroy", G_CALLBACK(on_window_destroy), state);

  start_loading(state);
  gtk_window_present(GTK_WINDOW(state->window));
}

} // namespace

int main(int argc, char *argv[])
{
  auto *state = new AppState();
  state->config = geoatlas::core::config_from_environment(geoatlas::core::ViewerConfig{});

  // Positional overrides: geoatlas [countries.geojson [cities.geojson]]
  std::vector<char *> gtk_args{argv[0]};
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (!arg.empty() && arg[0] != '-' && positional < 2) {
      (positional == 0 ? state->config.countries_path : state->config.cities_path) = arg;
      ++positional;
    } else {
      gtk_args.push_back(argv[i]);
    }
  }

  GtkApplication *app = gtk_application_new("org.geoatlas.viewer", G_APPLICATION_NON_UNIQUE);
  g_signal_connect(app, "activate", G_CALLBACK(on_activate), state);

  int status = g_application_run(G_APPLICATION(app), static_cast<int>(gtk_args.size()), gtk_args.data());
  g_object_unref(app);
  delete state;
  return status;
}
