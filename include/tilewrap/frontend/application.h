#pragma once

#include <tilewrap/grid_view.h>

#include <string>

namespace tilewrap {

struct AppConfig {
    int         window_width  = 800;
    int         window_height = 600;
    std::string title         = "tilewrap";
    std::string font_path;     // empty: first system sans font found
    std::string labels_path;   // empty: built-in emoji
    GridConfig  grid;
};

// High-level entry point: creates the window, fonts and grid view, runs the
// frame loop, and returns when the user quits.
// Returns false if initialisation fails.
bool run_application(const AppConfig& config);

} // namespace tilewrap
