#include <tilewrap/frontend/application.h>

#include <cstdio>
#include <stdexcept>
#include <string>

static void print_usage(const char* argv0) {
    std::fprintf(stderr,
        "usage: %s [options]\n"
        "  --labels FILE   cell labels, one per line (default: built-in emoji)\n"
        "  --cols N        grid columns, at least 5 (default 10)\n"
        "  --rows N        grid rows, at least 5 (default 10)\n"
        "  --size WxH      initial window size (default 800x600)\n"
        "  --font PATH     primary font file\n"
        "  --no-debug      start with the debug panel hidden\n",
        argv0);
}

static void parse_size(const std::string& s, int& w, int& h) {
    size_t x = s.find('x');
    if (x == std::string::npos)
        throw std::invalid_argument("expected WxH, got '" + s + "'");
    w = std::stoi(s.substr(0, x));
    h = std::stoi(s.substr(x + 1));
    if (w <= 0 || h <= 0)
        throw std::invalid_argument("window size must be positive");
}

int main(int argc, char* argv[]) {
    tilewrap::AppConfig config;
    config.window_width  = 800;
    config.window_height = 600;
    config.title         = "tilewrap";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc)
                    throw std::invalid_argument("missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--labels")        config.labels_path = value();
            else if (arg == "--cols")     config.grid.cols = std::stoi(value());
            else if (arg == "--rows")     config.grid.rows = std::stoi(value());
            else if (arg == "--size")     parse_size(value(), config.window_width, config.window_height);
            else if (arg == "--font")     config.font_path = value();
            else if (arg == "--no-debug") config.grid.show_debug = false;
            else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                throw std::invalid_argument("unknown option " + arg);
            }
        }
        tilewrap::make_grid(config.grid.cols, config.grid.rows);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "tilewrap: %s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }

    return tilewrap::run_application(config) ? 0 : 1;
}
