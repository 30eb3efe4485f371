#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "api_engine.hpp"
#include "api_gazetteer.hpp"
#include "textutil.hpp"

using namespace geosuggest;

int main(int argc, char** argv) {

    // Read gazetteer path and optional query from CLI
    if (argc < 2 || argc == 4 || argc > 5) {
        std::cerr << "Usage: gazetteer_check <TSV> [query] [lat lon]\n"
                  << "Example: gazetteer_check ./data/cities_canada-usa.tsv Londo 43.7 -79.4\n";
        return 1;
    }

    fs::path src = fs::path(argv[1]);

    LoadReport report;
    auto g = Gazetteer::load(src, report);
    if (!g) {
        std::cerr << "Load failed: " << report.error << "\n";
        return 1;
    }

    std::cout << "source:  " << src.string() << "\n"
              << "rows:    " << report.rows << "\n"
              << "loaded:  " << report.loaded << "\n"
              << "skipped: " << report.skipped << "\n"
              << "keys:    " << report.keys << "\n";

    if (argc < 3) return 0;

    // Optional reference point for distance ranking
    std::optional<GeoPoint> point;
    if (argc == 5) {
        GeoPoint p;
        if (!parse_double(argv[3], p.latitude) || !parse_double(argv[4], p.longitude)) {
            std::cerr << "Invalid coordinates: " << argv[3] << " " << argv[4] << "\n";
            return 1;
        }
        point = p;
    }

    auto results = suggest(*g, argv[2], point, DEFAULT_MAX_RESULTS);
    if (results.empty()) {
        std::cout << "no suggestions for \"" << argv[2] << "\"\n";
        return 0;
    }

    std::cout << std::fixed;
    for (const auto& s : results) {
        std::cout << std::setprecision(2) << s.score << "  " << s.name
                  << std::setprecision(5) << "  (" << s.latitude << ", " << s.longitude << ")\n";
    }
    return 0;
}
