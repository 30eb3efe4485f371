#include <iostream>
#include <string>

#include <httplib.h>

#include "api_engine.hpp"
#include "api_http.hpp"
#include "env_loader.hpp"
#include "textutil.hpp"

using geosuggest::Engine;
using geosuggest::LoadReport;
using geosuggest::ServerConfig;

int main(int argc, char** argv) {
    if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        std::cerr << "Usage: suggest_server [DATA_SOURCE] [port]\n"
                  << "Example: suggest_server ./data/cities_canada-usa.tsv 2345\n"
                  << "Settings are also read from .env and the environment:\n"
                  << "  DATA_SOURCE, HOST, PORT, MAX_RESULTS\n";
        return 0;
    }

    // .env < process environment < command line
    auto vars = geosuggest::overlay_process_env(geosuggest::load_env_file(".env"));
    ServerConfig cfg = geosuggest::config_from_vars(vars);

    if (argc >= 2) cfg.data_source = argv[1];
    if (argc >= 3) {
        uint64_t p = 0;
        if (!geosuggest::parse_u64(argv[2], p) || p < 1 || p > 65535) {
            std::cerr << "Invalid port: " << argv[2] << "\n";
            return 1;
        }
        cfg.port = (int)p;
    }

    std::cout << "[config] data_source=" << cfg.data_source.string()
              << " host=" << cfg.host << " port=" << cfg.port
              << " max_results=" << cfg.max_results << "\n";

    // The gazetteer is loaded once, before accepting traffic
    Engine engine;
    engine.max_results = cfg.max_results;

    LoadReport report;
    if (!engine.load(cfg.data_source, report)) {
        std::cerr << "Unable to set the cities data source: " << report.error << "\n";
        return 1;
    }

    httplib::Server svr;
    geosuggest::register_routes(svr, engine);

    std::cout << "Server running at http://" << cfg.host << ":" << cfg.port << "/suggestions\n";
    std::cout << "Try: /suggestions?q=Londo&latitude=43.70011&longitude=-79.4163\n";

    if (!svr.listen(cfg.host, cfg.port)) {
        std::cerr << "Failed to listen on " << cfg.host << ":" << cfg.port << "\n";
        return 1;
    }
    return 0;
}
