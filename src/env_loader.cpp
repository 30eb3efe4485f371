#include "env_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include "textutil.hpp"

namespace geosuggest {

static const char* const kConfigKeys[] = {"DATA_SOURCE", "HOST", "PORT", "MAX_RESULTS"};

EnvVars load_env_file(const fs::path& path) {
    EnvVars vars;

    std::ifstream in(path);
    if (!in) return vars;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        std::string t = trim_copy(line);
        if (t.empty() || t[0] == '#') continue;
        if (t.rfind("export ", 0) == 0) t = trim_copy(t.substr(7));

        size_t eq = t.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "[config] ignoring " << path.string() << ":" << line_no
                      << " (expected KEY=VALUE)\n";
            continue;
        }

        std::string key = trim_copy(t.substr(0, eq));
        std::string value = trim_copy(t.substr(eq + 1));

        // Strip one pair of matching quotes
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        vars[key] = value;
    }
    return vars;
}

EnvVars overlay_process_env(EnvVars vars) {
    for (const char* key : kConfigKeys) {
        if (const char* v = std::getenv(key)) vars[key] = v;
    }
    return vars;
}

ServerConfig config_from_vars(const EnvVars& vars) {
    ServerConfig cfg;

    auto get = [&](const char* key) -> std::string {
        auto it = vars.find(key);
        return it == vars.end() ? std::string() : trim_copy(it->second);
    };

    std::string data_source = get("DATA_SOURCE");
    if (!data_source.empty()) cfg.data_source = fs::path(data_source);

    std::string host = get("HOST");
    if (!host.empty()) cfg.host = host;

    std::string port = get("PORT");
    if (!port.empty()) {
        uint64_t p = 0;
        if (parse_u64(port, p) && p >= 1 && p <= 65535) {
            cfg.port = (int)p;
        } else {
            std::cerr << "[config] invalid PORT '" << port << "', using " << cfg.port << "\n";
        }
    }

    std::string max_results = get("MAX_RESULTS");
    if (!max_results.empty()) {
        uint64_t k = 0;
        if (parse_u64(max_results, k)) {
            cfg.max_results = (size_t)k;
        } else {
            std::cerr << "[config] invalid MAX_RESULTS '" << max_results << "', using "
                      << cfg.max_results << "\n";
        }
    }

    return cfg;
}

} // namespace geosuggest
