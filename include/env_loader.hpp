#pragma once

#include <string>
#include <unordered_map>

#include "api_types.hpp"

namespace geosuggest {

using EnvVars = std::unordered_map<std::string, std::string>;

// Host configuration. Only data_source and max_results reach the core.
struct ServerConfig {
    fs::path data_source = "./data/cities_canada-usa.tsv";
    std::string host = "127.0.0.1";
    int port = 2345;
    size_t max_results = DEFAULT_MAX_RESULTS;
};

// Parse a .env file of KEY=VALUE lines. Blank lines and '#' comments are
// ignored, an optional "export " prefix is accepted and surrounding quotes
// are stripped from values. A missing file yields an empty map.
EnvVars load_env_file(const fs::path& path);

// Overlay process environment variables for the known config keys.
EnvVars overlay_process_env(EnvVars vars);

// Build a config from DATA_SOURCE, HOST, PORT, MAX_RESULTS.
// Invalid numbers are logged and the defaults kept.
ServerConfig config_from_vars(const EnvVars& vars);

} // namespace geosuggest
