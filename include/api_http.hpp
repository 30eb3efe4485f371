#pragma once

#include <optional>
#include <string>
#include <vector>

#include "api_engine.hpp"
#include "api_types.hpp"

// Forward declarations
namespace httplib {
    struct Request;
    struct Response;
    class Server;
}

namespace geosuggest {

// Add permissive CORS headers
void enable_cors(httplib::Response& res);

// {"status":"<code>","code":...,"message":...,"more info":...}
json error_envelope(int status, const std::string& code, const std::string& message);

void send_json(httplib::Response& res, int status, const json& body);

json to_json(const Suggestion& s);
json suggestions_to_json(const std::vector<Suggestion>& suggestions);

// Reads the optional latitude/longitude params. Empty values count as absent.
// Returns false if a supplied value is not numeric. `point` is set only when
// both coordinates are present.
bool parse_point_params(const httplib::Request& req, std::optional<GeoPoint>& point);

// GET /suggestions?q=...&latitude=...&longitude=...
void handle_suggestions(const Engine& engine, const httplib::Request& req, httplib::Response& res);

// GET /health
void handle_health(const Engine& engine, httplib::Response& res);

// Any unknown path or method
void handle_invalid_path(httplib::Response& res);

// Install routes, access logger and error handlers on a server
void register_routes(httplib::Server& svr, const Engine& engine);

} // namespace geosuggest
