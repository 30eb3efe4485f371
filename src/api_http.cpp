#include "api_http.hpp"

#include <chrono>
#include <exception>
#include <iostream>

#include <httplib.h>

#include "textutil.hpp"

namespace geosuggest {

static const char* const MORE_INFO_URL = "https://github.com/patrick-hubert/coding-challenge-backend-c/wiki";

void enable_cors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

json error_envelope(int status, const std::string& code, const std::string& message) {
    json j;
    j["status"] = std::to_string(status);
    j["code"] = code;
    j["message"] = message;
    j["more info"] = MORE_INFO_URL;
    return j;
}

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(2, ' ', false, json::error_handler_t::replace), "application/json");
}

json to_json(const Suggestion& s) {
    json j;
    j["name"] = s.name;
    j["latitude"] = s.latitude;
    j["longitude"] = s.longitude;
    j["score"] = s.score;
    return j;
}

json suggestions_to_json(const std::vector<Suggestion>& suggestions) {
    json out;
    out["suggestions"] = json::array();
    for (const auto& s : suggestions) out["suggestions"].push_back(to_json(s));
    return out;
}

bool parse_point_params(const httplib::Request& req, std::optional<GeoPoint>& point) {
    point.reset();

    std::string lat_s = req.has_param("latitude") ? trim_copy(req.get_param_value("latitude")) : "";
    std::string lon_s = req.has_param("longitude") ? trim_copy(req.get_param_value("longitude")) : "";

    GeoPoint p;
    if (!lat_s.empty() && !parse_double(lat_s, p.latitude)) return false;
    if (!lon_s.empty() && !parse_double(lon_s, p.longitude)) return false;

    // Distance ranking needs both coordinates
    if (!lat_s.empty() && !lon_s.empty()) point = p;
    return true;
}

void handle_suggestions(const Engine& engine, const httplib::Request& req, httplib::Response& res) {
    enable_cors(res);

    using clock = std::chrono::steady_clock;
    auto t0 = clock::now();

    std::string q = req.has_param("q") ? req.get_param_value("q") : "";
    if (q.empty()) {
        send_json(res, 400, error_envelope(400, "MissingRequiredQueryParameter",
                  "A required query parameter was not specified for this request."));
        return;
    }

    std::optional<GeoPoint> point;
    if (!parse_point_params(req, point)) {
        send_json(res, 400, error_envelope(400, "InvalidQueryParameterValue",
                  "An invalid value was specified for one of the query parameters in the request URI."));
        return;
    }

    auto results = engine.suggest(q, point);

    auto t1 = clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    // Quoted and escaped so control characters in q cannot split the log line
    std::cerr << "[suggest] q=" << json(q).dump(-1, ' ', true, json::error_handler_t::replace)
              << " mode=" << (point ? "distance" : "population")
              << " results=" << results.size() << " time=" << ms << "ms\n";

    // No match is reported as 404 with an empty list
    send_json(res, results.empty() ? 404 : 200, suggestions_to_json(results));
}

void handle_health(const Engine& engine, httplib::Response& res) {
    enable_cors(res);
    json j;
    j["ok"] = engine.ready();
    j["places"] = engine.place_count();
    j["max_results"] = engine.max_results;
    send_json(res, engine.ready() ? 200 : 503, j);
}

void handle_invalid_path(httplib::Response& res) {
    enable_cors(res);
    send_json(res, 404, error_envelope(404, "InvalidPath", "Invalid path."));
}

void register_routes(httplib::Server& svr, const Engine& engine) {
    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        std::cerr << "[exception] " << req.method << " " << req.path << " : " << what << "\n";
        enable_cors(res);
        send_json(res, 500, error_envelope(500, "InternalError", what));
    });

    // Requests that matched no route get the InvalidPath envelope
    svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404 && res.body.empty()) handle_invalid_path(res);
    });

    // CORS preflight handler (OPTIONS) for all routes
    svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        enable_cors(res);
        res.status = 204;
    });

    svr.Get("/suggestions", [&engine](const httplib::Request& req, httplib::Response& res) {
        handle_suggestions(engine, req, res);
    });

    svr.Get("/health", [&engine](const httplib::Request&, httplib::Response& res) {
        handle_health(engine, res);
    });

    auto invalid = [](const httplib::Request&, httplib::Response& res) { handle_invalid_path(res); };
    svr.Get(R"(.*)", invalid);
    svr.Post(R"(.*)", invalid);
    svr.Put(R"(.*)", invalid);
    svr.Delete(R"(.*)", invalid);
    svr.Patch(R"(.*)", invalid);
}

} // namespace geosuggest
