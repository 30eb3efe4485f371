#include "api_engine.hpp"

#include <cmath>
#include <iostream>

#include "api_matcher.hpp"
#include "api_scorer.hpp"
#include "textutil.hpp"

namespace geosuggest {

RankMode select_rank_mode(const std::optional<GeoPoint>& point) {
    if (point && std::isfinite(point->latitude) && std::isfinite(point->longitude)) {
        return RankMode::by_distance(*point);
    }
    return RankMode::by_population();
}

std::vector<Suggestion> suggest(const Gazetteer& gazetteer,
                                const std::string& query,
                                const std::optional<GeoPoint>& point,
                                size_t max_results) {
    std::vector<Suggestion> out;
    if (max_results == 0) return out;

    // Same normalization as the catalog keys
    std::string q = normalize_text(query);
    if (q.empty()) return out;

    std::vector<Candidate> candidates = match(gazetteer, q);
    if (candidates.empty()) return out;

    candidates = rank(gazetteer, std::move(candidates), select_rank_mode(point));

    // Top-K, then score only what is kept
    if (candidates.size() > max_results) candidates.resize(max_results);

    out.reserve(candidates.size());
    for (const auto& c : candidates) {
        const PlaceRecord& r = gazetteer.record(c.record_id);
        Suggestion s;
        s.name = r.name;
        s.latitude = r.latitude;
        s.longitude = r.longitude;
        s.score = score(c);
        out.push_back(std::move(s));
    }
    return out;
}

bool Engine::load(const fs::path& source, LoadReport& report) {
    gazetteer = Gazetteer::load(source, report);
    if (!gazetteer) {
        std::cerr << "[engine] gazetteer not loaded: " << report.error << "\n";
        return false;
    }
    return true;
}

std::vector<Suggestion> Engine::suggest(const std::string& query,
                                        const std::optional<GeoPoint>& point) const {
    if (!gazetteer) return {};
    return geosuggest::suggest(*gazetteer, query, point, max_results);
}

} // namespace geosuggest
