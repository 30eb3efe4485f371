#pragma once

#include <optional>
#include <string>
#include <vector>

#include "api_gazetteer.hpp"
#include "api_ranker.hpp"
#include "api_types.hpp"

namespace geosuggest {

// Distance mode iff a finite point is supplied, population mode otherwise
RankMode select_rank_mode(const std::optional<GeoPoint>& point);

// normalize -> match -> rank -> top-K -> score.
// Pure function of its inputs; safe to call concurrently on one gazetteer.
std::vector<Suggestion> suggest(const Gazetteer& gazetteer,
                                const std::string& query,
                                const std::optional<GeoPoint>& point,
                                size_t max_results);

// What the host holds: the loaded gazetteer and the configured K.
struct Engine {
    GazetteerPtr gazetteer;
    size_t max_results = DEFAULT_MAX_RESULTS;

    // Loads the gazetteer once. Returns false on LoadError (see report.error).
    bool load(const fs::path& source, LoadReport& report);

    bool ready() const { return gazetteer != nullptr; }
    size_t place_count() const { return gazetteer ? gazetteer->size() : 0; }

    std::vector<Suggestion> suggest(const std::string& query,
                                    const std::optional<GeoPoint>& point) const;
};

} // namespace geosuggest
