#pragma once

#include <vector>

#include "api_gazetteer.hpp"
#include "api_types.hpp"

namespace geosuggest {

// How candidates are ordered. The two modes are mutually exclusive.
struct RankMode {
    enum class Kind { Population, Distance };

    Kind kind = Kind::Population;
    GeoPoint point; // used only in Distance mode

    static RankMode by_population() { return RankMode{}; }
    static RankMode by_distance(const GeoPoint& p) { return RankMode{Kind::Distance, p}; }

    bool is_distance() const { return kind == Kind::Distance; }
};

/**
 * Haversine great-circle distance on a sphere of mean Earth radius.
 * @param a  First point, decimal degrees
 * @param b  Second point, decimal degrees
 * @return Distance in kilometers
 */
double haversine_km(const GeoPoint& a, const GeoPoint& b);

// Orders candidates: nearest first in Distance mode (distance_km is filled in),
// most populous first in Population mode. Ties go to the normalized primary
// name, then to catalog order.
std::vector<Candidate> rank(const Gazetteer& gazetteer,
                            std::vector<Candidate> candidates,
                            const RankMode& mode);

} // namespace geosuggest
