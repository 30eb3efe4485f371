#include "api_ranker.hpp"

#include <algorithm>
#include <cmath>

namespace geosuggest {

static constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

double haversine_km(const GeoPoint& a, const GeoPoint& b) {
    const double lat1 = a.latitude * DEG_TO_RAD;
    const double lat2 = b.latitude * DEG_TO_RAD;
    const double dlat = lat2 - lat1;
    const double dlon = (b.longitude - a.longitude) * DEG_TO_RAD;

    double h = std::sin(dlat * 0.5) * std::sin(dlat * 0.5)
             + std::cos(lat1) * std::cos(lat2)
             * std::sin(dlon * 0.5) * std::sin(dlon * 0.5);
    // Rounding can push h just past 1 near antipodes
    h = std::min(1.0, std::max(0.0, h));
    const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));

    return EARTH_RADIUS_KM * c;
}

std::vector<Candidate> rank(const Gazetteer& gazetteer,
                            std::vector<Candidate> candidates,
                            const RankMode& mode) {
    auto tie_break = [&](const Candidate& a, const Candidate& b) {
        const std::string& na = gazetteer.record(a.record_id).name_norm;
        const std::string& nb = gazetteer.record(b.record_id).name_norm;
        if (na != nb) return na < nb;
        return a.record_id < b.record_id;
    };

    if (mode.is_distance()) {
        for (auto& c : candidates) {
            const PlaceRecord& r = gazetteer.record(c.record_id);
            c.distance_km = haversine_km(mode.point, GeoPoint{r.latitude, r.longitude});
        }
        std::stable_sort(candidates.begin(), candidates.end(),
                         [&](const Candidate& a, const Candidate& b) {
            if (a.distance_km != b.distance_km) return a.distance_km < b.distance_km;
            return tie_break(a, b);
        });
    } else {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [&](const Candidate& a, const Candidate& b) {
            uint64_t pa = gazetteer.record(a.record_id).population;
            uint64_t pb = gazetteer.record(b.record_id).population;
            if (pa != pb) return pa > pb;
            return tie_break(a, b);
        });
    }
    return candidates;
}

} // namespace geosuggest
