#include "api_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace geosuggest {

double coverage(const Candidate& c) {
    if (c.key_length == 0) return 0.0;
    double s = (double)c.matched_length / (double)c.key_length;
    return std::min(1.0, std::max(0.0, s));
}

double round_score(double s) {
    return std::round(s * 100.0) / 100.0;
}

double score(const Candidate& c) {
    return round_score(coverage(c));
}

} // namespace geosuggest
