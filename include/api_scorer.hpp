#pragma once

#include "api_types.hpp"

namespace geosuggest {

// Fraction of the matched name covered by the query, clamped to [0,1].
// An exact full-name match is 1.0.
double coverage(const Candidate& c);

// Round to two decimal places for display stability
double round_score(double s);

// Displayed confidence of a candidate: round_score(coverage(c))
double score(const Candidate& c);

} // namespace geosuggest
