#pragma once

#include <string>
#include <vector>

#include "api_gazetteer.hpp"
#include "api_types.hpp"

namespace geosuggest {

// Returns one Candidate per place whose name or alias starts with the query,
// or has a word starting with it. query_norm must already be normalized.
//
// When a place matches through several keys only the best one is kept:
// name prefix > alias prefix > name word > alias word, then the shortest key.
// Output is in catalog order. An empty query yields no candidates.
std::vector<Candidate> match(const Gazetteer& gazetteer, const std::string& query_norm);

} // namespace geosuggest
