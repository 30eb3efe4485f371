#include "api_matcher.hpp"

#include <algorithm>
#include <unordered_map>

#include "textutil.hpp"

namespace geosuggest {

// True if entry a is a better match for its record than b
static bool better_entry(const PrefixIndex::Entry& a, const PrefixIndex::Entry& b) {
    if (a.kind != b.kind) return (uint8_t)a.kind < (uint8_t)b.kind;
    return a.key_length < b.key_length;
}

std::vector<Candidate> match(const Gazetteer& gazetteer, const std::string& query_norm) {
    std::vector<Candidate> out;
    if (query_norm.empty()) return out;

    std::vector<PrefixIndex::Entry> hits;
    gazetteer.index().collect(query_norm, hits);
    if (hits.empty()) return out;

    // Keep the best entry per record
    std::unordered_map<uint32_t, PrefixIndex::Entry> best;
    best.reserve(hits.size());
    for (const auto& h : hits) {
        auto it = best.find(h.record_id);
        if (it == best.end()) best.emplace(h.record_id, h);
        else if (better_entry(h, it->second)) it->second = h;
    }

    const uint32_t qlen = utf8_length(query_norm);

    out.reserve(best.size());
    for (const auto& kv : best) {
        Candidate c;
        c.record_id = kv.first;
        c.kind = kv.second.kind;
        c.matched_length = qlen;
        c.key_length = kv.second.key_length;
        out.push_back(c);
    }

    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
        return a.record_id < b.record_id;
    });
    return out;
}

} // namespace geosuggest
