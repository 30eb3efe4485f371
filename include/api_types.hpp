#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace geosuggest {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Mean Earth radius used for haversine distances (km)
constexpr double EARTH_RADIUS_KM = 6371.0;

// Default number of suggestions returned per query
constexpr size_t DEFAULT_MAX_RESULTS = 4;

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

// One row of the gazetteer. Created once at load time, never modified.
struct PlaceRecord {
    std::string name;
    std::vector<std::string> aliases;
    double latitude = 0.0;
    double longitude = 0.0;
    uint64_t population = 0; // 0 = unknown
    std::string country_code;
    std::string admin_region;

    // Normalized primary name, cached for matching and tie-breaking
    std::string name_norm;
};

// Which text of a record produced a match. Lower value = preferred.
enum class MatchKind : uint8_t {
    NamePrefix = 0,
    AliasPrefix = 1,
    NameWord = 2,
    AliasWord = 3
};

// A record matched by one query, before ranking and scoring.
struct Candidate {
    uint32_t record_id = 0;
    MatchKind kind = MatchKind::NamePrefix;
    uint32_t matched_length = 0; // code points of the normalized query
    uint32_t key_length = 0;     // code points of the normalized key it matched
    double distance_km = 0.0;    // filled by the ranker in distance mode
};

// Externally visible output of suggest()
struct Suggestion {
    std::string name;
    double latitude = 0.0;
    double longitude = 0.0;
    double score = 0.0;
};

// Counters and error text produced by a gazetteer load
struct LoadReport {
    std::string error;   // non-empty = LoadError
    size_t rows = 0;     // data rows read (header excluded)
    size_t loaded = 0;   // records kept
    size_t skipped = 0;  // malformed rows
    size_t keys = 0;     // keys inserted into the prefix index

    bool ok() const { return error.empty(); }
};

} // namespace geosuggest
