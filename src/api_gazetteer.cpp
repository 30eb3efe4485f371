#include "api_gazetteer.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <unordered_set>

#include "textutil.hpp"

namespace geosuggest {

namespace {

// Column positions resolved from the header line (-1 = absent)
struct Columns {
    int name = -1;
    int aliases = -1;
    int ascii = -1;
    int lat = -1;
    int lon = -1;
    int population = -1;
    int country = -1;
    int admin = -1;

    int max_required() const { return std::max({name, lat, lon}); }
};

bool header_is(const std::string& col, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        if (col == n) return true;
    }
    return false;
}

Columns resolve_columns(const std::vector<std::string>& header) {
    Columns c;
    for (int i = 0; i < (int)header.size(); i++) {
        std::string col = to_lower_ascii(trim_copy(header[i]));
        if (c.name < 0 && header_is(col, {"name"})) c.name = i;
        else if (c.aliases < 0 && header_is(col, {"alt_name", "alternatenames", "alternate_names", "aliases"})) c.aliases = i;
        else if (c.ascii < 0 && header_is(col, {"ascii", "asciiname"})) c.ascii = i;
        else if (c.lat < 0 && header_is(col, {"lat", "latitude"})) c.lat = i;
        else if (c.lon < 0 && header_is(col, {"long", "lon", "lng", "longitude"})) c.lon = i;
        else if (c.population < 0 && header_is(col, {"population"})) c.population = i;
        else if (c.country < 0 && header_is(col, {"country", "country_code"})) c.country = i;
        else if (c.admin < 0 && header_is(col, {"admin1", "admin_region"})) c.admin = i;
    }
    return c;
}

std::string field_or_empty(const std::vector<std::string>& row, int col) {
    if (col < 0 || col >= (int)row.size()) return {};
    return trim_copy(row[col]);
}

// Parse one data row. On failure fills `why` and returns false.
bool parse_row(const std::vector<std::string>& row, const Columns& c,
               PlaceRecord& rec, std::string& ascii_name, std::string& why) {
    if ((int)row.size() <= c.max_required()) {
        why = "expected at least " + std::to_string(c.max_required() + 1) +
              " columns, got " + std::to_string(row.size());
        return false;
    }

    // Latin-1 sources are transcoded so every stored string is valid UTF-8
    rec.name = to_utf8(trim_copy(row[c.name]));
    if (rec.name.empty()) {
        why = "empty name";
        return false;
    }

    if (!parse_double(row[c.lat], rec.latitude) || rec.latitude < -90.0 || rec.latitude > 90.0) {
        why = "invalid latitude '" + trim_copy(row[c.lat]) + "'";
        return false;
    }
    if (!parse_double(row[c.lon], rec.longitude) || rec.longitude < -180.0 || rec.longitude > 180.0) {
        why = "invalid longitude '" + trim_copy(row[c.lon]) + "'";
        return false;
    }

    std::string pop = field_or_empty(row, c.population);
    if (!pop.empty() && !parse_u64(pop, rec.population)) {
        why = "invalid population '" + pop + "'";
        return false;
    }

    // Alternate names are comma-separated inside their cell
    std::string alt = field_or_empty(row, c.aliases);
    if (!alt.empty()) {
        for (auto& a : split_fields(alt, ',')) {
            std::string t = to_utf8(trim_copy(a));
            if (!t.empty()) rec.aliases.push_back(std::move(t));
        }
    }

    ascii_name = to_utf8(field_or_empty(row, c.ascii));
    rec.country_code = to_utf8(field_or_empty(row, c.country));
    rec.admin_region = to_utf8(field_or_empty(row, c.admin));
    return true;
}

bool is_word_separator(char c) {
    return c == ' ' || c == '-' || c == '\'' || c == '.' || c == '/' || c == '(' || c == ',';
}

} // namespace

void Gazetteer::add_record(PlaceRecord rec, const std::string& extra_alias) {
    const uint32_t id = (uint32_t)records_.size();
    rec.name_norm = normalize_text(rec.name);

    // Full keys first: the primary name, then aliases (the ascii spelling is
    // treated as one more alias). Duplicates within a record are indexed once.
    std::vector<std::pair<std::string, bool>> keys; // (key, is_name)
    keys.emplace_back(rec.name_norm, true);
    for (const auto& a : rec.aliases) keys.emplace_back(normalize_text(a), false);
    if (!extra_alias.empty()) keys.emplace_back(normalize_text(extra_alias), false);

    std::unordered_set<std::string> seen_full;
    std::unordered_set<std::string> seen_word;

    for (const auto& k : keys) {
        const std::string& key = k.first;
        if (key.empty() || !seen_full.insert(key).second) continue;

        PrefixIndex::Entry e;
        e.record_id = id;
        e.kind = k.second ? MatchKind::NamePrefix : MatchKind::AliasPrefix;
        e.key_length = utf8_length(key);
        index_.insert(key, e);

        // Word-start keys: every suffix that begins right after a separator
        e.kind = k.second ? MatchKind::NameWord : MatchKind::AliasWord;
        for (size_t p = 1; p < key.size(); p++) {
            if (!is_word_separator(key[p - 1]) || is_word_separator(key[p])) continue;
            std::string suffix = key.substr(p);
            if (seen_full.count(suffix) || !seen_word.insert(suffix).second) continue;
            index_.insert(suffix, e);
        }
    }

    records_.push_back(std::move(rec));
}

std::shared_ptr<const Gazetteer> Gazetteer::load(const fs::path& source, LoadReport& report) {
    report = LoadReport{};

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        report.error = "cannot open gazetteer source: " + source.string();
        std::cerr << "[gazetteer] FAILED open: " << source.string() << "\n";
        return nullptr;
    }
    return load(in, report, source.string());
}

std::shared_ptr<const Gazetteer> Gazetteer::load(std::istream& in,
                                                 LoadReport& report,
                                                 const std::string& source_name) {
    report = LoadReport{};

    // Read header line
    std::string header;
    if (!std::getline(in, header)) {
        report.error = "empty gazetteer source (no header): " + source_name;
        std::cerr << "[gazetteer] FAILED read header: " << source_name << "\n";
        return nullptr;
    }

    // Drop UTF-8 BOM and CR line endings
    if (header.size() >= 3 && header.compare(0, 3, "\xEF\xBB\xBF") == 0) header.erase(0, 3);
    if (!header.empty() && header.back() == '\r') header.pop_back();

    Columns cols = resolve_columns(split_fields(header, '\t'));
    const char* missing = nullptr;
    if (cols.name < 0) missing = "name";
    else if (cols.lat < 0) missing = "latitude";
    else if (cols.lon < 0) missing = "longitude";
    if (missing) {
        report.error = std::string("missing required column '") + missing + "' in header of " + source_name;
        std::cerr << "[gazetteer] " << report.error << "\n";
        return nullptr;
    }

    auto g = std::make_shared<Gazetteer>(PrivateTag{});

    std::string line;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim_copy(line).empty()) continue;

        report.rows++;

        PlaceRecord rec;
        std::string ascii_name;
        std::string why;
        if (!parse_row(split_fields(line, '\t'), cols, rec, ascii_name, why)) {
            report.skipped++;
            if (report.skipped <= MAX_LOAD_WARNINGS) {
                std::cerr << "[gazetteer] skipping malformed row " << source_name << ":" << line_no
                          << " (" << why << ")\n";
            }
            continue;
        }

        g->add_record(std::move(rec), ascii_name);
        report.loaded++;
    }

    if (report.skipped > MAX_LOAD_WARNINGS) {
        std::cerr << "[gazetteer] ... " << (report.skipped - MAX_LOAD_WARNINGS)
                  << " more malformed rows not shown\n";
    }

    report.keys = g->index_.key_count();

    std::cerr << "[gazetteer] source=" << source_name
              << " rows=" << report.rows
              << " loaded=" << report.loaded
              << " skipped=" << report.skipped
              << " keys=" << report.keys << "\n";

    return g;
}

} // namespace geosuggest
