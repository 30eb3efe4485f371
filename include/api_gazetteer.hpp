#pragma once

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "api_prefix_index.hpp"
#include "api_types.hpp"

namespace geosuggest {

// At most this many malformed-row warnings are printed per load
constexpr size_t MAX_LOAD_WARNINGS = 20;

// Immutable catalog of places plus its prefix index.
// Built once by load(); shared read-only between concurrent queries.
class Gazetteer {
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    // Only reachable through load()
    explicit Gazetteer(PrivateTag) {}

    // Load a tab-separated gazetteer file. Returns nullptr on LoadError
    // (report.error says why). Malformed rows are skipped and counted.
    static std::shared_ptr<const Gazetteer> load(const fs::path& source, LoadReport& report);

    // Same as above, reading from an already opened stream.
    static std::shared_ptr<const Gazetteer> load(std::istream& in,
                                                 LoadReport& report,
                                                 const std::string& source_name = "<stream>");

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const std::vector<PlaceRecord>& records() const { return records_; }
    const PlaceRecord& record(uint32_t id) const { return records_[id]; }
    const PrefixIndex& index() const { return index_; }

private:
    void add_record(PlaceRecord rec, const std::string& extra_alias);

    std::vector<PlaceRecord> records_;
    PrefixIndex index_;
};

using GazetteerPtr = std::shared_ptr<const Gazetteer>;

} // namespace geosuggest
