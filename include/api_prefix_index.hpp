#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "api_types.hpp"

namespace geosuggest {

// Trie over normalized place keys.
//
// Notes:
// - Keys are inserted already normalized (see normalize_text).
// - Every node that ends a key stores the entries for that key, so a prefix
//   lookup walks |prefix| nodes and then collects the subtree below it.
// - A place can own several keys (name, aliases, word starts of both).
class PrefixIndex {
public:
    struct Entry {
        uint32_t record_id = 0;
        MatchKind kind = MatchKind::NamePrefix;
        uint32_t key_length = 0; // code points of the full normalized name/alias
    };

    PrefixIndex();

    void clear();
    bool empty() const;
    size_t key_count() const { return keys_; }

    void insert(const std::string& key_norm, const Entry& entry);

    // Appends every entry whose key begins with prefix_norm.
    // An empty prefix collects nothing.
    void collect(const std::string& prefix_norm, std::vector<Entry>& out) const;

private:
    struct Node {
        std::unordered_map<char, uint32_t> next;
        std::vector<Entry> entries;
    };

    std::vector<Node> nodes_;
    size_t keys_ = 0;

    bool lookup_node(const std::string& prefix_norm, uint32_t& node_id) const;
};

} // namespace geosuggest
