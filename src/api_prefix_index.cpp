#include "api_prefix_index.hpp"

namespace geosuggest {

PrefixIndex::PrefixIndex() {
    clear();
}

void PrefixIndex::clear() {
    nodes_.clear();
    nodes_.push_back(Node{}); // root
    keys_ = 0;
}

bool PrefixIndex::empty() const {
    return keys_ == 0;
}

void PrefixIndex::insert(const std::string& key_norm, const Entry& entry) {
    if (key_norm.empty()) return;

    uint32_t node = 0; // root
    for (unsigned char uc : key_norm) {
        char c = (char)uc;
        auto it = nodes_[node].next.find(c);
        if (it == nodes_[node].next.end()) {
            uint32_t new_node = (uint32_t)nodes_.size();
            nodes_.push_back(Node{});
            nodes_[node].next.emplace(c, new_node);
            node = new_node;
        } else {
            node = it->second;
        }
    }

    nodes_[node].entries.push_back(entry);
    keys_++;
}

bool PrefixIndex::lookup_node(const std::string& prefix_norm, uint32_t& node_id) const {
    node_id = 0;
    for (unsigned char uc : prefix_norm) {
        char c = (char)uc;
        auto it = nodes_[node_id].next.find(c);
        if (it == nodes_[node_id].next.end()) return false;
        node_id = it->second;
    }
    return true;
}

void PrefixIndex::collect(const std::string& prefix_norm, std::vector<Entry>& out) const {
    if (prefix_norm.empty() || empty()) return;

    uint32_t start = 0;
    if (!lookup_node(prefix_norm, start)) return;

    // Iterative DFS over the subtree; the trie can be deep for long names
    std::vector<uint32_t> stack;
    stack.push_back(start);
    while (!stack.empty()) {
        uint32_t node = stack.back();
        stack.pop_back();

        const Node& n = nodes_[node];
        out.insert(out.end(), n.entries.begin(), n.entries.end());
        for (const auto& kv : n.next) stack.push_back(kv.second);
    }
}

} // namespace geosuggest
