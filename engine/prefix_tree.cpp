#include "prefix_tree.h"

static const uint32_t kNoNode = UINT32_MAX;

PrefixTree::PrefixTree() {
    nodes_.emplace_back();
}

void PrefixTree::clear() {
    nodes_.clear();
    free_.clear();
    nodes_.emplace_back();
    terms_ = 0;
}

size_t PrefixTree::commonPrefix(const std::string& label, const std::string& s, size_t from) {
    size_t i = 0;
    while (i < label.size() && from + i < s.size() && label[i] == s[from + i]) i++;
    return i;
}

PrefixTree::NodeId PrefixTree::allocNode() {
    if (!free_.empty()) {
        NodeId id = free_.back();
        free_.pop_back();
        nodes_[id] = Node{};
        return id;
    }
    nodes_.emplace_back();
    return (NodeId)(nodes_.size() - 1);
}

void PrefixTree::freeNode(NodeId id) {
    nodes_[id] = Node{};
    free_.push_back(id);
}

// Siblings never share a first byte, so at most one child can match.
PrefixTree::Children::const_iterator PrefixTree::childFor(NodeId node, char first) const {
    const auto& kids = nodes_[node].children;
    auto it = kids.lower_bound(std::string(1, first));
    if (it != kids.end() && it->first[0] == first) return it;
    return kids.end();
}

void PrefixTree::insert(const std::string& term, const std::string& docId) {
    if (term.empty()) return;

    NodeId node = kRoot;
    size_t pos = 0;

    while (pos < term.size()) {
        auto it = childFor(node, term[pos]);
        if (it == nodes_[node].children.end()) {
            NodeId leaf = allocNode();
            nodes_[node].children.emplace(term.substr(pos), leaf);
            node = leaf;
            pos = term.size();
            break;
        }

        std::string label = it->first;
        NodeId child = it->second;
        size_t common = commonPrefix(label, term, pos);

        if (common == label.size()) {
            node = child;
            pos += common;
            continue;
        }

        // split: parent -label[0,common)-> mid -label[common..)-> child
        NodeId mid = allocNode();
        auto& kids = nodes_[node].children;
        kids.erase(label);
        kids.emplace(label.substr(0, common), mid);
        nodes_[mid].children.emplace(label.substr(common), child);
        node = mid;
        pos += common;
    }

    Node& n = nodes_[node];
    if (!n.terminal) {
        n.terminal = true;
        terms_++;
    }
    n.docs.insert(docId);
}

PrefixTree::NodeId PrefixTree::descend(const std::string& term, std::vector<Step>* path) const {
    NodeId node = kRoot;
    size_t pos = 0;
    while (pos < term.size()) {
        auto it = childFor(node, term[pos]);
        if (it == nodes_[node].children.end()) return kNoNode;
        const std::string& label = it->first;
        if (term.compare(pos, label.size(), label) != 0) return kNoNode;
        if (path) path->push_back({node, label});
        node = it->second;
        pos += label.size();
    }
    return node;
}

const PrefixTree::DocSet* PrefixTree::find(const std::string& term) const {
    if (term.empty()) return nullptr;
    NodeId node = descend(term, nullptr);
    if (node == kNoNode || !nodes_[node].terminal) return nullptr;
    return &nodes_[node].docs;
}

bool PrefixTree::remove(const std::string& term, const std::string& docId) {
    if (term.empty()) return false;

    std::vector<Step> path;
    NodeId node = descend(term, &path);
    if (node == kNoNode) return false;

    Node& n = nodes_[node];
    if (!n.terminal || n.docs.erase(docId) == 0) return false;
    if (!n.docs.empty()) return true;

    n.terminal = false;
    terms_--;
    collapse(path, node);
    return true;
}

// Walks back up from a node that just lost its terminal flag: dead leaves
// are pruned, and a non-terminal node left with one child is merged into
// its parent edge.
void PrefixTree::collapse(std::vector<Step>& path, NodeId node) {
    while (!path.empty() && !nodes_[node].terminal) {
        Step step = path.back();
        path.pop_back();
        auto& parentKids = nodes_[step.parent].children;

        if (nodes_[node].children.empty()) {
            parentKids.erase(step.label);
            freeNode(node);
            node = step.parent;
            continue;
        }

        if (nodes_[node].children.size() == 1) {
            auto only = nodes_[node].children.begin();
            std::string merged = step.label + only->first;
            NodeId grandchild = only->second;
            parentKids.erase(step.label);
            parentKids.emplace(merged, grandchild);
            freeNode(node);
        }
        break;
    }
}

void PrefixTree::collect(NodeId node, std::string& acc, size_t limit,
                         std::vector<std::string>& out) const {
    if (limit && out.size() >= limit) return;
    const Node& n = nodes_[node];
    if (n.terminal) out.push_back(acc);
    for (const auto& kv : n.children) {
        if (limit && out.size() >= limit) return;
        size_t mark = acc.size();
        acc += kv.first;
        collect(kv.second, acc, limit, out);
        acc.resize(mark);
    }
}

std::vector<std::string> PrefixTree::complete(const std::string& prefix, size_t limit) const {
    std::vector<std::string> out;
    NodeId node = kRoot;
    std::string acc;
    size_t pos = 0;

    while (pos < prefix.size()) {
        auto it = childFor(node, prefix[pos]);
        if (it == nodes_[node].children.end()) return out;
        const std::string& label = it->first;
        size_t common = commonPrefix(label, prefix, pos);
        if (pos + common < prefix.size() && common < label.size()) return out;
        acc += label;
        node = it->second;
        pos += common;
        if (common < label.size()) break;   // prefix ends inside this edge
    }

    collect(node, acc, limit, out);
    return out;
}

bool PrefixTree::checkNode(NodeId node, bool isRoot) const {
    const Node& n = nodes_[node];
    if (n.terminal != !n.docs.empty()) return false;
    if (!isRoot && !n.terminal && n.children.empty()) return false;

    const std::string* prev = nullptr;
    for (const auto& kv : n.children) {
        if (kv.first.empty()) return false;
        // labels are sorted, so a shared first byte would show up between neighbours
        if (prev && (*prev)[0] == kv.first[0]) return false;
        prev = &kv.first;
        if (!checkNode(kv.second, false)) return false;
    }
    return true;
}

bool PrefixTree::checkInvariants() const {
    return checkNode(kRoot, true);
}
