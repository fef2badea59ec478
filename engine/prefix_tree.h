#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

// Compact prefix tree: chains of single-child nodes are stored as one
// edge with a multi-character label. Nodes live in an arena and refer
// to each other by index; slot 0 is the root.
//
// Invariants after every insert/remove:
//   - sibling labels share no common prefix (their first bytes differ);
//   - every non-root node is terminal (non-empty document set) or has
//     at least one child.
class PrefixTree {
public:
    using DocSet = std::set<std::string>;

    PrefixTree();

    void insert(const std::string& term, const std::string& docId);
    bool remove(const std::string& term, const std::string& docId);

    // nullptr when term was never inserted (or all its documents removed).
    const DocSet* find(const std::string& term) const;
    bool contains(const std::string& term) const { return find(term) != nullptr; }

    // Stored terms starting with prefix, lexicographic order. limit 0 = all.
    std::vector<std::string> complete(const std::string& prefix, size_t limit = 0) const;

    void clear();

    size_t nodeCount() const { return nodes_.size() - free_.size(); }
    size_t termCount() const { return terms_; }
    bool checkInvariants() const;

private:
    using NodeId = uint32_t;
    using Children = std::map<std::string, NodeId>;

    struct Node {
        Children children;
        DocSet docs;
        bool terminal = false;
    };

    struct Step {
        NodeId parent;
        std::string label;
    };

    static constexpr NodeId kRoot = 0;

    static size_t commonPrefix(const std::string& label, const std::string& s, size_t from);

    NodeId allocNode();
    void freeNode(NodeId id);
    Children::const_iterator childFor(NodeId node, char first) const;
    NodeId descend(const std::string& term, std::vector<Step>* path) const;
    void collapse(std::vector<Step>& path, NodeId node);
    void collect(NodeId node, std::string& acc, size_t limit, std::vector<std::string>& out) const;
    bool checkNode(NodeId node, bool isRoot) const;

    std::vector<Node> nodes_;
    std::vector<NodeId> free_;
    size_t terms_ = 0;
};
