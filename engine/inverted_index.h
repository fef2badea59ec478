#pragma once
#include <iosfwd>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "postings_table.h"
#include "prefix_tree.h"

// Corpus root (or a persisted index) is missing.
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DocumentMeta {
    size_t size = 0;         // bytes of raw text
    size_t wordCount = 0;    // terms kept by the tokenizer
    size_t uniqueWords = 0;
};

struct GlobalStats {
    size_t totalDocuments = 0;
    size_t totalTokens = 0;
    size_t distinctTerms = 0;
};

class InvertedIndex {
public:
    InvertedIndex() = default;

    // Not idempotent: ingesting the same id twice adds its frequencies twice.
    // Throws FormatError for ids PostingsTable::storableId rejects.
    void ingestDocument(const std::string& id, const std::string& text);

    // Rebuilds the index from <root>/<category>/*.txt. Document ids are
    // "<category>/<file name>". Throws NotFoundError if root is missing.
    size_t ingestCorpus(const std::string& root);
    size_t ingestCorpus(const std::string& root, const std::vector<std::string>& categories);

    // Recomputes distinct_terms and marks the index as ready for queries.
    void finalize();

    const Postings& postings(const std::string& term) const;
    double zscore(const std::string& term, const std::string& docId) const;

    void save(const std::string& path) const;
    bool load(const std::string& path, const std::string& corpusRoot);
    void reset();

    std::string title(const std::string& docId) const;
    const std::string* text(const std::string& docId) const;
    const DocumentMeta* metadata(const std::string& docId) const;
    const std::vector<std::string>& documents() const { return order_; }

    const GlobalStats& stats() const { return stats_; }
    const PrefixTree& tree() const { return tree_; }
    size_t termsCount() const { return postings_.size(); }
    bool isLoaded() const { return loaded_; }

    static const std::vector<std::string>& defaultCategories();

private:
    void parse(std::istream& in, const std::string& corpusRoot);

    PrefixTree tree_;
    PostingsTable postings_;
    std::unordered_map<std::string, std::string> texts_;
    std::map<std::string, DocumentMeta> meta_;
    std::vector<std::string> order_;
    GlobalStats stats_;
    bool loaded_ = false;
};
