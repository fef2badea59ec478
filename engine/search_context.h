#pragma once
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "config.h"
#include "inverted_index.h"
#include "query_engine.h"

// Process-wide search state, built once at startup and handed to whoever
// serves queries. Writers (load/rebuild) are exclusive; queries share.
class SearchContext {
public:
    explicit SearchContext(const Config& cfg);

    SearchContext(const SearchContext&) = delete;
    SearchContext& operator=(const SearchContext&) = delete;

    // Loads the index file, or builds it from the corpus and saves it when
    // the file is missing or unreadable. Runs once; NotFoundError from a
    // missing corpus propagates and a later call retries.
    void ensureLoaded();

    // Rebuilds from the corpus and saves. Returns the document count.
    size_t rebuild();

    std::vector<SearchResult> search(const std::string& query) const;
    std::string title(const std::string& docId) const;
    std::string text(const std::string& docId) const;
    std::vector<std::string> suggest(const std::string& prefix, size_t limit) const;
    GlobalStats stats() const;
    bool ready() const;

    static std::vector<SearchResult> page(const std::vector<SearchResult>& results,
                                          size_t offset, size_t limit);

private:
    size_t rebuildLocked();

    Config cfg_;
    InvertedIndex index_;
    QueryEngine engine_;
    mutable std::shared_mutex mu_;
    std::once_flag once_;
};
