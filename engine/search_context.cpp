#include "search_context.h"
#include <algorithm>
#include <iostream>

SearchContext::SearchContext(const Config& cfg)
    : cfg_(cfg), engine_(index_, cfg.window) {
    engine_.setDebug(cfg.debug);
}

void SearchContext::ensureLoaded() {
    std::call_once(once_, [this]() {
        std::unique_lock<std::shared_mutex> lock(mu_);
        if (index_.load(cfg_.indexPath, cfg_.corpusRoot)) return;
        std::cerr << "No usable index at " << cfg_.indexPath << ", building from " << cfg_.corpusRoot << "\n";
        rebuildLocked();
    });
}

size_t SearchContext::rebuild() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    return rebuildLocked();
}

size_t SearchContext::rebuildLocked() {
    size_t n = index_.ingestCorpus(cfg_.corpusRoot);
    index_.save(cfg_.indexPath);
    return n;
}

std::vector<SearchResult> SearchContext::search(const std::string& query) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return engine_.search(query);
}

std::string SearchContext::title(const std::string& docId) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return index_.title(docId);
}

std::string SearchContext::text(const std::string& docId) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    const std::string* t = index_.text(docId);
    return t ? *t : std::string();
}

std::vector<std::string> SearchContext::suggest(const std::string& prefix, size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return index_.tree().complete(prefix, limit);
}

GlobalStats SearchContext::stats() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return index_.stats();
}

bool SearchContext::ready() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return index_.isLoaded();
}

std::vector<SearchResult> SearchContext::page(const std::vector<SearchResult>& results,
                                              size_t offset, size_t limit) {
    if (offset >= results.size()) return {};
    size_t end = limit ? std::min(results.size(), offset + limit) : results.size();
    return std::vector<SearchResult>(results.begin() + offset, results.begin() + end);
}
