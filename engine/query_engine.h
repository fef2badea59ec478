#pragma once
#include <string>
#include <vector>
#include "inverted_index.h"

struct SearchResult {
    std::string documentId;
    double relevance = 0.0;
    std::vector<double> zscores;   // one per query term, query order
    std::string snippet;
};

class QueryEngine {
public:
    enum class TokType { TERM, AND, OR, LPAREN, RPAREN };
    struct Tok { TokType type; std::string val; };

    static constexpr size_t kDefaultWindow = 80;

    explicit QueryEngine(const InvertedIndex& idx, size_t window = kDefaultWindow)
        : idx_(idx), window_(window) {}

    void setDebug(bool on) { debug_ = on; }

    // Ranked, snippet-annotated matches. Never throws; empty on any failure
    // or when the index is not loaded.
    std::vector<SearchResult> search(const std::string& query) const;

    // Unranked matching document ids, ascending.
    std::vector<std::string> match(const std::string& query) const;
    std::vector<SearchResult> rank(const std::vector<std::string>& docs, const std::string& query) const;

    std::string snippet(const std::string& docId, const std::string& query) const {
        return snippet(docId, query, window_);
    }
    std::string snippet(const std::string& docId, const std::string& query, size_t window) const;

    static std::vector<Tok> lex(const std::string& q);
    static std::vector<Tok> withImplicitAnd(const std::vector<Tok>& toks);
    static std::vector<Tok> toRpn(const std::vector<Tok>& toks);
    std::vector<std::string> evalRpn(const std::vector<Tok>& rpn) const;

    static std::vector<std::string> queryTerms(const std::string& q);
    static std::string highlight(const std::string& excerpt, const std::vector<std::string>& terms);
    static std::string toString(const std::vector<Tok>& toks);

private:
    const InvertedIndex& idx_;
    size_t window_;
    bool debug_ = false;

    static bool isOp(TokType t);
    static int prec(TokType t);

    static std::vector<std::string> opAnd(const std::vector<std::string>& a, const std::vector<std::string>& b);
    static std::vector<std::string> opOr (const std::vector<std::string>& a, const std::vector<std::string>& b);
};
