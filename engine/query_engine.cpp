#include "query_engine.h"
#include "tokenizer.h"
#include <algorithm>
#include <cctype>
#include <iostream>

bool QueryEngine::isOp(TokType t){ return t==TokType::AND||t==TokType::OR; }
int  QueryEngine::prec(TokType t){ return (t==TokType::AND)?2:(t==TokType::OR)?1:0; }

std::vector<std::string> QueryEngine::opAnd(const std::vector<std::string>& a, const std::vector<std::string>& b){
    std::vector<std::string> out; out.reserve(std::min(a.size(), b.size()));
    size_t i=0,j=0;
    while(i<a.size()&&j<b.size()){
        if(a[i]==b[j]){ out.push_back(a[i]); i++; j++; }
        else if(a[i]<b[j]) i++; else j++;
    }
    return out;
}
std::vector<std::string> QueryEngine::opOr(const std::vector<std::string>& a, const std::vector<std::string>& b){
    std::vector<std::string> out; out.reserve(a.size()+b.size());
    size_t i=0,j=0;
    while(i<a.size()||j<b.size()){
        if(j==b.size()||(i<a.size()&&a[i]<b[j])) out.push_back(a[i++]);
        else if(i==a.size()||b[j]<a[i]) out.push_back(b[j++]);
        else { out.push_back(a[i]); i++; j++; }
    }
    return out;
}

static std::string upperAscii(std::string s){
    for(char& c: s) if((unsigned char)c<128) c=(char)std::toupper((unsigned char)c);
    return s;
}

// Quotes keep a segment (spaces and parentheses included) as one token.
std::vector<QueryEngine::Tok> QueryEngine::lex(const std::string& q) {
    std::vector<std::string> raw;
    std::string buf;
    bool quoted = false;

    auto flush = [&](){
        std::string t = Tokenizer::trim(buf);
        if(!t.empty()) raw.push_back(std::move(t));
        buf.clear();
    };

    for(char c: q){
        if(c=='"'){ quoted=!quoted; flush(); }
        else if((c=='('||c==')') && !quoted){ flush(); raw.push_back(std::string(1,c)); }
        else if(std::isspace((unsigned char)c) && !quoted) flush();
        else buf.push_back(c);
    }
    flush();

    std::vector<Tok> out;
    for(const auto& t: raw){
        auto up = upperAscii(t);
        if(up=="AND") out.push_back({TokType::AND,{}});
        else if(up=="OR") out.push_back({TokType::OR,{}});
        else if(t=="(") out.push_back({TokType::LPAREN,{}});
        else if(t==")") out.push_back({TokType::RPAREN,{}});
        else {
            auto term = Tokenizer::normalizeTerm(t);
            if(!term.empty()) out.push_back({TokType::TERM, term});
        }
    }
    return out;
}

std::vector<QueryEngine::Tok> QueryEngine::withImplicitAnd(const std::vector<Tok>& toks) {
    std::vector<Tok> norm;
    for(size_t i=0;i<toks.size();i++){
        norm.push_back(toks[i]);
        if(i+1<toks.size()){
            auto a=toks[i].type, b=toks[i+1].type;
            bool left  = (a==TokType::TERM || a==TokType::RPAREN);
            bool right = (b==TokType::TERM || b==TokType::LPAREN);
            if(left && right) norm.push_back({TokType::AND,{}});
        }
    }
    return norm;
}

// Unmatched ')' just drains the stack; unmatched '(' is dropped at the end.
std::vector<QueryEngine::Tok> QueryEngine::toRpn(const std::vector<Tok>& toks) {
    std::vector<Tok> out, st;
    for(auto& tk: toks){
        if(tk.type==TokType::TERM) out.push_back(tk);
        else if(isOp(tk.type)){
            while(!st.empty() && isOp(st.back().type) && prec(st.back().type)>=prec(tk.type)){
                out.push_back(st.back()); st.pop_back();
            }
            st.push_back(tk);
        } else if(tk.type==TokType::LPAREN) st.push_back(tk);
        else if(tk.type==TokType::RPAREN){
            while(!st.empty() && st.back().type!=TokType::LPAREN){ out.push_back(st.back()); st.pop_back(); }
            if(!st.empty() && st.back().type==TokType::LPAREN) st.pop_back();
        }
    }
    while(!st.empty()){
        if(st.back().type!=TokType::LPAREN) out.push_back(st.back());
        st.pop_back();
    }
    return out;
}

// Operators without two operands are skipped.
std::vector<std::string> QueryEngine::evalRpn(const std::vector<Tok>& rpn) const {
    std::vector<std::vector<std::string>> st;
    for(auto& tk: rpn){
        if(tk.type==TokType::TERM){
            std::vector<std::string> docs;
            for(const auto& kv: idx_.postings(tk.val)) docs.push_back(kv.first);
            st.push_back(std::move(docs));
        } else if(isOp(tk.type)){
            if(st.size()<2) continue;
            auto b=std::move(st.back()); st.pop_back();
            auto a=std::move(st.back()); st.pop_back();
            st.push_back(tk.type==TokType::AND ? opAnd(a,b) : opOr(a,b));
        }
    }
    return st.empty()?std::vector<std::string>{}:std::move(st.back());
}

std::string QueryEngine::toString(const std::vector<Tok>& toks) {
    std::string s;
    for(const auto& tk: toks){
        if(!s.empty()) s += ' ';
        switch(tk.type){
        case TokType::TERM:   s += tk.val; break;
        case TokType::AND:    s += "AND"; break;
        case TokType::OR:     s += "OR"; break;
        case TokType::LPAREN: s += "("; break;
        case TokType::RPAREN: s += ")"; break;
        }
    }
    return s;
}

std::vector<std::string> QueryEngine::queryTerms(const std::string& q) {
    std::vector<std::string> terms;
    for(const auto& tk: lex(q)) if(tk.type==TokType::TERM) terms.push_back(tk.val);
    return terms;
}

std::vector<std::string> QueryEngine::match(const std::string& query) const {
    if(!idx_.isLoaded()) return {};
    auto rpn = toRpn(withImplicitAnd(lex(query)));
    if(debug_) std::cerr << "[debug] rpn: " << toString(rpn) << "\n";
    return evalRpn(rpn);
}

// Relevance is the mean of the non-zero z-scores of the query terms.
std::vector<SearchResult> QueryEngine::rank(const std::vector<std::string>& docs, const std::string& query) const {
    auto terms = queryTerms(query);

    std::vector<SearchResult> results;
    results.reserve(docs.size());
    for(const auto& doc: docs){
        SearchResult r;
        r.documentId = doc;
        double sum = 0.0;
        size_t n = 0;
        for(const auto& t: terms){
            double z = idx_.zscore(t, doc);
            r.zscores.push_back(z);
            if(z != 0.0){ sum += z; n++; }
        }
        r.relevance = n ? sum / (double)n : 0.0;
        results.push_back(std::move(r));
    }

    std::stable_sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b){
        return a.relevance > b.relevance;
    });
    return results;
}

std::vector<SearchResult> QueryEngine::search(const std::string& query) const {
    if(!idx_.isLoaded()) return {};
    try {
        auto results = rank(match(query), query);
        for(auto& r: results) r.snippet = snippet(r.documentId, query);
        return results;
    } catch(const std::exception& e) {
        std::cerr << "[error] query '" << query << "' failed: " << e.what() << "\n";
        return {};
    }
}

// Wraps every case-insensitive occurrence of each term, one term after
// another. A later term can match inside markup added for an earlier one.
std::string QueryEngine::highlight(const std::string& excerpt, const std::vector<std::string>& terms) {
    std::string cur = excerpt;
    for(const auto& term: terms){
        if(term.empty()) continue;
        std::string needle = Tokenizer::lower(term);
        std::string lowered = Tokenizer::lower(cur);
        std::string out;
        out.reserve(cur.size() + 16);
        size_t pos = 0, hit;
        while((hit = lowered.find(needle, pos)) != std::string::npos){
            out.append(cur, pos, hit - pos);
            out += "<mark>";
            out.append(cur, hit, needle.size());
            out += "</mark>";
            pos = hit + needle.size();
        }
        out.append(cur, pos, std::string::npos);
        cur = std::move(out);
    }
    return cur;
}

std::string QueryEngine::snippet(const std::string& docId, const std::string& query, size_t window) const {
    const std::string* text = idx_.text(docId);
    if(!text || text->empty()) return "";

    auto terms = queryTerms(query);
    std::string lowered = Tokenizer::lower(*text);

    size_t best = std::string::npos;
    size_t bestLen = 0;
    for(const auto& t: terms){
        size_t pos = lowered.find(Tokenizer::lower(t));
        if(pos != std::string::npos && (best == std::string::npos || pos < best)){
            best = pos;
            bestLen = t.size();
        }
    }

    if(best == std::string::npos){
        std::string head = text->substr(0, 2 * window);
        return text->size() > 2 * window ? head + "..." : head;
    }

    size_t begin = best > window ? best - window : 0;
    size_t end = std::min(text->size(), best + bestLen + window);
    std::string out = highlight(text->substr(begin, end - begin), terms);
    if(begin > 0) out = "..." + out;
    if(end < text->size()) out += "...";
    return out;
}
