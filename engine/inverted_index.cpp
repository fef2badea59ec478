#include "inverted_index.h"
#include "tokenizer.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

static bool readFileAll(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

static bool hasTxtExtension(const fs::path& p) {
    return Tokenizer::lower(p.extension().string()) == ".txt";
}

const std::vector<std::string>& InvertedIndex::defaultCategories() {
    static const std::vector<std::string> cats = {
        "business", "entertainment", "politics", "sport", "tech"
    };
    return cats;
}

void InvertedIndex::reset() {
    tree_.clear();
    postings_.clear();
    texts_.clear();
    meta_.clear();
    order_.clear();
    stats_ = GlobalStats{};
    loaded_ = false;
}

void InvertedIndex::ingestDocument(const std::string& id, const std::string& text) {
    if (!PostingsTable::storableId(id)) throw FormatError("document id cannot be stored: " + id);

    auto tokens = Tokenizer::tokenize(text);

    if (meta_.find(id) == meta_.end()) order_.push_back(id);
    texts_[id] = text;

    std::unordered_map<std::string, uint32_t> tf;
    tf.reserve(tokens.size());
    for (const auto& t : tokens) tf[t]++;

    meta_[id] = DocumentMeta{text.size(), tokens.size(), tf.size()};

    for (const auto& kv : tf) {
        tree_.insert(kv.first, id);
        postings_.add(kv.first, id, kv.second);
    }

    stats_.totalDocuments++;
    stats_.totalTokens += tokens.size();
}

size_t InvertedIndex::ingestCorpus(const std::string& root) {
    return ingestCorpus(root, defaultCategories());
}

size_t InvertedIndex::ingestCorpus(const std::string& root, const std::vector<std::string>& categories) {
    std::error_code ec;
    if (!fs::exists(root, ec)) throw NotFoundError("corpus root not found: " + root);

    reset();
    size_t docs = 0;
    std::cerr << "Indexing corpus " << root << "\n";

    for (const auto& category : categories) {
        fs::path dir = fs::path(root) / category;
        if (!fs::is_directory(dir, ec)) {
            std::cerr << "[warn] missing category folder: " << category << "\n";
            continue;
        }

        std::vector<fs::path> files;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code fec;
            if (it->is_regular_file(fec) && hasTxtExtension(it->path())) files.push_back(it->path());
        }
        if (ec) {
            std::cerr << "[error] cannot list " << dir.string() << ": " << ec.message() << "\n";
            continue;
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            std::string id = category + "/" + file.filename().string();
            if (!PostingsTable::storableId(id)) {
                std::cerr << "[warn] skipping " << file.string() << ": name cannot be stored in the index\n";
                continue;
            }
            std::string raw;
            if (!readFileAll(file, raw)) {
                std::cerr << "[error] cannot read " << file.string() << "\n";
                continue;
            }
            std::string content = Tokenizer::trim(raw);
            if (content.empty()) continue;

            ingestDocument(id, content);
            docs++;
            if (docs % 100 == 0) std::cerr << "Indexed docs: " << docs << "\r" << std::flush;
        }
    }

    finalize();
    std::cerr << "\nIndexed: " << docs << " docs, " << stats_.distinctTerms << " terms\n";
    return docs;
}

void InvertedIndex::finalize() {
    stats_.distinctTerms = postings_.size();
    loaded_ = true;
}

const Postings& InvertedIndex::postings(const std::string& term) const {
    static const Postings empty;
    if (auto p = postings_.find(term)) return *p;
    return empty;
}

double InvertedIndex::zscore(const std::string& term, const std::string& docId) const {
    const Postings* p = postings_.find(term);
    if (!p || p->empty()) return 0.0;

    double n = (double)p->size();
    double sum = 0.0;
    for (const auto& kv : *p) sum += kv.second;
    double mean = sum / n;

    double var = 0.0;
    for (const auto& kv : *p) var += (kv.second - mean) * (kv.second - mean);
    var /= n;
    if (var <= 0.0) return 0.0;

    auto it = p->find(docId);
    double tf = it == p->end() ? 0.0 : (double)it->second;
    return (tf - mean) / std::sqrt(var);
}

std::string InvertedIndex::title(const std::string& docId) const {
    if (const std::string* t = text(docId)) {
        std::istringstream in(*t);
        std::string line;
        while (std::getline(in, line)) {
            line = Tokenizer::trim(line);
            if (!line.empty()) return line;
        }
    }
    return fs::path(docId).filename().string();
}

const std::string* InvertedIndex::text(const std::string& docId) const {
    auto it = texts_.find(docId);
    return it == texts_.end() ? nullptr : &it->second;
}

const DocumentMeta* InvertedIndex::metadata(const std::string& docId) const {
    auto it = meta_.find(docId);
    return it == meta_.end() ? nullptr : &it->second;
}

void InvertedIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot open index file for writing: " + path);

    ordered_json stats;
    stats["total_documents"] = stats_.totalDocuments;
    stats["total_tokens"] = stats_.totalTokens;
    stats["distinct_terms"] = stats_.distinctTerms;

    ordered_json meta = ordered_json::object();
    for (const auto& id : order_) {
        auto it = meta_.find(id);
        if (it == meta_.end()) continue;
        ordered_json m;
        m["size"] = it->second.size;
        m["word_count"] = it->second.wordCount;
        m["unique_words"] = it->second.uniqueWords;
        meta[id] = std::move(m);
    }

    out << "# GLOBAL_STATS\n" << stats.dump() << "\n";
    out << "# DOCUMENT_METADATA\n" << meta.dump() << "\n";
    out << "# DOCUMENTS\n" << ordered_json(order_).dump() << "\n";
    out << "# POSTINGS\n";

    postings_.write(out);

    out.flush();
    if (!out) throw std::runtime_error("failed writing index file: " + path);
    std::cerr << "Index saved: " << path << "\n";
}

bool InvertedIndex::load(const std::string& path, const std::string& corpusRoot) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return false;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "[error] cannot open index file: " << path << "\n";
        return false;
    }

    reset();
    try {
        parse(in, corpusRoot);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load index " << path << ": " << e.what() << "\n";
        reset();
        return false;
    }

    loaded_ = true;
    std::cerr << "Index loaded: " << stats_.totalDocuments << " docs, "
              << stats_.distinctTerms << " terms\n";
    return true;
}

void InvertedIndex::parse(std::istream& in, const std::string& corpusRoot) {
    enum class Section { NONE, STATS, META, DOCS, POSTINGS };
    Section mode = Section::NONE;

    json stats = json::object();
    std::vector<std::string> docsList;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.empty() || line[0] == '#') {
            if (line == "# GLOBAL_STATS") mode = Section::STATS;
            else if (line == "# DOCUMENT_METADATA") mode = Section::META;
            else if (line == "# DOCUMENTS") mode = Section::DOCS;
            else if (line == "# POSTINGS") mode = Section::POSTINGS;
            continue;
        }

        switch (mode) {
        case Section::STATS:
            stats = json::parse(line);
            if (!stats.is_object()) throw FormatError("GLOBAL_STATS is not an object");
            break;
        case Section::META: {
            json meta = json::parse(line);
            if (!meta.is_object()) throw FormatError("DOCUMENT_METADATA is not an object");
            for (const auto& item : meta.items()) {
                const json& m = item.value();
                meta_[item.key()] = DocumentMeta{
                    m.value("size", (size_t)0),
                    m.value("word_count", (size_t)0),
                    m.value("unique_words", (size_t)0)
                };
            }
            break;
        }
        case Section::DOCS:
            docsList = json::parse(line).get<std::vector<std::string>>();
            break;
        case Section::POSTINGS: {
            std::string term = postings_.readLine(line);
            if (const Postings* p = postings_.find(term))
                for (const auto& kv : *p) tree_.insert(term, kv.first);
            break;
        }
        case Section::NONE:
            break;
        }
    }
    if (in.bad()) throw std::runtime_error("read error");

    order_ = docsList;
    for (const auto& id : order_) {
        std::string raw;
        if (!readFileAll(fs::path(corpusRoot) / id, raw)) {
            std::cerr << "[warn] cannot open document " << id << "\n";
            continue;
        }
        texts_[id] = Tokenizer::trim(raw);
    }

    size_t known = meta_.empty() ? docsList.size() : meta_.size();
    stats_.totalDocuments = std::max(stats.value("total_documents", (size_t)0), known);
    stats_.totalTokens = stats.value("total_tokens", (size_t)0);
    stats_.distinctTerms = postings_.size();
}
