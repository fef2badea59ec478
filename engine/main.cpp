#include <iostream>
#include <string>
#include <vector>
#include <chrono>

#include "config.h"
#include "inverted_index.h"
#include "mongo_source.h"
#include "search_context.h"

#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>

static mongocxx::instance g_mongo_instance{};

static void printResults(const SearchContext& ctx, const std::vector<SearchResult>& hits, size_t limit) {
    std::cout << "hits: " << hits.size() << "\n";
    for (const auto& r : SearchContext::page(hits, 0, limit)) {
        std::cout << "  [" << r.relevance << "] " << r.documentId << "  " << ctx.title(r.documentId) << "\n";
        std::cout << "      " << r.snippet << "\n";
    }
    if (limit && hits.size() > limit) {
        std::cout << "  ... (" << (hits.size() - limit) << " more)\n";
    }
}

static int runIndex(const Config& cfg) {
    InvertedIndex index;
    auto t0 = std::chrono::steady_clock::now();
    size_t n = index.ingestCorpus(cfg.corpusRoot);
    auto t1 = std::chrono::steady_clock::now();

    double sec = std::chrono::duration<double>(t1 - t0).count();
    std::cerr << "Index build time: " << sec << " sec\n";
    if (sec > 0) std::cerr << "Speed: " << (n / sec) << " docs/sec\n";

    index.save(cfg.indexPath);
    return 0;
}

static int runMongo(const Config& cfg) {
    InvertedIndex index;
    MongoSource source(cfg.mongo);
    source.ingest(index);
    index.save(cfg.indexPath);
    return 0;
}

static int runSearch(const Config& cfg) {
    SearchContext ctx(cfg);
    ctx.ensureLoaded();

    if (cfg.command == Command::QUERY) {
        printResults(ctx, ctx.search(cfg.query), cfg.pageSize);
        return 0;
    }

    GlobalStats st = ctx.stats();
    std::cout << "Search ready: " << st.totalDocuments << " docs, " << st.distinctTerms << " terms.\n";
    std::cout << "Syntax: AND OR, parentheses, \"quoted phrases\". Implicit AND between terms.\n";
    std::cout << "  :suggest <prefix>   list indexed terms\n";
    std::cout << "  :open <doc id>      print a document\n";
    std::cout << "Ctrl+D to exit.\n";

    std::string q;
    while (std::cout << "> " && std::getline(std::cin, q)) {
        if (q.compare(0, 9, ":suggest ") == 0) {
            for (const auto& t : ctx.suggest(q.substr(9), 20)) std::cout << "  " << t << "\n";
            continue;
        }
        if (q.compare(0, 6, ":open ") == 0) {
            std::string id = q.substr(6);
            std::cout << ctx.title(id) << "\n\n" << ctx.text(id) << "\n";
            continue;
        }
        printResults(ctx, ctx.search(q), cfg.pageSize);
    }
    return 0;
}

int main(int argc, char** argv) {
    Config cfg;
    std::string err;
    if (!parseArgs(argc, argv, cfg, err)) {
        std::cerr << "error: " << err << "\n\n";
        usage(argv[0]);
        return 1;
    }

    try {
        switch (cfg.command) {
        case Command::INDEX:  return runIndex(cfg);
        case Command::MONGO:  return runMongo(cfg);
        case Command::SEARCH:
        case Command::QUERY:  return runSearch(cfg);
        }
    } catch (const NotFoundError& e) {
        std::cerr << "[error] " << e.what() << "\n";
    } catch (const mongocxx::exception& e) {
        std::cerr << "[error] mongo: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
    }
    return 1;
}
