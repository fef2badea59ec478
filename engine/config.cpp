#include "config.h"
#include <iostream>
#include <stdexcept>

static bool parseCount(const std::string& s, size_t& out) {
    if (s.empty()) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    try {
        out = (size_t)std::stoull(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool parseArgs(int argc, char** argv, Config& cfg, std::string& err) {
    if (argc < 2) { err = "missing command"; return false; }

    std::string cmd = argv[1];
    std::vector<std::string> pos;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        auto next = [&](std::string& v) {
            if (i + 1 >= argc) { err = a + " needs a value"; return false; }
            v = argv[++i];
            return true;
        };
        std::string v;
        if (a == "--debug") cfg.debug = true;
        else if (a == "--window") {
            if (!next(v) || !parseCount(v, cfg.window) || cfg.window == 0) {
                if (err.empty()) err = "bad --window value: " + v;
                return false;
            }
        } else if (a == "--limit") {
            size_t n = 0;
            if (!next(v) || !parseCount(v, n)) {
                if (err.empty()) err = "bad --limit value: " + v;
                return false;
            }
            cfg.pageSize = n;
            cfg.mongo.limit = (int64_t)n;
        } else if (a == "--url-field") {
            if (!next(cfg.mongo.urlField)) return false;
        } else if (a == "--text-field") {
            if (!next(cfg.mongo.textField)) return false;
        } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            err = "unknown option " + a;
            return false;
        } else pos.push_back(a);
    }

    if (cmd == "index") {
        if (pos.size() != 2) { err = "index needs <corpus_root> <index_file>"; return false; }
        cfg.command = Command::INDEX;
        cfg.corpusRoot = pos[0];
        cfg.indexPath = pos[1];
    } else if (cmd == "search") {
        if (pos.size() != 2) { err = "search needs <index_file> <corpus_root>"; return false; }
        cfg.command = Command::SEARCH;
        cfg.indexPath = pos[0];
        cfg.corpusRoot = pos[1];
    } else if (cmd == "query") {
        if (pos.size() < 3) { err = "query needs <index_file> <corpus_root> <query...>"; return false; }
        cfg.command = Command::QUERY;
        cfg.indexPath = pos[0];
        cfg.corpusRoot = pos[1];
        for (size_t i = 2; i < pos.size(); i++) {
            if (i > 2) cfg.query += ' ';
            cfg.query += pos[i];
        }
    } else if (cmd == "mongo") {
        if (pos.size() != 4) { err = "mongo needs <uri> <db> <collection> <index_file>"; return false; }
        cfg.command = Command::MONGO;
        cfg.mongo.uri = pos[0];
        cfg.mongo.database = pos[1];
        cfg.mongo.collection = pos[2];
        cfg.indexPath = pos[3];
    } else {
        err = "unknown command " + cmd;
        return false;
    }
    return true;
}

void usage(const char* prog) {
    std::cerr
        << "Usage:\n"
        << "  " << prog << " index  <corpus_root> <index_file> [--debug]\n"
        << "  " << prog << " search <index_file> <corpus_root> [--window N] [--limit N] [--debug]\n"
        << "  " << prog << " query  <index_file> <corpus_root> <query...> [--window N] [--limit N]\n"
        << "  " << prog << " mongo  <mongo_uri> <db> <collection> <index_file> [--limit N]\n"
        << "                 [--url-field F] [--text-field F]\n\n"
        << "Examples:\n"
        << "  " << prog << " index data/bbc index.txt\n"
        << "  " << prog << " query index.txt data/bbc '(oil OR gas) AND europe'\n"
        << "  " << prog << " mongo mongodb://localhost:27017 crawler pages index.txt --limit 50000\n";
}
