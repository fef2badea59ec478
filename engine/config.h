#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct MongoConfig {
    std::string uri;
    std::string database;
    std::string collection;
    std::string urlField = "url";
    std::string textField = "text";
    int64_t limit = 0;
};

enum class Command { INDEX, SEARCH, QUERY, MONGO };

struct Config {
    Command command = Command::SEARCH;
    std::string corpusRoot;
    std::string indexPath;
    std::string query;           // QUERY only
    MongoConfig mongo;           // MONGO only
    size_t window = 80;
    size_t pageSize = 20;
    bool debug = false;
};

// Fills cfg from argv. On failure returns false and sets err.
bool parseArgs(int argc, char** argv, Config& cfg, std::string& err);
void usage(const char* prog);
