#pragma once
#include <string>

#include <bsoncxx/document/view.hpp>

#include "config.h"
#include "inverted_index.h"

// Feeds documents of a MongoDB collection into an index. The url field is
// the document id, the text field its raw text.
// A mongocxx::instance must be alive while ingest() runs.
class MongoSource {
public:
    explicit MongoSource(MongoConfig cfg) : cfg_(std::move(cfg)) {}

    // Rebuilds idx from the collection; returns the number of documents.
    size_t ingest(InvertedIndex& idx) const;

    // False for documents lacking string id/text fields or with blank text.
    static bool extract(const bsoncxx::document::view& d, const MongoConfig& cfg,
                        std::string& id, std::string& text);

    // Ingests one collection document. Skips (with a warning) ids already
    // in idx and ids the index file cannot hold.
    static bool add(InvertedIndex& idx, const bsoncxx::document::view& d, const MongoConfig& cfg);

private:
    MongoConfig cfg_;
};
