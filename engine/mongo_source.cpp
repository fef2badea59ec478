#include "mongo_source.h"
#include "tokenizer.h"

#include <iostream>

#include <mongocxx/client.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/options/find.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

bool MongoSource::extract(const bsoncxx::document::view& d, const MongoConfig& cfg,
                          std::string& id, std::string& text) {
    auto itUrl = d.find(cfg.urlField);
    auto itTxt = d.find(cfg.textField);
    if (itUrl == d.end() || itTxt == d.end()) return false;
    if (itUrl->type() != bsoncxx::type::k_utf8) return false;
    if (itTxt->type() != bsoncxx::type::k_utf8) return false;

    id = itUrl->get_utf8().value.to_string();
    text = Tokenizer::trim(itTxt->get_utf8().value.to_string());
    return !id.empty() && !text.empty();
}

bool MongoSource::add(InvertedIndex& idx, const bsoncxx::document::view& d, const MongoConfig& cfg) {
    std::string id, text;
    if (!extract(d, cfg, id, text)) return false;

    if (idx.metadata(id) != nullptr) {
        std::cerr << "[warn] duplicate " << cfg.urlField << " skipped: " << id << "\n";
        return false;
    }
    if (!PostingsTable::storableId(id)) {
        std::cerr << "[warn] " << cfg.urlField << " cannot be stored in the index, skipped: " << id << "\n";
        return false;
    }

    idx.ingestDocument(id, text);
    return true;
}

size_t MongoSource::ingest(InvertedIndex& idx) const {
    mongocxx::client client{ mongocxx::uri{cfg_.uri} };
    auto coll = client[cfg_.database][cfg_.collection];

    auto filter = make_document(
        kvp(cfg_.textField, make_document(kvp("$type", "string"))),
        kvp(cfg_.urlField,  make_document(kvp("$type", "string")))
    );

    mongocxx::options::find opts;
    opts.projection(make_document(
        kvp(cfg_.urlField, 1),
        kvp(cfg_.textField, 1),
        kvp("_id", 0)
    ));
    if (cfg_.limit > 0) opts.limit(cfg_.limit);

    idx.reset();
    size_t docs = 0;
    auto cursor = coll.find(filter.view(), opts);

    for (auto&& d : cursor) {
        if (!add(idx, d, cfg_)) continue;
        docs++;

        if (docs % 2000 == 0) {
            std::cerr << "Indexed docs: " << docs << "\r" << std::flush;
        }
    }

    idx.finalize();
    std::cerr << "\nIndexed: " << docs << " docs from " << cfg_.database << "." << cfg_.collection << "\n";
    return docs;
}
