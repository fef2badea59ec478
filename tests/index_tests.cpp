#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../engine/inverted_index.h"
#include "../engine/postings_table.h"

namespace fs = std::filesystem;

static int g_failed = 0;

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE(" #cond ")\n"; \
        g_failed++; \
        return; \
    } \
} while(0)

#define ASSERT_EQ(a,b) do { \
    auto _a = (a); auto _b = (b); \
    if (!(_a == _b)) { \
        std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " ASSERT_EQ\n"; \
        std::cerr << "  left:  " << _a << "\n"; \
        std::cerr << "  right: " << _b << "\n"; \
        g_failed++; \
        return; \
    } \
} while(0)

#define ASSERT_NEAR(a,b,eps) ASSERT_TRUE(std::fabs((a) - (b)) < (eps))

static fs::path scratchDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("minisearch_index_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
}

static std::vector<std::string> readLines(const fs::path& p) {
    std::ifstream in(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static InvertedIndex buildCatsAndDogs() {
    InvertedIndex idx;
    idx.ingestDocument("a", "cats and dogs");
    idx.ingestDocument("b", "dogs everywhere");
    idx.finalize();
    return idx;
}

static void test_postings_frequencies() {
    InvertedIndex idx;
    idx.ingestDocument("d1", "Cats cats CATS dogs");
    idx.ingestDocument("d2", "dogs, dogs!");
    idx.finalize();

    ASSERT_EQ(idx.postings("cats").at("d1"), (uint32_t)3);
    ASSERT_EQ(idx.postings("cats").count("d2"), (size_t)0);
    ASSERT_EQ(idx.postings("dogs").at("d1"), (uint32_t)1);
    ASSERT_EQ(idx.postings("dogs").at("d2"), (uint32_t)2);
    ASSERT_TRUE(idx.postings("zebra").empty());
    ASSERT_TRUE(idx.postings("").empty());
}

static void test_metadata_and_stats() {
    auto idx = buildCatsAndDogs();
    auto m = idx.metadata("a");
    ASSERT_TRUE(m != nullptr);
    ASSERT_EQ(m->size, (size_t)13);
    ASSERT_EQ(m->wordCount, (size_t)3);
    ASSERT_EQ(m->uniqueWords, (size_t)3);
    ASSERT_TRUE(idx.metadata("nope") == nullptr);

    ASSERT_EQ(idx.stats().totalDocuments, (size_t)2);
    ASSERT_EQ(idx.stats().totalTokens, (size_t)5);
    ASSERT_EQ(idx.stats().distinctTerms, (size_t)4);
    ASSERT_TRUE(idx.isLoaded());
}

static void test_tree_tracks_presence() {
    auto idx = buildCatsAndDogs();
    auto docs = idx.tree().find("dogs");
    ASSERT_TRUE(docs != nullptr);
    ASSERT_EQ(docs->size(), (size_t)2);
    ASSERT_TRUE(idx.tree().find("an") == nullptr);
    ASSERT_EQ(idx.tree().termCount(), (size_t)4);
    ASSERT_TRUE(idx.tree().checkInvariants());
}

static void test_double_ingest_adds_twice() {
    InvertedIndex idx;
    idx.ingestDocument("d1", "oil gas oil");
    idx.ingestDocument("d1", "oil gas oil");
    ASSERT_EQ(idx.postings("oil").at("d1"), (uint32_t)4);
    ASSERT_EQ(idx.documents().size(), (size_t)1);
    ASSERT_EQ(idx.stats().totalDocuments, (size_t)2);
}

static void test_zscore() {
    InvertedIndex idx;
    idx.ingestDocument("x", "oil oil oil");
    idx.ingestDocument("y", "oil gas");
    idx.ingestDocument("z", "gas");
    idx.finalize();

    // oil: {x:3, y:1}, mean 2, stddev 1
    ASSERT_NEAR(idx.zscore("oil", "x"), 1.0, 1e-9);
    ASSERT_NEAR(idx.zscore("oil", "y"), -1.0, 1e-9);
    ASSERT_NEAR(idx.zscore("oil", "z"), -2.0, 1e-9);
    // gas: all frequencies equal
    ASSERT_EQ(idx.zscore("gas", "y"), 0.0);
    ASSERT_EQ(idx.zscore("unknown", "x"), 0.0);
}

static void test_zscore_single_document_is_zero() {
    auto idx = buildCatsAndDogs();
    ASSERT_EQ(idx.zscore("cats", "a"), 0.0);
}

static void test_title() {
    InvertedIndex idx;
    idx.ingestDocument("business/001.txt", "\n   \n  Ad sales boost Time Warner profit  \n\nQuarterly profits...");
    idx.ingestDocument("tech/002.txt", "   ");
    ASSERT_EQ(idx.title("business/001.txt"), std::string("Ad sales boost Time Warner profit"));
    ASSERT_EQ(idx.title("tech/002.txt"), std::string("002.txt"));
    ASSERT_EQ(idx.title("sport/missing.txt"), std::string("missing.txt"));
}

static void test_ingest_corpus() {
    auto root = scratchDir("corpus");
    writeFile(root / "business" / "b1.txt", "  Oil prices rise\n\nOil and gas markets react.  ");
    writeFile(root / "tech" / "t1.TXT", "Broadband gets faster");
    writeFile(root / "tech" / "blank.txt", " \n\t ");
    writeFile(root / "tech" / "notes.md", "markdown ignored");
    writeFile(root / "weather" / "w1.txt", "not a category");

    InvertedIndex idx;
    size_t n = idx.ingestCorpus(root.string());
    ASSERT_EQ(n, (size_t)2);
    ASSERT_EQ(idx.documents().size(), (size_t)2);
    ASSERT_EQ(idx.documents()[0], std::string("business/b1.txt"));
    ASSERT_EQ(idx.documents()[1], std::string("tech/t1.TXT"));
    ASSERT_EQ(idx.postings("oil").at("business/b1.txt"), (uint32_t)2);
    ASSERT_TRUE(idx.postings("markdown").empty());
    ASSERT_TRUE(idx.postings("category").empty());
    ASSERT_EQ(idx.title("business/b1.txt"), std::string("Oil prices rise"));
    ASSERT_EQ(*idx.text("business/b1.txt"), std::string("Oil prices rise\n\nOil and gas markets react."));
    ASSERT_TRUE(idx.isLoaded());

    // a second pass rebuilds instead of double counting
    ASSERT_EQ(idx.ingestCorpus(root.string()), (size_t)2);
    ASSERT_EQ(idx.postings("oil").at("business/b1.txt"), (uint32_t)2);
    ASSERT_EQ(idx.stats().totalDocuments, (size_t)2);
}

static void test_ingest_corpus_missing_root_throws() {
    InvertedIndex idx;
    bool thrown = false;
    try {
        idx.ingestCorpus((fs::temp_directory_path() / "minisearch_no_such_dir").string());
    } catch (const NotFoundError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_TRUE(!idx.isLoaded());
}

static void test_save_format() {
    auto dir = scratchDir("format");
    auto idx = buildCatsAndDogs();
    idx.save((dir / "index.txt").string());

    auto lines = readLines(dir / "index.txt");
    ASSERT_EQ(lines.size(), (size_t)11);
    ASSERT_EQ(lines[0], std::string("# GLOBAL_STATS"));
    ASSERT_EQ(lines[1], std::string("{\"total_documents\":2,\"total_tokens\":5,\"distinct_terms\":4}"));
    ASSERT_EQ(lines[2], std::string("# DOCUMENT_METADATA"));
    ASSERT_EQ(lines[3], std::string(
        "{\"a\":{\"size\":13,\"word_count\":3,\"unique_words\":3},"
        "\"b\":{\"size\":15,\"word_count\":2,\"unique_words\":2}}"));
    ASSERT_EQ(lines[4], std::string("# DOCUMENTS"));
    ASSERT_EQ(lines[5], std::string("[\"a\",\"b\"]"));
    ASSERT_EQ(lines[6], std::string("# POSTINGS"));
    ASSERT_EQ(lines[7], std::string("and|a:1"));
    ASSERT_EQ(lines[8], std::string("cats|a:1"));
    ASSERT_EQ(lines[9], std::string("dogs|a:1;b:1"));
    ASSERT_EQ(lines[10], std::string("everywhere|b:1"));
}

static void test_save_load_round_trip() {
    auto root = scratchDir("roundtrip");
    writeFile(root / "sport" / "s1.txt", "England beat Wales\nEngland rugby team wins again");
    writeFile(root / "sport" / "s2.txt", "Wales rugby coach resigns");
    writeFile(root / "politics" / "p1.txt", "Election campaign starts in England");

    InvertedIndex before;
    before.ingestCorpus(root.string());
    before.save((root / "index.txt").string());

    InvertedIndex after;
    ASSERT_TRUE(after.load((root / "index.txt").string(), root.string()));
    ASSERT_TRUE(after.isLoaded());
    ASSERT_TRUE(after.documents() == before.documents());
    ASSERT_EQ(after.termsCount(), before.termsCount());
    ASSERT_EQ(after.stats().totalDocuments, before.stats().totalDocuments);
    ASSERT_EQ(after.stats().totalTokens, before.stats().totalTokens);
    ASSERT_EQ(after.stats().distinctTerms, before.stats().distinctTerms);

    for (const auto& id : before.documents()) {
        ASSERT_EQ(after.metadata(id)->size, before.metadata(id)->size);
        ASSERT_EQ(after.metadata(id)->wordCount, before.metadata(id)->wordCount);
        ASSERT_EQ(after.metadata(id)->uniqueWords, before.metadata(id)->uniqueWords);
        ASSERT_EQ(*after.text(id), *before.text(id));
        ASSERT_EQ(after.title(id), before.title(id));
    }
    for (const char* term : {"england", "wales", "rugby", "election", "again"}) {
        ASSERT_TRUE(after.postings(term) == before.postings(term));
        ASSERT_EQ(after.tree().find(term)->size(), before.postings(term).size());
    }
    ASSERT_TRUE(after.tree().checkInvariants());

    // saving the loaded index reproduces the file byte for byte
    after.save((root / "index2.txt").string());
    ASSERT_TRUE(readLines(root / "index.txt") == readLines(root / "index2.txt"));
}

static void test_load_with_missing_document() {
    auto root = scratchDir("missingdoc");
    writeFile(root / "tech" / "t1.txt", "Mobile phones sell well");
    writeFile(root / "tech" / "t2.txt", "Mobile games grow");

    InvertedIndex before;
    before.ingestCorpus(root.string());
    before.save((root / "index.txt").string());
    fs::remove(root / "tech" / "t2.txt");

    InvertedIndex after;
    ASSERT_TRUE(after.load((root / "index.txt").string(), root.string()));
    ASSERT_TRUE(after.text("tech/t2.txt") == nullptr);
    ASSERT_TRUE(after.text("tech/t1.txt") != nullptr);
    ASSERT_EQ(after.postings("mobile").size(), (size_t)2);
    ASSERT_EQ(after.documents().size(), (size_t)2);
    ASSERT_EQ(after.title("tech/t2.txt"), std::string("t2.txt"));
}

static void test_load_missing_file() {
    InvertedIndex idx;
    ASSERT_TRUE(!idx.load((fs::temp_directory_path() / "minisearch_absent_index.txt").string(), "."));
    ASSERT_TRUE(!idx.isLoaded());
    ASSERT_TRUE(idx.documents().empty());
    ASSERT_EQ(idx.termsCount(), (size_t)0);
}

static void test_load_malformed_resets() {
    auto dir = scratchDir("malformed");
    const std::vector<std::string> bad = {
        "# GLOBAL_STATS\n{not json\n",
        "# DOCUMENTS\n[\"a\"]\n# POSTINGS\ncats|a:1\ndogs-without-separator\n",
        "# DOCUMENTS\n[\"a\"]\n# POSTINGS\ncats|a:x\n",
        "# DOCUMENTS\n[\"a\"]\n# POSTINGS\ncats|a:0\n",
        "# DOCUMENTS\n[\"a\"]\n# POSTINGS\ncats|a\n",
        "# DOCUMENT_METADATA\n[1,2]\n",
        "# DOCUMENTS\n{\"a\":1}\n",
    };

    for (size_t i = 0; i < bad.size(); i++) {
        auto path = dir / ("bad" + std::to_string(i) + ".txt");
        writeFile(path, bad[i]);

        auto idx = buildCatsAndDogs();
        ASSERT_TRUE(!idx.load(path.string(), dir.string()));
        ASSERT_TRUE(!idx.isLoaded());
        ASSERT_TRUE(idx.documents().empty());
        ASSERT_EQ(idx.termsCount(), (size_t)0);
        ASSERT_EQ(idx.tree().termCount(), (size_t)0);
        ASSERT_EQ(idx.stats().totalDocuments, (size_t)0);
    }
}

static void test_load_recomputes_stats() {
    auto dir = scratchDir("stats");
    writeFile(dir / "index.txt",
              "# GLOBAL_STATS\n"
              "{\"total_documents\":1,\"total_tokens\":7,\"distinct_terms\":99}\n"
              "# DOCUMENT_METADATA\n"
              "{\"x\":{\"size\":1,\"word_count\":1,\"unique_words\":1},\"y\":{\"size\":2,\"word_count\":2,\"unique_words\":2}}\n"
              "# DOCUMENTS\n"
              "[\"x\",\"y\"]\n"
              "# POSTINGS\n"
              "alpha|x:2;y:1\n"
              "empty|\n");

    InvertedIndex idx;
    ASSERT_TRUE(idx.load((dir / "index.txt").string(), dir.string()));
    ASSERT_EQ(idx.stats().totalDocuments, (size_t)2);
    ASSERT_EQ(idx.stats().totalTokens, (size_t)7);
    ASSERT_EQ(idx.stats().distinctTerms, (size_t)1);
    ASSERT_TRUE(idx.postings("empty").empty());
    ASSERT_TRUE(idx.text("x") == nullptr);
}

static void test_postings_table_lines() {
    PostingsTable table(8);
    table.add("oil", "news/b.txt", 2);
    table.add("oil", "https://news.example/a", 1);
    table.add("oil", "news/b.txt", 1);
    ASSERT_EQ(table.formatLine("oil"), std::string("oil|https://news.example/a:1;news/b.txt:3"));
    ASSERT_EQ(table.formatLine("gas"), std::string("gas|"));

    PostingsTable copy;
    ASSERT_EQ(copy.readLine(table.formatLine("oil")), std::string("oil"));
    ASSERT_TRUE(*copy.find("oil") == *table.find("oil"));

    bool thrown = false;
    try { table.add("gas", "news/b.txt", 0); } catch (const std::invalid_argument&) { thrown = true; }
    ASSERT_TRUE(thrown);
    ASSERT_TRUE(table.find("gas") == nullptr);

    thrown = false;
    try { copy.readLine("oil|a:99999999999"); } catch (const FormatError&) { thrown = true; }
    ASSERT_TRUE(thrown);
}

static void test_postings_table_grows() {
    PostingsTable table(8);
    for (int i = 0; i < 500; i++) table.add("term" + std::to_string(i), "d", (uint32_t)(i + 1));
    ASSERT_EQ(table.size(), (size_t)500);
    for (int i = 0; i < 500; i++) ASSERT_EQ(table.find("term" + std::to_string(i))->at("d"), (uint32_t)(i + 1));
    table.clear();
    ASSERT_EQ(table.size(), (size_t)0);
    ASSERT_TRUE(table.find("term7") == nullptr);
}

static void test_unstorable_ids_rejected() {
    ASSERT_TRUE(PostingsTable::storableId("https://news.example/a?x=1&y=2"));
    ASSERT_TRUE(!PostingsTable::storableId(""));
    ASSERT_TRUE(!PostingsTable::storableId("https://news.example/a;id=7"));
    ASSERT_TRUE(!PostingsTable::storableId("line\nbreak"));

    InvertedIndex idx;
    bool thrown = false;
    try {
        idx.ingestDocument("https://news.example/a;id=7", "climate report");
    } catch (const FormatError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    ASSERT_TRUE(idx.metadata("https://news.example/a;id=7") == nullptr);
    ASSERT_TRUE(idx.postings("climate").empty());
    ASSERT_EQ(idx.tree().termCount(), (size_t)0);
}

static void test_url_ids_round_trip() {
    auto dir = scratchDir("urls");
    InvertedIndex before;
    before.ingestDocument("http://news.example/b", "climate policy climate");
    before.ingestDocument("http://news.example:8080/c", "climate talks");
    before.finalize();
    before.save((dir / "index.txt").string());

    InvertedIndex after;
    ASSERT_TRUE(after.load((dir / "index.txt").string(), dir.string()));
    ASSERT_TRUE(after.postings("climate") == before.postings("climate"));
    ASSERT_EQ(after.postings("climate").at("http://news.example/b"), (uint32_t)2);
    ASSERT_EQ(after.postings("talks").at("http://news.example:8080/c"), (uint32_t)1);
}

static void test_ingest_corpus_skips_unstorable_names() {
    auto root = scratchDir("badnames");
    writeFile(root / "business" / "a;b.txt", "Oil exports fall");
    writeFile(root / "business" / "ok.txt", "Oil imports rise");

    InvertedIndex idx;
    ASSERT_EQ(idx.ingestCorpus(root.string()), (size_t)1);
    ASSERT_EQ(idx.postings("oil").size(), (size_t)1);
    ASSERT_TRUE(idx.postings("exports").empty());

    idx.save((root / "index.txt").string());
    InvertedIndex after;
    ASSERT_TRUE(after.load((root / "index.txt").string(), root.string()));
    ASSERT_EQ(after.postings("oil").at("business/ok.txt"), (uint32_t)1);
}

static void test_load_path_under_file() {
    auto dir = scratchDir("underfile");
    writeFile(dir / "plain.txt", "not a directory");

    InvertedIndex idx;
    ASSERT_TRUE(!idx.load((dir / "plain.txt" / "index.txt").string(), dir.string()));
    ASSERT_TRUE(!idx.isLoaded());
    ASSERT_TRUE(idx.documents().empty());
}

static void run(const char* name, void(*fn)()) {
    int before = g_failed;
    fn();
    if (g_failed == before) std::cerr << "[OK]   " << name << "\n";
}

int main() {
    run("postings_frequencies", test_postings_frequencies);
    run("metadata_and_stats", test_metadata_and_stats);
    run("tree_tracks_presence", test_tree_tracks_presence);
    run("double_ingest_adds_twice", test_double_ingest_adds_twice);
    run("zscore", test_zscore);
    run("zscore_single_document_is_zero", test_zscore_single_document_is_zero);
    run("title", test_title);
    run("ingest_corpus", test_ingest_corpus);
    run("ingest_corpus_missing_root_throws", test_ingest_corpus_missing_root_throws);
    run("save_format", test_save_format);
    run("save_load_round_trip", test_save_load_round_trip);
    run("load_with_missing_document", test_load_with_missing_document);
    run("load_missing_file", test_load_missing_file);
    run("load_malformed_resets", test_load_malformed_resets);
    run("load_recomputes_stats", test_load_recomputes_stats);
    run("postings_table_lines", test_postings_table_lines);
    run("postings_table_grows", test_postings_table_grows);
    run("unstorable_ids_rejected", test_unstorable_ids_rejected);
    run("url_ids_round_trip", test_url_ids_round_trip);
    run("ingest_corpus_skips_unstorable_names", test_ingest_corpus_skips_unstorable_names);
    run("load_path_under_file", test_load_path_under_file);

    if (g_failed) {
        std::cerr << "\nFAILED: " << g_failed << "\n";
        return 1;
    }
    std::cerr << "\nALL INDEX TESTS PASSED\n";
    return 0;
}
