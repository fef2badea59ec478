#pragma once
#include <cstdint>
#include <iosfwd>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// A persisted index line could not be understood.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// DocumentId -> term frequency, ordered by id.
using Postings = std::map<std::string, uint32_t>;

// term -> Postings, open addressing. Also owns the on-disk postings line
// "term|doc1:tf1;doc2:tf2;..." so writing and reading stay symmetric.
class PostingsTable {
public:
    explicit PostingsTable(size_t initialCapPow2 = 1 << 12);

    // Counts tf more occurrences of term in docId. tf must be >= 1.
    void add(const std::string& term, const std::string& docId, uint32_t tf);
    const Postings* find(const std::string& term) const;

    size_t size() const { return used_; }
    void clear();

    // Ids with ';' or line breaks cannot be written to a postings line.
    static bool storableId(const std::string& docId);

    std::string formatLine(const std::string& term) const;
    // All non-empty terms, ascending, one line each.
    void write(std::ostream& out) const;
    // Adds the postings of one line; returns its term. Throws FormatError.
    std::string readLine(const std::string& line);

private:
    struct Slot {
        bool used = false;
        uint64_t hash = 0;
        std::string term;
        Postings docs;
    };

    static uint64_t fnv1a(const std::string& s);
    size_t locate(const std::string& term, uint64_t h) const;
    void grow();

    std::vector<Slot> slots_;
    size_t used_ = 0;
    size_t initialCap_ = 0;
};
