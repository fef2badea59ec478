#include "postings_table.h"
#include <algorithm>
#include <cctype>
#include <ostream>

static size_t nextPow2(size_t x) { size_t p=1; while (p<x) p<<=1; return p; }

uint64_t PostingsTable::fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) { h ^= (uint64_t)c; h *= 1099511628211ull; }
    return h;
}

PostingsTable::PostingsTable(size_t initialCapPow2)
    : initialCap_(nextPow2(std::max<size_t>(8, initialCapPow2))) {
    slots_.resize(initialCap_);
}

void PostingsTable::clear() {
    slots_.assign(initialCap_, Slot{});
    used_ = 0;
}

// Slot holding term, or the empty slot where it would go.
size_t PostingsTable::locate(const std::string& term, uint64_t h) const {
    size_t mask = slots_.size() - 1;
    for (size_t i = (size_t)h & mask;; i = (i + 1) & mask) {
        const Slot& s = slots_[i];
        if (!s.used || (s.hash == h && s.term == term)) return i;
    }
}

// Doubles capacity; stored hashes spare rehashing the terms.
void PostingsTable::grow() {
    std::vector<Slot> old(slots_.size() * 2);
    old.swap(slots_);
    for (auto& s : old) {
        if (!s.used) continue;
        slots_[locate(s.term, s.hash)] = std::move(s);
    }
}

void PostingsTable::add(const std::string& term, const std::string& docId, uint32_t tf) {
    if (tf == 0) throw std::invalid_argument("zero frequency for term " + term);

    if ((used_ + 1) * 10 > slots_.size() * 7) grow();

    uint64_t h = fnv1a(term);
    Slot& s = slots_[locate(term, h)];
    if (!s.used) {
        s.used = true;
        s.hash = h;
        s.term = term;
        used_++;
    }
    s.docs[docId] += tf;
}

const Postings* PostingsTable::find(const std::string& term) const {
    const Slot& s = slots_[locate(term, fnv1a(term))];
    return s.used ? &s.docs : nullptr;
}

bool PostingsTable::storableId(const std::string& docId) {
    return !docId.empty() && docId.find_first_of(";\r\n") == std::string::npos;
}

std::string PostingsTable::formatLine(const std::string& term) const {
    std::string line = term + '|';
    if (const Postings* p = find(term)) {
        bool first = true;
        for (const auto& kv : *p) {
            if (!first) line += ';';
            line += kv.first;
            line += ':';
            line += std::to_string(kv.second);
            first = false;
        }
    }
    return line;
}

void PostingsTable::write(std::ostream& out) const {
    std::vector<const std::string*> terms;
    terms.reserve(used_);
    for (const auto& s : slots_) if (s.used && !s.docs.empty()) terms.push_back(&s.term);
    std::sort(terms.begin(), terms.end(), [](const std::string* a, const std::string* b){ return *a < *b; });
    for (const auto* t : terms) out << formatLine(*t) << '\n';
}

std::string PostingsTable::readLine(const std::string& line) {
    size_t bar = line.find('|');
    if (bar == std::string::npos || bar == 0) throw FormatError("bad postings line: " + line);

    std::string term = line.substr(0, bar);
    size_t pos = bar + 1;
    while (pos < line.size()) {
        size_t end = line.find(';', pos);
        if (end == std::string::npos) end = line.size();
        std::string pair = line.substr(pos, end - pos);
        pos = end + 1;

        // ids may contain ':', the frequency follows the last one
        size_t colon = pair.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == pair.size())
            throw FormatError("bad posting '" + pair + "' for term " + term);

        std::string tfText = pair.substr(colon + 1);
        for (unsigned char c : tfText)
            if (!std::isdigit(c)) throw FormatError("bad frequency '" + tfText + "' for term " + term);
        unsigned long long tf = std::stoull(tfText);
        if (tf == 0 || tf > UINT32_MAX) throw FormatError("frequency out of range for term " + term);

        add(term, pair.substr(0, colon), (uint32_t)tf);
    }
    return term;
}
