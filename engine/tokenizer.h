#pragma once
#include <string>
#include <vector>

class Tokenizer {
public:
    // Document terms: lowercased ASCII alphanumeric runs longer than two
    // characters, in text order, duplicates kept.
    static std::vector<std::string> tokenize(const std::string& text);

    // Query term: lowercased, punctuation removed (ASCII and the common
    // UTF-8 quotes, dashes and marks), whitespace and word characters
    // (letters, digits, '_', other non-ASCII text) kept.
    static std::string normalizeTerm(const std::string& token);

    static std::string lower(const std::string& s);
    static std::string trim(const std::string& s);

    static constexpr size_t kMinTermChars = 3;

private:
    enum class CpType { Word, Space, Other };

    static CpType classify(unsigned char c);
    static unsigned char asciiLower(unsigned char c);
    static bool isAsciiWord(unsigned char c);
    // Byte length of the UTF-8 punctuation sequence at s[i], 0 if none.
    static size_t utf8PunctLen(const std::string& s, size_t i);
};
