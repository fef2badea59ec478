#include "tokenizer.h"
#include <cctype>

unsigned char Tokenizer::asciiLower(unsigned char c) {
    return c < 128 ? (unsigned char)std::tolower(c) : c;
}

bool Tokenizer::isAsciiWord(unsigned char c) {
    return c < 128 && std::isalnum(c) != 0;
}

Tokenizer::CpType Tokenizer::classify(unsigned char c) {
    if (c >= 128) return CpType::Word;   // UTF-8 lead/continuation bytes
    if (std::isalnum(c) || c == '_') return CpType::Word;
    if (std::isspace(c)) return CpType::Space;
    return CpType::Other;
}

size_t Tokenizer::utf8PunctLen(const std::string& s, size_t i) {
    auto at = [&](size_t k) { return k < s.size() ? (unsigned char)s[k] : 0u; };
    unsigned char b0 = at(i), b1 = at(i + 1), b2 = at(i + 2);

    // U+00A0..U+00BF minus the letter-like and numeric signs
    if (b0 == 0xC2 && b1 >= 0xA0 && b1 <= 0xBF) {
        switch (b1) {
            case 0xAA: case 0xB2: case 0xB3: case 0xB5: case 0xB9:
            case 0xBA: case 0xBC: case 0xBD: case 0xBE:
                return 0;
            default:
                return 2;
        }
    }
    // U+200B..U+205E: zero-width marks, dashes, curly quotes, bullets
    if (b0 == 0xE2 && b1 == 0x80 && b2 >= 0x8B && b2 <= 0xBF) return 3;
    if (b0 == 0xE2 && b1 == 0x81 && b2 >= 0x80 && b2 <= 0x9E) return 3;
    // U+3000..U+303F: CJK punctuation
    if (b0 == 0xE3 && b1 == 0x80 && b2 >= 0x80 && b2 <= 0xBF) return 3;
    return 0;
}

std::string Tokenizer::lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back((char)asciiLower(c));
    return out;
}

std::string Tokenizer::trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) {
    std::vector<std::string> out;
    out.reserve(256);

    std::string token;
    token.reserve(64);

    auto flushToken = [&]() {
        if (token.size() >= kMinTermChars) out.push_back(token);
        token.clear();
    };

    for (unsigned char c : text) {
        if (isAsciiWord(c)) token.push_back((char)asciiLower(c));
        else flushToken();
    }
    flushToken();

    return out;
}

std::string Tokenizer::normalizeTerm(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (size_t i = 0; i < token.size();) {
        if (size_t n = utf8PunctLen(token, i)) { i += n; continue; }
        unsigned char c = (unsigned char)token[i++];
        if (classify(c) == CpType::Other) continue;
        out.push_back((char)asciiLower(c));
    }
    return out;
}
