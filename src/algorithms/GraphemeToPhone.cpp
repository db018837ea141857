#include "phonomatch/algorithms/GraphemeToPhone.hpp"
#include "phonomatch/Analyzer.hpp"

#include <cctype>
#include <string>

namespace phonomatch::algo {

namespace {

struct Rule {
    const char* graphemes;
    const char* phones[2]; // second slot unused when null
};

// Checked in order; longer graphemes come first.
const Rule kRules[] = {
    {"tch", {"tS"}}, {"igh", {"aI"}}, {"sch", {"s", "k"}},
    {"th", {"D"}}, {"sh", {"S"}}, {"ch", {"tS"}}, {"ph", {"f"}}, {"wh", {"w"}},
    {"ng", {"N"}}, {"ck", {"k"}}, {"qu", {"k", "w"}}, {"gh", {"g"}},
    {"ee", {"i"}}, {"ea", {"i"}}, {"ie", {"i"}}, {"oo", {"u"}}, {"ou", {"aU"}},
    {"ow", {"oU"}}, {"oa", {"oU"}}, {"ai", {"eI"}}, {"ay", {"eI"}}, {"ey", {"eI"}},
    {"oi", {"OI"}}, {"oy", {"OI"}}, {"au", {"O"}}, {"aw", {"O"}}, {"er", {"3"}},
    {"ir", {"3"}}, {"ur", {"3"}}, {"ar", {"A", "r"}}, {"or", {"O", "r"}},
    {"a", {"{"}}, {"e", {"E"}}, {"i", {"I"}}, {"o", {"A"}}, {"u", {"V"}},
    {"b", {"b"}}, {"d", {"d"}}, {"f", {"f"}}, {"g", {"g"}}, {"h", {"h"}},
    {"j", {"dZ"}}, {"k", {"k"}}, {"l", {"l"}}, {"m", {"m"}}, {"n", {"n"}},
    {"p", {"p"}}, {"q", {"k"}}, {"r", {"r"}}, {"s", {"s"}}, {"t", {"t"}},
    {"v", {"v"}}, {"w", {"w"}}, {"x", {"k", "s"}}, {"z", {"z"}},
};

bool startsWith(const std::string& s, size_t pos, const char* prefix) {
    for (size_t i = 0; prefix[i] != '\0'; ++i) {
        if (pos + i >= s.size() || s[pos + i] != prefix[i]) return false;
    }
    return true;
}

bool isSoftening(char c) {
    return c == 'e' || c == 'i' || c == 'y';
}

void appendWord(const std::string& word, std::vector<std::string>& out) {
    std::string letters;
    for (unsigned char ch : word) {
        if (ch >= 'a' && ch <= 'z') letters.push_back(static_cast<char>(ch));
    }

    size_t pos = 0;
    while (pos < letters.size()) {
        const char c = letters[pos];
        // doubled consonants sound once
        if (pos > 0 && c == letters[pos - 1] && c != 'e' && c != 'o') {
            ++pos;
            continue;
        }
        if (c == 'c') {
            bool soft = pos + 1 < letters.size() && isSoftening(letters[pos + 1]);
            out.push_back(soft ? "s" : "k");
            ++pos;
            continue;
        }
        if (c == 'y') {
            out.push_back(pos == 0 ? "j" : "i");
            ++pos;
            continue;
        }
        // silent final e after a consonant
        if (c == 'e' && pos + 1 == letters.size() && pos > 1) {
            ++pos;
            continue;
        }
        bool matched = false;
        for (const auto& rule : kRules) {
            if (!startsWith(letters, pos, rule.graphemes)) continue;
            for (const char* p : rule.phones) {
                if (p) out.emplace_back(p);
            }
            pos += std::char_traits<char>::length(rule.graphemes);
            matched = true;
            break;
        }
        if (!matched) ++pos;
    }
}

} // namespace

std::vector<std::string> graphemesToPhones(const std::string& text) {
    std::vector<std::string> phones;
    for (const auto& word : Analyzer::words(text)) {
        appendWord(word, phones);
    }
    return phones;
}

} // namespace phonomatch::algo
