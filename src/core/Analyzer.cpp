#include "phonomatch/Analyzer.hpp"

#include <cctype>

namespace phonomatch {

namespace {

std::string stripPunct(const std::string& word) {
    size_t begin = 0;
    size_t end = word.size();
    while (begin < end && std::ispunct(static_cast<unsigned char>(word[begin]))) ++begin;
    while (end > begin && std::ispunct(static_cast<unsigned char>(word[end - 1]))) --end;
    return word.substr(begin, end - begin);
}

} // namespace

std::vector<std::string> Analyzer::words(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (current.empty()) return;
        auto word = stripPunct(current);
        if (!word.empty()) tokens.push_back(std::move(word));
        current.clear();
    };

    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            flush();
        } else {
            current.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    flush();

    return tokens;
}

std::string Analyzer::normalize(const std::string& text) {
    std::string out;
    for (const auto& w : words(text)) {
        if (!out.empty()) out.push_back(' ');
        out += w;
    }
    return out;
}

} // namespace phonomatch
