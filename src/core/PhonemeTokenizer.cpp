#include "phonomatch/PhonemeTokenizer.hpp"
#include "phonomatch/Errors.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

namespace phonomatch {

namespace {

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool allDigits(const std::string& unit) {
    if (unit.empty()) return false;
    for (unsigned char ch : unit) {
        if (!std::isdigit(ch)) return false;
    }
    return true;
}

// Digit runs too long for int64 saturate instead of failing.
int64_t parseLevel(const std::string& unit) {
    int64_t level = 0;
    auto res = std::from_chars(unit.data(), unit.data() + unit.size(), level);
    if (res.ec == std::errc::result_out_of_range) {
        return std::numeric_limits<int64_t>::max();
    }
    return level;
}

} // namespace

const char* tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Phone: return "phone";
        case TokenKind::WordBoundary: return "word_boundary";
        case TokenKind::StressMarker: return "stress_marker";
        case TokenKind::SentenceBoundary: return "sentence_boundary";
        case TokenKind::Pause: return "pause";
        case TokenKind::Punctuation: return "punctuation";
        case TokenKind::UtteranceEnd: return "utterance_end";
    }
    return "unknown";
}

bool operator==(const Token& a, const Token& b) {
    return a.kind == b.kind && a.value == b.value && a.level == b.level;
}

Token classifyUnit(const std::string& unit) {
    Token tok;
    tok.value = unit;
    if (unit == "~") {
        tok.kind = TokenKind::UtteranceEnd;
    } else if (unit == "#") {
        tok.kind = TokenKind::WordBoundary;
    } else if (unit == ".") {
        tok.kind = TokenKind::SentenceBoundary;
    } else if (unit == ",") {
        tok.kind = TokenKind::Pause;
    } else if (unit == "!" || unit == "?") {
        tok.kind = TokenKind::Punctuation;
    } else if (allDigits(unit)) {
        tok.kind = TokenKind::StressMarker;
        tok.level = parseLevel(unit);
    } else {
        tok.kind = TokenKind::Phone;
    }
    return tok;
}

// -----------------------------------------------------------
// TokenStream
// -----------------------------------------------------------
TokenStream::TokenStream(std::string transcription) : source_(std::move(transcription)) {
    bool hasUnit = false;
    for (char c : source_) {
        if (!isSpace(c)) { hasUnit = true; break; }
    }
    if (!hasUnit) {
        throw MalformedTranscriptionError("empty transcription");
    }
}

TokenStream::const_iterator TokenStream::begin() const {
    return const_iterator(&source_, 0);
}

TokenStream::const_iterator TokenStream::end() const {
    return const_iterator();
}

TokenStream::const_iterator::const_iterator(const std::string* source, size_t pos)
    : source_(source), next_(pos), atEnd_(false) {
    advance();
}

void TokenStream::const_iterator::advance() {
    const std::string& s = *source_;
    size_t pos = next_;
    while (pos < s.size() && isSpace(s[pos])) ++pos;
    if (pos >= s.size()) {
        atEnd_ = true;
        next_ = s.size();
        return;
    }
    size_t stop = pos;
    while (stop < s.size() && !isSpace(s[stop])) ++stop;
    current_ = classifyUnit(s.substr(pos, stop - pos));
    next_ = stop;
}

TokenStream::const_iterator& TokenStream::const_iterator::operator++() {
    if (!atEnd_) advance();
    return *this;
}

TokenStream::const_iterator TokenStream::const_iterator::operator++(int) {
    const_iterator prev = *this;
    ++(*this);
    return prev;
}

bool TokenStream::const_iterator::operator==(const const_iterator& other) const {
    if (atEnd_ || other.atEnd_) return atEnd_ == other.atEnd_;
    return source_ == other.source_ && next_ == other.next_;
}

std::vector<Token> tokenize(const std::string& transcription) {
    TokenStream stream(transcription);
    return std::vector<Token>(stream.begin(), stream.end());
}

std::vector<std::string> phonesOf(const std::string& transcription) {
    std::vector<std::string> phones;
    for (const auto& tok : TokenStream(transcription)) {
        if (tok.kind == TokenKind::Phone) phones.push_back(tok.value);
    }
    return phones;
}

} // namespace phonomatch
