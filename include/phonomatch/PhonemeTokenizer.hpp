#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

namespace phonomatch {

enum class TokenKind {
    Phone,
    WordBoundary,     // #
    StressMarker,     // decimal code, e.g. 145 primary, 146 secondary
    SentenceBoundary, // .
    Pause,            // ,
    Punctuation,      // ! or ?
    UtteranceEnd      // ~
};

const char* tokenKindName(TokenKind kind);

struct Token {
    TokenKind kind = TokenKind::Phone;
    std::string value;
    int64_t level = 0; // StressMarker only
};

bool operator==(const Token& a, const Token& b);
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

// Lazy view over the whitespace-separated units of a transcription.
// Each pass re-scans the owned copy of the input, so the sequence can be
// iterated any number of times.
class TokenStream {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Token;
        using difference_type = std::ptrdiff_t;
        using pointer = const Token*;
        using reference = const Token&;

        const_iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        const_iterator& operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator& other) const;
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class TokenStream;
        const_iterator(const std::string* source, size_t pos);
        void advance();

        const std::string* source_ = nullptr;
        size_t next_ = 0;
        bool atEnd_ = true;
        Token current_;
    };

    // Throws MalformedTranscriptionError when the transcription has no unit at all.
    explicit TokenStream(std::string transcription);

    const_iterator begin() const;
    const_iterator end() const;

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

// Classify a single whitespace-free unit.
Token classifyUnit(const std::string& unit);

// Eager form of TokenStream.
std::vector<Token> tokenize(const std::string& transcription);

// Phone tokens only, in order.
std::vector<std::string> phonesOf(const std::string& transcription);

} // namespace phonomatch
