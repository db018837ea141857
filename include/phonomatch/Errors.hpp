#pragma once

#include <stdexcept>
#include <string>

namespace phonomatch {

// Base for every error the engine reports to its callers.
class PhonoMatchError : public std::runtime_error {
public:
    explicit PhonoMatchError(const std::string& message) : std::runtime_error(message) {}
};

// Empty transcription handed to the tokenizer.
class MalformedTranscriptionError : public PhonoMatchError {
public:
    explicit MalformedTranscriptionError(const std::string& message) : PhonoMatchError(message) {}
};

class UnknownSampleIdError : public PhonoMatchError {
public:
    explicit UnknownSampleIdError(const std::string& id)
        : PhonoMatchError("unknown sample id: " + id), id_(id) {}
    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class UnknownCategoryError : public PhonoMatchError {
public:
    explicit UnknownCategoryError(const std::string& category)
        : PhonoMatchError("unknown category: " + category), category_(category) {}
    const std::string& category() const { return category_; }

private:
    std::string category_;
};

// Raised only when the index holds no samples.
class NoMatchError : public PhonoMatchError {
public:
    NoMatchError() : PhonoMatchError("no match: corpus is empty") {}
};

// Sample sequence violating the corpus invariants (duplicate id, empty text).
class InvalidCorpusError : public PhonoMatchError {
public:
    explicit InvalidCorpusError(const std::string& message) : PhonoMatchError(message) {}
};

} // namespace phonomatch
