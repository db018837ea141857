#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "phonomatch/Sample.hpp"

namespace phonomatch {

struct CorpusStats {
    size_t sampleCount = 0;
    std::vector<std::string> categoryNames; // sorted
    std::map<std::string, size_t> categoryCounts;
    std::map<std::string, double> categoryDurations;
    double averageDuration = 0.0;
    double totalDuration = 0.0;
};

void to_json(nlohmann::json& j, const CorpusStats& stats);

// Read-only lookup structures over one corpus snapshot. Built once, never
// mutated; a corpus change means building a new index.
class CorpusIndex {
public:
    // Position of a sample in corpus order; doubles as the tie-break key.
    using SampleRef = uint32_t;

    struct Entry {
        Sample sample;
        std::string normalizedText;
        std::unordered_set<std::string> wordSet;
        std::vector<std::string> phones;
    };

    CorpusIndex() = default;

    // Copies the samples. Throws InvalidCorpusError on a duplicate id or an
    // empty text/transcription.
    static CorpusIndex build(const std::vector<Sample>& samples);

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    const std::vector<Entry>& entries() const { return entries_; }
    const Entry& entry(SampleRef ref) const { return entries_.at(ref); }

    // Throws UnknownSampleIdError.
    const Sample& sample(const std::string& id) const;
    const Sample* findSample(const std::string& id) const;

    // Corpus order. Throws UnknownCategoryError.
    std::vector<Sample> listCategory(const std::string& category) const;
    std::vector<std::string> categories() const;

    // Refs in ascending corpus order; empty when the word is not indexed.
    const std::vector<SampleRef>& samplesWithWord(const std::string& word) const;

    CorpusStats stats() const;

    const std::unordered_map<std::string, SampleRef>& byId() const { return byId_; }
    const std::map<std::string, std::vector<SampleRef>>& byCategory() const { return byCategory_; }
    const std::unordered_map<std::string, std::vector<SampleRef>>& invertedWordIndex() const { return invertedIndex_; }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, SampleRef> byId_;
    std::map<std::string, std::vector<SampleRef>> byCategory_;
    // normalized word -> samples containing it
    std::unordered_map<std::string, std::vector<SampleRef>> invertedIndex_;
};

} // namespace phonomatch
