//PhonoMatch.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "phonomatch/CorpusIndex.hpp"
#include "phonomatch/Errors.hpp"
#include "phonomatch/PhonemeAnalyzer.hpp"
#include "phonomatch/Sample.hpp"
#include "phonomatch/algorithms/MatchAlgorithms.hpp"

namespace phonomatch {

class PhonoMatch {
public:
    using MatchResult = algo::MatchResult;
    using MatchStage = algo::MatchStage;

    struct SampleAnalysis {
        Sample sample;
        AnalysisReport report;
    };

    // Loads the corpus at corpusPath when it is non-empty; otherwise starts
    // with an empty index.
    explicit PhonoMatch(const std::string& corpusPath = "");

    // --- Corpus lifecycle ---

    // Build a fresh index from the file and publish it. Returns false and
    // keeps the current index when the file cannot be read.
    bool loadCorpus(const std::string& path);

    // Build-then-publish: the old index stays visible until the new one is complete.
    void reload(const std::vector<Sample>& samples);

    // Index observed by queries started now.
    std::shared_ptr<const CorpusIndex> snapshot() const;

    // --- Queries ---
    MatchResult findBestMatch(const std::string& query) const;
    // Every related sample, best first.
    std::vector<Sample> search(const std::string& query) const;
    std::vector<Sample> search(const std::string& query, size_t maxResults) const;
    std::vector<Sample> listCategory(const std::string& category) const;
    SampleAnalysis analyze(const std::string& sampleId) const;
    Sample getSample(const std::string& sampleId) const;
    CorpusStats stats() const;

    // Plain-text corpus overview.
    std::string report() const;

    nlohmann::json config() const;

    // Default page size of the HTTP listings (PHONOMATCH_SEARCH_LIMIT).
    size_t searchLimit() const { return searchLimit_; }

private:
    std::string corpusPath_;
    size_t searchLimit_ = 10;

    mutable std::mutex mutex_;
    std::shared_ptr<const CorpusIndex> index_;

    void publish(std::shared_ptr<const CorpusIndex> next);
};

// Free-standing forms over an explicit index.
CorpusIndex buildIndex(const std::vector<Sample>& samples);
AnalysisReport analyze(const std::string& sampleId, const CorpusIndex& index);
std::string renderReport(const CorpusIndex& index);

void to_json(nlohmann::json& j, const PhonoMatch::SampleAnalysis& analysis);

} // namespace phonomatch
