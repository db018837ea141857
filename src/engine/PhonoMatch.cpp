//PhonoMatch.cpp
#include "PhonoMatch.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include "phonomatch/CorpusLoader.hpp"
#include "phonomatch/PhonemeTokenizer.hpp"

using json = nlohmann::json;

namespace phonomatch {

namespace {

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

CorpusIndex buildIndex(const std::vector<Sample>& samples) {
    return CorpusIndex::build(samples);
}

AnalysisReport analyze(const std::string& sampleId, const CorpusIndex& index) {
    const Sample& s = index.sample(sampleId);
    return PhonemeAnalyzer::analyze(TokenStream(s.transcription));
}

std::string renderReport(const CorpusIndex& index) {
    const auto st = index.stats();
    const std::string rule(60, '=');
    const std::string thin(60, '-');

    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << rule << "\n"
        << "UTTERANCE CORPUS REPORT\n"
        << rule << "\n";
    out << "\nTotal Samples: " << st.sampleCount << "\n";
    out << "Categories: " << st.categoryNames.size() << "\n";
    out << "Average Duration: " << st.averageDuration << "s\n";
    out << "Total Duration: " << st.totalDuration << "s\n";

    out << "\nCategories: ";
    bool first = true;
    for (const auto& name : st.categoryNames) {
        if (!first) out << ", ";
        out << name;
        first = false;
    }
    out << "\n";

    out << "\n" << thin << "\nCATEGORY BREAKDOWN\n" << thin << "\n";
    for (const auto& kv : st.categoryCounts) {
        const double total = st.categoryDurations.at(kv.first);
        out << "\n" << upper(kv.first) << ":\n";
        out << "  Samples: " << kv.second << "\n";
        out << "  Total Duration: " << total << "s\n";
        out << "  Avg Duration: " << total / static_cast<double>(kv.second) << "s\n";
    }

    out << "\n" << thin << "\nSAMPLE EXAMPLES (First 5)\n" << thin << "\n";
    const auto& entries = index.entries();
    for (size_t i = 0; i < entries.size() && i < 5; ++i) {
        const Sample& s = entries[i].sample;
        out << "\n" << (i + 1) << ". " << s.id << " (" << s.category << ")\n";
        out << "   Text: " << s.text << "\n";
        out << "   Duration: " << s.durationSeconds << "s\n";
        out << "   Phonemes: " << s.phoneSequence.substr(0, 80) << "...\n";
    }
    return out.str();
}

// -----------------------------------------------------------
// PhonoMatch
// -----------------------------------------------------------
PhonoMatch::PhonoMatch(const std::string& corpusPath)
    : corpusPath_(corpusPath), index_(std::make_shared<CorpusIndex>()) {
    if (const char* envLimit = std::getenv("PHONOMATCH_SEARCH_LIMIT")) {
        try {
            searchLimit_ = std::max<size_t>(1, static_cast<size_t>(std::stoull(envLimit)));
        } catch (const std::exception& e) {
            std::cerr << "PhonoMatch: ignoring PHONOMATCH_SEARCH_LIMIT=" << envLimit << " (" << e.what() << ")\n";
        }
    }
    std::cerr << "PhonoMatch: corpus=" << (corpusPath_.empty() ? "<none>" : corpusPath_)
              << " searchLimit=" << searchLimit_ << "\n";

    if (!corpusPath_.empty() && !loadCorpus(corpusPath_)) {
        throw std::runtime_error("failed to load corpus " + corpusPath_);
    }
}

bool PhonoMatch::loadCorpus(const std::string& path) {
    std::vector<Sample> samples;
    CorpusLoader loader(path);
    if (!loader.loadAll(samples)) return false;
    reload(samples);
    std::lock_guard<std::mutex> lk(mutex_);
    corpusPath_ = path;
    return true;
}

void PhonoMatch::reload(const std::vector<Sample>& samples) {
    std::shared_ptr<const CorpusIndex> next = std::make_shared<CorpusIndex>(CorpusIndex::build(samples));
    publish(std::move(next));
}

void PhonoMatch::publish(std::shared_ptr<const CorpusIndex> next) {
    const size_t samples = next->size();
    const size_t categories = next->byCategory().size();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        index_ = std::move(next);
    }
    std::cerr << "PhonoMatch: published index samples=" << samples << " categories=" << categories << "\n";
}

std::shared_ptr<const CorpusIndex> PhonoMatch::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return index_;
}

PhonoMatch::MatchResult PhonoMatch::findBestMatch(const std::string& query) const {
    auto idx = snapshot();
    return algo::findBestMatch(query, *idx);
}

std::vector<Sample> PhonoMatch::search(const std::string& query) const {
    return search(query, std::numeric_limits<size_t>::max());
}

std::vector<Sample> PhonoMatch::search(const std::string& query, size_t maxResults) const {
    auto idx = snapshot();
    std::vector<Sample> out;
    for (const auto& hit : algo::search(query, *idx, maxResults)) {
        out.push_back(idx->entry(hit.ref).sample);
    }
    return out;
}

std::vector<Sample> PhonoMatch::listCategory(const std::string& category) const {
    return snapshot()->listCategory(category);
}

PhonoMatch::SampleAnalysis PhonoMatch::analyze(const std::string& sampleId) const {
    auto idx = snapshot();
    SampleAnalysis out;
    out.sample = idx->sample(sampleId);
    out.report = phonomatch::analyze(sampleId, *idx);
    return out;
}

Sample PhonoMatch::getSample(const std::string& sampleId) const {
    return snapshot()->sample(sampleId);
}

CorpusStats PhonoMatch::stats() const {
    return snapshot()->stats();
}

std::string PhonoMatch::report() const {
    return renderReport(*snapshot());
}

json PhonoMatch::config() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return json{
        {"corpus_path", corpusPath_},
        {"search_limit", searchLimit_},
        {"samples", index_->size()}
    };
}

void to_json(json& j, const PhonoMatch::SampleAnalysis& analysis) {
    j = json{
        {"sample", analysis.sample},
        {"text", analysis.sample.text},
        {"full_sequence", analysis.sample.phoneSequence},
        {"transcription", analysis.sample.transcription},
        {"analysis", analysis.report}
    };
}

} // namespace phonomatch
