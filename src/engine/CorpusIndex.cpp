#include "phonomatch/CorpusIndex.hpp"
#include "phonomatch/Analyzer.hpp"
#include "phonomatch/Errors.hpp"
#include "phonomatch/PhonemeTokenizer.hpp"

#include <cctype>

using json = nlohmann::json;

namespace phonomatch {

namespace {

bool blank(const std::string& s) {
    for (unsigned char ch : s) {
        if (!std::isspace(ch)) return false;
    }
    return true;
}

} // namespace

CorpusIndex CorpusIndex::build(const std::vector<Sample>& samples) {
    CorpusIndex idx;
    idx.entries_.reserve(samples.size());

    for (const auto& s : samples) {
        if (blank(s.text)) throw InvalidCorpusError("sample " + s.id + " has empty text");
        if (blank(s.transcription)) throw InvalidCorpusError("sample " + s.id + " has empty transcription");

        const auto ref = static_cast<SampleRef>(idx.entries_.size());
        if (!idx.byId_.emplace(s.id, ref).second) {
            throw InvalidCorpusError("duplicate sample id " + s.id);
        }

        Entry e;
        e.sample = s;
        auto words = Analyzer::words(s.text);
        for (const auto& w : words) {
            if (!e.normalizedText.empty()) e.normalizedText.push_back(' ');
            e.normalizedText += w;
        }
        e.wordSet.insert(words.begin(), words.end());
        e.phones = phonesOf(blank(s.phoneSequence) ? s.transcription : s.phoneSequence);

        for (const auto& w : e.wordSet) {
            idx.invertedIndex_[w].push_back(ref);
        }
        idx.byCategory_[s.category].push_back(ref);
        idx.entries_.push_back(std::move(e));
    }
    return idx;
}

const Sample* CorpusIndex::findSample(const std::string& id) const {
    auto it = byId_.find(id);
    if (it == byId_.end()) return nullptr;
    return &entries_[it->second].sample;
}

const Sample& CorpusIndex::sample(const std::string& id) const {
    const Sample* s = findSample(id);
    if (!s) throw UnknownSampleIdError(id);
    return *s;
}

std::vector<Sample> CorpusIndex::listCategory(const std::string& category) const {
    auto it = byCategory_.find(category);
    if (it == byCategory_.end()) throw UnknownCategoryError(category);
    std::vector<Sample> out;
    out.reserve(it->second.size());
    for (auto ref : it->second) out.push_back(entries_[ref].sample);
    return out;
}

std::vector<std::string> CorpusIndex::categories() const {
    std::vector<std::string> out;
    out.reserve(byCategory_.size());
    for (const auto& kv : byCategory_) out.push_back(kv.first);
    return out;
}

const std::vector<CorpusIndex::SampleRef>& CorpusIndex::samplesWithWord(const std::string& word) const {
    static const std::vector<SampleRef> kNone;
    auto it = invertedIndex_.find(word);
    return it == invertedIndex_.end() ? kNone : it->second;
}

CorpusStats CorpusIndex::stats() const {
    CorpusStats st;
    st.sampleCount = entries_.size();
    st.categoryNames = categories();
    for (const auto& kv : byCategory_) {
        double total = 0.0;
        for (auto ref : kv.second) total += entries_[ref].sample.durationSeconds;
        st.categoryCounts[kv.first] = kv.second.size();
        st.categoryDurations[kv.first] = total;
    }
    for (const auto& e : entries_) st.totalDuration += e.sample.durationSeconds;
    if (!entries_.empty()) {
        st.averageDuration = st.totalDuration / static_cast<double>(entries_.size());
    }
    return st;
}

void to_json(json& j, const CorpusStats& stats) {
    j = json{
        {"sample_count", stats.sampleCount},
        {"category_names", stats.categoryNames},
        {"category_counts", stats.categoryCounts},
        {"category_durations", stats.categoryDurations},
        {"average_duration", stats.averageDuration},
        {"total_duration", stats.totalDuration}
    };
}

} // namespace phonomatch
