#include "phonomatch/algorithms/MatchAlgorithms.hpp"
#include "phonomatch/algorithms/GraphemeToPhone.hpp"
#include "phonomatch/Analyzer.hpp"
#include "phonomatch/Errors.hpp"

#include <set>

using json = nlohmann::json;

namespace phonomatch::algo {

namespace {

// Score of a containment relation between two normalized texts, if any.
std::optional<double> containmentScore(const std::string& query, const std::string& text) {
    if (query.empty() || text.empty()) return std::nullopt;
    if (query == text) return kExactScore;
    if (text.size() > query.size()) {
        if (text.find(query) == std::string::npos) return std::nullopt;
        return substringScore(query.size(), text.size());
    }
    if (query.find(text) == std::string::npos) return std::nullopt;
    return substringScore(text.size(), query.size());
}

std::unordered_set<std::string> toSet(const std::vector<std::string>& words) {
    return std::unordered_set<std::string>(words.begin(), words.end());
}

} // namespace

const char* matchStageName(MatchStage stage) {
    switch (stage) {
        case MatchStage::Exact: return "exact";
        case MatchStage::Substring: return "substring";
        case MatchStage::WordOverlap: return "word_overlap";
        case MatchStage::Phonetic: return "phonetic";
    }
    return "unknown";
}

double substringScore(size_t shorterLen, size_t longerLen) {
    if (longerLen == 0) return kSubstringBase;
    return kSubstringBase + kSubstringSpan * static_cast<double>(shorterLen) / static_cast<double>(longerLen);
}

double jaccardScore(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b) {
    const auto& smaller = a.size() <= b.size() ? a : b;
    const auto& larger = a.size() <= b.size() ? b : a;
    size_t inter = 0;
    for (const auto& w : smaller) {
        if (larger.count(w)) ++inter;
    }
    const size_t uni = a.size() + b.size() - inter;
    if (uni == 0) return 0.0;
    return kWordOverlapScale * static_cast<double>(inter) / static_cast<double>(uni);
}

double normalizedDistance(int distance, size_t lenA, size_t lenB) {
    const size_t longer = std::max(lenA, lenB);
    if (longer == 0) return 0.0;
    return static_cast<double>(distance) / static_cast<double>(longer);
}

double normalizedEditDistance(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return normalizedDistance(editDistance(a, b), a.size(), b.size());
}

std::optional<SearchHit> matchExact(const CorpusIndex& index, const std::string& normQuery) {
    const auto& entries = index.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].normalizedText == normQuery) {
            return SearchHit{static_cast<CorpusIndex::SampleRef>(i), kExactScore};
        }
    }
    return std::nullopt;
}

std::optional<SearchHit> matchSubstring(const CorpusIndex& index, const std::string& normQuery) {
    std::optional<SearchHit> best;
    const auto& entries = index.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        auto score = containmentScore(normQuery, entries[i].normalizedText);
        if (!score) continue;
        if (!best || *score > best->score) {
            best = SearchHit{static_cast<CorpusIndex::SampleRef>(i), *score};
        }
    }
    return best;
}

std::optional<SearchHit> matchWordOverlap(const CorpusIndex& index, const std::vector<std::string>& queryWords) {
    if (queryWords.empty()) return std::nullopt;
    const auto querySet = toSet(queryWords);

    // ordered so that the first maximum seen is the lowest ref
    std::set<CorpusIndex::SampleRef> candidates;
    for (const auto& w : querySet) {
        const auto& refs = index.samplesWithWord(w);
        candidates.insert(refs.begin(), refs.end());
    }

    std::optional<SearchHit> best;
    for (auto ref : candidates) {
        double score = jaccardScore(querySet, index.entry(ref).wordSet);
        if (score <= 0.0) continue;
        if (!best || score > best->score) best = SearchHit{ref, score};
    }
    return best;
}

std::optional<PhoneticHit> matchPhonetic(const CorpusIndex& index, const std::vector<std::string>& queryPhones) {
    std::optional<PhoneticHit> best;
    size_t bestLonger = 0;
    const auto& entries = index.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& phones = entries[i].phones;
        const size_t longer = std::max(queryPhones.size(), phones.size());

        // dist / longer must not exceed best.distance / bestLonger to compete
        int maxCost = std::numeric_limits<int>::max() - 1;
        if (best) {
            if (bestLonger == 0) break; // distance 0 on empty lists, nothing beats it
            const size_t bound = static_cast<size_t>(best->distance) * longer / bestLonger;
            maxCost = static_cast<int>(std::min<size_t>(bound, static_cast<size_t>(maxCost)));
        }
        const int dist = editDistance(queryPhones, phones, maxCost);
        if (dist > maxCost) continue;

        const double norm = normalizedDistance(dist, queryPhones.size(), phones.size());
        const double score = kPhoneticScale * (1.0 - norm);
        if (!best || score > best->score) {
            best = PhoneticHit{static_cast<CorpusIndex::SampleRef>(i), score, dist, norm};
            bestLonger = longer;
        }
    }
    return best;
}

MatchResult findBestMatch(const std::string& query, const CorpusIndex& index) {
    if (index.empty()) throw NoMatchError();

    const auto words = Analyzer::words(query);
    const std::string normQuery = Analyzer::normalize(query);

    auto fromHit = [&](const SearchHit& hit, MatchStage stage) {
        MatchResult r;
        r.sampleId = index.entry(hit.ref).sample.id;
        r.score = hit.score;
        r.stage = stage;
        return r;
    };

    if (auto hit = matchExact(index, normQuery)) return fromHit(*hit, MatchStage::Exact);
    if (auto hit = matchSubstring(index, normQuery)) return fromHit(*hit, MatchStage::Substring);
    if (auto hit = matchWordOverlap(index, words)) return fromHit(*hit, MatchStage::WordOverlap);

    auto hit = matchPhonetic(index, graphemesToPhones(normQuery));
    if (!hit) throw NoMatchError();
    MatchResult r;
    r.sampleId = index.entry(hit->ref).sample.id;
    r.score = hit->score;
    r.stage = MatchStage::Phonetic;
    r.editDistance = hit->distance;
    r.normalizedDistance = hit->normalizedDistance;
    return r;
}

std::vector<SearchHit> search(const std::string& query, const CorpusIndex& index, size_t maxResults) {
    const auto words = Analyzer::words(query);
    if (words.empty()) return {};
    const std::string normQuery = Analyzer::normalize(query);
    const auto querySet = toSet(words);

    std::vector<SearchHit> hits;
    const auto& entries = index.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        auto score = containmentScore(normQuery, entries[i].normalizedText);
        if (!score) {
            double overlap = jaccardScore(querySet, entries[i].wordSet);
            if (overlap <= 0.0) continue;
            score = overlap;
        }
        hits.push_back({static_cast<CorpusIndex::SampleRef>(i), *score});
    }

    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        return a.score > b.score;
    });
    if (hits.size() > maxResults) hits.resize(maxResults);
    return hits;
}

void to_json(json& j, const MatchResult& result) {
    j = json{
        {"sample_id", result.sampleId},
        {"score", result.score},
        {"stage", matchStageName(result.stage)}
    };
    if (result.editDistance) j["edit_distance"] = *result.editDistance;
    if (result.normalizedDistance) j["normalized_distance"] = *result.normalizedDistance;
}

} // namespace phonomatch::algo
