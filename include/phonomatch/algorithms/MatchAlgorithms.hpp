#pragma once

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "phonomatch/CorpusIndex.hpp"

namespace phonomatch::algo {

// Cascade stages in priority order.
enum class MatchStage { Exact, Substring, WordOverlap, Phonetic };

const char* matchStageName(MatchStage stage);

constexpr double kExactScore = 100.0;
constexpr double kSubstringBase = 75.0;
constexpr double kSubstringSpan = 25.0;
constexpr double kWordOverlapScale = 50.0;
constexpr double kPhoneticScale = 40.0;

struct SearchHit {
    CorpusIndex::SampleRef ref;
    double score;
};

struct PhoneticHit {
    CorpusIndex::SampleRef ref;
    double score;
    int distance;
    double normalizedDistance;
};

struct MatchResult {
    std::string sampleId;
    double score = 0.0;
    MatchStage stage = MatchStage::Exact;
    // Phonetic stage only.
    std::optional<int> editDistance;
    std::optional<double> normalizedDistance;
};

void to_json(nlohmann::json& j, const MatchResult& result);

// Single best match through exact -> substring -> word overlap -> phonetic.
// The first stage with a candidate wins. Throws NoMatchError on an empty index.
MatchResult findBestMatch(const std::string& query, const CorpusIndex& index);

// Stages, each over an already normalized query. Ties go to the lowest ref.
std::optional<SearchHit> matchExact(const CorpusIndex& index, const std::string& normQuery);
std::optional<SearchHit> matchSubstring(const CorpusIndex& index, const std::string& normQuery);
std::optional<SearchHit> matchWordOverlap(const CorpusIndex& index, const std::vector<std::string>& queryWords);
// Candidates that cannot beat the best so far are cut off through the
// editDistance bound.
std::optional<PhoneticHit> matchPhonetic(const CorpusIndex& index, const std::vector<std::string>& queryPhones);

// Non-cascaded listing: every sample related to the query by containment or
// shared words, best score first, corpus order on ties.
std::vector<SearchHit> search(const std::string& query, const CorpusIndex& index, size_t maxResults);

// 75 + 25 * shorter / longer, in (75, 100) for non-empty distinct strings.
double substringScore(size_t shorterLen, size_t longerLen);

// 50 * |a & b| / |a | b|; 0 when both are empty.
double jaccardScore(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b);

// Levenshtein distance over any indexable sequence. Returns maxCost + 1 as
// soon as the distance is known to exceed maxCost.
template <typename Seq>
int editDistance(const Seq& a, const Seq& b, int maxCost = std::numeric_limits<int>::max() - 1) {
    const int n = static_cast<int>(a.size());
    const int m = static_cast<int>(b.size());
    if (std::abs(n - m) > maxCost) return maxCost + 1;

    std::vector<int> prev(m + 1), curr(m + 1);
    for (int j = 0; j <= m; ++j) prev[j] = j;

    for (int i = 1; i <= n; ++i) {
        curr[0] = i;
        int rowMin = curr[0];
        for (int j = 1; j <= m; ++j) {
            int cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
            rowMin = std::min(rowMin, curr[j]);
        }
        if (rowMin > maxCost) return maxCost + 1;
        std::swap(prev, curr);
    }
    return prev[m];
}

// Distance divided by the longer length; 0 when both are empty.
double normalizedDistance(int distance, size_t lenA, size_t lenB);
double normalizedEditDistance(const std::vector<std::string>& a, const std::vector<std::string>& b);

} // namespace phonomatch::algo
