#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "phonomatch/PhonemeTokenizer.hpp"

namespace phonomatch {

struct StressMark {
    size_t wordIndex = 0;
    int64_t level = 0;
};

inline bool operator==(const StressMark& a, const StressMark& b) {
    return a.wordIndex == b.wordIndex && a.level == b.level;
}

struct AnalysisReport {
    // Phone and StressMarker tokens of each word, in order.
    std::vector<std::vector<Token>> words;
    std::vector<StressMark> stressPattern;
    std::map<std::string, size_t> phoneHistogram;
    size_t phoneCount = 0;
    size_t wordCount = 0;
};

// Word segmentation, stress attribution and phone statistics for one utterance.
// Word boundaries delimit segments; markers other than stress codes are
// neither content nor delimiters. A segment yields no word only when it holds
// neither phones nor stress markers.
class PhonemeAnalyzer {
public:
    static AnalysisReport analyze(const TokenStream& tokens);
    static AnalysisReport analyze(const std::vector<Token>& tokens);
};

void to_json(nlohmann::json& j, const AnalysisReport& report);

} // namespace phonomatch
