#include "phonomatch/PhonemeAnalyzer.hpp"

using json = nlohmann::json;

namespace phonomatch {

namespace {

template <typename Range>
AnalysisReport analyzeRange(const Range& tokens) {
    AnalysisReport report;
    std::vector<Token> current;

    auto closeWord = [&]() {
        if (current.empty()) return;
        report.words.push_back(std::move(current));
        current.clear();
    };

    for (const Token& tok : tokens) {
        switch (tok.kind) {
            case TokenKind::WordBoundary:
                closeWord();
                break;
            case TokenKind::StressMarker:
                // the open segment gets the next free word index; a segment
                // holding only markers still becomes a word
                report.stressPattern.push_back({report.words.size(), tok.level});
                current.push_back(tok);
                break;
            case TokenKind::Phone:
                ++report.phoneHistogram[tok.value];
                ++report.phoneCount;
                current.push_back(tok);
                break;
            default:
                break;
        }
    }
    closeWord();

    report.wordCount = report.words.size();
    return report;
}

} // namespace

AnalysisReport PhonemeAnalyzer::analyze(const TokenStream& tokens) {
    return analyzeRange(tokens);
}

AnalysisReport PhonemeAnalyzer::analyze(const std::vector<Token>& tokens) {
    return analyzeRange(tokens);
}

void to_json(json& j, const AnalysisReport& report) {
    json words = json::array();
    for (const auto& word : report.words) {
        json units = json::array();
        for (const auto& tok : word) {
            units.push_back({{"value", tok.value}, {"kind", tokenKindName(tok.kind)}});
        }
        words.push_back(std::move(units));
    }
    json stress = json::array();
    for (const auto& mark : report.stressPattern) {
        stress.push_back({{"word_index", mark.wordIndex}, {"level", mark.level}});
    }
    j = json{
        {"words", words},
        {"stress_pattern", stress},
        {"phone_histogram", report.phoneHistogram},
        {"phone_count", report.phoneCount},
        {"word_count", report.wordCount}
    };
}

} // namespace phonomatch
