#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace phonomatch {

// One recorded utterance of the corpus. Created once by the loader, never mutated.
struct Sample {
    std::string id;            // utterance_name
    std::string text;          // words
    std::string transcription; // phones with boundary/stress/punctuation markers
    std::string phoneSequence; // phones and word boundaries only
    std::string category;      // script_title
    double durationSeconds = 0.0;
    std::string locale;
    int sentenceIdx = 0;
    int paragraphIdx = 0;
};

bool operator==(const Sample& a, const Sample& b);
inline bool operator!=(const Sample& a, const Sample& b) { return !(a == b); }

// Serialized with the dataset field names.
void to_json(nlohmann::json& j, const Sample& s);
void from_json(const nlohmann::json& j, Sample& s);

} // namespace phonomatch
