#include "phonomatch/Sample.hpp"

using json = nlohmann::json;

namespace phonomatch {

bool operator==(const Sample& a, const Sample& b) {
    return a.id == b.id && a.text == b.text && a.transcription == b.transcription &&
           a.phoneSequence == b.phoneSequence && a.category == b.category &&
           a.durationSeconds == b.durationSeconds && a.locale == b.locale &&
           a.sentenceIdx == b.sentenceIdx && a.paragraphIdx == b.paragraphIdx;
}

void to_json(json& j, const Sample& s) {
    j = json{
        {"utterance_name", s.id},
        {"words", s.text},
        {"transcription", s.transcription},
        {"phone_sequence", s.phoneSequence},
        {"script_title", s.category},
        {"sentence_estimated_duration", s.durationSeconds},
        {"locale", s.locale},
        {"sentence_idx", s.sentenceIdx},
        {"paragraph_idx", s.paragraphIdx}
    };
}

// Required fields use at() and throw on absence; passthrough metadata defaults.
void from_json(const json& j, Sample& s) {
    s.id = j.at("utterance_name").get<std::string>();
    s.text = j.at("words").get<std::string>();
    s.transcription = j.at("transcription").get<std::string>();
    s.phoneSequence = j.value("phone_sequence", "");
    s.category = j.value("script_title", "");
    s.durationSeconds = j.at("sentence_estimated_duration").get<double>();
    s.locale = j.value("locale", "");
    s.sentenceIdx = j.value("sentence_idx", 0);
    s.paragraphIdx = j.value("paragraph_idx", 0);
}

} // namespace phonomatch
