#include "phonomatch/CorpusLoader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace phonomatch {

namespace {

bool nonEmptyString(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) return false;
    for (unsigned char ch : it->get_ref<const std::string&>()) {
        if (!std::isspace(ch)) return true;
    }
    return false;
}

bool stringOrAbsent(const json& record, const char* key) {
    auto it = record.find(key);
    return it == record.end() || it->is_string();
}

bool integerOrAbsent(const json& record, const char* key) {
    auto it = record.find(key);
    return it == record.end() || it->is_number_integer();
}

} // namespace

CorpusLoader::CorpusLoader(std::string path) : path_(std::move(path)) {}

std::string CorpusLoader::validate(const json& record) {
    if (!record.is_object()) return "record is not an object";
    if (!nonEmptyString(record, "utterance_name")) return "missing utterance_name";
    if (!nonEmptyString(record, "words")) return "missing words";
    if (!nonEmptyString(record, "transcription")) return "missing transcription";
    if (!record.contains("script_title") || !record["script_title"].is_string()) return "missing script_title";
    if (!record.contains("phone_sequence") || !record["phone_sequence"].is_string()) return "missing phone_sequence";
    auto dur = record.find("sentence_estimated_duration");
    if (dur == record.end() || !dur->is_number()) return "missing sentence_estimated_duration";
    if (!(dur->get<double>() > 0.0)) return "non-positive sentence_estimated_duration";
    if (!stringOrAbsent(record, "locale")) return "locale is not a string";
    if (!integerOrAbsent(record, "sentence_idx")) return "sentence_idx is not an integer";
    if (!integerOrAbsent(record, "paragraph_idx")) return "paragraph_idx is not an integer";
    return {};
}

void CorpusLoader::handleRecord(const json& record, const std::string& where,
                                const std::function<void(const Sample&)>& onSample) {
    auto reason = validate(record);
    if (!reason.empty()) {
        std::cerr << "CorpusLoader: " << where << ": " << reason << "; skipping\n";
        ++skipped_;
        return;
    }
    Sample s = record.get<Sample>();
    if (!seenIds_.insert(s.id).second) {
        std::cerr << "CorpusLoader: " << where << ": duplicate utterance_name " << s.id << "; skipping\n";
        ++skipped_;
        return;
    }
    ++admitted_;
    onSample(s);
}

bool CorpusLoader::load(const std::function<void(const Sample&)>& onSample) {
    admitted_ = 0;
    skipped_ = 0;
    seenIds_.clear();

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        std::cerr << "CorpusLoader: failed to open " << path_ << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();

    size_t first = 0;
    while (first < content.size() && std::isspace(static_cast<unsigned char>(content[first]))) ++first;

    if (first < content.size() && content[first] == '[') {
        auto doc = json::parse(content, nullptr, false);
        if (doc.is_discarded() || !doc.is_array()) {
            std::cerr << "CorpusLoader: " << path_ << " is not a valid JSON array\n";
            return false;
        }
        for (size_t i = 0; i < doc.size(); ++i) {
            handleRecord(doc[i], "record " + std::to_string(i), onSample);
        }
    } else {
        // JSON Lines: one record per non-blank line
        std::istringstream lines(content);
        std::string line;
        size_t lineNo = 0;
        while (std::getline(lines, line)) {
            ++lineNo;
            bool blank = true;
            for (unsigned char ch : line) {
                if (!std::isspace(ch)) { blank = false; break; }
            }
            if (blank) continue;
            auto rec = json::parse(line, nullptr, false);
            if (rec.is_discarded()) {
                std::cerr << "CorpusLoader: line " << lineNo << ": invalid JSON record; skipping\n";
                ++skipped_;
                continue;
            }
            handleRecord(rec, "line " + std::to_string(lineNo), onSample);
        }
    }

    std::cerr << "CorpusLoader: " << path_ << " admitted=" << admitted_ << " skipped=" << skipped_ << "\n";
    return true;
}

bool CorpusLoader::loadAll(std::vector<Sample>& out) {
    return load([&out](const Sample& s) { out.push_back(s); });
}

} // namespace phonomatch
