#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "phonomatch/Sample.hpp"

namespace phonomatch {

// Reads utterance records from a JSON array file or a JSON Lines file and
// hands every structurally valid one to the caller. Invalid records are
// logged and skipped; only an unreadable or unparseable file fails the load.
class CorpusLoader {
public:
    explicit CorpusLoader(std::string path);

    bool load(const std::function<void(const Sample&)>& onSample);

    // Convenience: collect everything load() admits.
    bool loadAll(std::vector<Sample>& out);

    size_t admitted() const { return admitted_; }
    size_t skipped() const { return skipped_; }
    const std::string& path() const { return path_; }

    // Empty string when the record is acceptable, otherwise the reason.
    static std::string validate(const nlohmann::json& record);

private:
    std::string path_;
    size_t admitted_ = 0;
    size_t skipped_ = 0;
    std::unordered_set<std::string> seenIds_;

    void handleRecord(const nlohmann::json& record, const std::string& where,
                      const std::function<void(const Sample&)>& onSample);
};

} // namespace phonomatch
