#pragma once

#include <string>
#include <vector>

namespace phonomatch {

// Text normalization shared by index build and queries: lowercase, split on
// whitespace, strip punctuation surrounding each word, rejoin with single spaces.
class Analyzer {
public:
    static std::vector<std::string> words(const std::string& text);
    static std::string normalize(const std::string& text);
};

} // namespace phonomatch
