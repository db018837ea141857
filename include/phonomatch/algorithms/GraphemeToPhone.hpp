#pragma once

#include <string>
#include <vector>

namespace phonomatch::algo {

// Rough letter-to-phone approximation of free text in the corpus phone
// alphabet. Pure rule table, longest grapheme first; characters outside a-z
// are skipped, so every printable input maps to some (possibly empty) list.
std::vector<std::string> graphemesToPhones(const std::string& text);

} // namespace phonomatch::algo
