#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace tally::util {

inline std::string trim(std::string_view s) {
    const auto notSpace = [](const unsigned char c) { return !std::isspace(c); };
    const auto first = std::find_if(s.begin(), s.end(), notSpace);
    const auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    if (first >= last) return {};
    return {first, last};
}

// Trimmed, ASCII case-folded form used for natural-key comparisons.
inline std::string normalizeName(std::string_view s) {
    auto out = trim(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}
