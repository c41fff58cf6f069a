#pragma once

#include "util/timestamp.hpp"

#include <optional>

namespace tally::sync {

enum class Resolution { Insert, Overwrite, Discard };

// Last-write-wins at whole-record granularity. A tie keeps what is stored.
inline Resolution resolve(const std::optional<util::Timestamp>& existing, const util::Timestamp incoming) {
    if (!existing) return Resolution::Insert;
    return incoming > *existing ? Resolution::Overwrite : Resolution::Discard;
}

inline const char* to_string(const Resolution r) {
    switch (r) {
        case Resolution::Insert: return "insert";
        case Resolution::Overwrite: return "overwrite";
        case Resolution::Discard: return "discard";
    }
    return "unknown";
}

}
