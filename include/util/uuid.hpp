#pragma once

#include <string>
#include <string_view>

namespace tally::util {

// Random (v4) UUID in canonical lowercase form. Used for every GlobalId.
std::string generateGlobalId();

// Lowercases and validates a textual UUID. Empty or malformed input yields "".
std::string canonicalGlobalId(std::string_view id);

// True for "" and the all-zero UUID, both meaning "no reference".
bool isNilGlobalId(std::string_view id);

}
