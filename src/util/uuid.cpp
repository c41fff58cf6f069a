#include "util/uuid.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace tally::util {

std::string generateGlobalId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string canonicalGlobalId(const std::string_view id) {
    if (id.empty()) return {};
    try {
        const boost::uuids::string_generator parse;
        const auto uuid = parse(id.begin(), id.end());
        if (uuid.is_nil()) return {};
        return boost::uuids::to_string(uuid);
    } catch (const std::runtime_error&) {
        return {};
    }
}

bool isNilGlobalId(const std::string_view id) {
    if (id.empty()) return true;
    for (const char c : id)
        if (c != '0' && c != '-') return false;
    return true;
}

}
