#pragma once

#include "types/SyncMeta.hpp"
#include "types/enums.hpp"

namespace tally::types {

struct Category : SyncMeta {
    std::string name;
    std::string icon;
    std::string color = "#6B7280";
    std::int64_t default_budget_cents{};
    CategoryType type{CategoryType::Fixed};
};

}
