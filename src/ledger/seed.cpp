#include "ledger/Mutations.hpp"
#include "log/Registry.hpp"

#include <array>

using namespace tally::types;

namespace tally::ledger {

namespace {

struct DefaultCategory {
    const char* name;
    const char* icon;
    const char* color;
    std::int64_t budget_cents;
    CategoryType type;
};

constexpr std::array<DefaultCategory, 10> kDefaultCategories{{
    {"Rent/Mortgage",     "🏠", "#EF4444", 150000, CategoryType::Fixed},
    {"Bills & Utilities", "📄", "#F97316",  30000, CategoryType::Fixed},
    {"Insurance",         "🛡️", "#3B82F6",  20000, CategoryType::Fixed},
    {"Subscriptions",     "📱", "#8B5CF6",   5000, CategoryType::Fixed},
    {"Transport",         "🚗", "#06B6D4",  20000, CategoryType::Fixed},
    {"Food & Dining",     "🍽️", "#F59E0B",  50000, CategoryType::Discretionary},
    {"Shopping",          "🛍️", "#EC4899",  30000, CategoryType::Discretionary},
    {"Entertainment",     "🎬", "#A855F7",  15000, CategoryType::Discretionary},
    {"Health & Fitness",  "💪", "#10B981",  10000, CategoryType::Discretionary},
    {"Personal Care",     "💊", "#14B8A6",   7500, CategoryType::Discretionary},
}};

}

bool seedDefaults(ChangeLedger& ledger, const util::Clock& clock) {
    if (!ledger.categories().listAll().empty()) return false;

    ledger.runInTransaction([&] {
        for (const auto& def : kDefaultCategories) {
            Category c;
            c.name = def.name;
            c.icon = def.icon;
            c.color = def.color;
            c.default_budget_cents = def.budget_cents;
            c.type = def.type;
            create(ledger, std::move(c), clock);
        }

        if (ledger.settings().listActive().empty()) create(ledger, Settings{}, clock);
    });

    log::Registry::ledger()->info("[Seed] Inserted {} default categories", kDefaultCategories.size());
    return true;
}

}
