#pragma once

#include "ledger/ChangeLedger.hpp"

#include <string>

namespace tally::sync {

// Owner-scoped parents for references that cannot be resolved. Created on
// first use; an active record with the same normalized name is reused.
class Fallbacks {
public:
    Fallbacks(ledger::ChangeLedger& ledger, util::Timestamp now,
              std::string categoryName, std::string savingsGoalName);

    types::LocalId category();
    types::LocalId savingsGoal();

    [[nodiscard]] std::size_t created() const { return created_; }

private:
    ledger::ChangeLedger& ledger_;
    util::Timestamp now_;
    std::string categoryName_, savingsGoalName_;
    types::LocalId categoryId_{types::kNoLocalId}, savingsGoalId_{types::kNoLocalId};
    std::size_t created_{0};
};

}
