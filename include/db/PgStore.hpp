#pragma once

#include "ledger/SharedStore.hpp"

namespace tally::db {

// SharedStore over the PostgreSQL pool. Each call holds a transaction-scoped
// advisory lock on the owner, so concurrent server processes serialize per owner.
class PgStore final : public ledger::SharedStore {
public:
    void withOwner(const std::string& ownerId, const std::function<void(ledger::ChangeLedger&)>& fn) override;
};

}
