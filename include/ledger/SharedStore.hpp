#pragma once

#include "ledger/ChangeLedger.hpp"

#include <functional>
#include <string>

namespace tally::ledger {

// The server's multi-owner store. Each call sees only ownerId's rows and runs
// in a single transaction that commits when fn returns and rolls back if it throws.
class SharedStore {
public:
    virtual ~SharedStore() = default;

    virtual void withOwner(const std::string& ownerId, const std::function<void(ChangeLedger&)>& fn) = 0;
};

}
