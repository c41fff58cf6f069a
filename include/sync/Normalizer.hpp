#pragma once

#include "ledger/ChangeLedger.hpp"

namespace tally::sync {

struct NormalizeStats {
    std::size_t erased{0};          // exact duplicates physically removed
    std::size_t softDeleted{0};     // semantic duplicates retired
    std::size_t repointed{0};       // children moved to a surviving parent

    [[nodiscard]] bool changed() const { return erased + softDeleted + repointed > 0; }
};

// Collapses duplicate records in one owner's ledger.
//
// Pass 1 groups rows by global id: the highest local id survives, children of the
// others are moved to it and the others are physically removed.
// Pass 2 groups active rows by natural key: the most recently updated row survives
// (ties go to the smaller global id), children are moved, the rest are soft-deleted
// with a fresh stamp so the deletion syncs. Children still attached to an already
// deleted row with the same key move to the survivor as well.
//
// Transactions, recurring transactions and savings goal transactions take part in
// pass 1 only. Re-running on a normalized ledger changes nothing.
class Normalizer {
public:
    Normalizer(ledger::ChangeLedger& ledger, util::Timestamp now);

    NormalizeStats run();

private:
    ledger::ChangeLedger& ledger_;
    util::Timestamp now_;
    NormalizeStats stats_;

    void collapseExact();
    void collapseSemantic();

    template <typename T, typename RepointFn>
    void exactPass(RepointFn&& repoint);

    template <typename T, typename KeyFn, typename RepointFn>
    void semanticPass(KeyFn&& key, RepointFn&& repoint);
};

}
