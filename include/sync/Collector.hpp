#pragma once

#include "ledger/ChangeLedger.hpp"
#include "sync/model/Payload.hpp"

namespace tally::sync {

// Everything in the ledger changed after `since`, deleted records included,
// with local references rewritten to their parents' global ids.
model::Payload collect(ledger::ChangeLedger& ledger, util::Timestamp since);

// The device's outbound set: rows whose change stamp is after `sentThrough`.
// Stamps written from received server data never qualify.
model::Payload collectOutbound(ledger::ChangeLedger& ledger, util::Timestamp sentThrough);

}
