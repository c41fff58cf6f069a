#pragma once

#include "auth/CredentialProvider.hpp"
#include "config/Config.hpp"
#include "ledger/ChangeLedger.hpp"
#include "ledger/WatermarkStore.hpp"
#include "sync/Transport.hpp"
#include "util/Clock.hpp"

namespace tally::sync {

enum class SyncResult { Completed, NotAuthenticated, TransportFailed, Failed, Skipped };

const char* to_string(SyncResult r);

// One device's side of a round trip: normalize, collect, exchange, apply,
// then persist the new cursor. Never throws; failures come back as results
// and leave the cursor where it was.
//
// Outbound rows are chosen by local change stamp against the cursor's
// sent_through mark; the server watermark only travels back as last_synced_at.
class Agent {
public:
    // Loads the persisted cursor once.
    Agent(ledger::ChangeLedger& ledger,
          ledger::WatermarkStore& watermarks,
          Transport& transport,
          const auth::CredentialProvider& credentials,
          const util::Clock& clock,
          config::SyncConfig cfg);

    SyncResult sync();

    [[nodiscard]] util::Timestamp watermark() const { return cursor_.watermark; }
    [[nodiscard]] util::Timestamp sentThrough() const { return cursor_.sent_through; }

private:
    ledger::ChangeLedger& ledger_;
    ledger::WatermarkStore& watermarks_;
    Transport& transport_;
    const auth::CredentialProvider& credentials_;
    const util::Clock& clock_;
    config::SyncConfig cfg_;
    ledger::SyncCursor cursor_;
};

}
