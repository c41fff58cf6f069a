#pragma once

namespace tally::ledger::sqlite {

class Database;

// Creates every ledger table and the sync_state table if absent, and adds
// columns that older device stores lack.
void initSchema(Database& db);

}
