#include "ledger/sqlite/schema.hpp"
#include "ledger/sqlite/Database.hpp"

namespace tally::ledger::sqlite {

namespace {

bool hasColumn(Database& db, const std::string& table, const std::string& column) {
    auto st = db.prepare("SELECT 1 FROM pragma_table_info(?1) WHERE name = ?2");
    st.bind(1, table);
    st.bind(2, column);
    return st.step();
}

}

// global_id is indexed but not unique: concurrent first syncs can leave
// transient duplicates that the normalizer collapses.
void initSchema(Database& db) {
    db.exec(R"(
CREATE TABLE IF NOT EXISTS categories
(
    id                    INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id              TEXT    NOT NULL DEFAULT '',
    global_id             TEXT    NOT NULL,
    updated_at            INTEGER NOT NULL,
    changed_at            INTEGER NOT NULL,
    is_deleted            INTEGER NOT NULL DEFAULT 0,
    name                  TEXT    NOT NULL,
    icon                  TEXT    NOT NULL DEFAULT '',
    color                 TEXT    NOT NULL DEFAULT '#6B7280',
    default_budget_cents  INTEGER NOT NULL DEFAULT 0,
    type                  INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS categories_owner_global ON categories (owner_id, global_id);
    )");

    db.exec(R"(
CREATE TABLE IF NOT EXISTS transactions
(
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id      TEXT    NOT NULL DEFAULT '',
    global_id     TEXT    NOT NULL,
    updated_at    INTEGER NOT NULL,
    changed_at    INTEGER NOT NULL,
    is_deleted    INTEGER NOT NULL DEFAULT 0,
    description   TEXT    NOT NULL DEFAULT '',
    amount_cents  INTEGER NOT NULL DEFAULT 0,
    date          TEXT    NOT NULL,
    category_id   INTEGER NOT NULL DEFAULT 0,
    type          INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS transactions_owner_global ON transactions (owner_id, global_id);
CREATE INDEX IF NOT EXISTS transactions_category ON transactions (category_id);
    )");

    db.exec(R"(
CREATE TABLE IF NOT EXISTS budgets
(
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id      TEXT    NOT NULL DEFAULT '',
    global_id     TEXT    NOT NULL,
    updated_at    INTEGER NOT NULL,
    changed_at    INTEGER NOT NULL,
    is_deleted    INTEGER NOT NULL DEFAULT 0,
    category_id   INTEGER NOT NULL DEFAULT 0,
    amount_cents  INTEGER NOT NULL DEFAULT 0,
    month         INTEGER NOT NULL,
    year          INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS budgets_owner_global ON budgets (owner_id, global_id);
    )");

    db.exec(R"(
CREATE TABLE IF NOT EXISTS recurring_transactions
(
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id       TEXT    NOT NULL DEFAULT '',
    global_id      TEXT    NOT NULL,
    updated_at     INTEGER NOT NULL,
    changed_at     INTEGER NOT NULL,
    is_deleted     INTEGER NOT NULL DEFAULT 0,
    description    TEXT    NOT NULL DEFAULT '',
    amount_cents   INTEGER NOT NULL DEFAULT 0,
    category_id    INTEGER NOT NULL DEFAULT 0,
    type           INTEGER NOT NULL DEFAULT 0,
    frequency      INTEGER NOT NULL DEFAULT 2,
    day_of_month   INTEGER NOT NULL DEFAULT 1,
    start_date     TEXT    NOT NULL,
    next_due_date  TEXT    NOT NULL,
    is_active      INTEGER NOT NULL DEFAULT 1
);
CREATE INDEX IF NOT EXISTS recurring_transactions_owner_global ON recurring_transactions (owner_id, global_id);
    )");

    db.exec(R"(
CREATE TABLE IF NOT EXISTS settings
(
    id                    INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id              TEXT    NOT NULL DEFAULT '',
    global_id             TEXT    NOT NULL,
    updated_at            INTEGER NOT NULL,
    changed_at            INTEGER NOT NULL,
    is_deleted            INTEGER NOT NULL DEFAULT 0,
    monthly_income_cents  INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS settings_owner_global ON settings (owner_id, global_id);
    )");

    db.exec(R"(
CREATE TABLE IF NOT EXISTS savings_goals
(
    id                          INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id                    TEXT    NOT NULL DEFAULT '',
    global_id                   TEXT    NOT NULL,
    updated_at                  INTEGER NOT NULL,
    changed_at                  INTEGER NOT NULL,
    is_deleted                  INTEGER NOT NULL DEFAULT 0,
    name                        TEXT    NOT NULL,
    icon                        TEXT    NOT NULL DEFAULT '',
    color                       TEXT    NOT NULL DEFAULT '#6366F1',
    goal_cents                  INTEGER NOT NULL DEFAULT 0,
    current_balance_cents       INTEGER NOT NULL DEFAULT 0,
    monthly_contribution_cents  INTEGER NOT NULL DEFAULT 0,
    start_date                  TEXT    NOT NULL,
    target_date                 TEXT,
    status                      INTEGER NOT NULL DEFAULT 0,
    auto_contribute             INTEGER NOT NULL DEFAULT 0,
    last_auto_contribute_date   TEXT
);
CREATE INDEX IF NOT EXISTS savings_goals_owner_global ON savings_goals (owner_id, global_id);
    )");

    db.exec(R"(
CREATE TABLE IF NOT EXISTS savings_goal_transactions
(
    id               INTEGER PRIMARY KEY AUTOINCREMENT,
    owner_id         TEXT    NOT NULL DEFAULT '',
    global_id        TEXT    NOT NULL,
    updated_at       INTEGER NOT NULL,
    changed_at       INTEGER NOT NULL,
    is_deleted       INTEGER NOT NULL DEFAULT 0,
    savings_goal_id  INTEGER NOT NULL DEFAULT 0,
    date             TEXT    NOT NULL,
    amount_cents     INTEGER NOT NULL DEFAULT 0,
    type             INTEGER NOT NULL DEFAULT 0,
    note             TEXT    NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS savings_goal_transactions_owner_global ON savings_goal_transactions (owner_id, global_id);
    )");

    db.exec(R"(
CREATE TABLE IF NOT EXISTS sync_state
(
    owner_id        TEXT    PRIMARY KEY,
    last_synced_at  INTEGER NOT NULL,
    sent_through    INTEGER NOT NULL DEFAULT 0
);
    )");

    // stores created before the outbound mark existed
    if (!hasColumn(db, "sync_state", "sent_through"))
        db.exec("ALTER TABLE sync_state ADD COLUMN sent_through INTEGER NOT NULL DEFAULT 0");
}

}
