#pragma once

#include "db/Transactions.hpp"

#include <fmt/format.h>

namespace tally::db::seed {

// Every ledger table shares the sync columns; timestamps are UTC microseconds.
inline void init_ledger() {
    Transactions::exec("init_db_tables::init_ledger", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS categories
(
    id                    BIGSERIAL     PRIMARY KEY,
    owner_id              TEXT          NOT NULL,
    global_id             UUID          NOT NULL,
    updated_at            BIGINT        NOT NULL,
    changed_at            BIGINT        NOT NULL,
    is_deleted            BOOLEAN       NOT NULL DEFAULT FALSE,
    name                  TEXT          NOT NULL,
    icon                  TEXT          NOT NULL DEFAULT '',
    color                 VARCHAR(16)   NOT NULL DEFAULT '#6B7280',
    default_budget_cents  BIGINT        NOT NULL DEFAULT 0,
    type                  SMALLINT      NOT NULL DEFAULT 0
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS savings_goals
(
    id                          BIGSERIAL     PRIMARY KEY,
    owner_id                    TEXT          NOT NULL,
    global_id                   UUID          NOT NULL,
    updated_at                  BIGINT        NOT NULL,
    changed_at                  BIGINT        NOT NULL,
    is_deleted                  BOOLEAN       NOT NULL DEFAULT FALSE,
    name                        TEXT          NOT NULL,
    icon                        TEXT          NOT NULL DEFAULT '',
    color                       VARCHAR(16)   NOT NULL DEFAULT '#6366F1',
    goal_cents                  BIGINT        NOT NULL DEFAULT 0,
    current_balance_cents       BIGINT        NOT NULL DEFAULT 0,
    monthly_contribution_cents  BIGINT        NOT NULL DEFAULT 0,
    start_date                  DATE          NOT NULL,
    target_date                 DATE,
    status                      SMALLINT      NOT NULL DEFAULT 0,
    auto_contribute             BOOLEAN       NOT NULL DEFAULT FALSE,
    last_auto_contribute_date   DATE
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS settings
(
    id                    BIGSERIAL     PRIMARY KEY,
    owner_id              TEXT          NOT NULL,
    global_id             UUID          NOT NULL,
    updated_at            BIGINT        NOT NULL,
    changed_at            BIGINT        NOT NULL,
    is_deleted            BOOLEAN       NOT NULL DEFAULT FALSE,
    monthly_income_cents  BIGINT        NOT NULL DEFAULT 0
);
        )");

        // category_id / savings_goal_id hold owner-local ids without FK constraints.
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS transactions
(
    id            BIGSERIAL     PRIMARY KEY,
    owner_id      TEXT          NOT NULL,
    global_id     UUID          NOT NULL,
    updated_at    BIGINT        NOT NULL,
    changed_at    BIGINT        NOT NULL,
    is_deleted    BOOLEAN       NOT NULL DEFAULT FALSE,
    description   TEXT          NOT NULL DEFAULT '',
    amount_cents  BIGINT        NOT NULL,
    date          DATE          NOT NULL,
    category_id   BIGINT        NOT NULL,
    type          SMALLINT      NOT NULL DEFAULT 0
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS budgets
(
    id            BIGSERIAL     PRIMARY KEY,
    owner_id      TEXT          NOT NULL,
    global_id     UUID          NOT NULL,
    updated_at    BIGINT        NOT NULL,
    changed_at    BIGINT        NOT NULL,
    is_deleted    BOOLEAN       NOT NULL DEFAULT FALSE,
    category_id   BIGINT        NOT NULL,
    amount_cents  BIGINT        NOT NULL,
    month         INTEGER       NOT NULL CHECK (month BETWEEN 1 AND 12),
    year          INTEGER       NOT NULL
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS recurring_transactions
(
    id             BIGSERIAL     PRIMARY KEY,
    owner_id       TEXT          NOT NULL,
    global_id      UUID          NOT NULL,
    updated_at     BIGINT        NOT NULL,
    changed_at     BIGINT        NOT NULL,
    is_deleted     BOOLEAN       NOT NULL DEFAULT FALSE,
    description    TEXT          NOT NULL DEFAULT '',
    amount_cents   BIGINT        NOT NULL,
    category_id    BIGINT        NOT NULL,
    type           SMALLINT      NOT NULL DEFAULT 0,
    frequency      SMALLINT      NOT NULL DEFAULT 2,
    day_of_month   INTEGER       NOT NULL DEFAULT 1,
    start_date     DATE          NOT NULL,
    next_due_date  DATE          NOT NULL,
    is_active      BOOLEAN       NOT NULL DEFAULT TRUE
);
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS savings_goal_transactions
(
    id               BIGSERIAL     PRIMARY KEY,
    owner_id         TEXT          NOT NULL,
    global_id        UUID          NOT NULL,
    updated_at       BIGINT        NOT NULL,
    changed_at       BIGINT        NOT NULL,
    is_deleted       BOOLEAN       NOT NULL DEFAULT FALSE,
    savings_goal_id  BIGINT        NOT NULL,
    date             DATE          NOT NULL,
    amount_cents     BIGINT        NOT NULL,
    type             SMALLINT      NOT NULL DEFAULT 0,
    note             TEXT          NOT NULL DEFAULT ''
);
        )");
    });
}

// Non-unique: duplicate global ids stay stored until the normalizer collapses them.
inline void init_indexes() {
    Transactions::exec("init_db_tables::init_indexes", [&](pqxx::work& txn) {
        for (const char* table : {"categories", "savings_goals", "settings", "transactions", "budgets",
                                  "recurring_transactions", "savings_goal_transactions"}) {
            txn.exec(fmt::format("CREATE INDEX IF NOT EXISTS idx_{0}_owner_global ON {0} (owner_id, global_id)", table));
            txn.exec(fmt::format("CREATE INDEX IF NOT EXISTS idx_{0}_owner_changed ON {0} (owner_id, changed_at)", table));
        }
    });
}

inline void init_tables() {
    init_ledger();
    init_indexes();
}

}
