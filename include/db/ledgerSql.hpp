#pragma once

#include "ledger/schema.hpp"

#include <fmt/format.h>
#include <string>
#include <string_view>

namespace tally::db::sql {

// Prepared statement names are "<table>_<op>".
template <typename T>
std::string stmt(const std::string_view op) {
    return fmt::format("{}_{}", ledger::Schema<T>::table, op);
}

// Columns 0..4 are id, global_id, updated_at, changed_at, is_deleted; domain columns follow.
inline constexpr int kFirstDomainColumn = 5;

template <typename T>
std::string select(const std::string_view clause) {
    return fmt::format("SELECT id, global_id::text, updated_at, changed_at, is_deleted, {} FROM {} "
                       "WHERE owner_id = $1 {}",
                       ledger::domainColumnList<T>(), ledger::Schema<T>::table, clause);
}

template <typename T>
std::string insert() {
    std::string placeholders = "$1, $2::uuid, $3, $4, $5";
    for (int i = kFirstDomainColumn + 1; i <= kFirstDomainColumn + ledger::domainColumnCount<T>(); ++i)
        placeholders += fmt::format(", ${}", i);
    return fmt::format("INSERT INTO {} (owner_id, global_id, updated_at, changed_at, is_deleted, {}) "
                       "VALUES ({}) RETURNING id",
                       ledger::Schema<T>::table, ledger::domainColumnList<T>(), placeholders);
}

template <typename T>
std::string update() {
    std::string sets = "global_id = $2::uuid, updated_at = $3, changed_at = $4, is_deleted = $5";
    int idx = kFirstDomainColumn + 1;
    T probe;
    ledger::Schema<T>::fields(probe, [&](const char* col, auto&) { sets += fmt::format(", {} = ${}", col, idx++); });
    return fmt::format("UPDATE {} SET {} WHERE owner_id = $1 AND id = ${}", ledger::Schema<T>::table, sets, idx);
}

template <typename T>
std::string repoint() {
    return fmt::format("UPDATE {0} SET {1} = $3, updated_at = GREATEST(updated_at + 1, $4), changed_at = $4 "
                       "WHERE owner_id = $1 AND {1} = $2",
                       ledger::Schema<T>::table, ledger::Schema<T>::parentColumn);
}

template <typename T, typename Conn>
void prepareTable(Conn& conn) {
    constexpr auto table = ledger::Schema<T>::table;

    conn.prepare(stmt<T>("changed_since"), select<T>("AND (updated_at > $2 OR changed_at > $2) ORDER BY id"));
    conn.prepare(stmt<T>("written_since"), select<T>("AND changed_at > $2 ORDER BY id"));
    conn.prepare(stmt<T>("latest_change"),
                 fmt::format("SELECT COALESCE(MAX(changed_at), 0) FROM {} WHERE owner_id = $1", table));
    conn.prepare(stmt<T>("list_all"), select<T>("ORDER BY id"));
    conn.prepare(stmt<T>("list_active"), select<T>("AND is_deleted = FALSE ORDER BY id"));
    conn.prepare(stmt<T>("by_global_id"), select<T>("AND global_id = $2::uuid ORDER BY id DESC LIMIT 1"));
    conn.prepare(stmt<T>("by_id"), select<T>("AND id = $2"));
    conn.prepare(stmt<T>("insert"), insert<T>());
    conn.prepare(stmt<T>("update"), update<T>());
    conn.prepare(stmt<T>("erase"), fmt::format("DELETE FROM {} WHERE owner_id = $1 AND id = $2", table));
    conn.prepare(stmt<T>("identities"),
                 fmt::format("SELECT id, global_id::text FROM {} WHERE owner_id = $1 ORDER BY id", table));

    if constexpr (!ledger::Schema<T>::parentColumn.empty())
        conn.prepare(stmt<T>("repoint"), repoint<T>());
}

}
