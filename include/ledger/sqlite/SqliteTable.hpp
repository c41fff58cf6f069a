#pragma once

#include "ledger/Table.hpp"
#include "ledger/schema.hpp"
#include "ledger/sqlite/Database.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <fmt/format.h>

namespace tally::ledger::sqlite {

namespace detail {

// Column 0..4 of every select: id, global_id, updated_at, changed_at, is_deleted.
inline constexpr int kFirstDomainColumn = 5;
inline constexpr const char* kMetaColumns = "id, global_id, updated_at, changed_at, is_deleted";

template <typename F>
void bindField(Statement& st, const int idx, const F& value) {
    if constexpr (std::is_same_v<F, std::string>) st.bind(idx, value);
    else if constexpr (std::is_same_v<F, bool>) st.bind(idx, static_cast<std::int64_t>(value ? 1 : 0));
    else if constexpr (std::is_enum_v<F>) st.bind(idx, static_cast<std::int64_t>(value));
    else if constexpr (std::is_integral_v<F>) st.bind(idx, static_cast<std::int64_t>(value));
    else if constexpr (std::is_same_v<F, util::Date>) st.bind(idx, util::dateToString(value));
    else if constexpr (std::is_same_v<F, std::optional<util::Date>>) {
        if (value) st.bind(idx, util::dateToString(*value));
        else st.bindNull(idx);
    } else static_assert(!sizeof(F), "Unsupported column type");
}

template <typename F>
void readField(const Statement& st, const int col, F& out) {
    if constexpr (std::is_same_v<F, std::string>) out = st.textAt(col);
    else if constexpr (std::is_same_v<F, bool>) out = st.int64At(col) != 0;
    else if constexpr (std::is_enum_v<F>) out = types::enumFromInt<F>(static_cast<int>(st.int64At(col)));
    else if constexpr (std::is_integral_v<F>) out = static_cast<F>(st.int64At(col));
    else if constexpr (std::is_same_v<F, util::Date>) out = util::parseDate(st.textAt(col));
    else if constexpr (std::is_same_v<F, std::optional<util::Date>>) {
        if (st.isNull(col)) out.reset();
        else out = util::parseDate(st.textAt(col));
    } else static_assert(!sizeof(F), "Unsupported column type");
}

}

// Table<T> over one SQLite connection, scoped to an owner id. The device store
// uses the empty owner.
template <typename T>
class SqliteTable final : public Table<T> {
public:
    SqliteTable(std::shared_ptr<Database> db, std::string ownerId)
        : db_(std::move(db)), ownerId_(std::move(ownerId)) {}

    std::vector<T> listChangedSince(const util::Timestamp since) override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(select("AND (updated_at > ?2 OR changed_at > ?2) ORDER BY id"));
        st.bind(1, ownerId_);
        st.bind(2, util::toMicros(since));
        return readAll(st);
    }

    std::vector<T> listWrittenSince(const util::Timestamp since) override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(select("AND changed_at > ?2 ORDER BY id"));
        st.bind(1, ownerId_);
        st.bind(2, util::toMicros(since));
        return readAll(st);
    }

    util::Timestamp latestChange() override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(fmt::format("SELECT COALESCE(MAX(changed_at), 0) FROM {} WHERE owner_id = ?1",
                                           Schema<T>::table));
        st.bind(1, ownerId_);
        if (!st.step()) return util::kEpoch;
        return util::fromMicros(st.int64At(0));
    }

    std::vector<T> listAll() override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(select("ORDER BY id"));
        st.bind(1, ownerId_);
        return readAll(st);
    }

    std::vector<T> listActive() override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(select("AND is_deleted = 0 ORDER BY id"));
        st.bind(1, ownerId_);
        return readAll(st);
    }

    std::optional<T> findByGlobalId(const GlobalId& id) override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(select("AND global_id = ?2 ORDER BY id DESC LIMIT 1"));
        st.bind(1, ownerId_);
        st.bind(2, id);
        if (!st.step()) return std::nullopt;
        return read(st);
    }

    std::optional<T> findByLocalId(const LocalId id) override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(select("AND id = ?2"));
        st.bind(1, ownerId_);
        st.bind(2, id);
        if (!st.step()) return std::nullopt;
        return read(st);
    }

    LocalId upsertByLocalId(const T& record) override {
        std::lock_guard lock(db_->mutex());
        if (!record.persisted()) {
            auto st = db_->prepare(insertSql());
            bindRecord(st, record);
            st.run();
            return db_->lastInsertRowId();
        }

        auto st = db_->prepare(updateSql());
        bindRecord(st, record);
        st.bind(detail::kFirstDomainColumn + 1 + domainColumnCount<T>(), record.id);
        st.run();
        if (db_->changes() == 0)
            throw SqliteError(fmt::format("No {} row with id {} for this owner", types::entityName<T>(), record.id),
                              0);
        return record.id;
    }

    void erase(const LocalId id) override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(fmt::format("DELETE FROM {} WHERE owner_id = ?1 AND id = ?2", Schema<T>::table));
        st.bind(1, ownerId_);
        st.bind(2, id);
        st.run();
    }

    std::vector<std::pair<LocalId, GlobalId>> identities() override {
        std::lock_guard lock(db_->mutex());
        auto st = db_->prepare(fmt::format("SELECT id, global_id FROM {} WHERE owner_id = ?1 ORDER BY id",
                                           Schema<T>::table));
        st.bind(1, ownerId_);
        std::vector<std::pair<LocalId, GlobalId>> out;
        while (st.step()) out.emplace_back(st.int64At(0), st.textAt(1));
        return out;
    }

    std::size_t repointParent(const LocalId from, const LocalId to, const util::Timestamp now) override {
        if constexpr (Schema<T>::parentColumn.empty()) {
            return 0;
        } else {
            std::lock_guard lock(db_->mutex());
            // updated_at must move forward even when a skewed writer stamped it past now
            auto st = db_->prepare(fmt::format(
                "UPDATE {0} SET {1} = ?3, updated_at = MAX(updated_at + 1, ?4), changed_at = ?4 "
                "WHERE owner_id = ?1 AND {1} = ?2",
                Schema<T>::table, Schema<T>::parentColumn));
            st.bind(1, ownerId_);
            st.bind(2, from);
            st.bind(3, to);
            st.bind(4, util::toMicros(now));
            st.run();
            return static_cast<std::size_t>(db_->changes());
        }
    }

private:
    std::shared_ptr<Database> db_;
    std::string ownerId_;

    static std::string select(const std::string_view clause) {
        return fmt::format("SELECT {}, {} FROM {} WHERE owner_id = ?1 {}", detail::kMetaColumns,
                           domainColumnList<T>(), Schema<T>::table, clause);
    }

    static std::string insertSql() {
        std::string placeholders;
        for (int i = 1; i <= detail::kFirstDomainColumn + domainColumnCount<T>(); ++i)
            placeholders += (i == 1 ? "?" : ", ?") + std::to_string(i);
        return fmt::format("INSERT INTO {} (owner_id, global_id, updated_at, changed_at, is_deleted, {}) VALUES ({})",
                           Schema<T>::table, domainColumnList<T>(), placeholders);
    }

    static std::string updateSql() {
        std::string sets = "global_id = ?2, updated_at = ?3, changed_at = ?4, is_deleted = ?5";
        int idx = detail::kFirstDomainColumn + 1;
        T probe;
        Schema<T>::fields(probe, [&](const char* col, auto&) {
            sets += fmt::format(", {} = ?{}", col, idx++);
        });
        return fmt::format("UPDATE {} SET {} WHERE owner_id = ?1 AND id = ?{}", Schema<T>::table, sets, idx);
    }

    // Binds ?1 owner, ?2..?5 sync columns, then the domain columns.
    void bindRecord(Statement& st, const T& r) const {
        st.bind(1, ownerId_);
        st.bind(2, r.global_id);
        st.bind(3, util::toMicros(r.updated_at));
        st.bind(4, util::toMicros(r.changed_at));
        st.bind(5, static_cast<std::int64_t>(r.is_deleted ? 1 : 0));
        int idx = detail::kFirstDomainColumn + 1;
        Schema<T>::fields(r, [&](const char*, const auto& value) { detail::bindField(st, idx++, value); });
    }

    static T read(const Statement& st) {
        T r;
        r.id = st.int64At(0);
        r.global_id = st.textAt(1);
        r.updated_at = util::fromMicros(st.int64At(2));
        r.changed_at = util::fromMicros(st.int64At(3));
        r.is_deleted = st.int64At(4) != 0;
        int col = detail::kFirstDomainColumn;
        Schema<T>::fields(r, [&](const char*, auto& field) { detail::readField(st, col++, field); });
        return r;
    }

    static std::vector<T> readAll(Statement& st) {
        std::vector<T> out;
        while (st.step()) out.push_back(read(st));
        return out;
    }
};

}
