#pragma once

#include "db/ledgerSql.hpp"
#include "ledger/Table.hpp"

#include <optional>
#include <type_traits>
#include <pqxx/pqxx>

namespace tally::db {

// The innermost open transaction of a PgLedger; nested scopes swap it.
struct TxnScope {
    pqxx::dbtransaction* current = nullptr;
};

namespace detail {

template <typename F>
void appendField(pqxx::params& p, const F& value) {
    if constexpr (std::is_same_v<F, std::string> || std::is_same_v<F, bool>) p.append(value);
    else if constexpr (std::is_enum_v<F>) p.append(types::toInt(value));
    else if constexpr (std::is_integral_v<F>) p.append(static_cast<std::int64_t>(value));
    else if constexpr (std::is_same_v<F, util::Date>) p.append(util::dateToString(value));
    else if constexpr (std::is_same_v<F, std::optional<util::Date>>) {
        if (value) p.append(util::dateToString(*value));
        else p.append();
    } else static_assert(!sizeof(F), "Unsupported column type");
}

template <typename Field, typename F>
void readField(const Field& f, F& out) {
    if constexpr (std::is_same_v<F, std::string>) out = f.template as<std::string>();
    else if constexpr (std::is_same_v<F, bool>) out = f.template as<bool>();
    else if constexpr (std::is_enum_v<F>) out = types::enumFromInt<F>(f.template as<int>());
    else if constexpr (std::is_integral_v<F>) out = static_cast<F>(f.template as<std::int64_t>());
    else if constexpr (std::is_same_v<F, util::Date>) out = util::parseDate(f.template as<std::string>());
    else if constexpr (std::is_same_v<F, std::optional<util::Date>>) {
        if (f.is_null()) out.reset();
        else out = util::parseDate(f.template as<std::string>());
    } else static_assert(!sizeof(F), "Unsupported column type");
}

}

// Table<T> over PostgreSQL prepared statements, scoped to one owner.
template <typename T>
class PgTable final : public ledger::Table<T> {
public:
    PgTable(TxnScope& scope, std::string ownerId) : scope_(scope), ownerId_(std::move(ownerId)) {}

    std::vector<T> listChangedSince(const util::Timestamp since) override {
        return readAll(txn().exec(pqxx::prepped{sql::stmt<T>("changed_since")},
                                  pqxx::params{ownerId_, util::toMicros(since)}));
    }

    std::vector<T> listWrittenSince(const util::Timestamp since) override {
        return readAll(txn().exec(pqxx::prepped{sql::stmt<T>("written_since")},
                                  pqxx::params{ownerId_, util::toMicros(since)}));
    }

    util::Timestamp latestChange() override {
        return util::fromMicros(txn().exec(pqxx::prepped{sql::stmt<T>("latest_change")}, pqxx::params{ownerId_})
                                    .one_field()
                                    .template as<std::int64_t>());
    }

    std::vector<T> listAll() override {
        return readAll(txn().exec(pqxx::prepped{sql::stmt<T>("list_all")}, pqxx::params{ownerId_}));
    }

    std::vector<T> listActive() override {
        return readAll(txn().exec(pqxx::prepped{sql::stmt<T>("list_active")}, pqxx::params{ownerId_}));
    }

    std::optional<T> findByGlobalId(const ledger::GlobalId& id) override {
        const auto res = txn().exec(pqxx::prepped{sql::stmt<T>("by_global_id")}, pqxx::params{ownerId_, id});
        if (res.empty()) return std::nullopt;
        return read(res[0]);
    }

    std::optional<T> findByLocalId(const ledger::LocalId id) override {
        const auto res = txn().exec(pqxx::prepped{sql::stmt<T>("by_id")}, pqxx::params{ownerId_, id});
        if (res.empty()) return std::nullopt;
        return read(res[0]);
    }

    ledger::LocalId upsertByLocalId(const T& record) override {
        auto p = params(record);
        if (!record.persisted())
            return txn().exec(pqxx::prepped{sql::stmt<T>("insert")}, p).one_field().template as<ledger::LocalId>();

        p.append(record.id);
        const auto res = txn().exec(pqxx::prepped{sql::stmt<T>("update")}, p);
        if (res.affected_rows() == 0)
            throw std::runtime_error(fmt::format("No {} row with id {} for this owner",
                                                 types::entityName<T>(), record.id));
        return record.id;
    }

    void erase(const ledger::LocalId id) override {
        txn().exec(pqxx::prepped{sql::stmt<T>("erase")}, pqxx::params{ownerId_, id});
    }

    std::vector<std::pair<ledger::LocalId, ledger::GlobalId>> identities() override {
        std::vector<std::pair<ledger::LocalId, ledger::GlobalId>> out;
        for (const auto& row : txn().exec(pqxx::prepped{sql::stmt<T>("identities")}, pqxx::params{ownerId_}))
            out.emplace_back(row[0].template as<ledger::LocalId>(), row[1].template as<std::string>());
        return out;
    }

    std::size_t repointParent(const ledger::LocalId from, const ledger::LocalId to, const util::Timestamp now) override {
        if constexpr (ledger::Schema<T>::parentColumn.empty()) {
            return 0;
        } else {
            const auto res = txn().exec(pqxx::prepped{sql::stmt<T>("repoint")},
                                        pqxx::params{ownerId_, from, to, util::toMicros(now)});
            return static_cast<std::size_t>(res.affected_rows());
        }
    }

private:
    TxnScope& scope_;
    std::string ownerId_;

    pqxx::dbtransaction& txn() const {
        if (!scope_.current) throw std::logic_error("PgTable used outside a transaction");
        return *scope_.current;
    }

    // $1 owner, $2..$5 sync columns, then the domain columns
    pqxx::params params(const T& r) const {
        pqxx::params p;
        p.append(ownerId_);
        p.append(r.global_id);
        p.append(util::toMicros(r.updated_at));
        p.append(util::toMicros(r.changed_at));
        p.append(r.is_deleted);
        ledger::Schema<T>::fields(r, [&](const char*, const auto& value) { detail::appendField(p, value); });
        return p;
    }

    static T read(const pqxx::row& row) {
        T r;
        r.id = row[0].template as<ledger::LocalId>();
        r.global_id = row[1].template as<std::string>();
        r.updated_at = util::fromMicros(row[2].template as<std::int64_t>());
        r.changed_at = util::fromMicros(row[3].template as<std::int64_t>());
        r.is_deleted = row[4].template as<bool>();
        int col = sql::kFirstDomainColumn;
        ledger::Schema<T>::fields(r, [&](const char*, auto& field) { detail::readField(row[col++], field); });
        return r;
    }

    static std::vector<T> readAll(const pqxx::result& res) {
        std::vector<T> out;
        out.reserve(res.size());
        for (const auto& row : res) out.push_back(read(row));
        return out;
    }
};

}
