#pragma once

#include "db/DBPool.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <utility>

namespace tally::db {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg) { dbPool_ = std::make_shared<DBPool>(cfg); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            pqxx::work txn(conn->get());

            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Transaction '{}' rolled back: {}", ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        } catch (...) {
            log::Registry::db()->error("[Transactions::exec] Transaction '{}' rolled back", ctx);
            dbPool_->release(std::move(conn));
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }
};

}
