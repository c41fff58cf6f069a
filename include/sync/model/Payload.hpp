#pragma once

#include "sync/model/Dto.hpp"

#include <vector>

namespace tally::sync::model {

// One change set, grouped by entity type.
struct Payload {
    std::vector<CategoryDto> categories;
    std::vector<TransactionDto> transactions;
    std::vector<BudgetDto> budgets;
    std::vector<RecurringTransactionDto> recurring_transactions;
    std::vector<SettingsDto> settings;
    std::vector<SavingsGoalDto> savings_goals;
    std::vector<SavingsGoalTransactionDto> savings_goal_transactions;

    [[nodiscard]] std::size_t size() const {
        return categories.size() + transactions.size() + budgets.size() + recurring_transactions.size()
               + settings.size() + savings_goals.size() + savings_goal_transactions.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }
};

struct SyncRequest {
    util::Timestamp last_synced_at{};
    Payload client_changes;
};

struct SyncResponse {
    Payload server_changes;
    util::Timestamp synced_at{};
};

void to_json(nlohmann::json& j, const Payload& p);
void from_json(const nlohmann::json& j, Payload& p);
void to_json(nlohmann::json& j, const SyncRequest& r);
void from_json(const nlohmann::json& j, SyncRequest& r);
void to_json(nlohmann::json& j, const SyncResponse& r);
void from_json(const nlohmann::json& j, SyncResponse& r);

}
