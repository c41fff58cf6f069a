#include "sync/model/Payload.hpp"

#include <nlohmann/json.hpp>

namespace tally::sync::model {

namespace {

template <typename T>
void list_from_json(const nlohmann::json& j, const char* key, std::vector<T>& out) {
    out.clear();
    if (!j.contains(key) || j.at(key).is_null()) return;
    out = j.at(key).get<std::vector<T>>();
}

}

void to_json(nlohmann::json& j, const Payload& p) {
    j = {
        {"categories", p.categories},
        {"transactions", p.transactions},
        {"budgets", p.budgets},
        {"recurring_transactions", p.recurring_transactions},
        {"settings", p.settings},
        {"savings_goals", p.savings_goals},
        {"savings_goal_transactions", p.savings_goal_transactions}
    };
}

void from_json(const nlohmann::json& j, Payload& p) {
    if (!j.is_object()) throw std::invalid_argument("Change set must be a JSON object");
    list_from_json(j, "categories", p.categories);
    list_from_json(j, "transactions", p.transactions);
    list_from_json(j, "budgets", p.budgets);
    list_from_json(j, "recurring_transactions", p.recurring_transactions);
    list_from_json(j, "settings", p.settings);
    list_from_json(j, "savings_goals", p.savings_goals);
    list_from_json(j, "savings_goal_transactions", p.savings_goal_transactions);
}

void to_json(nlohmann::json& j, const SyncRequest& r) {
    j = {
        {"last_synced_at", util::timestampToString(r.last_synced_at)},
        {"client_changes", r.client_changes}
    };
}

void from_json(const nlohmann::json& j, SyncRequest& r) {
    r.last_synced_at = util::parseTimestamp(j.at("last_synced_at").get<std::string>());
    if (j.contains("client_changes")) r.client_changes = j.at("client_changes").get<Payload>();
}

void to_json(nlohmann::json& j, const SyncResponse& r) {
    j = {
        {"server_changes", r.server_changes},
        {"synced_at", util::timestampToString(r.synced_at)}
    };
}

void from_json(const nlohmann::json& j, SyncResponse& r) {
    r.synced_at = util::parseTimestamp(j.at("synced_at").get<std::string>());
    if (j.contains("server_changes")) r.server_changes = j.at("server_changes").get<Payload>();
}

}
