#pragma once

#include "types/entities.hpp"

#include <string_view>

namespace tally::ledger {

// Storage layout of each entity: table name, parent reference column and the
// domain columns in declaration order. The sync columns (id, owner_id,
// global_id, updated_at, changed_at, is_deleted) are common to every table.
//
// fields() hands each (column, member) pair to a backend visitor; R is T or const T.
template <typename T> struct Schema;

template <> struct Schema<types::Category> {
    static constexpr std::string_view table = "categories";
    static constexpr std::string_view parentColumn = {};

    template <typename R, typename V> static void fields(R& r, V&& v) {
        v("name", r.name);
        v("icon", r.icon);
        v("color", r.color);
        v("default_budget_cents", r.default_budget_cents);
        v("type", r.type);
    }
};

template <> struct Schema<types::Transaction> {
    static constexpr std::string_view table = "transactions";
    static constexpr std::string_view parentColumn = "category_id";

    template <typename R, typename V> static void fields(R& r, V&& v) {
        v("description", r.description);
        v("amount_cents", r.amount_cents);
        v("date", r.date);
        v("category_id", r.category_id);
        v("type", r.type);
    }
};

template <> struct Schema<types::Budget> {
    static constexpr std::string_view table = "budgets";
    static constexpr std::string_view parentColumn = "category_id";

    template <typename R, typename V> static void fields(R& r, V&& v) {
        v("category_id", r.category_id);
        v("amount_cents", r.amount_cents);
        v("month", r.month);
        v("year", r.year);
    }
};

template <> struct Schema<types::RecurringTransaction> {
    static constexpr std::string_view table = "recurring_transactions";
    static constexpr std::string_view parentColumn = "category_id";

    template <typename R, typename V> static void fields(R& r, V&& v) {
        v("description", r.description);
        v("amount_cents", r.amount_cents);
        v("category_id", r.category_id);
        v("type", r.type);
        v("frequency", r.frequency);
        v("day_of_month", r.day_of_month);
        v("start_date", r.start_date);
        v("next_due_date", r.next_due_date);
        v("is_active", r.is_active);
    }
};

template <> struct Schema<types::Settings> {
    static constexpr std::string_view table = "settings";
    static constexpr std::string_view parentColumn = {};

    template <typename R, typename V> static void fields(R& r, V&& v) {
        v("monthly_income_cents", r.monthly_income_cents);
    }
};

template <> struct Schema<types::SavingsGoal> {
    static constexpr std::string_view table = "savings_goals";
    static constexpr std::string_view parentColumn = {};

    template <typename R, typename V> static void fields(R& r, V&& v) {
        v("name", r.name);
        v("icon", r.icon);
        v("color", r.color);
        v("goal_cents", r.goal_cents);
        v("current_balance_cents", r.current_balance_cents);
        v("monthly_contribution_cents", r.monthly_contribution_cents);
        v("start_date", r.start_date);
        v("target_date", r.target_date);
        v("status", r.status);
        v("auto_contribute", r.auto_contribute);
        v("last_auto_contribute_date", r.last_auto_contribute_date);
    }
};

template <> struct Schema<types::SavingsGoalTransaction> {
    static constexpr std::string_view table = "savings_goal_transactions";
    static constexpr std::string_view parentColumn = "savings_goal_id";

    template <typename R, typename V> static void fields(R& r, V&& v) {
        v("savings_goal_id", r.savings_goal_id);
        v("date", r.date);
        v("amount_cents", r.amount_cents);
        v("type", r.type);
        v("note", r.note);
    }
};

template <typename T>
std::string domainColumnList() {
    std::string out;
    T probe;
    Schema<T>::fields(probe, [&](const char* col, auto&) {
        if (!out.empty()) out += ", ";
        out += col;
    });
    return out;
}

template <typename T>
int domainColumnCount() {
    int n = 0;
    T probe;
    Schema<T>::fields(probe, [&](const char*, auto&) { ++n; });
    return n;
}

}
