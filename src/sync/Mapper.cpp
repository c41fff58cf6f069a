#include "sync/Mapper.hpp"

using namespace tally::types;
using namespace tally::sync::model;

namespace tally::sync::mapper {

namespace {

GlobalId resolve(const ledger::LocalToGlobal& table, const LocalId id) {
    if (id == kNoLocalId) return {};
    const auto it = table.find(id);
    return it == table.end() ? GlobalId{} : it->second;
}

void copyMeta(const SyncMeta& from, WireMeta& to) {
    to.global_id = from.global_id;
    to.updated_at = from.updated_at;
    to.is_deleted = from.is_deleted;
}

void copyMeta(const WireMeta& from, SyncMeta& to) {
    to.id = kNoLocalId;
    to.global_id = from.global_id;
    to.updated_at = from.updated_at;
    to.is_deleted = from.is_deleted;
}

}

CategoryDto toWire(const Category& c) {
    CategoryDto d;
    copyMeta(c, d);
    d.name = c.name;
    d.icon = c.icon;
    d.color = c.color;
    d.default_budget_cents = c.default_budget_cents;
    d.type = toInt(c.type);
    return d;
}

TransactionDto toWire(const Transaction& t, const ledger::LocalToGlobal& categories) {
    TransactionDto d;
    copyMeta(t, d);
    d.description = t.description;
    d.amount_cents = t.amount_cents;
    d.date = t.date;
    d.category_global_id = resolve(categories, t.category_id);
    d.type = toInt(t.type);
    return d;
}

BudgetDto toWire(const Budget& b, const ledger::LocalToGlobal& categories) {
    BudgetDto d;
    copyMeta(b, d);
    d.category_global_id = resolve(categories, b.category_id);
    d.amount_cents = b.amount_cents;
    d.month = b.month;
    d.year = b.year;
    return d;
}

RecurringTransactionDto toWire(const RecurringTransaction& r, const ledger::LocalToGlobal& categories) {
    RecurringTransactionDto d;
    copyMeta(r, d);
    d.description = r.description;
    d.amount_cents = r.amount_cents;
    d.category_global_id = resolve(categories, r.category_id);
    d.type = toInt(r.type);
    d.frequency = toInt(r.frequency);
    d.day_of_month = r.day_of_month;
    d.start_date = r.start_date;
    d.next_due_date = r.next_due_date;
    d.is_active = r.is_active;
    return d;
}

SettingsDto toWire(const Settings& s) {
    SettingsDto d;
    copyMeta(s, d);
    d.monthly_income_cents = s.monthly_income_cents;
    return d;
}

SavingsGoalDto toWire(const SavingsGoal& g) {
    SavingsGoalDto d;
    copyMeta(g, d);
    d.name = g.name;
    d.icon = g.icon;
    d.color = g.color;
    d.goal_cents = g.goal_cents;
    d.current_balance_cents = g.current_balance_cents;
    d.monthly_contribution_cents = g.monthly_contribution_cents;
    d.start_date = g.start_date;
    d.target_date = g.target_date;
    d.status = toInt(g.status);
    d.auto_contribute = g.auto_contribute;
    d.last_auto_contribute_date = g.last_auto_contribute_date;
    return d;
}

SavingsGoalTransactionDto toWire(const SavingsGoalTransaction& t, const ledger::LocalToGlobal& goals) {
    SavingsGoalTransactionDto d;
    copyMeta(t, d);
    d.savings_goal_global_id = resolve(goals, t.savings_goal_id);
    d.date = t.date;
    d.amount_cents = t.amount_cents;
    d.type = toInt(t.type);
    d.note = t.note;
    return d;
}

Category fromWire(const CategoryDto& d) {
    Category c;
    copyMeta(d, c);
    c.name = d.name;
    c.icon = d.icon;
    c.color = d.color;
    c.default_budget_cents = d.default_budget_cents;
    c.type = enumFromInt<CategoryType>(d.type);
    return c;
}

Transaction fromWire(const TransactionDto& d, const LocalId categoryId) {
    Transaction t;
    copyMeta(d, t);
    t.description = d.description;
    t.amount_cents = d.amount_cents;
    t.date = d.date;
    t.category_id = categoryId;
    t.type = enumFromInt<TransactionType>(d.type);
    return t;
}

Budget fromWire(const BudgetDto& d, const LocalId categoryId) {
    Budget b;
    copyMeta(d, b);
    b.category_id = categoryId;
    b.amount_cents = d.amount_cents;
    b.month = d.month;
    b.year = d.year;
    return b;
}

RecurringTransaction fromWire(const RecurringTransactionDto& d, const LocalId categoryId) {
    RecurringTransaction r;
    copyMeta(d, r);
    r.description = d.description;
    r.amount_cents = d.amount_cents;
    r.category_id = categoryId;
    r.type = enumFromInt<TransactionType>(d.type);
    r.frequency = enumFromInt<Frequency>(d.frequency);
    r.day_of_month = d.day_of_month;
    r.start_date = d.start_date;
    r.next_due_date = d.next_due_date;
    r.is_active = d.is_active;
    return r;
}

Settings fromWire(const SettingsDto& d) {
    Settings s;
    copyMeta(d, s);
    s.monthly_income_cents = d.monthly_income_cents;
    return s;
}

SavingsGoal fromWire(const SavingsGoalDto& d) {
    SavingsGoal g;
    copyMeta(d, g);
    g.name = d.name;
    g.icon = d.icon;
    g.color = d.color;
    g.goal_cents = d.goal_cents;
    g.current_balance_cents = d.current_balance_cents;
    g.monthly_contribution_cents = d.monthly_contribution_cents;
    g.start_date = d.start_date;
    g.target_date = d.target_date;
    g.status = enumFromInt<SavingsGoalStatus>(d.status);
    g.auto_contribute = d.auto_contribute;
    g.last_auto_contribute_date = d.last_auto_contribute_date;
    return g;
}

SavingsGoalTransaction fromWire(const SavingsGoalTransactionDto& d, const LocalId savingsGoalId) {
    SavingsGoalTransaction t;
    copyMeta(d, t);
    t.savings_goal_id = savingsGoalId;
    t.date = d.date;
    t.amount_cents = d.amount_cents;
    t.type = enumFromInt<SavingsGoalTransactionType>(d.type);
    t.note = d.note;
    return t;
}

}
