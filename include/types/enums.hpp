#pragma once

#include <stdexcept>
#include <string>

namespace tally::types {

enum class CategoryType { Fixed = 0, Discretionary = 1, Savings = 2 };

enum class TransactionType { Expense = 0, Income = 1 };

enum class Frequency { Weekly = 0, Biweekly = 1, Monthly = 2, Yearly = 3 };

enum class SavingsGoalStatus { Active = 0, Paused = 1, Completed = 2 };

enum class SavingsGoalTransactionType { Contribution = 0, Withdrawal = 1 };

template <typename E> constexpr int enumMax();
template <> constexpr int enumMax<CategoryType>() { return 2; }
template <> constexpr int enumMax<TransactionType>() { return 1; }
template <> constexpr int enumMax<Frequency>() { return 3; }
template <> constexpr int enumMax<SavingsGoalStatus>() { return 2; }
template <> constexpr int enumMax<SavingsGoalTransactionType>() { return 1; }

template <typename E> constexpr int toInt(const E e) { return static_cast<int>(e); }

template <typename E> E enumFromInt(const int v) {
    if (v < 0 || v > enumMax<E>())
        throw std::invalid_argument("Enum value out of range: " + std::to_string(v));
    return static_cast<E>(v);
}

}
