#pragma once

#include "AccountTree.hpp"
#include "Date.hpp"
#include <vector>

namespace reporting::domain {

/**
 * @brief Оборотно-сальдовая ведомость на дату
 *
 * Дерево всех активных счетов, суммы в валюте отчётности.
 * balanced, если |totalDebits - totalCredits| < допуска.
 */
struct TrialBalance {
    Date asOfDate;
    std::string currency = "BDT";
    AccountTree tree;
    Money totalDebits;
    Money totalCredits;
    bool balanced = true;
    std::vector<ReportWarning> warnings;

    Money difference() const { return totalDebits - totalCredits; }
};

} // namespace reporting::domain
