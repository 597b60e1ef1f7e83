#pragma once

#include "FxAnalysis.hpp"
#include "enums/AccountType.hpp"
#include <vector>

namespace reporting::domain {

/**
 * @brief Строка баланса: сальдо одного счёта
 */
struct BalanceSheetLine {
    std::string accountCode;
    std::string accountName;
    AccountType type = AccountType::ASSET;
    int depth = 0;
    Money balance;              ///< В валюте операции
    Money reportingBalance;     ///< В валюте отчётности
    bool mixedCurrency = false;
};

/**
 * @brief Баланс на дату с наложением нереализованной курсовой разницы
 *
 * Итоги секций считаются по собственным сальдо счетов, без свёртки
 * по дереву, поэтому родитель и ребёнок не суммируются дважды.
 */
struct BalanceSheet {
    Date asOfDate;
    std::string currency = "BDT";
    std::vector<BalanceSheetLine> assets;
    std::vector<BalanceSheetLine> liabilities;
    std::vector<BalanceSheetLine> equity;
    Money totalAssets;
    Money totalLiabilities;
    Money totalEquity;
    Money liabilitiesAndEquity;
    FxAnalysis unrealizedFx;
    std::vector<ReportWarning> warnings;
};

} // namespace reporting::domain
