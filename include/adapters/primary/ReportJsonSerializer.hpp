#pragma once

#include "domain/TrialBalance.hpp"
#include "domain/BalanceSheet.hpp"
#include "domain/ArBreakdown.hpp"
#include "domain/FxAnalysis.hpp"
#include "domain/AccountLedger.hpp"
#include "domain/FxRate.hpp"
#include <nlohmann/json.hpp>

namespace reporting::adapters::primary {

/**
 * @brief Отчёты -> JSON
 *
 * Ключи в snake_case, суммы - числа в валюте отчёта,
 * для сумм в валюте операции рядом указывается currency.
 */
class ReportJsonSerializer {
public:
    static nlohmann::json toJson(const domain::TrialBalance& report);
    static nlohmann::json toJson(const domain::BalanceSheet& report);
    static nlohmann::json toJson(const domain::ArBreakdown& report);
    static nlohmann::json toJson(const domain::FxAnalysis& report);
    static nlohmann::json toJson(const domain::AccountLedger& report);
    static nlohmann::json toJson(const domain::FxRate& rate);

    static nlohmann::json moneyToJson(const domain::Money& money);
    static nlohmann::json warningsToJson(const std::vector<domain::ReportWarning>& warnings);
};

} // namespace reporting::adapters::primary
