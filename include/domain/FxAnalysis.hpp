#pragma once

#include "ForeignPosition.hpp"
#include "VirtualJournalLine.hpp"
#include "ReportWarning.hpp"
#include <vector>
#include <set>

namespace reporting::domain {

/**
 * @brief Сводка по валюте без курса: сколько позиций ждут ручного ввода курса
 */
struct MissingRate {
    std::string currency;
    size_t positionsCount = 0;
    Money totalAmount;              ///< В валюте позиции
};

/**
 * @brief Результат переоценки валютных позиций на дату
 *
 * totalGain/totalLoss суммируют все переоценённые позиции, включая разницы
 * не больше порога, которые virtualJournal не проводит. Поэтому totalGain
 * может отличаться от кредита счёта "Unrealized FX Gain" на эти копейки.
 */
struct FxAnalysis {
    Date asOfDate;
    std::string reportingCurrency = "BDT";
    std::vector<ForeignPosition> positions;
    std::set<std::string> missingCurrencies;
    std::vector<MissingRate> missingRates;
    std::vector<VirtualJournalLine> virtualJournal;
    Money totalGain;
    Money totalLoss;                ///< Модуль суммы убытков
    Money netGainLoss;
    std::vector<ReportWarning> warnings;

    bool hasMissingRates() const { return !missingCurrencies.empty(); }
};

} // namespace reporting::domain
