#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "ReportWarning.hpp"
#include "enums/ArStatus.hpp"
#include <vector>
#include <map>
#include <optional>

namespace reporting::domain {

/**
 * @brief Строка разбивки дебиторской задолженности
 */
struct ArBreakdownItem {
    std::string invoiceId;
    std::string invoiceNumber;
    std::string customerName;
    std::string currency;
    Money totalAmount;
    Money allocatedAmount;
    Money remainingAmount;
    std::optional<double> rate;     ///< Курс, по которому посчитан reportingAmount
    Money reportingAmount;
    Date date;
    Date dueDate;
    int64_t daysOverdue = 0;        ///< Никогда не отрицательно
    ArStatus status = ArStatus::OPEN;
};

/**
 * @brief Итог по одному статусу: количество и сумма в валюте отчётности
 */
struct ArStatusSummary {
    size_t count = 0;
    Money total;
};

/**
 * @brief Разбивка неоплаченных инвойсов на дату
 */
struct ArBreakdown {
    Date asOfDate;
    std::string currency = "BDT";
    std::vector<ArBreakdownItem> items;
    Money totalReporting;
    std::map<ArStatus, ArStatusSummary> byStatus;
    std::vector<ReportWarning> warnings;
};

} // namespace reporting::domain
