#pragma once

#include "Account.hpp"
#include "Money.hpp"
#include "Date.hpp"
#include <vector>

namespace reporting::domain {

/**
 * @brief Строка карточки счёта с нарастающим сальдо
 */
struct AccountLedgerLine {
    std::string entryId;
    std::string entryNumber;
    Date date;
    std::string description;
    std::string reference;
    std::string originalCurrency;
    Money debit;                ///< В валюте отчётности
    Money credit;
    Money runningBalance;
};

/**
 * @brief Карточка счёта: проведённые строки до даты
 */
struct AccountLedger {
    Account account;
    Date asOfDate;
    std::string currency = "BDT";
    std::vector<AccountLedgerLine> lines;
    Money totalDebit;
    Money totalCredit;
    Money closingBalance;
};

} // namespace reporting::domain
