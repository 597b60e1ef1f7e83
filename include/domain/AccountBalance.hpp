#pragma once

#include "Money.hpp"
#include "enums/AccountType.hpp"
#include <string>

namespace reporting::domain {

/**
 * @brief Сальдо по знаку типа счёта
 *
 * asset, expense:             net = debit - credit
 * liability, equity, revenue: net = credit - debit
 */
inline Money netBalance(AccountType type, const Money& debit, const Money& credit) {
    return isDebitNormal(type) ? debit - credit : credit - debit;
}

/**
 * @brief Обороты по одному счёту
 *
 * debit/credit - в валюте операции (currency), reportingDebit/reportingCredit -
 * в валюте отчётности. Если по счёту были строки в разных валютах, обороты
 * в валюте операции не имеют смысла и помечаются mixedCurrency.
 */
struct AccountBalance {
    std::string accountCode;
    Money debit;
    Money credit;
    Money reportingDebit;
    Money reportingCredit;
    std::string currency;
    bool mixedCurrency = false;
    size_t lineCount = 0;

    AccountBalance() = default;

    AccountBalance(const std::string& code, const std::string& reportingCurrency)
        : accountCode(code),
          debit(Money::zero(reportingCurrency)),
          credit(Money::zero(reportingCurrency)),
          reportingDebit(Money::zero(reportingCurrency)),
          reportingCredit(Money::zero(reportingCurrency)),
          currency(reportingCurrency) {}

    Money net(AccountType type) const {
        return netBalance(type, debit, credit);
    }

    Money reportingNet(AccountType type) const {
        return netBalance(type, reportingDebit, reportingCredit);
    }
};

} // namespace reporting::domain
