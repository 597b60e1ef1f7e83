#pragma once

#include "domain/JournalLine.hpp"
#include "domain/AccountBalance.hpp"
#include "domain/ReportWarning.hpp"
#include <map>
#include <vector>
#include <string>
#include <cmath>

namespace reporting::application {

/**
 * @brief Свёртка строк проводок в обороты по счетам
 *
 * Чистая функция: результат не зависит от порядка строк.
 * Счета с нулевым сальдо сохраняются.
 */
class BalanceAggregator {
public:
    BalanceAggregator(const std::string& reportingCurrency, double tolerance)
        : reportingCurrency_(reportingCurrency), tolerance_(tolerance) {}

    std::map<std::string, domain::AccountBalance> aggregate(
        const std::vector<domain::JournalLine>& lines) const
    {
        std::map<std::string, domain::AccountBalance> balances;

        for (const auto& line : lines) {
            auto it = balances.find(line.accountCode);
            if (it == balances.end()) {
                domain::AccountBalance fresh(line.accountCode, reportingCurrency_);
                fresh.currency = line.originalCurrency;
                it = balances.emplace(line.accountCode, fresh).first;
            }
            auto& balance = it->second;

            if (balance.currency != line.originalCurrency) {
                balance.mixedCurrency = true;
                // Наименьший код, чтобы не зависеть от порядка строк
                if (line.originalCurrency < balance.currency) {
                    balance.currency = line.originalCurrency;
                }
            }

            balance.debit += line.debit;
            balance.credit += line.credit;
            balance.reportingDebit += line.reportingDebitIn(reportingCurrency_);
            balance.reportingCredit += line.reportingCreditIn(reportingCurrency_);
            balance.lineCount++;
        }

        for (auto& [code, balance] : balances) {
            balance.debit.currency = balance.currency;
            balance.credit.currency = balance.currency;
        }

        return balances;
    }

    /**
     * @brief Проверить, что каждая проведённая проводка сбалансирована
     *
     * Одно предупреждение UNBALANCED_ENTRY на проводку. Суммы в валюте операции
     * сравниваются только если все строки проводки в одной валюте.
     */
    std::vector<domain::ReportWarning> validateEntries(
        const std::vector<domain::JournalLine>& lines) const
    {
        struct EntryTotals {
            std::string entryNumber;
            std::string currency;
            bool singleCurrency = true;
            domain::Money debit;
            domain::Money credit;
            domain::Money reportingDebit;
            domain::Money reportingCredit;
        };

        std::map<std::string, EntryTotals> entries;
        for (const auto& line : lines) {
            if (line.entryStatus != domain::EntryStatus::POSTED) {
                continue;
            }
            auto [it, inserted] = entries.try_emplace(line.entryId);
            auto& totals = it->second;
            if (inserted) {
                totals.entryNumber = line.entryNumber;
                totals.currency = line.originalCurrency;
            } else if (totals.currency != line.originalCurrency) {
                totals.singleCurrency = false;
            }
            totals.debit += line.debit;
            totals.credit += line.credit;
            totals.reportingDebit += line.reportingDebitIn(reportingCurrency_);
            totals.reportingCredit += line.reportingCreditIn(reportingCurrency_);
        }

        std::vector<domain::ReportWarning> warnings;
        for (const auto& [entryId, totals] : entries) {
            bool transactionOk = !totals.singleCurrency ||
                withinTolerance(totals.debit - totals.credit);
            bool reportingOk = withinTolerance(totals.reportingDebit - totals.reportingCredit);
            if (transactionOk && reportingOk) {
                continue;
            }

            std::string message = "Entry " +
                (totals.entryNumber.empty() ? entryId : totals.entryNumber) +
                " is unbalanced: " + reportingCurrency_ + " debit " +
                std::to_string(totals.reportingDebit.toDouble()) + ", credit " +
                std::to_string(totals.reportingCredit.toDouble());
            if (!transactionOk) {
                message += "; " + totals.currency + " debit " +
                    std::to_string(totals.debit.toDouble()) + ", credit " +
                    std::to_string(totals.credit.toDouble());
            }
            warnings.emplace_back(domain::WarningKind::UNBALANCED_ENTRY, entryId, message);
        }
        return warnings;
    }

    /**
     * @brief Предупреждения по счетам со строками в разных валютах
     */
    std::vector<domain::ReportWarning> mixedCurrencyWarnings(
        const std::map<std::string, domain::AccountBalance>& balances) const
    {
        std::vector<domain::ReportWarning> warnings;
        for (const auto& [code, balance] : balances) {
            if (balance.mixedCurrency) {
                warnings.emplace_back(
                    domain::WarningKind::MIXED_CURRENCY, code,
                    "Account " + code + " has lines in more than one transaction currency; "
                    "only " + reportingCurrency_ + " totals are meaningful");
            }
        }
        return warnings;
    }

    static domain::Money netBalance(
        domain::AccountType type,
        const domain::Money& debit,
        const domain::Money& credit)
    {
        return domain::netBalance(type, debit, credit);
    }

    bool withinTolerance(const domain::Money& difference) const {
        return difference.isZero() || std::fabs(difference.toDouble()) < tolerance_;
    }

    const std::string& reportingCurrency() const { return reportingCurrency_; }

private:
    std::string reportingCurrency_;
    double tolerance_;
};

} // namespace reporting::application
