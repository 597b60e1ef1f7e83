#pragma once

#include "application/FxRateResolver.hpp"
#include "domain/FxAnalysis.hpp"
#include "domain/Invoice.hpp"
#include "domain/BankAccount.hpp"
#include <map>
#include <vector>
#include <string>

namespace reporting::application {

/**
 * @brief Переоценка открытых валютных позиций
 *
 * Позиции: неоплаченная часть инвойсов иностранным клиентам и остатки
 * валютных банковских счетов. gainLoss = remaining * (current - historical).
 *
 * Позиция без текущего курса остаётся в списке с пустым currentRate,
 * её валюта попадает в missingCurrencies, в итоги она не входит.
 */
class UnrealizedFxCalculator {
public:
    UnrealizedFxCalculator(const std::string& reportingCurrency, double tolerance)
        : reportingCurrency_(reportingCurrency), tolerance_(tolerance) {}

    /**
     * @param allocations Распределения платежей по id инвойса
     */
    domain::FxAnalysis computePositions(
        const std::vector<domain::Invoice>& invoices,
        const std::map<std::string, std::vector<domain::PaymentAllocation>>& allocations,
        const std::vector<domain::BankAccount>& bankAccounts,
        FxRateResolver& resolver,
        const domain::Date& asOfDate) const
    {
        domain::FxAnalysis analysis;
        analysis.asOfDate = asOfDate;
        analysis.reportingCurrency = reportingCurrency_;
        analysis.totalGain = domain::Money::zero(reportingCurrency_);
        analysis.totalLoss = domain::Money::zero(reportingCurrency_);
        analysis.netGainLoss = domain::Money::zero(reportingCurrency_);

        std::map<std::string, domain::MissingRate> missing;

        for (const auto& invoice : invoices) {
            if (invoice.currency == reportingCurrency_) {
                continue;
            }

            domain::Money allocated = domain::Money::zero(invoice.currency);
            auto found = allocations.find(invoice.id);
            if (found != allocations.end()) {
                for (const auto& allocation : found->second) {
                    allocated += allocation.amount;
                }
            }
            domain::Money remaining = invoice.totalAmount - allocated;
            remaining.currency = invoice.currency;
            if (remaining.toDouble() <= tolerance_) {
                continue;
            }

            domain::ForeignPosition position;
            position.sourceId = invoice.id;
            position.sourceType = domain::PositionSource::INVOICE;
            position.sourceReference = invoice.invoiceNumber;
            position.currency = invoice.currency;
            position.remainingAmount = remaining;
            position.historicalRate = invoice.historicalRate;
            position.historicalRateKind = domain::HistoricalRateKind::BOOKING;
            position.currentRate = resolver.resolveRate(invoice.currency, reportingCurrency_);
            position.asOfDate = asOfDate;

            if (!position.historicalRate) {
                analysis.warnings.emplace_back(
                    domain::WarningKind::MISSING_BOOKING_RATE, invoice.invoiceNumber,
                    "Invoice " + invoice.invoiceNumber + " has no booking exchange rate; not revalued");
            }

            revalue(position);
            addPosition(analysis, missing, std::move(position));
        }

        for (const auto& bank : bankAccounts) {
            if (bank.currency == reportingCurrency_ || !bank.active) {
                continue;
            }
            if (bank.balance.toDouble() <= tolerance_) {
                continue;
            }

            domain::ForeignPosition position;
            position.sourceId = bank.id;
            position.sourceType = domain::PositionSource::BANK_ACCOUNT;
            position.sourceReference = bank.name;
            position.currency = bank.currency;
            position.remainingAmount = domain::Money(bank.balance.units, bank.balance.nano, bank.currency);
            position.currentRate = resolver.resolveRate(bank.currency, reportingCurrency_);
            // Курса на дату поступления нет: опорный курс равен текущему
            position.historicalRate = position.currentRate;
            position.historicalRateKind = domain::HistoricalRateKind::APPROXIMATED;
            position.asOfDate = asOfDate;

            revalue(position);
            addPosition(analysis, missing, std::move(position));
        }

        for (const auto& [currency, entry] : missing) {
            analysis.missingCurrencies.insert(currency);
            analysis.missingRates.push_back(entry);
            analysis.warnings.emplace_back(
                domain::WarningKind::MISSING_RATE, currency,
                "No active " + currency + "/" + reportingCurrency_ + " rate on or before " +
                asOfDate.toString());
        }

        analysis.netGainLoss = analysis.totalGain - analysis.totalLoss;
        return analysis;
    }

private:
    std::string reportingCurrency_;
    double tolerance_;

    void revalue(domain::ForeignPosition& position) const {
        if (position.historicalRate) {
            position.historicalValue = position.remainingAmount.convert(
                *position.historicalRate, reportingCurrency_);
        }
        if (!position.currentRate) {
            return;
        }
        position.currentValue = position.remainingAmount.convert(
            *position.currentRate, reportingCurrency_);
        if (position.historicalRate) {
            position.gainLoss = position.remainingAmount.convert(
                *position.currentRate - *position.historicalRate, reportingCurrency_);
        }
    }

    void addPosition(
        domain::FxAnalysis& analysis,
        std::map<std::string, domain::MissingRate>& missing,
        domain::ForeignPosition position) const
    {
        if (!position.currentRate) {
            auto [it, inserted] = missing.try_emplace(position.currency);
            auto& entry = it->second;
            if (inserted) {
                entry.currency = position.currency;
                entry.totalAmount = domain::Money::zero(position.currency);
            }
            entry.positionsCount++;
            entry.totalAmount += position.remainingAmount;
        } else if (position.isRevalued()) {
            if (position.gainLoss->isPositive()) {
                analysis.totalGain += *position.gainLoss;
            } else if (position.gainLoss->isNegative()) {
                analysis.totalLoss += position.gainLoss->abs();
            }
        }
        analysis.positions.push_back(std::move(position));
    }
};

} // namespace reporting::application
