#pragma once

#include "domain/ForeignPosition.hpp"
#include "domain/VirtualJournalLine.hpp"
#include "settings/JournalAccountSettings.hpp"
#include <memory>
#include <vector>
#include <cmath>

namespace reporting::application {

/**
 * @brief Виртуальная проводка нереализованной курсовой разницы
 *
 * Для каждой позиции с |gainLoss| > порога:
 * - прибыль: дебет счёта позиции
 * - убыток:  кредит счёта позиции
 * Затем одна строка кредита "Unrealized FX Gain" на сумму прибылей
 * и одна строка дебета "Unrealized FX Loss" на сумму убытков.
 *
 * Сумма дебетов всегда равна сумме кредитов. В журнал не проводится.
 */
class VirtualJournalGenerator {
public:
    VirtualJournalGenerator(
        std::shared_ptr<settings::JournalAccountSettings> accounts,
        const std::string& reportingCurrency,
        double threshold = 0.01
    ) : accounts_(std::move(accounts)),
        reportingCurrency_(reportingCurrency),
        threshold_(threshold) {}

    std::vector<domain::VirtualJournalLine> generate(
        const std::vector<domain::ForeignPosition>& positions) const
    {
        std::vector<domain::VirtualJournalLine> lines;
        domain::Money totalGain = domain::Money::zero(reportingCurrency_);
        domain::Money totalLoss = domain::Money::zero(reportingCurrency_);

        for (const auto& position : positions) {
            if (!position.isRevalued()) {
                continue;
            }
            const domain::Money& gainLoss = *position.gainLoss;
            if (std::fabs(gainLoss.toDouble()) <= threshold_) {
                continue;
            }

            domain::VirtualJournalLine line;
            bool isInvoice = position.sourceType == domain::PositionSource::INVOICE;
            line.accountCode = isInvoice ? accounts_->getArAccountCode() : accounts_->getBankAccountCode();
            line.accountName = isInvoice ? accounts_->getArAccountName() : accounts_->getBankAccountName();
            line.currency = reportingCurrency_;
            line.fxImpact = gainLoss;

            std::string subject = (isInvoice ? "AR - " : "Bank - ") + position.sourceReference;
            if (gainLoss.isPositive()) {
                line.debit = gainLoss;
                line.credit = domain::Money::zero(reportingCurrency_);
                line.description = "Unrealized FX gain on " + subject;
                totalGain += gainLoss;
            } else {
                line.debit = domain::Money::zero(reportingCurrency_);
                line.credit = gainLoss.abs();
                line.description = "Unrealized FX loss on " + subject;
                totalLoss += gainLoss.abs();
            }
            lines.push_back(std::move(line));
        }

        if (totalGain.isPositive()) {
            domain::VirtualJournalLine line;
            line.accountCode = accounts_->getGainAccountCode();
            line.accountName = accounts_->getGainAccountName();
            line.debit = domain::Money::zero(reportingCurrency_);
            line.credit = totalGain;
            line.description = "Unrealized foreign exchange gains";
            line.currency = reportingCurrency_;
            line.fxImpact = totalGain;
            lines.push_back(std::move(line));
        }

        if (totalLoss.isPositive()) {
            domain::VirtualJournalLine line;
            line.accountCode = accounts_->getLossAccountCode();
            line.accountName = accounts_->getLossAccountName();
            line.debit = totalLoss;
            line.credit = domain::Money::zero(reportingCurrency_);
            line.description = "Unrealized foreign exchange losses";
            line.currency = reportingCurrency_;
            line.fxImpact = -totalLoss;
            lines.push_back(std::move(line));
        }

        return lines;
    }

private:
    std::shared_ptr<settings::JournalAccountSettings> accounts_;
    std::string reportingCurrency_;
    double threshold_;
};

} // namespace reporting::application
