#pragma once

#include "ports/input/IFxRateService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "application/FxRateResolver.hpp"
#include <memory>
#include <cmath>
#include <stdexcept>
#include <iostream>

namespace reporting::application {

/**
 * @brief Сервис курсов валют
 *
 * Ручной ввод только добавляет строку: прежние курсы на ту же дату
 * не деактивируются, действующим становится последний введённый.
 */
class FxRateService : public ports::input::IFxRateService {
public:
    static constexpr const char* MANUAL_SOURCE = "manual";

    explicit FxRateService(
        std::shared_ptr<ports::output::ILedgerRepository> repository
    ) : repository_(std::move(repository))
    {
        std::cout << "[FxRateService] Created" << std::endl;
    }

    std::optional<domain::FxRate> resolve(
        const std::string& fromCurrency,
        const std::string& toCurrency,
        const domain::Date& asOfDate) override
    {
        auto snapshot = repository_->openSnapshot(asOfDate);
        FxRateResolver resolver(*snapshot);
        return resolver.resolve(fromCurrency, toCurrency);
    }

    domain::FxRate applyManualRate(
        const std::string& currency,
        const std::string& toCurrency,
        double rate,
        const domain::Date& date) override
    {
        if (!std::isfinite(rate) || rate <= 0.0) {
            throw std::invalid_argument("FX rate must be positive, got " + std::to_string(rate));
        }
        if (currency.empty() || toCurrency.empty()) {
            throw std::invalid_argument("Currency codes must not be empty");
        }
        if (currency == toCurrency) {
            throw std::invalid_argument("Cannot set a rate for " + currency + " to itself");
        }

        domain::FxRate manual(currency, toCurrency, date, rate, MANUAL_SOURCE, true);
        manual.notes = "Manual rate entry";

        auto saved = repository_->insertManualRate(manual);
        std::cout << "[FxRateService] Manual rate " << currency << "/" << toCurrency
                  << " = " << rate << " on " << date.toString() << std::endl;
        return saved;
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
};

} // namespace reporting::application
