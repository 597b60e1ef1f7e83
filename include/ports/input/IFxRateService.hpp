#pragma once

#include "domain/FxRate.hpp"
#include <optional>
#include <string>

namespace reporting::ports::input {

/**
 * @brief Интерфейс работы с курсами валют
 */
class IFxRateService {
public:
    virtual ~IFxRateService() = default;

    /**
     * @brief Курс пары на дату
     * @return std::nullopt если активного курса нет
     */
    virtual std::optional<domain::FxRate> resolve(
        const std::string& fromCurrency,
        const std::string& toCurrency,
        const domain::Date& asOfDate) = 0;

    /**
     * @brief Ввести курс вручную (source = "manual")
     * @throws std::invalid_argument если rate <= 0
     */
    virtual domain::FxRate applyManualRate(
        const std::string& currency,
        const std::string& toCurrency,
        double rate,
        const domain::Date& date) = 0;
};

} // namespace reporting::ports::input
