#pragma once

#include "Date.hpp"
#include <string>
#include <cstdint>

namespace reporting::domain {

/**
 * @brief Строка таблицы курсов fx_rates
 *
 * На одну пару и дату может быть несколько строк (ручные вводы).
 * sequence - порядок вставки: при равной дате побеждает большая.
 */
struct FxRate {
    std::string id;
    std::string fromCurrency;
    std::string toCurrency;
    Date date;
    double rate = 0.0;
    std::string source;
    bool active = true;
    int64_t sequence = 0;
    std::string notes;

    FxRate() = default;

    FxRate(
        const std::string& from,
        const std::string& to,
        const Date& date,
        double rate,
        const std::string& source = "",
        bool active = true
    ) : fromCurrency(from), toCurrency(to), date(date),
        rate(rate), source(source), active(active) {}
};

} // namespace reporting::domain
