#pragma once

#include "Money.hpp"
#include <string>

namespace reporting::domain {

/**
 * @brief Строка виртуальной проводки переоценки
 *
 * Никогда не проводится в журнал, только показывается.
 * fxImpact - знаковый эффект: + прибыль, - убыток.
 */
struct VirtualJournalLine {
    std::string accountCode;
    std::string accountName;
    Money debit;
    Money credit;
    std::string description;
    std::string currency;
    Money fxImpact;
};

} // namespace reporting::domain
