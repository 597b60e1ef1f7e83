#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "enums/PositionSource.hpp"
#include "enums/HistoricalRateKind.hpp"
#include <string>
#include <optional>

namespace reporting::domain {

/**
 * @brief Открытая валютная позиция (производная, не хранится)
 *
 * remainingAmount - открытый остаток в валюте позиции.
 * Если currentRate не найден, currentValue и gainLoss пусты и позиция
 * не участвует в итогах переоценки.
 */
struct ForeignPosition {
    std::string sourceId;
    PositionSource sourceType = PositionSource::INVOICE;
    std::string sourceReference;    ///< Номер инвойса или название банковского счёта
    std::string currency;
    Money remainingAmount;
    std::optional<double> historicalRate;
    HistoricalRateKind historicalRateKind = HistoricalRateKind::BOOKING;
    std::optional<double> currentRate;
    std::optional<Money> historicalValue;
    std::optional<Money> currentValue;
    std::optional<Money> gainLoss;  ///< > 0 - прибыль, < 0 - убыток
    Date asOfDate;

    bool isRevalued() const { return gainLoss.has_value(); }
};

} // namespace reporting::domain
