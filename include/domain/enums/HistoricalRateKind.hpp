#pragma once

#include <string>

namespace reporting::domain {

/**
 * @brief Происхождение исторического курса позиции
 *
 * Для банковского остатка курса на дату проводки нет, поэтому
 * используется текущий курс (APPROXIMATED) и переоценка всегда нулевая.
 */
enum class HistoricalRateKind {
    BOOKING,        ///< Курс на дату проводки документа
    APPROXIMATED    ///< Текущий курс вместо исторического
};

inline std::string toString(HistoricalRateKind kind) {
    switch (kind) {
        case HistoricalRateKind::BOOKING:      return "booking";
        case HistoricalRateKind::APPROXIMATED: return "approximated";
    }
    return "unknown";
}

} // namespace reporting::domain
