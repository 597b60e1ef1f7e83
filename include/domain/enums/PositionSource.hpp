#pragma once

#include <string>

namespace reporting::domain {

/**
 * @brief Источник валютной позиции
 */
enum class PositionSource {
    INVOICE,        ///< Неоплаченная часть инвойса иностранному клиенту
    BANK_ACCOUNT    ///< Остаток на валютном банковском счёте
};

inline std::string toString(PositionSource source) {
    switch (source) {
        case PositionSource::INVOICE:      return "invoice";
        case PositionSource::BANK_ACCOUNT: return "bank_account";
    }
    return "unknown";
}

} // namespace reporting::domain
