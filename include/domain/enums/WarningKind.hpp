#pragma once

#include <string>

namespace reporting::domain {

/**
 * @brief Вид предупреждения отчёта
 *
 * Все виды восстановимы: отчёт строится дальше, предупреждение
 * прикладывается к результату.
 */
enum class WarningKind {
    MISSING_RATE,         ///< Нет активного курса на дату
    UNBALANCED_ENTRY,     ///< Проводка, у которой дебет != кредит
    ORPHAN_ACCOUNT,       ///< Родительский счёт не найден
    CYCLIC_PARENT,        ///< Цикл в цепочке родителей
    MIXED_CURRENCY,       ///< По счёту строки в разных валютах
    UNMAPPED_ACCOUNT,     ///< Обороты по счёту, которого нет в активном плане счетов
    MISSING_BOOKING_RATE ///< У инвойса нет курса на дату проводки
};

inline std::string toString(WarningKind kind) {
    switch (kind) {
        case WarningKind::MISSING_RATE:         return "missing_rate";
        case WarningKind::UNBALANCED_ENTRY:     return "unbalanced_entry";
        case WarningKind::ORPHAN_ACCOUNT:       return "orphan_account";
        case WarningKind::CYCLIC_PARENT:        return "cyclic_parent";
        case WarningKind::MIXED_CURRENCY:       return "mixed_currency";
        case WarningKind::UNMAPPED_ACCOUNT:     return "unmapped_account";
        case WarningKind::MISSING_BOOKING_RATE: return "missing_booking_rate";
    }
    return "unknown";
}

} // namespace reporting::domain
