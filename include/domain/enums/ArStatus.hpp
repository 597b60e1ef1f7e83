#pragma once

#include <string>

namespace reporting::domain {

/**
 * @brief Статус строки дебиторской задолженности
 */
enum class ArStatus {
    OPEN,
    OVERDUE,
    PARTIALLY_PAID
};

inline std::string toString(ArStatus status) {
    switch (status) {
        case ArStatus::OPEN:           return "Open";
        case ArStatus::OVERDUE:        return "Overdue";
        case ArStatus::PARTIALLY_PAID: return "Partially Paid";
    }
    return "Unknown";
}

} // namespace reporting::domain
