#pragma once

#include <string>
#include <stdexcept>

namespace reporting::domain {

/**
 * @brief Статус инвойса
 *
 * Открытой дебиторкой считаются только отправленные (SENT) инвойсы.
 */
enum class InvoiceStatus {
    DRAFT,
    SENT,
    CANCELLED
};

inline std::string toString(InvoiceStatus status) {
    switch (status) {
        case InvoiceStatus::DRAFT:     return "draft";
        case InvoiceStatus::SENT:      return "sent";
        case InvoiceStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline InvoiceStatus invoiceStatusFromString(const std::string& str) {
    if (str == "draft")     return InvoiceStatus::DRAFT;
    if (str == "sent")      return InvoiceStatus::SENT;
    if (str == "cancelled") return InvoiceStatus::CANCELLED;
    throw std::invalid_argument("Unknown InvoiceStatus: " + str);
}

} // namespace reporting::domain
