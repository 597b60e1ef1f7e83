#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "enums/CustomerType.hpp"
#include "enums/InvoiceStatus.hpp"
#include <string>
#include <optional>

namespace reporting::domain {

/**
 * @brief Инвойс клиенту (invoices JOIN customers)
 *
 * historicalRate - курс валюты инвойса к валюте отчётности на дату
 * проводки (exchange_rate). Может отсутствовать.
 */
struct Invoice {
    std::string id;
    std::string invoiceNumber;
    std::string customerName;
    CustomerType customerType = CustomerType::LOCAL;
    std::string currency = "BDT";
    Money totalAmount;
    std::optional<double> historicalRate;
    Date date;
    Date dueDate;
    InvoiceStatus status = InvoiceStatus::SENT;
};

/**
 * @brief Распределение платежа на инвойс (payment_allocations)
 */
struct PaymentAllocation {
    std::string id;
    std::string invoiceId;
    Money amount;
    Date allocationDate;
};

} // namespace reporting::domain
