#pragma once

#include "domain/Account.hpp"
#include "domain/JournalLine.hpp"
#include "domain/FxRate.hpp"
#include "domain/Invoice.hpp"
#include "domain/BankAccount.hpp"
#include <vector>
#include <string>

namespace reporting::ports::output {

/**
 * @brief Согласованный срез хранилища на одну as-of дату
 *
 * Все чтения одного отчёта идут через один срез, поэтому отчёт видит
 * проводки, счета и курсы в одном и том же состоянии.
 * Срез живёт в пределах одного запроса отчёта.
 */
class ILedgerSnapshot {
public:
    virtual ~ILedgerSnapshot() = default;

    virtual domain::Date asOfDate() const = 0;

    /**
     * @brief Строки проведённых проводок с датой <= asOfDate
     */
    virtual std::vector<domain::JournalLine> listPostedLines() = 0;

    /**
     * @brief Активные счета указанных типов (пустой список - все типы)
     */
    virtual std::vector<domain::Account> listActiveAccounts(
        const std::vector<domain::AccountType>& types) = 0;

    /**
     * @brief Отправленные (sent) инвойсы с датой <= asOfDate, все валюты
     */
    virtual std::vector<domain::Invoice> listOpenInvoices() = 0;

    /**
     * @brief Отправленные инвойсы иностранным клиентам не в валюте отчётности
     */
    virtual std::vector<domain::Invoice> listOpenForeignInvoices(
        const std::string& reportingCurrency) = 0;

    /**
     * @brief Распределения платежей на инвойс с датой <= asOfDate
     */
    virtual std::vector<domain::PaymentAllocation> listAllocations(
        const std::string& invoiceId) = 0;

    /**
     * @brief Активные банковские счета не в валюте отчётности
     */
    virtual std::vector<domain::BankAccount> listForeignBankAccounts(
        const std::string& reportingCurrency) = 0;

    /**
     * @brief Все строки курсов пары с датой <= asOfDate (включая неактивные)
     */
    virtual std::vector<domain::FxRate> listRates(
        const std::string& fromCurrency,
        const std::string& toCurrency) = 0;
};

} // namespace reporting::ports::output
