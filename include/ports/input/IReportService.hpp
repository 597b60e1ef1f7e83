#pragma once

#include "domain/TrialBalance.hpp"
#include "domain/BalanceSheet.hpp"
#include "domain/ArBreakdown.hpp"
#include "domain/FxAnalysis.hpp"
#include "domain/AccountLedger.hpp"

namespace reporting::ports::input {

/**
 * @brief Интерфейс построения отчётов
 *
 * Каждый вызов - чистая функция от (asOfDate, срез хранилища):
 * состояние между вызовами не хранится.
 */
class IReportService {
public:
    virtual ~IReportService() = default;

    virtual domain::TrialBalance buildTrialBalance(const domain::Date& asOfDate) = 0;

    virtual domain::BalanceSheet buildBalanceSheet(const domain::Date& asOfDate) = 0;

    virtual domain::ArBreakdown buildArBreakdown(const domain::Date& asOfDate) = 0;

    virtual domain::FxAnalysis buildFxAnalysis(const domain::Date& asOfDate) = 0;

    /**
     * @throws domain::AccountNotFoundException если счёта нет в плане счетов
     */
    virtual domain::AccountLedger buildAccountLedger(
        const std::string& accountCode,
        const domain::Date& asOfDate) = 0;
};

} // namespace reporting::ports::input
