#pragma once

#include "ILedgerSnapshot.hpp"
#include <memory>

namespace reporting::ports::output {

/**
 * @brief Хранилище проводок, счетов и курсов
 *
 * Только чтение через срезы плюс единственный путь записи:
 * добавление ручного курса.
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief Открыть срез на дату
     * @throws domain::RepositoryUnavailableException если хранилище недоступно
     */
    virtual std::unique_ptr<ILedgerSnapshot> openSnapshot(const domain::Date& asOfDate) = 0;

    /**
     * @brief Добавить строку курса (append-only, прежние строки не меняются)
     * @return Сохранённая строка с присвоенными id и sequence
     */
    virtual domain::FxRate insertManualRate(const domain::FxRate& rate) = 0;
};

} // namespace reporting::ports::output
