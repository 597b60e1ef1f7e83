#pragma once

#include "enums/AccountType.hpp"
#include <string>
#include <optional>

namespace reporting::domain {

/**
 * @brief Счёт плана счетов (chart_of_accounts)
 *
 * Принадлежит внешнему справочнику, движок только читает.
 * parentId ссылается на id (не на code) родительского счёта.
 */
struct Account {
    std::string id;                         ///< Идентификатор строки
    std::string code;                       ///< Код счёта ("1400"), уникален
    std::string name;                       ///< Название ("AR - Foreign Customers")
    AccountType type = AccountType::ASSET;
    std::optional<std::string> parentId;    ///< id родителя, слабая ссылка
    int level = 1;                          ///< Подсказка глубины из справочника
    bool active = true;

    Account() = default;

    Account(
        const std::string& id,
        const std::string& code,
        const std::string& name,
        AccountType type,
        std::optional<std::string> parentId = std::nullopt,
        int level = 1,
        bool active = true
    ) : id(id), code(code), name(name), type(type),
        parentId(std::move(parentId)), level(level), active(active) {}
};

} // namespace reporting::domain
