#pragma once

#include <string>
#include <stdexcept>

namespace reporting::domain {

/**
 * @brief Тип счёта плана счетов
 */
enum class AccountType {
    ASSET,      ///< Активы
    LIABILITY,  ///< Обязательства
    EQUITY,     ///< Капитал
    REVENUE,    ///< Доходы
    EXPENSE     ///< Расходы
};

/**
 * @brief Преобразовать в строку (как в таблице chart_of_accounts)
 */
inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::ASSET:     return "asset";
        case AccountType::LIABILITY: return "liability";
        case AccountType::EQUITY:    return "equity";
        case AccountType::REVENUE:   return "revenue";
        case AccountType::EXPENSE:   return "expense";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType accountTypeFromString(const std::string& str) {
    if (str == "asset")     return AccountType::ASSET;
    if (str == "liability") return AccountType::LIABILITY;
    if (str == "equity")    return AccountType::EQUITY;
    if (str == "revenue")   return AccountType::REVENUE;
    if (str == "expense")   return AccountType::EXPENSE;
    throw std::invalid_argument("Unknown AccountType: " + str);
}

/**
 * @brief Дебетовое ли нормальное сальдо (активы и расходы)
 *
 * Для таких счетов net = debit - credit, для остальных net = credit - debit.
 */
inline bool isDebitNormal(AccountType type) {
    return type == AccountType::ASSET || type == AccountType::EXPENSE;
}

} // namespace reporting::domain
