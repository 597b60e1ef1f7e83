#pragma once

#include "Money.hpp"
#include <string>

namespace reporting::domain {

/**
 * @brief Банковский счёт с остатком в валюте счёта
 */
struct BankAccount {
    std::string id;
    std::string name;
    std::string currency;
    Money balance;
    bool active = true;
};

} // namespace reporting::domain
