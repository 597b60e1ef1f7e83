#pragma once

#include "domain/AccountTree.hpp"
#include <map>
#include <vector>
#include <string>

namespace reporting::application {

/**
 * @brief Сборка плоского плана счетов в дерево
 *
 * Ребёнок привязывается к родителю строго по child.parentId == parent.id.
 * Перед сборкой цепочки родителей проверяются на циклы:
 * - родитель не найден -> счёт становится корнем, ORPHAN_ACCOUNT
 * - счёт на цикле (в т.ч. сам себе родитель) -> корень, CYCLIC_PARENT
 *
 * Сальдо детей в родителя не сворачиваются.
 */
class AccountHierarchyBuilder {
public:
    explicit AccountHierarchyBuilder(const std::string& reportingCurrency)
        : reportingCurrency_(reportingCurrency) {}

    domain::AccountTree buildTree(
        const std::vector<domain::Account>& accounts,
        const std::map<std::string, domain::AccountBalance>& balances) const;

private:
    std::string reportingCurrency_;
};

} // namespace reporting::application
