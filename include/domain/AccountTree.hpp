#pragma once

#include "Account.hpp"
#include "AccountBalance.hpp"
#include "ReportWarning.hpp"
#include <vector>
#include <map>
#include <optional>

namespace reporting::domain {

/**
 * @brief Узел дерева счетов
 *
 * net - сальдо только своего счёта в валюте отчётности.
 * Суммы по поддереву считает AccountTree::rolledUpNet().
 */
struct AccountNode {
    Account account;
    AccountBalance balance;
    Money net;
    int depth = 0;
    std::optional<size_t> parent;
    std::vector<size_t> children;
};

/**
 * @brief Дерево счетов в виде арены
 *
 * Узлы лежат в nodes, связи - индексы в этом же векторе.
 * roots и children упорядочены по коду счёта.
 */
struct AccountTree {
    std::vector<AccountNode> nodes;
    std::vector<size_t> roots;
    std::vector<ReportWarning> warnings;
    std::map<std::string, size_t> codeIndex;

    std::optional<size_t> indexOf(const std::string& code) const {
        auto it = codeIndex.find(code);
        if (it == codeIndex.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Сумма net по поддереву (включая сам узел)
     */
    Money rolledUpNet(size_t index) const {
        Money total = Money::zero(nodes.at(index).net.currency);
        std::vector<size_t> stack{index};
        while (!stack.empty()) {
            size_t current = stack.back();
            stack.pop_back();
            total += nodes[current].net;
            for (size_t child : nodes[current].children) {
                stack.push_back(child);
            }
        }
        return total;
    }

    /**
     * @brief Обход в глубину: корни по порядку, родитель раньше детей
     */
    std::vector<size_t> preorder() const {
        std::vector<size_t> order;
        order.reserve(nodes.size());
        std::vector<size_t> stack(roots.rbegin(), roots.rend());
        while (!stack.empty()) {
            size_t current = stack.back();
            stack.pop_back();
            order.push_back(current);
            const auto& children = nodes[current].children;
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.push_back(*it);
            }
        }
        return order;
    }

    size_t size() const { return nodes.size(); }
};

} // namespace reporting::domain
