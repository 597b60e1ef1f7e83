#include "application/AccountHierarchyBuilder.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>

namespace reporting::application {

namespace {

enum class VisitState { NEW, ON_PATH, DONE };

} // namespace

domain::AccountTree AccountHierarchyBuilder::buildTree(
    const std::vector<domain::Account>& accounts,
    const std::map<std::string, domain::AccountBalance>& balances) const
{
    domain::AccountTree tree;

    std::vector<domain::Account> sorted(accounts);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const domain::Account& a, const domain::Account& b) { return a.code < b.code; });

    // Арена: узлы в порядке кода, тогда roots и children уже отсортированы
    std::unordered_map<std::string, size_t> idIndex;
    for (const auto& account : sorted) {
        if (tree.codeIndex.count(account.code)) {
            continue;
        }
        size_t index = tree.nodes.size();
        tree.codeIndex.emplace(account.code, index);
        if (!account.id.empty()) {
            idIndex.emplace(account.id, index);
        }

        domain::AccountNode node;
        node.account = account;
        auto balance = balances.find(account.code);
        node.balance = balance != balances.end()
            ? balance->second
            : domain::AccountBalance(account.code, reportingCurrency_);
        node.net = node.balance.reportingNet(account.type);
        node.net.currency = reportingCurrency_;
        tree.nodes.push_back(std::move(node));
    }

    const size_t count = tree.nodes.size();

    // 1. Разрешить parentId -> индекс
    std::vector<std::optional<size_t>> parentOf(count);
    for (size_t i = 0; i < count; ++i) {
        const auto& account = tree.nodes[i].account;
        if (!account.parentId || account.parentId->empty()) {
            continue;
        }
        auto parent = idIndex.find(*account.parentId);
        if (parent == idIndex.end()) {
            tree.warnings.emplace_back(
                domain::WarningKind::ORPHAN_ACCOUNT, account.code,
                "Account " + account.code + " references missing parent " + *account.parentId +
                "; treated as root");
            continue;
        }
        parentOf[i] = parent->second;
    }

    // 2. Найти циклы в цепочках родителей
    std::vector<VisitState> state(count, VisitState::NEW);
    std::vector<bool> onCycle(count, false);
    for (size_t start = 0; start < count; ++start) {
        if (state[start] != VisitState::NEW) {
            continue;
        }
        std::vector<size_t> path;
        std::optional<size_t> current = start;
        while (current && state[*current] == VisitState::NEW) {
            state[*current] = VisitState::ON_PATH;
            path.push_back(*current);
            current = parentOf[*current];
        }
        if (current && state[*current] == VisitState::ON_PATH) {
            auto cycleStart = std::find(path.begin(), path.end(), *current);
            for (auto it = cycleStart; it != path.end(); ++it) {
                onCycle[*it] = true;
            }
        }
        for (size_t index : path) {
            state[index] = VisitState::DONE;
        }
    }

    for (size_t i = 0; i < count; ++i) {
        if (!onCycle[i]) {
            continue;
        }
        const auto& account = tree.nodes[i].account;
        tree.warnings.emplace_back(
            domain::WarningKind::CYCLIC_PARENT, account.code,
            "Account " + account.code + " is part of a parent cycle; treated as root");
        parentOf[i].reset();
    }

    // 3. Связать узлы
    for (size_t i = 0; i < count; ++i) {
        if (parentOf[i]) {
            tree.nodes[i].parent = parentOf[i];
            tree.nodes[*parentOf[i]].children.push_back(i);
        } else {
            tree.roots.push_back(i);
        }
    }

    // 4. Глубина от корней
    std::deque<size_t> queue(tree.roots.begin(), tree.roots.end());
    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop_front();
        for (size_t child : tree.nodes[current].children) {
            tree.nodes[child].depth = tree.nodes[current].depth + 1;
            queue.push_back(child);
        }
    }

    return tree;
}

} // namespace reporting::application
