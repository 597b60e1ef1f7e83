#pragma once

#include <stdexcept>
#include <string>

namespace reporting::domain {

/**
 * @brief Хранилище проводок недоступно: отчёт построить нельзя
 */
class RepositoryUnavailableException : public std::runtime_error {
public:
    explicit RepositoryUnavailableException(const std::string& message)
        : std::runtime_error("Ledger repository unavailable: " + message) {}
};

} // namespace reporting::domain
