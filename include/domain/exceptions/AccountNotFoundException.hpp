#pragma once

#include <stdexcept>
#include <string>

namespace reporting::domain {

class AccountNotFoundException : public std::runtime_error {
public:
    explicit AccountNotFoundException(const std::string& accountCode)
        : std::runtime_error("Account not found: " + accountCode),
          accountCode_(accountCode) {}

    const std::string& accountCode() const { return accountCode_; }

private:
    std::string accountCode_;
};

} // namespace reporting::domain
