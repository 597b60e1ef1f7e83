#pragma once

#include <string>
#include <stdexcept>

namespace reporting::domain {

enum class CustomerType {
    LOCAL,
    FOREIGN
};

inline std::string toString(CustomerType type) {
    switch (type) {
        case CustomerType::LOCAL:   return "local";
        case CustomerType::FOREIGN: return "foreign";
    }
    return "unknown";
}

inline CustomerType customerTypeFromString(const std::string& str) {
    if (str == "local")   return CustomerType::LOCAL;
    if (str == "foreign") return CustomerType::FOREIGN;
    throw std::invalid_argument("Unknown CustomerType: " + str);
}

} // namespace reporting::domain
