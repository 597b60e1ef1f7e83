#pragma once

#include "enums/WarningKind.hpp"
#include <string>

namespace reporting::domain {

/**
 * @brief Предупреждение, приложенное к отчёту
 *
 * subject - к чему относится: id проводки, код счёта, валюта, номер инвойса.
 */
struct ReportWarning {
    WarningKind kind = WarningKind::MISSING_RATE;
    std::string subject;
    std::string message;

    ReportWarning() = default;

    ReportWarning(WarningKind kind, const std::string& subject, const std::string& message)
        : kind(kind), subject(subject), message(message) {}
};

} // namespace reporting::domain
