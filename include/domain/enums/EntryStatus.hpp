#pragma once

#include <string>
#include <stdexcept>

namespace reporting::domain {

enum class EntryStatus {
    DRAFT,
    POSTED
};

inline std::string toString(EntryStatus status) {
    switch (status) {
        case EntryStatus::DRAFT:  return "draft";
        case EntryStatus::POSTED: return "posted";
    }
    return "unknown";
}

inline EntryStatus entryStatusFromString(const std::string& str) {
    if (str == "draft")  return EntryStatus::DRAFT;
    if (str == "posted") return EntryStatus::POSTED;
    throw std::invalid_argument("Unknown EntryStatus: " + str);
}

} // namespace reporting::domain
