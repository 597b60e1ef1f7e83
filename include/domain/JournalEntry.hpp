#pragma once

#include "JournalLine.hpp"
#include <vector>

namespace reporting::domain {

/**
 * @brief Журнальная проводка (заголовок + строки)
 *
 * В расчётах участвуют только POSTED проводки с date <= asOfDate.
 */
struct JournalEntry {
    std::string id;
    std::string entryNumber;
    Date date;
    std::string description;
    std::string reference;
    EntryStatus status = EntryStatus::DRAFT;
    std::vector<JournalLine> lines;

    bool isPosted() const { return status == EntryStatus::POSTED; }

    /**
     * @brief Строки с заполненными полями заголовка
     */
    std::vector<JournalLine> joinedLines() const {
        std::vector<JournalLine> result;
        result.reserve(lines.size());
        for (auto line : lines) {
            line.entryId = id;
            line.entryNumber = entryNumber;
            line.entryDate = date;
            line.entryStatus = status;
            line.entryDescription = description;
            line.entryReference = reference;
            result.push_back(std::move(line));
        }
        return result;
    }
};

} // namespace reporting::domain
