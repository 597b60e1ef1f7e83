#pragma once

#include <string>
#include <cstdint>

namespace reporting::domain {

/**
 * @brief Календарная дата (без времени)
 *
 * Используется как as-of дата отчётов, дата проводки и дата курса.
 * Формат строки: YYYY-MM-DD.
 */
class Date {
public:
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;

    /**
     * @throws std::invalid_argument если дата не существует
     */
    Date(int y, int m, int d);

    /**
     * @brief Разобрать YYYY-MM-DD (хвост ISO 8601 "THH:MM:SS" игнорируется)
     * @throws std::invalid_argument при неверном формате
     */
    static Date fromString(const std::string& str);

    /**
     * @brief Дата по номеру дня от 1970-01-01
     */
    static Date fromDays(int64_t days);

    std::string toString() const;

    /**
     * @brief Номер дня от 1970-01-01
     */
    int64_t toDays() const;

    /**
     * @brief Количество дней от this до other (отрицательно, если other раньше)
     */
    int64_t daysUntil(const Date& other) const {
        return other.toDays() - toDays();
    }

    Date addDays(int64_t days) const {
        return fromDays(toDays() + days);
    }

    bool operator<(const Date& other) const { return toDays() < other.toDays(); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>=(const Date& other) const { return !(*this < other); }
    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
};

} // namespace reporting::domain
