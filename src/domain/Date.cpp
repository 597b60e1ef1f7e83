#include "domain/Date.hpp"

#include <cstdio>
#include <stdexcept>

namespace reporting::domain {

namespace {

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return days[m - 1];
}

bool isDigits(const std::string& str, size_t pos, size_t count) {
    for (size_t i = pos; i < pos + count; ++i) {
        if (str[i] < '0' || str[i] > '9') {
            return false;
        }
    }
    return true;
}

} // namespace

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {
    if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
        throw std::invalid_argument(
            "Invalid date: " + std::to_string(y) + "-" + std::to_string(m) + "-" + std::to_string(d));
    }
}

Date Date::fromString(const std::string& str) {
    // YYYY-MM-DD, допускаем хвост времени: 2024-03-31T00:00:00Z
    if (str.size() < 10 || str[4] != '-' || str[7] != '-' ||
        !isDigits(str, 0, 4) || !isDigits(str, 5, 2) || !isDigits(str, 8, 2)) {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
    }
    if (str.size() > 10 && str[10] != 'T' && str[10] != ' ') {
        throw std::invalid_argument("Invalid date format (expected YYYY-MM-DD): " + str);
    }
    return Date(std::stoi(str.substr(0, 4)), std::stoi(str.substr(5, 2)), std::stoi(str.substr(8, 2)));
}

// Алгоритм days_from_civil / civil_from_days (Howard Hinnant)
int64_t Date::toDays() const {
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::fromDays(int64_t days) {
    days += 719468;
    int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    int64_t doe = days - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d));
}

std::string Date::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

} // namespace reporting::domain
