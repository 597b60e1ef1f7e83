#pragma once

#include <string>
#include <cstdint>
#include <cmath>

namespace reporting::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит значение с фиксированной точкой: целая часть + nano (10^-9).
 * После любой операции nano нормализуется в диапазон [0, 10^9),
 * поэтому у каждого значения ровно одно представление.
 */
class Money {
public:
    static constexpr int32_t NANO_PER_UNIT = 1000000000;

    int64_t units = 0;      // Целая часть (floor для отрицательных)
    int32_t nano = 0;       // Дробная часть, 10^-9
    std::string currency = "BDT";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "BDT")
        : units(u), nano(n), currency(cur)
    {
        normalize();
    }

    static Money zero(const std::string& cur = "BDT") {
        return Money(0, 0, cur);
    }

    static Money fromDouble(double value, const std::string& cur = "BDT") {
        Money m;
        m.currency = cur;
        double whole = std::floor(value);
        m.units = static_cast<int64_t>(whole);
        int64_t n = std::llround((value - whole) * 1e9);
        if (n >= NANO_PER_UNIT) {
            m.units++;
            n -= NANO_PER_UNIT;
        }
        m.nano = static_cast<int32_t>(n);
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    Money operator+(const Money& other) const {
        return Money(units + other.units, nano + other.nano, currency);
    }

    Money operator-(const Money& other) const {
        return Money(units - other.units, nano - other.nano, currency);
    }

    Money operator-() const {
        return Money(-units, -nano, currency);
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    Money abs() const {
        return isNegative() ? -(*this) : *this;
    }

    /**
     * @brief Пересчитать по курсу в другую валюту
     */
    Money convert(double rate, const std::string& targetCurrency) const {
        return Money::fromDouble(toDouble() * rate, targetCurrency);
    }

    /**
     * @brief Ноль с учётом допуска (|value| <= tolerance)
     */
    bool isZero(double tolerance = 0.0) const {
        if (tolerance <= 0.0) {
            return units == 0 && nano == 0;
        }
        return std::fabs(toDouble()) <= tolerance;
    }

    bool isNegative() const { return units < 0; }
    bool isPositive() const { return units > 0 || (units == 0 && nano > 0); }

    bool operator<(const Money& other) const {
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Money& other) const {
        return other < *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    void normalize() {
        units += nano / NANO_PER_UNIT;
        nano %= NANO_PER_UNIT;
        if (nano < 0) {
            units--;
            nano += NANO_PER_UNIT;
        }
    }
};

} // namespace reporting::domain
