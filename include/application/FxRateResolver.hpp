#pragma once

#include "ports/output/ILedgerSnapshot.hpp"
#include <map>
#include <optional>
#include <utility>

namespace reporting::application {

/**
 * @brief Поиск курса валютной пары на as-of дату среза
 *
 * Выбирает активную строку с наибольшей датой <= asOfDate, при равной
 * дате - с наибольшим sequence (вставленную последней).
 * Отсутствие курса - не ошибка: возвращается std::nullopt.
 *
 * Результаты кэшируются на время жизни резолвера (один отчёт, один срез).
 */
class FxRateResolver {
public:
    static constexpr const char* IDENTITY_SOURCE = "identity";

    explicit FxRateResolver(ports::output::ILedgerSnapshot& snapshot)
        : snapshot_(snapshot) {}

    std::optional<domain::FxRate> resolve(
        const std::string& fromCurrency,
        const std::string& toCurrency)
    {
        if (fromCurrency == toCurrency) {
            return domain::FxRate(fromCurrency, toCurrency, snapshot_.asOfDate(), 1.0, IDENTITY_SOURCE);
        }

        auto key = std::make_pair(fromCurrency, toCurrency);
        auto cached = cache_.find(key);
        if (cached != cache_.end()) {
            return cached->second;
        }

        auto rate = selectRate(snapshot_.listRates(fromCurrency, toCurrency), snapshot_.asOfDate());
        cache_.emplace(key, rate);
        return rate;
    }

    std::optional<double> resolveRate(
        const std::string& fromCurrency,
        const std::string& toCurrency)
    {
        auto rate = resolve(fromCurrency, toCurrency);
        if (!rate) {
            return std::nullopt;
        }
        return rate->rate;
    }

    /**
     * @brief Выбрать действующий курс из строк одной пары
     */
    static std::optional<domain::FxRate> selectRate(
        const std::vector<domain::FxRate>& rates,
        const domain::Date& asOfDate)
    {
        const domain::FxRate* best = nullptr;
        for (const auto& rate : rates) {
            if (!rate.active || rate.date > asOfDate) {
                continue;
            }
            if (!best || rate.date > best->date ||
                (rate.date == best->date && rate.sequence >= best->sequence)) {
                best = &rate;
            }
        }
        if (!best) {
            return std::nullopt;
        }
        return *best;
    }

private:
    ports::output::ILedgerSnapshot& snapshot_;
    std::map<std::pair<std::string, std::string>, std::optional<domain::FxRate>> cache_;
};

} // namespace reporting::application
