// include/settings/ReportingSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace reporting::settings
{

    /**
     * @brief Общие настройки движка отчётов
     *
     * REPORTING_BASE_CURRENCY - валюта отчётности (BDT)
     * REPORTING_TOLERANCE     - допуск сравнения сумм (0.01)
     * REPORTING_DATA_SOURCE   - "postgres" или "json"
     * REPORTING_SNAPSHOT_FILE - путь к JSON-срезу для источника "json"
     */
    class ReportingSettings
    {
    public:
        ReportingSettings()
        {
            baseCurrency_ = getEnvOrDefault("REPORTING_BASE_CURRENCY", "BDT");
            tolerance_ = std::stod(getEnvOrDefault("REPORTING_TOLERANCE", "0.01"));
            dataSource_ = getEnvOrDefault("REPORTING_DATA_SOURCE", "postgres");
            snapshotFile_ = getEnvOrDefault("REPORTING_SNAPSHOT_FILE", "ledger.json");

            if (tolerance_ < 0.0) {
                throw std::invalid_argument("REPORTING_TOLERANCE must be non-negative");
            }
            if (dataSource_ != "postgres" && dataSource_ != "json") {
                throw std::invalid_argument("Unknown REPORTING_DATA_SOURCE: " + dataSource_);
            }
        }

        std::string getBaseCurrency() const { return baseCurrency_; }
        double getTolerance() const { return tolerance_; }
        std::string getDataSource() const { return dataSource_; }
        std::string getSnapshotFile() const { return snapshotFile_; }

        bool isJsonSource() const { return dataSource_ == "json"; }

    private:
        std::string baseCurrency_;
        double tolerance_;
        std::string dataSource_;
        std::string snapshotFile_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace reporting::settings
