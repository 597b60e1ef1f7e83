// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace reporting::settings
{

    /**
     * @brief Подключение движка отчётов к PostgreSQL
     *
     * Один процесс держит одно соединение: каждый отчёт открывает на нём
     * REPEATABLE READ срез, а ручной курс пишется коротким INSERT.
     * CLI не должен зависать на недоступной базе, поэтому connect_timeout
     * обязателен и ограничен сверху (REPORTING_DB_CONNECT_TIMEOUT, 1..60 с).
     * REPORTING_DB_SSLMODE пустой - libpq выбирает режим сам.
     */
    class DbSettings
    {
    public:
        static constexpr int kMaxConnectTimeoutSeconds = 60;

        DbSettings()
        {
            host_ = getEnvOrDefault("REPORTING_DB_HOST", "localhost");
            port_ = parseInt("REPORTING_DB_PORT", "5432");
            name_ = getEnvOrDefault("REPORTING_DB_NAME", "accounting_db");
            user_ = getEnvOrDefault("REPORTING_DB_USER", "accounting_user");
            password_ = getEnvOrDefault("REPORTING_DB_PASSWORD", "accounting_password");
            sslMode_ = getEnvOrDefault("REPORTING_DB_SSLMODE", "");
            connectTimeoutSeconds_ = parseInt("REPORTING_DB_CONNECT_TIMEOUT", "5");

            if (port_ < 1 || port_ > 65535) {
                throw std::invalid_argument("REPORTING_DB_PORT out of range: " + std::to_string(port_));
            }
            if (connectTimeoutSeconds_ < 1 || connectTimeoutSeconds_ > kMaxConnectTimeoutSeconds) {
                throw std::invalid_argument(
                    "REPORTING_DB_CONNECT_TIMEOUT must be 1.." + std::to_string(kMaxConnectTimeoutSeconds));
            }
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }

        std::string getConnectionString() const
        {
            std::string result = "host=" + host_ + " port=" + std::to_string(port_) +
                                 " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                                 " connect_timeout=" + std::to_string(connectTimeoutSeconds_) +
                                 " application_name=reporting-service";
            if (!sslMode_.empty()) {
                result += " sslmode=" + sslMode_;
            }
            return result;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        std::string sslMode_;
        int connectTimeoutSeconds_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static int parseInt(const char *name, const char *defaultValue)
        {
            std::string raw = getEnvOrDefault(name, defaultValue);
            size_t pos = 0;
            int value = 0;
            try {
                value = std::stoi(raw, &pos);
            } catch (const std::logic_error&) {
                throw std::invalid_argument(std::string(name) + " is not an integer: " + raw);
            }
            if (pos != raw.size()) {
                throw std::invalid_argument(std::string(name) + " is not an integer: " + raw);
            }
            return value;
        }
    };

} // namespace reporting::settings
