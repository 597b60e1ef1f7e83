// include/settings/JournalAccountSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace reporting::settings
{

    /**
     * @brief Счета виртуальной проводки переоценки
     *
     * Коды берутся из окружения, названия совпадают с планом счетов по умолчанию.
     */
    class JournalAccountSettings
    {
    public:
        JournalAccountSettings()
        {
            gainAccountCode_ = getEnvOrDefault("REPORTING_FX_GAIN_ACCOUNT", "4300");
            gainAccountName_ = getEnvOrDefault("REPORTING_FX_GAIN_ACCOUNT_NAME", "Unrealized FX Gain");
            lossAccountCode_ = getEnvOrDefault("REPORTING_FX_LOSS_ACCOUNT", "5700");
            lossAccountName_ = getEnvOrDefault("REPORTING_FX_LOSS_ACCOUNT_NAME", "Unrealized FX Loss");
            arAccountCode_ = getEnvOrDefault("REPORTING_AR_FOREIGN_ACCOUNT", "1400");
            arAccountName_ = getEnvOrDefault("REPORTING_AR_FOREIGN_ACCOUNT_NAME", "AR - Foreign Customers");
            bankAccountCode_ = getEnvOrDefault("REPORTING_BANK_FOREIGN_ACCOUNT", "1200");
            bankAccountName_ = getEnvOrDefault("REPORTING_BANK_FOREIGN_ACCOUNT_NAME", "Bank - Foreign Currency");
        }

        std::string getGainAccountCode() const { return gainAccountCode_; }
        std::string getGainAccountName() const { return gainAccountName_; }
        std::string getLossAccountCode() const { return lossAccountCode_; }
        std::string getLossAccountName() const { return lossAccountName_; }
        std::string getArAccountCode() const { return arAccountCode_; }
        std::string getArAccountName() const { return arAccountName_; }
        std::string getBankAccountCode() const { return bankAccountCode_; }
        std::string getBankAccountName() const { return bankAccountName_; }

    private:
        std::string gainAccountCode_;
        std::string gainAccountName_;
        std::string lossAccountCode_;
        std::string lossAccountName_;
        std::string arAccountCode_;
        std::string arAccountName_;
        std::string bankAccountCode_;
        std::string bankAccountName_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace reporting::settings
