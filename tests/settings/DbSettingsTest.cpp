/**
 * @file DbSettingsTest.cpp
 * @brief Unit tests for DbSettings
 */

#include <gtest/gtest.h>
#include "settings/DbSettings.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace reporting::settings;

class DbSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear();
    }

    void TearDown() override {
        clear();
    }

    static void clear() {
        for (const char* name : {"REPORTING_DB_HOST", "REPORTING_DB_PORT", "REPORTING_DB_NAME",
                                 "REPORTING_DB_USER", "REPORTING_DB_PASSWORD",
                                 "REPORTING_DB_CONNECT_TIMEOUT", "REPORTING_DB_SSLMODE"}) {
            unsetenv(name);
        }
    }
};

// ============================================================================
// DEFAULTS
// ============================================================================

TEST_F(DbSettingsTest, Defaults_ConnectionStringCarriesTimeoutAndAppName) {
    DbSettings settings;

    EXPECT_EQ(settings.getHost(), "localhost");
    EXPECT_EQ(settings.getPort(), 5432);
    EXPECT_EQ(settings.getConnectTimeoutSeconds(), 5);

    auto connection = settings.getConnectionString();
    EXPECT_NE(connection.find("dbname=accounting_db"), std::string::npos);
    EXPECT_NE(connection.find("connect_timeout=5"), std::string::npos);
    EXPECT_NE(connection.find("application_name=reporting-service"), std::string::npos);
    EXPECT_EQ(connection.find("sslmode="), std::string::npos);
}

// ============================================================================
// OVERRIDES
// ============================================================================

TEST_F(DbSettingsTest, Env_OverridesApplied) {
    setenv("REPORTING_DB_HOST", "db.internal", 1);
    setenv("REPORTING_DB_PORT", "6432", 1);
    setenv("REPORTING_DB_CONNECT_TIMEOUT", "15", 1);
    setenv("REPORTING_DB_SSLMODE", "require", 1);

    DbSettings settings;

    EXPECT_EQ(settings.getHost(), "db.internal");
    EXPECT_EQ(settings.getPort(), 6432);
    EXPECT_EQ(settings.getConnectTimeoutSeconds(), 15);
    auto connection = settings.getConnectionString();
    EXPECT_NE(connection.find("host=db.internal port=6432"), std::string::npos);
    EXPECT_NE(connection.find("connect_timeout=15"), std::string::npos);
    EXPECT_NE(connection.find("sslmode=require"), std::string::npos);
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST_F(DbSettingsTest, Timeout_OutOfRange_Throws) {
    setenv("REPORTING_DB_CONNECT_TIMEOUT", "0", 1);
    EXPECT_THROW(DbSettings{}, std::invalid_argument);

    setenv("REPORTING_DB_CONNECT_TIMEOUT", "61", 1);
    EXPECT_THROW(DbSettings{}, std::invalid_argument);
}

TEST_F(DbSettingsTest, Port_NotAnInteger_Throws) {
    setenv("REPORTING_DB_PORT", "54x2", 1);
    EXPECT_THROW(DbSettings{}, std::invalid_argument);

    setenv("REPORTING_DB_PORT", "", 1);
    EXPECT_THROW(DbSettings{}, std::invalid_argument);
}

TEST_F(DbSettingsTest, Port_OutOfRange_Throws) {
    setenv("REPORTING_DB_PORT", "70000", 1);
    EXPECT_THROW(DbSettings{}, std::invalid_argument);
}
