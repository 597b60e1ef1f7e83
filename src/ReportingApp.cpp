#include "ReportingApp.hpp"

// Primary Adapters
#include "adapters/primary/ReportCommandHandler.hpp"

// Application Services
#include "application/ReportService.hpp"
#include "application/FxRateService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/persistence/JsonLedgerLoader.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRepository.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/ReportingSettings.hpp"
#include "settings/JournalAccountSettings.hpp"

#include <iostream>
#include <ostream>

namespace di = boost::di;

// ============================================================================
// ReportingApp Implementation
// ============================================================================

ReportingApp::ReportingApp()
    : reportBuffer_(std::cout.rdbuf())
{
    reportStream_ = std::make_unique<std::ostream>(reportBuffer_);
    // Логи компонентов -> stderr, stdout остаётся только для отчёта
    std::cout.rdbuf(std::cerr.rdbuf());
    std::cout << "[ReportingApp] Application created" << std::endl;
}

ReportingApp::~ReportingApp()
{
    std::cout << "[ReportingApp] Application destroyed" << std::endl;
    std::cout.rdbuf(reportBuffer_);
}

int ReportingApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return start();
}

void ReportingApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[ReportingApp] Loading environment..." << std::endl;

    args_.assign(argv + 1, argv + argc);
    settings_ = std::make_shared<reporting::settings::ReportingSettings>();

    std::cout << "[ReportingApp] Data source: " << settings_->getDataSource()
              << ", reporting currency: " << settings_->getBaseCurrency() << std::endl;
}

std::shared_ptr<reporting::ports::output::ILedgerRepository> ReportingApp::createRepository()
{
    if (settings_->isJsonSource())
    {
        auto repository = std::make_shared<reporting::adapters::secondary::InMemoryLedgerRepository>();
        reporting::adapters::secondary::JsonLedgerLoader::loadFile(settings_->getSnapshotFile(), *repository);
        return repository;
    }

    auto dbSettings = std::make_shared<reporting::settings::DbSettings>();
    return std::make_shared<reporting::adapters::secondary::PostgresLedgerRepository>(dbSettings);
}

void ReportingApp::configureInjection()
{
    std::cout << "[ReportingApp] Configuring Boost.DI injection..." << std::endl;

    repository_ = createRepository();

    auto injector = di::make_injector(

        // ====================================================================
        // Settings
        // ====================================================================

        di::bind<reporting::settings::ReportingSettings>().to(settings_),

        di::bind<reporting::settings::JournalAccountSettings>()
            .in(di::singleton),

        // ====================================================================
        // Secondary Adapters (Output Ports implementations)
        // ====================================================================

        // ILedgerRepository - PostgreSQL или JSON-срез, выбран по настройкам
        di::bind<reporting::ports::output::ILedgerRepository>().to(repository_),

        // ====================================================================
        // Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<reporting::ports::input::IReportService>()
            .to<reporting::application::ReportService>()
            .in(di::singleton),

        di::bind<reporting::ports::input::IFxRateService>()
            .to<reporting::application::FxRateService>()
            .in(di::singleton));

    // ========================================================================
    // Primary Adapter
    // ========================================================================

    handler_ = injector.create<std::shared_ptr<reporting::adapters::primary::ReportCommandHandler>>();

    std::cout << "[ReportingApp] Injection configured" << std::endl;
}

int ReportingApp::start()
{
    return handler_->handle(args_, *reportStream_, std::cerr);
}
