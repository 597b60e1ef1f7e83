#pragma once

#include <boost/di.hpp>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

// Forward declarations - Ports
namespace reporting::ports::output {
    class ILedgerRepository;
}

namespace reporting::settings {
    class ReportingSettings;
}

namespace reporting::adapters::primary {
    class ReportCommandHandler;
}

/**
 * @class ReportingApp
 * @brief Приложение Reporting Service (командная строка)
 *
 * Template Method:
 * 1. loadEnvironment()    - настройки из переменных окружения, аргументы
 * 2. configureInjection() - выбор хранилища и Boost.DI
 * 3. start()              - выполнение одной команды
 *
 * Отчёт печатается в stdout как JSON, поэтому на время работы приложения
 * std::cout перенаправлен в stderr: логи компонентов не смешиваются с отчётом.
 */
class ReportingApp
{
public:
    ReportingApp();
    ~ReportingApp();

    /**
     * @return Код завершения процесса
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Выбрать хранилище по REPORTING_DATA_SOURCE и собрать сервисы через Boost.DI
     *
     * @throws reporting::domain::RepositoryUnavailableException если хранилище недоступно
     */
    void configureInjection();

    int start();

private:
    std::streambuf* reportBuffer_;
    std::unique_ptr<std::ostream> reportStream_;
    std::vector<std::string> args_;

    std::shared_ptr<reporting::settings::ReportingSettings> settings_;
    std::shared_ptr<reporting::ports::output::ILedgerRepository> repository_;
    std::shared_ptr<reporting::adapters::primary::ReportCommandHandler> handler_;

    std::shared_ptr<reporting::ports::output::ILedgerRepository> createRepository();
};
