#pragma once

#include "ports/input/IReportService.hpp"
#include "ports/input/IFxRateService.hpp"
#include "settings/ReportingSettings.hpp"
#include "adapters/primary/ReportJsonSerializer.hpp"
#include "domain/exceptions/AccountNotFoundException.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <iostream>

namespace reporting::adapters::primary
{

    /**
     * @brief Команды командной строки -> отчёты в JSON
     *
     *   trial-balance  <asOf>
     *   balance-sheet  <asOf>
     *   ar-breakdown   <asOf>
     *   fx-analysis    <asOf>
     *   account-ledger <accountCode> <asOf>
     *   apply-rate     <currency> <rate> <date>
     *
     * Отчёт пишется в out, ошибка - JSON {"error": ...} в err.
     * RepositoryUnavailableException не перехватывается.
     */
    class ReportCommandHandler
    {
    public:
        static constexpr int EXIT_OK = 0;
        static constexpr int EXIT_USAGE = 2;
        static constexpr int EXIT_NOT_FOUND = 3;

        ReportCommandHandler(
            std::shared_ptr<ports::input::IReportService> reportService,
            std::shared_ptr<ports::input::IFxRateService> fxRateService,
            std::shared_ptr<settings::ReportingSettings> settings)
            : reportService_(std::move(reportService)),
              fxRateService_(std::move(fxRateService)),
              settings_(std::move(settings))
        {
            std::cout << "[ReportCommandHandler] Created" << std::endl;
        }

        int handle(const std::vector<std::string> &args, std::ostream &out, std::ostream &err)
        {
            if (args.empty())
            {
                printUsage(err);
                return EXIT_USAGE;
            }

            const std::string &command = args[0];
            try
            {
                if (command == "trial-balance" && args.size() == 2)
                {
                    auto report = reportService_->buildTrialBalance(domain::Date::fromString(args[1]));
                    return print(out, ReportJsonSerializer::toJson(report));
                }
                if (command == "balance-sheet" && args.size() == 2)
                {
                    auto report = reportService_->buildBalanceSheet(domain::Date::fromString(args[1]));
                    return print(out, ReportJsonSerializer::toJson(report));
                }
                if (command == "ar-breakdown" && args.size() == 2)
                {
                    auto report = reportService_->buildArBreakdown(domain::Date::fromString(args[1]));
                    return print(out, ReportJsonSerializer::toJson(report));
                }
                if (command == "fx-analysis" && args.size() == 2)
                {
                    auto report = reportService_->buildFxAnalysis(domain::Date::fromString(args[1]));
                    return print(out, ReportJsonSerializer::toJson(report));
                }
                if (command == "account-ledger" && args.size() == 3)
                {
                    auto report = reportService_->buildAccountLedger(
                        args[1], domain::Date::fromString(args[2]));
                    return print(out, ReportJsonSerializer::toJson(report));
                }
                if (command == "apply-rate" && args.size() == 4)
                {
                    double rate = parseRate(args[2]);
                    auto saved = fxRateService_->applyManualRate(
                        args[1], settings_->getBaseCurrency(), rate, domain::Date::fromString(args[3]));
                    return print(out, ReportJsonSerializer::toJson(saved));
                }
            }
            catch (const domain::AccountNotFoundException &e)
            {
                std::cerr << "[ReportCommandHandler] " << e.what() << std::endl;
                sendError(err, e.what());
                return EXIT_NOT_FOUND;
            }
            catch (const std::invalid_argument &e)
            {
                std::cerr << "[ReportCommandHandler] Invalid argument: " << e.what() << std::endl;
                sendError(err, e.what());
                return EXIT_USAGE;
            }

            sendError(err, "Unknown command or wrong number of arguments: " + command);
            printUsage(err);
            return EXIT_USAGE;
        }

    private:
        std::shared_ptr<ports::input::IReportService> reportService_;
        std::shared_ptr<ports::input::IFxRateService> fxRateService_;
        std::shared_ptr<settings::ReportingSettings> settings_;

        static int print(std::ostream &out, const nlohmann::json &report)
        {
            out << report.dump(2) << std::endl;
            return EXIT_OK;
        }

        static double parseRate(const std::string &value)
        {
            size_t consumed = 0;
            double rate = 0.0;
            try
            {
                rate = std::stod(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::invalid_argument("Invalid rate: " + value);
            }
            if (consumed != value.size())
            {
                throw std::invalid_argument("Invalid rate: " + value);
            }
            return rate;
        }

        static void sendError(std::ostream &err, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            err << error.dump() << std::endl;
        }

        static void printUsage(std::ostream &err)
        {
            err << "Usage:\n"
                << "  reporting-service trial-balance  <YYYY-MM-DD>\n"
                << "  reporting-service balance-sheet  <YYYY-MM-DD>\n"
                << "  reporting-service ar-breakdown   <YYYY-MM-DD>\n"
                << "  reporting-service fx-analysis    <YYYY-MM-DD>\n"
                << "  reporting-service account-ledger <account-code> <YYYY-MM-DD>\n"
                << "  reporting-service apply-rate     <currency> <rate> <YYYY-MM-DD>\n";
        }
    };

} // namespace reporting::adapters::primary
