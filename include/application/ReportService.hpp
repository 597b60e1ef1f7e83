#pragma once

#include "ports/input/IReportService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "settings/ReportingSettings.hpp"
#include "settings/JournalAccountSettings.hpp"
#include "application/BalanceAggregator.hpp"
#include "application/AccountHierarchyBuilder.hpp"
#include "application/FxRateResolver.hpp"
#include "application/UnrealizedFxCalculator.hpp"
#include "application/VirtualJournalGenerator.hpp"
#include "domain/exceptions/AccountNotFoundException.hpp"
#include <algorithm>
#include <memory>
#include <iostream>

namespace reporting::application {

/**
 * @brief Сервис построения отчётов
 *
 * Каждый отчёт открывает ровно один срез хранилища и все подзапросы
 * выполняет через него. Между вызовами состояние не хранится.
 * RepositoryUnavailableException из среза пробрасывается вызывающему.
 */
class ReportService : public ports::input::IReportService {
public:
    ReportService(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::shared_ptr<settings::ReportingSettings> settings,
        std::shared_ptr<settings::JournalAccountSettings> journalAccounts
    ) : repository_(std::move(repository)),
        settings_(std::move(settings)),
        journalAccounts_(std::move(journalAccounts))
    {
        std::cout << "[ReportService] Created (reporting currency "
                  << settings_->getBaseCurrency() << ")" << std::endl;
    }

    // ================================================================
    // TRIAL BALANCE
    // ================================================================

    domain::TrialBalance buildTrialBalance(const domain::Date& asOfDate) override {
        auto snapshot = repository_->openSnapshot(asOfDate);
        const std::string currency = settings_->getBaseCurrency();

        auto lines = snapshot->listPostedLines();
        auto accounts = snapshot->listActiveAccounts({});

        BalanceAggregator aggregator(currency, settings_->getTolerance());
        auto balances = aggregator.aggregate(lines);

        domain::TrialBalance report;
        report.asOfDate = asOfDate;
        report.currency = currency;
        report.tree = AccountHierarchyBuilder(currency).buildTree(accounts, balances);

        appendAll(report.warnings, aggregator.validateEntries(lines));
        appendAll(report.warnings, aggregator.mixedCurrencyWarnings(balances));
        appendAll(report.warnings, report.tree.warnings);

        report.totalDebits = domain::Money::zero(currency);
        report.totalCredits = domain::Money::zero(currency);
        for (const auto& node : report.tree.nodes) {
            report.totalDebits += node.balance.reportingDebit;
            report.totalCredits += node.balance.reportingCredit;
        }

        // Обороты по кодам вне активного плана счетов в итоги не входят
        for (const auto& [code, balance] : balances) {
            if (!report.tree.indexOf(code)) {
                report.warnings.emplace_back(
                    domain::WarningKind::UNMAPPED_ACCOUNT, code,
                    "Account " + code + " has " + std::to_string(balance.lineCount) +
                    " posted lines but is not in the active chart of accounts");
            }
        }

        report.balanced = aggregator.withinTolerance(report.totalDebits - report.totalCredits);

        std::cout << "[ReportService] Trial balance as of " << asOfDate.toString()
                  << ": " << report.tree.size() << " accounts, "
                  << (report.balanced ? "balanced" : "NOT balanced")
                  << ", " << report.warnings.size() << " warnings" << std::endl;
        return report;
    }

    // ================================================================
    // BALANCE SHEET
    // ================================================================

    domain::BalanceSheet buildBalanceSheet(const domain::Date& asOfDate) override {
        auto snapshot = repository_->openSnapshot(asOfDate);
        const std::string currency = settings_->getBaseCurrency();

        auto lines = snapshot->listPostedLines();
        auto accounts = snapshot->listActiveAccounts({
            domain::AccountType::ASSET,
            domain::AccountType::LIABILITY,
            domain::AccountType::EQUITY
        });

        BalanceAggregator aggregator(currency, settings_->getTolerance());
        auto balances = aggregator.aggregate(lines);
        auto tree = AccountHierarchyBuilder(currency).buildTree(accounts, balances);

        domain::BalanceSheet report;
        report.asOfDate = asOfDate;
        report.currency = currency;
        report.totalAssets = domain::Money::zero(currency);
        report.totalLiabilities = domain::Money::zero(currency);
        report.totalEquity = domain::Money::zero(currency);

        for (size_t index : tree.preorder()) {
            const auto& node = tree.nodes[index];

            domain::BalanceSheetLine line;
            line.accountCode = node.account.code;
            line.accountName = node.account.name;
            line.type = node.account.type;
            line.depth = node.depth;
            line.balance = node.balance.net(node.account.type);
            line.reportingBalance = node.net;
            line.mixedCurrency = node.balance.mixedCurrency;

            switch (node.account.type) {
                case domain::AccountType::ASSET:
                    report.totalAssets += line.reportingBalance;
                    report.assets.push_back(std::move(line));
                    break;
                case domain::AccountType::LIABILITY:
                    report.totalLiabilities += line.reportingBalance;
                    report.liabilities.push_back(std::move(line));
                    break;
                case domain::AccountType::EQUITY:
                    report.totalEquity += line.reportingBalance;
                    report.equity.push_back(std::move(line));
                    break;
                default:
                    break;
            }
        }
        report.liabilitiesAndEquity = report.totalLiabilities + report.totalEquity;

        appendAll(report.warnings, aggregator.validateEntries(lines));
        std::map<std::string, domain::AccountBalance> sheetBalances;
        for (const auto& node : tree.nodes) {
            sheetBalances.emplace(node.account.code, node.balance);
        }
        appendAll(report.warnings, aggregator.mixedCurrencyWarnings(sheetBalances));
        appendAll(report.warnings, tree.warnings);

        report.unrealizedFx = computeFxAnalysis(*snapshot, asOfDate);
        appendAll(report.warnings, report.unrealizedFx.warnings);

        std::cout << "[ReportService] Balance sheet as of " << asOfDate.toString()
                  << ": assets " << report.totalAssets.toDouble()
                  << ", liabilities+equity " << report.liabilitiesAndEquity.toDouble()
                  << ", unrealized FX " << report.unrealizedFx.netGainLoss.toDouble() << std::endl;
        return report;
    }

    // ================================================================
    // AR BREAKDOWN
    // ================================================================

    domain::ArBreakdown buildArBreakdown(const domain::Date& asOfDate) override {
        auto snapshot = repository_->openSnapshot(asOfDate);
        const std::string currency = settings_->getBaseCurrency();
        const double tolerance = settings_->getTolerance();
        FxRateResolver resolver(*snapshot);

        domain::ArBreakdown report;
        report.asOfDate = asOfDate;
        report.currency = currency;
        report.totalReporting = domain::Money::zero(currency);

        for (const auto& invoice : snapshot->listOpenInvoices()) {
            domain::Money allocated = domain::Money::zero(invoice.currency);
            for (const auto& allocation : snapshot->listAllocations(invoice.id)) {
                allocated += allocation.amount;
            }
            domain::Money remaining = invoice.totalAmount - allocated;
            remaining.currency = invoice.currency;
            if (remaining.toDouble() <= tolerance) {
                continue;
            }

            domain::ArBreakdownItem item;
            item.invoiceId = invoice.id;
            item.invoiceNumber = invoice.invoiceNumber;
            item.customerName = invoice.customerName;
            item.currency = invoice.currency;
            item.totalAmount = invoice.totalAmount;
            item.allocatedAmount = allocated;
            item.remainingAmount = remaining;
            item.date = invoice.date;
            item.dueDate = invoice.dueDate;

            if (invoice.currency == currency) {
                item.rate = 1.0;
            } else if (invoice.historicalRate) {
                item.rate = invoice.historicalRate;
            } else {
                item.rate = resolver.resolveRate(invoice.currency, currency);
            }

            if (item.rate) {
                item.reportingAmount = remaining.convert(*item.rate, currency);
            } else {
                item.reportingAmount = domain::Money(remaining.units, remaining.nano, currency);
                report.warnings.emplace_back(
                    domain::WarningKind::MISSING_RATE, invoice.invoiceNumber,
                    "No " + invoice.currency + "/" + currency + " rate for invoice " +
                    invoice.invoiceNumber + "; original amount used");
            }

            int64_t overdue = invoice.dueDate.daysUntil(asOfDate);
            item.daysOverdue = std::max<int64_t>(0, overdue);

            if (allocated.isPositive()) {
                item.status = domain::ArStatus::PARTIALLY_PAID;
            } else if (overdue > 0) {
                item.status = domain::ArStatus::OVERDUE;
            } else {
                item.status = domain::ArStatus::OPEN;
            }

            report.totalReporting += item.reportingAmount;
            auto& summary = report.byStatus[item.status];
            if (summary.count == 0) {
                summary.total = domain::Money::zero(currency);
            }
            summary.count++;
            summary.total += item.reportingAmount;

            report.items.push_back(std::move(item));
        }

        std::stable_sort(report.items.begin(), report.items.end(),
            [](const domain::ArBreakdownItem& a, const domain::ArBreakdownItem& b) {
                if (a.dueDate != b.dueDate) {
                    return a.dueDate < b.dueDate;
                }
                return a.invoiceNumber < b.invoiceNumber;
            });

        std::cout << "[ReportService] AR breakdown as of " << asOfDate.toString()
                  << ": " << report.items.size() << " open invoices, total "
                  << report.totalReporting.toDouble() << " " << currency << std::endl;
        return report;
    }

    // ================================================================
    // FX ANALYSIS
    // ================================================================

    domain::FxAnalysis buildFxAnalysis(const domain::Date& asOfDate) override {
        auto snapshot = repository_->openSnapshot(asOfDate);
        auto analysis = computeFxAnalysis(*snapshot, asOfDate);

        std::cout << "[ReportService] FX analysis as of " << asOfDate.toString()
                  << ": " << analysis.positions.size() << " positions, net "
                  << analysis.netGainLoss.toDouble() << ", "
                  << analysis.missingCurrencies.size() << " currencies without rate" << std::endl;
        return analysis;
    }

    // ================================================================
    // ACCOUNT LEDGER
    // ================================================================

    domain::AccountLedger buildAccountLedger(
        const std::string& accountCode,
        const domain::Date& asOfDate) override
    {
        auto snapshot = repository_->openSnapshot(asOfDate);
        const std::string currency = settings_->getBaseCurrency();

        auto accounts = snapshot->listActiveAccounts({});
        auto found = std::find_if(accounts.begin(), accounts.end(),
            [&](const domain::Account& a) { return a.code == accountCode; });
        if (found == accounts.end()) {
            throw domain::AccountNotFoundException(accountCode);
        }

        std::vector<domain::JournalLine> lines;
        for (auto& line : snapshot->listPostedLines()) {
            if (line.accountCode == accountCode) {
                lines.push_back(std::move(line));
            }
        }
        std::stable_sort(lines.begin(), lines.end(),
            [](const domain::JournalLine& a, const domain::JournalLine& b) {
                if (a.entryDate != b.entryDate) {
                    return a.entryDate < b.entryDate;
                }
                if (a.entryNumber != b.entryNumber) {
                    return a.entryNumber < b.entryNumber;
                }
                return a.id < b.id;
            });

        domain::AccountLedger ledger;
        ledger.account = *found;
        ledger.asOfDate = asOfDate;
        ledger.currency = currency;
        ledger.totalDebit = domain::Money::zero(currency);
        ledger.totalCredit = domain::Money::zero(currency);
        domain::Money running = domain::Money::zero(currency);

        for (const auto& line : lines) {
            domain::AccountLedgerLine row;
            row.entryId = line.entryId;
            row.entryNumber = line.entryNumber;
            row.date = line.entryDate;
            row.description = line.description.empty() ? line.entryDescription : line.description;
            row.reference = line.entryReference;
            row.originalCurrency = line.originalCurrency;
            row.debit = line.reportingDebitIn(currency);
            row.credit = line.reportingCreditIn(currency);

            running += BalanceAggregator::netBalance(found->type, row.debit, row.credit);
            row.runningBalance = running;

            ledger.totalDebit += row.debit;
            ledger.totalCredit += row.credit;
            ledger.lines.push_back(std::move(row));
        }
        ledger.closingBalance = running;

        std::cout << "[ReportService] Ledger for " << accountCode << " as of "
                  << asOfDate.toString() << ": " << ledger.lines.size() << " lines" << std::endl;
        return ledger;
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    std::shared_ptr<settings::ReportingSettings> settings_;
    std::shared_ptr<settings::JournalAccountSettings> journalAccounts_;

    domain::FxAnalysis computeFxAnalysis(
        ports::output::ILedgerSnapshot& snapshot,
        const domain::Date& asOfDate)
    {
        const std::string currency = settings_->getBaseCurrency();
        FxRateResolver resolver(snapshot);

        auto invoices = snapshot.listOpenForeignInvoices(currency);
        std::map<std::string, std::vector<domain::PaymentAllocation>> allocations;
        for (const auto& invoice : invoices) {
            allocations[invoice.id] = snapshot.listAllocations(invoice.id);
        }
        auto bankAccounts = snapshot.listForeignBankAccounts(currency);

        UnrealizedFxCalculator calculator(currency, settings_->getTolerance());
        auto analysis = calculator.computePositions(
            invoices, allocations, bankAccounts, resolver, asOfDate);

        VirtualJournalGenerator generator(journalAccounts_, currency, settings_->getTolerance());
        analysis.virtualJournal = generator.generate(analysis.positions);

        if (analysis.hasMissingRates()) {
            std::cout << "[ReportService] Missing rates for:";
            for (const auto& missing : analysis.missingCurrencies) {
                std::cout << " " << missing;
            }
            std::cout << std::endl;
        }
        return analysis;
    }

    static void appendAll(
        std::vector<domain::ReportWarning>& target,
        const std::vector<domain::ReportWarning>& source)
    {
        target.insert(target.end(), source.begin(), source.end());
    }
};

} // namespace reporting::application
