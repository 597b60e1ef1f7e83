#include "adapters/primary/ReportJsonSerializer.hpp"

namespace reporting::adapters::primary {

namespace {

using nlohmann::json;

json optionalRate(const std::optional<double>& rate) {
    return rate ? json(*rate) : json(nullptr);
}

json optionalAmount(const std::optional<domain::Money>& money) {
    return money ? json(money->toDouble()) : json(nullptr);
}

json treeNodeToJson(const domain::AccountTree& tree, size_t index) {
    const auto& node = tree.nodes[index];

    json j;
    j["account_code"] = node.account.code;
    j["account_name"] = node.account.name;
    j["account_type"] = domain::toString(node.account.type);
    j["level"] = node.depth;
    j["debit"] = node.balance.reportingDebit.toDouble();
    j["credit"] = node.balance.reportingCredit.toDouble();
    j["net_balance"] = node.net.toDouble();
    j["rolled_up_balance"] = tree.rolledUpNet(index).toDouble();

    json children = json::array();
    for (size_t child : node.children) {
        children.push_back(treeNodeToJson(tree, child));
    }
    j["children"] = children;
    return j;
}

json sheetLinesToJson(const std::vector<domain::BalanceSheetLine>& lines) {
    json result = json::array();
    for (const auto& line : lines) {
        json j;
        j["account_code"] = line.accountCode;
        j["account_name"] = line.accountName;
        j["account_type"] = domain::toString(line.type);
        j["level"] = line.depth;
        // Обороты в разных валютах не складываются
        j["balance"] = line.mixedCurrency
            ? json(nullptr)
            : ReportJsonSerializer::moneyToJson(line.balance);
        j["reporting_balance"] = line.reportingBalance.toDouble();
        result.push_back(j);
    }
    return result;
}

json positionToJson(const domain::ForeignPosition& position) {
    json j;
    j["source_id"] = position.sourceId;
    j["source_type"] = domain::toString(position.sourceType);
    j["reference"] = position.sourceReference;
    j["currency"] = position.currency;
    j["remaining_amount"] = position.remainingAmount.toDouble();
    j["historical_rate"] = optionalRate(position.historicalRate);
    j["historical_rate_kind"] = domain::toString(position.historicalRateKind);
    j["current_rate"] = optionalRate(position.currentRate);
    j["historical_value"] = optionalAmount(position.historicalValue);
    j["current_value"] = optionalAmount(position.currentValue);
    j["gain_loss"] = optionalAmount(position.gainLoss);
    j["as_of_date"] = position.asOfDate.toString();
    return j;
}

json journalLineToJson(const domain::VirtualJournalLine& line) {
    json j;
    j["account_code"] = line.accountCode;
    j["account_name"] = line.accountName;
    j["debit"] = line.debit.toDouble();
    j["credit"] = line.credit.toDouble();
    j["description"] = line.description;
    j["currency"] = line.currency;
    j["fx_impact"] = line.fxImpact.toDouble();
    return j;
}

} // namespace

nlohmann::json ReportJsonSerializer::moneyToJson(const domain::Money& money) {
    json j;
    j["amount"] = money.toDouble();
    j["currency"] = money.currency;
    return j;
}

nlohmann::json ReportJsonSerializer::warningsToJson(const std::vector<domain::ReportWarning>& warnings) {
    json result = json::array();
    for (const auto& warning : warnings) {
        json j;
        j["kind"] = domain::toString(warning.kind);
        j["subject"] = warning.subject;
        j["message"] = warning.message;
        result.push_back(j);
    }
    return result;
}

nlohmann::json ReportJsonSerializer::toJson(const domain::TrialBalance& report) {
    json j;
    j["report"] = "trial_balance";
    j["as_of_date"] = report.asOfDate.toString();
    j["currency"] = report.currency;

    json accounts = json::array();
    for (size_t root : report.tree.roots) {
        accounts.push_back(treeNodeToJson(report.tree, root));
    }
    j["accounts"] = accounts;
    j["total_debits"] = report.totalDebits.toDouble();
    j["total_credits"] = report.totalCredits.toDouble();
    j["difference"] = report.difference().toDouble();
    j["balanced"] = report.balanced;
    j["warnings"] = warningsToJson(report.warnings);
    return j;
}

nlohmann::json ReportJsonSerializer::toJson(const domain::BalanceSheet& report) {
    json j;
    j["report"] = "balance_sheet";
    j["as_of_date"] = report.asOfDate.toString();
    j["currency"] = report.currency;
    j["assets"] = sheetLinesToJson(report.assets);
    j["liabilities"] = sheetLinesToJson(report.liabilities);
    j["equity"] = sheetLinesToJson(report.equity);
    j["total_assets"] = report.totalAssets.toDouble();
    j["total_liabilities"] = report.totalLiabilities.toDouble();
    j["total_equity"] = report.totalEquity.toDouble();
    j["liabilities_and_equity"] = report.liabilitiesAndEquity.toDouble();
    j["unrealized_fx"] = toJson(report.unrealizedFx);
    j["warnings"] = warningsToJson(report.warnings);
    return j;
}

nlohmann::json ReportJsonSerializer::toJson(const domain::ArBreakdown& report) {
    json j;
    j["report"] = "ar_breakdown";
    j["as_of_date"] = report.asOfDate.toString();
    j["currency"] = report.currency;

    json items = json::array();
    for (const auto& item : report.items) {
        json i;
        i["invoice_id"] = item.invoiceId;
        i["invoice_number"] = item.invoiceNumber;
        i["customer_name"] = item.customerName;
        i["currency"] = item.currency;
        i["total_amount"] = item.totalAmount.toDouble();
        i["allocated_amount"] = item.allocatedAmount.toDouble();
        i["remaining_amount"] = item.remainingAmount.toDouble();
        i["rate"] = optionalRate(item.rate);
        i["reporting_amount"] = item.reportingAmount.toDouble();
        i["date"] = item.date.toString();
        i["due_date"] = item.dueDate.toString();
        i["days_overdue"] = item.daysOverdue;
        i["status"] = domain::toString(item.status);
        items.push_back(i);
    }
    j["items"] = items;

    json byStatus = json::object();
    for (const auto& [status, summary] : report.byStatus) {
        byStatus[domain::toString(status)] = {
            {"count", summary.count},
            {"total", summary.total.toDouble()}
        };
    }
    j["by_status"] = byStatus;
    j["total_reporting"] = report.totalReporting.toDouble();
    j["warnings"] = warningsToJson(report.warnings);
    return j;
}

nlohmann::json ReportJsonSerializer::toJson(const domain::FxAnalysis& report) {
    json j;
    j["report"] = "fx_analysis";
    j["as_of_date"] = report.asOfDate.toString();
    j["currency"] = report.reportingCurrency;

    json positions = json::array();
    for (const auto& position : report.positions) {
        positions.push_back(positionToJson(position));
    }
    j["positions"] = positions;

    json journal = json::array();
    for (const auto& line : report.virtualJournal) {
        journal.push_back(journalLineToJson(line));
    }
    j["virtual_journal"] = journal;

    j["missing_currencies"] = report.missingCurrencies;
    json missing = json::array();
    for (const auto& entry : report.missingRates) {
        missing.push_back({
            {"currency", entry.currency},
            {"positions_count", entry.positionsCount},
            {"total_amount", entry.totalAmount.toDouble()}
        });
    }
    j["missing_rates"] = missing;
    j["total_gain"] = report.totalGain.toDouble();
    j["total_loss"] = report.totalLoss.toDouble();
    j["net_gain_loss"] = report.netGainLoss.toDouble();
    j["warnings"] = warningsToJson(report.warnings);
    return j;
}

nlohmann::json ReportJsonSerializer::toJson(const domain::AccountLedger& report) {
    json j;
    j["report"] = "account_ledger";
    j["as_of_date"] = report.asOfDate.toString();
    j["currency"] = report.currency;
    j["account_code"] = report.account.code;
    j["account_name"] = report.account.name;
    j["account_type"] = domain::toString(report.account.type);

    json lines = json::array();
    for (const auto& line : report.lines) {
        json l;
        l["entry_id"] = line.entryId;
        l["entry_number"] = line.entryNumber;
        l["date"] = line.date.toString();
        l["description"] = line.description;
        l["reference"] = line.reference;
        l["original_currency"] = line.originalCurrency;
        l["debit"] = line.debit.toDouble();
        l["credit"] = line.credit.toDouble();
        l["running_balance"] = line.runningBalance.toDouble();
        lines.push_back(l);
    }
    j["lines"] = lines;
    j["total_debit"] = report.totalDebit.toDouble();
    j["total_credit"] = report.totalCredit.toDouble();
    j["closing_balance"] = report.closingBalance.toDouble();
    return j;
}

nlohmann::json ReportJsonSerializer::toJson(const domain::FxRate& rate) {
    json j;
    j["id"] = rate.id;
    j["from_currency"] = rate.fromCurrency;
    j["to_currency"] = rate.toCurrency;
    j["date"] = rate.date.toString();
    j["rate"] = rate.rate;
    j["source"] = rate.source;
    j["is_active"] = rate.active;
    j["sequence"] = rate.sequence;
    return j;
}

} // namespace reporting::adapters::primary
