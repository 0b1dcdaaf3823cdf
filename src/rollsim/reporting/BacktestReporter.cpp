#include "BacktestReporter.h"
#include "OutputUtils.h"
#include <iomanip>

namespace rollsim
{
namespace reporting
{

using utils::formatDecimal;

// "+5.0" for gains, "-3.2" for losses
static std::string formatSignedPercent(const Num& value)
{
    std::string text = formatDecimal(value, 1);
    if (value > DecimalConstants<Num>::DecimalZero)
        return "+" + text;
    return text;
}

static std::string formatOptional(const std::optional<Num>& value, int places)
{
    return value ? formatDecimal(*value, places) : std::string("-");
}

void BacktestReporter::writeBacktestReport(std::ostream& out,
                                           const BacktestResults<Num>& results,
                                           const BacktestConfiguration<Num>& config)
{
    writeConfiguration(out, results, config);
    out << std::endl;
    writeSummary(out, results.getSummaryStats());
    out << std::endl;
    writeYearlyReturns(out, results);
    out << std::endl;
    writeTradeLog(out, results);
}

void BacktestReporter::writeConfiguration(std::ostream& out,
                                          const BacktestResults<Num>& results,
                                          const BacktestConfiguration<Num>& config)
{
    const DateRange& window = results.getSimulationWindow();
    const FuturesContractAttributes<Num>& contract = config.getContractAttributes();

    writeSectionHeader(out, "Backtest Configuration");

    out << "Contract: " << contract.getSymbol() << " (" << contract.getExchange() << "), "
        << contract.getName() << std::endl;
    out << "Window: " << boost::gregorian::to_iso_extended_string(window.getFirstDate())
        << " to " << boost::gregorian::to_iso_extended_string(window.getLastDate()) << std::endl;
    out << "Initial Lots: " << config.getInitialLots() << std::endl;
    out << "Initial Margin: " << formatDecimal(config.getInitialMarginPercent(), 2) << "%" << std::endl;
    out << "Transaction Cost per Lot: " << formatDecimal(config.getTransactionCost(), 2) << std::endl;
    out << "Contract Multiplier: " << formatDecimal(config.getContractMultiplier(), 2) << std::endl;
    out << "Compounding: " << (config.isCompounding() ? "on" : "off");
    if (config.isCompounding())
        out << " (target " << formatDecimal(config.getCompoundingFactor(), 1) << "%)";
    out << std::endl;
    out << "Expiry Guard: " << (config.isExpiryGuardEnforced() ? "on" : "off") << std::endl;

    writeSectionFooter(out);
}

void BacktestReporter::writeSummary(std::ostream& out, const SummaryStats<Num>& stats)
{
    writeSectionHeader(out, "Summary");

    out << "Start Capital: " << formatDecimal(stats.getInitialCapital(), 2) << std::endl;
    out << "Final Capital: " << formatDecimal(stats.getFinalCapital(), 2) << std::endl;
    out << "Total Return: " << formatDecimal(stats.getTotalReturnPercent(), 0) << "%" << std::endl;
    out << "CAGR: " << formatDecimal(stats.getCagrPercent(), 1) << "%" << std::endl;
    out << "Average Annual Return: " << formatDecimal(stats.getAverageAnnualReturnPercent(), 1) << "%" << std::endl;
    out << "Max Drawdown: " << formatDecimal(stats.getMaxDrawdownPercent(), 1) << "%" << std::endl;
    out << "Max Lots: " << stats.getMaxLots() << std::endl;
    out << "Rollovers: " << stats.getNumRollovers() << std::endl;
    out << "Compounding Events: " << stats.getNumCompoundings() << std::endl;
    out << "Blocked Rollovers: " << stats.getNumBlockedRollovers() << std::endl;
    out << "Total Transaction Costs: " << formatDecimal(stats.getTotalTransactionCosts(), 2) << std::endl;

    writeSectionFooter(out);
}

void BacktestReporter::writeYearlyReturns(std::ostream& out, const BacktestResults<Num>& results)
{
    writeSectionHeader(out, "Yearly Returns");

    for (const auto& yearly : results.getYearlyReturns())
        out << yearly.year << ": " << formatSignedPercent(yearly.returnPercent) << "%" << std::endl;

    writeSectionFooter(out);
}

void BacktestReporter::writeTradeLog(std::ostream& out, const BacktestResults<Num>& results)
{
    writeSectionHeader(out, "Trade Log");

    out << std::left
        << std::setw(12) << "Date"
        << std::setw(17) << "Type"
        << std::setw(26) << "Details"
        << std::setw(24) << "Prices (S / B)"
        << std::setw(14) << "Gross PnL"
        << std::setw(14) << "Net PnL"
        << "Note" << std::endl;

    for (const auto& trade : results.getTrades())
    {
        std::string prices("-");
        if (trade.getSellPrice() && trade.getBuyPrice())
            prices = formatDecimal(*trade.getSellPrice(), 0) + " / " + formatDecimal(*trade.getBuyPrice(), 0);

        std::string details = trade.getDescription();
        if (trade.getKind() == RollTradeKind::Compounding)
            details += " (" + std::to_string(trade.getLots()) + " lots)";

        out << std::setw(12) << boost::gregorian::to_iso_extended_string(trade.getDate())
            << std::setw(17) << rollTradeKindToString(trade.getKind())
            << std::setw(26) << details
            << std::setw(24) << prices
            << std::setw(14) << formatOptional(trade.getGrossPnL(), 0)
            << std::setw(14) << formatOptional(trade.getNetPnL(), 0)
            << (trade.getNote() ? *trade.getNote() : std::string()) << std::endl;
    }

    out << std::right;
    writeSectionFooter(out);
}

void BacktestReporter::writeSectionHeader(std::ostream& out, const std::string& title)
{
    out << "=== " << title << " ===" << std::endl;
}

void BacktestReporter::writeSectionFooter(std::ostream& out)
{
    out << "===================================" << std::endl;
}

} // namespace reporting
} // namespace rollsim
