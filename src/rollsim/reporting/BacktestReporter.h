#pragma once

#include <ostream>
#include <string>
#include "number.h"
#include "BacktestConfiguration.h"
#include "BacktestResults.h"

namespace rollsim
{
namespace reporting
{

using Num = num::DefaultNumber;

/**
 * @brief Reporter for perpetual roll backtest results
 * 
 * Writes a plain text report: the run configuration, the summary statistics,
 * returns by calendar year and the trade ledger, most recent trade first.
 */
class BacktestReporter
{
public:
    /**
     * @brief Write the complete report
     * @param out Stream to write to (console, file or both through a TeeStream)
     * @param results Results of one run
     * @param config Configuration the run used
     */
    static void writeBacktestReport(std::ostream& out,
                                    const BacktestResults<Num>& results,
                                    const BacktestConfiguration<Num>& config);

    static void writeConfiguration(std::ostream& out,
                                   const BacktestResults<Num>& results,
                                   const BacktestConfiguration<Num>& config);

    static void writeSummary(std::ostream& out, const SummaryStats<Num>& stats);

    static void writeYearlyReturns(std::ostream& out, const BacktestResults<Num>& results);

    static void writeTradeLog(std::ostream& out, const BacktestResults<Num>& results);

private:
    static void writeSectionHeader(std::ostream& out, const std::string& title);
    static void writeSectionFooter(std::ostream& out);
};

} // namespace reporting
} // namespace rollsim
