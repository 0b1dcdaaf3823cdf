#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include "number.h"
#include "BacktestResults.h"

namespace rollsim
{
namespace reporting
{

using Num = num::DefaultNumber;

class ResultsWriterException : public std::runtime_error
{
public:
    ResultsWriterException(const std::string msg)
        : std::runtime_error(msg)
    {}

    ~ResultsWriterException()
    {}
};

/**
 * @brief Writes the equity curve and the trade ledger of a run as CSV
 *
 * Equity curve columns: Date,Equity,Lots,DrawdownPercent,Premium
 * Trade log columns: Date,Type,Description,SellPrice,BuyPrice,Lots,GrossPnL,
 * Cost,NetPnL,Equity,Note
 *
 * Dates are ISO (YYYY-MM-DD). Values that do not apply to a trade are left empty.
 */
class ResultsCsvWriter
{
public:
    static void writeEquityCurve(std::ostream& out, const BacktestResults<Num>& results);
    static void writeTradeLog(std::ostream& out, const BacktestResults<Num>& results);

    /**
     * @throws ResultsWriterException if the file cannot be opened
     */
    static void writeEquityCurveFile(const std::string& fileName, const BacktestResults<Num>& results);

    /**
     * @throws ResultsWriterException if the file cannot be opened
     */
    static void writeTradeLogFile(const std::string& fileName, const BacktestResults<Num>& results);
};

} // namespace reporting
} // namespace rollsim
