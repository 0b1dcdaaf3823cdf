#include "ResultsCsvWriter.h"
#include "OutputUtils.h"
#include <fstream>

namespace rollsim
{
namespace reporting
{

using utils::formatDecimal;

static std::string optionalField(const std::optional<Num>& value)
{
    return value ? formatDecimal(*value, 2) : std::string();
}

// Text fields are quoted; embedded quotes are doubled
static std::string quoted(const std::string& text)
{
    std::string result("\"");
    for (char c : text)
    {
        if (c == '"')
            result += '"';
        result += c;
    }
    result += '"';
    return result;
}

void ResultsCsvWriter::writeEquityCurve(std::ostream& out, const BacktestResults<Num>& results)
{
    out << "Date,Equity,Lots,DrawdownPercent,Premium" << "\n";

    for (const auto& point : results.getEquityCurve())
    {
        out << boost::gregorian::to_iso_extended_string(point.getDate()) << ","
            << formatDecimal(point.getEquity(), 0) << ","
            << point.getLots() << ","
            << formatDecimal(point.getDrawdownPercent(), 2) << ","
            << optionalField(point.getPremium()) << "\n";
    }
}

void ResultsCsvWriter::writeTradeLog(std::ostream& out, const BacktestResults<Num>& results)
{
    out << "Date,Type,Description,SellPrice,BuyPrice,Lots,GrossPnL,Cost,NetPnL,Equity,Note" << "\n";

    for (const auto& trade : results.getTrades())
    {
        out << boost::gregorian::to_iso_extended_string(trade.getDate()) << ","
            << rollTradeKindToString(trade.getKind()) << ","
            << quoted(trade.getDescription()) << ","
            << optionalField(trade.getSellPrice()) << ","
            << optionalField(trade.getBuyPrice()) << ","
            << trade.getLots() << ","
            << optionalField(trade.getGrossPnL()) << ","
            << optionalField(trade.getCost()) << ","
            << optionalField(trade.getNetPnL()) << ","
            << formatDecimal(trade.getEquitySnapshot(), 2) << ","
            << (trade.getNote() ? quoted(*trade.getNote()) : std::string()) << "\n";
    }
}

void ResultsCsvWriter::writeEquityCurveFile(const std::string& fileName, const BacktestResults<Num>& results)
{
    std::ofstream file(fileName);
    if (!file.is_open())
        throw ResultsWriterException("ResultsCsvWriter::writeEquityCurveFile - cannot open " + fileName);

    writeEquityCurve(file, results);
}

void ResultsCsvWriter::writeTradeLogFile(const std::string& fileName, const BacktestResults<Num>& results)
{
    std::ofstream file(fileName);
    if (!file.is_open())
        throw ResultsWriterException("ResultsCsvWriter::writeTradeLogFile - cannot open " + fileName);

    writeTradeLog(file, results);
}

} // namespace reporting
} // namespace rollsim
