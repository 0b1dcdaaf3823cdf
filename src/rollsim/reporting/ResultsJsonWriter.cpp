#include "ResultsJsonWriter.h"
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <fstream>

using namespace rapidjson;

namespace rollsim
{
namespace reporting
{

static Value dateValue(const boost::gregorian::date& d, Document::AllocatorType& allocator)
{
    return Value(boost::gregorian::to_iso_extended_string(d).c_str(), allocator);
}

static Value numberValue(const std::optional<Num>& value)
{
    Value result;
    if (value)
        result.SetDouble(num::to_double(*value));
    return result;
}

static Value serializeSummary(const BacktestResults<Num>& results, Document::AllocatorType& allocator)
{
    const SummaryStats<Num>& stats = results.getSummaryStats();
    Value summary(kObjectType);

    summary.AddMember("startDate", dateValue(results.getSimulationWindow().getFirstDate(), allocator), allocator);
    summary.AddMember("endDate", dateValue(results.getSimulationWindow().getLastDate(), allocator), allocator);
    summary.AddMember("initialCapital", num::to_double(stats.getInitialCapital()), allocator);
    summary.AddMember("finalCapital", num::to_double(stats.getFinalCapital()), allocator);
    summary.AddMember("totalReturn", num::to_double(stats.getTotalReturnPercent()), allocator);
    summary.AddMember("cagr", num::to_double(stats.getCagrPercent()), allocator);
    summary.AddMember("averageAnnualReturn", num::to_double(stats.getAverageAnnualReturnPercent()), allocator);
    summary.AddMember("maxDrawdown", num::to_double(stats.getMaxDrawdownPercent()), allocator);
    summary.AddMember("maxLots", stats.getMaxLots(), allocator);
    summary.AddMember("rollovers", static_cast<uint64_t>(stats.getNumRollovers()), allocator);
    summary.AddMember("compoundings", static_cast<uint64_t>(stats.getNumCompoundings()), allocator);
    summary.AddMember("blockedRollovers", static_cast<uint64_t>(stats.getNumBlockedRollovers()), allocator);
    summary.AddMember("transactionCosts", num::to_double(stats.getTotalTransactionCosts()), allocator);

    return summary;
}

static Value serializeTrade(const RollTrade<Num>& trade, Document::AllocatorType& allocator)
{
    Value obj(kObjectType);

    obj.AddMember("date", dateValue(trade.getDate(), allocator), allocator);
    obj.AddMember("type", Value(rollTradeKindToString(trade.getKind()).c_str(), allocator), allocator);
    obj.AddMember("description", Value(trade.getDescription().c_str(), allocator), allocator);
    obj.AddMember("sellPrice", numberValue(trade.getSellPrice()), allocator);
    obj.AddMember("buyPrice", numberValue(trade.getBuyPrice()), allocator);
    obj.AddMember("lots", trade.getLots(), allocator);
    obj.AddMember("grossPnL", numberValue(trade.getGrossPnL()), allocator);
    obj.AddMember("cost", numberValue(trade.getCost()), allocator);
    obj.AddMember("netPnL", numberValue(trade.getNetPnL()), allocator);
    obj.AddMember("equity", num::to_double(trade.getEquitySnapshot()), allocator);

    Value note;
    if (trade.getNote())
        note.SetString(trade.getNote()->c_str(), allocator);
    obj.AddMember("note", note, allocator);

    return obj;
}

std::string ResultsJsonWriter::exportToJson(const BacktestResults<Num>& results)
{
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("summary", serializeSummary(results, allocator), allocator);

    Value equityCurve(kArrayType);
    for (const auto& point : results.getEquityCurve())
    {
        Value obj(kObjectType);
        obj.AddMember("date", dateValue(point.getDate(), allocator), allocator);
        obj.AddMember("equity", num::to_double(point.getEquity()), allocator);
        obj.AddMember("lots", point.getLots(), allocator);
        obj.AddMember("drawdown", num::to_double(point.getDrawdownPercent()), allocator);
        obj.AddMember("premium", numberValue(point.getPremium()), allocator);
        equityCurve.PushBack(obj, allocator);
    }
    doc.AddMember("equityCurve", equityCurve, allocator);

    Value drawdownCurve(kArrayType);
    for (const auto& point : results.getDrawdownCurve())
    {
        Value obj(kObjectType);
        obj.AddMember("date", dateValue(point.date, allocator), allocator);
        obj.AddMember("drawdown", num::to_double(point.drawdownPercent), allocator);
        drawdownCurve.PushBack(obj, allocator);
    }
    doc.AddMember("drawdownCurve", drawdownCurve, allocator);

    Value yearlyReturns(kArrayType);
    for (const auto& yearly : results.getYearlyReturns())
    {
        Value obj(kObjectType);
        obj.AddMember("year", yearly.year, allocator);
        obj.AddMember("return", num::to_double(yearly.returnPercent), allocator);
        yearlyReturns.PushBack(obj, allocator);
    }
    doc.AddMember("yearlyReturns", yearlyReturns, allocator);

    Value trades(kArrayType);
    for (const auto& trade : results.getTrades())
        trades.PushBack(serializeTrade(trade, allocator), allocator);
    doc.AddMember("trades", trades, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

void ResultsJsonWriter::saveToFile(const BacktestResults<Num>& results, const std::string& filePath)
{
    std::ofstream file(filePath);
    if (!file.is_open())
        throw ResultsWriterException("ResultsJsonWriter::saveToFile - cannot open " + filePath);

    file << exportToJson(results);
}

} // namespace reporting
} // namespace rollsim
