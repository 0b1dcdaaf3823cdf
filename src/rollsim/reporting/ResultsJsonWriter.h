#pragma once

#include <string>
#include "number.h"
#include "BacktestResults.h"
#include "ResultsCsvWriter.h"

namespace rollsim
{
namespace reporting
{

/**
 * @brief Serializes a run into a single JSON document
 *
 * Top level members: summary, equityCurve, drawdownCurve, yearlyReturns and
 * trades (most recent first). Values that do not apply are null.
 */
class ResultsJsonWriter
{
public:
    static std::string exportToJson(const BacktestResults<Num>& results);

    /**
     * @throws ResultsWriterException if the file cannot be opened
     */
    static void saveToFile(const BacktestResults<Num>& results, const std::string& filePath);
};

} // namespace reporting
} // namespace rollsim
