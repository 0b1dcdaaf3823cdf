#pragma once

#include <streambuf>
#include <ostream>
#include <string>
#include "number.h"

namespace rollsim
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 * 
 * This class allows writing to two different stream buffers simultaneously,
 * useful for writing a report to both console and file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    /**
     * @brief Construct a TeeBuf with two target stream buffers
     * @param sb1 First stream buffer to write to
     * @param sb2 Second stream buffer to write to
     */
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Handle character overflow by writing to both buffers
     * @param c Character to write
     * @return EOF on error, otherwise the character written
     */
    int overflow(int c) override;

    /**
     * @brief Synchronize both underlying buffers
     * @return 0 on success, -1 on error
     */
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Name of an output file inside outputDir, creating the directory if needed
 * @param outputDir Directory the file goes into; empty means the current directory
 * @param symbol Contract symbol, e.g. "GOLD"
 * @param suffix Descriptive suffix including the extension, e.g. "Equity.csv"
 * @return outputDir/SYMBOL_suffix
 */
std::string createOutputFileName(const std::string& outputDir,
                                 const std::string& symbol,
                                 const std::string& suffix);

/**
 * @brief Fixed point rendering of a decimal, e.g. formatDecimal(1050.456, 2) == "1050.46"
 */
std::string formatDecimal(const num::DefaultNumber& value, int places);

} // namespace utils
} // namespace rollsim
