#include "OutputUtils.h"
#include <boost/filesystem.hpp>
#include <iomanip>
#include <sstream>

namespace rollsim
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }
    
    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string createOutputFileName(const std::string& outputDir,
                                 const std::string& symbol,
                                 const std::string& suffix)
{
    boost::filesystem::path dir(outputDir.empty() ? std::string(".") : outputDir);
    boost::filesystem::create_directories(dir);

    return (dir / (symbol + "_" + suffix)).string();
}

std::string formatDecimal(const num::DefaultNumber& value, int places)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(places) << num::to_double(value);
    return os.str();
}

} // namespace utils
} // namespace rollsim
