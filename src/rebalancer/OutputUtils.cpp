#include "OutputUtils.h"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

namespace rebalancer
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* console, std::streambuf* logFile)
    : mConsole(console),
      mLogFile(logFile)
{
}

int TeeBuf::overflow(int c)
{
    if (traits_type::eq_int_type(c, traits_type::eof()))
        return traits_type::not_eof(c);

    const char ch = traits_type::to_char_type(c);
    const bool consoleOk = !traits_type::eq_int_type(mConsole->sputc(ch), traits_type::eof());
    const bool logOk = !traits_type::eq_int_type(mLogFile->sputc(ch), traits_type::eof());
    return (consoleOk && logOk) ? c : traits_type::eof();
}

std::streamsize TeeBuf::xsputn(const char* s, std::streamsize n)
{
    const std::streamsize written = mConsole->sputn(s, n);
    const std::streamsize logged = mLogFile->sputn(s, n);
    return std::min(written, logged);
}

int TeeBuf::sync()
{
    const int consoleResult = mConsole->pubsync();
    const int logResult = mLogFile->pubsync();
    return (consoleResult == 0 && logResult == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& console, std::ostream& logFile)
    : std::ostream(nullptr),
      mTeeBuf(console.rdbuf(), logFile.rdbuf())
{
    rdbuf(&mTeeBuf);
}

std::string createOutputFileName(const std::string& directory,
                                 const std::string& strategyName,
                                 const std::string& frequency,
                                 const std::string& kind)
{
    const boost::filesystem::path dir(directory.empty() ? "." : directory);
    if (!boost::filesystem::exists(dir))
        boost::filesystem::create_directories(dir);

    const std::string name = boost::algorithm::to_lower_copy(strategyName + "_" + frequency + "_" + kind) + ".csv";
    return (dir / name).string();
}

} // namespace utils
} // namespace rebalancer
