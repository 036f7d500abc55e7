#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace rebalancer
{
namespace utils
{

/**
 * @brief Stream buffer that forwards every write to a console buffer and a
 *        log file buffer
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* console, std::streambuf* logFile);

protected:
    int overflow(int c) override;
    std::streamsize xsputn(const char* s, std::streamsize n) override;
    int sync() override;

private:
    std::streambuf* mConsole;
    std::streambuf* mLogFile;
};

/**
 * @brief Output stream for the run log, echoed to the console and a log file
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& console, std::ostream& logFile);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Path "<directory>/<strategy>_<frequency>_<kind>.csv" for a run
 *        output file, lower cased, creating directory when missing
 *
 * An empty directory means the current directory.
 */
std::string createOutputFileName(const std::string& directory,
                                 const std::string& strategyName,
                                 const std::string& frequency,
                                 const std::string& kind);

} // namespace utils
} // namespace rebalancer
