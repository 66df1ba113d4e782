#include "Logging.hh"

#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>

namespace Tarot {

namespace {

std::reference_wrapper<std::ostream> logOutput {std::cerr};
LogLevel minimumLevel {LogLevel::WARNING};
std::mutex logMutex;

const char* getLevelName(const LogLevel level)
{
    switch (level) {
    case LogLevel::FATAL:
        return "FATAL";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::NONE:
        break;
    }
    return "";
}

}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    return level != LogLevel::NONE && level <= minimumLevel;
}

std::unique_lock<std::mutex> lockLogStream()
{
    return std::unique_lock {logMutex};
}

void writePrefix(const LogLevel level)
{
    const auto now = std::time(nullptr);
    auto utc = std::tm {};
    gmtime_r(&now, &utc);
    logStream() << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ ")
                << std::left << std::setw(8) << getLevelName(level)
                << std::right;
}

std::ostream& logStream()
{
    return logOutput.get();
}

}

LogLevel getLogLevel(const int verbosity)
{
    switch (verbosity) {
    case 0:
        return LogLevel::WARNING;
    case 1:
        return LogLevel::INFO;
    }
    return verbosity > 1 ? LogLevel::DEBUG : LogLevel::WARNING;
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    minimumLevel = level;
    logOutput = stream;
}

}
