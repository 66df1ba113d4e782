/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <mutex>
#include <ostream>

#include "IoUtility.hh"

namespace Tarot {

/** \brief Severity of a log line
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Other events of importance
    DEBUG     ///< Verbose debugging logging
};

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
std::unique_lock<std::mutex> lockLogStream();
void writePrefix(LogLevel level);
std::ostream& logStream();

template<typename FormatIterator>
void log(FormatIterator first, FormatIterator last)
{
    if (first != last) {
        logStream() << std::addressof(*first);
    }
}

template<typename FormatIterator, typename First, typename... Rest>
void log(
    FormatIterator first, FormatIterator last, const First& arg,
    const Rest&... rest)
{
    const auto iter = std::find(first, last, '%');
    if (iter == last || std::next(iter) == last) {
        log(first, iter);
    } else {
        logStream().write(std::addressof(*first), iter - first);
        // Tarot::operator<< for optional values
        {
            using Tarot::operator<<;
            logStream() << arg;
        }
        log(std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Write a log line
 *
 * The line is written if \p level passes the level given to
 * setupLogging(). Each \c % in \p format consumes the character after it and
 * is replaced by the next value of \p ts streamed with \c operator<<. The
 * character after \c % only marks the position. Its type is not checked.
 *
 * Lines are written under a lock and may be logged from any thread.
 *
 * \param level the level of the line
 * \param format the format string
 * \param ts the values to format
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        const auto lock = Impl::lockLogStream();
        Impl::writePrefix(level);
        Impl::log(std::begin(format), std::end(format), ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Map number of \c -v flags to log level
 *
 * \return LogLevel::WARNING for 0, LogLevel::INFO for 1 and LogLevel::DEBUG
 * for more
 */
LogLevel getLogLevel(int verbosity);

/** \brief Set the minimum log level and the log stream
 *
 * Before the first call, lines at LogLevel::WARNING and above go to
 * \c std::cerr. LogLevel::NONE disables logging. \p stream must outlive any
 * logging done before the next call. Not synchronized with log().
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
