/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include <algorithm>
#include <iterator>
#include <memory>
#include <ostream>

#include "IoUtility.hh"

namespace Blackjack {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Unrecoverable error situations
    ERROR,    ///< Recoverable error situations
    WARNING,  ///< Rejected commands and other unexpected events
    INFO,     ///< Round and shoe level events
    DEBUG     ///< Individual cards and transitions
};

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
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
        // Brings the operator<< overloads of the Blackjack namespace (for
        // optionals and variants among others) into consideration
        {
            using Blackjack::operator<<;
            logStream() << arg;
        }
        log(std::next(iter, 2), last, rest...);
    }
}

}

/// \endcond

/** \brief Logging utility
 *
 * Log message if \p level is at least the minimum logging level set by
 * setupLogging().
 *
 * The \p format string uses % followed by exactly one character as a
 * placeholder. The character after % is ignored and the corresponding value in
 * \p ts is written using its operator<<. Placeholders without a value, and
 * values without a placeholder, are dropped.
 *
 * \note The utility is not thread safe.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values streamed to the placeholders in \p format
 */
template<typename String, typename... Ts>
void log(LogLevel level, const String& format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        Impl::log(std::begin(format), std::end(format), ts...);
        Impl::logStream() << '\n';
    }
}

/** \brief Map verbosity to logging level
 *
 * \param verbosity the verbosity level (typically the number of times -v flag
 * is given)
 *
 * \return LogLevel corresponding the verbosity (0 warning, 1 info, >=2 debug)
 */
LogLevel getLogLevel(int verbosity);

/** \brief Setup logging utility
 *
 * Sets the (global) minimum logging level and the stream the log is written
 * to. Until this function is called the level is LogLevel::WARNING and the
 * stream is std::cerr.
 *
 * The caller must ensure that \p stream outlives any logging that takes place
 * before the next call to this function.
 *
 * \param level the minimum logging level that causes log to be output
 * \param stream the output stream to which the logs are output
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
