#ifndef __RESTED_LOG_H__
#define __RESTED_LOG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <sys/types.h>

#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/date_time/posix_time/ptime.hpp>

#include "predef.h"
#include "version.h"

namespace Rested {

class Logger;

/// @brief Static interface to the logging framework
/// @details
/// Loggers form a tree by name, with ':' separating levels
/// ("rested:http:range" is a child of "rested:http").  A Logger's level is
/// derived from the log.*mask ConfigVars: the most verbose level whose
/// regex matches the Logger's full name wins, otherwise only FATAL is
/// enabled.  Messages go to the sinks of the Logger and of every ancestor
/// up to the first one that does not inheritSinks().
/// @sa LogMacros
class Log : boost::noncopyable
{
private:
    Log();

public:
    enum Level {
        NONE,
        FATAL,
        ERROR,
        WARNING,
        INFO,
        VERBOSE,
        DEBUG,
        TRACE
    };

    static boost::shared_ptr<Logger> root();
    /// Find or create a Logger by name; new Loggers start at the level the
    /// current masks give them
    static boost::shared_ptr<Logger> lookup(const std::string &name);
};

/// One message, as handed to a LogSink
struct LogRecord
{
    std::string logger;
    boost::posix_time::ptime time;
    pid_t thread;
    Log::Level level;
    std::string message;
    const char *file;
    int line;
};

/// Receives formatted log messages
class LogSink
{
public:
    typedef boost::shared_ptr<LogSink> ptr;

public:
    virtual ~LogSink() {}

    virtual void log(const LogRecord &record) = 0;

    /// "<time> <level> <thread> <logger> <file>:<line> <message>\n"
    static std::string format(const LogRecord &record);
};

/// Writes to std::cout; enabled with log.stdout
class StdoutLogSink : public LogSink
{
public:
    void log(const LogRecord &record);
};

/// Appends to a file; enabled by naming the file in log.file
///
/// Each message is a single write() to a descriptor opened with O_APPEND.
class FileLogSink : public LogSink
{
public:
    /// @throws NativeException if file cannot be opened
    FileLogSink(const std::string &file);
    ~FileLogSink();

    void log(const LogRecord &record);

    const std::string &file() const { return m_file; }

private:
    std::string m_file;
    int m_fd;
};

/// Returned by Logger::log(); whatever is streamed to os() is logged when
/// the event is destroyed
struct LogEvent
{
    friend class Logger;
private:
    LogEvent(boost::shared_ptr<Logger> logger, Log::Level level,
        const char *file, int line)
        : m_logger(logger),
          m_level(level),
          m_file(file),
          m_line(line)
    {}

public:
    LogEvent(const LogEvent &copy)
        : m_logger(copy.m_logger),
          m_level(copy.m_level),
          m_file(copy.m_file),
          m_line(copy.m_line)
    {}
    ~LogEvent();

    std::ostream &os() { return m_os; }

private:
    boost::shared_ptr<Logger> m_logger;
    Log::Level m_level;
    const char *m_file;
    int m_line;
    std::ostringstream m_os;
};

class Logger : public boost::enable_shared_from_this<Logger>
{
    friend class Log;
public:
    typedef boost::shared_ptr<Logger> ptr;

private:
    Logger(const std::string &name, Logger::ptr parent);

public:
    bool enabled(Log::Level level) const
    { return level == Log::FATAL || m_level >= level; }
    Log::Level level() const { return m_level; }
    /// Overrides the mask-derived level of this Logger and its descendants,
    /// until the masks next change
    void level(Log::Level level);

    bool inheritSinks() const { return m_inheritSinks; }
    void inheritSinks(bool inherit) { m_inheritSinks = inherit; }
    void addSink(LogSink::ptr sink) { m_sinks.push_back(sink); }
    void removeSink(LogSink::ptr sink);

    LogEvent log(Log::Level level, const char *file = NULL, int line = -1)
    { return LogEvent(shared_from_this(), level, file, line); }
    void log(Log::Level level, const std::string &message,
        const char *file = NULL, int line = -1);

    const std::string &name() const { return m_name; }

    /// Recomputes the level of this Logger and its descendants from the masks
    void applyMasks();

private:
    std::string m_name;
    boost::weak_ptr<Logger> m_parent;
    std::map<std::string, Logger::ptr> m_children;
    Log::Level m_level;
    std::vector<LogSink::ptr> m_sinks;
    bool m_inheritSinks;
};

/// @defgroup LogMacros Logging Macros
/// Stream a message to a Logger, capturing file and line.  The streaming
/// expression is not evaluated at all unless the level is enabled.
/// @{
#define RESTED_LOG_LEVEL(lg, level) if ((lg)->enabled(level))                   \
    (lg)->log(level, __FILE__, __LINE__).os()
#define RESTED_LOG_FATAL(log) RESTED_LOG_LEVEL(log, ::Rested::Log::FATAL)
#define RESTED_LOG_ERROR(log) RESTED_LOG_LEVEL(log, ::Rested::Log::ERROR)
#define RESTED_LOG_WARNING(log) RESTED_LOG_LEVEL(log, ::Rested::Log::WARNING)
#define RESTED_LOG_INFO(log) RESTED_LOG_LEVEL(log, ::Rested::Log::INFO)
#define RESTED_LOG_VERBOSE(log) RESTED_LOG_LEVEL(log, ::Rested::Log::VERBOSE)
#define RESTED_LOG_DEBUG(log) RESTED_LOG_LEVEL(log, ::Rested::Log::DEBUG)
#define RESTED_LOG_TRACE(log) RESTED_LOG_LEVEL(log, ::Rested::Log::TRACE)
/// @}

std::ostream &operator <<(std::ostream &os, Log::Level level);

}

#endif
