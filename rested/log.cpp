// Copyright (c) 2009 - Mozy, Inc.

#include "log.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>

#include <algorithm>
#include <iostream>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/regex.hpp>

#include "assert.h"
#include "config.h"

namespace Rested {

namespace {
struct LevelMask
{
    Log::Level level;
    ConfigVar<std::string>::ptr var;
    boost::regex regex;
};
}

static void masksChanged(const std::string &);

static bool
validMask(const std::string &mask)
{
    try {
        boost::regex regex(mask);
        return true;
    } catch (boost::regex_error &) {
        return false;
    }
}

static LevelMask
mask(Log::Level level, const char *name, const char *defaultValue)
{
    LevelMask result;
    result.level = level;
    result.var = Config::lookup<std::string>(name, defaultValue,
        "Regex of loggers to enable this level (or more verbose) for");
    result.var->beforeChange.connect(&validMask);
    result.var->onChange.connect(&masksChanged);
    result.regex = boost::regex(result.var->val());
    return result;
}

// Most verbose first; created on first use so that loggers looked up during
// static initialization of other files see them
static std::vector<LevelMask> &
masks()
{
    static std::vector<LevelMask> result;
    if (result.empty()) {
        result.push_back(mask(Log::TRACE, "log.tracemask", ""));
        result.push_back(mask(Log::DEBUG, "log.debugmask", ""));
        result.push_back(mask(Log::VERBOSE, "log.verbosemask", ""));
        result.push_back(mask(Log::INFO, "log.infomask", ".*"));
        result.push_back(mask(Log::WARNING, "log.warnmask", ".*"));
        result.push_back(mask(Log::ERROR, "log.errormask", ".*"));
    }
    return result;
}

static Log::Level
maskedLevel(const std::string &name)
{
    std::vector<LevelMask> &all = masks();
    for (std::vector<LevelMask>::const_iterator it(all.begin());
        it != all.end();
        ++it) {
        if (boost::regex_match(name, it->regex))
            return it->level;
    }
    return Log::FATAL;
}

static void
masksChanged(const std::string &)
{
    std::vector<LevelMask> &all = masks();
    for (std::vector<LevelMask>::iterator it(all.begin());
        it != all.end();
        ++it)
        it->regex = boost::regex(it->var->val());
    Log::root()->applyMasks();
}

static ConfigVar<bool>::ptr g_logStdout =
    Config::lookup("log.stdout", false, "Log to stdout");
static ConfigVar<std::string>::ptr g_logFile =
    Config::lookup("log.file", std::string(), "Append log messages to file");

static void
stdoutChanged(bool enable)
{
    static LogSink::ptr sink;
    if (enable && !sink) {
        sink.reset(new StdoutLogSink());
        Log::root()->addSink(sink);
    } else if (!enable && sink) {
        Log::root()->removeSink(sink);
        sink.reset();
    }
}

static void
fileChanged(const std::string &file)
{
    static LogSink::ptr sink;
    if (sink) {
        Log::root()->removeSink(sink);
        sink.reset();
    }
    if (!file.empty()) {
        sink.reset(new FileLogSink(file));
        Log::root()->addSink(sink);
    }
}

namespace {
static struct LogInitializer
{
    LogInitializer()
    {
        masks();
        g_logStdout->onChange.connect(&stdoutChanged);
        g_logFile->onChange.connect(&fileChanged);
    }
} g_init;
}

std::string
LogSink::format(const LogRecord &record)
{
    std::ostringstream os;
    os << record.time << ' ' << record.level << ' ' << record.thread << ' '
        << record.logger << ' ' << (record.file ? record.file : "") << ':'
        << record.line << ' ' << record.message << '\n';
    return os.str();
}

void
StdoutLogSink::log(const LogRecord &record)
{
    std::cout << format(record) << std::flush;
}

FileLogSink::FileLogSink(const std::string &file)
    : m_file(file)
{
    m_fd = open(file.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd < 0)
        RESTED_THROW_EXCEPTION(NativeException())
            << boost::errinfo_errno(errno)
            << boost::errinfo_file_name(file)
            << boost::errinfo_api_function("open");
}

FileLogSink::~FileLogSink()
{
    close(m_fd);
}

void
FileLogSink::log(const LogRecord &record)
{
    std::string line = format(record);
    // Nowhere to report a failed log write
    ssize_t rc = write(m_fd, line.c_str(), line.size());
    (void)rc;
}

Logger::ptr
Log::root()
{
    static Logger::ptr result(new Logger(":", Logger::ptr()));
    return result;
}

Logger::ptr
Log::lookup(const std::string &name)
{
    Logger::ptr logger = root();
    std::string path;
    size_t start = 0;
    while (start < name.size()) {
        size_t colon = name.find(':', start);
        if (colon == std::string::npos)
            colon = name.size();
        std::string component = name.substr(start, colon - start);
        start = colon + 1;
        if (component.empty())
            continue;
        if (!path.empty())
            path.append(1, ':');
        path.append(component);
        Logger::ptr &child = logger->m_children[path];
        if (!child) {
            child.reset(new Logger(path, logger));
            child->m_level = maskedLevel(path);
        }
        logger = child;
    }
    return logger;
}

Logger::Logger(const std::string &name, Logger::ptr parent)
    : m_name(name),
      m_parent(parent),
      m_level(Log::INFO),
      m_inheritSinks(parent.get() != NULL)
{}

void
Logger::level(Log::Level level)
{
    m_level = level;
    for (std::map<std::string, Logger::ptr>::iterator it(m_children.begin());
        it != m_children.end();
        ++it)
        it->second->level(level);
}

void
Logger::applyMasks()
{
    m_level = maskedLevel(m_name);
    for (std::map<std::string, Logger::ptr>::iterator it(m_children.begin());
        it != m_children.end();
        ++it)
        it->second->applyMasks();
}

void
Logger::removeSink(LogSink::ptr sink)
{
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink),
        m_sinks.end());
}

void
Logger::log(Log::Level level, const std::string &message, const char *file,
    int line)
{
    if (message.empty() || !enabled(level))
        return;
    int error = errno;
    LogRecord record;
    record.logger = m_name;
    record.time = boost::posix_time::microsec_clock::universal_time();
    record.thread = (pid_t)syscall(SYS_gettid);
    record.level = level;
    record.message = message;
    record.file = file;
    record.line = line;
    for (Logger::ptr logger = shared_from_this(); logger;
        logger = logger->m_parent.lock()) {
        for (std::vector<LogSink::ptr>::const_iterator it(
            logger->m_sinks.begin());
            it != logger->m_sinks.end();
            ++it)
            (*it)->log(record);
        if (!logger->m_inheritSinks)
            break;
    }
    errno = error;
}

LogEvent::~LogEvent()
{
    m_logger->log(m_level, m_os.str(), m_file, m_line);
}

std::ostream &
operator <<(std::ostream &os, Log::Level level)
{
    static const char *names[] = { "NONE", "FATAL", "ERROR", "WARN", "INFO",
        "VERBOSE", "DEBUG", "TRACE" };
    RESTED_ASSERT(level >= Log::NONE && level <= Log::TRACE);
    return os << names[level];
}

}
