// Copyright (c) 2009 - Mozy, Inc.

#include <vector>

#include "rested/config.h"
#include "rested/log.h"
#include "rested/test/test.h"

using namespace Rested;

namespace {
class RecordingSink : public LogSink
{
public:
    typedef boost::shared_ptr<RecordingSink> ptr;

public:
    void log(const LogRecord &record) { m_records.push_back(record); }

    std::vector<LogRecord> m_records;
};

/// Attaches a RecordingSink to a Logger for the duration of a test
struct Attach
{
    Attach(Logger::ptr logger)
        : m_logger(logger),
          m_sink(new RecordingSink())
    {
        m_logger->addSink(m_sink);
    }
    ~Attach()
    {
        m_logger->removeSink(m_sink);
    }

    Logger::ptr m_logger;
    RecordingSink::ptr m_sink;
};
}

RESTED_UNITTEST(Log, hierarchy)
{
    Logger::ptr range = Log::lookup("rested:http:range");
    RESTED_TEST_ASSERT_EQUAL(range->name(), "rested:http:range");
    RESTED_TEST_ASSERT(Log::lookup("rested::http:range:") == range);
    RESTED_TEST_ASSERT(Log::lookup("") == Log::root());
}

RESTED_UNITTEST(Log, masks)
{
    Logger::ptr range = Log::lookup("rested:http:range");
    Logger::ptr writer = Log::lookup("rested:http:writer");
    {
        HijackConfigVar debug("log.debugmask", "rested:http:range");
        RESTED_TEST_ASSERT(range->enabled(Log::DEBUG));
        RESTED_TEST_ASSERT(!range->enabled(Log::TRACE));
        RESTED_TEST_ASSERT(!writer->enabled(Log::DEBUG));
        RESTED_TEST_ASSERT(writer->enabled(Log::INFO));
        // Loggers created later pick up the current masks
        HijackConfigVar verbose("log.verbosemask", "rested:http:.*");
        RESTED_TEST_ASSERT(Log::lookup("rested:http:later")->enabled(
            Log::VERBOSE));
    }
    RESTED_TEST_ASSERT_EQUAL(range->level(), Log::INFO);
    RESTED_TEST_ASSERT_EQUAL(writer->level(), Log::INFO);
}

RESTED_UNITTEST(Log, onlyFatal)
{
    Logger::ptr dispatcher = Log::lookup("rested:http:dispatcher");
    HijackConfigVar error("log.errormask", "");
    HijackConfigVar warn("log.warnmask", "");
    HijackConfigVar info("log.infomask", "");
    RESTED_TEST_ASSERT_EQUAL(dispatcher->level(), Log::FATAL);
    Attach attach(dispatcher);
    RESTED_LOG_ERROR(dispatcher) << "dropped";
    RESTED_LOG_FATAL(dispatcher) << "kept";
    RESTED_TEST_ASSERT_EQUAL(attach.m_sink->m_records.size(), 1u);
    RESTED_TEST_ASSERT_EQUAL(attach.m_sink->m_records[0].message, "kept");
}

RESTED_UNITTEST(Log, invalidMask)
{
    RESTED_TEST_ASSERT_EXCEPTION(HijackConfigVar("log.debugmask", "rested:("),
        std::invalid_argument);
    RESTED_TEST_ASSERT_EQUAL(Config::lookup("log.debugmask")->toString(), "");
}

static int g_evaluated;

static int
expensive()
{
    return ++g_evaluated;
}

RESTED_UNITTEST(Log, disabledNotEvaluated)
{
    Logger::ptr range = Log::lookup("rested:http:range");
    g_evaluated = 0;
    RESTED_LOG_TRACE(range) << expensive();
    RESTED_TEST_ASSERT_EQUAL(g_evaluated, 0);
    RESTED_LOG_INFO(range) << expensive();
    RESTED_TEST_ASSERT_EQUAL(g_evaluated, 1);
}

RESTED_UNITTEST(Log, sinksInherited)
{
    Logger::ptr http = Log::lookup("rested:http");
    Logger::ptr writer = Log::lookup("rested:http:writer");
    Attach parent(http);
    Attach child(writer);

    RESTED_LOG_WARNING(writer) << "no representation";
    RESTED_TEST_ASSERT_EQUAL(child.m_sink->m_records.size(), 1u);
    RESTED_TEST_ASSERT_EQUAL(parent.m_sink->m_records.size(), 1u);
    const LogRecord &record = parent.m_sink->m_records[0];
    RESTED_TEST_ASSERT_EQUAL(record.logger, "rested:http:writer");
    RESTED_TEST_ASSERT_EQUAL(record.level, Log::WARNING);
    RESTED_TEST_ASSERT_EQUAL(record.message, "no representation");
    RESTED_TEST_ASSERT(record.file != NULL);
    RESTED_TEST_ASSERT_GREATER_THAN(record.line, 0);

    std::string line = LogSink::format(record);
    RESTED_TEST_ASSERT_NOT_EQUAL(line.find(" WARN "), std::string::npos);
    RESTED_TEST_ASSERT_NOT_EQUAL(line.find(" rested:http:writer "),
        std::string::npos);
    RESTED_TEST_ASSERT_EQUAL(line.substr(line.size() - 18),
        "no representation\n");

    writer->inheritSinks(false);
    RESTED_LOG_WARNING(writer) << "again";
    writer->inheritSinks(true);
    RESTED_TEST_ASSERT_EQUAL(child.m_sink->m_records.size(), 2u);
    RESTED_TEST_ASSERT_EQUAL(parent.m_sink->m_records.size(), 1u);
}
