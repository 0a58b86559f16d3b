#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Logging/Logger.h"

using namespace TransitEngine::Core::Logging;

namespace {

class CaptureSink : public ILogSink {
public:
    void write(const LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (!shouldLog(entry.level)) return;
        entries.push_back(entry);
    }
    void flush() override { ++flushes; }

    std::mutex mutex;
    std::vector<LogEntry> entries;
    int flushes = 0;
};

} // namespace

TEST(Logger, DeliversToEverySink) {
    Logger logger("Test");
    auto a = std::make_shared<CaptureSink>();
    auto b = std::make_shared<CaptureSink>();
    logger.addSink(a);
    logger.addSink(b);
    EXPECT_EQ(logger.sinkCount(), 2u);

    logger.log(LogLevel::Warning, "Transfer", "disk nearly full");
    ASSERT_EQ(a->entries.size(), 1u);
    ASSERT_EQ(b->entries.size(), 1u);
    EXPECT_EQ(a->entries[0].level, LogLevel::Warning);
    EXPECT_EQ(a->entries[0].category, "Transfer");
    EXPECT_EQ(a->entries[0].message, "disk nearly full");

    logger.removeSink(b);
    logger.info("second");
    EXPECT_EQ(a->entries.size(), 2u);
    EXPECT_EQ(a->entries[1].category, "Test");
    EXPECT_EQ(b->entries.size(), 1u);

    logger.flush();
    EXPECT_EQ(a->flushes, 1);
    logger.clearSinks();
    EXPECT_EQ(logger.sinkCount(), 0u);
}

TEST(Logger, MinimumLevelFilters) {
    Logger logger("Test");
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);

    EXPECT_EQ(logger.minLevel(), LogLevel::Info);
    logger.debug("hidden");
    logger.info("shown");
    EXPECT_EQ(sink->entries.size(), 1u);

    logger.setMinLevel(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Fatal));
    logger.warning("hidden");
    logger.error("shown");
    EXPECT_EQ(sink->entries.size(), 2u);

    logger.setMinLevel(LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Fatal));
    logger.fatal("hidden");
    EXPECT_EQ(sink->entries.size(), 2u);
}

TEST(Logger, SinkLevelFiltersIndependently) {
    Logger logger("Test");
    logger.setMinLevel(LogLevel::Trace);
    auto verbose = std::make_shared<CaptureSink>();
    auto terse = std::make_shared<CaptureSink>();
    terse->setMinLevel(LogLevel::Error);
    logger.addSink(verbose);
    logger.addSink(terse);

    logger.trace("t");
    logger.error("e");
    EXPECT_EQ(verbose->entries.size(), 2u);
    ASSERT_EQ(terse->entries.size(), 1u);
    EXPECT_EQ(terse->entries[0].message, "e");
}

TEST(Logger, GlobalMacrosReachAttachedSinks) {
    auto& global = Logger::global();
    auto sink = std::make_shared<CaptureSink>();
    const LogLevel previous = global.minLevel();
    global.setMinLevel(LogLevel::Debug);
    global.addSink(sink);

    TRANSIT_LOG_DEBUG_CAT("Engine", "debug line");
    TRANSIT_LOG_TRACE_CAT("Engine", "trace line");
    TRANSIT_LOG_INFO("info line");

    global.removeSink(sink);
    global.setMinLevel(previous);

    ASSERT_EQ(sink->entries.size(), 2u);
    EXPECT_EQ(sink->entries[0].category, "Engine");
    EXPECT_EQ(sink->entries[0].message, "debug line");
    EXPECT_EQ(sink->entries[1].message, "info line");
}

TEST(LogLevel, ParseAcceptsPrintedNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
    EXPECT_EQ(toString(LogLevel::Warning), "WARN");
}
