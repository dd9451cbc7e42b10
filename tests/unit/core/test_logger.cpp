#include <gtest/gtest.h>
#include "tessera/core/logger.hpp"
#include <chrono>

using namespace tessera;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        m_sink = sink.get();
        logging::add_sink(std::move(sink));
        m_previous = logging::level();
        logging::set_level(LogLevel::Info);
    }

    void TearDown() override {
        logging::remove_sink(m_sink);
        logging::set_level(m_previous);
    }

    MemorySink* m_sink{nullptr};
    LogLevel m_previous{LogLevel::Info};
};

TEST_F(LoggerTest, RecordsNamedLogger) {
    logging::get("atlas").warn("tile missing");

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
    EXPECT_EQ(entries[0].logger_name, "atlas");
    EXPECT_EQ(entries[0].message, "tile missing");
}

TEST_F(LoggerTest, FormatsArguments) {
    logging::get("packer").info_fmt("{} @ {}px", "arrows", 32);

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "arrows @ 32px");
}

TEST_F(LoggerTest, GlobalLevelFilters) {
    logging::get("svg").debug("hidden");
    EXPECT_EQ(m_sink->count(LogLevel::Debug), 0u);

    logging::set_level(LogLevel::Debug);
    logging::get("svg").debug("shown");
    EXPECT_EQ(m_sink->count(LogLevel::Debug), 1u);
}

TEST_F(LoggerTest, SameNameSameLogger) {
    EXPECT_EQ(&logging::get("catalog"), &logging::get("catalog"));
    EXPECT_NE(&logging::get("catalog"), &logging::get("svg"));
}

TEST_F(LoggerTest, ClearDropsEntries) {
    TESSERA_LOG_ERROR("boom");
    EXPECT_EQ(m_sink->count(LogLevel::Error), 1u);
    m_sink->clear();
    EXPECT_TRUE(m_sink->entries().empty());
}

TEST(LogLevelTest, Ordering) {
    EXPECT_LT(LogLevel::Debug, LogLevel::Info);
    EXPECT_LT(LogLevel::Warn, LogLevel::Error);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    logging::set_level(LogLevel::Off);
    EXPECT_FALSE(logging::get("packer").is_enabled(LogLevel::Error));
    logging::get("packer").error_fmt("{} failed", "arrows");
    EXPECT_TRUE(m_sink->entries().empty());
}

TEST(LogLineTest, IncludesLevelNameAndMessage) {
    LogRecord record{LogLevel::Warn, "atlas", "b.svg: bad path", std::chrono::system_clock::now()};
    std::string line = format_log_line(record);

    EXPECT_NE(line.find("warn "), std::string::npos);
    EXPECT_NE(line.find("[atlas] b.svg: bad path"), std::string::npos);
}

TEST(LogLineTest, OmitsEmptyName) {
    LogRecord record{LogLevel::Info, "", "done", std::chrono::system_clock::now()};
    std::string line = format_log_line(record);

    EXPECT_EQ(line.find('['), std::string::npos);
    EXPECT_EQ(line.substr(line.size() - 4), "done");
}

TEST(FileSinkTest, UnopenableFileIsReported) {
    FileSink sink("/nonexistent-directory/tessera.log");
    EXPECT_FALSE(sink.is_open());
}
