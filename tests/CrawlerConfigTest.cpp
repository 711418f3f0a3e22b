#include "CrawlerConfig.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <iterator>

using sthe::codec::Format;
using sthe::codec::FormatError;
using sthe::crawler::CommandLine;
using sthe::crawler::CrawlerConfig;
using sthe::crawler::UsageError;
using sthe::crawler::applyCommandLine;
using sthe::crawler::applyEnvironment;
using sthe::crawler::loadConfigText;
using sthe::crawler::parseCommandLine;
using sthe::util::LogLevel;

namespace {

constexpr const char* kEnvironment[] = {"STHE_HTTP_TIMEOUT", "STHE_USER_AGENT", "STHE_JOBS", "STHE_LOG_LEVEL"};

class CrawlerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnvironment(); }
    void TearDown() override { clearEnvironment(); }

    static void clearEnvironment() {
        for (const char* name : kEnvironment) {
            unsetenv(name);
        }
    }
};

constexpr const char* kToml = R"(
url = ["https://example.com/a", "https://example.com/b"]
user_agent = "from-file"
timeout = 12

[title]
selector = "h1"

[links]
selector = "a"
target = "attr:href"
many = true
)";

} // namespace

TEST_F(CrawlerConfigTest, ReadsUrlsSettingsAndItems) {
    CrawlerConfig config;
    loadConfigText(kToml, Format::toml, config);

    ASSERT_EQ(config.urls.size(), 2u);
    EXPECT_EQ(config.urls[1], "https://example.com/b");
    EXPECT_EQ(config.userAgent, "from-file");
    EXPECT_EQ(config.timeout.count(), 12);
    ASSERT_EQ(config.items.size(), 2u);
    EXPECT_EQ(config.items[0].first, "title");
    EXPECT_EQ(config.items[1].first, "links");
    EXPECT_TRUE(config.items[1].second.many);
}

TEST_F(CrawlerConfigTest, EnvironmentOverridesFileAndCommandLineOverridesBoth) {
    CrawlerConfig config;
    loadConfigText(kToml, Format::toml, config);

    setenv("STHE_HTTP_TIMEOUT", "40", 1);
    setenv("STHE_USER_AGENT", "from-env", 1);
    setenv("STHE_JOBS", "3", 1);
    setenv("STHE_LOG_LEVEL", "debug", 1);
    applyEnvironment(config);
    EXPECT_EQ(config.timeout.count(), 40);
    EXPECT_EQ(config.userAgent, "from-env");
    EXPECT_EQ(config.jobs, 3u);
    EXPECT_EQ(config.logLevel, LogLevel::debug);

    const char* argv[] = {"sthe-crawler", "--config", "crawl.toml", "--timeout", "5", "--jobs", "7",
                          "--format",     "toml",     "--log-level", "warn"};
    CommandLine cli = parseCommandLine(static_cast<int>(std::size(argv)), argv);
    EXPECT_EQ(cli.configPath.string(), "crawl.toml");
    applyCommandLine(cli, config);
    EXPECT_EQ(config.timeout.count(), 5);
    EXPECT_EQ(config.jobs, 7u);
    EXPECT_EQ(config.format, Format::toml);
    EXPECT_EQ(config.logLevel, LogLevel::warn);
    EXPECT_EQ(config.userAgent, "from-env");
}

TEST_F(CrawlerConfigTest, IgnoresUnusableEnvironmentValues) {
    CrawlerConfig config;
    auto timeout = config.timeout;
    auto level = config.logLevel;
    setenv("STHE_HTTP_TIMEOUT", "soon", 1);
    setenv("STHE_LOG_LEVEL", "loud", 1);
    applyEnvironment(config);
    EXPECT_EQ(config.timeout, timeout);
    EXPECT_EQ(config.logLevel, level);
}

TEST_F(CrawlerConfigTest, RequiresUrl) {
    CrawlerConfig config;
    try {
        loadConfigText(R"({"title": {"selector": "h1"}})", Format::json, config);
        FAIL() << "expected FormatError";
    } catch (const FormatError& ex) {
        EXPECT_EQ(ex.path(), "url");
    }
}

TEST_F(CrawlerConfigTest, RejectsNonTableItems) {
    CrawlerConfig config;
    EXPECT_THROW(loadConfigText(R"({"url": "https://example.com", "title": 3})", Format::json, config),
                 FormatError);
}

TEST_F(CrawlerConfigTest, RejectsBadCommandLines) {
    const char* missingConfig[] = {"sthe-crawler", "--jobs", "2"};
    EXPECT_THROW(parseCommandLine(3, missingConfig), UsageError);

    const char* missingValue[] = {"sthe-crawler", "--config"};
    EXPECT_THROW(parseCommandLine(2, missingValue), UsageError);

    const char* zeroJobs[] = {"sthe-crawler", "--config", "c.json", "--jobs", "0"};
    EXPECT_THROW(parseCommandLine(5, zeroJobs), UsageError);

    const char* unknown[] = {"sthe-crawler", "--config", "c.json", "--verbose"};
    EXPECT_THROW(parseCommandLine(4, unknown), UsageError);

    const char* badFormat[] = {"sthe-crawler", "--config", "c.json", "--format", "xml"};
    EXPECT_THROW(parseCommandLine(5, badFormat), UsageError);
}
