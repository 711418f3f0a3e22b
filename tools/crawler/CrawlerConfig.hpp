#pragma once

#include "sthe/codec/Format.hpp"
#include "sthe/model/OptionSpec.hpp"
#include "sthe/util/Logging.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace sthe::crawler {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    std::filesystem::path configPath;
    std::optional<codec::Format> format;
    std::optional<unsigned int> jobs;
    std::optional<util::LogLevel> logLevel;
    std::optional<std::chrono::seconds> timeout;
};

struct CrawlerConfig {
    std::vector<std::string> urls;
    std::string userAgent{"sthe-crawler/1.0"};
    std::chrono::seconds timeout{30};
    unsigned int jobs{std::max(2u, std::thread::hardware_concurrency())};
    codec::Format format{codec::Format::json};
    util::LogLevel logLevel{util::LogLevel::info};
    std::vector<std::pair<std::string, model::OptionSpec>> items;
};

// Throws UsageError for unknown flags, missing values and a missing --config.
CommandLine parseCommandLine(int argc, const char* const* argv);

// Reads `url`, `user_agent`, `timeout` and the named extraction tables.
// Throws codec::FormatError on anything else.
void loadConfigText(std::string_view text, codec::Format format, CrawlerConfig& config);

// TOML when the extension is `.toml`, JSON otherwise.
void loadConfigFile(const std::filesystem::path& path, CrawlerConfig& config);

void applyEnvironment(CrawlerConfig& config);
void applyCommandLine(const CommandLine& cli, CrawlerConfig& config);

// Defaults, then the file, then the environment, then the command line.
CrawlerConfig loadCrawlerConfig(const CommandLine& cli);

} // namespace sthe::crawler
