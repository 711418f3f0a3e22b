#include "CrawlerConfig.hpp"

#include "sthe/codec/SpecCodec.hpp"
#include "sthe/util/JsonUtil.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace sthe::crawler {
namespace {

unsigned long parsePositive(std::string_view flag, const std::string& value) {
    char* end = nullptr;
    unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || parsed == 0) {
        throw UsageError(std::string{flag} + " expects a positive integer, got `" + value + "`");
    }
    return parsed;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string expectString(const boost::json::value& value, const std::string& key) {
    if (!value.is_string()) {
        throw codec::FormatError(key, "expected a string");
    }
    return std::string(util::asStringView(value.get_string()));
}

} // namespace

CommandLine parseCommandLine(int argc, const char* const* argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string_view flag{argv[i]};
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(std::string{flag} + " requires a value");
            }
            return argv[++i];
        };

        if (flag == "--config") {
            cli.configPath = next();
        } else if (flag == "--format") {
            auto name = next();
            cli.format = codec::formatFromName(name);
            if (!cli.format) {
                throw UsageError("unknown output format `" + name + "`");
            }
        } else if (flag == "--jobs") {
            cli.jobs = static_cast<unsigned int>(parsePositive(flag, next()));
        } else if (flag == "--log-level") {
            auto name = next();
            cli.logLevel = util::parseLogLevel(name);
            if (!cli.logLevel) {
                throw UsageError("unknown log level `" + name + "`");
            }
        } else if (flag == "--timeout") {
            cli.timeout = std::chrono::seconds{parsePositive(flag, next())};
        } else {
            throw UsageError("unknown argument `" + std::string{flag} + "`");
        }
    }
    if (cli.configPath.empty()) {
        throw UsageError("--config is required");
    }
    return cli;
}

void loadConfigText(std::string_view text, codec::Format format, CrawlerConfig& config) {
    auto document = codec::parseDocument(text, format);

    for (const auto& member : document) {
        std::string key{util::asStringView(member.key())};
        const auto& value = member.value();

        if (key == "url") {
            if (value.is_array()) {
                const auto& array = value.get_array();
                for (std::size_t i = 0; i < array.size(); ++i) {
                    config.urls.push_back(expectString(array[i], key + "[" + std::to_string(i) + "]"));
                }
            } else {
                config.urls.push_back(expectString(value, key));
            }
        } else if (key == "user_agent") {
            config.userAgent = expectString(value, key);
        } else if (key == "timeout") {
            if (!value.is_int64() || value.get_int64() <= 0) {
                throw codec::FormatError(key, "expected a positive integer");
            }
            config.timeout = std::chrono::seconds{value.get_int64()};
        } else if (value.is_object()) {
            config.items.emplace_back(key, codec::decodeSpec(value.get_object(), key));
        } else {
            throw codec::FormatError(key, "expected an extraction table");
        }
    }

    if (config.urls.empty()) {
        throw codec::FormatError("url", "missing required field");
    }
}

void loadConfigFile(const std::filesystem::path& path, CrawlerConfig& config) {
    auto format = path.extension() == ".toml" ? codec::Format::toml : codec::Format::json;
    loadConfigText(readFile(path), format, config);
}

void applyEnvironment(CrawlerConfig& config) {
    if (const char* value = std::getenv("STHE_LOG_LEVEL")) {
        if (auto level = util::parseLogLevel(value)) {
            config.logLevel = *level;
        } else {
            util::log(util::LogLevel::warn, std::string{"Ignoring STHE_LOG_LEVEL="} + value);
        }
    }
    if (const char* value = std::getenv("STHE_HTTP_TIMEOUT")) {
        auto seconds = std::strtoul(value, nullptr, 10);
        if (seconds > 0) {
            config.timeout = std::chrono::seconds{seconds};
        }
    }
    if (const char* value = std::getenv("STHE_USER_AGENT")) {
        config.userAgent = value;
    }
    if (const char* value = std::getenv("STHE_JOBS")) {
        config.jobs = std::max(1u, static_cast<unsigned int>(std::strtoul(value, nullptr, 10)));
    }
}

void applyCommandLine(const CommandLine& cli, CrawlerConfig& config) {
    if (cli.format) config.format = *cli.format;
    if (cli.jobs) config.jobs = *cli.jobs;
    if (cli.logLevel) config.logLevel = *cli.logLevel;
    if (cli.timeout) config.timeout = *cli.timeout;
}

CrawlerConfig loadCrawlerConfig(const CommandLine& cli) {
    CrawlerConfig config;
    loadConfigFile(cli.configPath, config);
    applyEnvironment(config);
    applyCommandLine(cli, config);
    return config;
}

} // namespace sthe::crawler
