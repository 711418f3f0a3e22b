#include "CrawlerConfig.hpp"

#include "sthe/codec/Format.hpp"
#include "sthe/codec/ValueCodec.hpp"
#include "sthe/extract/Compiler.hpp"
#include "sthe/extract/Extractor.hpp"
#include "sthe/html/Document.hpp"
#include "sthe/util/HttpClient.hpp"
#include "sthe/util/JsonUtil.hpp"
#include "sthe/util/Logging.hpp"
#include "sthe/util/Toml.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
using namespace sthe;

constexpr int kExitFetchFailed = 1;
constexpr int kExitBadConfig = 2;
constexpr unsigned int kMaxRedirects = 5;

struct PageResult {
    std::string url;
    std::optional<model::Value> items;
    std::string error;
};

void printUsage() {
    std::cerr << "usage: sthe-crawler --config <file> [--format json|toml] [--jobs N]\n"
                 "                    [--log-level trace|debug|info|warn|error] [--timeout SECONDS]\n";
}

using CompiledItems = std::vector<std::pair<std::string, extract::CompiledOption>>;

PageResult crawlPage(const std::string& url, const CompiledItems& items, const crawler::CrawlerConfig& config,
                     boost::asio::io_context& io) {
    PageResult result;
    result.url = url;
    try {
        util::HttpClient client{io};
        std::string effectiveUrl;
        auto response = client.get(url, {{"User-Agent", config.userAgent}, {"Accept", "text/html"}}, config.timeout,
                                   true, kMaxRedirects, &effectiveUrl);
        if (response.result_int() < 200 || response.result_int() >= 300) {
            result.error = "HTTP status " + std::to_string(response.result_int());
            util::log(util::LogLevel::error, url + ": " + result.error);
            return result;
        }
        util::log(util::LogLevel::info,
                  "Fetched " + effectiveUrl + " (" + std::to_string(response.body().size()) + " bytes)");

        auto document = html::Document::parse(response.body());
        model::Value::Map entries;
        entries.reserve(items.size());
        for (const auto& [name, option] : items) {
            entries.emplace_back(name, extract::evaluate(document.root(), option));
        }
        result.items = model::Value::map(std::move(entries));
    } catch (const std::exception& ex) {
        result.error = ex.what();
        util::log(util::LogLevel::error, url + ": " + result.error);
    }
    return result;
}

boost::json::object pageToJson(const PageResult& page, bool withUrl) {
    boost::json::object object;
    if (withUrl || !page.items) {
        object["url"] = util::toJsonView(page.url);
    }
    if (!page.items) {
        object["error"] = util::toJsonView(page.error);
        return object;
    }
    auto values = codec::toJson(*page.items);
    for (auto& member : values.get_object()) {
        object[member.key()] = std::move(member.value());
    }
    return object;
}

std::string render(const std::vector<PageResult>& pages, codec::Format format) {
    if (pages.size() == 1) {
        auto object = pageToJson(pages.front(), false);
        return format == codec::Format::json ? util::prettyJson(object) + "\n" : util::writeToml(object);
    }

    boost::json::array array;
    for (const auto& page : pages) {
        array.push_back(pageToJson(page, true));
    }
    if (format == codec::Format::json) {
        return util::prettyJson(array) + "\n";
    }
    boost::json::object wrapper;
    wrapper["pages"] = std::move(array);
    return util::writeToml(wrapper);
}

} // namespace

int main(int argc, char** argv) {
    util::initLogging(util::LogLevel::info);

    crawler::CrawlerConfig config;
    CompiledItems items;
    try {
        config = crawler::loadCrawlerConfig(crawler::parseCommandLine(argc, argv));
        util::initLogging(config.logLevel);

        items.reserve(config.items.size());
        for (const auto& [name, spec] : config.items) {
            auto compiled = extract::compile(spec);
            util::log(util::LogLevel::debug, "Item " + name + ": " + compiled.describe());
            items.emplace_back(name, std::move(compiled));
        }
    } catch (const crawler::UsageError& ex) {
        util::log(util::LogLevel::error, ex.what());
        printUsage();
        return kExitBadConfig;
    } catch (const extract::CompileError& ex) {
        util::log(util::LogLevel::error, std::string{"Invalid extraction spec: "} + ex.what());
        return kExitBadConfig;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Invalid configuration: "} + ex.what());
        return kExitBadConfig;
    }

    util::log(util::LogLevel::info, "Crawling " + std::to_string(config.urls.size()) + " page(s) with " +
                                        std::to_string(config.jobs) + " worker(s)");

    boost::asio::io_context io;
    boost::asio::thread_pool workerPool(config.jobs);
    std::vector<PageResult> pages(config.urls.size());
    for (std::size_t i = 0; i < config.urls.size(); ++i) {
        boost::asio::post(workerPool, [&, i]() {
            pages[i] = crawlPage(config.urls[i], items, config, io);
        });
    }
    workerPool.join();

    std::cout << render(pages, config.format);

    bool failed = std::any_of(pages.begin(), pages.end(), [](const PageResult& page) { return !page.items; });
    return failed ? kExitFetchFailed : 0;
}
