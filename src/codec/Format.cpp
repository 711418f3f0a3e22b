#include "sthe/codec/Format.hpp"
#include "sthe/util/JsonUtil.hpp"
#include "sthe/util/Toml.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace sthe::codec {

FormatError::FormatError(std::string path, const std::string& message)
    : std::runtime_error(path.empty() ? message : path + ": " + message)
    , path_(std::move(path)) {}

std::optional<Format> formatFromName(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "json") return Format::json;
    if (lowered == "toml") return Format::toml;
    return std::nullopt;
}

const char* formatName(Format format) {
    switch (format) {
    case Format::json: return "json";
    case Format::toml: return "toml";
    }
    return "json";
}

boost::json::object parseDocument(std::string_view text, Format format) {
    if (format == Format::toml) {
        try {
            return util::parseToml(text);
        } catch (const util::TomlError& ex) {
            throw FormatError({}, ex.what());
        }
    }

    boost::json::value parsed;
    try {
        parsed = util::parseJson(text);
    } catch (const std::exception& ex) {
        throw FormatError({}, std::string{"invalid JSON: "} + ex.what());
    }
    if (!parsed.is_object()) {
        throw FormatError({}, "top-level JSON value must be an object");
    }
    return std::move(parsed.get_object());
}

} // namespace sthe::codec
