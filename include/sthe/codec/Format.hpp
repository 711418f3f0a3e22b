#pragma once

#include <boost/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sthe::codec {

enum class Format {
    json,
    toml
};

// Text that cannot be read as a specification or result: broken JSON/TOML,
// unknown fields, fields of the wrong type.
class FormatError : public std::runtime_error {
public:
    FormatError(std::string path, const std::string& message);

    // Dotted location of the offending field; empty for the document itself.
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

std::optional<Format> formatFromName(std::string_view name);
const char* formatName(Format format);

// Reads a JSON or TOML document whose top level must be an object/table.
boost::json::object parseDocument(std::string_view text, Format format);

} // namespace sthe::codec
