#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sthe::util {

class TomlError : public std::runtime_error {
public:
    TomlError(std::size_t line, const std::string& message);

    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

// Reads a TOML document into a JSON object. Tables become objects, arrays of
// tables become arrays of objects. Date-time values are rejected.
boost::json::object parseToml(std::string_view text);

// Writes a JSON object as a TOML document. Null values have no TOML
// representation and are skipped, both as keys and as array elements.
std::string writeToml(const boost::json::object& table);

} // namespace sthe::util
