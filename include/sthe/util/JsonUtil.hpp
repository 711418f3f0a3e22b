#pragma once

#include <boost/json.hpp>
#include <string>
#include <string_view>

namespace sthe::util {

inline std::string_view asStringView(boost::json::string_view value) noexcept {
    return {value.data(), value.size()};
}

inline boost::json::string_view toJsonView(std::string_view value) noexcept {
    return {value.data(), value.size()};
}

boost::json::value parseJson(std::string_view payload);
std::string stringifyJson(const boost::json::value& value);

// Two-space indented rendering, object members kept in insertion order.
std::string prettyJson(const boost::json::value& value);

} // namespace sthe::util
