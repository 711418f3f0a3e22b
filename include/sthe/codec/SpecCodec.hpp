#pragma once

#include "sthe/codec/Format.hpp"
#include "sthe/model/OptionSpec.hpp"

#include <boost/json.hpp>

#include <string>
#include <string_view>

namespace sthe::codec {

// Field names understood in a specification object. Every other key holding
// an object is a named child specification.
inline constexpr std::string_view kSelectorField = "selector";
inline constexpr std::string_view kTargetField = "target";
inline constexpr std::string_view kManyField = "many";
inline constexpr std::string_view kRegexField = "regex";
inline constexpr std::string_view kTrimField = "trim";

model::OptionSpec decodeSpec(const boost::json::value& value);
model::OptionSpec decodeSpec(const boost::json::object& object, const std::string& path);
model::OptionSpec parseSpec(std::string_view text, Format format);

boost::json::object encodeSpec(const model::OptionSpec& spec);

} // namespace sthe::codec
