#pragma once

#include "sthe/codec/Format.hpp"
#include "sthe/extract/Compiler.hpp"
#include "sthe/model/Value.hpp"

#include <boost/json.hpp>

#include <string>
#include <string_view>

namespace sthe::codec {

// Absent leaves inside a map are left out; inside a list they become null.
boost::json::value toJson(const model::Value& value);

// Rebuilds a Value with the shape `option` would produce. Missing or null
// fields take the option's absent value.
model::Value fromJson(const boost::json::value& json, const extract::CompiledOption& option);

// TOML cannot hold a bare leaf or list at the top level; such values are
// written under a single `value` key.
std::string serializeValue(const model::Value& value, Format format, bool pretty = false);
model::Value deserializeValue(std::string_view text, Format format, const extract::CompiledOption& option);

} // namespace sthe::codec
