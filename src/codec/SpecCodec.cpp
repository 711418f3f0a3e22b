#include "sthe/codec/SpecCodec.hpp"
#include "sthe/util/JsonUtil.hpp"

namespace sthe::codec {
namespace {

std::string childPath(const std::string& path, std::string_view name) {
    return path.empty() ? std::string(name) : path + "." + std::string(name);
}

std::string expectString(const boost::json::value& value, const std::string& path) {
    if (!value.is_string()) {
        throw FormatError(path, "expected a string");
    }
    return std::string(util::asStringView(value.get_string()));
}

bool expectBool(const boost::json::value& value, const std::string& path) {
    if (!value.is_bool()) {
        throw FormatError(path, "expected a boolean");
    }
    return value.get_bool();
}

} // namespace

model::OptionSpec decodeSpec(const boost::json::value& value) {
    if (!value.is_object()) {
        throw FormatError({}, "specification must be an object");
    }
    return decodeSpec(value.get_object(), {});
}

model::OptionSpec decodeSpec(const boost::json::object& object, const std::string& path) {
    model::OptionSpec spec;
    bool hasSelector = false;

    for (const auto& member : object) {
        std::string_view key = util::asStringView(member.key());
        const auto& value = member.value();
        std::string fieldPath = childPath(path, key);

        if (key == kSelectorField) {
            spec.selector = expectString(value, fieldPath);
            hasSelector = true;
        } else if (key == kTargetField) {
            auto name = expectString(value, fieldPath);
            auto target = model::Target::parse(name);
            if (!target) {
                throw FormatError(fieldPath, "invalid target `" + name + "`");
            }
            spec.target = std::move(*target);
        } else if (key == kManyField) {
            spec.many = expectBool(value, fieldPath);
        } else if (key == kRegexField) {
            spec.regex = expectString(value, fieldPath);
        } else if (key == kTrimField) {
            spec.trim = expectBool(value, fieldPath);
        } else if (value.is_object()) {
            spec.children.emplace_back(std::string(key), decodeSpec(value.get_object(), fieldPath));
        } else {
            throw FormatError(fieldPath, "unknown field");
        }
    }

    if (!hasSelector) {
        throw FormatError(childPath(path, kSelectorField), "missing required field");
    }
    return spec;
}

model::OptionSpec parseSpec(std::string_view text, Format format) {
    return decodeSpec(parseDocument(text, format), {});
}

boost::json::object encodeSpec(const model::OptionSpec& spec) {
    boost::json::object out;
    out[util::toJsonView(kSelectorField)] = spec.selector;
    if (spec.target.kind() != model::Target::Kind::text) {
        out[util::toJsonView(kTargetField)] = spec.target.describe();
    }
    if (spec.many) {
        out[util::toJsonView(kManyField)] = true;
    }
    if (spec.regex) {
        out[util::toJsonView(kRegexField)] = *spec.regex;
    }
    if (!spec.trim) {
        out[util::toJsonView(kTrimField)] = false;
    }
    for (const auto& [name, child] : spec.children) {
        out[util::toJsonView(name)] = encodeSpec(child);
    }
    return out;
}

} // namespace sthe::codec
