#include "sthe/codec/ValueCodec.hpp"
#include "sthe/extract/Extractor.hpp"
#include "sthe/util/JsonUtil.hpp"
#include "sthe/util/Toml.hpp"

namespace sthe::codec {
namespace {

constexpr std::string_view kWrapperKey = "value";

std::string childPath(const std::string& path, std::string_view name) {
    return path.empty() ? std::string(name) : path + "." + std::string(name);
}

model::Value decodeSingle(const boost::json::value& json, const extract::CompiledOption& option,
                          const std::string& path);

model::Value decode(const boost::json::value& json, const extract::CompiledOption& option,
                    const std::string& path) {
    if (json.is_null()) {
        return extract::absentValue(option);
    }
    if (!option.many()) {
        return decodeSingle(json, option, path);
    }
    if (!json.is_array()) {
        throw FormatError(path, "expected an array");
    }
    model::Value::List items;
    const auto& array = json.get_array();
    items.reserve(array.size());
    for (std::size_t i = 0; i < array.size(); ++i) {
        const auto& item = array[i];
        std::string itemPath = path + "[" + std::to_string(i) + "]";
        if (item.is_null() && !option.hasChildren()) {
            items.push_back(model::Value::leaf(std::nullopt));
        } else if (item.is_null()) {
            throw FormatError(itemPath, "expected an object");
        } else {
            items.push_back(decodeSingle(item, option, itemPath));
        }
    }
    return model::Value::list(std::move(items));
}

model::Value decodeSingle(const boost::json::value& json, const extract::CompiledOption& option,
                          const std::string& path) {
    if (!option.hasChildren()) {
        if (!json.is_string()) {
            throw FormatError(path, "expected a string");
        }
        return model::Value::leaf(std::string(util::asStringView(json.get_string())));
    }

    if (!json.is_object()) {
        throw FormatError(path, "expected an object");
    }
    const auto& object = json.get_object();
    for (const auto& member : object) {
        std::string_view key = util::asStringView(member.key());
        if (!option.child(key)) {
            throw FormatError(childPath(path, key), "unknown field");
        }
    }

    model::Value::Map entries;
    entries.reserve(option.children().size());
    for (const auto& [name, child] : option.children()) {
        const auto* field = object.if_contains(util::toJsonView(name));
        if (field) {
            entries.emplace_back(name, decode(*field, child, childPath(path, name)));
        } else {
            entries.emplace_back(name, extract::absentValue(child));
        }
    }
    return model::Value::map(std::move(entries));
}

} // namespace

boost::json::value toJson(const model::Value& value) {
    switch (value.kind()) {
    case model::Value::Kind::leaf: {
        const auto& leaf = value.asLeaf();
        if (!leaf) {
            return nullptr;
        }
        return boost::json::string(util::toJsonView(*leaf));
    }
    case model::Value::Kind::list: {
        boost::json::array array;
        for (const auto& item : value.asList()) {
            array.push_back(toJson(item));
        }
        return array;
    }
    case model::Value::Kind::map: {
        boost::json::object object;
        for (const auto& [name, entry] : value.asMap()) {
            if (entry.isLeaf() && !entry.asLeaf()) {
                continue;
            }
            object[util::toJsonView(name)] = toJson(entry);
        }
        return object;
    }
    }
    return nullptr;
}

model::Value fromJson(const boost::json::value& json, const extract::CompiledOption& option) {
    return decode(json, option, {});
}

std::string serializeValue(const model::Value& value, Format format, bool pretty) {
    auto json = toJson(value);
    if (format == Format::json) {
        return pretty ? util::prettyJson(json) : util::stringifyJson(json);
    }
    if (json.is_object()) {
        return util::writeToml(json.get_object());
    }
    boost::json::object wrapper;
    wrapper[util::toJsonView(kWrapperKey)] = std::move(json);
    return util::writeToml(wrapper);
}

model::Value deserializeValue(std::string_view text, Format format, const extract::CompiledOption& option) {
    if (format == Format::json) {
        boost::json::value parsed;
        try {
            parsed = util::parseJson(text);
        } catch (const std::exception& ex) {
            throw FormatError({}, std::string{"invalid JSON: "} + ex.what());
        }
        return fromJson(parsed, option);
    }

    auto table = parseDocument(text, Format::toml);
    if (option.hasChildren() && !option.many()) {
        return fromJson(boost::json::value(std::move(table)), option);
    }
    const auto* wrapped = table.if_contains(util::toJsonView(kWrapperKey));
    if (!wrapped) {
        return extract::absentValue(option);
    }
    return fromJson(*wrapped, option);
}

} // namespace sthe::codec
