#include "sthe/util/JsonUtil.hpp"

#include <sstream>

namespace sthe::util {
namespace {

void writePretty(std::ostringstream& os, const boost::json::value& value, std::string& indent) {
    switch (value.kind()) {
    case boost::json::kind::object: {
        const auto& obj = value.get_object();
        if (obj.empty()) {
            os << "{}";
            return;
        }
        os << "{\n";
        indent.append(2, ' ');
        bool first = true;
        for (const auto& member : obj) {
            if (!first) {
                os << ",\n";
            }
            first = false;
            os << indent << boost::json::serialize(boost::json::value(member.key())) << ": ";
            writePretty(os, member.value(), indent);
        }
        indent.resize(indent.size() - 2);
        os << '\n' << indent << '}';
        return;
    }
    case boost::json::kind::array: {
        const auto& arr = value.get_array();
        if (arr.empty()) {
            os << "[]";
            return;
        }
        os << "[\n";
        indent.append(2, ' ');
        bool first = true;
        for (const auto& element : arr) {
            if (!first) {
                os << ",\n";
            }
            first = false;
            os << indent;
            writePretty(os, element, indent);
        }
        indent.resize(indent.size() - 2);
        os << '\n' << indent << ']';
        return;
    }
    default:
        os << boost::json::serialize(value);
        return;
    }
}

} // namespace

boost::json::value parseJson(std::string_view payload) {
    return boost::json::parse(toJsonView(payload));
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::string prettyJson(const boost::json::value& value) {
    std::ostringstream os;
    std::string indent;
    writePretty(os, value, indent);
    return os.str();
}

} // namespace sthe::util
