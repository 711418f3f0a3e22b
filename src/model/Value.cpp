#include "sthe/model/Value.hpp"

#include <stdexcept>

namespace sthe::model {

Value::Value()
    : data_(Leaf{}) {}

Value Value::leaf(Leaf text) {
    Value value;
    value.data_ = std::move(text);
    return value;
}

Value Value::list(List items) {
    Value value;
    value.data_ = std::move(items);
    return value;
}

Value Value::map(Map entries) {
    Value value;
    value.data_ = std::move(entries);
    return value;
}

Value::Kind Value::kind() const noexcept {
    switch (data_.index()) {
    case 1: return Kind::list;
    case 2: return Kind::map;
    default: return Kind::leaf;
    }
}

const Value::Leaf& Value::asLeaf() const {
    return std::get<Leaf>(data_);
}

const Value::List& Value::asList() const {
    return std::get<List>(data_);
}

const Value::Map& Value::asMap() const {
    return std::get<Map>(data_);
}

const Value* Value::find(std::string_view name) const {
    const auto* entries = std::get_if<Map>(&data_);
    if (!entries) {
        return nullptr;
    }
    for (const auto& [key, value] : *entries) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

const Value& Value::at(std::string_view name) const {
    if (const auto* value = find(name)) {
        return *value;
    }
    throw std::out_of_range("no entry named " + std::string(name));
}

bool Value::operator==(const Value& other) const {
    return data_ == other.data_;
}

} // namespace sthe::model
