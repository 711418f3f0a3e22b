#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sthe::model {

// Result of an extraction. Mirrors the shape of the option that produced it:
// a list for `many`, a map for options with children, a leaf otherwise.
class Value {
public:
    using Leaf = std::optional<std::string>;
    using List = std::vector<Value>;
    using Map = std::vector<std::pair<std::string, Value>>;

    enum class Kind {
        leaf,
        list,
        map
    };

    Value();

    static Value leaf(Leaf text);
    static Value list(List items);
    static Value map(Map entries);

    [[nodiscard]] Kind kind() const noexcept;
    [[nodiscard]] bool isLeaf() const noexcept { return kind() == Kind::leaf; }
    [[nodiscard]] bool isList() const noexcept { return kind() == Kind::list; }
    [[nodiscard]] bool isMap() const noexcept { return kind() == Kind::map; }

    // Throw std::bad_variant_access on a kind mismatch.
    const Leaf& asLeaf() const;
    const List& asList() const;
    const Map& asMap() const;

    const Value* find(std::string_view name) const;
    const Value& at(std::string_view name) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<Leaf, List, Map> data_;
};

} // namespace sthe::model
