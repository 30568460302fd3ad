/// @file value.hpp
/// @brief Node, the tagged value of a data tree, and its containers Object and Array.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace datastore_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The seven kinds of Node. Object and Array are containers, the rest are leaves.
enum class Kind : std::uint8_t {
    null,
    boolean,
    integer,
    real,
    string,
    object,  ///< String-keyed mapping, insertion ordered.
    array,   ///< Ordered, 0-indexed sequence.
};

/// Convert a Kind to its string representation.
constexpr auto to_string_view(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::null:    return "null";
        case Kind::boolean: return "boolean";
        case Kind::integer: return "integer";
        case Kind::real:    return "real";
        case Kind::string:  return "string";
        case Kind::object:  return "object";
        case Kind::array:   return "array";
    }
    return "unknown";
}

class Node;
class Object;

/// An ordered sequence of nodes.
using Array = std::vector<Node>;

/// A value in the data tree: a scalar leaf or a container.
///
/// Containers are held through a shared handle, so copying a Node shares
/// its Object or Array with the source, the way a decoded host structure
/// can reference one sub-object from two places (or from inside itself).
/// Use deep_copy() (merge.hpp) for an independent tree; DataStore never
/// keeps a shared container it did not copy itself.
///
/// @code
/// auto cfg = Node::object({
///     {"db", Node::object({{"host", "localhost"}, {"port", 5432}})},
///     {"tags", Node::array({"a", "b"})},
/// });
/// @endcode
class Node {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        std::string,
        std::shared_ptr<Object>,
        std::shared_ptr<Array>
    >;

    /// Construct a null node.
    Node() = default;

    Node(Null) {}
    Node(bool b) : data_{b} {}

    /// Integers are stored as int64. Unsigned values above INT64_MAX are
    /// stored as real, the same as JSON import. Character types are not
    /// accepted as integers.
    template <std::integral T>
        requires (!std::same_as<T, bool> && !std::same_as<T, char> &&
                  !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> &&
                  !std::same_as<T, char16_t> && !std::same_as<T, char32_t>)
    Node(T i) : data_{from_integer(i)} {}

    Node(double d) : data_{d} {}
    Node(const char* s) : data_{std::string{s}} {}
    Node(std::string s) : data_{std::move(s)} {}
    Node(std::string_view s) : data_{std::string{s}} {}
    Node(Object obj);
    Node(Array arr);

    /// Create an empty object, or one populated from key/value pairs.
    static auto object() -> Node;
    static auto object(std::initializer_list<std::pair<std::string, Node>> entries) -> Node;

    /// Create an empty array, or one populated from values.
    static auto array() -> Node;
    static auto array(std::initializer_list<Node> values) -> Node;

    // -- Type queries ---------------------------------------------------------

    auto kind() const noexcept -> Kind { return static_cast<Kind>(data_.index()); }

    auto is_null() const noexcept -> bool    { return kind() == Kind::null; }
    auto is_bool() const noexcept -> bool    { return kind() == Kind::boolean; }
    auto is_integer() const noexcept -> bool { return kind() == Kind::integer; }
    auto is_real() const noexcept -> bool    { return kind() == Kind::real; }
    auto is_number() const noexcept -> bool  { return is_integer() || is_real(); }
    auto is_string() const noexcept -> bool  { return kind() == Kind::string; }
    auto is_object() const noexcept -> bool  { return kind() == Kind::object; }
    auto is_array() const noexcept -> bool   { return kind() == Kind::array; }

    /// True for Object and Array.
    auto is_container() const noexcept -> bool { return is_object() || is_array(); }

    /// True for every non-container kind, null included.
    auto is_scalar() const noexcept -> bool { return !is_container(); }

    // -- Checked access (throw TypeMismatchError on the wrong kind) -----------

    auto as_bool() const -> bool;
    auto as_integer() const -> std::int64_t;
    /// Integer or real, widened to double.
    auto as_double() const -> double;
    auto as_string() const -> const std::string&;
    auto as_object() -> Object&;
    auto as_object() const -> const Object&;
    auto as_array() -> Array&;
    auto as_array() const -> const Array&;

    /// Pointer to the scalar alternative T, or nullptr.
    template <typename T>
    auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&data_);
    }

    /// Number of children of a container, 0 for scalars.
    auto size() const noexcept -> std::size_t;

    /// Address of the held container, or nullptr for scalars.
    ///
    /// Two nodes with the same identity share one container.
    auto identity() const noexcept -> const void*;

    auto storage() const noexcept -> const Storage& { return data_; }

private:
    template <std::integral T>
    static auto from_integer(T i) -> Storage {
        if constexpr (std::is_unsigned_v<T>) {
            constexpr auto int64_max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (static_cast<std::uint64_t>(i) > int64_max) return Storage{static_cast<double>(i)};
        }
        return Storage{static_cast<std::int64_t>(i)};
    }

    Storage data_;
};

/// Structural deep equality (see equals() in merge.hpp).
auto operator==(const Node& a, const Node& b) -> bool;

/// A string-keyed mapping that preserves insertion order.
///
/// Lookup is linear; the data this library targets is configuration-sized.
class Object {
public:
    using value_type = std::pair<std::string, Node>;
    using container_type = std::vector<value_type>;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;

    Object() = default;

    /// Later duplicates of a key overwrite earlier ones in place.
    Object(std::initializer_list<value_type> entries);

    auto begin() noexcept -> iterator { return entries_.begin(); }
    auto end() noexcept -> iterator { return entries_.end(); }
    auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    auto end() const noexcept -> const_iterator { return entries_.end(); }

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }

    auto find(std::string_view key) -> iterator;
    auto find(std::string_view key) const -> const_iterator;
    auto contains(std::string_view key) const -> bool;

    /// The node at key, or nullptr if absent.
    auto get(std::string_view key) -> Node*;
    auto get(std::string_view key) const -> const Node*;

    /// The node at key; throws std::out_of_range if absent.
    auto at(std::string_view key) -> Node&;
    auto at(std::string_view key) const -> const Node&;

    /// The node at key, inserting null at the end if absent.
    auto operator[](std::string_view key) -> Node&;

    /// Overwrite in place if present, append otherwise.
    auto insert_or_assign(std::string key, Node value) -> Node&;

    /// Remove key. Returns false if it was not present.
    auto erase(std::string_view key) -> bool;
    auto erase(const_iterator pos) -> iterator;

    void clear() noexcept { entries_.clear(); }

    /// Keys in insertion order.
    auto keys() const -> std::vector<std::string>;

private:
    container_type entries_;
};

// -- Inline definitions that need the complete Object -------------------------

inline Node::Node(Object obj) : data_{std::make_shared<Object>(std::move(obj))} {}
inline Node::Node(Array arr) : data_{std::make_shared<Array>(std::move(arr))} {}

inline auto Node::object() -> Node { return Node{Object{}}; }

inline auto Node::object(std::initializer_list<std::pair<std::string, Node>> entries) -> Node {
    auto obj = Object{};
    for (const auto& [k, v] : entries) obj.insert_or_assign(k, v);
    return Node{std::move(obj)};
}

inline auto Node::array() -> Node { return Node{Array{}}; }

inline auto Node::array(std::initializer_list<Node> values) -> Node {
    return Node{Array(values)};
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { printf("%lld\n", static_cast<long long>(i)); },
///     [](const auto&) { printf("other\n"); },
/// }, node.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar from a Node, or nullopt on type mismatch.
/// @code
/// auto name = get_scalar<std::string>(node);
/// @endcode
template <typename T>
auto get_scalar(const Node& n) -> std::optional<T> {
    if (const auto* t = n.get_if<T>()) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<Node>.
template <typename T>
auto get_scalar(const std::optional<Node>& n) -> std::optional<T> {
    if (!n) return std::nullopt;
    return get_scalar<T>(*n);
}

}  // namespace datastore_cpp
