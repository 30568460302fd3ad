#include <datastore-cpp/value.hpp>

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/merge.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace datastore_cpp {

namespace {

[[noreturn]] void throw_kind_mismatch(Kind expected, Kind actual) {
    throw TypeMismatchError{"expected " + std::string{to_string_view(expected)} +
                            ", got " + std::string{to_string_view(actual)}};
}

}  // anonymous namespace

// =============================================================================
// Node
// =============================================================================

auto Node::as_bool() const -> bool {
    if (const auto* b = std::get_if<bool>(&data_)) return *b;
    throw_kind_mismatch(Kind::boolean, kind());
}

auto Node::as_integer() const -> std::int64_t {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return *i;
    throw_kind_mismatch(Kind::integer, kind());
}

auto Node::as_double() const -> double {
    if (const auto* d = std::get_if<double>(&data_)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(&data_)) return static_cast<double>(*i);
    throw_kind_mismatch(Kind::real, kind());
}

auto Node::as_string() const -> const std::string& {
    if (const auto* s = std::get_if<std::string>(&data_)) return *s;
    throw_kind_mismatch(Kind::string, kind());
}

auto Node::as_object() -> Object& {
    if (auto* p = std::get_if<std::shared_ptr<Object>>(&data_)) return **p;
    throw_kind_mismatch(Kind::object, kind());
}

auto Node::as_object() const -> const Object& {
    if (const auto* p = std::get_if<std::shared_ptr<Object>>(&data_)) return **p;
    throw_kind_mismatch(Kind::object, kind());
}

auto Node::as_array() -> Array& {
    if (auto* p = std::get_if<std::shared_ptr<Array>>(&data_)) return **p;
    throw_kind_mismatch(Kind::array, kind());
}

auto Node::as_array() const -> const Array& {
    if (const auto* p = std::get_if<std::shared_ptr<Array>>(&data_)) return **p;
    throw_kind_mismatch(Kind::array, kind());
}

auto Node::size() const noexcept -> std::size_t {
    if (const auto* p = std::get_if<std::shared_ptr<Object>>(&data_)) return (*p)->size();
    if (const auto* p = std::get_if<std::shared_ptr<Array>>(&data_)) return (*p)->size();
    return 0;
}

auto Node::identity() const noexcept -> const void* {
    if (const auto* p = std::get_if<std::shared_ptr<Object>>(&data_)) return p->get();
    if (const auto* p = std::get_if<std::shared_ptr<Array>>(&data_)) return p->get();
    return nullptr;
}

auto operator==(const Node& a, const Node& b) -> bool {
    return equals(a, b);
}

// =============================================================================
// Object
// =============================================================================

Object::Object(std::initializer_list<value_type> entries) {
    entries_.reserve(entries.size());
    for (const auto& [k, v] : entries) insert_or_assign(k, v);
}

auto Object::find(std::string_view key) -> iterator {
    return std::ranges::find_if(entries_, [&](const value_type& e) { return e.first == key; });
}

auto Object::find(std::string_view key) const -> const_iterator {
    return std::ranges::find_if(entries_, [&](const value_type& e) { return e.first == key; });
}

auto Object::contains(std::string_view key) const -> bool {
    return find(key) != entries_.end();
}

auto Object::get(std::string_view key) -> Node* {
    auto it = find(key);
    return it != entries_.end() ? &it->second : nullptr;
}

auto Object::get(std::string_view key) const -> const Node* {
    auto it = find(key);
    return it != entries_.end() ? &it->second : nullptr;
}

auto Object::at(std::string_view key) -> Node& {
    if (auto* n = get(key)) return *n;
    throw std::out_of_range{"no such key: " + std::string{key}};
}

auto Object::at(std::string_view key) const -> const Node& {
    if (const auto* n = get(key)) return *n;
    throw std::out_of_range{"no such key: " + std::string{key}};
}

auto Object::operator[](std::string_view key) -> Node& {
    if (auto* n = get(key)) return *n;
    return entries_.emplace_back(std::string{key}, Node{}).second;
}

auto Object::insert_or_assign(std::string key, Node value) -> Node& {
    if (auto* n = get(key)) {
        *n = std::move(value);
        return *n;
    }
    return entries_.emplace_back(std::move(key), std::move(value)).second;
}

auto Object::erase(std::string_view key) -> bool {
    auto it = find(key);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

auto Object::erase(const_iterator pos) -> iterator {
    return entries_.erase(pos);
}

auto Object::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& [k, v] : entries_) result.push_back(k);
    return result;
}

}  // namespace datastore_cpp
