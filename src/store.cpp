#include <datastore-cpp/store.hpp>

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/flatten.hpp>
#include <datastore-cpp/path.hpp>
#include <datastore-cpp/traversal.hpp>

#include <utility>

namespace datastore_cpp {

// =============================================================================
// Construction
// =============================================================================

DataStore::DataStore() : root_{Node::object()} {}

DataStore::DataStore(const Node& data) : root_{deep_copy(data)} {}

DataStore::DataStore(Node root, std::in_place_t) noexcept : root_{std::move(root)} {}

DataStore::DataStore(const DataStore& other) : root_{deep_copy(other.root_)} {}

auto DataStore::operator=(const DataStore& other) -> DataStore& {
    if (this != &other) {
        root_ = deep_copy(other.root_);
    }
    return *this;
}

// =============================================================================
// Path access
// =============================================================================

auto DataStore::get(std::string_view path) const -> std::optional<Node> {
    auto segments = parse_path(path);
    if (const auto* found = find(root_, segments)) return deep_copy(*found);
    return std::nullopt;
}

auto DataStore::get(std::string_view path, const Node& default_value) const -> Node {
    if (auto found = get(path)) return std::move(*found);
    return default_value;
}

void DataStore::set(std::string_view path, const Node& value) {
    auto segments = parse_path(path);
    assign(root_, segments, deep_copy(value));
}

auto DataStore::has(std::string_view path) const -> bool {
    return datastore_cpp::contains(root_, parse_path(path));
}

auto DataStore::remove(std::string_view path) -> bool {
    return erase(root_, parse_path(path));
}

auto DataStore::get_many(const std::vector<std::string>& paths) const -> Object {
    // Validate everything up front so a bad path leaves no partial result.
    auto parsed = std::vector<Path>{};
    parsed.reserve(paths.size());
    for (const auto& p : paths) parsed.push_back(parse_path(p));

    auto out = Object{};
    for (std::size_t i = 0; i < paths.size(); ++i) {
        const auto* found = find(root_, parsed[i]);
        out.insert_or_assign(paths[i], found ? deep_copy(*found) : Node{});
    }
    return out;
}

// =============================================================================
// Top level
// =============================================================================

auto DataStore::keys() const -> std::vector<std::string> {
    if (!root_.is_object()) return {};
    return root_.as_object().keys();
}

auto DataStore::values() const -> Array {
    auto out = Array{};
    if (!root_.is_object()) return out;
    for (const auto& [key, value] : root_.as_object()) {
        out.push_back(deep_copy(value));
    }
    return out;
}

auto DataStore::items() const -> Object {
    if (!root_.is_object()) return {};
    return deep_copy(root_).as_object();
}

auto DataStore::size() const -> std::size_t {
    return root_.size();
}

auto DataStore::contains(std::string_view key) const -> bool {
    return root_.is_object() && root_.as_object().contains(key);
}

// =============================================================================
// Search
// =============================================================================

auto DataStore::find_paths(std::string_view pattern) const -> std::vector<std::string> {
    return datastore_cpp::find_paths(root_, pattern);
}

auto DataStore::find_all_keys(std::string_view key) const -> Object {
    auto out = Object{};
    for (const auto& [path, value] : datastore_cpp::find_all_keys(root_, key)) {
        out.insert_or_assign(path, deep_copy(value));
    }
    return out;
}

auto DataStore::find_values(const PathPredicate& pred) const -> Object {
    return datastore_cpp::find_values(root_, pred);
}

auto DataStore::list_paths(std::string_view prefix) const -> std::vector<std::string> {
    return datastore_cpp::list_paths(root_, prefix);
}

auto DataStore::flatten(std::string_view separator) const -> Object {
    return datastore_cpp::flatten(root_, separator);
}

// =============================================================================
// Query
// =============================================================================

auto DataStore::resolve_array(std::string_view path) const -> const Array& {
    auto segments = parse_path(path);
    const auto* found = find(root_, segments);
    if (!found) {
        throw TypeMismatchError{"cannot query \"" + std::string{path} + "\": path not found"};
    }
    if (!found->is_array()) {
        throw TypeMismatchError{"cannot query \"" + std::string{path} + "\": expected array, got " +
                                std::string{to_string_view(found->kind())}};
    }
    return found->as_array();
}

auto DataStore::query(std::string_view path) const -> Query {
    auto items = Array{};
    for (const auto& item : resolve_array(path)) items.push_back(deep_copy(item));
    return Query{std::move(items)};
}

auto DataStore::filter_list(std::string_view path, const Query::Predicate& pred) const -> Array {
    auto out = Array{};
    for (const auto& item : resolve_array(path)) {
        if (pred(item)) out.push_back(deep_copy(item));
    }
    return out;
}

// =============================================================================
// Bulk operations
// =============================================================================

auto DataStore::update_where(const LeafCondition& condition,
                             const LeafTransform& transform) -> std::size_t {
    return datastore_cpp::update_where(root_, condition, transform);
}

auto DataStore::remove_nulls() -> std::size_t {
    return datastore_cpp::remove_nulls(root_);
}

auto DataStore::remove_empty() -> std::size_t {
    return datastore_cpp::remove_empty(root_);
}

auto DataStore::transform_all(const PathTransform& fn) const -> DataStore {
    return DataStore{datastore_cpp::transform_all(root_, fn), std::in_place};
}

auto DataStore::transform_keys(const KeyTransform& fn) const -> DataStore {
    return DataStore{datastore_cpp::transform_keys(root_, fn), std::in_place};
}

// =============================================================================
// Combination
// =============================================================================

void DataStore::merge(const DataStore& other) {
    merge_into(root_, other.root_);
}

void DataStore::merge(const Node& other) {
    merge_into(root_, other);
}

auto DataStore::diff(const DataStore& other) const -> DiffResult {
    return datastore_cpp::diff(root_, other.root_);
}

auto DataStore::equals(const DataStore& other) const -> bool {
    return datastore_cpp::equals(root_, other.root_);
}

auto DataStore::equals(const Node& other) const -> bool {
    return datastore_cpp::equals(root_, other);
}

// =============================================================================
// Introspection and export
// =============================================================================

auto DataStore::stats() const -> Stats {
    return datastore_cpp::stats(root_);
}

auto DataStore::describe() const -> Node {
    return datastore_cpp::describe(root_);
}

auto DataStore::to_value() const -> Node {
    return deep_copy(root_);
}

auto operator==(const DataStore& a, const DataStore& b) -> bool {
    return a.equals(b);
}

auto operator==(const DataStore& a, const Node& b) -> bool {
    return a.equals(b);
}

}  // namespace datastore_cpp
