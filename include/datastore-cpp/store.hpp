/// @file store.hpp
/// @brief The DataStore class -- the primary API for datastore-cpp.

#pragma once

#include <datastore-cpp/introspect.hpp>
#include <datastore-cpp/merge.hpp>
#include <datastore-cpp/pattern.hpp>
#include <datastore-cpp/query.hpp>
#include <datastore-cpp/transform.hpp>
#include <datastore-cpp/value.hpp>
#include <datastore-cpp/view.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datastore_cpp {

/// An owned tree of JSON-like data addressed by dotted paths.
///
/// DataStore exclusively owns its root Node. Every path string it accepts
/// goes through parse_path first, so a malformed path fails the same way
/// everywhere with InvalidPathError, before the tree is touched. Values
/// going in (set, merge, construction) and coming out (get, to_value) are
/// deep-copied; only view() hands out live references.
///
/// @code
/// auto store = DataStore{};
/// store.set("site.name", "My Blog");
/// auto name = store.get<std::string>("site.name");   // "My Blog"
/// store.remove("site.name");
/// @endcode
class DataStore {
public:
    /// Construct an empty store (root is an empty object).
    DataStore();

    /// Construct from a deep copy of data.
    /// @throws CircularReferenceError if data contains a cycle.
    explicit DataStore(const Node& data);

    DataStore(DataStore&&) noexcept = default;
    auto operator=(DataStore&&) noexcept -> DataStore& = default;

    /// Deep-copy a store. The copy shares no containers with other.
    DataStore(const DataStore& other);
    /// Deep-copy assignment.
    auto operator=(const DataStore& other) -> DataStore&;

    // -- Path access ----------------------------------------------------------

    /// Deep copy of the value at path, or nullopt if it is unreachable.
    /// @throws InvalidPathError
    auto get(std::string_view path) const -> std::optional<Node>;

    /// Deep copy of the value at path, or default_value if unreachable.
    /// @throws InvalidPathError
    auto get(std::string_view path, const Node& default_value) const -> Node;

    /// Typed scalar read.
    ///
    /// @code
    /// auto views = store.get<std::int64_t>("posts.0.views").value_or(0);
    /// @endcode
    template <typename T>
    auto get(std::string_view path) const -> std::optional<T> {
        return get_scalar<T>(get(path));
    }

    /// Set the value at path to a deep copy of value, creating missing
    /// intermediate objects.
    /// @throws InvalidPathError, TypeMismatchError, CircularReferenceError
    void set(std::string_view path, const Node& value);

    /// True if path resolves to a value (null included).
    /// @throws InvalidPathError
    auto has(std::string_view path) const -> bool;

    /// Remove the value at path. Returns false if nothing was there.
    /// @throws InvalidPathError
    auto remove(std::string_view path) -> bool;

    /// path -> value for each of paths; unreachable paths map to null.
    /// @throws InvalidPathError
    auto get_many(const std::vector<std::string>& paths) const -> Object;

    // -- Top level ------------------------------------------------------------

    /// Keys of the root object (empty for a non-object root).
    auto keys() const -> std::vector<std::string>;

    /// Deep copies of the root object's values.
    auto values() const -> Array;

    /// Deep copy of the root object (empty for a non-object root).
    auto items() const -> Object;

    /// Number of entries in the root container.
    auto size() const -> std::size_t;

    /// True if the root object has key (no path parsing).
    auto contains(std::string_view key) const -> bool;

    // -- Search ---------------------------------------------------------------

    /// Concrete paths matching a wildcard pattern.
    /// @throws InvalidPathError
    auto find_paths(std::string_view pattern) const -> std::vector<std::string>;

    /// Every occurrence of key at any depth, as path -> deep copy.
    auto find_all_keys(std::string_view key) const -> Object;

    /// Every leaf satisfying pred, as path -> value.
    auto find_values(const PathPredicate& pred) const -> Object;

    /// Every concrete path, optionally restricted to those under prefix.
    /// @throws InvalidPathError
    auto list_paths(std::string_view prefix = {}) const -> std::vector<std::string>;

    /// Flat path -> leaf mapping.
    auto flatten(std::string_view separator = ".") const -> Object;

    // -- Query ----------------------------------------------------------------

    /// A Query over a deep copy of the array at path.
    /// @throws InvalidPathError, TypeMismatchError if path is not an array.
    auto query(std::string_view path) const -> Query;

    /// Deep copies of the items of the array at path satisfying pred.
    /// @throws InvalidPathError, TypeMismatchError if path is not an array.
    auto filter_list(std::string_view path, const Query::Predicate& pred) const -> Array;

    // -- Bulk operations ------------------------------------------------------

    /// Apply transform to every leaf satisfying condition; returns the count.
    auto update_where(const LeafCondition& condition, const LeafTransform& transform) -> std::size_t;

    /// Remove nulls recursively; returns the number removed.
    auto remove_nulls() -> std::size_t;

    /// Remove empty containers recursively; returns the number removed.
    auto remove_empty() -> std::size_t;

    /// A new store with every leaf replaced by fn(path, leaf).
    auto transform_all(const PathTransform& fn) const -> DataStore;

    /// A new store with every object key replaced by fn(key).
    auto transform_keys(const KeyTransform& fn) const -> DataStore;

    // -- Combination ----------------------------------------------------------

    /// Deep-merge other into this store; all-or-nothing.
    /// @throws CircularReferenceError
    void merge(const DataStore& other);

    /// Deep-merge a plain tree into this store; all-or-nothing.
    /// @throws CircularReferenceError
    void merge(const Node& other);

    /// What changed going from this store to other.
    auto diff(const DataStore& other) const -> DiffResult;

    /// Structural equality.
    auto equals(const DataStore& other) const -> bool;
    auto equals(const Node& other) const -> bool;

    // -- Introspection --------------------------------------------------------

    auto stats() const -> Stats;
    auto describe() const -> Node;

    // -- Export ---------------------------------------------------------------

    /// Deep copy of the whole tree.
    auto to_value() const -> Node;

    /// Read-only access to the root without copying.
    auto root() const noexcept -> const Node& { return root_; }

    /// Live attribute-style view of the root.
    auto view() -> NodeView { return NodeView{&root_}; }

private:
    explicit DataStore(Node root, std::in_place_t) noexcept;

    auto resolve_array(std::string_view path) const -> const Array&;

    Node root_;
};

auto operator==(const DataStore& a, const DataStore& b) -> bool;
auto operator==(const DataStore& a, const Node& b) -> bool;

}  // namespace datastore_cpp
