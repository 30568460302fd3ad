/// @file transform.hpp
/// @brief Bulk updates, cleanup passes, and whole-tree transformations.

#pragma once

#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <string>

namespace datastore_cpp {

/// Condition over (joined path, leaf value).
using LeafCondition = std::function<bool(const std::string& path, const Node& value)>;

/// Replacement for one leaf value.
using LeafTransform = std::function<Node(const Node& value)>;

/// Replacement for one leaf value, given its joined path.
using PathTransform = std::function<Node(const std::string& path, const Node& value)>;

/// Replacement for one object key.
using KeyTransform = std::function<std::string(const std::string& key)>;

/// Replace every leaf for which condition holds with transform(leaf).
///
/// Conditions are evaluated against the tree as it was before the first
/// replacement.
/// @return The number of leaves replaced.
/// @throws CircularReferenceError
auto update_where(Node& root, const LeafCondition& condition,
                  const LeafTransform& transform) -> std::size_t;

/// Remove every null from objects and arrays, recursively.
/// @return The number of nulls removed.
auto remove_nulls(Node& root) -> std::size_t;

/// Remove every empty object and array, recursively and post-order: a
/// container emptied by the pass is removed too. root itself is kept.
/// @return The number of containers removed.
auto remove_empty(Node& root) -> std::size_t;

/// A copy of root with every leaf replaced by fn(path, leaf).
auto transform_all(const Node& root, const PathTransform& fn) -> Node;

/// A copy of root with every object key replaced by fn(key).
/// When two keys map to the same name the later one wins.
auto transform_keys(const Node& root, const KeyTransform& fn) -> Node;

}  // namespace datastore_cpp
