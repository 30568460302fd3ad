/// @file traversal.hpp
/// @brief Resolve, create, and remove a parsed Path inside a Node tree.
///
/// Absence is an outcome, not an error: find() returns nullptr, contains()
/// and erase() return false. Only assign() throws, when an existing node
/// blocks the write.

#pragma once

#include <datastore-cpp/path.hpp>
#include <datastore-cpp/value.hpp>

namespace datastore_cpp {

/// Resolve a path to the node it names.
///
/// At an Object a segment is a key; at an Array it must parse as an
/// in-range index; a scalar cannot be descended.
/// @return The node, or nullptr if any step is absent or impossible.
auto find(const Node& root, const Path& path) -> const Node*;
auto find(Node& root, const Path& path) -> Node*;

/// True iff find() would return a node.
auto contains(const Node& root, const Path& path) -> bool;

/// Write value at path, creating missing intermediate objects.
///
/// Arrays are never extended: the index must already exist.
/// @throws TypeMismatchError if an existing intermediate is a scalar, an
///   Array step is not an in-range index, or root is a scalar.
void assign(Node& root, const Path& path, Node value);

/// Remove the node at path.
/// @return false if the path does not resolve (never throws).
auto erase(Node& root, const Path& path) -> bool;

}  // namespace datastore_cpp
