/// @file pattern.hpp
/// @brief Wildcard path patterns and whole-tree searches.
///
/// A pattern is a path whose segments may be "*" (exactly one segment,
/// any key or index) or "**" (zero or more segments). "**" may appear
/// anywhere, any number of times; matching backtracks across siblings.
///
/// @code
/// find_paths(root, "posts.*.title");   // {"posts.0.title", "posts.1.title"}
/// find_paths(root, "**.url");          // every "url" key at any depth
/// @endcode

#pragma once

#include <datastore-cpp/path.hpp>
#include <datastore-cpp/value.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace datastore_cpp {

/// Predicate over (joined path, leaf value).
using PathPredicate = std::function<bool(const std::string& path, const Node& value)>;

/// Every concrete path in root matching a parsed pattern.
///
/// Results are in depth-first discovery order with duplicates removed.
/// The empty path (root itself) is never reported.
auto match_paths(const Node& root, const Path& pattern) -> std::vector<Path>;

/// Every concrete path in root matching pattern, joined with '.'.
/// @throws InvalidPathError if pattern is malformed.
auto find_paths(const Node& root, std::string_view pattern) -> std::vector<std::string>;

/// Every object entry named key (matched literally) at any depth, root
/// level included, as joined path -> value (values share containers with
/// root). Array indices never match.
auto find_all_keys(const Node& root, std::string_view key) -> Object;

/// Every leaf for which pred(path, value) holds, as joined path -> value,
/// in depth-first order.
/// @throws CircularReferenceError
auto find_values(const Node& root, const PathPredicate& pred) -> Object;

/// Every concrete path in root (containers and leaves), pre-order.
///
/// With a non-empty prefix, only paths equal to or below the prefix are
/// returned.
/// @throws InvalidPathError if prefix is non-empty and malformed.
/// @throws CircularReferenceError
auto list_paths(const Node& root, std::string_view prefix = {}) -> std::vector<std::string>;

}  // namespace datastore_cpp
