/// @file introspect.hpp
/// @brief Structural statistics and a self-describing summary of a tree.

#pragma once

#include <datastore-cpp/value.hpp>

#include <cstddef>

namespace datastore_cpp {

/// Counts over a whole tree.
struct Stats {
    std::size_t total_keys{0};    ///< Object keys, summed over every object.
    std::size_t max_depth{0};     ///< Longest path length (0 for an empty or scalar root).
    std::size_t object_count{0};  ///< Objects, root included.
    std::size_t array_count{0};   ///< Arrays, root included.
    std::size_t leaf_count{0};    ///< Scalars below the root.

    auto operator==(const Stats&) const -> bool = default;
};

/// Compute Stats for root.
/// @throws CircularReferenceError
auto stats(const Node& root) -> Stats;

/// Describe the shape of a tree as a Node.
///
/// An object root gives {key: description} for each top-level key; any
/// other root gives its own description. Descriptions are:
///
/// - object: {"type": "object", "keys": [...], "structure": {key: description}}
/// - array:  {"type": "array", "length": n, "item_types": [distinct kinds]}
/// - scalar: {"type": kind, "value": value}
///
/// @throws CircularReferenceError
auto describe(const Node& root) -> Node;

}  // namespace datastore_cpp
