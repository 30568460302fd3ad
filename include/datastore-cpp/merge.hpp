/// @file merge.hpp
/// @brief Deep copy, deep merge, structural equality, and structural diff.
///
/// Every function here walks containers under a fresh CycleGuard and throws
/// CircularReferenceError if a container is its own ancestor. Shared but
/// acyclic sub-structures (DAGs) are accepted and copied once per path.

#pragma once

#include <datastore-cpp/value.hpp>

#include <string>
#include <vector>

namespace datastore_cpp {

/// Copy a tree so that the result shares no container with the source.
/// @throws CircularReferenceError
auto deep_copy(const Node& node) -> Node;

/// Deep-merge overlay onto base and return the result; neither input changes.
///
/// - A key only in overlay is added.
/// - A key in both whose values are both objects is merged recursively.
/// - Otherwise the overlay value replaces the base value wholesale
///   (arrays are replaced, not concatenated).
///
/// If either root is not an object, the result is a copy of overlay.
/// The result shares no container with either input.
/// @throws CircularReferenceError
auto merge(const Node& base, const Node& overlay) -> Node;

/// Deep-merge overlay into base in place.
///
/// All-or-nothing: on CircularReferenceError base is left unchanged.
void merge_into(Node& base, const Node& overlay);

/// Structural deep equality.
///
/// Objects compare by key set (order-independent), arrays element-wise in
/// order, integers and reals by numeric value. Booleans never equal numbers.
/// @throws CircularReferenceError
auto equals(const Node& a, const Node& b) -> bool;

/// A value present on both sides of a diff with different contents.
struct ChangedValue {
    std::string path;  ///< Joined path of the value.
    Node before;       ///< Value in the old tree.
    Node after;        ///< Value in the new tree.
};

/// The result of diff(): three pairwise path-disjoint sets.
struct DiffResult {
    Object added;                       ///< path -> value only in the new tree.
    Object removed;                     ///< path -> value only in the old tree.
    std::vector<ChangedValue> changed;  ///< paths present on both sides with unequal values.

    /// True when the two trees were equal.
    auto empty() const noexcept -> bool {
        return added.empty() && removed.empty() && changed.empty();
    }
};

/// Compute what changed from before to after.
///
/// Objects are compared key by key, recursing where both sides hold an
/// object; a subtree that exists on one side only is reported once, at
/// its own path, with its whole value. Arrays and scalars are compared as
/// whole values. Unchanged paths are omitted. If the roots are not both
/// objects and differ, a single change is reported at the empty path.
/// @throws CircularReferenceError
auto diff(const Node& before, const Node& after) -> DiffResult;

}  // namespace datastore_cpp
