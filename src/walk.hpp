#pragma once

// Internal header, not installed. Depth-first walk over objects and arrays
// with joined path strings.

#include <datastore-cpp/cycle_guard.hpp>
#include <datastore-cpp/path.hpp>
#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <type_traits>

namespace datastore_cpp::detail {

// Calls fn(path, child) for every node below node, pre-order, children in
// container order. N is Node or const Node; with a non-const N the callback
// may replace scalar children in place but must not restructure containers.
template <typename N, typename Fn>
void walk_children(N& node, Path& path, CycleGuard& guard, Fn& fn) {
    if (node.is_scalar()) return;

    auto scope = guard.enter(node, join_path(path));
    if (node.is_object()) {
        for (auto& [key, child] : node.as_object()) {
            path.push_back(key);
            fn(static_cast<const Path&>(path), child);
            walk_children(child, path, guard, fn);
            path.pop_back();
        }
        return;
    }

    auto& arr = node.as_array();
    for (std::size_t i = 0; i < arr.size(); ++i) {
        path.push_back(std::to_string(i));
        fn(static_cast<const Path&>(path), arr[i]);
        walk_children(arr[i], path, guard, fn);
        path.pop_back();
    }
}

// Walk every node below root (root itself is not visited).
// Throws CircularReferenceError if a container is its own ancestor.
template <typename N, typename Fn>
void walk_tree(N& root, Fn&& fn) {
    auto guard = CycleGuard{};
    auto path = Path{};
    walk_children(root, path, guard, fn);
}

// Walk only the leaves (scalars) below root.
template <typename N, typename Fn>
void walk_leaves(N& root, Fn&& fn) {
    walk_tree(root, [&](const Path& path, auto& node) {
        if (node.is_scalar()) fn(path, node);
    });
}

}  // namespace datastore_cpp::detail
