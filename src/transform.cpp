#include <datastore-cpp/transform.hpp>

#include <datastore-cpp/cycle_guard.hpp>
#include <datastore-cpp/merge.hpp>
#include <datastore-cpp/path.hpp>

#include "walk.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace datastore_cpp {

namespace {

// Leaves are collected before any replacement so that a transform
// returning a container is never itself walked.
auto collect_leaves(Node& root) -> std::vector<std::pair<std::string, Node*>> {
    auto leaves = std::vector<std::pair<std::string, Node*>>{};
    detail::walk_leaves(root, [&](const Path& path, Node& leaf) {
        leaves.emplace_back(join_path(path), &leaf);
    });
    return leaves;
}

template <typename Pred>
auto prune(Node& node, CycleGuard& guard, const std::string& where, Pred&& remove) -> std::size_t {
    if (node.is_scalar()) return 0;

    auto scope = guard.enter(node, where);
    auto count = std::size_t{0};
    if (node.is_object()) {
        auto& obj = node.as_object();
        for (auto it = obj.begin(); it != obj.end();) {
            count += prune(it->second, guard, append_path(where, it->first), remove);
            if (remove(it->second)) {
                it = obj.erase(it);
                ++count;
            } else {
                ++it;
            }
        }
        return count;
    }

    auto& arr = node.as_array();
    for (std::size_t i = 0; i < arr.size();) {
        count += prune(arr[i], guard, append_path(where, std::to_string(i)), remove);
        if (remove(arr[i])) {
            arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(i));
            ++count;
        } else {
            ++i;
        }
    }
    return count;
}

auto rename_keys(const Node& node, const KeyTransform& fn,
                 CycleGuard& guard, const std::string& where) -> Node {
    if (node.is_scalar()) return node;

    auto scope = guard.enter(node, where);
    if (node.is_object()) {
        auto out = Object{};
        for (const auto& [key, child] : node.as_object()) {
            out.insert_or_assign(fn(key), rename_keys(child, fn, guard, append_path(where, key)));
        }
        return Node{std::move(out)};
    }

    const auto& arr = node.as_array();
    auto out = Array{};
    out.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        out.push_back(rename_keys(arr[i], fn, guard, append_path(where, std::to_string(i))));
    }
    return Node{std::move(out)};
}

}  // anonymous namespace

auto update_where(Node& root, const LeafCondition& condition,
                  const LeafTransform& transform) -> std::size_t {
    auto matched = std::vector<Node*>{};
    for (const auto& [path, leaf] : collect_leaves(root)) {
        if (condition(path, *leaf)) matched.push_back(leaf);
    }
    for (auto* leaf : matched) {
        *leaf = deep_copy(transform(*leaf));
    }
    return matched.size();
}

auto remove_nulls(Node& root) -> std::size_t {
    auto guard = CycleGuard{};
    return prune(root, guard, {}, [](const Node& n) { return n.is_null(); });
}

auto remove_empty(Node& root) -> std::size_t {
    auto guard = CycleGuard{};
    return prune(root, guard, {}, [](const Node& n) {
        return n.is_container() && n.size() == 0;
    });
}

auto transform_all(const Node& root, const PathTransform& fn) -> Node {
    auto result = deep_copy(root);
    for (const auto& [path, leaf] : collect_leaves(result)) {
        *leaf = deep_copy(fn(path, *leaf));
    }
    return result;
}

auto transform_keys(const Node& root, const KeyTransform& fn) -> Node {
    auto guard = CycleGuard{};
    return rename_keys(root, fn, guard, {});
}

}  // namespace datastore_cpp
