#include <datastore-cpp/introspect.hpp>

#include <datastore-cpp/cycle_guard.hpp>
#include <datastore-cpp/path.hpp>

#include "walk.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace datastore_cpp {

namespace {

void count_container(const Node& node, Stats& out) {
    if (node.is_object()) {
        ++out.object_count;
        out.total_keys += node.size();
    } else if (node.is_array()) {
        ++out.array_count;
    }
}

auto describe_recursive(const Node& node, CycleGuard& guard, const std::string& where) -> Node {
    if (node.is_scalar()) {
        return Node::object({
            {"type", std::string{to_string_view(node.kind())}},
            {"value", node},
        });
    }

    auto scope = guard.enter(node, where);
    if (node.is_object()) {
        auto keys = Array{};
        auto structure = Object{};
        for (const auto& [key, child] : node.as_object()) {
            keys.emplace_back(key);
            structure.insert_or_assign(key, describe_recursive(child, guard, append_path(where, key)));
        }
        return Node::object({
            {"type", "object"},
            {"keys", Node{std::move(keys)}},
            {"structure", Node{std::move(structure)}},
        });
    }

    const auto& arr = node.as_array();
    auto kinds = std::vector<std::string>{};
    for (const auto& item : arr) {
        auto name = std::string{to_string_view(item.kind())};
        if (std::ranges::find(kinds, name) == kinds.end()) kinds.push_back(std::move(name));
    }
    auto item_types = Array{};
    for (auto& k : kinds) item_types.emplace_back(std::move(k));
    return Node::object({
        {"type", "array"},
        {"length", arr.size()},
        {"item_types", Node{std::move(item_types)}},
    });
}

}  // anonymous namespace

auto stats(const Node& root) -> Stats {
    auto out = Stats{};
    count_container(root, out);
    detail::walk_tree(root, [&](const Path& path, const Node& node) {
        out.max_depth = std::max(out.max_depth, path.size());
        if (node.is_scalar()) {
            ++out.leaf_count;
        } else {
            count_container(node, out);
        }
    });
    return out;
}

auto describe(const Node& root) -> Node {
    auto guard = CycleGuard{};
    auto description = describe_recursive(root, guard, {});
    if (!root.is_object()) return description;
    return description.as_object().at("structure");
}

}  // namespace datastore_cpp
