#include <datastore-cpp/pattern.hpp>

#include <datastore-cpp/cycle_guard.hpp>
#include <datastore-cpp/traversal.hpp>

#include "walk.hpp"

#include <algorithm>
#include <cstddef>
#include <set>

namespace datastore_cpp {

namespace {

// Backtracking matcher. `current` is the concrete path of the node being
// matched; `seen` removes the duplicates a "**" produces when it can
// reach the same path by consuming different numbers of segments.
class Matcher {
public:
    explicit Matcher(const Path& pattern) : pattern_{pattern} {}

    auto run(const Node& root) -> std::vector<Path> {
        match(root, 0);
        return std::move(results_);
    }

private:
    void emit() {
        if (current_.empty()) return;
        if (seen_.insert(current_).second) results_.push_back(current_);
    }

    template <typename Fn>
    void for_each_child(const Node& node, Fn&& fn) {
        if (node.is_scalar()) return;
        auto scope = guard_.enter(node, join_path(current_));
        if (node.is_object()) {
            for (const auto& [key, child] : node.as_object()) {
                current_.push_back(key);
                fn(child);
                current_.pop_back();
            }
            return;
        }
        const auto& arr = node.as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            current_.push_back(std::to_string(i));
            fn(arr[i]);
            current_.pop_back();
        }
    }

    void match(const Node& node, std::size_t pi) {
        if (pi == pattern_.size()) {
            emit();
            return;
        }

        const auto& segment = pattern_[pi];
        if (segment == wildcard_any) {
            // Zero segments, then one more segment with "**" still active.
            match(node, pi + 1);
            for_each_child(node, [&](const Node& child) { match(child, pi); });
            return;
        }
        if (segment == wildcard_one) {
            for_each_child(node, [&](const Node& child) { match(child, pi + 1); });
            return;
        }

        const auto* next = find(node, Path{segment});
        if (!next) return;
        current_.push_back(segment);
        match(*next, pi + 1);
        current_.pop_back();
    }

    const Path& pattern_;
    Path current_;
    std::set<Path> seen_;
    std::vector<Path> results_;
    CycleGuard guard_;
};

auto starts_with(const Path& path, const Path& prefix) -> bool {
    return path.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), path.begin());
}

}  // anonymous namespace

auto match_paths(const Node& root, const Path& pattern) -> std::vector<Path> {
    return Matcher{pattern}.run(root);
}

auto find_paths(const Node& root, std::string_view pattern) -> std::vector<std::string> {
    auto matches = match_paths(root, parse_pattern(pattern));
    auto result = std::vector<std::string>{};
    result.reserve(matches.size());
    for (const auto& path : matches) result.push_back(join_path(path));
    return result;
}

auto find_all_keys(const Node& root, std::string_view key) -> Object {
    // The key is literal: "*" and "**" name ordinary keys here, and an
    // array index never matches.
    auto result = Object{};
    detail::walk_tree(root, [&](const Path& path, const Node& node) {
        if (path.back() != key) return;
        const auto* parent = find(root, Path(path.begin(), path.end() - 1));
        if (parent != nullptr && parent->is_object()) {
            result.insert_or_assign(join_path(path), node);
        }
    });
    return result;
}

auto find_values(const Node& root, const PathPredicate& pred) -> Object {
    auto result = Object{};
    detail::walk_leaves(root, [&](const Path& path, const Node& leaf) {
        auto joined = join_path(path);
        if (pred(joined, leaf)) result.insert_or_assign(std::move(joined), leaf);
    });
    return result;
}

auto list_paths(const Node& root, std::string_view prefix) -> std::vector<std::string> {
    auto prefix_path = prefix.empty() ? Path{} : parse_path(prefix);
    auto result = std::vector<std::string>{};
    detail::walk_tree(root, [&](const Path& path, const Node&) {
        if (starts_with(path, prefix_path)) result.push_back(join_path(path));
    });
    return result;
}

}  // namespace datastore_cpp
