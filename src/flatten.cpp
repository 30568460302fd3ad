#include <datastore-cpp/flatten.hpp>

#include <datastore-cpp/merge.hpp>
#include <datastore-cpp/path.hpp>
#include <datastore-cpp/traversal.hpp>

#include "walk.hpp"

namespace datastore_cpp {

auto flatten(const Node& root, std::string_view separator) -> Object {
    auto result = Object{};
    detail::walk_leaves(root, [&](const Path& path, const Node& leaf) {
        result.insert_or_assign(join_path(path, separator), leaf);
    });
    return result;
}

auto unflatten(const Object& flat, std::string_view separator) -> Node {
    auto root = Node::object();
    for (const auto& [key, value] : flat) {
        assign(root, parse_path(key, separator), deep_copy(value));
    }
    return root;
}

}  // namespace datastore_cpp
