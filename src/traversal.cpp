#include <datastore-cpp/traversal.hpp>

#include <datastore-cpp/error.hpp>

#include <cstddef>
#include <string>

namespace datastore_cpp {

namespace {

/// One step down from node, or nullptr. N is Node or const Node.
template <typename N>
auto child(N& node, const std::string& segment) -> N* {
    if (node.is_object()) return node.as_object().get(segment);
    if (node.is_array()) {
        auto& arr = node.as_array();
        auto idx = try_parse_index(segment);
        if (!idx || *idx >= arr.size()) return nullptr;
        return &arr[*idx];
    }
    return nullptr;
}

template <typename N>
auto walk(N& root, const Path& path) -> N* {
    auto* current = &root;
    for (const auto& segment : path) {
        current = child(*current, segment);
        if (!current) return nullptr;
    }
    return current;
}

[[noreturn]] void blocked(const Path& path, std::size_t depth, std::string_view reason) {
    auto prefix = Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(depth));
    auto where = prefix.empty() ? std::string{"<root>"} : join_path(prefix);
    throw TypeMismatchError{"cannot set \"" + join_path(path) + "\": " +
                            std::string{reason} + " at " + where};
}

/// The slot for segment i under node, creating an empty object when node
/// is an object without that key.
auto slot_for_write(Node& node, const Path& path, std::size_t i) -> Node& {
    const auto& segment = path[i];
    if (node.is_object()) {
        auto& obj = node.as_object();
        if (auto* existing = obj.get(segment)) return *existing;
        return obj.insert_or_assign(segment, i + 1 < path.size() ? Node::object() : Node{});
    }
    if (node.is_array()) {
        auto& arr = node.as_array();
        auto idx = try_parse_index(segment);
        if (!idx) blocked(path, i, "array index is not an integer");
        if (*idx >= arr.size()) blocked(path, i, "array index out of range");
        return arr[*idx];
    }
    blocked(path, i, std::string{to_string_view(node.kind())} + " is not a container");
}

}  // anonymous namespace

auto find(Node& root, const Path& path) -> Node* {
    return walk(root, path);
}

auto find(const Node& root, const Path& path) -> const Node* {
    return walk(root, path);
}

auto contains(const Node& root, const Path& path) -> bool {
    return find(root, path) != nullptr;
}

void assign(Node& root, const Path& path, Node value) {
    if (path.empty()) throw InvalidPathError{"cannot set an empty path"};

    auto* current = &root;
    for (std::size_t i = 0; i < path.size(); ++i) {
        current = &slot_for_write(*current, path, i);
    }
    *current = std::move(value);
}

auto erase(Node& root, const Path& path) -> bool {
    if (path.empty()) return false;

    auto parent_path = Path(path.begin(), path.end() - 1);
    auto* parent = find(root, parent_path);
    if (!parent) return false;

    const auto& last = path.back();
    if (parent->is_object()) {
        return parent->as_object().erase(last);
    }
    if (parent->is_array()) {
        auto& arr = parent->as_array();
        auto idx = try_parse_index(last);
        if (!idx || *idx >= arr.size()) return false;
        arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(*idx));
        return true;
    }
    return false;
}

}  // namespace datastore_cpp
