#include <datastore-cpp/view.hpp>

#include <datastore-cpp/merge.hpp>
#include <datastore-cpp/path.hpp>
#include <datastore-cpp/traversal.hpp>

#include <stdexcept>
#include <string>

namespace datastore_cpp {

auto NodeView::operator[](std::string_view key) const -> NodeView {
    if (!node_) return NodeView{nullptr};
    return NodeView{find(*node_, Path{std::string{key}})};
}

auto NodeView::node() const -> Node& {
    if (!node_) throw std::out_of_range{"view does not refer to a node"};
    return *node_;
}

auto NodeView::get(std::string_view path) const -> std::optional<Node> {
    auto segments = parse_path(path);
    if (!node_) return std::nullopt;
    if (const auto* found = find(*node_, segments)) return *found;
    return std::nullopt;
}

void NodeView::set(std::string_view path, const Node& value) const {
    auto segments = parse_path(path);
    assign(node(), segments, deep_copy(value));
}

auto NodeView::has(std::string_view path) const -> bool {
    auto segments = parse_path(path);
    return node_ && contains(*node_, segments);
}

}  // namespace datastore_cpp
