/// @file view.hpp
/// @brief NodeView, attribute-style access by live reference.

#pragma once

#include <datastore-cpp/value.hpp>

#include <optional>
#include <string_view>

namespace datastore_cpp {

/// A live, non-owning handle to one node of a tree.
///
/// Unlike DataStore::get, nothing here copies: values read through a view
/// share containers with the tree, and writes through it land in the tree
/// immediately. A view is invalidated by any structural change to the
/// containers above it, exactly like an iterator.
///
/// @code
/// auto site = store.view()["site"];
/// site.set("tagline", "Building things");
/// auto name = site["name"].as<std::string>();
/// @endcode
class NodeView {
public:
    /// A view of node; nullptr makes an absent view.
    explicit NodeView(Node* node) noexcept : node_{node} {}

    /// True if the view refers to a node.
    auto exists() const noexcept -> bool { return node_ != nullptr; }

    /// Step into one child. key is taken literally (dots included) and is
    /// an index when this node is an array. Absent views stay absent.
    auto operator[](std::string_view key) const -> NodeView;

    /// The referenced node; throws std::out_of_range for an absent view.
    auto node() const -> Node&;

    /// Typed scalar read, nullopt when absent or of another kind.
    template <typename T>
    auto as() const -> std::optional<T> {
        if (!node_) return std::nullopt;
        return get_scalar<T>(*node_);
    }

    // -- Forwarders to the traversal engine (paths are validated) --------------

    /// The node at path, sharing containers with the tree.
    auto get(std::string_view path) const -> std::optional<Node>;

    /// Write a deep copy of value at path.
    void set(std::string_view path, const Node& value) const;

    auto has(std::string_view path) const -> bool;

private:
    Node* node_;
};

}  // namespace datastore_cpp
