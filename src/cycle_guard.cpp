#include <datastore-cpp/cycle_guard.hpp>

#include <datastore-cpp/error.hpp>

#include <string>

namespace datastore_cpp {

auto CycleGuard::enter(const Node& node, std::string_view where) -> Scope {
    const auto* id = node.identity();
    if (!id) return Scope{this, nullptr};

    if (!active_.insert(id).second) {
        auto location = where.empty() ? std::string{"<root>"} : std::string{where};
        throw CircularReferenceError{"circular reference detected at " + location};
    }
    return Scope{this, id};
}

auto CycleGuard::is_active(const Node& node) const -> bool {
    const auto* id = node.identity();
    return id && active_.contains(id);
}

}  // namespace datastore_cpp
