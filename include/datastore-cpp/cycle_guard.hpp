/// @file cycle_guard.hpp
/// @brief Detects a container reached again through its own descendants.

#pragma once

#include <datastore-cpp/value.hpp>

#include <string>
#include <string_view>
#include <unordered_set>

namespace datastore_cpp {

/// Tracks the containers on the active recursion stack of one traversal.
///
/// Construct one per top-level call (never share it across calls). Before
/// descending into a container, enter() it; the returned Scope leaves on
/// destruction, so a container reachable through two sibling branches
/// (a DAG) is visited twice without complaint, while a container that
/// reappears below itself throws CircularReferenceError.
///
/// @code
/// auto guard = CycleGuard{};
/// auto copy_node = [&](const Node& n, auto&& self) -> Node {
///     auto scope = guard.enter(n, "a.b");
///     ...
/// };
/// @endcode
class CycleGuard {
public:
    /// Membership of one container in the active set.
    class Scope {
    public:
        Scope(Scope&& other) noexcept : guard_{other.guard_}, id_{other.id_} {
            other.guard_ = nullptr;
        }
        Scope(const Scope&) = delete;
        auto operator=(const Scope&) -> Scope& = delete;
        auto operator=(Scope&&) -> Scope& = delete;

        ~Scope() {
            if (guard_ && id_) guard_->active_.erase(id_);
        }

    private:
        friend class CycleGuard;
        Scope(CycleGuard* guard, const void* id) : guard_{guard}, id_{id} {}

        CycleGuard* guard_;
        const void* id_;
    };

    /// Mark a container as being visited. Scalars are accepted and ignored.
    ///
    /// @param node The node about to be descended into.
    /// @param where The joined path of node, for the error message.
    /// @throws CircularReferenceError if node is already active.
    auto enter(const Node& node, std::string_view where = {}) -> Scope;

    /// True if node is on the active stack.
    auto is_active(const Node& node) const -> bool;

    /// Number of containers currently active.
    auto depth() const noexcept -> std::size_t { return active_.size(); }

private:
    std::unordered_set<const void*> active_;
};

}  // namespace datastore_cpp
