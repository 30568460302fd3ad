#include <datastore-cpp/merge.hpp>

#include <datastore-cpp/cycle_guard.hpp>
#include <datastore-cpp/path.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace datastore_cpp {

namespace {

auto index_path(const std::string& where, std::size_t i) -> std::string {
    return append_path(where, std::to_string(i));
}

// -- Copy ---------------------------------------------------------------------

auto copy_recursive(const Node& node, CycleGuard& guard, const std::string& where) -> Node {
    if (node.is_scalar()) return node;

    auto scope = guard.enter(node, where);
    if (node.is_object()) {
        auto out = Object{};
        for (const auto& [key, child] : node.as_object()) {
            out.insert_or_assign(key, copy_recursive(child, guard, append_path(where, key)));
        }
        return Node{std::move(out)};
    }

    const auto& arr = node.as_array();
    auto out = Array{};
    out.reserve(arr.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        out.push_back(copy_recursive(arr[i], guard, index_path(where, i)));
    }
    return Node{std::move(out)};
}

// -- Merge --------------------------------------------------------------------

// Base and overlay get separate guards: the same container may legitimately
// appear on both sides (merging a tree with itself).
auto merge_recursive(const Node& base, const Node& overlay,
                     CycleGuard& base_guard, CycleGuard& overlay_guard,
                     const std::string& where) -> Node {
    if (!base.is_object() || !overlay.is_object()) {
        return copy_recursive(overlay, overlay_guard, where);
    }

    auto base_scope = base_guard.enter(base, where);
    auto overlay_scope = overlay_guard.enter(overlay, where);

    const auto& base_obj = base.as_object();
    const auto& overlay_obj = overlay.as_object();

    auto out = Object{};
    for (const auto& [key, base_child] : base_obj) {
        auto path = append_path(where, key);
        if (const auto* overlay_child = overlay_obj.get(key)) {
            out.insert_or_assign(key, merge_recursive(base_child, *overlay_child,
                                                      base_guard, overlay_guard, path));
        } else {
            out.insert_or_assign(key, copy_recursive(base_child, base_guard, path));
        }
    }
    for (const auto& [key, overlay_child] : overlay_obj) {
        if (base_obj.contains(key)) continue;
        out.insert_or_assign(key, copy_recursive(overlay_child, overlay_guard,
                                                 append_path(where, key)));
    }
    return Node{std::move(out)};
}

// -- Equality -----------------------------------------------------------------

// Exact: an integer equals a real only if the real is integral and
// converts back to the same int64.
auto integer_equals_real(std::int64_t i, double d) -> bool {
    if (!std::isfinite(d) || std::trunc(d) != d) return false;
    if (d < -0x1p63 || d >= 0x1p63) return false;
    return static_cast<std::int64_t>(d) == i;
}

auto numbers_equal(const Node& a, const Node& b) -> bool {
    if (a.is_integer() && b.is_integer()) return a.as_integer() == b.as_integer();
    if (a.is_real() && b.is_real()) return a.as_double() == b.as_double();
    if (a.is_integer()) return integer_equals_real(a.as_integer(), b.as_double());
    return integer_equals_real(b.as_integer(), a.as_double());
}

auto equals_recursive(const Node& a, const Node& b,
                      CycleGuard& guard_a, CycleGuard& guard_b,
                      const std::string& where) -> bool {
    if (a.is_number() && b.is_number()) return numbers_equal(a, b);
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case Kind::null:    return true;
        case Kind::boolean: return a.as_bool() == b.as_bool();
        case Kind::string:  return a.as_string() == b.as_string();
        case Kind::integer:
        case Kind::real:    return numbers_equal(a, b);
        case Kind::object: {
            auto scope_a = guard_a.enter(a, where);
            auto scope_b = guard_b.enter(b, where);
            const auto& oa = a.as_object();
            const auto& ob = b.as_object();
            if (oa.size() != ob.size()) return false;
            for (const auto& [key, child_a] : oa) {
                const auto* child_b = ob.get(key);
                if (!child_b) return false;
                if (!equals_recursive(child_a, *child_b, guard_a, guard_b,
                                      append_path(where, key))) {
                    return false;
                }
            }
            return true;
        }
        case Kind::array: {
            auto scope_a = guard_a.enter(a, where);
            auto scope_b = guard_b.enter(b, where);
            const auto& aa = a.as_array();
            const auto& ab = b.as_array();
            if (aa.size() != ab.size()) return false;
            for (std::size_t i = 0; i < aa.size(); ++i) {
                if (!equals_recursive(aa[i], ab[i], guard_a, guard_b, index_path(where, i))) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

// -- Diff ---------------------------------------------------------------------

void diff_recursive(const Node& before, const Node& after,
                    CycleGuard& guard_before, CycleGuard& guard_after,
                    const std::string& where, DiffResult& out) {
    auto scope_before = guard_before.enter(before, where);
    auto scope_after = guard_after.enter(after, where);

    const auto& obj_before = before.as_object();
    const auto& obj_after = after.as_object();

    for (const auto& [key, old_value] : obj_before) {
        auto path = append_path(where, key);
        const auto* new_value = obj_after.get(key);
        if (!new_value) {
            out.removed.insert_or_assign(path, copy_recursive(old_value, guard_before, path));
        } else if (old_value.is_object() && new_value->is_object()) {
            diff_recursive(old_value, *new_value, guard_before, guard_after, path, out);
        } else if (!equals_recursive(old_value, *new_value, guard_before, guard_after, path)) {
            out.changed.push_back(ChangedValue{
                path,
                copy_recursive(old_value, guard_before, path),
                copy_recursive(*new_value, guard_after, path),
            });
        }
    }
    for (const auto& [key, new_value] : obj_after) {
        if (obj_before.contains(key)) continue;
        auto path = append_path(where, key);
        out.added.insert_or_assign(path, copy_recursive(new_value, guard_after, path));
    }
}

}  // anonymous namespace

auto deep_copy(const Node& node) -> Node {
    auto guard = CycleGuard{};
    return copy_recursive(node, guard, {});
}

auto merge(const Node& base, const Node& overlay) -> Node {
    auto base_guard = CycleGuard{};
    auto overlay_guard = CycleGuard{};
    return merge_recursive(base, overlay, base_guard, overlay_guard, {});
}

void merge_into(Node& base, const Node& overlay) {
    auto merged = merge(base, overlay);
    base = std::move(merged);
}

auto equals(const Node& a, const Node& b) -> bool {
    auto guard_a = CycleGuard{};
    auto guard_b = CycleGuard{};
    return equals_recursive(a, b, guard_a, guard_b, {});
}

auto diff(const Node& before, const Node& after) -> DiffResult {
    auto guard_before = CycleGuard{};
    auto guard_after = CycleGuard{};
    auto result = DiffResult{};
    if (before.is_object() && after.is_object()) {
        diff_recursive(before, after, guard_before, guard_after, {}, result);
    } else if (!equals_recursive(before, after, guard_before, guard_after, {})) {
        result.changed.push_back(ChangedValue{
            {},
            copy_recursive(before, guard_before, {}),
            copy_recursive(after, guard_after, {}),
        });
    }
    return result;
}

}  // namespace datastore_cpp
