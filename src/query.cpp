#include <datastore-cpp/query.hpp>

#include <datastore-cpp/merge.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace datastore_cpp {

namespace {

// Rank of a kind in the cross-kind ordering; integer and real share a rank.
auto rank(const Node& n) -> int {
    switch (n.kind()) {
        case Kind::null:    return 0;
        case Kind::boolean: return 1;
        case Kind::integer:
        case Kind::real:    return 2;
        case Kind::string:  return 3;
        case Kind::array:   return 4;
        case Kind::object:  return 5;
    }
    return 6;
}

auto numbers_less(const Node& a, const Node& b) -> bool {
    if (a.is_integer() && b.is_integer()) return a.as_integer() < b.as_integer();
    return a.as_double() < b.as_double();
}

}  // anonymous namespace

auto less_than(const Node& a, const Node& b) -> bool {
    auto ra = rank(a);
    auto rb = rank(b);
    if (ra != rb) return ra < rb;

    switch (a.kind()) {
        case Kind::null:    return false;
        case Kind::boolean: return !a.as_bool() && b.as_bool();
        case Kind::integer:
        case Kind::real:    return numbers_less(a, b);
        case Kind::string:  return a.as_string() < b.as_string();
        case Kind::array:
            return std::lexicographical_compare(
                a.as_array().begin(), a.as_array().end(),
                b.as_array().begin(), b.as_array().end(),
                [](const Node& x, const Node& y) { return less_than(x, y); });
        case Kind::object: {
            const auto& oa = a.as_object();
            const auto& ob = b.as_object();
            if (oa.size() != ob.size()) return oa.size() < ob.size();
            return std::lexicographical_compare(
                oa.begin(), oa.end(), ob.begin(), ob.end(),
                [](const Object::value_type& x, const Object::value_type& y) {
                    if (x.first != y.first) return x.first < y.first;
                    return less_than(x.second, y.second);
                });
        }
    }
    return false;
}

auto field(std::string key) -> std::function<Node(const Node&)> {
    return [key = std::move(key)](const Node& item) -> Node {
        if (!item.is_object()) return Node{};
        const auto* value = item.as_object().get(key);
        return value ? *value : Node{};
    };
}

// =============================================================================
// Query
// =============================================================================

Query::Query(Array items) : items_{std::move(items)} {}

auto Query::where(Predicate pred) -> Query& {
    filters_.push_back(std::move(pred));
    return *this;
}

auto Query::sort(KeyFn key, bool reverse) -> Query& {
    sort_key_ = std::move(key);
    sort_reverse_ = reverse;
    return *this;
}

auto Query::limit(std::size_t n) -> Query& {
    limit_ = n;
    return *this;
}

auto Query::offset(std::size_t n) -> Query& {
    offset_ = n;
    return *this;
}

auto Query::execute() const -> Array {
    auto result = Array{};
    std::ranges::copy_if(items_, std::back_inserter(result), [&](const Node& item) {
        return std::ranges::all_of(filters_, [&](const Predicate& p) { return p(item); });
    });

    if (sort_key_) {
        auto keyed = std::vector<std::pair<Node, Node>>{};
        keyed.reserve(result.size());
        for (auto& item : result) {
            auto key = sort_key_(item);
            keyed.emplace_back(std::move(key), std::move(item));
        }
        std::ranges::stable_sort(keyed, [&](const auto& x, const auto& y) {
            return sort_reverse_ ? less_than(y.first, x.first) : less_than(x.first, y.first);
        });
        result.clear();
        for (auto& [key, item] : keyed) result.push_back(std::move(item));
    }

    if (offset_ >= result.size()) return {};
    result.erase(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(offset_));
    if (limit_ && *limit_ < result.size()) {
        result.resize(*limit_);
    }

    // Results never alias the queried items.
    auto out = Array{};
    out.reserve(result.size());
    for (const auto& item : result) out.push_back(deep_copy(item));
    return out;
}

auto Query::first() const -> std::optional<Node> {
    auto results = execute();
    if (results.empty()) return std::nullopt;
    return std::move(results.front());
}

auto Query::count() const -> std::size_t {
    return execute().size();
}

auto Query::pluck(std::string_view key) const -> Array {
    auto result = Array{};
    for (const auto& item : execute()) {
        if (!item.is_object()) continue;
        if (const auto* value = item.as_object().get(key)) result.push_back(*value);
    }
    return result;
}

auto Query::group_by(std::string_view key) const -> std::vector<Group> {
    auto groups = std::vector<Group>{};
    for (auto& item : execute()) {
        auto group_key = Node{};
        if (item.is_object()) {
            if (const auto* value = item.as_object().get(key)) group_key = *value;
        }
        auto it = std::ranges::find_if(groups, [&](const Group& g) {
            return equals(g.key, group_key);
        });
        if (it == groups.end()) {
            groups.push_back(Group{std::move(group_key), Array{std::move(item)}});
        } else {
            it->items.push_back(std::move(item));
        }
    }
    return groups;
}

}  // namespace datastore_cpp
