/// @file query.hpp
/// @brief In-memory filter/sort/paginate/group over an already resolved array.
///
/// @code
/// auto top = store.query("posts")
///     .where([](const Node& p) { return get_scalar<bool>(p.as_object().at("published")).value_or(false); })
///     .sort(field("views"), true)
///     .limit(3)
///     .execute();
/// @endcode

#pragma once

#include <datastore-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datastore_cpp {

/// Strict weak ordering over all Nodes, used by Query::sort.
///
/// null < boolean < number < string < array < object. Numbers compare by
/// value across integer and real, strings and arrays lexicographically,
/// objects by size and then entry by entry.
auto less_than(const Node& a, const Node& b) -> bool;

/// Key extractor returning the value of key for objects that have it, null
/// otherwise.
auto field(std::string key) -> std::function<Node(const Node&)>;

/// One group produced by Query::group_by.
struct Group {
    Node key;           ///< The shared value of the grouping field.
    Array items;        ///< Items in original order.
};

/// A chainable query over a private copy of an array.
///
/// Stages always apply in the same order regardless of call order:
/// every where() predicate (logical AND), then sort() (stable), then
/// offset(), then limit().
class Query {
public:
    using Predicate = std::function<bool(const Node&)>;
    using KeyFn = std::function<Node(const Node&)>;

    /// Take ownership of the items to query.
    explicit Query(Array items);

    /// Keep only items for which pred holds.
    auto where(Predicate pred) -> Query&;

    /// Order items by key(item); stable, so equal keys keep their order.
    auto sort(KeyFn key, bool reverse = false) -> Query&;

    /// Keep at most n items.
    auto limit(std::size_t n) -> Query&;

    /// Skip the first n items.
    auto offset(std::size_t n) -> Query&;

    /// Run the query.
    auto execute() const -> Array;

    /// The first result, or nullopt when there is none.
    auto first() const -> std::optional<Node>;

    /// Number of results.
    auto count() const -> std::size_t;

    /// Value of key from every result that is an object containing key.
    auto pluck(std::string_view key) const -> Array;

    /// Results grouped by the value of key, groups in first-seen order.
    /// Items that are not objects or lack key are grouped under null.
    auto group_by(std::string_view key) const -> std::vector<Group>;

private:
    Array items_;
    std::vector<Predicate> filters_;
    KeyFn sort_key_;
    bool sort_reverse_{false};
    std::size_t offset_{0};
    std::optional<std::size_t> limit_;
};

}  // namespace datastore_cpp
