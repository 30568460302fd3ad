#include <datastore-cpp/json.hpp>

#include <datastore-cpp/cycle_guard.hpp>
#include <datastore-cpp/error.hpp>
#include <datastore-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <ostream>
#include <string>
#include <variant>

namespace datastore_cpp {

namespace {

// =============================================================================
// Node <-> basic_json, shared by json and ordered_json
// =============================================================================

template <typename Json>
auto export_recursive(const Node& node, CycleGuard& guard, const std::string& where) -> Json {
    auto scope = guard.enter(node, where);
    return std::visit(overload{
        [](Null) -> Json { return nullptr; },
        [](bool b) -> Json { return b; },
        [](std::int64_t i) -> Json { return i; },
        [](double d) -> Json { return d; },
        [](const std::string& s) -> Json { return s; },
        [&](const std::shared_ptr<Object>& obj) -> Json {
            auto j = Json::object();
            for (const auto& [key, child] : *obj) {
                j[key] = export_recursive<Json>(child, guard, append_path(where, key));
            }
            return j;
        },
        [&](const std::shared_ptr<Array>& arr) -> Json {
            auto j = Json::array();
            for (std::size_t i = 0; i < arr->size(); ++i) {
                j.push_back(export_recursive<Json>((*arr)[i], guard,
                                                   append_path(where, std::to_string(i))));
            }
            return j;
        },
    }, node.storage());
}

template <typename Json>
auto export_node(const Node& node) -> Json {
    auto guard = CycleGuard{};
    return export_recursive<Json>(node, guard, {});
}

template <typename Json>
auto import_node(const Json& val) -> Node {
    if (val.is_object()) {
        auto obj = Object{};
        for (const auto& [k, v] : val.items()) {
            obj.insert_or_assign(k, import_node(v));
        }
        return Node{std::move(obj)};
    }
    if (val.is_array()) {
        auto arr = Array{};
        arr.reserve(val.size());
        for (const auto& v : val) {
            arr.push_back(import_node(v));
        }
        return Node{std::move(arr)};
    }
    if (val.is_string()) return Node{val.template get<std::string>()};
    if (val.is_number_unsigned()) {
        auto u = val.template get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Node{static_cast<std::int64_t>(u)};
        }
        return Node{static_cast<double>(u)};
    }
    if (val.is_number_integer()) return Node{val.template get<std::int64_t>()};
    if (val.is_number_float()) return Node{val.template get<double>()};
    if (val.is_boolean()) return Node{val.template get<bool>()};
    if (val.is_null()) return Node{};
    throw JsonDecodeError{std::string{"unsupported JSON value of type "} + val.type_name()};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Node& node) {
    j = export_node<nlohmann::json>(node);
}

void to_json(nlohmann::ordered_json& j, const Node& node) {
    j = export_node<nlohmann::ordered_json>(node);
}

void to_json(nlohmann::json& j, const Object& obj) {
    j = export_node<nlohmann::json>(Node{obj});
}

void to_json(nlohmann::ordered_json& j, const Object& obj) {
    j = export_node<nlohmann::ordered_json>(Node{obj});
}

void from_json(const nlohmann::json& j, Node& node) {
    node = import_node(j);
}

void from_json(const nlohmann::ordered_json& j, Node& node) {
    node = import_node(j);
}

void to_json(nlohmann::json& j, const DiffResult& d) {
    auto changed = nlohmann::json::object();
    for (const auto& c : d.changed) {
        changed[c.path] = nlohmann::json{{"old", c.before}, {"new", c.after}};
    }
    j = nlohmann::json{
        {"added", d.added},
        {"removed", d.removed},
        {"changed", std::move(changed)},
    };
}

void to_json(nlohmann::json& j, const Stats& s) {
    j = nlohmann::json{
        {"total_keys", s.total_keys},
        {"max_depth", s.max_depth},
        {"object_count", s.object_count},
        {"array_count", s.array_count},
        {"leaf_count", s.leaf_count},
    };
}

void to_json(nlohmann::json& j, const DataStore& store) {
    to_json(j, store.root());
}

// =============================================================================
// Text
// =============================================================================

auto parse_json(std::string_view text) -> Node {
    try {
        return import_node(nlohmann::ordered_json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        throw JsonDecodeError{e.what()};
    }
}

auto dump(const Node& node, int indent) -> std::string {
    return export_node<nlohmann::ordered_json>(node).dump(indent);
}

auto dump(const DataStore& store, int indent) -> std::string {
    return dump(store.root(), indent);
}

auto operator<<(std::ostream& os, const Node& node) -> std::ostream& {
    return os << dump(node, -1);
}

}  // namespace datastore_cpp
