/// @file json.hpp
/// @brief nlohmann/json interoperability for datastore-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Node and the result
/// types, plus text parsing and dumping.

#pragma once

#include <datastore-cpp/introspect.hpp>
#include <datastore-cpp/merge.hpp>
#include <datastore-cpp/store.hpp>
#include <datastore-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace datastore_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Node ---------------------------------------------------------------------

/// Objects become JSON objects, arrays become arrays, scalars map
/// naturally. Use nlohmann::ordered_json to keep key insertion order.
/// @throws CircularReferenceError
void to_json(nlohmann::json& j, const Node& node);
void to_json(nlohmann::ordered_json& j, const Node& node);
void to_json(nlohmann::json& j, const Object& obj);
void to_json(nlohmann::ordered_json& j, const Object& obj);

/// Integers become int64 (unsigned values above INT64_MAX become double),
/// floats become double.
void from_json(const nlohmann::json& j, Node& node);
void from_json(const nlohmann::ordered_json& j, Node& node);

// -- Result types -------------------------------------------------------------

/// {"added": {...}, "removed": {...}, "changed": {path: {"old": .., "new": ..}}}
void to_json(nlohmann::json& j, const DiffResult& d);
void to_json(nlohmann::json& j, const Stats& s);
void to_json(nlohmann::json& j, const DataStore& store);

// =============================================================================
// Text
// =============================================================================

/// Parse JSON text into a Node, keeping the document's key order.
/// @throws JsonDecodeError carrying the parser message.
auto parse_json(std::string_view text) -> Node;

/// Serialize a Node as JSON text in key insertion order; indent < 0 gives
/// the compact form.
/// @throws CircularReferenceError
auto dump(const Node& node, int indent = 2) -> std::string;

/// Serialize a store's tree as JSON text.
auto dump(const DataStore& store, int indent = 2) -> std::string;

/// Stream a Node as compact JSON.
auto operator<<(std::ostream& os, const Node& node) -> std::ostream&;

}  // namespace datastore_cpp
