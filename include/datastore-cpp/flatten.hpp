/// @file flatten.hpp
/// @brief Flatten a tree to a single-level path -> leaf mapping, and back.

#pragma once

#include <datastore-cpp/value.hpp>

#include <string_view>

namespace datastore_cpp {

/// Flatten a tree to a mapping of joined path to leaf value.
///
/// Only leaves (scalars, null included) contribute entries; arrays are
/// descended with their indices as segments ("posts.0.title"). Empty
/// containers contribute nothing, so their presence is lost. Each call
/// returns a fresh mapping in depth-first order.
/// @throws CircularReferenceError
auto flatten(const Node& root, std::string_view separator = ".") -> Object;

/// Rebuild a tree by assigning every entry of flat into an empty object.
///
/// Intermediate containers are always objects: an index segment produced
/// by flatten() comes back as an object key, which resolves to the same
/// leaf through find().
/// @throws InvalidPathError if a key is not a valid path for separator.
auto unflatten(const Object& flat, std::string_view separator = ".") -> Node;

}  // namespace datastore_cpp
