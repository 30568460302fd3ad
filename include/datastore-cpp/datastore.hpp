/// @file datastore.hpp
/// @brief Umbrella header for the datastore-cpp library.
///
/// Include this single header for access to all public types:
/// DataStore, NodeView, Node, Query, Path, the free traversal, pattern,
/// merge/diff and transform functions, JSON interop, the loader, and Error.

#pragma once

#include <datastore-cpp/cycle_guard.hpp>
#include <datastore-cpp/error.hpp>
#include <datastore-cpp/flatten.hpp>
#include <datastore-cpp/introspect.hpp>
#include <datastore-cpp/json.hpp>
#include <datastore-cpp/loader.hpp>
#include <datastore-cpp/merge.hpp>
#include <datastore-cpp/path.hpp>
#include <datastore-cpp/pattern.hpp>
#include <datastore-cpp/query.hpp>
#include <datastore-cpp/store.hpp>
#include <datastore-cpp/transform.hpp>
#include <datastore-cpp/traversal.hpp>
#include <datastore-cpp/value.hpp>
#include <datastore-cpp/view.hpp>
