/// @file loader.hpp
/// @brief Reading stores from JSON files and directories, and saving them.
///
/// The only part of datastore-cpp that touches the filesystem. Everything
/// else works on in-memory trees.
///
/// @code
/// auto opts = LoadOptions{};
/// opts.base_dir = "/srv/config";
/// opts.max_size = 1 << 20;
/// auto store = load_directory("/srv/config/conf.d", opts);
/// save_file(store, "/srv/config/merged.json");
/// @endcode

#pragma once

#include <datastore-cpp/store.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace datastore_cpp {

/// Options shared by load_file and load_directory.
struct LoadOptions {
    /// Reject any file that does not resolve to a location inside this
    /// directory (symlinks and ".." included).
    std::optional<std::filesystem::path> base_dir;

    /// Reject any file larger than this many bytes, before reading it.
    std::optional<std::uintmax_t> max_size;

    /// Filename glob used by load_directory (fnmatch syntax).
    std::string pattern = "*.json";
};

/// Load one JSON document into a new store.
/// @throws NotFoundError, PathTraversalError, FileTooLargeError,
///         JsonDecodeError, IoError
auto load_file(const std::filesystem::path& file, const LoadOptions& options = {}) -> DataStore;

/// Load every regular file in dir whose name matches options.pattern,
/// in filename order, deep-merging each into the result.
///
/// Not recursive. An empty match set gives an empty store. Files that are
/// not valid JSON are skipped with a warning.
/// @throws NotFoundError, PathTraversalError, FileTooLargeError, IoError
auto load_directory(const std::filesystem::path& dir, const LoadOptions& options = {}) -> DataStore;

/// Write the store as JSON text, creating missing parent directories.
/// @throws IoError
void save_file(const DataStore& store, const std::filesystem::path& file, int indent = 2);

}  // namespace datastore_cpp
