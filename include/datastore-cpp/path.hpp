/// @file path.hpp
/// @brief Dotted path strings: parsing, validation, joining.
///
/// The textual grammar is the one wire format for every path-taking entry
/// point: segments joined by '.', at least one segment, no empty segment.
/// "a.b.2.c" is four segments. A segment is never typed at parse time;
/// whether "2" is a key or an index is decided by the container reached
/// during traversal.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace datastore_cpp {

/// A parsed path: one string per segment, never empty.
using Path = std::vector<std::string>;

/// Matches exactly one segment in a pattern.
inline constexpr std::string_view wildcard_one = "*";

/// Matches zero or more segments in a pattern.
inline constexpr std::string_view wildcard_any = "**";

/// Split a dotted path into segments.
///
/// @param path The path string.
/// @param separator Segment separator; "." everywhere except flatten keys.
/// @throws InvalidPathError if the string is empty or whitespace-only,
///   equals ".", starts or ends with '.', or contains "..".
auto parse_path(std::string_view path, std::string_view separator = ".") -> Path;

/// Split a dotted pattern into segments.
///
/// Same grammar as parse_path; "*" and "**" segments are wildcards.
/// @throws InvalidPathError on the same conditions as parse_path.
auto parse_pattern(std::string_view pattern) -> Path;

/// Join segments with a separator ("." by default).
auto join_path(const Path& segments, std::string_view separator = ".") -> std::string;

/// Append one segment to a joined path string.
auto append_path(std::string_view prefix, std::string_view segment,
                 std::string_view separator = ".") -> std::string;

/// Try to read a segment as a sequence index.
///
/// Accepts all-digit segments (leading zeros allowed); rejects signs,
/// whitespace, and anything that overflows size_t.
auto try_parse_index(std::string_view segment) -> std::optional<std::size_t>;

}  // namespace datastore_cpp
