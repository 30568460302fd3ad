#include <datastore-cpp/path.hpp>

#include <datastore-cpp/error.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace datastore_cpp {

namespace {

[[noreturn]] void reject(std::string_view path, std::string_view reason) {
    throw InvalidPathError{"invalid path \"" + std::string{path} + "\": " + std::string{reason}};
}

auto is_blank(std::string_view s) -> bool {
    return std::ranges::all_of(s, [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

}  // anonymous namespace

auto parse_path(std::string_view path, std::string_view separator) -> Path {
    if (separator.empty()) throw InvalidPathError{"path separator must not be empty"};
    if (is_blank(path)) reject(path, "path is empty");
    if (path == separator) reject(path, "path is a lone separator");
    if (path.starts_with(separator)) reject(path, "leading separator");
    if (path.ends_with(separator)) reject(path, "trailing separator");

    auto segments = Path{};
    auto start = std::size_t{0};
    while (true) {
        auto pos = path.find(separator, start);
        auto segment = path.substr(start, pos == std::string_view::npos ? pos : pos - start);
        if (segment.empty()) reject(path, "consecutive separators");
        segments.emplace_back(segment);
        if (pos == std::string_view::npos) break;
        start = pos + separator.size();
    }
    return segments;
}

auto parse_pattern(std::string_view pattern) -> Path {
    return parse_path(pattern);
}

auto join_path(const Path& segments, std::string_view separator) -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += separator;
        result += segments[i];
    }
    return result;
}

auto append_path(std::string_view prefix, std::string_view segment,
                 std::string_view separator) -> std::string {
    auto result = std::string{prefix};
    if (!result.empty()) result += separator;
    result += segment;
    return result;
}

auto try_parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    if (!std::ranges::all_of(segment, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

}  // namespace datastore_cpp
