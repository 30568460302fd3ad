// Fuzz target for path parsing: exercises separator placement and
// blank-input edge cases in parse_path and parse_pattern.

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        auto segments = datastore_cpp::parse_path(text);
        // A parsed path must re-join and re-parse to the same segments.
        auto again = datastore_cpp::parse_path(datastore_cpp::join_path(segments));
        if (again != segments) __builtin_trap();
    } catch (const datastore_cpp::InvalidPathError&) {
        // Expected for malformed input
    }

    try {
        auto pattern = datastore_cpp::parse_pattern(text);
        (void)pattern;
    } catch (const datastore_cpp::InvalidPathError&) {
    }

    return 0;
}
