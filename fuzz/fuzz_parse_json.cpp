// Fuzz target for JSON import: parse arbitrary bytes, then dump and
// re-parse whatever was accepted.

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/json.hpp>
#include <datastore-cpp/merge.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        auto node = datastore_cpp::parse_json(text);
        auto reparsed = datastore_cpp::parse_json(datastore_cpp::dump(node, -1));
        (void)datastore_cpp::equals(node, reparsed);
    } catch (const datastore_cpp::JsonDecodeError&) {
        // Expected for malformed input
    }

    return 0;
}
