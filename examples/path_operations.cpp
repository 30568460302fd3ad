// path_operations: wildcard search, flattening, and structure listing
//
// Build: cmake --build build
// Run:   ./build/path_operations

#include <datastore-cpp/datastore.hpp>

#include <cstdio>
#include <string>

namespace ds = datastore_cpp;

int main() {
    auto store = ds::DataStore{ds::parse_json(R"({
        "site": {"name": "My Blog", "url": "https://example.com"},
        "posts": [
            {"title": "First Post", "author": {"name": "Alice"}, "url": "http://example.com/1"},
            {"title": "Second Post", "author": {"name": "Bob"}, "url": "https://example.com/2"}
        ]
    })")};

    std::printf("Every post title:\n");
    for (const auto& path : store.find_paths("posts.*.title")) {
        std::printf("  %s = %s\n", path.c_str(), store.get<std::string>(path)->c_str());
    }

    std::printf("\nEvery 'name' at any depth:\n");
    for (const auto& [path, value] : store.find_all_keys("name")) {
        std::printf("  %s = %s\n", path.c_str(), value.as_string().c_str());
    }

    std::printf("\nInsecure links:\n");
    auto insecure = store.find_values([](const std::string&, const ds::Node& v) {
        return v.is_string() && v.as_string().starts_with("http://");
    });
    for (const auto& [path, value] : insecure) {
        std::printf("  %s\n", path.c_str());
    }

    std::printf("\nFlattened:\n");
    for (const auto& [path, value] : store.flatten()) {
        std::printf("  %s: %s\n", path.c_str(), ds::dump(value, -1).c_str());
    }

    std::printf("\nPaths under posts.0:\n");
    for (const auto& path : store.list_paths("posts.0")) {
        std::printf("  %s\n", path.c_str());
    }

    auto rebuilt = ds::unflatten(ds::flatten(store.root(), "/"), "/");
    std::printf("\nRebuilt from '/'-separated flat map:\n%s\n", ds::dump(rebuilt).c_str());
    return 0;
}
