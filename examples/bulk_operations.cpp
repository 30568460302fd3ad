// bulk_operations: whole-tree updates, cleanup, transforms, diff and stats
//
// Build: cmake --build build
// Run:   ./build/bulk_operations

#include <datastore-cpp/datastore.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

namespace ds = datastore_cpp;

int main() {
    auto store = ds::DataStore{ds::parse_json(R"({
        "site": {"url": "http://example.com", "name": "Blog", "logo": null},
        "posts": [
            {"title": "First", "link": "http://example.com/first", "tags": []},
            {"title": "Second", "link": "https://example.com/second", "tags": ["cpp"]}
        ],
        "legacy": {}
    })")};
    const auto original = store;

    // -- Upgrade every http:// link -------------------------------------------
    auto upgraded = store.update_where(
        [](const std::string&, const ds::Node& v) {
            return v.is_string() && v.as_string().starts_with("http://");
        },
        [](const ds::Node& v) { return ds::Node{"https://" + v.as_string().substr(7)}; });
    std::printf("Upgraded %zu links\n", upgraded);

    // -- Cleanup --------------------------------------------------------------
    std::printf("Removed %zu nulls\n", store.remove_nulls());
    std::printf("Removed %zu empty containers\n", store.remove_empty());

    // -- Transformed copies ---------------------------------------------------
    auto shouting = store.transform_all([](const std::string& path, const ds::Node& v) {
        if (!path.ends_with("title") || !v.is_string()) return v;
        auto s = v.as_string();
        std::ranges::transform(s, s.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return ds::Node{s};
    });
    std::printf("Shouting title: %s\n", shouting.get<std::string>("posts.0.title")->c_str());

    auto prefixed = store.transform_keys([](const std::string& key) { return "cfg_" + key; });
    std::printf("Prefixed keys: %s\n", ds::dump(prefixed.root(), -1).c_str());

    // -- What changed ---------------------------------------------------------
    auto changes = original.diff(store);
    std::printf("\nAdded: %zu, removed: %zu, changed: %zu\n",
                changes.added.size(), changes.removed.size(), changes.changed.size());
    for (const auto& c : changes.changed) {
        std::printf("  ~ %s: %s -> %s\n", c.path.c_str(),
                    ds::dump(c.before, -1).c_str(), ds::dump(c.after, -1).c_str());
    }

    // -- Introspection --------------------------------------------------------
    auto s = store.stats();
    std::printf("\nKeys: %zu, depth: %zu, objects: %zu, arrays: %zu, leaves: %zu\n",
                s.total_keys, s.max_depth, s.object_count, s.array_count, s.leaf_count);
    std::printf("Structure:\n%s\n", ds::dump(store.describe()).c_str());
    return 0;
}
