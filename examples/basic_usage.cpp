// basic_usage: demonstrates the core datastore-cpp API
//
// Shows building a store, dotted-path get/set/has/remove, typed get<T>(),
// defaults, the live view, merging, and JSON dumping.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <datastore-cpp/datastore.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace ds = datastore_cpp;

int main() {
    auto store = ds::DataStore{ds::Node::object({
        {"site", ds::Node::object({{"name", "My Blog"}, {"url", "https://example.com"}})},
        {"settings", ds::Node::object({{"theme", "dark"}, {"posts_per_page", 10}})},
    })};

    // -- Typed reads ----------------------------------------------------------
    if (auto name = store.get<std::string>("site.name")) {
        std::printf("Site: %s\n", name->c_str());
    }
    auto per_page = store.get<std::int64_t>("settings.posts_per_page").value_or(20);
    std::printf("Posts per page: %lld\n", static_cast<long long>(per_page));

    // -- Defaults for absent paths --------------------------------------------
    auto lang = store.get("settings.language", "en");
    std::printf("Language: %s\n", lang.as_string().c_str());

    // -- Writes create intermediate objects -----------------------------------
    store.set("site.social.twitter", "@myblog");
    store.set("site.social.github", "myblog");
    std::printf("Has social links: %s\n", store.has("site.social") ? "yes" : "no");

    // -- Removal is idempotent ------------------------------------------------
    std::printf("Removed url: %s\n", store.remove("site.url") ? "yes" : "no");
    std::printf("Removed again: %s\n", store.remove("site.url") ? "yes" : "no");

    // -- Live view for attribute-style access ---------------------------------
    auto site = store.view()["site"];
    site.set("tagline", "Building things");
    if (auto tagline = site["tagline"].as<std::string>()) {
        std::printf("Tagline: %s\n", tagline->c_str());
    }

    // -- Merge another tree in ------------------------------------------------
    store.merge(ds::Node::object({{"settings", ds::Node::object({{"theme", "light"}})}}));
    std::printf("Theme after merge: %s\n", store.get<std::string>("settings.theme")->c_str());

    // -- Malformed paths are rejected -----------------------------------------
    try {
        store.get("site..name");
    } catch (const ds::InvalidPathError& e) {
        std::printf("Rejected: %s\n", e.what());
    }

    std::printf("\n%s\n", ds::dump(store).c_str());
    return 0;
}
