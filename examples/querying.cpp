// querying: filter, sort, paginate and group an array held in a store
//
// Build: cmake --build build
// Run:   ./build/querying

#include <datastore-cpp/datastore.hpp>

#include <cstdio>
#include <string>

namespace ds = datastore_cpp;

namespace {

auto is_published(const ds::Node& post) -> bool {
    return ds::get_scalar<bool>(post.as_object().at("published")).value_or(false);
}

void print_titles(const char* heading, const ds::Array& posts) {
    std::printf("%s\n", heading);
    for (const auto& post : posts) {
        std::printf("  %s (%s views)\n",
                    post.as_object().at("title").as_string().c_str(),
                    ds::dump(post.as_object().at("views"), -1).c_str());
    }
}

}  // anonymous namespace

int main() {
    auto store = ds::DataStore{ds::parse_json(R"({"posts": [
        {"title": "Intro to C++", "category": "tech", "views": 150, "published": true},
        {"title": "Morning Routines", "category": "life", "views": 89, "published": true},
        {"title": "Draft Ideas", "category": "tech", "views": 0, "published": false},
        {"title": "Templates", "category": "tech", "views": 320, "published": true},
        {"title": "Travel Notes", "category": "life", "views": 210, "published": true}
    ]})")};

    auto top = store.query("posts")
        .where(is_published)
        .sort(ds::field("views"), true)
        .limit(3)
        .execute();
    print_titles("Top 3 published:", top);

    auto page_two = store.query("posts").sort(ds::field("title")).offset(2).limit(2).execute();
    print_titles("\nPage 2 by title:", page_two);

    std::printf("\nPublished count: %zu\n", store.query("posts").where(is_published).count());

    std::printf("\nBy category:\n");
    for (const auto& group : store.query("posts").group_by("category")) {
        std::printf("  %s: %zu posts\n", group.key.as_string().c_str(), group.items.size());
    }

    auto titles = store.query("posts").where(is_published).pluck("title");
    std::printf("\nPublished titles: %s\n", ds::dump(ds::Node{titles}, -1).c_str());

    auto drafts = store.filter_list("posts", [](const ds::Node& p) { return !is_published(p); });
    print_titles("\nDrafts:", drafts);
    return 0;
}
