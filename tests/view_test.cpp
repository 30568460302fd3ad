#include <datastore-cpp/error.hpp>
#include <datastore-cpp/store.hpp>
#include <datastore-cpp/view.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>

using namespace datastore_cpp;

namespace {

auto site_store() -> DataStore {
    return DataStore{Node::object({
        {"site", Node::object({{"name", "My Blog"}, {"version.major", 2}})},
        {"posts", Node::array({Node::object({{"title", "First"}})})},
    })};
}

}  // anonymous namespace

TEST(NodeView, chained_subscripts_read_live_values) {
    auto store = site_store();
    auto view = store.view();
    EXPECT_EQ(view["site"]["name"].as<std::string>(), "My Blog");
    EXPECT_EQ(view["posts"]["0"]["title"].as<std::string>(), "First");
}

TEST(NodeView, subscript_key_is_literal) {
    auto store = site_store();
    EXPECT_EQ(store.view()["site"]["version.major"].as<std::int64_t>(), 2);
}

TEST(NodeView, missing_steps_give_absent_views) {
    auto store = site_store();
    auto missing = store.view()["nope"]["deeper"];
    EXPECT_FALSE(missing.exists());
    EXPECT_FALSE(missing.as<std::string>().has_value());
    EXPECT_FALSE(missing.has("x"));
    EXPECT_FALSE(missing.get("x").has_value());
    EXPECT_THROW((void)missing.node(), std::out_of_range);
}

TEST(NodeView, writes_land_in_the_store) {
    auto store = site_store();
    auto site = store.view()["site"];
    site.set("tagline", "Building things");
    EXPECT_EQ(store.get<std::string>("site.tagline"), "Building things");

    site.node().as_object().insert_or_assign("name", "Renamed");
    EXPECT_EQ(store.get<std::string>("site.name"), "Renamed");
}

TEST(NodeView, get_returns_live_reference) {
    auto store = site_store();
    auto site = store.view().get("site");
    ASSERT_TRUE(site.has_value());
    site->as_object().insert_or_assign("live", true);
    EXPECT_TRUE(store.has("site.live"));
}

TEST(NodeView, set_copies_the_value) {
    auto store = site_store();
    auto value = Node::object({{"k", 1}});
    store.view().set("extra", value);
    value.as_object().insert_or_assign("k", 2);
    EXPECT_EQ(store.get<std::int64_t>("extra.k"), 1);
}

TEST(NodeView, paths_are_validated) {
    auto store = site_store();
    auto view = store.view();
    EXPECT_THROW((void)view.get("a..b"), InvalidPathError);
    EXPECT_THROW(view.set(".a", 1), InvalidPathError);
    EXPECT_THROW((void)view.has(""), InvalidPathError);
}

TEST(NodeView, set_on_absent_view_throws) {
    auto store = site_store();
    EXPECT_THROW(store.view()["nope"].set("a", 1), std::out_of_range);
}
