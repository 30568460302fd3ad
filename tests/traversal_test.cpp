#include <datastore-cpp/error.hpp>
#include <datastore-cpp/traversal.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace datastore_cpp;

namespace {

auto sample() -> Node {
    return Node::object({
        {"site", Node::object({{"name", "My Blog"}, {"url", "https://example.com"}})},
        {"posts", Node::array({
            Node::object({{"title", "First"}, {"views", 150}}),
            Node::object({{"title", "Second"}, {"views", 89}}),
        })},
        {"empty", Node{}},
    });
}

}  // anonymous namespace

// -- find ---------------------------------------------------------------------

TEST(Find, resolves_object_keys) {
    auto root = sample();
    const auto* name = find(root, Path{"site", "name"});
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->as_string(), "My Blog");
}

TEST(Find, numeric_segment_indexes_arrays) {
    auto root = sample();
    const auto* title = find(root, Path{"posts", "1", "title"});
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->as_string(), "Second");
}

TEST(Find, numeric_segment_is_a_key_in_objects) {
    auto root = Node::object({{"0", "zero"}, {"10", "ten"}});
    const auto* ten = find(root, Path{"10"});
    ASSERT_NE(ten, nullptr);
    EXPECT_EQ(ten->as_string(), "ten");
}

TEST(Find, absent_paths_return_null) {
    auto root = sample();
    EXPECT_EQ(find(root, Path{"missing"}), nullptr);
    EXPECT_EQ(find(root, Path{"posts", "5"}), nullptr);
    EXPECT_EQ(find(root, Path{"posts", "first"}), nullptr);
    EXPECT_EQ(find(root, Path{"posts", "-1"}), nullptr);
    EXPECT_EQ(find(root, Path{"site", "name", "deeper"}), nullptr);
}

TEST(Find, null_value_is_found) {
    auto root = sample();
    const auto* empty = find(root, Path{"empty"});
    ASSERT_NE(empty, nullptr);
    EXPECT_TRUE(empty->is_null());
}

TEST(Find, empty_path_is_root) {
    auto root = sample();
    EXPECT_EQ(find(root, Path{}), &root);
}

TEST(Contains, matches_find) {
    auto root = sample();
    EXPECT_TRUE(contains(root, Path{"posts", "0"}));
    EXPECT_TRUE(contains(root, Path{"empty"}));
    EXPECT_FALSE(contains(root, Path{"posts", "2"}));
}

// -- assign -------------------------------------------------------------------

TEST(Assign, creates_missing_intermediate_objects) {
    auto root = Node::object();
    assign(root, Path{"a", "b", "c"}, 1);
    const auto* c = find(root, Path{"a", "b", "c"});
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->as_integer(), 1);
    EXPECT_TRUE(find(root, Path{"a", "b"})->is_object());
}

TEST(Assign, numeric_segment_creates_object_key_not_array) {
    auto root = Node::object();
    assign(root, Path{"items", "0"}, "x");
    const auto* items = find(root, Path{"items"});
    ASSERT_NE(items, nullptr);
    EXPECT_TRUE(items->is_object());
    EXPECT_TRUE(items->as_object().contains("0"));
}

TEST(Assign, overwrites_existing_value) {
    auto root = sample();
    assign(root, Path{"site", "name"}, "Renamed");
    EXPECT_EQ(find(root, Path{"site", "name"})->as_string(), "Renamed");
}

TEST(Assign, replaces_array_element_in_range) {
    auto root = sample();
    assign(root, Path{"posts", "0", "views"}, 151);
    EXPECT_EQ(find(root, Path{"posts", "0", "views"})->as_integer(), 151);
    assign(root, Path{"posts", "1"}, "flattened");
    EXPECT_EQ(find(root, Path{"posts", "1"})->as_string(), "flattened");
}

TEST(Assign, array_index_out_of_range_throws) {
    auto root = sample();
    EXPECT_THROW(assign(root, Path{"posts", "2"}, 1), TypeMismatchError);
    EXPECT_EQ(find(root, Path{"posts"})->size(), 2u);
}

TEST(Assign, non_integer_array_step_throws) {
    auto root = sample();
    EXPECT_THROW(assign(root, Path{"posts", "first", "title"}, 1), TypeMismatchError);
}

TEST(Assign, scalar_intermediate_throws) {
    auto root = sample();
    EXPECT_THROW(assign(root, Path{"site", "name", "first"}, 1), TypeMismatchError);
    EXPECT_EQ(find(root, Path{"site", "name"})->as_string(), "My Blog");
}

TEST(Assign, null_intermediate_throws) {
    auto root = sample();
    EXPECT_THROW(assign(root, Path{"empty", "child"}, 1), TypeMismatchError);
}

TEST(Assign, scalar_root_throws) {
    auto root = Node{5};
    EXPECT_THROW(assign(root, Path{"a"}, 1), TypeMismatchError);
}

TEST(Assign, empty_path_is_invalid) {
    auto root = Node::object();
    EXPECT_THROW(assign(root, Path{}, 1), InvalidPathError);
}

TEST(Assign, error_message_names_the_blocking_prefix) {
    auto root = sample();
    try {
        assign(root, Path{"site", "name", "first"}, 1);
        FAIL() << "expected TypeMismatchError";
    } catch (const TypeMismatchError& e) {
        EXPECT_NE(std::string{e.what()}.find("site.name"), std::string::npos);
    }
}

// -- erase --------------------------------------------------------------------

TEST(Erase, removes_object_key) {
    auto root = sample();
    EXPECT_TRUE(erase(root, Path{"site", "url"}));
    EXPECT_FALSE(contains(root, Path{"site", "url"}));
    EXPECT_TRUE(contains(root, Path{"site", "name"}));
}

TEST(Erase, removes_array_element_and_shifts) {
    auto root = sample();
    EXPECT_TRUE(erase(root, Path{"posts", "0"}));
    EXPECT_EQ(find(root, Path{"posts"})->size(), 1u);
    EXPECT_EQ(find(root, Path{"posts", "0", "title"})->as_string(), "Second");
}

TEST(Erase, is_idempotent) {
    auto root = sample();
    EXPECT_TRUE(erase(root, Path{"site"}));
    EXPECT_FALSE(erase(root, Path{"site"}));
}

TEST(Erase, absent_or_impossible_paths_return_false) {
    auto root = sample();
    EXPECT_FALSE(erase(root, Path{"nope", "deeper"}));
    EXPECT_FALSE(erase(root, Path{"posts", "9"}));
    EXPECT_FALSE(erase(root, Path{"site", "name", "x"}));
    EXPECT_FALSE(erase(root, Path{}));
}
