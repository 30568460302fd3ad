// json_test.cpp: Tests for nlohmann/json interoperability

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/json.hpp>
#include <datastore-cpp/traversal.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace datastore_cpp;
using json = nlohmann::json;

// =============================================================================
// ADL to_json / from_json
// =============================================================================

TEST(JsonAdl, node_to_json) {
    auto node = Node::object({
        {"s", "text"}, {"i", 42}, {"d", 1.5}, {"b", true}, {"n", Node{}},
        {"a", Node::array({1, "two"})},
    });
    json j = node;
    EXPECT_EQ(j["s"], "text");
    EXPECT_EQ(j["i"], 42);
    EXPECT_DOUBLE_EQ(j["d"].get<double>(), 1.5);
    EXPECT_EQ(j["b"], true);
    EXPECT_TRUE(j["n"].is_null());
    EXPECT_EQ(j["a"], json::array({1, "two"}));
}

TEST(JsonAdl, json_to_node) {
    auto j = json::parse(R"({"a": {"b": [1, 2.5, "x", null, false]}})");
    auto node = j.get<Node>();
    const auto* b = find(node, Path{"a", "b"});
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(*b, Node::array({1, 2.5, "x", Node{}, false}));
    EXPECT_TRUE(b->as_array()[0].is_integer());
    EXPECT_TRUE(b->as_array()[1].is_real());
}

TEST(JsonAdl, large_unsigned_becomes_real) {
    auto j = json(std::numeric_limits<std::uint64_t>::max());
    auto node = j.get<Node>();
    EXPECT_TRUE(node.is_real());
}

TEST(JsonAdl, unsigned_in_range_stays_integer) {
    auto j = json(std::uint64_t{7});
    EXPECT_EQ(j.get<Node>(), Node{7});
    EXPECT_TRUE(j.get<Node>().is_integer());
}

TEST(JsonAdl, cyclic_node_throws) {
    auto node = Node::object();
    node.as_object().insert_or_assign("me", node);
    json j;
    EXPECT_THROW(to_json(j, node), CircularReferenceError);
    node.as_object().clear();
}

TEST(JsonAdl, diff_result_shape) {
    auto d = diff(Node::object({{"a", 1}, {"b", 2}}), Node::object({{"a", 5}, {"c", 3}}));
    json j = d;
    EXPECT_EQ(j["added"], (json{{"c", 3}}));
    EXPECT_EQ(j["removed"], (json{{"b", 2}}));
    EXPECT_EQ(j["changed"]["a"]["old"], 1);
    EXPECT_EQ(j["changed"]["a"]["new"], 5);
}

TEST(JsonAdl, stats_shape) {
    json j = stats(Node::object({{"a", Node::array({1})}}));
    EXPECT_EQ(j["object_count"], 1);
    EXPECT_EQ(j["array_count"], 1);
    EXPECT_EQ(j["leaf_count"], 1);
    EXPECT_EQ(j["max_depth"], 2);
    EXPECT_EQ(j["total_keys"], 1);
}

TEST(JsonAdl, store_to_json) {
    auto store = DataStore{};
    store.set("a.b", 1);
    json j = store;
    EXPECT_EQ(j, (json{{"a", {{"b", 1}}}}));
}

// =============================================================================
// Text
// =============================================================================

TEST(ParseJson, keeps_document_key_order) {
    auto node = parse_json(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    EXPECT_EQ(node.as_object().keys(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(ParseJson, scalar_documents) {
    EXPECT_EQ(parse_json("42"), Node{42});
    EXPECT_EQ(parse_json("\"s\""), Node{"s"});
    EXPECT_TRUE(parse_json("null").is_null());
}

TEST(ParseJson, malformed_text_throws_decode_error) {
    EXPECT_THROW((void)parse_json("{ bad json }"), JsonDecodeError);
    EXPECT_THROW((void)parse_json(""), JsonDecodeError);
    EXPECT_THROW((void)parse_json("[1, 2"), JsonDecodeError);
}

TEST(Dump, compact_and_indented) {
    auto node = Node::object({{"b", 1}, {"a", Node::array({true})}});
    EXPECT_EQ(dump(node, -1), R"({"b":1,"a":[true]})");
    EXPECT_EQ(dump(node, 2), "{\n  \"b\": 1,\n  \"a\": [\n    true\n  ]\n}");
}

TEST(Dump, parse_restores_the_same_tree) {
    auto node = Node::object({{"x", Node::object({{"y", Node::array({1.25, "z", Node{}})}})}});
    EXPECT_EQ(parse_json(dump(node)), node);
}

TEST(Dump, stream_operator_is_compact) {
    auto os = std::ostringstream{};
    os << Node::array({1, "a"});
    EXPECT_EQ(os.str(), R"([1,"a"])");
}
