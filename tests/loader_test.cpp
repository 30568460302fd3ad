#include <datastore-cpp/error.hpp>
#include <datastore-cpp/loader.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace datastore_cpp;
namespace fs = std::filesystem;

namespace {

class LoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string{"datastore_cpp_"} + info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        auto ec = std::error_code{};
        fs::remove_all(dir_, ec);
    }

    auto write(const fs::path& relative, const std::string& text) -> fs::path {
        auto path = dir_ / relative;
        fs::create_directories(path.parent_path());
        auto out = std::ofstream{path};
        out << text;
        return path;
    }

    static auto read(const fs::path& path) -> std::string {
        auto in = std::ifstream{path};
        auto buffer = std::ostringstream{};
        buffer << in.rdbuf();
        return buffer.str();
    }

    fs::path dir_;
};

}  // anonymous namespace

// -- load_file ----------------------------------------------------------------

TEST_F(LoaderTest, load_file_parses_document) {
    auto file = write("config.json", R"({"site": {"name": "My Blog"}, "posts": [1, 2]})");
    auto store = load_file(file);
    EXPECT_EQ(store.get<std::string>("site.name"), "My Blog");
    EXPECT_EQ(store.get<std::int64_t>("posts.1"), 2);
}

TEST_F(LoaderTest, missing_file_is_not_found) {
    EXPECT_THROW((void)load_file(dir_ / "nonexistent.json"), NotFoundError);
}

TEST_F(LoaderTest, invalid_json_is_a_decode_error) {
    auto file = write("bad.json", "{ bad json }");
    try {
        (void)load_file(file);
        FAIL() << "expected JsonDecodeError";
    } catch (const JsonDecodeError& e) {
        EXPECT_NE(std::string{e.what()}.find("bad.json"), std::string::npos);
    }
}

TEST_F(LoaderTest, base_dir_allows_files_inside) {
    auto file = write("safe/config.json", R"({"ok": true})");
    auto opts = LoadOptions{};
    opts.base_dir = dir_ / "safe";
    EXPECT_EQ(load_file(file, opts).get<bool>("ok"), true);
}

TEST_F(LoaderTest, base_dir_rejects_escaping_paths) {
    write("safe/config.json", "{}");
    auto secret = write("unsafe/secrets.json", R"({"password": "x"})");
    auto opts = LoadOptions{};
    opts.base_dir = dir_ / "safe";

    EXPECT_THROW((void)load_file(secret, opts), PathTraversalError);
    EXPECT_THROW((void)load_file(dir_ / "safe" / ".." / "unsafe" / "secrets.json", opts),
                 PathTraversalError);
}

TEST_F(LoaderTest, base_dir_is_matched_by_whole_components) {
    auto sibling = write("safe2/config.json", "{}");
    auto opts = LoadOptions{};
    opts.base_dir = dir_ / "safe";
    EXPECT_THROW((void)load_file(sibling, opts), PathTraversalError);
}

TEST_F(LoaderTest, max_size_rejects_large_files) {
    auto small = write("small.json", R"({"a": 1})");
    auto large = write("large.json", "{\"data\": \"" + std::string(2048, 'x') + "\"}");
    auto opts = LoadOptions{};
    opts.max_size = 1024;

    EXPECT_EQ(load_file(small, opts).get<std::int64_t>("a"), 1);
    EXPECT_THROW((void)load_file(large, opts), FileTooLargeError);
    EXPECT_NO_THROW((void)load_file(large));
}

// -- load_directory -----------------------------------------------------------

TEST_F(LoaderTest, load_directory_merges_in_filename_order) {
    write("conf/20-override.json", R"({"db": {"host": "prod"}, "features": ["b"]})");
    write("conf/10-base.json", R"({"db": {"host": "localhost", "port": 5432}, "features": ["a"]})");
    write("conf/readme.txt", "not json");

    auto store = load_directory(dir_ / "conf");
    EXPECT_EQ(store.get<std::string>("db.host"), "prod");
    EXPECT_EQ(store.get<std::int64_t>("db.port"), 5432);
    EXPECT_EQ(store.get("features"), Node::array({"b"}));
}

TEST_F(LoaderTest, load_directory_honours_pattern) {
    write("mixed/app.config.json", R"({"app": 1})");
    write("mixed/data.json", R"({"data": 1})");
    auto opts = LoadOptions{};
    opts.pattern = "*.config.json";

    auto store = load_directory(dir_ / "mixed", opts);
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"app"}));
}

TEST_F(LoaderTest, load_directory_skips_invalid_files) {
    write("mixed/valid.json", R"({"valid": true})");
    write("mixed/invalid.json", "{ bad json }");
    auto store = load_directory(dir_ / "mixed");
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"valid"}));
}

TEST_F(LoaderTest, load_directory_is_not_recursive) {
    write("tree/top.json", R"({"top": 1})");
    write("tree/nested/inner.json", R"({"inner": 1})");
    auto store = load_directory(dir_ / "tree");
    EXPECT_FALSE(store.has("inner"));
    EXPECT_TRUE(store.has("top"));
}

TEST_F(LoaderTest, load_directory_empty_match_gives_empty_store) {
    fs::create_directories(dir_ / "empty");
    EXPECT_EQ(load_directory(dir_ / "empty").size(), 0u);
}

TEST_F(LoaderTest, missing_directory_is_not_found) {
    EXPECT_THROW((void)load_directory(dir_ / "nonexistent_dir"), NotFoundError);
}

TEST_F(LoaderTest, load_directory_applies_size_limit_to_each_file) {
    write("sized/a.json", R"({"a": 1})");
    write("sized/b.json", "{\"b\": \"" + std::string(512, 'x') + "\"}");
    auto opts = LoadOptions{};
    opts.max_size = 100;
    EXPECT_THROW((void)load_directory(dir_ / "sized", opts), FileTooLargeError);
}

TEST_F(LoaderTest, load_directory_outside_base_dir_is_rejected) {
    fs::create_directories(dir_ / "safe");
    write("other/a.json", "{}");
    auto opts = LoadOptions{};
    opts.base_dir = dir_ / "safe";
    EXPECT_THROW((void)load_directory(dir_ / "other", opts), PathTraversalError);
}

// -- save_file ----------------------------------------------------------------

TEST_F(LoaderTest, save_file_creates_parents_and_round_trips) {
    auto store = DataStore{};
    store.set("site.name", "My Blog");
    store.set("site.tags", Node::array({"cpp"}));

    auto target = dir_ / "out" / "nested" / "saved.json";
    save_file(store, target);
    ASSERT_TRUE(fs::exists(target));
    EXPECT_EQ(load_file(target), store);
}

TEST_F(LoaderTest, save_file_honours_indent) {
    auto store = DataStore{};
    store.set("a", 1);
    auto target = dir_ / "compact.json";
    save_file(store, target, -1);
    EXPECT_EQ(read(target), R"({"a":1})");
}
