// datastore-cpp benchmarks: throughput of path access, search and merge.

#include <datastore-cpp/datastore.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

using namespace datastore_cpp;

// Object of n posts under "posts", each with a nested author and tag list.
static auto make_store(std::int64_t n) -> DataStore {
    auto posts = Array{};
    posts.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        posts.push_back(Node::object({
            {"id", i},
            {"title", "post " + std::to_string(i)},
            {"author", Node::object({{"name", "user" + std::to_string(i % 7)}})},
            {"tags", Node::array({"a", "b"})},
            {"views", i * 3},
        }));
    }
    auto store = DataStore{};
    store.set("site.name", "bench");
    store.set("posts", Node{std::move(posts)});
    return store;
}

// =============================================================================
// Path access
// =============================================================================

static void bm_get_nested(benchmark::State& state) {
    auto store = make_store(100);
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.get("posts.50.author.name"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get_nested);

static void bm_set_nested(benchmark::State& state) {
    auto store = DataStore{};
    std::int64_t i = 0;
    for (auto _ : state) {
        store.set("a.b.c.d", i++);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_nested);

static void bm_parse_path(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(parse_path("site.posts.12.author.name"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_path);

// =============================================================================
// Search and flatten
// =============================================================================

static void bm_find_paths_wildcard(benchmark::State& state) {
    auto store = make_store(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.find_paths("posts.*.author.name"));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_find_paths_wildcard)->Range(10, 1000);

static void bm_find_paths_recursive(benchmark::State& state) {
    auto store = make_store(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.find_paths("**.name"));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_find_paths_recursive)->Range(10, 1000);

static void bm_flatten(benchmark::State& state) {
    auto store = make_store(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.flatten());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_flatten)->Range(10, 1000);

// =============================================================================
// Query
// =============================================================================

static void bm_query_sort_limit(benchmark::State& state) {
    auto store = make_store(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            store.query("posts").sort(field("views"), true).limit(10).execute());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_query_sort_limit)->Range(10, 1000);

// =============================================================================
// Copy, merge and diff
// =============================================================================

static void bm_deep_copy(benchmark::State& state) {
    auto store = make_store(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(deep_copy(store.root()));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_deep_copy)->Range(10, 1000);

static void bm_merge(benchmark::State& state) {
    auto base = make_store(state.range(0));
    auto overlay = Node::object({
        {"site", Node::object({{"name", "merged"}, {"theme", "dark"}})},
        {"extra", Node::object({{"a", 1}, {"b", 2}})},
    });
    for (auto _ : state) {
        benchmark::DoNotOptimize(merge(base.root(), overlay));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_merge)->Range(10, 1000);

static void bm_diff(benchmark::State& state) {
    auto before = make_store(state.range(0));
    auto after = before;
    after.set("site.name", "changed");
    after.set("site.theme", "dark");
    for (auto _ : state) {
        benchmark::DoNotOptimize(before.diff(after));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_diff)->Range(10, 1000);
