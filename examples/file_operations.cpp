// file_operations: loading, layering and saving JSON files
//
// Shows load_file with a sandbox and size limit, load_directory merging
// conf.d-style fragments in filename order, and save_file.
//
// Build: cmake --build build
// Run:   ./build/file_operations

#include <datastore-cpp/datastore.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace ds = datastore_cpp;
namespace fs = std::filesystem;

namespace {

void write_text(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    auto out = std::ofstream{path};
    out << text;
}

}  // anonymous namespace

int main() {
    const auto root = fs::temp_directory_path() / "datastore_cpp_file_operations";
    fs::remove_all(root);

    write_text(root / "conf.d" / "10-base.json",
               R"({"db": {"host": "localhost", "port": 5432}, "debug": false})");
    write_text(root / "conf.d" / "20-local.json", R"({"db": {"host": "db.internal"}})");
    write_text(root / "conf.d" / "30-broken.json", "{ not json");
    write_text(root / "secrets.json", R"({"password": "hunter2"})");

    auto opts = ds::LoadOptions{};
    opts.base_dir = root / "conf.d";
    opts.max_size = 64 * 1024;

    try {
        auto config = ds::load_directory(root / "conf.d", opts);
        std::printf("Merged config:\n%s\n", ds::dump(config).c_str());

        // -- Sandbox ----------------------------------------------------------
        try {
            (void)ds::load_file(root / "conf.d" / ".." / "secrets.json", opts);
        } catch (const ds::PathTraversalError& e) {
            std::printf("\nBlocked: %s\n", e.what());
        }

        // -- Save and reload --------------------------------------------------
        config.set("db.pool_size", 8);
        const auto out = root / "out" / "effective.json";
        ds::save_file(config, out);
        auto reloaded = ds::load_file(out);
        std::printf("\nReloaded equals saved: %s\n", reloaded == config ? "yes" : "no");
    } catch (const ds::Exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }

    fs::remove_all(root);
    return 0;
}
