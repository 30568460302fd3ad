#include <datastore-cpp/loader.hpp>

#include <datastore-cpp/error.hpp>
#include <datastore-cpp/json.hpp>

#include <glog/logging.h>

#include <fnmatch.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace datastore_cpp {

namespace fs = std::filesystem;

namespace {

auto resolve(const fs::path& p) -> fs::path {
    auto ec = std::error_code{};
    auto absolute = fs::absolute(p, ec);
    if (ec) throw IoError{"cannot resolve " + p.string() + ": " + ec.message()};
    auto resolved = fs::weakly_canonical(absolute, ec);
    if (ec) throw IoError{"cannot resolve " + p.string() + ": " + ec.message()};
    // weakly_canonical keeps a trailing separator on non-existent paths
    if (!resolved.has_filename() && resolved.has_relative_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

void check_sandbox(const fs::path& target, const LoadOptions& options) {
    if (!options.base_dir) return;

    auto base = resolve(*options.base_dir);
    auto resolved = resolve(target);
    auto mismatch = std::mismatch(base.begin(), base.end(), resolved.begin(), resolved.end());
    if (mismatch.first != base.end()) {
        LOG(WARNING) << "rejected " << target << ": outside base directory " << base;
        throw PathTraversalError{"path " + target.string() +
                                 " resolves outside base directory " + base.string()};
    }
}

void check_size(const fs::path& file, const LoadOptions& options) {
    if (!options.max_size) return;

    auto ec = std::error_code{};
    auto size = fs::file_size(file, ec);
    if (ec) throw IoError{"cannot stat " + file.string() + ": " + ec.message()};
    if (size > *options.max_size) {
        LOG(WARNING) << "rejected " << file << ": " << size << " bytes exceeds limit of "
                     << *options.max_size;
        throw FileTooLargeError{"file " + file.string() + " is " + std::to_string(size) +
                                " bytes, limit is " + std::to_string(*options.max_size)};
    }
}

auto read_text(const fs::path& file) -> std::string {
    auto in = std::ifstream{file, std::ios::binary};
    if (!in) throw IoError{"cannot open " + file.string()};
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    if (in.bad()) throw IoError{"cannot read " + file.string()};
    return buffer.str();
}

// Checks, reads and parses one file; JsonDecodeError carries the file name.
auto read_document(const fs::path& file, const LoadOptions& options) -> Node {
    check_sandbox(file, options);

    auto ec = std::error_code{};
    if (!fs::is_regular_file(file, ec)) {
        throw NotFoundError{"file not found: " + file.string()};
    }
    check_size(file, options);

    auto text = read_text(file);
    VLOG(1) << "read " << file << " (" << text.size() << " bytes)";
    try {
        return parse_json(text);
    } catch (const JsonDecodeError& e) {
        throw JsonDecodeError{file.string() + ": " + e.what()};
    }
}

}  // anonymous namespace

auto load_file(const fs::path& file, const LoadOptions& options) -> DataStore {
    return DataStore{read_document(file, options)};
}

auto load_directory(const fs::path& dir, const LoadOptions& options) -> DataStore {
    check_sandbox(dir, options);

    auto ec = std::error_code{};
    if (!fs::is_directory(dir, ec)) {
        throw NotFoundError{"directory not found: " + dir.string()};
    }

    auto files = std::vector<fs::path>{};
    for (auto it = fs::directory_iterator{dir, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        auto name = it->path().filename().string();
        if (::fnmatch(options.pattern.c_str(), name.c_str(), 0) == 0) {
            files.push_back(it->path());
        }
    }
    if (ec) throw IoError{"cannot list " + dir.string() + ": " + ec.message()};

    std::ranges::sort(files, [](const fs::path& a, const fs::path& b) {
        return a.filename() < b.filename();
    });

    auto result = DataStore{};
    for (const auto& file : files) {
        auto document = Node{};
        try {
            document = read_document(file, options);
        } catch (const JsonDecodeError& e) {
            LOG(WARNING) << "skipping " << file << ": " << e.what();
            continue;
        }
        result.merge(document);
        VLOG(1) << "merged " << file;
    }
    return result;
}

void save_file(const DataStore& store, const fs::path& file, int indent) {
    auto ec = std::error_code{};
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) throw IoError{"cannot create " + file.parent_path().string() + ": " + ec.message()};
    }

    auto out = std::ofstream{file, std::ios::binary | std::ios::trunc};
    if (!out) throw IoError{"cannot open " + file.string() + " for writing"};
    out << dump(store, indent);
    out.close();
    if (!out) throw IoError{"cannot write " + file.string()};
    VLOG(1) << "saved " << file;
}

}  // namespace datastore_cpp
