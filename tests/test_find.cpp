#include <catch2/catch.hpp>
#include <sift/filter.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>

using namespace sift;
namespace fs = std::filesystem;

using V = std::vector<std::string>;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("sift_find_test_" + std::to_string(
            std::hash<std::string>{}(std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()))));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }

    std::string root() const { return path.generic_string(); }
};

static void setup_tree(TempDir& td) {
    for (const char* p : {"a/a.test1", "a/b.test2", "b/a.test1", "b/b.test2", "x", "x.test1"}) {
        td.write_file(p, "test");
    }
}

// In-memory lister that records every directory it is asked for.
struct FakeLister : DirLister {
    std::map<std::string, std::vector<DirEntry>> dirs;
    std::set<std::string> files;
    mutable V visited;

    Result<DirEntry> stat(const std::string& path) const override {
        DirEntry e;
        e.name = path.substr(path.find_last_of('/') + 1);
        if (dirs.count(path)) {
            e.is_dir = true;
        } else if (!files.count(path)) {
            return SiftError{SiftError::IO, "no such file or directory", "", path};
        }
        return Result<DirEntry>::ok(e);
    }

    Result<std::vector<DirEntry>> list(const std::string& dir) const override {
        visited.push_back(dir);
        auto it = dirs.find(dir);
        if (it == dirs.end()) {
            return SiftError{SiftError::IO, "permission denied", "", dir};
        }
        return Result<std::vector<DirEntry>>::ok(it->second);
    }
};

static V run_find(const TempDir& td, const V& includes, const V& excludes) {
    auto r = sift::find(td.root(), includes, excludes);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_pattern_errors());
    return r.value().paths;
}

// ---- Filesystem walks ----

TEST_CASE("find doublestar selects every file", "[find]") {
    TempDir td;
    setup_tree(td);
    REQUIRE(run_find(td, {"**"}, {}) ==
            V{"a/a.test1", "a/b.test2", "b/a.test1", "b/b.test2", "x", "x.test1"});
}

TEST_CASE("find by extension", "[find]") {
    TempDir td;
    setup_tree(td);
    REQUIRE(run_find(td, {"**/*.test1"}, {}) ==
            V{"a/a.test1", "b/a.test1", "x.test1"});
}

TEST_CASE("find single-segment exclude only hits top level", "[find]") {
    TempDir td;
    setup_tree(td);
    REQUIRE(run_find(td, {"**"}, {"*.test1"}) ==
            V{"a/a.test1", "a/b.test2", "b/a.test1", "b/b.test2", "x"});
}

TEST_CASE("find excluded directory is pruned", "[find]") {
    TempDir td;
    setup_tree(td);
    V expected = {"b/a.test1", "b/b.test2", "x", "x.test1"};
    REQUIRE(run_find(td, {"**"}, {"a"}) == expected);
    REQUIRE(run_find(td, {"**"}, {"a/"}) == expected);
}

TEST_CASE("find multiple excludes", "[find]") {
    TempDir td;
    setup_tree(td);
    REQUIRE(run_find(td, {"**"}, {"**/*.test1", "**/*.test2"}) == V{"x"});
}

TEST_CASE("find walks only the include base paths", "[find]") {
    TempDir td;
    setup_tree(td);
    REQUIRE(run_find(td, {"b/**"}, {}) == V{"b/a.test1", "b/b.test2"});
    REQUIRE(run_find(td, {"b/*.test2", "a/a.*"}, {}) == V{"b/b.test2", "a/a.test1"});
}

TEST_CASE("find without includes selects nothing", "[find]") {
    TempDir td;
    setup_tree(td);
    REQUIRE(run_find(td, {}, {}).empty());
}

TEST_CASE("find with an absolute pattern reports absolute paths", "[find]") {
    TempDir td;
    setup_tree(td);
    std::string abs = td.root();
    auto r = sift::find(".", {abs + "/b/**"}, {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().paths == V{abs + "/b/a.test1", abs + "/b/b.test2"});
}

TEST_CASE("find reports invalid patterns and keeps going", "[find]") {
    TempDir td;
    setup_tree(td);
    auto r = sift::find(td.root(), {"*"}, {"[["});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().paths == V{"x", "x.test1"});
    REQUIRE(r.value().pattern_errors.size() == 1);
    REQUIRE(r.value().pattern_errors[0].code == SiftError::Pattern);
}

TEST_CASE("find missing base path is a walk error", "[find]") {
    TempDir td;
    setup_tree(td);
    auto r = sift::find(td.root(), {"nothere/**"}, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::Walk);
}

TEST_CASE("find selects a file named by a walk root", "[find]") {
    TempDir td;
    setup_tree(td);
    REQUIRE(run_find(td, {"x.test1/**"}, {}) == V{"x.test1"});
    REQUIRE(run_find(td, {"x.test1/**", "b/**"}, {}) ==
            V{"x.test1", "b/a.test1", "b/b.test2"});
    REQUIRE(run_find(td, {"x.test1/**"}, {"*.test1"}).empty());
}

TEST_CASE("find agrees with filter_files on walk roots", "[find]") {
    TempDir td;
    setup_tree(td);
    V all = {"a/a.test1", "a/b.test2", "b/a.test1", "b/b.test2", "x", "x.test1"};
    for (const auto& inc : V{"x/**", "a/**", "b/*.test2", "x.test1/**"}) {
        INFO(inc);
        REQUIRE(run_find(td, {inc}, {}) == filter_files(all, {inc}, {}).paths);
    }
}

TEST_CASE("FsDirLister stat", "[find]") {
    TempDir td;
    setup_tree(td);
    FsDirLister lister;

    auto dir = lister.stat(td.root() + "/a");
    REQUIRE(dir.is_ok());
    REQUIRE(dir.value().is_dir);
    REQUIRE(dir.value().name == "a");

    auto file = lister.stat(td.root() + "/x.test1");
    REQUIRE(file.is_ok());
    REQUIRE_FALSE(file.value().is_dir);

    auto missing = lister.stat(td.root() + "/nothere");
    REQUIRE(missing.is_err());
}

TEST_CASE("FsDirLister lists sorted entries", "[find]") {
    TempDir td;
    setup_tree(td);
    FsDirLister lister;
    auto r = lister.list(td.root());
    REQUIRE(r.is_ok());
    const auto& entries = r.value();
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0].name == "a");
    REQUIRE(entries[0].is_dir);
    REQUIRE(entries[2].name == "x");
    REQUIRE_FALSE(entries[2].is_dir);
}

// ---- Custom listers ----

TEST_CASE("find follows lister order depth first", "[find]") {
    FakeLister fake;
    fake.dirs["r"] = {{"z", false}, {"d", true}, {"a", false}};
    fake.dirs["r/d"] = {{"inner", false}};

    auto r = sift::find(fake, "r", {"**"}, {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().paths == V{"z", "d/inner", "a"});
}

TEST_CASE("find does not descend into excluded directories", "[find]") {
    FakeLister fake;
    fake.dirs["r"] = {{"keep", true}, {"skip", true}};
    fake.dirs["r/keep"] = {{"f", false}};
    fake.dirs["r/skip"] = {{"g", false}};

    auto r = sift::find(fake, "r", {"**"}, {"skip"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().paths == V{"keep/f"});
    REQUIRE(fake.visited == V{"r", "r/keep"});
}

TEST_CASE("find listing failure discards partial results", "[find]") {
    FakeLister fake;
    fake.dirs["r"] = {{"ok", false}, {"locked", true}, {"later", false}};

    auto r = sift::find(fake, "r", {"**"}, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::Walk);
    REQUIRE(r.error().file == "r/locked");
    REQUIRE(r.error().message.find("permission denied") != std::string::npos);
}

TEST_CASE("find visits each subtree once for overlapping includes", "[find]") {
    FakeLister fake;
    fake.dirs["r"] = {{"src", true}};
    fake.dirs["r/src"] = {{"a.c", false}};

    auto r = sift::find(fake, "r", {"src/**", "**/*.c"}, {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().paths == V{"src/a.c"});
    REQUIRE(fake.visited == V{"r", "r/src"});
}

TEST_CASE("find tests a file walk root without listing it", "[find]") {
    FakeLister fake;
    fake.dirs["r"] = {{"notes.txt", false}, {"src", true}};
    fake.dirs["r/src"] = {{"a.c", false}};
    fake.files = {"r/notes.txt", "r/src/a.c"};

    auto r = sift::find(fake, "r", {"notes.txt/**", "src/**"}, {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().paths == V{"notes.txt", "src/a.c"});
    REQUIRE(fake.visited == V{"r/src"});
}

TEST_CASE("find missing walk root is a walk error", "[find]") {
    FakeLister fake;
    fake.dirs["r"] = {};

    auto r = sift::find(fake, "r", {"gone/**"}, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::Walk);
    REQUIRE(r.error().file == "r/gone");
    REQUIRE(fake.visited.empty());
}

TEST_CASE("find skips the walk when nothing can be included", "[find]") {
    FakeLister fake;
    auto r = sift::find(fake, "r", {"[["}, {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().paths.empty());
    REQUIRE(r.value().pattern_errors.size() == 1);
    REQUIRE(fake.visited.empty());
}
