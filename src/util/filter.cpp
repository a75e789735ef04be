#include <sift/filter.hpp>
#include <sift/base_path.hpp>
#include <sift/glob.hpp>
#include <sift/log.hpp>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace sift {

// ---- Helpers ----

static bool already_reported(const std::vector<SiftError>& errors,
                             const std::string& pattern) {
    for (const auto& e : errors) {
        if (e.file == pattern) return true;
    }
    return false;
}

// Compile every pattern; invalid ones are left out and reported once.
static std::vector<Pattern> compile_set(const std::vector<std::string>& patterns,
                                        std::vector<SiftError>& errors) {
    std::vector<Pattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto& p : patterns) {
        auto res = compile_pattern(p);
        if (res.is_err()) {
            if (!already_reported(errors, p)) errors.push_back(std::move(res).error());
            continue;
        }
        compiled.push_back(std::move(res).value());
    }
    return compiled;
}

static bool matches_any(const std::vector<Pattern>& set, const std::string& path) {
    for (const auto& pat : set) {
        if (glob_match(pat, path)) return true;
    }
    return false;
}

static std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

static SiftError walk_error(const std::string& dir, const SiftError& cause) {
    return SiftError{SiftError::Walk,
        "cannot list directory '" + dir + "': " + cause.message,
        cause.hint, dir};
}

static Status walk(const DirLister& lister,
                   const std::string& dir,
                   const std::string& rel,
                   const std::vector<Pattern>& includes,
                   const std::vector<Pattern>& excludes,
                   std::vector<std::string>& out) {
    auto entries = lister.list(dir);
    if (entries.is_err()) return walk_error(dir, entries.error());

    for (const auto& entry : entries.value()) {
        std::string child = join_path(rel, entry.name);

        if (matches_any(excludes, child)) {
            if (entry.is_dir) log::trace("pruning excluded directory %s", child.c_str());
            continue;
        }

        if (entry.is_dir) {
            SIFT_TRY(walk(lister, join_path(dir, entry.name), child,
                          includes, excludes, out));
        } else if (matches_any(includes, child)) {
            out.push_back(std::move(child));
        }
    }

    return ok_status();
}

// ---- Public API ----

Result<std::vector<DirEntry>> FsDirLister::list(const std::string& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return SiftError{SiftError::IO, ec.message(), "", dir};
    }

    std::vector<DirEntry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        auto st = it->symlink_status(ec);
        if (ec) break;

        DirEntry e;
        e.name = it->path().filename().string();
        e.is_dir = fs::is_directory(st);
        entries.push_back(std::move(e));
    }
    if (ec) {
        return SiftError{SiftError::IO, ec.message(), "", dir};
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

Result<DirEntry> FsDirLister::stat(const std::string& path) const {
    std::error_code ec;
    auto st = fs::symlink_status(path, ec);
    if (!ec && !fs::exists(st)) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (ec) {
        return SiftError{SiftError::IO, ec.message(), "", path};
    }

    DirEntry e;
    e.name = fs::path(path).filename().string();
    e.is_dir = fs::is_directory(st);
    return Result<DirEntry>::ok(std::move(e));
}

Selection filter_files(const std::vector<std::string>& paths,
                       const std::vector<std::string>& includes,
                       const std::vector<std::string>& excludes) {
    Selection sel;
    auto inc = compile_set(includes, sel.pattern_errors);
    auto exc = compile_set(excludes, sel.pattern_errors);

    for (const auto& p : paths) {
        if (matches_any(inc, p) && !matches_any(exc, p)) {
            sel.paths.push_back(p);
        }
    }
    return sel;
}

Result<Selection> find(const DirLister& lister,
                       const std::string& root,
                       const std::vector<std::string>& includes,
                       const std::vector<std::string>& excludes) {
    Selection sel;
    auto inc = compile_set(includes, sel.pattern_errors);
    auto exc = compile_set(excludes, sel.pattern_errors);

    std::vector<std::string> sources;
    for (const auto& p : inc) sources.push_back(p.source);
    auto bases = get_base_paths({}, sources);

    std::string top = root.empty() ? "." : root;
    for (const auto& base : bases) {
        bool absolute = base[0] == '/';
        std::string dir = absolute ? base : (base == "." ? top : join_path(top, base));
        std::string rel = absolute ? base : (base == "." ? "" : base);

        if (!rel.empty()) {
            if (matches_any(exc, rel)) {
                log::debug("base path %s is excluded, skipping", rel.c_str());
                continue;
            }

            // "x/**" matches "x" itself, which may be a plain file
            auto st = lister.stat(dir);
            if (st.is_err()) return walk_error(dir, st.error());
            if (!st.value().is_dir) {
                if (matches_any(inc, rel)) sel.paths.push_back(rel);
                continue;
            }
        }

        log::debug("walking %s", dir.c_str());
        SIFT_TRY(walk(lister, dir, rel, inc, exc, sel.paths));
    }

    return Result<Selection>::ok(std::move(sel));
}

Result<Selection> find(const std::string& root,
                       const std::vector<std::string>& includes,
                       const std::vector<std::string>& excludes) {
    FsDirLister lister;
    return find(lister, root, includes, excludes);
}

} // namespace sift
