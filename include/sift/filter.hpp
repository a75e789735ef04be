#pragma once

#include <sift/result.hpp>
#include <string>
#include <vector>

namespace sift {

// One immediate child of a listed directory.
struct DirEntry {
    std::string name;
    bool is_dir = false;
};

// Directory-listing primitive consumed by find(). list() returns the
// immediate entries of `dir` in the order the walk should visit them, or an
// error. find() does the recursion itself. stat() describes a single path;
// find() uses it on each walk root, which may turn out to be a file.
class DirLister {
public:
    virtual ~DirLister() = default;
    virtual Result<std::vector<DirEntry>> list(const std::string& dir) const = 0;
    virtual Result<DirEntry> stat(const std::string& path) const = 0;
};

// Lists the real filesystem. Entries are sorted by name; symlinks are
// reported as plain entries and never followed.
class FsDirLister : public DirLister {
public:
    Result<std::vector<DirEntry>> list(const std::string& dir) const override;
    Result<DirEntry> stat(const std::string& path) const override;
};

// Outcome of a filtering call. Invalid patterns match nothing; each one is
// reported once in pattern_errors, even when it appears in both sets, so the
// caller can warn about it.
struct Selection {
    std::vector<std::string> paths;
    std::vector<SiftError> pattern_errors;

    bool has_pattern_errors() const { return !pattern_errors.empty(); }
};

// Select the paths that match at least one include and no exclude pattern.
// Input order is preserved. An empty include set selects nothing.
Selection filter_files(const std::vector<std::string>& paths,
                       const std::vector<std::string>& includes,
                       const std::vector<std::string>& excludes);

// Walk `root` and select the files that pass the include/exclude filter.
// Only the base paths of the include patterns are walked. Returned paths are
// '/'-separated and relative to `root` (absolute for absolute patterns), in
// depth-first order. Excluded directories are not descended into. A walk
// root that is itself a file is tested as a candidate instead of listed.
// A listing failure aborts the call with SiftError::Walk.
Result<Selection> find(const DirLister& lister,
                       const std::string& root,
                       const std::vector<std::string>& includes,
                       const std::vector<std::string>& excludes);

// find() over the real filesystem.
Result<Selection> find(const std::string& root,
                       const std::vector<std::string>& includes,
                       const std::vector<std::string>& excludes);

} // namespace sift
