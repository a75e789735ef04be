#pragma once

#include <string>
#include <vector>

namespace sift {

// Longest literal directory prefix that contains every match of `pattern`.
//   "foo"        -> "."
//   "test/foo*"  -> "test"
//   "foo/**/bar" -> "foo"
//   "/voing/**"  -> "/voing"
// Relative patterns with no literal prefix give "."; absolute ones give "/".
std::string base_path(const std::string& pattern);

// True if `path` equals `base` or lies below it. "." covers every relative
// path and "/" every absolute one; relative and absolute never cover each
// other.
bool base_covers(const std::string& base, const std::string& path);

// Append the base path of each pattern to `bases`, keeping first-seen order.
// A base path already covered by a retained one is dropped; retained base
// paths covered by a new one are replaced by it.
std::vector<std::string> get_base_paths(std::vector<std::string> bases,
                                        const std::vector<std::string>& patterns);

} // namespace sift
