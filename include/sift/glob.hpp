#pragma once

#include <sift/result.hpp>
#include <string>
#include <vector>

namespace sift {

// One '/'-delimited piece of a compiled pattern.
struct Segment {
    enum Kind {
        Literal,     // no unescaped metacharacters; text is unescaped
        Glob,        // contains *, ? or [...]; text is the raw segment
        DoubleStar   // exactly "**"
    };

    Kind kind;
    std::string text;
};

// A pattern split into segments and validated. An absolute pattern starts
// with an empty Literal segment.
struct Pattern {
    std::string source;
    std::vector<Segment> segments;
};

// Collapse repeated slashes and drop a trailing slash ("/" stays "/").
std::string normalize_path(const std::string& p);

// Split on '/'. "" -> {""}, "/a" -> {"", "a"}.
std::vector<std::string> split_segments(const std::string& s);

// Classify a segment without validating it.
Segment::Kind classify_segment(const std::string& seg);

// Remove backslash escapes from a literal segment.
std::string unescape_segment(const std::string& seg);

// Split and validate a pattern. Fails with SiftError::Pattern when a segment
// has an unterminated character class or a trailing escape.
//
// Segment dialect:
//   *       any run of characters except '/'
//   ?       exactly one character except '/'
//   [abc]   one of a set; [a-z] ranges; [!...] or [^...] negates;
//           ']' is literal when it comes first
//   \c      the character c, literally
//   **      as a whole segment, zero or more whole path segments
Result<Pattern> compile_pattern(const std::string& pattern);

// Anchored, case-sensitive match of a normalized path against a compiled
// pattern.
bool glob_match(const Pattern& pattern, const std::string& path);

// Compile-and-match convenience wrapper.
Result<bool> glob_match(const std::string& pattern, const std::string& path);

} // namespace sift
