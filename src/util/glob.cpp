#include <sift/glob.hpp>

namespace sift {

// ---- Helpers ----

// Index one past the ']' closing the class that opens at pi, or npos.
static size_t class_end(const std::string& pat, size_t pi) {
    size_t n = pat.size();
    pi++; // skip '['
    if (pi < n && (pat[pi] == '!' || pat[pi] == '^')) pi++;
    if (pi < n && pat[pi] == ']') pi++;
    while (pi < n && pat[pi] != ']') {
        if (pat[pi] == '\\') {
            pi++;
            if (pi >= n) return std::string::npos;
        }
        pi++;
    }
    return pi < n ? pi + 1 : std::string::npos;
}

// Match one character against the class spanning [pi, end).
static bool match_class(const std::string& pat, size_t pi, size_t end, char c) {
    size_t i = pi + 1;
    size_t last = end - 1; // position of ']'
    bool negate = false;
    if (pat[i] == '!' || pat[i] == '^') {
        negate = true;
        i++;
    }

    bool matched = false;
    while (i < last) {
        char lo = pat[i];
        if (lo == '\\') lo = pat[++i];
        i++;
        char hi = lo;
        if (i + 1 < last && pat[i] == '-') {
            hi = pat[i + 1];
            i += 2;
            if (hi == '\\') hi = pat[i++];
        }
        if (c >= lo && c <= hi) matched = true;
    }
    return matched != negate;
}

// Match one character position of a validated glob segment. On success
// advances pi past the consumed pattern atom.
static bool match_atom(const std::string& pat, size_t& pi, char c) {
    char pc = pat[pi];
    if (pc == '?') {
        pi++;
        return true;
    }
    if (pc == '[') {
        size_t end = class_end(pat, pi);
        if (!match_class(pat, pi, end, c)) return false;
        pi = end;
        return true;
    }
    size_t lit = pc == '\\' ? pi + 1 : pi;
    if (pat[lit] != c) return false;
    pi = lit + 1;
    return true;
}

// Match a single segment against a validated glob segment (no '/' in either).
// Only the most recent '*' is retried, so the cost is bounded by
// pattern length times segment length.
static bool match_segment(const std::string& pat, const std::string& str) {
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < str.size()) {
        if (pi < pat.size()) {
            if (pat[pi] == '*') {
                star_pi = ++pi;
                star_si = si;
                continue;
            }
            if (match_atom(pat, pi, str[si])) {
                si++;
                continue;
            }
        }
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        si = ++star_si;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;
    return pi == pat.size();
}

static bool segment_matches(const Segment& seg, const std::string& part) {
    switch (seg.kind) {
        case Segment::Literal:    return part == seg.text;
        case Segment::Glob:       return match_segment(seg.text, part);
        case Segment::DoubleStar: return true;
    }
    return false;
}

// Segment-level matching; '**' backtracks the same way '*' does within a
// segment.
static bool match_segments(const std::vector<Segment>& pat,
                           const std::vector<std::string>& path) {
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < path.size()) {
        if (pi < pat.size()) {
            if (pat[pi].kind == Segment::DoubleStar) {
                star_pi = ++pi;
                star_si = si;
                continue;
            }
            if (segment_matches(pat[pi], path[si])) {
                pi++;
                si++;
                continue;
            }
        }
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        si = ++star_si;
    }

    while (pi < pat.size() && pat[pi].kind == Segment::DoubleStar) pi++;
    return pi == pat.size();
}

static SiftError pattern_error(const std::string& pattern, const std::string& why) {
    return SiftError{SiftError::Pattern,
        "invalid glob pattern '" + pattern + "'", why, pattern};
}

// ---- Public API ----

std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

Segment::Kind classify_segment(const std::string& seg) {
    if (seg == "**") return Segment::DoubleStar;
    for (size_t i = 0; i < seg.size(); i++) {
        char c = seg[i];
        if (c == '\\') {
            i++;
            continue;
        }
        if (c == '*' || c == '?' || c == '[') return Segment::Glob;
    }
    return Segment::Literal;
}

std::string unescape_segment(const std::string& seg) {
    std::string out;
    out.reserve(seg.size());
    for (size_t i = 0; i < seg.size(); i++) {
        if (seg[i] == '\\' && i + 1 < seg.size()) i++;
        out.push_back(seg[i]);
    }
    return out;
}

Result<Pattern> compile_pattern(const std::string& pattern) {
    Pattern compiled;
    compiled.source = pattern;

    for (const auto& raw : split_segments(normalize_path(pattern))) {
        // A trailing backslash escapes nothing
        size_t run = 0;
        for (size_t i = raw.size(); i > 0 && raw[i - 1] == '\\'; i--) run++;
        if (run % 2 == 1) {
            return pattern_error(pattern, "trailing '\\' in segment '" + raw + "'");
        }

        Segment seg;
        seg.kind = classify_segment(raw);
        if (seg.kind == Segment::Literal) {
            seg.text = unescape_segment(raw);
        } else {
            seg.text = raw;
        }

        if (seg.kind == Segment::Glob) {
            for (size_t i = 0; i < raw.size(); i++) {
                if (raw[i] == '\\') {
                    i++;
                } else if (raw[i] == '[') {
                    size_t end = class_end(raw, i);
                    if (end == std::string::npos) {
                        return pattern_error(pattern,
                            "unterminated character class in segment '" + raw + "'");
                    }
                    i = end - 1;
                }
            }
        }

        compiled.segments.push_back(std::move(seg));
    }

    return Result<Pattern>::ok(std::move(compiled));
}

bool glob_match(const Pattern& pattern, const std::string& path) {
    auto path_segs = split_segments(normalize_path(path));
    return match_segments(pattern.segments, path_segs);
}

Result<bool> glob_match(const std::string& pattern, const std::string& path) {
    auto compiled = compile_pattern(pattern);
    SIFT_TRY(compiled);
    return Result<bool>::ok(glob_match(compiled.value(), path));
}

} // namespace sift
