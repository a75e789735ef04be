#include <sift/base_path.hpp>
#include <sift/glob.hpp>
#include <unordered_set>

namespace sift {

static bool is_absolute(const std::string& p) {
    return !p.empty() && p[0] == '/';
}

std::string base_path(const std::string& pattern) {
    auto segs = split_segments(normalize_path(pattern));

    // An all-literal pattern names a single entry; its parent bounds it
    size_t stop = segs.size() - 1;
    for (size_t i = 0; i < segs.size(); i++) {
        if (classify_segment(segs[i]) != Segment::Literal) {
            stop = i;
            break;
        }
    }

    std::string out;
    for (size_t i = 0; i < stop; i++) {
        if (i > 0) out += '/';
        out += unescape_segment(segs[i]);
    }

    if (out.empty()) return is_absolute(pattern) ? "/" : ".";
    return out;
}

bool base_covers(const std::string& base, const std::string& path) {
    if (is_absolute(base) != is_absolute(path)) return false;
    if (base == "." || base == "/" || base == path) return true;
    return path.size() > base.size() &&
           path.compare(0, base.size(), base) == 0 &&
           path[base.size()] == '/';
}

std::vector<std::string> get_base_paths(std::vector<std::string> bases,
                                        const std::vector<std::string>& patterns) {
    std::unordered_set<std::string> seen(bases.begin(), bases.end());

    for (const auto& pat : patterns) {
        std::string bp = base_path(pat);
        if (seen.count(bp)) continue;

        bool covered = false;
        for (const auto& b : bases) {
            if (base_covers(b, bp)) {
                covered = true;
                break;
            }
        }
        if (covered) continue;

        // Replace the first base the new one covers, drop the rest
        std::vector<std::string> kept;
        bool placed = false;
        for (auto& b : bases) {
            if (base_covers(bp, b)) {
                seen.erase(b);
                if (!placed) {
                    kept.push_back(bp);
                    placed = true;
                }
                continue;
            }
            kept.push_back(std::move(b));
        }
        if (!placed) kept.push_back(bp);

        bases = std::move(kept);
        seen.insert(bp);
    }

    return bases;
}

} // namespace sift
