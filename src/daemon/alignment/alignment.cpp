#include "alignment.hpp"

#include "../text/utf8.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace {

// Buffers edits between equal runs so each edit run comes out as one delete
// followed by one insert, and merges runs of the same kind.
class SegmentBuilder {
public:
    void equal(std::u32string_view text) {
        if (text.empty()) return;
        flush_edits();
        equal_ += text;
    }

    void remove(std::u32string_view text) {
        if (text.empty()) return;
        flush_equal();
        deleted_ += text;
    }

    void insert(std::u32string_view text) {
        if (text.empty()) return;
        flush_equal();
        inserted_ += text;
    }

    std::vector<DiffSegment> finish() {
        flush_equal();
        flush_edits();
        return std::move(out_);
    }

private:
    void emit(DiffKind kind, std::u32string& run) {
        if (run.empty()) return;
        auto text = utf8::encode(run);
        run.clear();
        if (!out_.empty() && out_.back().kind == kind) {
            out_.back().text += text;
        } else {
            out_.push_back({kind, std::move(text)});
        }
    }

    void flush_equal() { emit(DiffKind::Equal, equal_); }

    void flush_edits() {
        emit(DiffKind::Delete, deleted_);
        emit(DiffKind::Insert, inserted_);
    }

    std::vector<DiffSegment> out_;
    std::u32string equal_;
    std::u32string deleted_;
    std::u32string inserted_;
};

// Myers' middle-snake bisection in linear space. Returns a point (x, y) on a
// shortest edit path from a to b, strictly between (0, 0) and (n, m). Both
// inputs are non-empty and differ in their first and last code points.
std::pair<size_t, size_t> split_point(std::u32string_view a, std::u32string_view b) {
    const long n = static_cast<long>(a.size());
    const long m = static_cast<long>(b.size());

    // Diagonals are k = x - y, valid in [-m, n]; one sentinel slot per side.
    const long dmin = -m;
    const long dmax = n;
    const long delta = n - m;
    const bool odd = (delta & 1) != 0;

    // fd[k]: furthest x reached forward from (0, 0); bd[k]: smallest x
    // reached backward from (n, m).
    std::vector<long> fv(static_cast<size_t>(n + m + 3));
    std::vector<long> bv(static_cast<size_t>(n + m + 3));
    auto fd = [&fv, m](long k) -> long& { return fv[static_cast<size_t>(k + m + 1)]; };
    auto bd = [&bv, m](long k) -> long& { return bv[static_cast<size_t>(k + m + 1)]; };

    long fmin = 0, fmax = 0;
    long bmin = delta, bmax = delta;
    fd(0) = 0;
    bd(delta) = n;

    while (true) {
        if (fmin > dmin) fd(--fmin - 1) = -1; else ++fmin;
        if (fmax < dmax) fd(++fmax + 1) = -1; else --fmax;
        for (long k = fmax; k >= fmin; k -= 2) {
            long lo = fd(k - 1);
            long hi = fd(k + 1);
            long x = lo < hi ? hi : lo + 1;
            long y = x - k;
            while (x < n && y < m && a[x] == b[y]) {
                ++x;
                ++y;
            }
            fd(k) = x;
            if (odd && bmin <= k && k <= bmax && bd(k) <= x) {
                return {static_cast<size_t>(x), static_cast<size_t>(y)};
            }
        }

        if (bmin > dmin) bd(--bmin - 1) = std::numeric_limits<long>::max(); else ++bmin;
        if (bmax < dmax) bd(++bmax + 1) = std::numeric_limits<long>::max(); else --bmax;
        for (long k = bmax; k >= bmin; k -= 2) {
            long lo = bd(k - 1);
            long hi = bd(k + 1);
            long x = lo < hi ? lo : hi - 1;
            long y = x - k;
            while (x > 0 && y > 0 && a[x - 1] == b[y - 1]) {
                --x;
                --y;
            }
            bd(k) = x;
            if (!odd && fmin <= k && k <= fmax && x <= fd(k)) {
                return {static_cast<size_t>(x), static_cast<size_t>(y)};
            }
        }
    }
}

// Appends the shortest edit script from a to b. Each split halves the edit
// distance, so recursion depth is logarithmic in it.
void diff_range(std::u32string_view a, std::u32string_view b, SegmentBuilder& out) {
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) ++prefix;
    out.equal(a.substr(0, prefix));
    a.remove_prefix(prefix);
    b.remove_prefix(prefix);

    size_t suffix = 0;
    while (suffix < a.size() && suffix < b.size() &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }
    auto tail = a.substr(a.size() - suffix);
    a.remove_suffix(suffix);
    b.remove_suffix(suffix);

    if (a.empty() || b.empty()) {
        out.remove(a);
        out.insert(b);
    } else {
        auto [x, y] = split_point(a, b);
        diff_range(a.substr(0, x), b.substr(0, y), out);
        diff_range(a.substr(x), b.substr(y), out);
    }

    out.equal(tail);
}

size_t char_count(const std::string& text) {
    return utf8::length(text).value_or(text.size());
}

} // namespace

namespace alignment {

std::expected<std::vector<DiffSegment>, Error>
diff(std::string_view reference, std::string_view hypothesis) {
    auto ref = utf8::decode(reference);
    if (!ref) {
        return std::unexpected(Error{ErrorKind::InvalidInput, "reference is not valid UTF-8"});
    }
    auto hyp = utf8::decode(hypothesis);
    if (!hyp) {
        return std::unexpected(Error{ErrorKind::InvalidInput, "hypothesis is not valid UTF-8"});
    }

    SegmentBuilder builder;
    diff_range(*ref, *hyp, builder);
    return builder.finish();
}

std::vector<DisplaySegment> collapse_for_display(const std::vector<DiffSegment>& segments) {
    std::vector<DisplaySegment> out;
    out.reserve(segments.size());

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        switch (seg.kind) {
            case DiffKind::Equal:
                out.push_back({DisplayKind::Match, seg.text});
                break;
            case DiffKind::Insert:
                out.push_back({DisplayKind::Error, seg.text});
                break;
            case DiffKind::Delete:
                if (i + 1 < segments.size() && segments[i + 1].kind == DiffKind::Insert) {
                    out.push_back({DisplayKind::Error, segments[i + 1].text});
                    ++i;
                } else {
                    out.push_back({DisplayKind::Missing, seg.text});
                }
                break;
        }
    }
    return out;
}

int similarity(const std::vector<DiffSegment>& segments) {
    size_t matched = 0;
    size_t total = 0;
    for (const auto& seg : segments) {
        size_t len = char_count(seg.text);
        if (seg.kind == DiffKind::Equal) matched += len;
        total += len;
    }
    if (total == 0) return 0;
    return static_cast<int>(std::lround(100.0 * static_cast<double>(matched) / static_cast<double>(total)));
}

} // namespace alignment

std::string_view to_string(DiffKind kind) {
    switch (kind) {
        case DiffKind::Equal: return "equal";
        case DiffKind::Insert: return "insert";
        case DiffKind::Delete: return "delete";
    }
    return "equal";
}

std::string_view to_string(DisplayKind kind) {
    switch (kind) {
        case DisplayKind::Match: return "match";
        case DisplayKind::Error: return "error";
        case DisplayKind::Missing: return "missing";
    }
    return "match";
}
