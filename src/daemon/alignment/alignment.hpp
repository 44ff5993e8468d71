#pragma once

#include "../errors.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class DiffKind { Equal, Insert, Delete };

// "insert" is hypothesis-only text, "delete" is reference-only text.
struct DiffSegment {
    DiffKind kind;
    std::string text;

    bool operator==(const DiffSegment&) const = default;
};

enum class DisplayKind { Match, Error, Missing };

struct DisplaySegment {
    DisplayKind kind;
    std::string text;

    bool operator==(const DisplaySegment&) const = default;
};

namespace alignment {

// Character-level minimal edit script from reference to hypothesis, over
// Unicode code points. Equal runs are maximal and inside each edit run the
// delete precedes the insert. Fails with InvalidInput on malformed UTF-8.
std::expected<std::vector<DiffSegment>, Error>
    diff(std::string_view reference, std::string_view hypothesis);

// delete+insert becomes one Error span carrying the inserted text; a lone
// delete is Missing, a lone insert is Error, equal is Match.
std::vector<DisplaySegment> collapse_for_display(const std::vector<DiffSegment>& segments);

// round(100 * equal / (equal + inserted + deleted)) in code points, 0 for an
// empty script. Replacements count on both sides of the denominator.
int similarity(const std::vector<DiffSegment>& segments);

} // namespace alignment

std::string_view to_string(DiffKind kind);
std::string_view to_string(DisplayKind kind);
