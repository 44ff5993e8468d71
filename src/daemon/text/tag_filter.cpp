#include "tag_filter.hpp"

#include "utf8.hpp"

namespace text {

std::string strip_tags(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());

    size_t pos = 0;
    while (pos < raw.size()) {
        auto open = raw.find('<', pos);
        if (open == std::string_view::npos) {
            out.append(raw.substr(pos));
            break;
        }
        auto close = raw.find('>', open + 1);
        if (close == std::string_view::npos) {
            out.append(raw.substr(pos));
            break;
        }
        out.append(raw.substr(pos, open - pos));
        pos = close + 1;
    }

    return std::string(utf8::trim(out));
}

} // namespace text
