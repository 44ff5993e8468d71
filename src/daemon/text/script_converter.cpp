#include "script_converter.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <format>
#include <fstream>

std::expected<void, std::string> DictionaryConverter::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("could not open dictionary " + path);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        auto view = utf8::trim(line);
        if (view.empty() || view.front() == '#') continue;

        auto tab = view.find('\t');
        if (tab == std::string_view::npos) {
            return std::unexpected(std::format("{}:{}: missing tab separator", path, line_no));
        }
        auto source = view.substr(0, tab);
        auto targets = utf8::trim(view.substr(tab + 1));
        // First listed candidate is the preferred one.
        auto target = targets.substr(0, targets.find(' '));

        if (!add(source, target)) {
            return std::unexpected(std::format("{}:{}: invalid UTF-8", path, line_no));
        }
    }
    return {};
}

bool DictionaryConverter::add(std::string_view source, std::string_view target) {
    auto src = utf8::decode(source);
    auto dst = utf8::decode(target);
    if (!src || !dst || src->empty()) return false;

    max_key_len_ = std::max(max_key_len_, src->size());
    table_.insert_or_assign(std::move(*src), std::move(*dst));
    return true;
}

std::string DictionaryConverter::convert(std::string_view text) const {
    auto cps = utf8::decode(text);
    if (!cps || table_.empty()) return std::string(text);

    std::u32string out;
    out.reserve(cps->size());

    std::u32string_view rest(*cps);
    while (!rest.empty()) {
        bool matched = false;
        for (size_t len = std::min(max_key_len_, rest.size()); len > 0; --len) {
            auto it = table_.find(std::u32string(rest.substr(0, len)));
            if (it != table_.end()) {
                out += it->second;
                rest.remove_prefix(len);
                matched = true;
                break;
            }
        }
        if (!matched) {
            out.push_back(rest.front());
            rest.remove_prefix(1);
        }
    }
    return utf8::encode(out);
}
