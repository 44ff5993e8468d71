#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>

class ScriptConverter {
public:
    virtual ~ScriptConverter() = default;
    virtual std::string convert(std::string_view text) const = 0;
};

class IdentityConverter : public ScriptConverter {
public:
    std::string convert(std::string_view text) const override { return std::string(text); }
};

// Table-driven converter reading OpenCC text dictionaries such as
// STCharacters.txt and STPhrases.txt ("source\ttarget [alternatives]").
// Matching is greedy longest-match over code points; unmapped text passes through.
class DictionaryConverter : public ScriptConverter {
public:
    std::expected<void, std::string> load(const std::string& path);

    // Adds or replaces one mapping. Both sides are UTF-8.
    bool add(std::string_view source, std::string_view target);

    size_t size() const { return table_.size(); }

    std::string convert(std::string_view text) const override;

private:
    std::unordered_map<std::u32string, std::u32string> table_;
    size_t max_key_len_ = 0;
};
