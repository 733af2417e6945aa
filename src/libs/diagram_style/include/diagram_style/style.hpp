#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace diagram_style {

struct StyleEntry {
    std::string key;
    std::string value;
    bool has_value = false; // false for bare flags such as "ellipse"
};

// Ordered key/value style as found in a cell's style attribute.
// An unmodified record serializes back to the exact text it was parsed from.
class StyleRecord {
public:
    StyleRecord() = default;

    static StyleRecord opaque_raw(std::string raw);

    const std::vector<StyleEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty() && raw_.empty(); }
    bool is_opaque() const { return opaque_; }
    bool is_modified() const { return modified_; }

    bool contains(std::string_view key) const;
    bool has_value(std::string_view key) const;
    std::optional<std::string> get(std::string_view key) const;
    std::optional<double> get_number(std::string_view key) const;
    std::optional<bool> get_bool(std::string_view key) const;
    // First bare flag, e.g. "ellipse" in "ellipse;whiteSpace=wrap".
    std::optional<std::string> first_flag() const;

    // Setters return false when the record is opaque or the key is not representable.
    bool set(std::string_view key, std::string_view value);
    bool set_number(std::string_view key, double value);
    bool set_bool(std::string_view key, bool value);
    bool set_flag(std::string_view key);
    bool erase(std::string_view key);

    std::string serialize() const;

    friend bool operator==(const StyleRecord& a, const StyleRecord& b) {
        return a.opaque_ == b.opaque_ && a.serialize() == b.serialize();
    }

private:
    friend struct StyleParser;

    StyleEntry* find(std::string_view key);
    const StyleEntry* find(std::string_view key) const;

    std::vector<StyleEntry> entries_;
    std::string raw_;
    bool modified_ = false;
    bool opaque_ = false;
    bool trailing_delimiter_ = false;
};

struct StyleParseError {
    std::string message;
    std::size_t offset = 0;
};

struct StyleParseResult {
    StyleRecord record;
    std::optional<StyleParseError> error; // set together with an opaque record
};

StyleParseResult parse_style(std::string_view text);
std::string serialize_style(const StyleRecord& record);

bool is_valid_style_key(std::string_view key);
std::string format_style_number(double value);

// Named styles referenced by a leading bare token of a cell style, plus the
// implicit vertex and edge defaults.
class StyleRegistry {
public:
    StyleRegistry();

    void register_style(const std::string& name, StyleRecord style);
    bool contains(const std::string& name) const;
    const StyleRecord* find(const std::string& name) const;
    std::vector<std::string> names() const;

    // Effective style: default, then referenced named styles, then the record's own keys.
    // Opaque records contribute nothing beyond the default.
    StyleRecord resolve(const StyleRecord& record, bool is_edge) const;

private:
    std::unordered_map<std::string, StyleRecord> styles_;
    std::vector<std::string> order_;
};

} // namespace diagram_style
