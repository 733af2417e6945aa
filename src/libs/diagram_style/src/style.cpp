#include <diagram_style/style.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace diagram_style {

struct StyleParser {
    static void upsert(StyleRecord& record, std::string_view key, std::string_view value, bool has_value) {
        if (StyleEntry* existing = record.find(key)) {
            existing->value = std::string(value);
            existing->has_value = has_value;
            return;
        }
        record.entries_.push_back(StyleEntry{ std::string(key), std::string(value), has_value });
    }

    static void finish(StyleRecord& record, std::string_view text) {
        record.raw_ = std::string(text);
        record.trailing_delimiter_ = !text.empty() && text.back() == ';';
    }
};

namespace {

bool contains_control(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x20;
    });
}

} // namespace

bool is_valid_style_key(std::string_view key) {
    if (key.empty()) return false;
    if (key.find(';') != std::string_view::npos || key.find('=') != std::string_view::npos) return false;
    return !contains_control(key);
}

std::string format_style_number(double value) {
    if (!std::isfinite(value)) return "0";
    if (value == 0.0) return "0";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value);
    if (res.ec != std::errc()) return "0";
    return std::string(buf, res.ptr);
}

StyleParseResult parse_style(std::string_view text) {
    StyleParseResult out;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t end = text.find(';', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view segment = text.substr(pos, end - pos);
        if (!segment.empty()) {
            const std::size_t eq = segment.find('=');
            const std::string_view key = eq == std::string_view::npos ? segment : segment.substr(0, eq);
            if (!is_valid_style_key(key)) {
                out.error = StyleParseError{ "invalid style key '" + std::string(key) + "'", pos };
                out.record = StyleRecord::opaque_raw(std::string(text));
                return out;
            }
            if (eq == std::string_view::npos)
                StyleParser::upsert(out.record, key, {}, false);
            else
                StyleParser::upsert(out.record, key, segment.substr(eq + 1), true);
        }
        if (end == text.size()) break;
        pos = end + 1;
    }
    StyleParser::finish(out.record, text);
    return out;
}

std::string serialize_style(const StyleRecord& record) {
    return record.serialize();
}

StyleRecord StyleRecord::opaque_raw(std::string raw) {
    StyleRecord r;
    r.raw_ = std::move(raw);
    r.opaque_ = true;
    return r;
}

StyleEntry* StyleRecord::find(std::string_view key) {
    for (auto& e : entries_)
        if (e.key == key) return &e;
    return nullptr;
}

const StyleEntry* StyleRecord::find(std::string_view key) const {
    for (const auto& e : entries_)
        if (e.key == key) return &e;
    return nullptr;
}

bool StyleRecord::contains(std::string_view key) const {
    return find(key) != nullptr;
}

bool StyleRecord::has_value(std::string_view key) const {
    const StyleEntry* e = find(key);
    return e && e->has_value;
}

std::optional<std::string> StyleRecord::get(std::string_view key) const {
    const StyleEntry* e = find(key);
    if (!e) return std::nullopt;
    return e->value;
}

std::optional<double> StyleRecord::get_number(std::string_view key) const {
    const StyleEntry* e = find(key);
    if (!e || !e->has_value || e->value.empty()) return std::nullopt;
    double v = 0;
    const char* first = e->value.data();
    const char* last = first + e->value.size();
    auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
    return v;
}

std::optional<bool> StyleRecord::get_bool(std::string_view key) const {
    const StyleEntry* e = find(key);
    if (!e) return std::nullopt;
    // A bare flag is treated as set.
    if (!e->has_value) return true;
    if (e->value == "1" || e->value == "true") return true;
    if (e->value == "0" || e->value == "false") return false;
    return std::nullopt;
}

std::optional<std::string> StyleRecord::first_flag() const {
    for (const auto& e : entries_)
        if (!e.has_value) return e.key;
    return std::nullopt;
}

bool StyleRecord::set(std::string_view key, std::string_view value) {
    if (opaque_ || !is_valid_style_key(key)) return false;
    if (value.find(';') != std::string_view::npos || contains_control(value)) return false;
    if (StyleEntry* e = find(key)) {
        if (e->has_value && e->value == value) return true;
        e->value = std::string(value);
        e->has_value = true;
    } else {
        entries_.push_back(StyleEntry{ std::string(key), std::string(value), true });
    }
    modified_ = true;
    return true;
}

bool StyleRecord::set_number(std::string_view key, double value) {
    return set(key, format_style_number(value));
}

bool StyleRecord::set_bool(std::string_view key, bool value) {
    return set(key, value ? "1" : "0");
}

bool StyleRecord::set_flag(std::string_view key) {
    if (opaque_ || !is_valid_style_key(key)) return false;
    if (StyleEntry* e = find(key)) {
        if (!e->has_value) return true;
        e->value.clear();
        e->has_value = false;
    } else {
        entries_.push_back(StyleEntry{ std::string(key), {}, false });
    }
    modified_ = true;
    return true;
}

bool StyleRecord::erase(std::string_view key) {
    if (opaque_) return false;
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const StyleEntry& e) { return e.key == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    modified_ = true;
    return true;
}

std::string StyleRecord::serialize() const {
    if (opaque_ || !modified_) return raw_;
    std::string out;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (i > 0) out += ';';
        out += entries_[i].key;
        if (entries_[i].has_value) {
            out += '=';
            out += entries_[i].value;
        }
    }
    if (trailing_delimiter_ && !out.empty()) out += ';';
    return out;
}

StyleRegistry::StyleRegistry() {
    register_style("defaultVertex", parse_style(
        "shape=rectangle;perimeter=rectanglePerimeter;verticalAlign=middle;align=center;"
        "fillColor=#FFFFFF;strokeColor=#000000;fontColor=#000000").record);
    register_style("defaultEdge", parse_style(
        "shape=connector;endArrow=classic;verticalAlign=middle;align=center;"
        "strokeColor=#000000;fontColor=#000000").record);
    register_style("text", parse_style(
        "fillColor=none;strokeColor=none;align=left;verticalAlign=top").record);
    register_style("edgeLabel", parse_style(
        "labelBackgroundColor=#FFFFFF;fontSize=11").record);
    register_style("ellipse", parse_style("shape=ellipse;perimeter=ellipsePerimeter").record);
    register_style("rhombus", parse_style("shape=rhombus;perimeter=rhombusPerimeter").record);
    register_style("triangle", parse_style("shape=triangle;perimeter=trianglePerimeter").record);
    register_style("swimlane", parse_style("shape=swimlane;startSize=23").record);
}

void StyleRegistry::register_style(const std::string& name, StyleRecord style) {
    if (styles_.find(name) == styles_.end()) order_.push_back(name);
    styles_[name] = std::move(style);
}

bool StyleRegistry::contains(const std::string& name) const {
    return styles_.find(name) != styles_.end();
}

const StyleRecord* StyleRegistry::find(const std::string& name) const {
    auto it = styles_.find(name);
    return it == styles_.end() ? nullptr : &it->second;
}

std::vector<std::string> StyleRegistry::names() const {
    return order_;
}

StyleRecord StyleRegistry::resolve(const StyleRecord& record, bool is_edge) const {
    StyleRecord out;
    auto merge = [&out](const StyleRecord& from) {
        for (const auto& e : from.entries()) {
            if (e.has_value)
                out.set(e.key, e.value);
            else
                out.set_flag(e.key);
        }
    };

    if (const StyleRecord* base = find(is_edge ? "defaultEdge" : "defaultVertex"))
        merge(*base);
    if (record.is_opaque()) return out;

    for (const auto& e : record.entries()) {
        if (e.has_value) continue;
        if (const StyleRecord* named = find(e.key)) merge(*named);
    }
    for (const auto& e : record.entries()) {
        if (e.has_value)
            out.set(e.key, e.value);
        else if (!contains(e.key))
            out.set_flag(e.key);
    }
    return out;
}

} // namespace diagram_style
