#include "xml_support.hpp"
#include <diagram_style/style.hpp>
#include <charconv>
#include <cstring>
#include <utility>
#include <vector>

namespace diagram_codec::xml {

namespace {

constexpr std::size_t max_excerpt = 160;

struct AttributeEscape {
    char raw;
    char marker; // a control character XML forbids, so no real value carries it
    const char* reference;
};

constexpr AttributeEscape attribute_escapes[] = {
    { '\n', '\x01', "&#xa;" },
    { '\r', '\x02', "&#xd;" },
    { '\t', '\x03', "&#x9;" },
};

void mark_attributes(tinyxml2::XMLElement* e) {
    for (; e; e = e->NextSiblingElement()) {
        std::vector<std::pair<std::string, std::string>> changed;
        for (const auto* a = e->FirstAttribute(); a; a = a->Next()) {
            std::string value = a->Value();
            bool touched = false;
            for (char& c : value) {
                for (const auto& escape : attribute_escapes) {
                    if (c != escape.raw) continue;
                    c = escape.marker;
                    touched = true;
                }
            }
            if (touched) changed.emplace_back(a->Name(), std::move(value));
        }
        for (const auto& [name, value] : changed)
            e->SetAttribute(name.c_str(), value.c_str());
        mark_attributes(e->FirstChildElement());
    }
}

} // namespace

std::string print_node(const tinyxml2::XMLNode* node) {
    tinyxml2::XMLDocument scratch;
    scratch.InsertEndChild(node->DeepClone(&scratch));
    return print_document(scratch, true);
}

std::string print_document(tinyxml2::XMLDocument& doc, bool compact) {
    mark_attributes(doc.FirstChildElement());
    tinyxml2::XMLPrinter printer(nullptr, compact);
    doc.Print(&printer);

    std::string out;
    for (const char* c = printer.CStr(); *c; ++c) {
        const AttributeEscape* escape = nullptr;
        for (const auto& candidate : attribute_escapes)
            if (*c == candidate.marker) escape = &candidate;
        if (escape)
            out += escape->reference;
        else
            out += *c;
    }
    return out;
}

std::string excerpt(const tinyxml2::XMLNode* node) {
    if (!node) return {};
    std::string text = print_node(node);
    if (text.size() > max_excerpt) {
        text.resize(max_excerpt);
        text += "...";
    }
    return text;
}

bool is_blank_text(const tinyxml2::XMLNode* node) {
    const tinyxml2::XMLText* text = node->ToText();
    if (!text) return false;
    const char* value = text->Value();
    if (!value) return true;
    for (const char* c = value; *c; ++c)
        if (!std::strchr(" \t\r\n", *c)) return false;
    return true;
}

bool is_preservable(const tinyxml2::XMLNode* node) {
    return node->ToElement() != nullptr || node->ToComment() != nullptr;
}

std::optional<double> parse_number(const char* text) {
    if (!text) return std::nullopt;
    const char* begin = text;
    const char* end = text + std::strlen(text);
    while (begin != end && *begin == ' ') ++begin;
    if (begin != end && *begin == '+') ++begin;
    double value = 0;
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr == begin) return std::nullopt;
    while (ptr != end && *ptr == ' ') ++ptr;
    if (ptr != end) return std::nullopt;
    return value;
}

std::string format_number(double value) {
    return diagram_style::format_style_number(value);
}

diagram_model::Status append_fragment(tinyxml2::XMLDocument& doc, tinyxml2::XMLNode* parent,
    const std::string& fragment)
{
    tinyxml2::XMLDocument scratch;
    if (scratch.Parse(fragment.c_str(), fragment.size()) != tinyxml2::XML_SUCCESS)
        return diagram_model::make_error(diagram_model::ErrorCode::MalformedXml,
            "preserved node no longer parses", {}, fragment.substr(0, max_excerpt));
    for (const tinyxml2::XMLNode* node = scratch.FirstChild(); node; node = node->NextSibling())
        parent->InsertEndChild(node->DeepClone(&doc));
    return diagram_model::Status::success();
}

std::string indexed(const std::string& path, const char* name, int index) {
    std::string out = path;
    if (!out.empty()) out += '/';
    out += name;
    if (index > 0) out += "[" + std::to_string(index) + "]";
    return out;
}

} // namespace diagram_codec::xml
