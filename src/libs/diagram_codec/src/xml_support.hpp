#pragma once

#include <diagram_model/errors.hpp>
#include <tinyxml2.h>
#include <optional>
#include <string>

namespace diagram_codec::xml {

// Compact serialization of a node, used to keep unknown nodes verbatim.
std::string print_node(const tinyxml2::XMLNode* node);
// Whole-document output. Line breaks and tabs inside attribute values are
// written as character references so XML readers do not fold them to spaces.
std::string print_document(tinyxml2::XMLDocument& doc, bool compact);
// print_node cut down to a readable length for error reports.
std::string excerpt(const tinyxml2::XMLNode* node);

bool is_blank_text(const tinyxml2::XMLNode* node);
// Elements and comments survive as opaque fragments; other nodes do not.
bool is_preservable(const tinyxml2::XMLNode* node);

std::optional<double> parse_number(const char* text);
std::string format_number(double value);

// Appends a fragment produced by print_node below `parent`.
diagram_model::Status append_fragment(tinyxml2::XMLDocument& doc, tinyxml2::XMLNode* parent,
    const std::string& fragment);

std::string indexed(const std::string& path, const char* name, int index);

} // namespace diagram_codec::xml
