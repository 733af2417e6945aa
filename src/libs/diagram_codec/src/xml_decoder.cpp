#include <diagram_codec/codec.hpp>
#include <diagram_codec/envelope.hpp>
#include <diagram_model/invariants.hpp>
#include <diagram_model/logging.hpp>
#include "xml_support.hpp"
#include <cmath>
#include <cstring>
#include <unordered_map>
#include <unordered_set>

namespace diagram_codec {

using diagram_model::Document;
using diagram_model::Element;
using diagram_model::Geometry;
using diagram_model::LayerCell;
using diagram_model::Page;
using diagram_model::Point;
using diagram_model::make_error;
using tinyxml2::XMLElement;
using tinyxml2::XMLNode;

namespace {

struct DecodeContext {
    const DecodeOptions& options;
    std::vector<Diagnostic>* diagnostics;

    void note(ErrorCode code, std::string message, std::string path) {
        diagram_model::core_logger()->warn("{} at {}: {}", diagram_model::to_string(code), path, message);
        if (diagnostics)
            diagnostics->push_back(Diagnostic{ code, std::move(message), std::move(path) });
    }
};

Status node_error(ErrorCode code, const std::string& message, const std::string& path, const XMLNode* node) {
    std::string text = message;
    if (node && node->GetLineNum() > 0) text += " (line " + std::to_string(node->GetLineNum()) + ")";
    return make_error(code, text, path, xml::excerpt(node));
}

bool is_wrapper(const XMLElement* e) {
    return std::strcmp(e->Name(), "UserObject") == 0 || std::strcmp(e->Name(), "object") == 0;
}

bool flag_set(const XMLElement* e, const char* name) {
    const char* value = e->Attribute(name);
    return value && std::strcmp(value, "1") == 0;
}

// Copies the opaque children of `node`, skipping the ones `skip` names.
void keep_children(const XMLNode* node, const XMLNode* skip, std::vector<std::string>& out,
    DecodeContext& ctx, const std::string& path)
{
    for (const XMLNode* child = node->FirstChild(); child; child = child->NextSibling()) {
        if (child == skip || xml::is_blank_text(child)) continue;
        if (xml::is_preservable(child))
            out.push_back(xml::print_node(child));
        else
            ctx.note(ErrorCode::MalformedXml, "unsupported node dropped", path);
    }
}

Status read_point(const XMLElement* e, Point& out, bool& plain, const std::string& path) {
    plain = true;
    for (const auto* a = e->FirstAttribute(); a; a = a->Next()) {
        const std::string name = a->Name();
        if (name == "x" || name == "y") {
            const auto v = xml::parse_number(a->Value());
            if (!v) return node_error(ErrorCode::MalformedXml, "bad number in '" + name + "'", path, e);
            // NaN or infinity: the caller keeps the whole point verbatim.
            if (!std::isfinite(*v)) plain = false;
            (name == "x" ? out.x : out.y) = *v;
        } else if (name != "as") {
            plain = false;
        }
    }
    if (e->FirstChild()) plain = false;
    return Status::success();
}

Status read_geometry(const XMLElement* g, Geometry& out, DecodeContext& ctx, const std::string& path) {
    out.present = true;
    for (const auto* a = g->FirstAttribute(); a; a = a->Next()) {
        const std::string name = a->Name();
        if (name == "x" || name == "y" || name == "width" || name == "height") {
            const auto v = xml::parse_number(a->Value());
            if (!v) return node_error(ErrorCode::MalformedXml, "bad number in '" + name + "'", path, g);
            if (!std::isfinite(*v)) {
                out.extra_attributes.push_back({ name, a->Value() });
                continue;
            }
            if (name == "x") out.x = *v;
            else if (name == "y") out.y = *v;
            else if (name == "width") out.width = *v;
            else out.height = *v;
        } else if (name == "relative") {
            out.relative = std::strcmp(a->Value(), "1") == 0;
        } else if (name != "as") {
            out.extra_attributes.push_back({ name, a->Value() });
        }
    }

    for (const XMLNode* child = g->FirstChild(); child; child = child->NextSibling()) {
        if (xml::is_blank_text(child)) continue;
        const XMLElement* e = child->ToElement();
        const char* as = e ? e->Attribute("as") : nullptr;
        const std::string role = as ? as : "";
        bool handled = false;

        if (e && std::strcmp(e->Name(), "mxPoint") == 0
            && (role == "sourcePoint" || role == "targetPoint" || role == "offset"))
        {
            Point p;
            bool plain = true;
            if (Status s = read_point(e, p, plain, path); !s.ok()) return s;
            std::optional<Point>& slot = role == "sourcePoint" ? out.source_point
                : role == "targetPoint" ? out.target_point : out.offset;
            if (plain && !slot) {
                slot = p;
                handled = true;
            }
        } else if (e && std::strcmp(e->Name(), "Array") == 0 && role == "points" && out.points.empty()) {
            std::vector<Point> points;
            bool plain = e->FirstAttribute() && !e->FirstAttribute()->Next();
            for (const XMLNode* n = e->FirstChild(); n && plain; n = n->NextSibling()) {
                if (xml::is_blank_text(n)) continue;
                const XMLElement* pe = n->ToElement();
                if (!pe || std::strcmp(pe->Name(), "mxPoint") != 0 || pe->Attribute("as")) {
                    plain = false;
                    break;
                }
                Point p;
                if (Status s = read_point(pe, p, plain, path); !s.ok()) return s;
                points.push_back(p);
            }
            if (plain) {
                out.points = std::move(points);
                handled = true;
            }
        }

        if (handled) continue;
        if (xml::is_preservable(child))
            out.extra_children.push_back(xml::print_node(child));
        else
            ctx.note(ErrorCode::MalformedXml, "unsupported node dropped", path);
    }
    return Status::success();
}

struct RawCell {
    std::string id;
    std::optional<std::string> parent;
    const XMLElement* cell = nullptr;
    const XMLElement* wrapper = nullptr;
    std::string path;
};

diagram_model::CellWrapper read_wrapper(const RawCell& raw, std::string* label, DecodeContext& ctx) {
    diagram_model::CellWrapper w;
    w.tag = raw.wrapper->Name();
    for (const auto* a = raw.wrapper->FirstAttribute(); a; a = a->Next()) {
        const std::string name = a->Name();
        if (name == "id") continue;
        if (label && name == "label")
            *label = a->Value();
        else
            w.attributes.push_back({ name, a->Value() });
    }
    keep_children(raw.wrapper, raw.cell, w.extra_children, ctx, raw.path);
    return w;
}

LayerCell read_layer(const RawCell& raw, DecodeContext& ctx) {
    LayerCell layer;
    layer.id = raw.id;
    layer.parent_id = raw.parent;
    for (const auto* a = raw.cell->FirstAttribute(); a; a = a->Next()) {
        const std::string name = a->Name();
        if ((name == "id" && !raw.wrapper) || name == "parent") continue;
        layer.attributes.push_back({ name, a->Value() });
    }
    keep_children(raw.cell, nullptr, layer.extra_children, ctx, raw.path);
    if (raw.wrapper) layer.wrapper = read_wrapper(raw, nullptr, ctx);
    return layer;
}

Status read_element(const RawCell& raw, bool is_group, Element& out, DecodeContext& ctx) {
    const XMLElement* cell = raw.cell;
    out.id = raw.id;
    out.parent_id = raw.parent.value_or(std::string());
    out.geometry.present = false;

    const bool is_edge = flag_set(cell, "edge");
    if (is_edge)
        out.payload = diagram_model::ConnectorData{};
    else if (is_group)
        out.payload = diagram_model::GroupData{};

    for (const auto* a = cell->FirstAttribute(); a; a = a->Next()) {
        const std::string name = a->Name();
        if ((name == "id" || name == "value") && !raw.wrapper) {
            if (name == "value") out.label = a->Value();
        } else if (name == "parent" || name == "vertex" || name == "edge") {
        } else if (name == "style") {
            auto parsed = diagram_style::parse_style(a->Value());
            if (parsed.error)
                ctx.note(ErrorCode::MalformedStyle,
                    parsed.error->message + " at offset " + std::to_string(parsed.error->offset), raw.path);
            out.style = std::move(parsed.record);
        } else if (is_edge && (name == "source" || name == "target")) {
            out.connector()->endpoint(name == "source" ? diagram_model::EndpointSide::Source
                                                       : diagram_model::EndpointSide::Target) = a->Value();
        } else if (name == "visible") {
            out.visible = std::strcmp(a->Value(), "0") != 0;
        } else {
            out.extra_attributes.push_back({ name, a->Value() });
        }
    }

    const XMLElement* geometry = nullptr;
    for (const XMLElement* e = cell->FirstChildElement("mxGeometry"); e; e = e->NextSiblingElement("mxGeometry")) {
        const char* as = e->Attribute("as");
        if (!as || std::strcmp(as, "geometry") == 0) {
            geometry = e;
            break;
        }
    }
    if (geometry) {
        if (Status s = read_geometry(geometry, out.geometry, ctx, raw.path + "/mxGeometry"); !s.ok()) return s;
    }
    keep_children(cell, geometry, out.extra_children, ctx, raw.path);

    if (raw.wrapper) out.wrapper = read_wrapper(raw, &out.label, ctx);
    diagram_model::refresh_derived_fields(out);
    return Status::success();
}

Status read_root(const XMLElement* root, Page& page, DecodeContext& ctx, const std::string& path) {
    std::vector<RawCell> cells;
    std::unordered_map<std::string, std::size_t> by_id;
    std::unordered_map<std::string, int> counters;

    for (const XMLNode* node = root->FirstChild(); node; node = node->NextSibling()) {
        if (xml::is_blank_text(node)) continue;
        const XMLElement* e = node->ToElement();
        const bool cell_node = e && (std::strcmp(e->Name(), "mxCell") == 0 || is_wrapper(e));
        if (!cell_node) {
            if (xml::is_preservable(node))
                page.extra_root_children.push_back(xml::print_node(node));
            else
                ctx.note(ErrorCode::MalformedXml, "unsupported node dropped", path);
            continue;
        }

        RawCell raw;
        raw.path = xml::indexed(path, e->Name(), ++counters[e->Name()]);
        if (is_wrapper(e)) {
            raw.wrapper = e;
            raw.cell = e->FirstChildElement("mxCell");
            if (!raw.cell)
                return node_error(ErrorCode::MalformedXml, "wrapper without mxCell", raw.path, e);
        } else {
            raw.cell = e;
        }
        const char* id = e->Attribute("id");
        if (!id || !*id)
            return node_error(ErrorCode::MalformedXml, "cell without id", raw.path, e);
        raw.id = id;
        if (const char* parent = raw.cell->Attribute("parent")) raw.parent = std::string(parent);
        if (!by_id.emplace(raw.id, cells.size()).second)
            return node_error(ErrorCode::DuplicateId, "duplicate cell id '" + raw.id + "'", raw.path, e);
        cells.push_back(std::move(raw));
    }

    std::unordered_set<std::string> containers;
    for (const auto& raw : cells) {
        if (!raw.parent) continue;
        if (!by_id.count(*raw.parent))
            return node_error(ErrorCode::UnresolvableReference,
                "parent '" + *raw.parent + "' of '" + raw.id + "' does not exist", raw.path, raw.cell);
        containers.insert(*raw.parent);
    }
    for (const auto& raw : cells) {
        std::optional<std::string> current = raw.parent;
        std::size_t steps = 0;
        while (current) {
            if (*current == raw.id || ++steps > cells.size())
                return node_error(ErrorCode::InvariantViolation,
                    "containment cycle through '" + raw.id + "'", raw.path, raw.cell);
            current = cells[by_id.at(*current)].parent;
        }
    }

    for (const auto& raw : cells) {
        const bool drawable = flag_set(raw.cell, "vertex") || flag_set(raw.cell, "edge");
        const bool is_root = !raw.parent;
        const bool is_layer = raw.parent && !cells[by_id.at(*raw.parent)].parent && !drawable;
        if (is_root || is_layer) {
            page.layers.push_back(read_layer(raw, ctx));
            continue;
        }
        // Same rule as Page::renumber: the group token or members make a group.
        const char* style = raw.cell->Attribute("style");
        const bool grouped_style = style && diagram_model::is_group_style(diagram_style::parse_style(style).record);
        const bool is_group = !flag_set(raw.cell, "edge") && (grouped_style || containers.count(raw.id));
        Element element;
        if (Status s = read_element(raw, is_group, element, ctx); !s.ok()) return s;
        page.elements.push_back(std::move(element));
    }

    for (auto& e : page.elements) {
        diagram_model::ConnectorData* c = e.connector();
        if (!c) continue;
        const std::string cell_path = cells[by_id.at(e.id)].path;
        for (auto side : { diagram_model::EndpointSide::Source, diagram_model::EndpointSide::Target }) {
            auto& ref = c->endpoint(side);
            if (!ref || page.find(*ref)) continue;
            const std::string message = std::string(side == diagram_model::EndpointSide::Source ? "source" : "target")
                + " '" + *ref + "' of connector '" + e.id + "' does not exist";
            switch (ctx.options.dangling) {
            case DanglingPolicy::Reject:
                return node_error(ErrorCode::UnresolvableReference, message, cell_path,
                    cells[by_id.at(e.id)].cell);
            case DanglingPolicy::Retain:
                c->dangling(side) = true;
                ctx.note(ErrorCode::UnresolvableReference, message + "; kept dangling", cell_path);
                break;
            case DanglingPolicy::Detach:
                ref.reset();
                ctx.note(ErrorCode::UnresolvableReference, message + "; detached", cell_path);
                break;
            }
        }
    }
    // Also lists group members, following the parent links.
    page.renumber();
    return Status::success();
}

Status read_graph_model(const XMLElement* model, Page& page, DecodeContext& ctx, const std::string& path) {
    for (const auto* a = model->FirstAttribute(); a; a = a->Next()) {
        const std::string name = a->Name();
        if (name == "grid") {
            page.settings.grid_enabled = std::strcmp(a->Value(), "0") != 0;
        } else if (name == "gridSize") {
            const auto v = xml::parse_number(a->Value());
            if (!v || !std::isfinite(*v) || *v <= 0) return node_error(ErrorCode::MalformedXml, "bad gridSize", path, model);
            page.settings.grid_size = *v;
        } else if (name == "background") {
            page.settings.background = a->Value();
        } else {
            page.settings.extra_attributes.push_back({ name, a->Value() });
        }
    }

    const XMLElement* root = model->FirstChildElement("root");
    if (root) {
        for (const auto* a = root->FirstAttribute(); a; a = a->Next())
            page.root_attributes.push_back({ a->Name(), a->Value() });
        if (Status s = read_root(root, page, ctx, path + "/root"); !s.ok()) return s;
    }
    keep_children(model, root, page.extra_model_children, ctx, path);

    if (Status s = diagram_model::check_page_invariants(page); !s.ok()) {
        diagram_model::Error error = s.error();
        error.path = path;
        return Status(error);
    }
    return Status::success();
}

Status read_page(const XMLElement* node, int index, Page& page, DecodeContext& ctx, const std::string& path) {
    for (const auto* a = node->FirstAttribute(); a; a = a->Next()) {
        const std::string name = a->Name();
        if (name == "id") page.id = a->Value();
        else if (name == "name") page.name = a->Value();
        else page.extra_attributes.push_back({ name, a->Value() });
    }
    if (page.id.empty()) page.id = "page-" + std::to_string(index);

    const XMLElement* model = node->FirstChildElement("mxGraphModel");
    std::string payload;
    for (const XMLNode* child = node->FirstChild(); child; child = child->NextSibling()) {
        if (child == model || xml::is_blank_text(child)) continue;
        if (const tinyxml2::XMLText* text = child->ToText())
            payload += text->Value();
        else if (xml::is_preservable(child))
            page.extra_children.push_back(xml::print_node(child));
    }

    if (model) {
        if (!payload.empty())
            ctx.note(ErrorCode::MalformedXml, "compressed payload ignored next to a plain graph model", path);
        return read_graph_model(model, page, ctx, path + "/mxGraphModel");
    }
    if (payload.empty()) return Status::success();

    auto unpacked = unpack_page(payload);
    if (!unpacked.ok()) {
        diagram_model::Error error = unpacked.error();
        error.path = path;
        error.fragment = payload.substr(0, 80);
        return Status(error);
    }
    page.encoding.compressed = true;
    page.encoding.uri_encoded = unpacked->uri_encoded;

    tinyxml2::XMLDocument inner;
    if (inner.Parse(unpacked->xml.c_str(), unpacked->xml.size()) != tinyxml2::XML_SUCCESS)
        return make_error(ErrorCode::MalformedXml,
            std::string("compressed page: ") + inner.ErrorStr(), path, unpacked->xml.substr(0, 160));
    const XMLElement* inner_model = inner.RootElement();
    if (!inner_model || std::strcmp(inner_model->Name(), "mxGraphModel") != 0)
        return make_error(ErrorCode::MalformedXml, "compressed page does not hold an mxGraphModel", path,
            xml::excerpt(inner_model));
    return read_graph_model(inner_model, page, ctx, path + "/mxGraphModel");
}

std::string source_line(std::string_view bytes, int line) {
    std::size_t begin = 0;
    for (int i = 1; i < line && begin != std::string_view::npos; ++i) {
        begin = bytes.find('\n', begin);
        if (begin != std::string_view::npos) ++begin;
    }
    if (begin == std::string_view::npos || begin >= bytes.size()) return {};
    const std::size_t end = bytes.find('\n', begin);
    std::string out(bytes.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin));
    if (out.size() > 160) out.resize(160);
    return out;
}

} // namespace

Result<Document> decode(std::string_view bytes, const DecodeOptions& options, std::vector<Diagnostic>* diagnostics) {
    DecodeContext ctx{ options, diagnostics };

    tinyxml2::XMLDocument xml;
    if (xml.Parse(bytes.data(), bytes.size()) != tinyxml2::XML_SUCCESS) {
        const int line = xml.ErrorLineNum();
        return make_error(ErrorCode::MalformedXml, xml.ErrorStr(), "line " + std::to_string(line),
            source_line(bytes, line));
    }

    Document document;
    const XMLNode* first = xml.FirstChild();
    document.xml_declaration = first && first->ToDeclaration();

    const XMLElement* root = xml.RootElement();
    if (!root) return make_error(ErrorCode::MalformedXml, "document has no root element");

    if (std::strcmp(root->Name(), "mxGraphModel") == 0) {
        document.bare_graph_model = true;
        Page page;
        page.id = "page-1";
        page.name = "Page-1";
        if (Status s = read_graph_model(root, page, ctx, "mxGraphModel"); !s.ok()) return s;
        document.pages.push_back(std::move(page));
    } else if (std::strcmp(root->Name(), "mxfile") == 0) {
        for (const auto* a = root->FirstAttribute(); a; a = a->Next()) {
            const std::string name = a->Name();
            if (name == "id") document.id = a->Value();
            else if (name == "name") document.name = a->Value();
            else if (name == "version") document.version = a->Value();
            else document.extra_attributes.push_back({ name, a->Value() });
        }

        std::unordered_set<std::string> page_ids;
        int index = 0;
        for (const XMLNode* node = root->FirstChild(); node; node = node->NextSibling()) {
            if (xml::is_blank_text(node)) continue;
            const XMLElement* e = node->ToElement();
            if (!e || std::strcmp(e->Name(), "diagram") != 0) {
                if (xml::is_preservable(node))
                    document.extra_children.push_back(xml::print_node(node));
                else
                    ctx.note(ErrorCode::MalformedXml, "unsupported node dropped", "mxfile");
                continue;
            }
            ++index;
            const std::string path = xml::indexed("mxfile", "diagram", index);
            Page page;
            if (Status s = read_page(e, index, page, ctx, path); !s.ok()) return s;
            if (!page_ids.insert(page.id).second)
                return node_error(ErrorCode::DuplicateId, "duplicate page id '" + page.id + "'", path, e);
            document.pages.push_back(std::move(page));
        }
    } else {
        return node_error(ErrorCode::MalformedXml,
            std::string("unexpected root element '") + root->Name() + "'", root->Name(), root);
    }

    diagram_model::core_logger()->debug("decoded {} page(s)", document.pages.size());
    return document;
}

} // namespace diagram_codec
