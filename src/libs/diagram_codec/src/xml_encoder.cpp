#include <diagram_codec/codec.hpp>
#include <diagram_codec/envelope.hpp>
#include <diagram_model/logging.hpp>
#include "xml_support.hpp"

namespace diagram_codec {

using diagram_model::AttributeList;
using diagram_model::Document;
using diagram_model::Element;
using diagram_model::Geometry;
using diagram_model::LayerCell;
using diagram_model::Page;
using diagram_model::Point;
using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;
using tinyxml2::XMLNode;

namespace {

class Writer {
public:
    explicit Writer(XMLDocument& doc) : doc_(doc) {}

    Status graph_model(XMLNode* parent, const Page& page);

private:
    Status layer(XMLElement* root, const LayerCell& layer);
    Status element(XMLElement* root, const Element& element);
    Status geometry(XMLElement* cell, const Geometry& geometry);
    Status wrap(XMLElement* root, const diagram_model::CellWrapper& wrapper, const std::string& id,
        const std::string* label, XMLElement* cell);

    void point(XMLElement* parent, const Point& p, const char* as);
    Status children(XMLNode* parent, const std::vector<std::string>& fragments);
    void attributes(XMLElement* e, const AttributeList& list);
    void number(XMLElement* e, const char* name, double value);

    XMLDocument& doc_;
};

Status Writer::graph_model(XMLNode* parent, const Page& page) {
    XMLElement* model = doc_.NewElement("mxGraphModel");
    parent->InsertEndChild(model);
    model->SetAttribute("grid", page.settings.grid_enabled ? "1" : "0");
    number(model, "gridSize", page.settings.grid_size);
    attributes(model, page.settings.extra_attributes);
    if (!page.settings.background.empty())
        model->SetAttribute("background", page.settings.background.c_str());

    XMLElement* root = doc_.NewElement("root");
    model->InsertEndChild(root);
    attributes(root, page.root_attributes);
    for (const auto& l : page.layers)
        if (Status s = layer(root, l); !s.ok()) return s;
    for (const auto& e : page.elements)
        if (Status s = element(root, e); !s.ok()) return s;
    if (Status s = children(root, page.extra_root_children); !s.ok()) return s;
    return children(model, page.extra_model_children);
}

Status Writer::layer(XMLElement* root, const LayerCell& l) {
    XMLElement* cell = doc_.NewElement("mxCell");
    if (!l.wrapper) cell->SetAttribute("id", l.id.c_str());
    if (l.parent_id) cell->SetAttribute("parent", l.parent_id->c_str());
    attributes(cell, l.attributes);
    if (Status s = children(cell, l.extra_children); !s.ok()) return s;
    if (l.wrapper) return wrap(root, *l.wrapper, l.id, nullptr, cell);
    root->InsertEndChild(cell);
    return Status::success();
}

Status Writer::element(XMLElement* root, const Element& e) {
    XMLElement* cell = doc_.NewElement("mxCell");
    if (!e.wrapper) {
        cell->SetAttribute("id", e.id.c_str());
        cell->SetAttribute("value", e.label.c_str());
    }
    if (!e.style.empty())
        cell->SetAttribute("style", e.style.serialize().c_str());
    if (const auto* c = e.connector()) {
        cell->SetAttribute("edge", "1");
        cell->SetAttribute("parent", e.parent_id.c_str());
        if (c->source_id) cell->SetAttribute("source", c->source_id->c_str());
        if (c->target_id) cell->SetAttribute("target", c->target_id->c_str());
    } else {
        cell->SetAttribute("vertex", "1");
        cell->SetAttribute("parent", e.parent_id.c_str());
    }
    if (!e.visible) cell->SetAttribute("visible", "0");
    attributes(cell, e.extra_attributes);

    if (e.geometry.present) {
        if (Status s = geometry(cell, e.geometry); !s.ok()) return s;
    }
    if (Status s = children(cell, e.extra_children); !s.ok()) return s;

    if (e.wrapper) return wrap(root, *e.wrapper, e.id, &e.label, cell);
    root->InsertEndChild(cell);
    return Status::success();
}

Status Writer::geometry(XMLElement* cell, const Geometry& g) {
    XMLElement* node = doc_.NewElement("mxGeometry");
    cell->InsertEndChild(node);
    if (g.x != 0) number(node, "x", g.x);
    if (g.y != 0) number(node, "y", g.y);
    if (g.width != 0) number(node, "width", g.width);
    if (g.height != 0) number(node, "height", g.height);
    if (g.relative) node->SetAttribute("relative", "1");
    attributes(node, g.extra_attributes);
    node->SetAttribute("as", "geometry");

    if (g.source_point) point(node, *g.source_point, "sourcePoint");
    if (g.target_point) point(node, *g.target_point, "targetPoint");
    if (!g.points.empty()) {
        XMLElement* array = doc_.NewElement("Array");
        array->SetAttribute("as", "points");
        node->InsertEndChild(array);
        for (const auto& p : g.points)
            point(array, p, nullptr);
    }
    if (g.offset) point(node, *g.offset, "offset");
    return children(node, g.extra_children);
}

Status Writer::wrap(XMLElement* root, const diagram_model::CellWrapper& wrapper, const std::string& id,
    const std::string* label, XMLElement* cell)
{
    XMLElement* node = doc_.NewElement(wrapper.tag.c_str());
    if (label) node->SetAttribute("label", label->c_str());
    attributes(node, wrapper.attributes);
    node->SetAttribute("id", id.c_str());
    node->InsertEndChild(cell);
    root->InsertEndChild(node);
    return children(node, wrapper.extra_children);
}

void Writer::point(XMLElement* parent, const Point& p, const char* as) {
    XMLElement* node = doc_.NewElement("mxPoint");
    if (p.x != 0) number(node, "x", p.x);
    if (p.y != 0) number(node, "y", p.y);
    if (as) node->SetAttribute("as", as);
    parent->InsertEndChild(node);
}

Status Writer::children(XMLNode* parent, const std::vector<std::string>& fragments) {
    for (const auto& fragment : fragments)
        if (Status s = xml::append_fragment(doc_, parent, fragment); !s.ok()) return s;
    return Status::success();
}

void Writer::attributes(XMLElement* e, const AttributeList& list) {
    for (const auto& a : list)
        e->SetAttribute(a.name.c_str(), a.value.c_str());
}

void Writer::number(XMLElement* e, const char* name, double value) {
    e->SetAttribute(name, xml::format_number(value).c_str());
}

bool should_compress(const Page& page, const EncodeOptions& options) {
    switch (options.compression) {
    case Compression::Always: return true;
    case Compression::Never: return false;
    case Compression::Preserve: return page.encoding.compressed;
    }
    return false;
}

Status write_page(XMLDocument& doc, XMLElement* file, const Page& page, const EncodeOptions& options) {
    XMLElement* node = doc.NewElement("diagram");
    file->InsertEndChild(node);
    node->SetAttribute("id", page.id.c_str());
    node->SetAttribute("name", page.name.c_str());
    for (const auto& a : page.extra_attributes)
        node->SetAttribute(a.name.c_str(), a.value.c_str());

    if (should_compress(page, options)) {
        XMLDocument scratch;
        Writer writer(scratch);
        if (Status s = writer.graph_model(&scratch, page); !s.ok()) return s;

        const bool uri = options.compression == Compression::Preserve && page.encoding.compressed
            ? page.encoding.uri_encoded : options.uri_encode;
        auto packed = pack_page(xml::print_document(scratch, true), uri);
        if (!packed.ok()) return packed.status();
        node->SetText(packed->c_str());
    } else {
        Writer writer(doc);
        if (Status s = writer.graph_model(node, page); !s.ok()) return s;
    }
    for (const auto& fragment : page.extra_children)
        if (Status s = xml::append_fragment(doc, node, fragment); !s.ok()) return s;
    return Status::success();
}

} // namespace

Result<std::string> encode(const Document& document, const EncodeOptions& options) {
    XMLDocument doc;
    if (document.xml_declaration) doc.InsertEndChild(doc.NewDeclaration());

    const bool bare = document.bare_graph_model && document.pages.size() == 1
        && options.compression != Compression::Always;
    if (bare) {
        Writer writer(doc);
        if (Status s = writer.graph_model(&doc, document.pages.front()); !s.ok()) return s;
    } else {
        XMLElement* file = doc.NewElement("mxfile");
        doc.InsertEndChild(file);
        if (!document.id.empty()) file->SetAttribute("id", document.id.c_str());
        if (!document.name.empty()) file->SetAttribute("name", document.name.c_str());
        if (!document.version.empty()) file->SetAttribute("version", document.version.c_str());
        for (const auto& a : document.extra_attributes)
            file->SetAttribute(a.name.c_str(), a.value.c_str());
        for (const auto& page : document.pages)
            if (Status s = write_page(doc, file, page, options); !s.ok()) return s;
        for (const auto& fragment : document.extra_children)
            if (Status s = xml::append_fragment(doc, file, fragment); !s.ok()) return s;
    }

    std::string out = xml::print_document(doc, !options.pretty);
    diagram_model::core_logger()->debug("encoded {} page(s)", document.pages.size());
    return out;
}

} // namespace diagram_codec
