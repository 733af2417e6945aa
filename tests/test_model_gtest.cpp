#include <gtest/gtest.h>
#include <diagram_model/diagram.hpp>
#include <diagram_model/invariants.hpp>
#include <cmath>

using namespace diagram_model;

namespace {

class DiagramTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(diagram.create_element(page, make_shape("A", "Alpha", Rect{ 0, 0, 100, 50 })).ok());
        ASSERT_TRUE(diagram.create_element(page, make_shape("B", "Beta", Rect{ 200, 100, 100, 50 })).ok());
        ASSERT_TRUE(diagram.create_element(page, make_connector("c", "A", "B")).ok());
    }

    const Element& element(const std::string& id) const {
        const Element* e = diagram.element(page, id);
        EXPECT_NE(e, nullptr) << id;
        return *e;
    }

    bool valid() const { return check_page_invariants(*diagram.page(page)).ok(); }

    Diagram diagram;
    const std::string page = "page-1";
};

} // namespace

TEST(DiagramBasicsTest, DefaultDiagramHasOnePageWithRootAndLayer) {
    Diagram diagram;
    ASSERT_EQ(diagram.document().pages.size(), 1u);
    const Page& p = diagram.document().pages.front();
    EXPECT_EQ(p.id, "page-1");
    ASSERT_EQ(p.layers.size(), 2u);
    EXPECT_EQ(p.layers[0].id, "0");
    EXPECT_FALSE(p.layers[0].parent_id.has_value());
    EXPECT_EQ(p.default_parent(), "1");
}

TEST_F(DiagramTest, CreateAssignsDefaultParentAndZOrder) {
    EXPECT_EQ(element("A").parent_id, "1");
    EXPECT_EQ(element("A").z_order, 0u);
    EXPECT_EQ(element("B").z_order, 1u);
    EXPECT_EQ(element("c").z_order, 2u);
    EXPECT_TRUE(element("c").is_connector());
    EXPECT_TRUE(valid());
}

TEST_F(DiagramTest, CreateAtIndexShiftsZOrder) {
    ASSERT_TRUE(diagram.create_element(page, make_shape("D", "", Rect{ 0, 0, 10, 10 }), 0).ok());
    EXPECT_EQ(element("D").z_order, 0u);
    EXPECT_EQ(element("A").z_order, 1u);
    EXPECT_EQ(diagram.create_element(page, make_shape("E", "", Rect{}), 99).code(), ErrorCode::InvariantViolation);
}

TEST_F(DiagramTest, RejectedCreateLeavesDocumentUnchanged) {
    const Document before = diagram.document();
    EXPECT_EQ(diagram.create_element(page, make_shape("A", "", Rect{})).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.create_element(page, make_shape("1", "", Rect{})).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.create_element(page, make_shape("X", "", Rect{}, {}, "nowhere")).code(),
        ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.create_element(page, make_shape("X", "", Rect{ 0, 0, -1, 5 })).code(),
        ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.create_element(page, make_shape("X", "", Rect{ std::nan(""), 0, 1, 1 })).code(),
        ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.create_element(page, make_connector("d", "A", "ghost")).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.create_element("nope", make_shape("X", "", Rect{})).code(), ErrorCode::InvariantViolation);
    EXPECT_TRUE(diagram.document() == before);
}

TEST_F(DiagramTest, MoveAndResize) {
    ASSERT_TRUE(diagram.move_element(page, "A", 10, 20).ok());
    EXPECT_EQ(element("A").geometry.x, 10);
    EXPECT_EQ(element("A").geometry.y, 20);
    ASSERT_TRUE(diagram.resize_element(page, "A", 40, 30).ok());
    EXPECT_EQ(element("A").geometry.width, 40);

    EXPECT_EQ(diagram.resize_element(page, "c", 1, 1).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.resize_element(page, "A", -1, 1).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.move_element(page, "missing", 0, 0).code(), ErrorCode::InvariantViolation);
}

TEST_F(DiagramTest, ConnectorsMoveThroughWaypointsOnly) {
    const Document before = diagram.document();
    EXPECT_EQ(diagram.move_element(page, "c", 10, 10).code(), ErrorCode::InvariantViolation);
    EXPECT_TRUE(diagram.document() == before);

    // A label on a connector sits at a relative position along it.
    Element label = make_shape("l", "note", Rect{ -0.5, 0, 0, 0 }, "edgeLabel", "c");
    label.geometry.relative = true;
    label.geometry.offset = Point{ 5, 5 };
    ASSERT_TRUE(diagram.create_element(page, label).ok());
    ASSERT_TRUE(diagram.move_element(page, "l", 0.25, 0).ok());
    EXPECT_EQ(element("l").geometry.x, 0.25);
    EXPECT_EQ(element("l").geometry.y, 0);
    EXPECT_EQ(element("l").geometry.offset, (Point{ 5, 5 }));
    EXPECT_TRUE(valid());
}

TEST_F(DiagramTest, ShapesCannotContainCells) {
    const Document before = diagram.document();
    EXPECT_EQ(diagram.create_element(page, make_shape("X", "", Rect{}, {}, "A")).code(),
        ErrorCode::InvariantViolation);
    EXPECT_TRUE(diagram.document() == before);

    Page p = make_page("p", "P");
    p.elements.push_back(make_shape("A", "", Rect{}, {}, "1"));
    p.elements.push_back(make_shape("B", "", Rect{}, {}, "A"));
    p.renumber();
    EXPECT_EQ(check_page_invariants(p).code(), ErrorCode::InvariantViolation);
}

TEST_F(DiagramTest, EmptyGroupWithoutGroupStyleBecomesShape) {
    ASSERT_TRUE(diagram.create_element(page, make_group("g")).ok());
    ASSERT_TRUE(element("g").is_group());
    EXPECT_TRUE(valid());

    ASSERT_TRUE(diagram.restyle_element(page, "g", diagram_style::parse_style("rounded=1").record).ok());
    EXPECT_TRUE(element("g").is_shape());
    EXPECT_TRUE(valid());
    ASSERT_TRUE(diagram.restyle_element(page, "A", diagram_style::parse_style("group").record).ok());
    EXPECT_TRUE(element("A").is_group());
    EXPECT_TRUE(valid());

    Page p = make_page("p", "P");
    Element hollow = make_group("h", "1");
    hollow.style = diagram_style::StyleRecord{};
    p.elements.push_back(hollow);
    EXPECT_EQ(check_page_invariants(p).code(), ErrorCode::InvariantViolation);
    p.renumber();
    EXPECT_TRUE(p.find("h")->is_shape());
    EXPECT_TRUE(check_page_invariants(p).ok());
}

TEST_F(DiagramTest, RestyleRefreshesDerivedShapeType) {
    ASSERT_TRUE(diagram.restyle_element(page, "A", diagram_style::parse_style("ellipse;locked=1").record).ok());
    EXPECT_EQ(element("A").shape()->shape_type, "ellipse");
    EXPECT_TRUE(element("A").locked());
    ASSERT_TRUE(diagram.restyle_element(page, "c",
        diagram_style::parse_style("edgeStyle=orthogonalEdgeStyle").record).ok());
    EXPECT_EQ(element("c").connector()->routing, "orthogonalEdgeStyle");
}

TEST_F(DiagramTest, LabelsVisibilityAndWaypoints) {
    ASSERT_TRUE(diagram.set_label(page, "c", "uses").ok());
    EXPECT_EQ(element("c").label, "uses");
    ASSERT_TRUE(diagram.set_visible(page, "B", false).ok());
    EXPECT_FALSE(element("B").visible);
    ASSERT_TRUE(diagram.set_waypoints(page, "c", { { 150, 25 }, { 150, 125 } }).ok());
    EXPECT_EQ(element("c").geometry.points.size(), 2u);
    EXPECT_EQ(diagram.set_waypoints(page, "A", {}).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.set_waypoints(page, "c", { { INFINITY, 0 } }).code(), ErrorCode::InvariantViolation);
}

TEST_F(DiagramTest, DisconnectPinsEndAtElementCentre) {
    ASSERT_TRUE(diagram.disconnect(page, "c", EndpointSide::Target).ok());
    const Element& c = element("c");
    EXPECT_FALSE(c.connector()->target_id.has_value());
    ASSERT_TRUE(c.geometry.target_point.has_value());
    EXPECT_EQ(*c.geometry.target_point, (Point{ 250, 125 }));
    EXPECT_EQ(c.connector()->source_id, "A");

    ASSERT_TRUE(diagram.set_endpoint(page, "c", EndpointSide::Target, "A").ok());
    EXPECT_EQ(element("c").connector()->target_id, "A");
    EXPECT_FALSE(element("c").geometry.target_point.has_value());
    EXPECT_EQ(diagram.set_endpoint(page, "c", EndpointSide::Source, "ghost").code(), ErrorCode::InvariantViolation);
    EXPECT_TRUE(valid());
}

TEST(DiagramGroupTest, GroupComputesUnionBoundsAndRelativeChildren) {
    Diagram diagram;
    const std::string page = "page-1";
    ASSERT_TRUE(diagram.create_element(page, make_shape("A", "", Rect{ 100, 100, 50, 50 })).ok());
    ASSERT_TRUE(diagram.create_element(page, make_shape("B", "", Rect{ 200, 150, 50, 50 })).ok());
    ASSERT_TRUE(diagram.group_elements(page, "g", { "B", "A" }).ok());

    const Element* g = diagram.element(page, "g");
    ASSERT_NE(g, nullptr);
    ASSERT_TRUE(g->is_group());
    EXPECT_EQ(g->geometry.bounds(), (Rect{ 100, 100, 150, 100 }));
    EXPECT_EQ(g->group()->child_ids, (std::vector<std::string>{ "A", "B" }));
    EXPECT_EQ(g->z_order, 0u);

    const Element* a = diagram.element(page, "A");
    const Element* b = diagram.element(page, "B");
    EXPECT_EQ(a->parent_id, "g");
    EXPECT_EQ(a->geometry.x, 0);
    EXPECT_EQ(b->geometry.x, 100);
    EXPECT_EQ(b->geometry.y, 50);
    EXPECT_EQ(absolute_bounds(*diagram.page(page), *b), (Rect{ 200, 150, 50, 50 }));
    EXPECT_TRUE(check_page_invariants(*diagram.page(page)).ok());

    ASSERT_TRUE(diagram.ungroup(page, "g").ok());
    EXPECT_EQ(diagram.element(page, "g"), nullptr);
    EXPECT_EQ(diagram.element(page, "B")->geometry.bounds(), (Rect{ 200, 150, 50, 50 }));
    EXPECT_EQ(diagram.element(page, "B")->parent_id, "1");
    EXPECT_TRUE(check_page_invariants(*diagram.page(page)).ok());
}

TEST_F(DiagramTest, GroupRejectsMixedParentsAndDuplicates) {
    ASSERT_TRUE(diagram.group_elements(page, "g", { "A" }).ok());
    EXPECT_EQ(diagram.group_elements(page, "h", { "A", "B" }).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.group_elements(page, "h", { "B", "B" }).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.group_elements(page, "h", {}).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.group_elements(page, "A", { "B" }).code(), ErrorCode::InvariantViolation);
}

TEST_F(DiagramTest, AddToGroupRejectsCycles) {
    ASSERT_TRUE(diagram.group_elements(page, "g", { "A" }).ok());
    ASSERT_TRUE(diagram.group_elements(page, "h", { "g" }).ok());
    const Document before = diagram.document();

    EXPECT_EQ(diagram.add_to_group(page, "g", "h").code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.add_to_group(page, "g", "g").code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.add_to_group(page, "B", "A").code(), ErrorCode::InvariantViolation);
    EXPECT_TRUE(diagram.document() == before);

    ASSERT_TRUE(diagram.add_to_group(page, "g", "B").ok());
    EXPECT_EQ(element("B").parent_id, "g");
    EXPECT_EQ(element("g").group()->child_ids, (std::vector<std::string>{ "A", "B" }));
    EXPECT_TRUE(valid());
}

TEST_F(DiagramTest, DeleteDetachesDependentConnectors) {
    ASSERT_TRUE(diagram.delete_element(page, "A").ok());
    EXPECT_EQ(diagram.element(page, "A"), nullptr);
    const Element& c = element("c");
    EXPECT_FALSE(c.connector()->source_id.has_value());
    ASSERT_TRUE(c.geometry.source_point.has_value());
    EXPECT_EQ(*c.geometry.source_point, (Point{ 50, 25 }));
    EXPECT_EQ(c.connector()->target_id, "B");
    EXPECT_TRUE(valid());
}

TEST_F(DiagramTest, DeleteCascadeRemovesDependentConnectors) {
    ASSERT_TRUE(diagram.delete_element(page, "B", ReconnectPolicy::Cascade).ok());
    EXPECT_EQ(diagram.element(page, "c"), nullptr);
    EXPECT_NE(diagram.element(page, "A"), nullptr);
    EXPECT_TRUE(valid());
}

TEST_F(DiagramTest, DeleteGroupRemovesDescendants) {
    ASSERT_TRUE(diagram.group_elements(page, "g", { "A", "B" }).ok());
    ASSERT_TRUE(diagram.delete_element(page, "g").ok());
    const Page& p = *diagram.page(page);
    ASSERT_EQ(p.elements.size(), 1u);
    EXPECT_EQ(p.elements[0].id, "c");
    EXPECT_EQ(p.elements[0].geometry.source_point, (Point{ 50, 25 }));
    EXPECT_EQ(p.elements[0].geometry.target_point, (Point{ 250, 125 }));
    EXPECT_TRUE(valid());
}

TEST_F(DiagramTest, ReorderElement) {
    ASSERT_TRUE(diagram.reorder_element(page, "c", 0).ok());
    const Page& p = *diagram.page(page);
    EXPECT_EQ(p.elements[0].id, "c");
    EXPECT_EQ(element("A").z_order, 1u);
    EXPECT_EQ(diagram.reorder_element(page, "c", 3).code(), ErrorCode::InvariantViolation);
    EXPECT_TRUE(valid());
}

TEST(DiagramDanglingTest, CreatingMissingElementResolvesDanglingEnd) {
    Document document;
    Page p = make_page("p", "P");
    p.elements.push_back(make_shape("A", "", Rect{ 0, 0, 10, 10 }, {}, "1"));
    Element c = make_connector("c", "A", "ghost", {}, "1");
    c.connector()->target_dangling = true;
    p.elements.push_back(c);
    p.renumber();
    document.pages.push_back(p);
    ASSERT_TRUE(check_document_invariants(document).ok());

    Diagram diagram(document);
    ASSERT_TRUE(diagram.create_element("p", make_shape("ghost", "", Rect{ 50, 0, 10, 10 })).ok());
    EXPECT_FALSE(diagram.element("p", "c")->connector()->target_dangling);
    EXPECT_TRUE(check_page_invariants(*diagram.page("p")).ok());
}

TEST(InvariantTest, DetectsDuplicateIdsAndCycles) {
    Page p = make_page("p", "P");
    p.elements.push_back(make_shape("A", "", Rect{}, {}, "1"));
    p.elements.push_back(make_shape("A", "", Rect{}, {}, "1"));
    p.renumber();
    EXPECT_EQ(check_page_invariants(p).code(), ErrorCode::InvariantViolation);

    Page q = make_page("q", "Q");
    q.elements.push_back(make_group("g", "h"));
    q.elements.push_back(make_group("h", "g"));
    q.renumber();
    EXPECT_EQ(check_page_invariants(q).code(), ErrorCode::InvariantViolation);

    Page r = make_page("r", "R");
    r.elements.push_back(make_connector("c", "A", std::nullopt, {}, "1"));
    r.renumber();
    EXPECT_EQ(check_page_invariants(r).code(), ErrorCode::InvariantViolation);
}

TEST(DiagramPageTest, PageOperations) {
    Diagram diagram;
    ASSERT_TRUE(diagram.add_page(make_page("p2", "Second")).ok());
    EXPECT_EQ(diagram.add_page(make_page("p2", "Again")).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(diagram.add_page(make_page("p3", "Far"), 7).code(), ErrorCode::InvariantViolation);

    ASSERT_TRUE(diagram.move_page("p2", 0).ok());
    EXPECT_EQ(diagram.document().pages[0].id, "p2");
    ASSERT_TRUE(diagram.rename_page("p2", "Renamed").ok());
    EXPECT_EQ(diagram.page("p2")->name, "Renamed");

    PageSettings settings;
    settings.grid_size = 0;
    EXPECT_EQ(diagram.set_page_settings("p2", settings).code(), ErrorCode::InvariantViolation);
    settings.grid_size = 20;
    settings.background = "#ffffff";
    ASSERT_TRUE(diagram.set_page_settings("p2", settings).ok());
    EXPECT_EQ(diagram.page("p2")->settings.grid_size, 20);

    ASSERT_TRUE(diagram.remove_page("p2").ok());
    EXPECT_EQ(diagram.page("p2"), nullptr);
    EXPECT_EQ(diagram.remove_page("p2").code(), ErrorCode::InvariantViolation);
    ASSERT_TRUE(diagram.set_document_name("Doc").ok());
    EXPECT_EQ(diagram.document().name, "Doc");
}

TEST_F(DiagramTest, DeltaReplaysBothWays) {
    const Page before = *diagram.page(page);
    ASSERT_TRUE(diagram.delete_element(page, "A").ok());
    const Page after = *diagram.page(page);
    const ElementDelta delta = diff_pages(before, after);
    EXPECT_FALSE(delta.empty());

    ASSERT_TRUE(diagram.apply_delta(delta, DeltaDirection::Backward).ok());
    EXPECT_TRUE(*diagram.page(page) == before);
    EXPECT_EQ(diagram.apply_delta(delta, DeltaDirection::Backward).code(), ErrorCode::InvariantViolation);
    ASSERT_TRUE(diagram.apply_delta(delta, DeltaDirection::Forward).ok());
    EXPECT_TRUE(*diagram.page(page) == after);
}

TEST(GeometryTest, TranslateAndUnion) {
    Geometry g;
    g.x = 1;
    g.y = 2;
    g.points = { { 10, 10 } };
    g.translate(5, 5);
    EXPECT_EQ(g.x, 6);
    EXPECT_EQ(g.points[0], (Point{ 15, 15 }));

    g.relative = true;
    g.translate(1, 1);
    EXPECT_EQ(g.x, 6);
    EXPECT_EQ(g.points[0], (Point{ 16, 16 }));

    EXPECT_EQ(union_rect(Rect{ 0, 0, 10, 10 }, Rect{ 20, 5, 10, 10 }), (Rect{ 0, 0, 30, 15 }));
    EXPECT_FALSE(is_valid_size(-1, 0));
    EXPECT_FALSE(is_finite_point(INFINITY, 0));
}

TEST(ErrorTest, DescribeAndResult) {
    const Status s = make_error(ErrorCode::MalformedXml, "bad tag", "mxfile/diagram[2]", "<mx");
    EXPECT_FALSE(s.ok());
    EXPECT_EQ(std::string(to_string(s.code())), "MalformedXML");
    EXPECT_EQ(describe(s.error()), "MalformedXML: bad tag at mxfile/diagram[2] near '<mx'");
    EXPECT_TRUE(is_format_error(ErrorCode::DuplicateId));
    EXPECT_FALSE(is_format_error(ErrorCode::NothingToUndo));

    Result<int> ok_result(5);
    EXPECT_TRUE(ok_result.ok());
    EXPECT_EQ(*ok_result, 5);
    Result<int> failed(s);
    EXPECT_EQ(failed.code(), ErrorCode::MalformedXml);
}
