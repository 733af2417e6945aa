#include <diagram_codec/sample_diagram.hpp>
#include <diagram_model/diagram.hpp>
#include <diagram_model/logging.hpp>
#include <initializer_list>

namespace diagram_codec {

namespace {

constexpr const char* class_style = "rounded=0;whiteSpace=wrap;html=1;";
constexpr const char* inherit_style = "endArrow=block;endFill=0;html=1;edgeStyle=orthogonalEdgeStyle;";
constexpr double class_width = 160;
constexpr double class_height = 60;

} // namespace

diagram_model::Document make_sample_document() {
    using diagram_model::Rect;

    diagram_model::Diagram diagram;
    auto report = [](const diagram_model::Status& status) {
        if (!status.ok())
            diagram_model::core_logger()->error("sample diagram: {}", diagram_model::describe(status.error()));
    };

    const std::string classes = "page-1";
    report(diagram.rename_page(classes, "classes"));
    auto add_class = [&](const std::string& page, const char* id, double x, double y,
        std::initializer_list<const char*> parents)
    {
        report(diagram.create_element(page,
            diagram_model::make_shape(id, id, Rect{ x, y, class_width, class_height }, class_style)));
        for (const char* parent : parents) {
            const std::string edge_id = std::string(id) + "->" + parent;
            report(diagram.create_element(page, diagram_model::make_connector(edge_id, id, parent, inherit_style)));
        }
    };

    add_class(classes, "GameObject", 60, 40, {});
    add_class(classes, "Serializable", 400, 40, {});
    add_class(classes, "Entity", 60, 180, { "GameObject" });
    add_class(classes, "Character", 60, 320, { "Entity" });
    add_class(classes, "Player", 60, 460, { "Character", "Serializable" });
    add_class(classes, "Enemy", 300, 460, { "Character" });
    add_class(classes, "NPC", 520, 460, { "Character" });
    add_class(classes, "Item", 740, 320, { "Entity" });
    add_class(classes, "Weapon", 740, 460, { "Item" });

    const std::string tiles = "page-2";
    report(diagram.add_page(diagram_model::make_page(tiles, "tiles")));
    add_class(tiles, "Tile", 60, 40, {});
    add_class(tiles, "FloorTile", 60, 180, { "Tile" });
    add_class(tiles, "WallTile", 300, 180, { "Tile" });
    add_class(tiles, "DoorTile", 520, 180, { "Tile" });
    report(diagram.group_elements(tiles, "tile-group",
        { "Tile", "FloorTile", "WallTile", "DoorTile", "FloorTile->Tile", "WallTile->Tile", "DoorTile->Tile" }));
    report(diagram.set_waypoints(tiles, "DoorTile->Tile", { { 600, 140 }, { 140, 140 } }));

    diagram_model::Document document = diagram.document();
    document.name = "RPG roguelike classes";
    return document;
}

} // namespace diagram_codec
