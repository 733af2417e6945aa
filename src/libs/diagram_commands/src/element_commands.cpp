#include <diagram_commands/commands.hpp>

namespace diagram_commands {

namespace {

std::string quoted(const std::string& id) {
    return "'" + id + "'";
}

} // namespace

CreateElementCommand::CreateElementCommand(std::string page_id, Element element, std::optional<std::size_t> index)
    : ElementCommand(std::move(page_id)), element_(std::move(element)), index_(index) {}

Status CreateElementCommand::apply(Diagram& diagram) const {
    return diagram.create_element(page_id(), element_, index_);
}

std::string CreateElementCommand::description() const {
    return std::string("Create ") + diagram_model::to_string(element_.kind()) + " " + quoted(element_.id);
}

MoveElementCommand::MoveElementCommand(std::string page_id, std::string element_id, double x, double y)
    : ElementCommand(std::move(page_id)), element_id_(std::move(element_id)), x_(x), y_(y) {}

Status MoveElementCommand::apply(Diagram& diagram) const {
    return diagram.move_element(page_id(), element_id_, x_, y_);
}

std::string MoveElementCommand::description() const {
    return "Move " + quoted(element_id_);
}

ResizeElementCommand::ResizeElementCommand(std::string page_id, std::string element_id, double width, double height)
    : ElementCommand(std::move(page_id)), element_id_(std::move(element_id)), width_(width), height_(height) {}

Status ResizeElementCommand::apply(Diagram& diagram) const {
    return diagram.resize_element(page_id(), element_id_, width_, height_);
}

std::string ResizeElementCommand::description() const {
    return "Resize " + quoted(element_id_);
}

RestyleElementCommand::RestyleElementCommand(std::string page_id, std::string element_id,
    diagram_style::StyleRecord style)
    : ElementCommand(std::move(page_id)), element_id_(std::move(element_id)), style_(std::move(style)) {}

Status RestyleElementCommand::apply(Diagram& diagram) const {
    return diagram.restyle_element(page_id(), element_id_, style_);
}

std::string RestyleElementCommand::description() const {
    return "Restyle " + quoted(element_id_);
}

SetLabelCommand::SetLabelCommand(std::string page_id, std::string element_id, std::string label)
    : ElementCommand(std::move(page_id)), element_id_(std::move(element_id)), label_(std::move(label)) {}

Status SetLabelCommand::apply(Diagram& diagram) const {
    return diagram.set_label(page_id(), element_id_, label_);
}

std::string SetLabelCommand::description() const {
    return "Edit label of " + quoted(element_id_);
}

SetVisibleCommand::SetVisibleCommand(std::string page_id, std::string element_id, bool visible)
    : ElementCommand(std::move(page_id)), element_id_(std::move(element_id)), visible_(visible) {}

Status SetVisibleCommand::apply(Diagram& diagram) const {
    return diagram.set_visible(page_id(), element_id_, visible_);
}

std::string SetVisibleCommand::description() const {
    return (visible_ ? "Show " : "Hide ") + quoted(element_id_);
}

ConnectCommand::ConnectCommand(std::string page_id, std::string connector_id, std::string source_id,
    std::string target_id, std::string style)
    : ElementCommand(std::move(page_id))
    , connector_id_(std::move(connector_id))
    , source_id_(std::move(source_id))
    , target_id_(std::move(target_id))
    , style_(std::move(style))
{
}

Status ConnectCommand::apply(Diagram& diagram) const {
    if (source_id_.empty() || target_id_.empty())
        return diagram_model::make_error(diagram_model::ErrorCode::InvariantViolation,
            "a connection needs both ends", "page '" + page_id() + "'");
    return diagram.create_element(page_id(),
        diagram_model::make_connector(connector_id_, source_id_, target_id_, style_));
}

std::string ConnectCommand::description() const {
    return "Connect " + quoted(source_id_) + " to " + quoted(target_id_);
}

SetEndpointCommand::SetEndpointCommand(std::string page_id, std::string connector_id, EndpointSide side,
    std::string element_id)
    : ElementCommand(std::move(page_id)), connector_id_(std::move(connector_id)), side_(side),
      element_id_(std::move(element_id)) {}

Status SetEndpointCommand::apply(Diagram& diagram) const {
    return diagram.set_endpoint(page_id(), connector_id_, side_, element_id_);
}

std::string SetEndpointCommand::description() const {
    return std::string("Attach ") + (side_ == EndpointSide::Source ? "source" : "target") + " of "
        + quoted(connector_id_) + " to " + quoted(element_id_);
}

DisconnectCommand::DisconnectCommand(std::string page_id, std::string connector_id, std::optional<EndpointSide> side)
    : ElementCommand(std::move(page_id)), connector_id_(std::move(connector_id)), side_(side) {}

Status DisconnectCommand::apply(Diagram& diagram) const {
    return diagram.disconnect(page_id(), connector_id_, side_);
}

std::string DisconnectCommand::description() const {
    return "Disconnect " + quoted(connector_id_);
}

SetWaypointsCommand::SetWaypointsCommand(std::string page_id, std::string connector_id, std::vector<Point> points)
    : ElementCommand(std::move(page_id)), connector_id_(std::move(connector_id)), points_(std::move(points)) {}

Status SetWaypointsCommand::apply(Diagram& diagram) const {
    return diagram.set_waypoints(page_id(), connector_id_, points_);
}

std::string SetWaypointsCommand::description() const {
    return "Reroute " + quoted(connector_id_);
}

GroupCommand::GroupCommand(std::string page_id, std::string group_id, std::vector<std::string> child_ids)
    : ElementCommand(std::move(page_id)), group_id_(std::move(group_id)), child_ids_(std::move(child_ids)) {}

Status GroupCommand::apply(Diagram& diagram) const {
    return diagram.group_elements(page_id(), group_id_, child_ids_);
}

std::string GroupCommand::description() const {
    return "Group " + std::to_string(child_ids_.size()) + " element(s) as " + quoted(group_id_);
}

AddToGroupCommand::AddToGroupCommand(std::string page_id, std::string group_id, std::string element_id)
    : ElementCommand(std::move(page_id)), group_id_(std::move(group_id)), element_id_(std::move(element_id)) {}

Status AddToGroupCommand::apply(Diagram& diagram) const {
    return diagram.add_to_group(page_id(), group_id_, element_id_);
}

std::string AddToGroupCommand::description() const {
    return "Add " + quoted(element_id_) + " to " + quoted(group_id_);
}

UngroupCommand::UngroupCommand(std::string page_id, std::string group_id)
    : ElementCommand(std::move(page_id)), group_id_(std::move(group_id)) {}

Status UngroupCommand::apply(Diagram& diagram) const {
    return diagram.ungroup(page_id(), group_id_);
}

std::string UngroupCommand::description() const {
    return "Ungroup " + quoted(group_id_);
}

ReorderElementCommand::ReorderElementCommand(std::string page_id, std::string element_id, std::size_t new_index)
    : ElementCommand(std::move(page_id)), element_id_(std::move(element_id)), new_index_(new_index) {}

Status ReorderElementCommand::apply(Diagram& diagram) const {
    return diagram.reorder_element(page_id(), element_id_, new_index_);
}

std::string ReorderElementCommand::description() const {
    return "Reorder " + quoted(element_id_);
}

DeleteElementCommand::DeleteElementCommand(std::string page_id, std::string element_id, ReconnectPolicy policy)
    : ElementCommand(std::move(page_id)), element_id_(std::move(element_id)), policy_(policy) {}

Status DeleteElementCommand::apply(Diagram& diagram) const {
    return diagram.delete_element(page_id(), element_id_, policy_);
}

std::string DeleteElementCommand::description() const {
    return "Delete " + quoted(element_id_);
}

} // namespace diagram_commands
