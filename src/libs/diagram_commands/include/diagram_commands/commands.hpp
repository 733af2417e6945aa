#pragma once

#include <diagram_commands/command.hpp>
#include <diagram_model/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace diagram_commands {

using diagram_model::Element;
using diagram_model::EndpointSide;
using diagram_model::Point;
using diagram_model::ReconnectPolicy;

class CreateElementCommand : public ElementCommand {
public:
    CreateElementCommand(std::string page_id, Element element, std::optional<std::size_t> index = std::nullopt);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    Element element_;
    std::optional<std::size_t> index_;
};

class MoveElementCommand : public ElementCommand {
public:
    MoveElementCommand(std::string page_id, std::string element_id, double x, double y);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string element_id_;
    double x_;
    double y_;
};

class ResizeElementCommand : public ElementCommand {
public:
    ResizeElementCommand(std::string page_id, std::string element_id, double width, double height);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string element_id_;
    double width_;
    double height_;
};

class RestyleElementCommand : public ElementCommand {
public:
    RestyleElementCommand(std::string page_id, std::string element_id, diagram_style::StyleRecord style);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string element_id_;
    diagram_style::StyleRecord style_;
};

class SetLabelCommand : public ElementCommand {
public:
    SetLabelCommand(std::string page_id, std::string element_id, std::string label);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string element_id_;
    std::string label_;
};

class SetVisibleCommand : public ElementCommand {
public:
    SetVisibleCommand(std::string page_id, std::string element_id, bool visible);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string element_id_;
    bool visible_;
};

// Creates a connector between two existing elements.
class ConnectCommand : public ElementCommand {
public:
    ConnectCommand(std::string page_id, std::string connector_id, std::string source_id, std::string target_id,
        std::string style = {});
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string connector_id_;
    std::string source_id_;
    std::string target_id_;
    std::string style_;
};

class SetEndpointCommand : public ElementCommand {
public:
    SetEndpointCommand(std::string page_id, std::string connector_id, EndpointSide side, std::string element_id);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string connector_id_;
    EndpointSide side_;
    std::string element_id_;
};

class DisconnectCommand : public ElementCommand {
public:
    DisconnectCommand(std::string page_id, std::string connector_id, std::optional<EndpointSide> side = std::nullopt);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string connector_id_;
    std::optional<EndpointSide> side_;
};

class SetWaypointsCommand : public ElementCommand {
public:
    SetWaypointsCommand(std::string page_id, std::string connector_id, std::vector<Point> points);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string connector_id_;
    std::vector<Point> points_;
};

class GroupCommand : public ElementCommand {
public:
    GroupCommand(std::string page_id, std::string group_id, std::vector<std::string> child_ids);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string group_id_;
    std::vector<std::string> child_ids_;
};

class AddToGroupCommand : public ElementCommand {
public:
    AddToGroupCommand(std::string page_id, std::string group_id, std::string element_id);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string group_id_;
    std::string element_id_;
};

class UngroupCommand : public ElementCommand {
public:
    UngroupCommand(std::string page_id, std::string group_id);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string group_id_;
};

class ReorderElementCommand : public ElementCommand {
public:
    ReorderElementCommand(std::string page_id, std::string element_id, std::size_t new_index);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string element_id_;
    std::size_t new_index_;
};

class DeleteElementCommand : public ElementCommand {
public:
    DeleteElementCommand(std::string page_id, std::string element_id, ReconnectPolicy policy = ReconnectPolicy::Detach);
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string element_id_;
    ReconnectPolicy policy_;
};

// Page commands keep the page itself and its position so undo can put it back.
class AddPageCommand : public Command {
public:
    explicit AddPageCommand(diagram_model::Page page, std::optional<std::size_t> index = std::nullopt);

    Status execute(Diagram& diagram) override;
    Status undo(Diagram& diagram) override;
    Status redo(Diagram& diagram) override;
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    diagram_model::Page page_;
    std::optional<std::size_t> index_;
};

class RemovePageCommand : public Command {
public:
    explicit RemovePageCommand(std::string page_id);

    Status execute(Diagram& diagram) override;
    Status undo(Diagram& diagram) override;
    Status redo(Diagram& diagram) override;
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string page_id_;
    std::optional<diagram_model::Page> removed_;
    std::size_t index_ = 0;
};

class RenamePageCommand : public Command {
public:
    RenamePageCommand(std::string page_id, std::string name);

    Status execute(Diagram& diagram) override;
    Status undo(Diagram& diagram) override;
    Status redo(Diagram& diagram) override;
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string page_id_;
    std::string name_;
    std::string previous_name_;
};

class MovePageCommand : public Command {
public:
    MovePageCommand(std::string page_id, std::size_t new_index);

    Status execute(Diagram& diagram) override;
    Status undo(Diagram& diagram) override;
    Status redo(Diagram& diagram) override;
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string page_id_;
    std::size_t new_index_;
    std::size_t previous_index_ = 0;
};

class SetPageSettingsCommand : public Command {
public:
    SetPageSettingsCommand(std::string page_id, diagram_model::PageSettings settings);

    Status execute(Diagram& diagram) override;
    Status undo(Diagram& diagram) override;
    Status redo(Diagram& diagram) override;
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string page_id_;
    diagram_model::PageSettings settings_;
    diagram_model::PageSettings previous_;
};

class SetDocumentNameCommand : public Command {
public:
    explicit SetDocumentNameCommand(std::string name);

    Status execute(Diagram& diagram) override;
    Status undo(Diagram& diagram) override;
    Status redo(Diagram& diagram) override;
    std::string description() const override;

protected:
    Status apply(Diagram& diagram) const override;

private:
    std::string name_;
    std::string previous_name_;
};

} // namespace diagram_commands
