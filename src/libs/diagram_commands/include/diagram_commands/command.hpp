#pragma once

#include <diagram_model/diagram.hpp>
#include <diagram_model/errors.hpp>
#include <string>

namespace diagram_commands {

using diagram_model::Diagram;
using diagram_model::Status;

// Reversible mutation of a Diagram. A command is executed once, then
// alternates between undo and redo under the CommandManager.
class Command {
public:
    virtual ~Command() = default;

    virtual Status execute(Diagram& diagram) = 0;
    virtual Status undo(Diagram& diagram) = 0;
    virtual Status redo(Diagram& diagram) = 0;
    virtual std::string description() const = 0;

    // Dry run against a scratch copy of the document; the diagram is untouched.
    Status validate(const Diagram& diagram) const;

protected:
    // The forward mutation itself, without any history bookkeeping.
    virtual Status apply(Diagram& diagram) const = 0;
};

// Command confined to one page. Execution records the before and after state
// of every element it touched, and undo/redo replay those states verbatim.
class ElementCommand : public Command {
public:
    Status execute(Diagram& diagram) override;
    Status undo(Diagram& diagram) override;
    Status redo(Diagram& diagram) override;

    const std::string& page_id() const { return page_id_; }
    const diagram_model::ElementDelta& delta() const { return delta_; }

protected:
    explicit ElementCommand(std::string page_id) : page_id_(std::move(page_id)) {}

private:
    std::string page_id_;
    diagram_model::ElementDelta delta_;
    bool executed_ = false;
};

} // namespace diagram_commands
