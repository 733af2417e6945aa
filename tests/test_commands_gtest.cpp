#include <gtest/gtest.h>
#include <diagram_codec/codec.hpp>
#include <diagram_commands/command_manager.hpp>
#include <diagram_commands/commands.hpp>
#include <diagram_model/invariants.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace diagram_commands;
using diagram_model::Document;
using diagram_model::ErrorCode;
using diagram_model::Rect;
using diagram_model::make_shape;

namespace {

class CommandManagerTest : public ::testing::Test {
protected:
    Status create(const std::string& id, double x = 0, double y = 0) {
        return manager.create_element(page, make_shape(id, id, Rect{ x, y, 100, 50 }));
    }

    std::string encoded() const {
        auto bytes = diagram_codec::encode(diagram.document());
        EXPECT_TRUE(bytes.ok());
        return bytes.ok() ? *bytes : std::string();
    }

    bool valid() const { return diagram_model::check_document_invariants(diagram.document()).ok(); }

    Diagram diagram;
    CommandManager manager{ diagram };
    const std::string page = "page-1";
};

class CountingObserver : public diagram_model::ModelObserver {
public:
    void on_model_changed(const diagram_model::ChangeEvent& event) override {
        ++count;
        if (hook) hook(event);
    }

    int count = 0;
    std::function<void(const diagram_model::ChangeEvent&)> hook;
};

class RecordingListener : public HistoryListener {
public:
    void on_history_changed(const HistoryEvent& event) override {
        events.push_back(event);
        if (hook) hook(event);
    }

    std::vector<HistoryEvent> events;
    std::function<void(const HistoryEvent&)> hook;
};

} // namespace

TEST_F(CommandManagerTest, ConnectUndoRedo) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B", 200, 0).ok());
    ASSERT_TRUE(manager.connect(page, "c", "A", "B").ok());
    ASSERT_NE(diagram.element(page, "c"), nullptr);

    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(diagram.element(page, "c"), nullptr);
    EXPECT_NE(diagram.element(page, "A"), nullptr);
    EXPECT_NE(diagram.element(page, "B"), nullptr);

    ASSERT_TRUE(manager.redo().ok());
    const auto* c = diagram.element(page, "c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->connector()->source_id, "A");
    EXPECT_EQ(c->connector()->target_id, "B");
    EXPECT_TRUE(valid());
}

TEST_F(CommandManagerTest, UndoRestoresByteIdenticalDocument) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B", 200, 0).ok());
    ASSERT_TRUE(manager.connect(page, "c", "A", "B", "endArrow=block;html=1;").ok());
    const std::string before = encoded();
    const Document snapshot = diagram.document();

    auto restyled = diagram.element(page, "A")->style;
    ASSERT_TRUE(restyled.set("fillColor", "#dae8fc"));
    ASSERT_TRUE(manager.restyle_element(page, "A", restyled).ok());
    ASSERT_TRUE(manager.move_element(page, "A", 40, 40).ok());
    ASSERT_TRUE(manager.set_label(page, "B", "renamed").ok());
    ASSERT_TRUE(manager.group(page, "g", { "A", "B" }).ok());
    ASSERT_TRUE(manager.delete_element(page, "g").ok());
    EXPECT_EQ(diagram.element(page, "A"), nullptr);

    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(manager.undo().ok()) << i;
    EXPECT_TRUE(diagram.document() == snapshot);
    EXPECT_EQ(encoded(), before);

    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(manager.redo().ok()) << i;
    EXPECT_EQ(diagram.element(page, "g"), nullptr);
    EXPECT_TRUE(valid());
}

TEST_F(CommandManagerTest, EmptyHistoryReportsNothingToDo) {
    EXPECT_FALSE(manager.can_undo());
    EXPECT_FALSE(manager.can_redo());
    EXPECT_EQ(manager.undo().code(), ErrorCode::NothingToUndo);
    EXPECT_EQ(manager.redo().code(), ErrorCode::NothingToRedo);
    EXPECT_FALSE(manager.undo_description().has_value());

    ASSERT_TRUE(create("A").ok());
    EXPECT_EQ(manager.redo().code(), ErrorCode::NothingToRedo);
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(manager.undo().code(), ErrorCode::NothingToUndo);
}

TEST_F(CommandManagerTest, ExecuteDropsRedoTail) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B").ok());
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_TRUE(manager.can_redo());

    ASSERT_TRUE(create("C").ok());
    EXPECT_FALSE(manager.can_redo());
    EXPECT_EQ(manager.history_size(), 2u);
    EXPECT_EQ(diagram.element(page, "B"), nullptr);
}

TEST_F(CommandManagerTest, RejectedCommandIsNotRecorded) {
    ASSERT_TRUE(create("A").ok());
    const Document before = diagram.document();
    EXPECT_EQ(create("A").code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(manager.move_element(page, "missing", 1, 1).code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(manager.connect(page, "c", "A", "").code(), ErrorCode::InvariantViolation);
    EXPECT_EQ(manager.history_size(), 1u);
    EXPECT_TRUE(diagram.document() == before);
    EXPECT_EQ(manager.undo_description(), "Create shape 'A'");
}

TEST_F(CommandManagerTest, HistoryLimitDropsOldestEntries) {
    CommandManager small(diagram, 3);
    EXPECT_EQ(small.history_limit(), 3u);
    ASSERT_TRUE(small.create_element(page, make_shape("A", "", Rect{ 0, 0, 10, 10 })).ok());
    for (int i = 1; i <= 4; ++i)
        ASSERT_TRUE(small.move_element(page, "A", i * 10, 0).ok());
    EXPECT_EQ(small.history_size(), 3u);

    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(small.undo().ok());
    EXPECT_EQ(small.undo().code(), ErrorCode::NothingToUndo);
    // The creation and the first move fell off; A stays where the second move put it.
    ASSERT_NE(diagram.element(page, "A"), nullptr);
    EXPECT_EQ(diagram.element(page, "A")->geometry.x, 10);

    ASSERT_TRUE(small.set_history_limit(1).ok());
    EXPECT_EQ(small.history_size(), 1u);
    ASSERT_TRUE(small.clear().ok());
    EXPECT_FALSE(small.can_redo());
    EXPECT_EQ(small.history_size(), 0u);
}

TEST_F(CommandManagerTest, Descriptions) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B").ok());
    ASSERT_TRUE(manager.connect(page, "c", "A", "B").ok());
    EXPECT_EQ(manager.undo_description(), "Connect 'A' to 'B'");
    ASSERT_TRUE(manager.move_element(page, "A", 5, 5).ok());
    EXPECT_EQ(manager.undo_description(), "Move 'A'");
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(manager.redo_description(), "Move 'A'");
    EXPECT_EQ(manager.undo_description(), "Connect 'A' to 'B'");
}

TEST_F(CommandManagerTest, CanExecuteLeavesModelAlone) {
    ASSERT_TRUE(create("A").ok());
    CountingObserver observer;
    diagram.subscribe(&observer);
    const Document before = diagram.document();

    EXPECT_TRUE(manager.can_execute(MoveElementCommand(page, "A", 300, 300)));
    EXPECT_FALSE(manager.can_execute(MoveElementCommand(page, "missing", 300, 300)));
    EXPECT_FALSE(manager.can_execute(CreateElementCommand(page, make_shape("A", "", Rect{}))));
    EXPECT_TRUE(diagram.document() == before);
    EXPECT_EQ(observer.count, 0);
    EXPECT_EQ(manager.history_size(), 1u);
}

TEST_F(CommandManagerTest, MutationFromObserverIsRejected) {
    CountingObserver observer;
    Status nested;
    Status nested_validate;
    observer.hook = [&](const diagram_model::ChangeEvent&) {
        nested = create("nested");
        nested_validate = manager.validate(MoveElementCommand(page, "A", 1, 1));
    };
    diagram.subscribe(&observer);

    ASSERT_TRUE(create("A").ok());
    EXPECT_EQ(nested.code(), ErrorCode::ReentrantMutation);
    EXPECT_EQ(nested_validate.code(), ErrorCode::ReentrantMutation);
    EXPECT_EQ(diagram.element(page, "nested"), nullptr);
    EXPECT_EQ(manager.history_size(), 1u);
}

TEST_F(CommandManagerTest, HistoryIsFrozenDuringChangeNotification) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(manager.move_element(page, "A", 50, 0).ok());
    CountingObserver observer;
    Status cleared;
    Status limited;
    Status nested_undo;
    observer.hook = [&](const diagram_model::ChangeEvent&) {
        cleared = manager.clear();
        limited = manager.set_history_limit(0);
        nested_undo = manager.undo();
    };
    diagram.subscribe(&observer);

    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(observer.count, 1);
    EXPECT_EQ(cleared.code(), ErrorCode::ReentrantMutation);
    EXPECT_EQ(limited.code(), ErrorCode::ReentrantMutation);
    EXPECT_EQ(nested_undo.code(), ErrorCode::ReentrantMutation);
    EXPECT_EQ(manager.history_size(), 2u);
    EXPECT_EQ(manager.history_limit(), CommandManager::default_history_limit);
    EXPECT_EQ(manager.redo_description(), "Move 'A'");
    EXPECT_EQ(diagram.element(page, "A")->geometry.x, 0);

    ASSERT_TRUE(manager.redo().ok());
    EXPECT_EQ(cleared.code(), ErrorCode::ReentrantMutation);
    EXPECT_EQ(manager.history_size(), 2u);
    EXPECT_EQ(diagram.element(page, "A")->geometry.x, 50);
}

TEST_F(CommandManagerTest, HistoryListenersSeeEveryChange) {
    RecordingListener listener;
    const ListenerId id = manager.add_listener(&listener);
    EXPECT_EQ(manager.listener_count(), 1u);

    ASSERT_TRUE(create("A").ok());
    EXPECT_EQ(create("A").code(), ErrorCode::InvariantViolation);
    ASSERT_TRUE(manager.undo().ok());
    ASSERT_TRUE(manager.redo().ok());
    ASSERT_TRUE(manager.set_history_limit(10).ok());
    ASSERT_TRUE(manager.clear().ok());

    ASSERT_EQ(listener.events.size(), 5u);
    EXPECT_EQ(listener.events[0].action, HistoryAction::Executed);
    EXPECT_EQ(listener.events[0].description, "Create shape 'A'");
    EXPECT_TRUE(listener.events[0].can_undo);
    EXPECT_EQ(listener.events[1].action, HistoryAction::Undone);
    EXPECT_FALSE(listener.events[1].can_undo);
    EXPECT_TRUE(listener.events[1].can_redo);
    EXPECT_EQ(listener.events[2].action, HistoryAction::Redone);
    EXPECT_EQ(listener.events[3].action, HistoryAction::LimitChanged);
    EXPECT_EQ(listener.events[4].action, HistoryAction::Cleared);
    EXPECT_FALSE(listener.events[4].can_undo);
    EXPECT_STREQ(to_string(HistoryAction::Cleared), "Cleared");

    EXPECT_TRUE(manager.remove_listener(id));
    EXPECT_FALSE(manager.remove_listener(id));
    ASSERT_TRUE(create("B").ok());
    EXPECT_EQ(listener.events.size(), 5u);
}

TEST_F(CommandManagerTest, ListenerCannotChangeHistory) {
    RecordingListener listener;
    Status nested;
    ListenerId id = 0;
    listener.hook = [&](const HistoryEvent&) {
        nested = manager.undo();
        EXPECT_TRUE(manager.remove_listener(id));
    };
    id = manager.add_listener(&listener);

    ASSERT_TRUE(create("A").ok());
    EXPECT_EQ(nested.code(), ErrorCode::ReentrantMutation);
    EXPECT_TRUE(manager.can_undo());
    EXPECT_EQ(manager.listener_count(), 0u);
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(listener.events.size(), 1u);
}

TEST_F(CommandManagerTest, DefaultReconnectPolicyAppliesToDelete) {
    CommandManager cascading(diagram, 10, ReconnectPolicy::Cascade);
    EXPECT_EQ(cascading.reconnect_policy(), ReconnectPolicy::Cascade);
    ASSERT_TRUE(cascading.create_element(page, make_shape("A", "", Rect{ 0, 0, 10, 10 })).ok());
    ASSERT_TRUE(cascading.create_element(page, make_shape("B", "", Rect{ 50, 0, 10, 10 })).ok());
    ASSERT_TRUE(cascading.connect(page, "c", "A", "B").ok());

    ASSERT_TRUE(cascading.delete_element(page, "B").ok());
    EXPECT_EQ(diagram.element(page, "c"), nullptr);
    ASSERT_TRUE(cascading.undo().ok());

    ASSERT_TRUE(cascading.delete_element(page, "B", ReconnectPolicy::Detach).ok());
    ASSERT_NE(diagram.element(page, "c"), nullptr);
    EXPECT_FALSE(diagram.element(page, "c")->connector()->target_id.has_value());
}

TEST_F(CommandManagerTest, UndoFailsWhenDocumentDriftedOutsideHistory) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(diagram.move_element(page, "A", 77, 0).ok());
    EXPECT_EQ(manager.undo().code(), ErrorCode::InvariantViolation);
    EXPECT_TRUE(manager.can_undo());
    EXPECT_NE(diagram.element(page, "A"), nullptr);
}

TEST_F(CommandManagerTest, DeleteWithDetachRestoresConnectorOnUndo) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B", 200, 100).ok());
    ASSERT_TRUE(manager.connect(page, "c", "A", "B").ok());
    const Document before = diagram.document();

    ASSERT_TRUE(manager.delete_element(page, "B").ok());
    const auto* c = diagram.element(page, "c");
    ASSERT_NE(c, nullptr);
    EXPECT_FALSE(c->connector()->target_id.has_value());
    ASSERT_TRUE(c->geometry.target_point.has_value());
    EXPECT_EQ(c->geometry.target_point->x, 250);

    ASSERT_TRUE(manager.undo().ok());
    EXPECT_TRUE(diagram.document() == before);

    ASSERT_TRUE(manager.delete_element(page, "B", ReconnectPolicy::Cascade).ok());
    EXPECT_EQ(diagram.element(page, "c"), nullptr);
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_TRUE(diagram.document() == before);
}

TEST_F(CommandManagerTest, GroupingCommands) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B", 200, 0).ok());
    ASSERT_TRUE(create("C", 400, 0).ok());
    ASSERT_TRUE(manager.group(page, "g", { "A", "B" }).ok());
    ASSERT_TRUE(manager.execute(std::make_unique<AddToGroupCommand>(page, "g", "C")).ok());
    EXPECT_EQ(diagram.element(page, "g")->group()->child_ids.size(), 3u);

    ASSERT_TRUE(manager.ungroup(page, "g").ok());
    EXPECT_EQ(diagram.element(page, "g"), nullptr);
    EXPECT_EQ(diagram.element(page, "A")->parent_id, "1");

    ASSERT_TRUE(manager.undo().ok());
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(diagram.element(page, "g")->group()->child_ids, (std::vector<std::string>{ "A", "B" }));
    EXPECT_EQ(diagram.element(page, "C")->parent_id, "1");
    EXPECT_TRUE(valid());
}

TEST_F(CommandManagerTest, ConnectorEditingCommands) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B", 200, 0).ok());
    ASSERT_TRUE(create("C", 400, 0).ok());
    ASSERT_TRUE(manager.connect(page, "c", "A", "B").ok());

    ASSERT_TRUE(manager.execute(std::make_unique<SetEndpointCommand>(page, "c", EndpointSide::Target, "C")).ok());
    EXPECT_EQ(diagram.element(page, "c")->connector()->target_id, "C");
    const std::vector<Point> points{ { 100, 200 }, { 300, 200 } };
    ASSERT_TRUE(manager.execute(std::make_unique<SetWaypointsCommand>(page, "c", points)).ok());
    EXPECT_EQ(diagram.element(page, "c")->geometry.points, points);
    ASSERT_TRUE(manager.disconnect(page, "c", EndpointSide::Source).ok());
    EXPECT_FALSE(diagram.element(page, "c")->connector()->source_id.has_value());

    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(manager.undo().ok());
    const auto* c = diagram.element(page, "c");
    EXPECT_EQ(c->connector()->source_id, "A");
    EXPECT_EQ(c->connector()->target_id, "B");
    EXPECT_TRUE(c->geometry.points.empty());
}

TEST_F(CommandManagerTest, ReorderAndResize) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(create("B").ok());
    ASSERT_TRUE(manager.execute(std::make_unique<ReorderElementCommand>(page, "B", 0)).ok());
    EXPECT_EQ(diagram.element(page, "B")->z_order, 0u);
    ASSERT_TRUE(manager.resize_element(page, "A", 30, 40).ok());
    EXPECT_EQ(diagram.element(page, "A")->geometry.width, 30);
    EXPECT_EQ(manager.resize_element(page, "A", -1, 40).code(), ErrorCode::InvariantViolation);

    ASSERT_TRUE(manager.undo().ok());
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(diagram.element(page, "A")->z_order, 0u);
    EXPECT_EQ(diagram.element(page, "A")->geometry.width, 100);
}

TEST_F(CommandManagerTest, PageCommands) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(manager.execute(std::make_unique<AddPageCommand>(diagram_model::make_page("page-2", "Second"))).ok());
    ASSERT_EQ(diagram.document().pages.size(), 2u);
    EXPECT_EQ(manager.undo_description(), "Add page 'Second'");

    ASSERT_TRUE(manager.execute(std::make_unique<RenamePageCommand>("page-1", "Main")).ok());
    EXPECT_EQ(diagram.page("page-1")->name, "Main");
    ASSERT_TRUE(manager.execute(std::make_unique<RemovePageCommand>("page-1")).ok());
    EXPECT_EQ(diagram.page("page-1"), nullptr);
    EXPECT_EQ(manager.execute(std::make_unique<RemovePageCommand>("page-1")).code(), ErrorCode::InvariantViolation);

    ASSERT_TRUE(manager.undo().ok());
    ASSERT_EQ(diagram.document().pages.size(), 2u);
    EXPECT_EQ(diagram.document().pages[0].id, "page-1");
    EXPECT_NE(diagram.element("page-1", "A"), nullptr);

    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(diagram.page("page-1")->name, "Page-1");
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(diagram.page("page-2"), nullptr);
    ASSERT_TRUE(manager.redo().ok());
    EXPECT_NE(diagram.page("page-2"), nullptr);
}

TEST_F(CommandManagerTest, VisibilityAndDocumentCommands) {
    ASSERT_TRUE(create("A").ok());
    ASSERT_TRUE(manager.set_visible(page, "A", false).ok());
    EXPECT_FALSE(diagram.element(page, "A")->visible);
    EXPECT_EQ(manager.undo_description(), "Hide 'A'");

    ASSERT_TRUE(manager.execute(std::make_unique<AddPageCommand>(diagram_model::make_page("page-2", "Second"))).ok());
    ASSERT_TRUE(manager.execute(std::make_unique<MovePageCommand>("page-2", 0)).ok());
    EXPECT_EQ(diagram.document().pages[0].id, "page-2");
    EXPECT_EQ(manager.execute(std::make_unique<MovePageCommand>("page-2", 5)).code(), ErrorCode::InvariantViolation);

    diagram_model::PageSettings settings = diagram.page(page)->settings;
    settings.grid_enabled = false;
    settings.grid_size = 25;
    ASSERT_TRUE(manager.execute(std::make_unique<SetPageSettingsCommand>(page, settings)).ok());
    EXPECT_EQ(diagram.page(page)->settings.grid_size, 25);
    settings.grid_size = 0;
    EXPECT_EQ(manager.execute(std::make_unique<SetPageSettingsCommand>(page, settings)).code(),
        ErrorCode::InvariantViolation);

    ASSERT_TRUE(manager.execute(std::make_unique<SetDocumentNameCommand>("Plan")).ok());
    EXPECT_EQ(diagram.document().name, "Plan");
    EXPECT_EQ(manager.history_size(), 6u);

    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(diagram.document().name, "");
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_TRUE(diagram.page(page)->settings.grid_enabled);
    EXPECT_EQ(diagram.page(page)->settings.grid_size, 10);
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_EQ(diagram.document().pages[0].id, page);
    ASSERT_TRUE(manager.undo().ok());
    ASSERT_TRUE(manager.undo().ok());
    EXPECT_TRUE(diagram.element(page, "A")->visible);

    // Every mutation went through the history, so the whole stack replays.
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(manager.redo().ok()) << i;
    EXPECT_EQ(diagram.document().name, "Plan");
    EXPECT_FALSE(diagram.element(page, "A")->visible);
    EXPECT_TRUE(valid());
}

TEST(CommandTest, ElementCommandRecordsDelta) {
    Diagram diagram;
    CreateElementCommand command("page-1", make_shape("A", "", Rect{ 0, 0, 10, 10 }));
    EXPECT_FALSE(command.undo(diagram).ok());
    ASSERT_TRUE(command.execute(diagram).ok());
    EXPECT_EQ(command.page_id(), "page-1");
    ASSERT_EQ(command.delta().changes.size(), 1u);
    EXPECT_FALSE(command.delta().changes[0].before.has_value());
    EXPECT_TRUE(command.delta().changes[0].after.has_value());
    ASSERT_TRUE(command.undo(diagram).ok());
    EXPECT_EQ(diagram.element("page-1", "A"), nullptr);
}
