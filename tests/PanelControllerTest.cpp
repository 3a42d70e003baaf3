#include "PanelController.h"

#include "ConfigStore.h"
#include "FakePanelSurface.h"
#include "PanelCommands.h"
#include "SettingsStore.h"

#include <QTemporaryDir>

#include <gtest/gtest.h>

using PanelPlacement::Side;

namespace {

const QPoint kExpandedCenter(560, 240);
const QPoint kCollapsedCenter(850, 460);

class PanelControllerTest : public ::testing::Test
{
protected:
    PanelControllerTest()
        : settings(dir.filePath(QStringLiteral("settings.json")))
        , config(dir.filePath(QStringLiteral("config.json")))
        , controller(settings, config)
    {
        controller.setSurface(&panel);
    }

    void drag(const QPoint &to) { panel.pos = to; }

    QTemporaryDir dir;
    SettingsStore settings;
    ConfigStore config;
    PanelController controller;
    FakePanelSurface panel;
};

} // namespace

TEST_F(PanelControllerTest, PanelButtonRestoresDraggedPositionAfterHotkey)
{
    ASSERT_TRUE(controller.select(PanelMode::Expanded, Side::Right).isEmpty());
    EXPECT_EQ(panel.pos, kExpandedCenter);

    drag(QPoint(5, 6));
    ASSERT_TRUE(controller.savePositionAfterMove());
    EXPECT_EQ(settings.customPosition(QStringLiteral("expanded")), QPoint(5, 6));

    ASSERT_TRUE(controller.toggleCollapse().isEmpty());
    EXPECT_EQ(controller.mode(), PanelMode::Collapsed);
    EXPECT_FALSE(controller.customPositionsEnabled());
    EXPECT_EQ(panel.pos, kCollapsedCenter);

    ASSERT_TRUE(controller.select(PanelMode::Expanded, Side::Right).isEmpty());
    EXPECT_TRUE(controller.customPositionsEnabled());
    EXPECT_EQ(panel.pos, QPoint(5, 6));
}

TEST_F(PanelControllerTest, ShowExpandedIgnoresStoredPosition)
{
    ASSERT_TRUE(settings.saveCustomPosition(QStringLiteral("expanded"), QPoint(5, 6)));

    ASSERT_TRUE(controller.select(PanelMode::Expanded, Side::Right).isEmpty());
    EXPECT_EQ(panel.pos, QPoint(5, 6));

    ASSERT_TRUE(controller.showExpanded().isEmpty());
    EXPECT_EQ(controller.mode(), PanelMode::Expanded);
    EXPECT_FALSE(controller.customPositionsEnabled());
    EXPECT_EQ(panel.pos, kExpandedCenter);
    EXPECT_TRUE(panel.visible);
}

TEST_F(PanelControllerTest, ToggleCollapseFollowsTransitionsAtDefaultAnchors)
{
    ASSERT_TRUE(settings.saveCustomPosition(QStringLiteral("expanded"), QPoint(5, 6)));

    ASSERT_TRUE(controller.select(PanelMode::SidePanel, Side::Left).isEmpty());
    EXPECT_EQ(panel.pos, QPoint(40, 140));

    ASSERT_TRUE(controller.toggleCollapse().isEmpty());
    EXPECT_EQ(controller.mode(), PanelMode::Collapsed);

    ASSERT_TRUE(controller.toggleCollapse().isEmpty());
    EXPECT_EQ(controller.mode(), PanelMode::Expanded);
    EXPECT_EQ(panel.pos, kExpandedCenter);

    ASSERT_TRUE(controller.toggleCollapse().isEmpty());
    EXPECT_EQ(controller.mode(), PanelMode::Collapsed);
}

TEST_F(PanelControllerTest, ToggleWithoutWindowKeepsMode)
{
    controller.setSurface(nullptr);
    EXPECT_EQ(controller.toggleCollapse(), QStringLiteral("Window not found"));
    EXPECT_EQ(controller.mode(), PanelMode::Expanded);
}

TEST_F(PanelControllerTest, ModeChangesAreSignalled)
{
    int modeChanges = 0;
    QObject::connect(&controller, &PanelController::modeChanged, [&modeChanges]() { ++modeChanges; });

    ASSERT_TRUE(controller.showExpanded().isEmpty());
    EXPECT_EQ(modeChanges, 0);

    ASSERT_TRUE(controller.select(PanelMode::SidePanel, Side::Right).isEmpty());
    EXPECT_EQ(modeChanges, 1);
    EXPECT_EQ(controller.side(), Side::Right);
}

TEST_F(PanelControllerTest, DragSaveSkipsHiddenHoveredAndUnmovedPanel)
{
    drag(QPoint(1, 1));
    EXPECT_FALSE(controller.savePositionAfterMove());

    ASSERT_TRUE(controller.select(PanelMode::Hovered, Side::Right).isEmpty());
    EXPECT_EQ(panel.pos, QPoint(750, 40));
    drag(QPoint(100, 100));
    EXPECT_FALSE(controller.savePositionAfterMove());

    ASSERT_TRUE(controller.select(PanelMode::Collapsed, Side::Right).isEmpty());
    EXPECT_FALSE(controller.savePositionAfterMove());
    EXPECT_FALSE(settings.hasCustomPosition(QStringLiteral("collapsed")));

    drag(QPoint(12, 34));
    EXPECT_TRUE(controller.savePositionAfterMove());
    EXPECT_EQ(settings.customPosition(QStringLiteral("collapsed")), QPoint(12, 34));
    EXPECT_FALSE(controller.savePositionAfterMove());
}

TEST_F(PanelControllerTest, DragSaveTurnsCustomPositionsOn)
{
    ASSERT_TRUE(controller.showExpanded().isEmpty());
    ASSERT_FALSE(controller.customPositionsEnabled());

    int customChanges = 0;
    QObject::connect(&controller, &PanelController::customPositionChanged, [&customChanges]() { ++customChanges; });

    drag(QPoint(70, 80));
    ASSERT_TRUE(controller.savePositionAfterMove());
    EXPECT_TRUE(controller.customPositionsEnabled());
    EXPECT_TRUE(controller.hasCustomPosition());
    EXPECT_EQ(customChanges, 1);
}

TEST_F(PanelControllerTest, PositionSetByAppIsNotSavedAsDrag)
{
    ASSERT_TRUE(controller.select(PanelMode::Expanded, Side::Right).isEmpty());

    QString error;
    ASSERT_TRUE(PanelCommands::positionTopCenter(&panel, 40, PanelPlacement::Origin::TopLeft, true, &error));
    controller.notePlaced();
    EXPECT_FALSE(controller.savePositionAfterMove());
    EXPECT_FALSE(settings.hasCustomPosition(QStringLiteral("expanded")));
}

TEST_F(PanelControllerTest, ResetPositionClearsKeyAndReturnsToAnchor)
{
    ASSERT_TRUE(settings.saveCustomPosition(QStringLiteral("sidepanel_left"), QPoint(7, 8)));

    ASSERT_TRUE(controller.select(PanelMode::SidePanel, Side::Left).isEmpty());
    EXPECT_EQ(panel.pos, QPoint(7, 8));
    EXPECT_TRUE(controller.hasCustomPosition());

    ASSERT_TRUE(controller.resetPosition().isEmpty());
    EXPECT_FALSE(settings.hasCustomPosition(QStringLiteral("sidepanel_left")));
    EXPECT_FALSE(controller.hasCustomPosition());
    EXPECT_FALSE(controller.customPositionsEnabled());
    EXPECT_EQ(controller.mode(), PanelMode::SidePanel);
    EXPECT_EQ(panel.pos, QPoint(40, 140));

    SettingsStore reloaded(settings.filePath());
    ASSERT_TRUE(reloaded.load());
    EXPECT_FALSE(reloaded.hasCustomPosition(QStringLiteral("sidepanel_left")));
}
