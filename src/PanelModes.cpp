#include "PanelModes.h"

namespace PanelModes {

Geometry geometry(PanelMode mode)
{
    switch (mode) {
    case PanelMode::Collapsed:
        return { QSize(220, 160), QSize(220, 160), false };
    case PanelMode::Hovered:
        return { QSize(420, 110), QSize(420, 110), false };
    case PanelMode::Expanded:
        return { QSize(800, 600), QSize(640, 360), true };
    case PanelMode::SidePanel:
        return { QSize(420, 800), QSize(360, 480), true };
    }
    return { QSize(800, 600), QSize(640, 360), true };
}

PanelPlacement::Anchor defaultAnchor(PanelMode mode, PanelPlacement::Side side)
{
    switch (mode) {
    case PanelMode::Hovered:
        return PanelPlacement::Anchor::TopCenter;
    case PanelMode::SidePanel:
        return side == PanelPlacement::Side::Right ? PanelPlacement::Anchor::RightCenter
                                                   : PanelPlacement::Anchor::LeftCenter;
    case PanelMode::Collapsed:
    case PanelMode::Expanded:
        break;
    }
    return PanelPlacement::Anchor::Center;
}

QString positionKey(PanelMode mode, PanelPlacement::Side side)
{
    switch (mode) {
    case PanelMode::Collapsed:
        return QStringLiteral("collapsed");
    case PanelMode::Expanded:
        return QStringLiteral("expanded");
    case PanelMode::SidePanel:
        return side == PanelPlacement::Side::Right ? QStringLiteral("sidepanel_right")
                                                   : QStringLiteral("sidepanel_left");
    case PanelMode::Hovered:
        break;
    }
    return QString();
}

bool usesCustomPosition(PanelMode mode, bool customPositionsEnabled)
{
    switch (mode) {
    case PanelMode::Collapsed:
        return true;
    case PanelMode::Expanded:
    case PanelMode::SidePanel:
        return customPositionsEnabled;
    case PanelMode::Hovered:
        break;
    }
    return false;
}

bool savesPositionOnMove(PanelMode mode)
{
    return mode != PanelMode::Hovered;
}

PanelMode nextOnToggleCollapse(PanelMode current)
{
    if (current == PanelMode::SidePanel)
        return PanelMode::Collapsed;
    if (current == PanelMode::Collapsed)
        return PanelMode::Expanded;
    return PanelMode::Collapsed;
}

QString name(PanelMode mode)
{
    switch (mode) {
    case PanelMode::Collapsed:
        return QStringLiteral("collapsed");
    case PanelMode::Hovered:
        return QStringLiteral("hovered");
    case PanelMode::Expanded:
        return QStringLiteral("expanded");
    case PanelMode::SidePanel:
        return QStringLiteral("sidepanel");
    }
    return QString();
}

std::optional<PanelMode> fromName(const QString &name)
{
    if (name == QLatin1String("collapsed"))
        return PanelMode::Collapsed;
    if (name == QLatin1String("hovered"))
        return PanelMode::Hovered;
    if (name == QLatin1String("expanded"))
        return PanelMode::Expanded;
    if (name == QLatin1String("sidepanel"))
        return PanelMode::SidePanel;
    return std::nullopt;
}

QString sideName(PanelPlacement::Side side)
{
    return side == PanelPlacement::Side::Right ? QStringLiteral("right") : QStringLiteral("left");
}

std::optional<PanelPlacement::Side> sideFromName(const QString &name)
{
    if (name == QLatin1String("right"))
        return PanelPlacement::Side::Right;
    if (name == QLatin1String("left"))
        return PanelPlacement::Side::Left;
    return std::nullopt;
}

} // namespace PanelModes
