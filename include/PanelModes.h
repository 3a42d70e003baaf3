#pragma once

#include "PanelPlacement.h"

#include <QSize>
#include <QString>

#include <optional>

enum class PanelMode { Collapsed, Hovered, Expanded, SidePanel };

namespace PanelModes {

struct Geometry {
    QSize size;        // logical
    QSize minimumSize; // logical
    bool resizable = false;
};

Geometry geometry(PanelMode mode);

// Default anchor when no custom position applies. `side` only matters for SidePanel.
PanelPlacement::Anchor defaultAnchor(PanelMode mode, PanelPlacement::Side side);

// Settings key suffix for custom positions; empty when the mode never stores one.
QString positionKey(PanelMode mode, PanelPlacement::Side side);

// Collapsed always honors a stored position; Expanded and SidePanel only when
// the user opted in by dragging; Hovered never.
bool usesCustomPosition(PanelMode mode, bool customPositionsEnabled);

// Saving on drag is only meaningful where positionKey() is non-empty.
bool savesPositionOnMove(PanelMode mode);

PanelMode nextOnToggleCollapse(PanelMode current);

QString name(PanelMode mode);
std::optional<PanelMode> fromName(const QString &name);

QString sideName(PanelPlacement::Side side);
std::optional<PanelPlacement::Side> sideFromName(const QString &name);

} // namespace PanelModes
