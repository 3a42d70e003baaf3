#pragma once

#include "PanelModes.h"

#include <QPoint>
#include <QRect>
#include <QSize>

#include <optional>

// Query/mutation interface of the panel window. Positions, sizes and monitor
// rects are physical pixels; PanelModes::Geometry is logical.
class PanelSurface
{
public:
    virtual ~PanelSurface() = default;

    virtual std::optional<QSize> outerSize() const = 0;
    // Full extent of the monitor the window is on.
    virtual std::optional<QRect> currentMonitor() const = 0;
    virtual QPoint position() const = 0;

    virtual void setPosition(const QPoint &pos) = 0;
    virtual void applyGeometry(const PanelModes::Geometry &geometry) = 0;

    // Best-effort; false when the host did not honor the request.
    virtual bool show() = 0;
    virtual bool setAlwaysOnTop(bool onTop) = 0;
    virtual bool focus() = 0;

    virtual bool isVisible() const = 0;
};
