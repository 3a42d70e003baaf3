#pragma once

#include "PanelSurface.h"

// In-memory panel window for command tests.
class FakePanelSurface final : public PanelSurface
{
public:
    std::optional<QSize> size = QSize(420, 110);
    std::optional<QRect> monitor = QRect(0, 0, 1920, 1080);
    QPoint pos;
    int setPositionCalls = 0;
    PanelModes::Geometry lastGeometry;
    bool geometryApplied = false;

    bool visible = false;
    bool onTop = false;
    bool focused = false;
    bool failShow = false;

    std::optional<QSize> outerSize() const override { return size; }
    std::optional<QRect> currentMonitor() const override { return monitor; }
    QPoint position() const override { return pos; }

    void setPosition(const QPoint &p) override
    {
        pos = p;
        ++setPositionCalls;
    }

    void applyGeometry(const PanelModes::Geometry &geometry) override
    {
        lastGeometry = geometry;
        geometryApplied = true;
        size = geometry.size;
    }

    bool show() override
    {
        if (failShow)
            return false;
        visible = true;
        return true;
    }

    bool setAlwaysOnTop(bool v) override
    {
        onTop = v;
        return true;
    }

    bool focus() override
    {
        focused = visible;
        return focused;
    }

    bool isVisible() const override { return visible; }
};
