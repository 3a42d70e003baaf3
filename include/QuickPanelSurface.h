#pragma once

#include "PanelSurface.h"

#include <QPointer>

class QQuickView;
class QScreen;

class QuickPanelSurface final : public PanelSurface
{
public:
    explicit QuickPanelSurface(QQuickView *view);

    std::optional<QSize> outerSize() const override;
    std::optional<QRect> currentMonitor() const override;
    QPoint position() const override;

    void setPosition(const QPoint &pos) override;
    void applyGeometry(const PanelModes::Geometry &geometry) override;

    bool show() override;
    bool setAlwaysOnTop(bool onTop) override;
    bool focus() override;

    bool isVisible() const override;

private:
    QScreen *screen() const;
    qreal scale() const;
    QPoint toPhysical(const QPoint &logical) const;
    QPoint fromPhysical(const QPoint &physical) const;

    QPointer<QQuickView> m_view;
};
