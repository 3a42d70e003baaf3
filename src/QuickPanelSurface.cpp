#include "QuickPanelSurface.h"

#include <QGuiApplication>
#include <QQuickView>
#include <QScreen>
#include <QtMath>

QuickPanelSurface::QuickPanelSurface(QQuickView *view)
    : m_view(view)
{
}

QScreen *QuickPanelSurface::screen() const
{
    if (!m_view)
        return nullptr;
    return m_view->screen();
}

qreal QuickPanelSurface::scale() const
{
    QScreen *s = screen();
    return s ? s->devicePixelRatio() : 1.0;
}

// Qt keeps each screen's top-left at its native position and scales extents
// around it, so conversions are relative to the screen origin.
QPoint QuickPanelSurface::toPhysical(const QPoint &logical) const
{
    QScreen *s = screen();
    if (!s)
        return logical;
    const QPoint origin = s->geometry().topLeft();
    const qreal f = scale();
    return origin + QPoint(qRound((logical.x() - origin.x()) * f), qRound((logical.y() - origin.y()) * f));
}

QPoint QuickPanelSurface::fromPhysical(const QPoint &physical) const
{
    QScreen *s = screen();
    if (!s)
        return physical;
    const QPoint origin = s->geometry().topLeft();
    const qreal f = scale();
    return origin + QPoint(qRound((physical.x() - origin.x()) / f), qRound((physical.y() - origin.y()) / f));
}

std::optional<QSize> QuickPanelSurface::outerSize() const
{
    if (!m_view)
        return std::nullopt;
    const QSize logical = m_view->frameGeometry().size();
    if (logical.isEmpty())
        return std::nullopt;
    const qreal f = scale();
    return QSize(qRound(logical.width() * f), qRound(logical.height() * f));
}

std::optional<QRect> QuickPanelSurface::currentMonitor() const
{
    QScreen *s = screen();
    if (!s)
        s = QGuiApplication::primaryScreen();
    if (!s)
        return std::nullopt;
    const QRect g = s->geometry();
    const qreal f = s->devicePixelRatio();
    return QRect(g.topLeft(), QSize(qRound(g.width() * f), qRound(g.height() * f)));
}

QPoint QuickPanelSurface::position() const
{
    if (!m_view)
        return QPoint();
    return toPhysical(m_view->framePosition());
}

void QuickPanelSurface::setPosition(const QPoint &pos)
{
    if (!m_view)
        return;
    m_view->setFramePosition(fromPhysical(pos));
}

void QuickPanelSurface::applyGeometry(const PanelModes::Geometry &geometry)
{
    if (!m_view)
        return;
    m_view->setMinimumSize(geometry.minimumSize);
    m_view->setMaximumSize(geometry.resizable ? QSize(QWINDOWSIZE_MAX, QWINDOWSIZE_MAX) : geometry.size);
    m_view->resize(geometry.size);
}

bool QuickPanelSurface::show()
{
    if (!m_view)
        return false;
    m_view->show();
    return m_view->isVisible();
}

bool QuickPanelSurface::setAlwaysOnTop(bool onTop)
{
    if (!m_view)
        return false;
    m_view->setFlag(Qt::WindowStaysOnTopHint, onTop);
    return m_view->flags().testFlag(Qt::WindowStaysOnTopHint) == onTop;
}

bool QuickPanelSurface::focus()
{
    if (!m_view || !m_view->isVisible())
        return false;
    m_view->raise();
    m_view->requestActivate();
    return true;
}

bool QuickPanelSurface::isVisible() const
{
    return m_view && m_view->isVisible();
}
