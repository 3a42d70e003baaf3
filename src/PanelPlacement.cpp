#include "PanelPlacement.h"

namespace PanelPlacement {

int clampAxis(int value, int min, int max)
{
    if (min > max)
        return min;
    if (value < min)
        return min;
    if (value > max)
        return max;
    return value;
}

QPoint computeTopCenter(const QPoint &monitorPos, const QSize &monitorSize, const QSize &windowSize,
                        int verticalMargin, Origin origin)
{
    const int availableWidth = monitorSize.width() - windowSize.width();
    const int availableHeight = monitorSize.height() - windowSize.height();

    const int desiredX = monitorPos.x() + availableWidth / 2;
    const int desiredY = (origin == Origin::BottomLeft)
        ? monitorPos.y() + availableHeight - verticalMargin
        : monitorPos.y() + verticalMargin;

    const int x = clampAxis(desiredX, monitorPos.x(), monitorPos.x() + availableWidth);
    const int y = clampAxis(desiredY, monitorPos.y(), monitorPos.y() + availableHeight);
    return QPoint(x, y);
}

QPoint computeEdgeCenter(const QPoint &monitorPos, const QSize &monitorSize, const QSize &windowSize,
                         int margin, Side side)
{
    const int availableWidth = monitorSize.width() - windowSize.width();
    const int availableHeight = monitorSize.height() - windowSize.height();

    const int desiredX = (side == Side::Right)
        ? monitorPos.x() + availableWidth - margin
        : monitorPos.x() + margin;
    const int desiredY = monitorPos.y() + availableHeight / 2;

    const int x = clampAxis(desiredX, monitorPos.x(), monitorPos.x() + availableWidth);
    const int y = clampAxis(desiredY, monitorPos.y(), monitorPos.y() + availableHeight);
    return QPoint(x, y);
}

QPoint computeCenter(const QSize &windowSize, const QRect &monitor)
{
    const int availableWidth = monitor.width() - windowSize.width();
    const int availableHeight = monitor.height() - windowSize.height();

    const int x = clampAxis(monitor.x() + availableWidth / 2, monitor.x(), monitor.x() + availableWidth);
    const int y = clampAxis(monitor.y() + availableHeight / 2, monitor.y(), monitor.y() + availableHeight);
    return QPoint(x, y);
}

QPoint place(Anchor anchor, const QRect &monitor, const QSize &windowSize, int margin, Origin origin)
{
    switch (anchor) {
    case Anchor::TopCenter:
        return computeTopCenter(monitor.topLeft(), monitor.size(), windowSize, margin, origin);
    case Anchor::LeftCenter:
        return computeEdgeCenter(monitor.topLeft(), monitor.size(), windowSize, margin, Side::Left);
    case Anchor::RightCenter:
        return computeEdgeCenter(monitor.topLeft(), monitor.size(), windowSize, margin, Side::Right);
    case Anchor::Center:
        break;
    }
    return computeCenter(windowSize, monitor);
}

Origin platformOrigin()
{
    // The cocoa backend flips NSScreen coordinates before QScreen sees them,
    // and X11/Wayland/Windows are top-left natively.
    return Origin::TopLeft;
}

QString anchorName(Anchor anchor)
{
    switch (anchor) {
    case Anchor::TopCenter:
        return QStringLiteral("top-center");
    case Anchor::LeftCenter:
        return QStringLiteral("left-center");
    case Anchor::RightCenter:
        return QStringLiteral("right-center");
    case Anchor::Center:
        break;
    }
    return QStringLiteral("center");
}

std::optional<Origin> originFromString(const QString &s)
{
    const QString v = s.trimmed().toLower();
    if (v == QLatin1String("top-left"))
        return Origin::TopLeft;
    if (v == QLatin1String("bottom-left"))
        return Origin::BottomLeft;
    if (v.isEmpty() || v == QLatin1String("auto"))
        return platformOrigin();
    return std::nullopt;
}

} // namespace PanelPlacement
