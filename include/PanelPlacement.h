#pragma once

#include <QPoint>
#include <QRect>
#include <QSize>
#include <QString>

#include <optional>

// Window placement geometry. All values are physical pixels; monitor rects are
// the full monitor extent (position + size), not the work area.
namespace PanelPlacement {

enum class Anchor { TopCenter, LeftCenter, RightCenter, Center };
enum class Side { Left, Right };
enum class Origin { TopLeft, BottomLeft };

constexpr int kDefaultMargin = 40;

// Clamps to [min, max]. A window larger than the monitor yields min > max;
// the result then collapses to min.
int clampAxis(int value, int min, int max);

QPoint computeTopCenter(const QPoint &monitorPos, const QSize &monitorSize, const QSize &windowSize,
                        int verticalMargin, Origin origin);
QPoint computeEdgeCenter(const QPoint &monitorPos, const QSize &monitorSize, const QSize &windowSize,
                         int margin, Side side);
QPoint computeCenter(const QSize &windowSize, const QRect &monitor);

QPoint place(Anchor anchor, const QRect &monitor, const QSize &windowSize, int margin, Origin origin);

// Origin convention of the host. Qt normalizes every platform to top-left.
Origin platformOrigin();

QString anchorName(Anchor anchor);
std::optional<Origin> originFromString(const QString &s);

} // namespace PanelPlacement
