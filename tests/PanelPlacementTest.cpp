#include "PanelPlacement.h"

#include <gtest/gtest.h>

using namespace PanelPlacement;

TEST(PanelPlacement, TopOriginPlacesNearTop)
{
    const QPoint p = computeTopCenter(QPoint(0, 0), QSize(1920, 1080), QSize(420, 110), 40, Origin::TopLeft);
    EXPECT_EQ(p, QPoint(750, 40));
}

TEST(PanelPlacement, BottomOriginPlacesNearTopEdge)
{
    const QPoint p = computeTopCenter(QPoint(0, 0), QSize(1920, 1080), QSize(420, 110), 40, Origin::BottomLeft);
    EXPECT_EQ(p, QPoint(750, 930));
}

TEST(PanelPlacement, ClampsWhenMarginExceedsBounds)
{
    const QPoint p = computeTopCenter(QPoint(100, 50), QSize(400, 200), QSize(380, 150), 200, Origin::BottomLeft);
    EXPECT_EQ(p, QPoint(110, 50));
}

TEST(PanelPlacement, TopCenterIsIdempotent)
{
    const QPoint a = computeTopCenter(QPoint(-1280, 0), QSize(1280, 1024), QSize(300, 90), 40, Origin::TopLeft);
    const QPoint b = computeTopCenter(QPoint(-1280, 0), QSize(1280, 1024), QSize(300, 90), 40, Origin::TopLeft);
    EXPECT_EQ(a, b);
}

TEST(PanelPlacement, CenteringTruncatesTowardZero)
{
    // available width 1001 -> 500, not 501
    const QPoint p = computeTopCenter(QPoint(0, 0), QSize(1421, 800), QSize(420, 100), 0, Origin::TopLeft);
    EXPECT_EQ(p.x(), 500);

    const QPoint c = computeCenter(QSize(100, 100), QRect(0, 0, 301, 303));
    EXPECT_EQ(c, QPoint(100, 101));
}

TEST(PanelPlacement, StaysWithinMonitorForAnyMargin)
{
    const QPoint monitorPos(200, -300);
    const QSize monitorSize(1600, 900);
    const QSize windowSizes[] = { QSize(1, 1), QSize(420, 110), QSize(800, 600), QSize(1600, 900) };
    const int margins[] = { 0, 1, 40, 450, 899, 5000 };

    for (const QSize &window : windowSizes) {
        const int maxX = monitorPos.x() + monitorSize.width() - window.width();
        const int maxY = monitorPos.y() + monitorSize.height() - window.height();
        for (int margin : margins) {
            for (Origin origin : { Origin::TopLeft, Origin::BottomLeft }) {
                const QPoint p = computeTopCenter(monitorPos, monitorSize, window, margin, origin);
                EXPECT_GE(p.x(), monitorPos.x());
                EXPECT_LE(p.x(), maxX);
                EXPECT_GE(p.y(), monitorPos.y());
                EXPECT_LE(p.y(), maxY);
            }
            for (Side side : { Side::Left, Side::Right }) {
                const QPoint p = computeEdgeCenter(monitorPos, monitorSize, window, margin, side);
                EXPECT_GE(p.x(), monitorPos.x());
                EXPECT_LE(p.x(), maxX);
                EXPECT_GE(p.y(), monitorPos.y());
                EXPECT_LE(p.y(), maxY);
            }
        }
    }
}

TEST(PanelPlacement, EdgeCenterScenario)
{
    const QPoint right = computeEdgeCenter(QPoint(0, 0), QSize(1920, 1080), QSize(420, 800), 40, Side::Right);
    EXPECT_EQ(right, QPoint(1460, 140));

    const QPoint left = computeEdgeCenter(QPoint(0, 0), QSize(1920, 1080), QSize(420, 800), 40, Side::Left);
    EXPECT_EQ(left, QPoint(40, 140));
}

TEST(PanelPlacement, EdgeCenterIsMonotonicInMargin)
{
    const QPoint monitorPos(10, 20);
    const QSize monitorSize(1024, 768);
    const QSize window(300, 400);
    const int availableWidth = monitorSize.width() - window.width();

    int previousRight = computeEdgeCenter(monitorPos, monitorSize, window, 0, Side::Right).x();
    int previousLeft = computeEdgeCenter(monitorPos, monitorSize, window, 0, Side::Left).x();
    for (int margin = 1; margin <= availableWidth; ++margin) {
        const int right = computeEdgeCenter(monitorPos, monitorSize, window, margin, Side::Right).x();
        const int left = computeEdgeCenter(monitorPos, monitorSize, window, margin, Side::Left).x();
        EXPECT_LE(right, previousRight);
        EXPECT_GE(left, previousLeft);
        previousRight = right;
        previousLeft = left;
    }
}

TEST(PanelPlacement, OversizedWindowCollapsesToMonitorOrigin)
{
    const QPoint monitorPos(100, 50);
    const QSize monitorSize(400, 200);
    const QSize window(600, 300);

    EXPECT_EQ(computeTopCenter(monitorPos, monitorSize, window, 40, Origin::TopLeft), monitorPos);
    EXPECT_EQ(computeTopCenter(monitorPos, monitorSize, window, 40, Origin::BottomLeft), monitorPos);
    EXPECT_EQ(computeEdgeCenter(monitorPos, monitorSize, window, 40, Side::Right), monitorPos);
    EXPECT_EQ(computeEdgeCenter(monitorPos, monitorSize, window, 40, Side::Left), monitorPos);
    EXPECT_EQ(computeCenter(window, QRect(monitorPos, monitorSize)), monitorPos);
}

TEST(PanelPlacement, OversizedOnOneAxisOnly)
{
    const QPoint p = computeTopCenter(QPoint(0, 0), QSize(1920, 100), QSize(420, 300), 40, Origin::TopLeft);
    EXPECT_EQ(p, QPoint(750, 0));
}

TEST(PanelPlacement, ZeroSizeMonitorDoesNotCrash)
{
    const QPoint p = computeCenter(QSize(420, 110), QRect(QPoint(5, 6), QSize(0, 0)));
    EXPECT_EQ(p, QPoint(5, 6));
}

TEST(PanelPlacement, ClampAxisHandlesInvertedRange)
{
    EXPECT_EQ(clampAxis(5, 0, 10), 5);
    EXPECT_EQ(clampAxis(-5, 0, 10), 0);
    EXPECT_EQ(clampAxis(15, 0, 10), 10);
    EXPECT_EQ(clampAxis(15, 10, 0), 10);
    EXPECT_EQ(clampAxis(-15, 10, 0), 10);
}

TEST(PanelPlacement, PlaceDispatchesOnAnchor)
{
    const QRect monitor(0, 0, 1920, 1080);
    const QSize window(420, 110);

    EXPECT_EQ(place(Anchor::TopCenter, monitor, window, 40, Origin::TopLeft), QPoint(750, 40));
    EXPECT_EQ(place(Anchor::LeftCenter, monitor, window, 40, Origin::TopLeft), QPoint(40, 485));
    EXPECT_EQ(place(Anchor::RightCenter, monitor, window, 40, Origin::TopLeft), QPoint(1460, 485));
    EXPECT_EQ(place(Anchor::Center, monitor, window, 40, Origin::TopLeft), QPoint(750, 485));
}

TEST(PanelPlacement, OriginParsing)
{
    EXPECT_EQ(originFromString(QStringLiteral("top-left")), Origin::TopLeft);
    EXPECT_EQ(originFromString(QStringLiteral(" Bottom-Left ")), Origin::BottomLeft);
    EXPECT_EQ(originFromString(QStringLiteral("auto")), platformOrigin());
    EXPECT_EQ(originFromString(QString()), platformOrigin());
    EXPECT_FALSE(originFromString(QStringLiteral("upside-down")).has_value());
}
