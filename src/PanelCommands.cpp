#include "PanelCommands.h"

#include "BestEffort.h"
#include "Logging.h"
#include "PanelSurface.h"
#include "SettingsStore.h"

namespace {

void setError(QString *errorString, const QString &msg)
{
    if (errorString)
        *errorString = msg;
}

struct Geometry {
    QSize window;
    QRect monitor;
};

bool queryGeometry(PanelSurface *panel, Geometry *out, QString *errorString)
{
    if (!panel) {
        setError(errorString, QStringLiteral("Window not found"));
        return false;
    }
    const auto monitor = panel->currentMonitor();
    if (!monitor) {
        setError(errorString, QStringLiteral("No monitor found"));
        return false;
    }
    const auto window = panel->outerSize();
    if (!window) {
        setError(errorString, QStringLiteral("Cannot read window size"));
        return false;
    }
    out->window = *window;
    out->monitor = *monitor;

    qCDebug(lcPlacement, "monitor size=%dx%d, pos=(%d, %d), window size=%dx%d",
            monitor->width(), monitor->height(), monitor->x(), monitor->y(),
            window->width(), window->height());
    return true;
}

void reveal(PanelSurface *panel, bool keepOnTop)
{
    bestEffort(lcPlacement(), "show panel", panel->show());
    bestEffort(lcPlacement(), "keep panel on top", panel->setAlwaysOnTop(keepOnTop));
    bestEffort(lcPlacement(), "focus panel", panel->focus());
}

} // namespace

namespace PanelCommands {

bool positionTopCenter(PanelSurface *panel, int margin, PanelPlacement::Origin origin, bool keepOnTop,
                       QString *errorString)
{
    qCInfo(lcPlacement) << "position_window_top_center invoked";

    Geometry g;
    if (!queryGeometry(panel, &g, errorString))
        return false;

    const QPoint pos = PanelPlacement::computeTopCenter(g.monitor.topLeft(), g.monitor.size(), g.window,
                                                        margin, origin);
    qCDebug(lcPlacement, "final collapsed position resolved to (%d, %d)", pos.x(), pos.y());
    panel->setPosition(pos);

    reveal(panel, keepOnTop);
    qCDebug(lcPlacement) << "panel set visible and focused";
    return true;
}

bool positionEdgeCenter(PanelSurface *panel, PanelPlacement::Side side, int margin, bool keepOnTop,
                        QString *errorString)
{
    qCInfo(lcPlacement) << "position_window_edge_center invoked, side=" << PanelModes::sideName(side);

    Geometry g;
    if (!queryGeometry(panel, &g, errorString))
        return false;

    const QPoint pos = PanelPlacement::computeEdgeCenter(g.monitor.topLeft(), g.monitor.size(), g.window,
                                                         margin, side);
    panel->setPosition(pos);

    reveal(panel, keepOnTop);
    qCDebug(lcPlacement, "panel moved to %s-center at (%d, %d)",
            qPrintable(PanelModes::sideName(side)), pos.x(), pos.y());
    return true;
}

bool center(PanelSurface *panel, QString *errorString)
{
    qCInfo(lcPlacement) << "center_window invoked";

    Geometry g;
    if (!queryGeometry(panel, &g, errorString))
        return false;

    const QPoint pos = PanelPlacement::computeCenter(g.window, g.monitor);
    panel->setPosition(pos);
    qCDebug(lcPlacement, "panel centered at (%d, %d)", pos.x(), pos.y());
    return true;
}

bool applyMode(PanelSurface *panel, const SettingsStore &store, const ModeRequest &request,
               QString *errorString)
{
    qCInfo(lcPlacement) << "applying panel mode" << PanelModes::name(request.mode);

    if (!panel) {
        setError(errorString, QStringLiteral("Window not found"));
        return false;
    }

    panel->applyGeometry(PanelModes::geometry(request.mode));

    const QString key = PanelModes::positionKey(request.mode, request.side);
    if (!key.isEmpty() && PanelModes::usesCustomPosition(request.mode, request.customPositionsEnabled)) {
        QString readError;
        const auto custom = store.customPosition(key, &readError);
        if (custom) {
            qCInfo(lcPlacement) << "Using custom position for" << key << ":" << *custom;
            panel->setPosition(*custom);
            reveal(panel, request.keepOnTop);
            return true;
        }
        if (!readError.isEmpty())
            qCWarning(lcPlacement) << "Ignoring stored position:" << readError;
    }

    Geometry g;
    if (!queryGeometry(panel, &g, errorString))
        return false;

    const auto anchor = PanelModes::defaultAnchor(request.mode, request.side);
    const QPoint pos = PanelPlacement::place(anchor, g.monitor, g.window, request.margin, request.origin);
    qCDebug(lcPlacement, "mode %s placed %s at (%d, %d)", qPrintable(PanelModes::name(request.mode)),
            qPrintable(PanelPlacement::anchorName(anchor)), pos.x(), pos.y());
    panel->setPosition(pos);

    reveal(panel, request.keepOnTop);
    return true;
}

void showPanel(PanelSurface *panel, bool keepOnTop)
{
    if (!panel) {
        qCWarning(lcPlacement) << "show requested but the panel window does not exist";
        return;
    }
    reveal(panel, keepOnTop);
}

} // namespace PanelCommands
