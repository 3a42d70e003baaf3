#include "PanelController.h"

#include "ConfigStore.h"
#include "Logging.h"
#include "PanelCommands.h"
#include "PanelSurface.h"
#include "SettingsStore.h"

PanelController::PanelController(SettingsStore &settings, const ConfigStore &config, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_config(config)
{
}

bool PanelController::hasCustomPosition() const
{
    const QString key = PanelModes::positionKey(m_mode, m_side);
    return !key.isEmpty() && m_settings.hasCustomPosition(key);
}

QString PanelController::showExpanded()
{
    return applyMode(PanelMode::Expanded, m_side, false);
}

QString PanelController::toggleCollapse()
{
    if (!m_surface) {
        qCCritical(lcApp) << "Panel window not found! Cannot toggle collapsed state.";
        return QStringLiteral("Window not found");
    }
    const PanelMode next = PanelModes::nextOnToggleCollapse(m_mode);
    qCInfo(lcApp) << "Toggling from" << PanelModes::name(m_mode) << "to" << PanelModes::name(next);
    return applyMode(next, m_side, false);
}

QString PanelController::select(PanelMode mode, PanelPlacement::Side side)
{
    return applyMode(mode, side, true);
}

QString PanelController::resetPosition()
{
    const QString key = PanelModes::positionKey(m_mode, m_side);
    if (!key.isEmpty()) {
        QString error;
        if (!m_settings.clearCustomPosition(key, &error))
            return error;
    }
    return applyMode(m_mode, m_side, false);
}

void PanelController::notePlaced()
{
    if (m_surface)
        m_lastPlacedPosition = m_surface->position();
}

bool PanelController::savePositionAfterMove(QString *errorString)
{
    if (!m_surface || !m_surface->isVisible())
        return false;
    if (!PanelModes::savesPositionOnMove(m_mode))
        return false;

    const QPoint pos = m_surface->position();
    if (pos == m_lastPlacedPosition)
        return false;

    const QString key = PanelModes::positionKey(m_mode, m_side);
    if (!m_settings.saveCustomPosition(key, pos, errorString))
        return false;

    qCDebug(lcPlacement) << "saved dragged position" << pos << "for" << key;
    m_lastPlacedPosition = pos;
    if (!m_customPositionsEnabled) {
        m_customPositionsEnabled = true;
        emit customPositionChanged();
    }
    return true;
}

QString PanelController::applyMode(PanelMode mode, PanelPlacement::Side side, bool useCustom)
{
    PanelCommands::ModeRequest request;
    request.mode = mode;
    request.side = side;
    request.customPositionsEnabled = useCustom;
    request.margin = m_config.margin();
    request.origin = m_config.origin();
    request.keepOnTop = m_config.alwaysOnTop();

    QString error;
    const bool ok = PanelCommands::applyMode(m_surface, m_settings, request, &error);

    const bool changed = (m_mode != mode || m_side != side || m_customPositionsEnabled != useCustom);
    m_mode = mode;
    m_side = side;
    m_customPositionsEnabled = useCustom;
    notePlaced();
    if (changed) {
        emit modeChanged();
        emit customPositionChanged();
    }
    return ok ? QString() : error;
}
