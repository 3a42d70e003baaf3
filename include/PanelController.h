#pragma once

#include "PanelModes.h"

#include <QObject>
#include <QPoint>
#include <QString>

class ConfigStore;
class PanelSurface;
class SettingsStore;

// Current panel mode and the rules for when a stored custom position is used.
// Methods returning QString report an error description, empty on success.
class PanelController final : public QObject
{
    Q_OBJECT
public:
    PanelController(SettingsStore &settings, const ConfigStore &config, QObject *parent = nullptr);

    // Null until the window exists.
    void setSurface(PanelSurface *surface) { m_surface = surface; }
    PanelSurface *surface() const { return m_surface; }

    PanelMode mode() const { return m_mode; }
    PanelPlacement::Side side() const { return m_side; }
    bool customPositionsEnabled() const { return m_customPositionsEnabled; }
    bool hasCustomPosition() const;

    // Hotkey, tray and relaunch: expanded at the default anchor.
    QString showExpanded();
    // Toggle-collapse hotkey, default anchors only.
    QString toggleCollapse();
    // A mode picked in the panel restores the user's dragged positions.
    QString select(PanelMode mode, PanelPlacement::Side side);
    // Forgets the stored position for the current mode and re-places the panel.
    QString resetPosition();

    // Records where the app itself put the panel, so the resulting move is not
    // mistaken for a drag.
    void notePlaced();

    // Persists the current position for the mode after a drag. Returns true
    // when a position was saved.
    bool savePositionAfterMove(QString *errorString = nullptr);

signals:
    void modeChanged();
    void customPositionChanged();

private:
    QString applyMode(PanelMode mode, PanelPlacement::Side side, bool useCustom);

    SettingsStore &m_settings;
    const ConfigStore &m_config;
    PanelSurface *m_surface = nullptr;

    PanelMode m_mode = PanelMode::Expanded;
    PanelPlacement::Side m_side = PanelPlacement::Side::Right;
    bool m_customPositionsEnabled = false;
    QPoint m_lastPlacedPosition;
};
