#pragma once

#include "PanelController.h"
#include "PanelEventQueue.h"
#include "PanelModes.h"

#include <QObject>
#include <QPointer>
#include <QSystemTrayIcon>
#include <QTimer>
#include <QVariantMap>

#include <memory>

class QMenu;
class QAction;
class QQuickView;

class ConfigStore;
class GlobalShortcuts;
class PanelSurface;
class SettingsStore;

class AppController final : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString mode READ modeName NOTIFY modeChanged)
    Q_PROPERTY(QString side READ sideName NOTIFY modeChanged)
    Q_PROPERTY(bool customPositionsEnabled READ customPositionsEnabled NOTIFY customPositionChanged)
    Q_PROPERTY(bool hasCustomPosition READ hasCustomPosition NOTIFY customPositionChanged)
public:
    AppController(ConfigStore *config, SettingsStore *settings, QObject *parent = nullptr);
    ~AppController() override;

    bool init();

    PanelEventQueue *events() { return &m_events; }

    QString modeName() const;
    QString sideName() const;
    bool customPositionsEnabled() const;
    bool hasCustomPosition() const;

    // QML-facing commands. Each returns an error description, empty on success.
    Q_INVOKABLE QString positionWindowTopCenter();
    Q_INVOKABLE QString positionWindowLeftCenter(int margin = -1);
    Q_INVOKABLE QString positionWindowRightCenter(int margin = -1);
    Q_INVOKABLE QString centerWindow();
    Q_INVOKABLE QString setMode(const QString &mode, const QString &side = QString());

    Q_INVOKABLE QString saveCustomPosition(const QString &mode, int x, int y);
    // {x, y} when stored, {} when not, {error} when the stored value is unusable.
    Q_INVOKABLE QVariantMap getCustomPosition(const QString &mode) const;
    Q_INVOKABLE QString clearCustomPosition(const QString &mode);
    Q_INVOKABLE bool hasCustomPositionFor(const QString &mode) const;
    Q_INVOKABLE QString resetCurrentPosition();

    Q_INVOKABLE void debugLog(const QString &level, const QString &message);

signals:
    void panelShouldExpand();
    void toggleCollapseRequested();
    void modeChanged();
    void customPositionChanged();

private:
    void dispatch(const PanelEvent &event);
    PanelSurface *panelSurface() const;
    void revealPanel();

    bool buildPanel();
    void buildTray();
    void registerShortcuts();
    void savePositionAfterMove();
    QString reportError(const char *operation, const QString &error) const;

    bool eventFilter(QObject *watched, QEvent *event) override;

    QPointer<ConfigStore> m_config;
    QPointer<SettingsStore> m_settings;

    QSystemTrayIcon m_tray;
    QPointer<QMenu> m_menu;
    QAction *m_actionShow = nullptr;
    QAction *m_actionKeepOnTop = nullptr;
    QAction *m_actionShowOnLaunch = nullptr;
    QAction *m_actionResetHotkeys = nullptr;
    QAction *m_actionQuit = nullptr;

    QPointer<QQuickView> m_view;
    std::unique_ptr<PanelSurface> m_surface;
    QPointer<GlobalShortcuts> m_shortcuts;

    PanelEventQueue m_events;
    QPointer<PanelController> m_panel;

    // Drag-to-save: persist the panel position 500 ms after the last move.
    QTimer m_moveSaveTimer;
};
