#include "AppController.h"

#include "BestEffort.h"
#include "ConfigStore.h"
#include "GlobalShortcuts.h"
#include "Logging.h"
#include "PanelCommands.h"
#include "QuickPanelSurface.h"
#include "SettingsStore.h"

#include <QAction>
#include <QCoreApplication>
#include <QEvent>
#include <QGuiApplication>
#include <QIcon>
#include <QKeyEvent>
#include <QMenu>
#include <QQmlContext>
#include <QQmlError>
#include <QQuickView>
#include <QUrl>

static QIcon makeTrayIcon();

AppController::AppController(ConfigStore *config, SettingsStore *settings, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_settings(settings)
{
    m_events.setHandler([this](const PanelEvent &event) { dispatch(event); });

    m_moveSaveTimer.setSingleShot(true);
    m_moveSaveTimer.setInterval(500);
    connect(&m_moveSaveTimer, &QTimer::timeout, this, &AppController::savePositionAfterMove);

    if (m_config && m_settings) {
        m_panel = new PanelController(*m_settings, *m_config, this);
        connect(m_panel, &PanelController::modeChanged, this, &AppController::modeChanged);
        connect(m_panel, &PanelController::customPositionChanged, this, &AppController::customPositionChanged);
        connect(m_settings, &SettingsStore::customPositionChanged, this, [this]() {
            emit customPositionChanged();
        });
    }
}

AppController::~AppController()
{
    if (m_view) {
        m_view->removeEventFilter(this);
        delete m_view;
    }
    delete m_menu;
}

bool AppController::init()
{
    if (!m_config || !m_settings || !m_panel)
        return false;

    if (!buildPanel())
        return false;

    if (QSystemTrayIcon::isSystemTrayAvailable())
        buildTray();
    else
        qCWarning(lcTray) << "No system tray available; the panel is reachable through hotkeys only";

    registerShortcuts();

    if (m_config->showOnLaunch())
        m_events.post({ PanelEvent::Kind::ShowPanel, QStringLiteral("launch") });
    return true;
}

QString AppController::modeName() const
{
    return m_panel ? PanelModes::name(m_panel->mode()) : QString();
}

QString AppController::sideName() const
{
    return m_panel ? PanelModes::sideName(m_panel->side()) : QString();
}

bool AppController::customPositionsEnabled() const
{
    return m_panel && m_panel->customPositionsEnabled();
}

bool AppController::hasCustomPosition() const
{
    return m_panel && m_panel->hasCustomPosition();
}

PanelSurface *AppController::panelSurface() const
{
    return m_view ? m_surface.get() : nullptr;
}

void AppController::dispatch(const PanelEvent &event)
{
    qCDebug(lcApp) << "dispatching" << panelEventName(event.kind) << "from" << event.source;

    switch (event.kind) {
    case PanelEvent::Kind::ShowPanel:
    case PanelEvent::Kind::Relaunch: {
        // Hotkeys, tray and relaunch always use the default position for the mode.
        const QString error = m_panel->showExpanded();
        if (!error.isEmpty()) {
            reportError("show panel", error);
            revealPanel();
        }
        emit panelShouldExpand();
        break;
    }
    case PanelEvent::Kind::ToggleCollapse: {
        const QString error = m_panel->toggleCollapse();
        if (!error.isEmpty())
            reportError("toggle collapse", error);
        if (m_panel->surface())
            emit toggleCollapseRequested();
        break;
    }
    case PanelEvent::Kind::Quit:
        qCInfo(lcApp) << "quit menu item selected; exiting";
        QCoreApplication::quit();
        break;
    case PanelEvent::Kind::CloseRequested:
        qCInfo(lcApp) << "Close requested event received, preventing default behavior";
        break;
    case PanelEvent::Kind::EscapePressed:
        qCInfo(lcApp) << "ESC key intercepted and blocked";
        break;
    }
}

void AppController::revealPanel()
{
    PanelCommands::showPanel(panelSurface(), m_config ? m_config->alwaysOnTop() : true);
}

QString AppController::reportError(const char *operation, const QString &error) const
{
    qCWarning(lcApp, "%s failed: %s", operation, qPrintable(error));
    return error;
}

QString AppController::positionWindowTopCenter()
{
    QString error;
    if (!PanelCommands::positionTopCenter(panelSurface(), m_config->margin(),
                                          m_config->origin(), m_config->alwaysOnTop(), &error))
        return reportError("position_window_top_center", error);
    m_panel->notePlaced();
    return QString();
}

QString AppController::positionWindowLeftCenter(int margin)
{
    QString error;
    const int m = margin < 0 ? m_config->margin() : margin;
    if (!PanelCommands::positionEdgeCenter(panelSurface(), PanelPlacement::Side::Left, m,
                                           m_config->alwaysOnTop(), &error))
        return reportError("position_window_left_center", error);
    m_panel->notePlaced();
    return QString();
}

QString AppController::positionWindowRightCenter(int margin)
{
    QString error;
    const int m = margin < 0 ? m_config->margin() : margin;
    if (!PanelCommands::positionEdgeCenter(panelSurface(), PanelPlacement::Side::Right, m,
                                           m_config->alwaysOnTop(), &error))
        return reportError("position_window_right_center", error);
    m_panel->notePlaced();
    return QString();
}

QString AppController::centerWindow()
{
    QString error;
    if (!PanelCommands::center(panelSurface(), &error))
        return reportError("center_window", error);
    m_panel->notePlaced();
    return QString();
}

QString AppController::setMode(const QString &mode, const QString &side)
{
    const auto parsed = PanelModes::fromName(mode);
    if (!parsed)
        return reportError("set_mode", QStringLiteral("unknown panel mode: %1").arg(mode));

    PanelPlacement::Side s = m_panel->side();
    if (!side.isEmpty()) {
        const auto parsedSide = PanelModes::sideFromName(side);
        if (!parsedSide)
            return reportError("set_mode", QStringLiteral("unknown side: %1").arg(side));
        s = *parsedSide;
    }

    const QString error = m_panel->select(*parsed, s);
    if (!error.isEmpty())
        return reportError("set_mode", error);
    return QString();
}

QString AppController::saveCustomPosition(const QString &mode, int x, int y)
{
    QString error;
    if (!m_settings->saveCustomPosition(mode, QPoint(x, y), &error))
        return reportError("save_custom_position", error);
    return QString();
}

QVariantMap AppController::getCustomPosition(const QString &mode) const
{
    QVariantMap out;
    QString error;
    const auto pos = m_settings->customPosition(mode, &error);
    if (pos) {
        out.insert(QStringLiteral("x"), pos->x());
        out.insert(QStringLiteral("y"), pos->y());
    } else if (!error.isEmpty()) {
        out.insert(QStringLiteral("error"), reportError("get_custom_position", error));
    }
    return out;
}

QString AppController::clearCustomPosition(const QString &mode)
{
    QString error;
    if (!m_settings->clearCustomPosition(mode, &error))
        return reportError("clear_custom_position", error);
    return QString();
}

bool AppController::hasCustomPositionFor(const QString &mode) const
{
    return m_settings->hasCustomPosition(mode);
}

QString AppController::resetCurrentPosition()
{
    const QString error = m_panel->resetPosition();
    if (!error.isEmpty())
        return reportError("reset_position", error);
    return QString();
}

void AppController::debugLog(const QString &level, const QString &message)
{
    Logging::frontendMessage(level, message);
}

void AppController::savePositionAfterMove()
{
    if (!m_view)
        return;
    QString error;
    if (!m_panel->savePositionAfterMove(&error) && !error.isEmpty())
        reportError("save dragged position", error);
}

bool AppController::buildPanel()
{
    m_view = new QQuickView;
    m_view->setTitle(QStringLiteral("Sidebar"));
    m_view->setResizeMode(QQuickView::SizeRootObjectToView);
    m_view->setColor(Qt::transparent);
    m_view->setFlags(Qt::FramelessWindowHint | Qt::Tool | Qt::WindowStaysOnTopHint);

    // Close, Escape and drag moves are handled in eventFilter().
    m_view->installEventFilter(this);

    m_view->rootContext()->setContextProperty(QStringLiteral("appController"), this);
    m_view->setSource(QUrl(QStringLiteral("qrc:/qml/Panel.qml")));
    if (m_view->status() == QQuickView::Error) {
        for (const QQmlError &e : m_view->errors())
            qCCritical(lcApp).noquote() << e.toString();
        return false;
    }

    m_surface = std::make_unique<QuickPanelSurface>(m_view);
    m_surface->applyGeometry(PanelModes::geometry(m_panel->mode()));
    m_panel->setSurface(m_surface.get());
    return true;
}

void AppController::registerShortcuts()
{
    m_shortcuts = new GlobalShortcuts(this);
    connect(m_shortcuts, &GlobalShortcuts::showPanelRequested, this, [this](const QString &seq) {
        m_events.post({ PanelEvent::Kind::ShowPanel, QStringLiteral("hotkey:") + seq });
    });
    connect(m_shortcuts, &GlobalShortcuts::toggleCollapseRequested, this, [this](const QString &seq) {
        m_events.post({ PanelEvent::Kind::ToggleCollapse, QStringLiteral("hotkey:") + seq });
    });
    m_shortcuts->registerShortcuts(m_config->showPanelShortcuts(), m_config->toggleCollapseShortcuts());
}

void AppController::buildTray()
{
    m_menu = new QMenu;

    m_actionShow = m_menu->addAction(tr("Show Window"));
    connect(m_actionShow, &QAction::triggered, this, [this]() {
        m_events.post({ PanelEvent::Kind::ShowPanel, QStringLiteral("tray-menu") });
    });

    m_menu->addSeparator();

    m_actionKeepOnTop = m_menu->addAction(tr("Keep on top"));
    m_actionKeepOnTop->setCheckable(true);
    m_actionKeepOnTop->setChecked(m_config->alwaysOnTop());
    connect(m_actionKeepOnTop, &QAction::triggered, this, [this](bool checked) {
        m_config->setAlwaysOnTop(checked);
        if (m_surface)
            bestEffort(lcTray(), "update keep-on-top", m_surface->setAlwaysOnTop(checked));
    });

    m_actionShowOnLaunch = m_menu->addAction(tr("Show on launch"));
    m_actionShowOnLaunch->setCheckable(true);
    m_actionShowOnLaunch->setChecked(m_config->showOnLaunch());
    connect(m_actionShowOnLaunch, &QAction::triggered, this, [this](bool checked) {
        m_config->setShowOnLaunch(checked);
    });

    m_actionResetHotkeys = m_menu->addAction(tr("Reset hotkeys"));
    connect(m_actionResetHotkeys, &QAction::triggered, this, [this]() {
        if (m_shortcuts)
            m_shortcuts->resetShortcuts(m_config->showPanelShortcuts(), m_config->toggleCollapseShortcuts());
    });

    m_menu->addSeparator();
    m_actionQuit = m_menu->addAction(tr("Quit"));
    connect(m_actionQuit, &QAction::triggered, this, [this]() {
        m_events.post({ PanelEvent::Kind::Quit, QStringLiteral("tray-menu") });
    });

    m_tray.setToolTip(tr("Sidebar - Click to Show"));
    m_tray.setContextMenu(m_menu);
    m_tray.setIcon(makeTrayIcon());
    m_tray.show();
    bestEffort(lcTray(), "show tray icon", m_tray.isVisible());

    connect(&m_tray, &QSystemTrayIcon::activated, this, [this](QSystemTrayIcon::ActivationReason reason) {
        // A click always shows the panel; it never hides it.
        if (reason == QSystemTrayIcon::Trigger || reason == QSystemTrayIcon::DoubleClick)
            m_events.post({ PanelEvent::Kind::ShowPanel, QStringLiteral("tray") });
    });
}

static QIcon makeTrayIcon()
{
    QIcon icon(QStringLiteral(":/assets/sidebar.svg"));
    if (icon.isNull())
        icon = QIcon::fromTheme(QStringLiteral("view-right-new"));
    if (icon.isNull())
        icon = QGuiApplication::windowIcon();
    return icon;
}

bool AppController::eventFilter(QObject *watched, QEvent *event)
{
    if (watched == m_view) {
        switch (event->type()) {
        case QEvent::Close:
            event->ignore();
            m_events.post({ PanelEvent::Kind::CloseRequested, QStringLiteral("window") });
            return true;
        case QEvent::KeyPress:
            if (static_cast<QKeyEvent *>(event)->key() == Qt::Key_Escape) {
                m_events.post({ PanelEvent::Kind::EscapePressed, QStringLiteral("window") });
                return true;
            }
            break;
        case QEvent::Move:
            if (PanelModes::savesPositionOnMove(m_panel->mode()))
                m_moveSaveTimer.start();
            break;
        default:
            break;
        }
    }
    return QObject::eventFilter(watched, event);
}
