#include "ConfigStore.h"

#include "Logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>

static QStringList stringList(const QJsonValue &v, const QStringList &fallback)
{
    if (!v.isArray())
        return fallback;
    QStringList out;
    for (const auto &item : v.toArray()) {
        const QString s = item.toString().trimmed();
        if (!s.isEmpty())
            out.append(s);
    }
    return out;
}

static QJsonArray jsonArray(const QStringList &list)
{
    QJsonArray arr;
    for (const auto &s : list)
        arr.append(s);
    return arr;
}

ConfigStore::ConfigStore(const QString &path, QObject *parent)
    : QObject(parent)
    , m_path(path)
    , m_logLevel(defaultLogLevel())
    , m_showPanelShortcuts(defaultShowPanelShortcuts())
    , m_toggleCollapseShortcuts(defaultToggleCollapseShortcuts())
{
    connect(this, &ConfigStore::changed, this, [this]() { save(); });
}

QString ConfigStore::defaultPath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(base).filePath(QStringLiteral("config.json"));
}

QString ConfigStore::defaultLogLevel()
{
#ifdef QT_NO_DEBUG
    return QStringLiteral("info");
#else
    return QStringLiteral("debug");
#endif
}

QStringList ConfigStore::defaultShowPanelShortcuts()
{
    return { QStringLiteral("Alt+Meta+Space"), QStringLiteral("Ctrl+Space"), QStringLiteral("Meta+Shift+Space") };
}

QStringList ConfigStore::defaultToggleCollapseShortcuts()
{
    return { QStringLiteral("Meta+1") };
}

void ConfigStore::load()
{
    QFile f(m_path);
    if (!f.exists())
        return;
    if (!f.open(QIODevice::ReadOnly))
        return;

    const auto doc = QJsonDocument::fromJson(f.readAll());
    if (!doc.isObject()) {
        qCWarning(lcApp) << "Ignoring malformed" << m_path;
        return;
    }

    const QJsonObject o = doc.object();

    const int margin = o.value(QStringLiteral("margin")).toInt(PanelPlacement::kDefaultMargin);
    m_margin = margin < 0 ? PanelPlacement::kDefaultMargin : margin;

    const QString origin = o.value(QStringLiteral("origin")).toString(QStringLiteral("auto"));
    if (PanelPlacement::originFromString(origin)) {
        m_origin = origin.trimmed().toLower();
    } else {
        qCWarning(lcApp) << "Unknown origin" << origin << "in" << m_path << "- using auto";
        m_origin = QStringLiteral("auto");
    }

    m_showOnLaunch = o.value(QStringLiteral("showOnLaunch")).toBool(true);
    m_alwaysOnTop = o.value(QStringLiteral("alwaysOnTop")).toBool(true);
    m_logLevel = o.value(QStringLiteral("logLevel")).toString(defaultLogLevel());
    m_logToFile = o.value(QStringLiteral("logToFile")).toBool(true);

    const QJsonObject shortcuts = o.value(QStringLiteral("shortcuts")).toObject();
    m_showPanelShortcuts = stringList(shortcuts.value(QStringLiteral("showPanel")), defaultShowPanelShortcuts());
    m_toggleCollapseShortcuts = stringList(shortcuts.value(QStringLiteral("toggleCollapse")), defaultToggleCollapseShortcuts());
}

void ConfigStore::save() const
{
    const QString dir = QFileInfo(m_path).absolutePath();
    if (!QDir().mkpath(dir)) {
        qCWarning(lcApp) << "Cannot create" << dir;
        return;
    }

    QJsonObject o;
    o.insert(QStringLiteral("schemaVersion"), 1);
    o.insert(QStringLiteral("margin"), m_margin);
    o.insert(QStringLiteral("origin"), m_origin);
    o.insert(QStringLiteral("showOnLaunch"), m_showOnLaunch);
    o.insert(QStringLiteral("alwaysOnTop"), m_alwaysOnTop);
    o.insert(QStringLiteral("logLevel"), m_logLevel);
    o.insert(QStringLiteral("logToFile"), m_logToFile);

    QJsonObject shortcuts;
    shortcuts.insert(QStringLiteral("showPanel"), jsonArray(m_showPanelShortcuts));
    shortcuts.insert(QStringLiteral("toggleCollapse"), jsonArray(m_toggleCollapseShortcuts));
    o.insert(QStringLiteral("shortcuts"), shortcuts);

    QFile f(m_path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcApp) << "Cannot write" << m_path << ":" << f.errorString();
        return;
    }
    if (f.write(QJsonDocument(o).toJson(QJsonDocument::Indented)) < 0)
        qCWarning(lcApp) << "Cannot write" << m_path << ":" << f.errorString();
}

PanelPlacement::Origin ConfigStore::origin() const
{
    return PanelPlacement::originFromString(m_origin).value_or(PanelPlacement::platformOrigin());
}

void ConfigStore::setShowOnLaunch(bool v)
{
    if (m_showOnLaunch == v)
        return;
    m_showOnLaunch = v;
    emit changed();
}

void ConfigStore::setAlwaysOnTop(bool v)
{
    if (m_alwaysOnTop == v)
        return;
    m_alwaysOnTop = v;
    emit changed();
}
