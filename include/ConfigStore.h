#pragma once

#include "PanelPlacement.h"

#include <QObject>
#include <QString>
#include <QStringList>

class ConfigStore final : public QObject
{
    Q_OBJECT
public:
    explicit ConfigStore(const QString &path, QObject *parent = nullptr);

    static QString defaultPath();

    void load();
    void save() const;

    QString configPath() const { return m_path; }

    int margin() const { return m_margin; }

    // Raw "origin" value ("auto", "top-left", "bottom-left") and its resolution.
    QString originSetting() const { return m_origin; }
    PanelPlacement::Origin origin() const;

    bool showOnLaunch() const { return m_showOnLaunch; }
    void setShowOnLaunch(bool v);

    bool alwaysOnTop() const { return m_alwaysOnTop; }
    void setAlwaysOnTop(bool v);

    QString logLevel() const { return m_logLevel; }
    bool logToFile() const { return m_logToFile; }

    QStringList showPanelShortcuts() const { return m_showPanelShortcuts; }
    QStringList toggleCollapseShortcuts() const { return m_toggleCollapseShortcuts; }

    static QString defaultLogLevel();
    static QStringList defaultShowPanelShortcuts();
    static QStringList defaultToggleCollapseShortcuts();

signals:
    void changed();

private:
    QString m_path;

    int m_margin = PanelPlacement::kDefaultMargin;
    QString m_origin = QStringLiteral("auto");
    bool m_showOnLaunch = true;
    bool m_alwaysOnTop = true;
    QString m_logLevel;
    bool m_logToFile = true;
    QStringList m_showPanelShortcuts;
    QStringList m_toggleCollapseShortcuts;
};
