#pragma once

#include <QLocalServer>
#include <QObject>
#include <QString>

// One running process per user. Later launches connect to the first one's
// local socket, ask it to show the panel, and exit.
class SingleInstance final : public QObject
{
    Q_OBJECT
public:
    explicit SingleInstance(const QString &key, QObject *parent = nullptr);

    static QString defaultKey();

    // True when this process is now the primary instance; false when a running
    // instance was found and notified.
    bool claim();

    bool isListening() const { return m_server.isListening(); }

signals:
    void relaunched();

private:
    bool notifyRunningInstance();
    void onNewConnection();

    QString m_key;
    QLocalServer m_server;
};
