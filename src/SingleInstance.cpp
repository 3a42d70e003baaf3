#include "SingleInstance.h"

#include "Logging.h"

#include <QLocalSocket>

static const QByteArray kShowCommand = QByteArrayLiteral("show\n");

SingleInstance::SingleInstance(const QString &key, QObject *parent)
    : QObject(parent)
    , m_key(key)
{
    connect(&m_server, &QLocalServer::newConnection, this, &SingleInstance::onNewConnection);
}

QString SingleInstance::defaultKey()
{
    QString user = qEnvironmentVariable("USER");
    if (user.isEmpty())
        user = qEnvironmentVariable("USERNAME");
    return QStringLiteral("Sidebar.SingleInstance.") + user;
}

bool SingleInstance::notifyRunningInstance()
{
    QLocalSocket socket;
    socket.connectToServer(m_key);
    if (!socket.waitForConnected(250))
        return false;

    socket.write(kShowCommand);
    if (!socket.waitForBytesWritten(250))
        qCWarning(lcApp) << "running instance did not accept the show request:" << socket.errorString();
    socket.disconnectFromServer();
    return true;
}

bool SingleInstance::claim()
{
    if (notifyRunningInstance())
        return false;

    // Nobody answered: a socket file left by a crashed instance would block listen().
    QLocalServer::removeServer(m_key);
    m_server.setSocketOptions(QLocalServer::UserAccessOption);
    if (!m_server.listen(m_key)) {
        qCWarning(lcApp) << "single-instance listener failed:" << m_server.errorString()
                         << "- relaunches will start a second copy";
    }
    return true;
}

void SingleInstance::onNewConnection()
{
    while (QLocalSocket *socket = m_server.nextPendingConnection()) {
        connect(socket, &QLocalSocket::disconnected, socket, &QObject::deleteLater);
        connect(socket, &QLocalSocket::readyRead, this, [this, socket]() {
            while (socket->canReadLine()) {
                const QByteArray line = socket->readLine();
                if (line == kShowCommand) {
                    qCInfo(lcApp) << "second instance launched; showing panel";
                    emit relaunched();
                } else {
                    qCWarning(lcApp) << "unknown single-instance command" << line.trimmed();
                }
            }
        });
    }
}
