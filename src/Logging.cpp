#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>

#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(lcApp, "sidebar.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlacement, "sidebar.placement", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSettings, "sidebar.settings", QtInfoMsg)
Q_LOGGING_CATEGORY(lcShortcuts, "sidebar.shortcuts", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTray, "sidebar.tray", QtInfoMsg)
Q_LOGGING_CATEGORY(lcFrontend, "sidebar.frontend", QtInfoMsg)

namespace {

QMutex g_sinkMutex;

std::unique_ptr<QFile> &logFile()
{
    static std::unique_ptr<QFile> file;
    return file;
}

void closeLogFile()
{
    QMutexLocker lock(&g_sinkMutex);
    logFile().reset();
}

const char *levelTag(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return "DEBUG";
    case QtInfoMsg:
        return "INFO";
    case QtWarningMsg:
        return "WARN";
    case QtCriticalMsg:
        return "ERROR";
    case QtFatalMsg:
        return "FATAL";
    }
    return "INFO";
}

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    const QString line = QStringLiteral("%1 %2 %3: %4\n")
                             .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
                                  QLatin1String(levelTag(type)),
                                  QLatin1String(context.category ? context.category : "default"),
                                  msg);
    const QByteArray bytes = line.toUtf8();

    QMutexLocker lock(&g_sinkMutex);
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
    std::fflush(stderr);
    const auto &file = logFile();
    if (file && file->isOpen()) {
        file->write(bytes);
        file->flush();
    }
}

} // namespace

namespace Logging {

QString filterRulesForLevel(const QString &level)
{
    const QString v = level.trimmed().toLower();
    if (v == QLatin1String("debug") || v == QLatin1String("trace"))
        return QStringLiteral("sidebar.*.debug=true");
    if (v == QLatin1String("warn") || v == QLatin1String("warning"))
        return QStringLiteral("sidebar.*.debug=false\nsidebar.*.info=false");
    if (v == QLatin1String("error"))
        return QStringLiteral("sidebar.*.debug=false\nsidebar.*.info=false\nsidebar.*.warning=false");
    return QStringLiteral("sidebar.*.debug=false\nsidebar.*.info=true");
}

QString defaultLogFilePath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return QDir(base).filePath(QStringLiteral("logs/sidebar.log"));
}

QString logFilePath()
{
    QMutexLocker lock(&g_sinkMutex);
    const auto &file = logFile();
    return file ? file->fileName() : QString();
}

void install(const QString &level, const QString &filePath)
{
    bool fileFailed = false;
    {
        QMutexLocker lock(&g_sinkMutex);
        auto &file = logFile();
        if (filePath.isEmpty()) {
            file.reset();
        } else if (!file || file->fileName() != filePath) {
            file.reset();
            QDir().mkpath(QFileInfo(filePath).absolutePath());
            auto opened = std::make_unique<QFile>(filePath);
            if (opened->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
                file = std::move(opened);
            else
                fileFailed = true;
        }
    }

    static bool postRoutineAdded = false;
    if (!postRoutineAdded && QCoreApplication::instance()) {
        qAddPostRoutine(closeLogFile);
        postRoutineAdded = true;
    }

    qInstallMessageHandler(messageHandler);
    QLoggingCategory::setFilterRules(filterRulesForLevel(level));

    if (fileFailed)
        qCWarning(lcApp) << "Cannot open log file" << filePath << "- logging to stderr only";
}

void frontendMessage(const QString &level, const QString &message)
{
    const QString trimmed = message.trimmed();
    const QString v = level.toLower();
    if (v == QLatin1String("error"))
        qCCritical(lcFrontend).noquote() << trimmed;
    else if (v == QLatin1String("warn"))
        qCWarning(lcFrontend).noquote() << trimmed;
    else if (v == QLatin1String("debug") || v == QLatin1String("trace"))
        qCDebug(lcFrontend).noquote() << trimmed;
    else
        qCInfo(lcFrontend).noquote() << trimmed;
}

} // namespace Logging
