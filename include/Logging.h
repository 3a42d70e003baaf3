#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcPlacement)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)
Q_DECLARE_LOGGING_CATEGORY(lcShortcuts)
Q_DECLARE_LOGGING_CATEGORY(lcTray)
Q_DECLARE_LOGGING_CATEGORY(lcFrontend)

namespace Logging {

// Installs the stderr/file message handler and applies `level` as filter rules.
// May be called again to change the level or the file; an empty filePath
// closes the file sink.
void install(const QString &level, const QString &filePath);

// Path of the open log file, empty when logging to stderr only.
QString logFilePath();

// Filter rules for the sidebar.* categories at `level`
// (error, warn, info, debug, trace). Unknown levels behave like info.
QString filterRulesForLevel(const QString &level);

QString defaultLogFilePath();

// Logs a frontend line under sidebar.frontend at the named level.
void frontendMessage(const QString &level, const QString &message);

} // namespace Logging
