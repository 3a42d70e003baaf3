#include <QApplication>
#include <QIcon>
#include <QQuickStyle>

#include "AppController.h"
#include "ConfigStore.h"
#include "Logging.h"
#include "SettingsStore.h"
#include "SingleInstance.h"

int main(int argc, char *argv[])
{
    QQuickStyle::setStyle(QStringLiteral("Basic"));

    QApplication app(argc, argv);
    app.setQuitOnLastWindowClosed(false);
    app.setApplicationName(QStringLiteral("Sidebar"));
    app.setOrganizationName(QStringLiteral("Sidebar"));
    app.setDesktopFileName(QStringLiteral("sidebar"));
    app.setWindowIcon(QIcon(QStringLiteral(":/assets/sidebar.svg")));

    // Log with defaults while config.json is read, so its warnings reach the file.
    Logging::install(ConfigStore::defaultLogLevel(), Logging::defaultLogFilePath());
    ConfigStore config(ConfigStore::defaultPath());
    config.load();
    Logging::install(config.logLevel(), config.logToFile() ? Logging::defaultLogFilePath() : QString());

    SingleInstance instance(SingleInstance::defaultKey());
    if (!instance.claim()) {
        qCInfo(lcApp) << "Sidebar is already running; asked it to show the panel";
        return 0;
    }

    SettingsStore settings(SettingsStore::defaultPath());
    QString error;
    if (!settings.load(&error))
        qCWarning(lcSettings).noquote() << error << "- custom positions start empty";

    AppController controller(&config, &settings);
    QObject::connect(&instance, &SingleInstance::relaunched, &controller, [&controller]() {
        controller.events()->post({ PanelEvent::Kind::Relaunch, QStringLiteral("second-instance") });
    });
    if (!controller.init()) {
        qCCritical(lcApp) << "Failed to create the panel window";
        return 1;
    }

    return app.exec();
}
