#include "Logging.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

TEST(Logging, FilterRulesPerLevel)
{
    EXPECT_EQ(Logging::filterRulesForLevel(QStringLiteral("debug")), QStringLiteral("sidebar.*.debug=true"));
    EXPECT_EQ(Logging::filterRulesForLevel(QStringLiteral("TRACE")), QStringLiteral("sidebar.*.debug=true"));

    const QString warn = Logging::filterRulesForLevel(QStringLiteral("warn"));
    EXPECT_TRUE(warn.contains(QStringLiteral("sidebar.*.info=false")));
    EXPECT_FALSE(warn.contains(QStringLiteral("sidebar.*.warning=false")));

    const QString error = Logging::filterRulesForLevel(QStringLiteral(" error "));
    EXPECT_TRUE(error.contains(QStringLiteral("sidebar.*.warning=false")));
}

TEST(Logging, UnknownLevelBehavesLikeInfo)
{
    const QString info = Logging::filterRulesForLevel(QStringLiteral("info"));
    EXPECT_EQ(Logging::filterRulesForLevel(QStringLiteral("loud")), info);
    EXPECT_EQ(Logging::filterRulesForLevel(QString()), info);
    EXPECT_TRUE(info.contains(QStringLiteral("sidebar.*.info=true")));
}

TEST(Logging, RulesApplyToSidebarCategories)
{
    QLoggingCategory::setFilterRules(Logging::filterRulesForLevel(QStringLiteral("warn")));
    EXPECT_FALSE(lcPlacement().isInfoEnabled());
    EXPECT_TRUE(lcPlacement().isWarningEnabled());

    QLoggingCategory::setFilterRules(Logging::filterRulesForLevel(QStringLiteral("debug")));
    EXPECT_TRUE(lcFrontend().isDebugEnabled());

    QLoggingCategory::setFilterRules(QString());
}

TEST(Logging, FileSinkCanBeSwitchedAndClosed)
{
    QTemporaryDir dir;
    const QString first = dir.filePath(QStringLiteral("logs/first.log"));
    const QString second = dir.filePath(QStringLiteral("second.log"));

    Logging::install(QStringLiteral("info"), first);
    EXPECT_EQ(Logging::logFilePath(), first);
    qCWarning(lcApp) << "written to first";

    Logging::install(QStringLiteral("info"), second);
    EXPECT_EQ(Logging::logFilePath(), second);
    qCWarning(lcApp) << "written to second";

    Logging::install(QStringLiteral("info"), QString());
    EXPECT_TRUE(Logging::logFilePath().isEmpty());
    qCWarning(lcApp) << "stderr only";

    qInstallMessageHandler(nullptr);
    QLoggingCategory::setFilterRules(QString());

    QFile a(first);
    ASSERT_TRUE(a.open(QIODevice::ReadOnly));
    const QByteArray firstText = a.readAll();
    EXPECT_TRUE(firstText.contains("written to first"));
    EXPECT_FALSE(firstText.contains("written to second"));

    QFile b(second);
    ASSERT_TRUE(b.open(QIODevice::ReadOnly));
    const QByteArray secondText = b.readAll();
    EXPECT_TRUE(secondText.contains("sidebar.app: written to second"));
    EXPECT_FALSE(secondText.contains("stderr only"));
}
