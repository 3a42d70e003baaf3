#include "SingleInstance.h"

#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QUuid>

#include <gtest/gtest.h>

namespace {

QString uniqueKey()
{
    return QStringLiteral("sidebar-test-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace

TEST(SingleInstance, FirstClaimWinsAndSecondNotifies)
{
    const QString key = uniqueKey();

    SingleInstance primary(key);
    ASSERT_TRUE(primary.claim());
    EXPECT_TRUE(primary.isListening());

    int relaunches = 0;
    QObject::connect(&primary, &SingleInstance::relaunched, [&relaunches]() { ++relaunches; });

    SingleInstance secondary(key);
    EXPECT_FALSE(secondary.claim());
    EXPECT_FALSE(secondary.isListening());

    QDeadlineTimer deadline(2000);
    while (relaunches == 0 && !deadline.hasExpired())
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    EXPECT_EQ(relaunches, 1);
}

TEST(SingleInstance, ClaimSucceedsAfterPrimaryExits)
{
    const QString key = uniqueKey();
    {
        SingleInstance first(key);
        ASSERT_TRUE(first.claim());
    }
    SingleInstance next(key);
    EXPECT_TRUE(next.claim());
}
