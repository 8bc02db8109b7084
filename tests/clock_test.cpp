#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "clock.hpp"
#include "test_support.hpp"

TEST_CASE("System clock reports UTC") {
    const QDateTime before = QDateTime::currentDateTimeUtc();
    const QDateTime now = SystemClock::instance().now();

    CHECK(now.timeSpec() == Qt::UTC);
    CHECK(now >= before);
}

TEST_CASE("Manual clock only moves when told to") {
    ManualClock clock(utc(2025, 1, 1));
    CHECK(clock.now() == utc(2025, 1, 1));
    CHECK(clock.now() == clock.now());

    clock.advance(1500);
    CHECK(clock.now() == utc(2025, 1, 1).addMSecs(1500));

    clock.set(utc(2030, 6, 1, 12, 0));
    CHECK(clock.now() == utc(2030, 6, 1, 12, 0));
}

TEST_CASE("Manual clock normalizes to UTC") {
    const QDateTime offset(QDate(2025, 1, 1), QTime(2, 0), QTimeZone::fromSecondsAheadOfUtc(7200));
    ManualClock clock(offset);
    CHECK(clock.now() == utc(2025, 1, 1));
    CHECK(clock.now().timeSpec() == Qt::UTC);
}
