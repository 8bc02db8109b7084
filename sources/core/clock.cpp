#include "clock.hpp"

QDateTime SystemClock::now() const {
    return QDateTime::currentDateTimeUtc();
}

const SystemClock& SystemClock::instance() {
    static const SystemClock clock;
    return clock;
}

ManualClock::ManualClock(const QDateTime& start) : now_(start.toUTC()) {}

QDateTime ManualClock::now() const {
    return now_;
}

void ManualClock::set(const QDateTime& instant) {
    now_ = instant.toUTC();
}

void ManualClock::advance(qint64 msecs) {
    now_ = now_.addMSecs(msecs);
}
