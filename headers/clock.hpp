#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <QDateTime>

/**
 * @class Clock
 * @brief Source of the current instant, injected wherever "now" matters
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Current instant
     * @return QDateTime in UTC
     */
    virtual QDateTime now() const = 0;
};

/**
 * @class SystemClock
 * @brief Wall clock, millisecond precision
 */
class SystemClock : public Clock {
public:
    QDateTime now() const override;

    /**
     * @brief Process-wide instance used as the default clock
     */
    static const SystemClock& instance();
};

/**
 * @class ManualClock
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(const QDateTime& start);

    QDateTime now() const override;

    void set(const QDateTime& instant);

    /**
     * @brief Move the clock forward
     * @param msecs Milliseconds to add (may be negative)
     */
    void advance(qint64 msecs);

private:
    QDateTime now_;
};

#endif
