#include "date_parser.hpp"
#include "errors.hpp"
#include <QDate>
#include <QRegularExpression>
#include <QTime>
#include <QTimeZone>

namespace {

const char* const kInvalidFormat = "Invalid date format. Please use YYYY-MM-DD or RFC3339 format";

const QRegularExpression& date_pattern() {
    static const QRegularExpression re(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    return re;
}

// Date, separator, time, optional fraction, zone
const QRegularExpression& rfc3339_pattern() {
    static const QRegularExpression re(QStringLiteral(
        "^(\\d{4}-\\d{2}-\\d{2})[Tt ](\\d{2}:\\d{2}:\\d{2})(\\.\\d{1,9})?([Zz]|[+-]\\d{2}:\\d{2})$"));
    return re;
}

QDateTime parse_rfc3339(const QString& text) {
    const QRegularExpressionMatch match = rfc3339_pattern().match(text);
    if (!match.hasMatch()) {
        return QDateTime();
    }

    const QDate date = QDate::fromString(match.captured(1), Qt::ISODate);
    QTime time = QTime::fromString(match.captured(2), Qt::ISODate);
    if (!date.isValid() || !time.isValid()) {
        return QDateTime();
    }

    if (match.hasCaptured(3)) {
        // Keep milliseconds, drop anything finer
        const QString digits = match.captured(3).mid(1).leftJustified(3, QLatin1Char('0')).left(3);
        time = time.addMSecs(digits.toInt());
    }

    const QString zone = match.captured(4);
    int offset_seconds = 0;
    if (zone.compare(QStringLiteral("Z"), Qt::CaseInsensitive) != 0) {
        const int hours = zone.mid(1, 2).toInt();
        const int minutes = zone.mid(4, 2).toInt();
        if (hours > 23 || minutes > 59) {
            return QDateTime();
        }
        offset_seconds = (hours * 3600 + minutes * 60) * (zone.startsWith(QLatin1Char('-')) ? -1 : 1);
    }

    return QDateTime(date, time, QTimeZone::fromSecondsAheadOfUtc(offset_seconds)).toUTC();
}

} // namespace

QDateTime parse_date_time(const std::string& text) {
    const QString input = QString::fromStdString(text).trimmed();

    if (date_pattern().match(input).hasMatch()) {
        const QDate date = QDate::fromString(input, Qt::ISODate);
        if (date.isValid()) {
            return QDateTime(date, QTime(0, 0), QTimeZone::UTC);
        }
        throw ValidationError(kInvalidFormat);
    }

    const QDateTime instant = parse_rfc3339(input);
    if (!instant.isValid()) {
        throw ValidationError(kInvalidFormat);
    }
    return instant;
}

QDateTime parse_due_date(const std::string& text, const Clock& clock) {
    const QDateTime due = parse_date_time(text);
    if (due <= clock.now()) {
        throw ValidationError("Due date must be in the future");
    }
    return due;
}

std::string format_timestamp(const QDateTime& instant) {
    return instant.toUTC().toString(Qt::ISODateWithMs).toStdString();
}

QDateTime parse_timestamp(const std::string& text) {
    const QString input = QString::fromStdString(text);
    QDateTime instant = parse_rfc3339(input);
    if (!instant.isValid()) {
        instant = QDateTime::fromString(input, Qt::ISODateWithMs);
    }
    return instant.isValid() ? instant.toUTC() : QDateTime();
}
