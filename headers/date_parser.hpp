#ifndef DATE_PARSER_HPP
#define DATE_PARSER_HPP

#include <string>
#include <QDateTime>
#include "clock.hpp"

/**
 * @brief Parse a date or timestamp entered by the user
 *
 * Accepted forms:
 *  - "YYYY-MM-DD" (midnight UTC)
 *  - RFC 3339 with a zone designator, e.g. "2030-01-01T09:30:00Z", "2030-01-01T09:30:00.250+02:00"
 *
 * @return Instant converted to UTC
 * @throws ValidationError on any other form
 */
QDateTime parse_date_time(const std::string& text);

/**
 * @brief Parse a due date for the write path
 * @param text User input, see parse_date_time()
 * @param clock Reference for "now"
 * @return Due date in UTC, strictly after clock.now()
 * @throws ValidationError on bad format or a date not in the future
 */
QDateTime parse_due_date(const std::string& text, const Clock& clock);

/**
 * @brief Storage encoding: RFC 3339, UTC, milliseconds ("2030-01-01T00:00:00.000Z")
 */
std::string format_timestamp(const QDateTime& instant);

/**
 * @brief Decode format_timestamp() output (or any RFC 3339 text)
 * @return UTC instant, invalid QDateTime if the text cannot be decoded
 */
QDateTime parse_timestamp(const std::string& text);

#endif
