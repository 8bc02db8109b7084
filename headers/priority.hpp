#ifndef PRIORITY_HPP
#define PRIORITY_HPP

#include <optional>
#include <string>
#include <QString>

/**
 * @brief Task priority, stored as its ordinal (0, 1, 2)
 */
enum class Priority { Low = 0, Medium = 1, High = 2 };

/**
 * @brief Ordinal stored in the database for a priority
 */
int priority_to_ordinal(Priority priority) noexcept;

/**
 * @brief Convert a stored ordinal back to a priority
 * @param ordinal Any integer, including values from a hand-edited database
 * @return Matching priority; anything outside 0..2 falls back to Priority::Medium
 */
Priority priority_from_ordinal(int ordinal) noexcept;

/**
 * @brief Check an ordinal supplied on the write path
 */
bool is_valid_priority_ordinal(int ordinal) noexcept;

/**
 * @brief Display label: "LOW", "MEDIUM" or "HIGH"
 */
const char* priority_label(Priority priority) noexcept;

/**
 * @brief Display label for a raw ordinal, with the same Medium fallback
 */
const char* priority_label(int ordinal) noexcept;

/**
 * @brief Parse a user-facing name ("low", "Medium", "HIGH", ...)
 * @return Priority or std::nullopt for an unknown name
 */
std::optional<Priority> priority_from_name(const QString& name);

#endif
