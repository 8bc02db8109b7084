#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @class ValidationError
 * @brief Rejected user input: empty title, malformed or past due date, unknown priority
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @class NotFoundError
 * @brief No task is stored under the requested ID
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(std::int64_t id)
        : std::runtime_error("Task with ID " + std::to_string(id) + " not found"),
          id_(id) {}

    std::int64_t id() const noexcept { return id_; }

private:
    std::int64_t id_;
};

/**
 * @class StorageError
 * @brief SQLite failure or a row that cannot be decoded
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ConfigError
 * @brief Configuration file missing or unusable
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

#endif
