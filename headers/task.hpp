#ifndef TASK_HPP
#define TASK_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <QDateTime>
#include "clock.hpp"
#include "priority.hpp"

/**
 * @class Task
 * @brief Stores information about the task: title, description, due date, priority, completion status, timestamps
 */
class Task {
public:
    using Id = std::int64_t;

    /**
     * @brief Construct an empty task (used when loading rows from the database)
     */
    Task();

    /**
     * @brief Construct a new Task object, not yet stored
     * @param title Task title (required)
     * @param description Task description (empty means none)
     * @param due_date Due date in UTC (invalid QDateTime means none)
     * @param priority Priority level
     * @param clock Source of the creation timestamp
     * @throws ValidationError if the title is empty
     */
    Task(const std::string& title,
         const std::string& description = "",
         const QDateTime& due_date = QDateTime(),
         Priority priority = Priority::Medium,
         const Clock& clock = SystemClock::instance()
    );

    ~Task() = default;

    /**
     * @brief Get the id object
     * @return Database ID, or std::nullopt before the first save
     */
    std::optional<Id> get_id() const noexcept;

    std::string get_title() const;
    std::string get_description() const;
    bool has_description() const noexcept;

    /**
     * @brief Get the due date
     * @return Due date in UTC, or an invalid QDateTime when there is none
     */
    QDateTime get_due_date() const;
    bool has_due_date() const noexcept;

    Priority get_priority() const noexcept;

    /**
     * @brief Check task completion status
     * @return True if the task is completed, otherwise false
     */
    bool is_completed() const noexcept;

    QDateTime get_created_at() const;
    QDateTime get_updated_at() const;

    /**
     * @brief Overdue check
     * @param now Reference instant
     * @return True if not completed and the due date lies strictly before now
     */
    bool is_overdue(const QDateTime& now) const;

    /**
     * @brief Priority as "LOW", "MEDIUM" or "HIGH"
     */
    std::string priority_label() const;

    /**
     * @brief Due date as yyyy-MM-dd (UTC) or "No due date"
     */
    std::string due_date_text() const;

    void set_id(Id id);

    /**
     * @throws ValidationError if the title is empty
     */
    void set_title(const std::string& title);
    void set_description(const std::string& description);
    void set_due_date(const QDateTime& due_date);
    void clear_due_date();
    void set_priority(Priority priority) noexcept;

    /**
     * @brief Update task completion status
     * @param status Status true for completed, false for incomplete
     */
    void mark_completed(bool status) noexcept;

    void set_created_at(const QDateTime& created_at);
    void set_updated_at(const QDateTime& updated_at);

private:
    std::optional<Id> id_;          ///< Assigned by the database on first save
    std::string title_;             ///< Task title
    std::string description_;       ///< Task description, empty when absent
    QDateTime due_date_;            ///< Invalid when absent
    Priority priority_;
    bool is_completed_;             ///< Completion status
    QDateTime created_at_;
    QDateTime updated_at_;
};

#endif
