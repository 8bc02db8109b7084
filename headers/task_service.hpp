#ifndef TASK_SERVICE_HPP
#define TASK_SERVICE_HPP

#include <optional>
#include <string>
#include <vector>
#include "clock.hpp"
#include "database_manager.hpp"
#include "task.hpp"

/**
 * @struct TaskPatch
 * @brief Field-level overrides for "update"; unset fields keep their stored value
 */
struct TaskPatch {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> due_date;        ///< Raw user input, parsed by parse_due_date()
    std::optional<int> priority;                ///< Ordinal 0..2
};

/**
 * @class TaskService
 * @brief Operations offered to the command line: raw user input in, validated calls to the database out
 */
class TaskService {
public:
    TaskService(DatabaseManager& db, const Clock& clock = SystemClock::instance());

    /**
     * @brief Create and store a task
     * @param priority Ordinal 0..2
     * @return ID of the new task
     * @throws ValidationError on empty title, bad due date or priority out of range
     */
    Task::Id create(const std::string& title,
                    const std::optional<std::string>& description,
                    const std::optional<std::string>& due_date,
                    int priority);

    std::vector<Task> list(bool include_completed, std::optional<int> priority = std::nullopt);

    std::optional<Task> get(Task::Id id);
    bool exists(Task::Id id);

    /**
     * @throws NotFoundError if the task does not exist
     * @throws ValidationError if an override is invalid (nothing is written)
     */
    void update(Task::Id id, const TaskPatch& patch);

    void complete(Task::Id id);
    void remove(Task::Id id);

    TaskStats stats();

private:
    DatabaseManager& db_;
    const Clock& clock_;

    static Priority checked_priority(int ordinal);
};

#endif
