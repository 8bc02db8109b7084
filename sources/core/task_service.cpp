#include "task_service.hpp"
#include "date_parser.hpp"
#include "errors.hpp"

TaskService::TaskService(DatabaseManager& db, const Clock& clock) : db_(db), clock_(clock) {}

Priority TaskService::checked_priority(int ordinal) {
    if (!is_valid_priority_ordinal(ordinal)) {
        throw ValidationError("Invalid priority " + std::to_string(ordinal) + ". Use low, medium or high");
    }
    return priority_from_ordinal(ordinal);
}

Task::Id TaskService::create(const std::string& title,
                             const std::optional<std::string>& description,
                             const std::optional<std::string>& due_date,
                             int priority) {
    QDateTime due;
    if (due_date) {
        due = parse_due_date(*due_date, clock_);
    }

    Task task(title, description.value_or(""), due, checked_priority(priority), clock_);
    return db_.createTask(task);
}

std::vector<Task> TaskService::list(bool include_completed, std::optional<int> priority) {
    std::optional<Priority> filter;
    if (priority) {
        filter = checked_priority(*priority);
    }
    return db_.getAllTasks(include_completed, filter);
}

std::optional<Task> TaskService::get(Task::Id id) {
    return db_.getTaskById(id);
}

bool TaskService::exists(Task::Id id) {
    return db_.taskExists(id);
}

void TaskService::update(Task::Id id, const TaskPatch& patch) {
    std::optional<Task> stored = db_.getTaskById(id);
    if (!stored) {
        throw NotFoundError(id);
    }

    Task task = *stored;
    if (patch.title) {
        task.set_title(*patch.title);
    }
    if (patch.description) {
        task.set_description(*patch.description);
    }
    if (patch.due_date) {
        task.set_due_date(parse_due_date(*patch.due_date, clock_));
    }
    if (patch.priority) {
        task.set_priority(checked_priority(*patch.priority));
    }

    db_.updateTask(id, task);
}

void TaskService::complete(Task::Id id) {
    db_.completeTask(id);
}

void TaskService::remove(Task::Id id) {
    db_.deleteTask(id);
}

TaskStats TaskService::stats() {
    return db_.getTaskStats(clock_.now());
}
