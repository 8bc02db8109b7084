#ifndef DATABASE_MANAGER_HPP
#define DATABASE_MANAGER_HPP

#include <sqlite3.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "clock.hpp"
#include "priority.hpp"
#include "task.hpp"

/**
 * @struct TaskStats
 * @brief Task counters shown by the "stats" command
 */
struct TaskStats {
    int pending = 0;
    int completed = 0;
    int overdue = 0;     ///< Pending tasks whose due date has passed
};

/**
 * @class DatabaseManager
 * @brief Manages the SQLite task table: schema creation, CRUD, filtered and ordered listing.
 */
class DatabaseManager {
public:
    /**
     * @brief Opens (or creates) the database file and creates the schema.
     * @param db_path Path to the SQLite database file, ":memory:" for a private in-memory database.
     * @param clock Source of "now" for updated_at refreshes.
     * @throws StorageError If the connection or schema creation fails.
     */
    explicit DatabaseManager(const std::string& db_path, const Clock& clock = SystemClock::instance());

    /**
     * @brief Closes the connection
     */
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Creates the tasks table if it does not exist. Safe to call repeatedly.
     */
    void initialize();

    /**
     * @brief Inserts a new task, all fields and both timestamps included.
     * @return ID assigned by the database
     */
    Task::Id createTask(const Task& task);

    /**
     * @brief Lists tasks ordered by priority (high first), then creation time (oldest first).
     * @param include_completed False hides completed tasks
     * @param priority_filter Keep only tasks with exactly this priority
     */
    std::vector<Task> getAllTasks(bool include_completed = true,
                                  std::optional<Priority> priority_filter = std::nullopt);

    /**
     * @return Task, or std::nullopt if no row has this ID
     */
    std::optional<Task> getTaskById(Task::Id id);

    /**
     * @brief Overwrites title, description, due date, priority and completion; updated_at is set to now.
     * @throws NotFoundError If no row has this ID
     */
    void updateTask(Task::Id id, const Task& task);

    /**
     * @brief Marks a task completed and refreshes updated_at. Other columns are untouched.
     * @throws NotFoundError If no row has this ID
     */
    void completeTask(Task::Id id);

    /**
     * @throws NotFoundError If no row has this ID
     */
    void deleteTask(Task::Id id);

    bool taskExists(Task::Id id);

    TaskStats getTaskStats(const QDateTime& now);

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    sqlite3* db_;          ///< SQLite database connection handle
    const Clock& clock_;

    /**
     * @brief Timestamp for the next mutation of a task: now, or 1 ms past the stored updated_at if the clock has not moved on
     * @throws NotFoundError If no row has this ID
     */
    QDateTime nextUpdatedAt(Task::Id id);

    void executeQuery(const std::string& sql);
    Statement prepare(const std::string& sql, const std::string& context);
    void throwOnError(int rc, const std::string& context) const;
    void stepDone(sqlite3_stmt* stmt, const std::string& context);

    void bindText(sqlite3_stmt* stmt, int index, const std::string& value);
    void bindOptionalText(sqlite3_stmt* stmt, int index, const std::string& value);
    void bindTaskParameters(sqlite3_stmt* stmt, const Task& task);
    Task mapTaskFromRow(sqlite3_stmt* stmt);
};

#endif
