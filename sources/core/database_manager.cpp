#include "database_manager.hpp"
#include "date_parser.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <sstream>
#include <iostream>
#include <QDebug>

namespace {

const char* const kTaskColumns =
    "id, title, description, due_date, priority, completed, created_at, updated_at";

// Stored priority folded onto 0..2, anything else counts as Medium (1)
const char* const kEffectivePriority =
    "(CASE WHEN priority IN (0, 1, 2) THEN priority ELSE 1 END)";

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

} // namespace

DatabaseManager::DatabaseManager(const std::string& db_path, const Clock& clock) : db_(nullptr), clock_(clock) {
    int rc = sqlite3_open_v2(
        db_path.c_str(),
        &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );

    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw StorageError("Cannot open database " + db_path + ": " + err);
    }

    try {
        initialize();
    } catch (...) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

DatabaseManager::~DatabaseManager() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void DatabaseManager::initialize() {
    try {
        executeQuery(
            "CREATE TABLE IF NOT EXISTS tasks ("
            "id INTEGER PRIMARY KEY, "
            "title TEXT NOT NULL, "
            "description TEXT, "
            "due_date TEXT, "
            "priority INTEGER DEFAULT 1, "  // 0, 1 or 2
            "completed BOOLEAN DEFAULT FALSE, "
            "created_at TEXT NOT NULL, "
            "updated_at TEXT NOT NULL"
            ");"
        );
    } catch (const StorageError& e) {
        std::cerr << "[ERROR] Database initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void DatabaseManager::throwOnError(int rc, const std::string& context) const {
    if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE) {
        std::ostringstream oss;
        oss << "SQLite error (" << context << "): " << sqlite3_errmsg(db_);
        throw StorageError(oss.str());
    }
}

DatabaseManager::Statement DatabaseManager::prepare(const std::string& sql, const std::string& context) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    Statement stmt(raw);
    throwOnError(rc, "prepare " + context);
    return stmt;
}

void DatabaseManager::stepDone(sqlite3_stmt* stmt, const std::string& context) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        throw StorageError("SQLite error (execute " + context + "): statement returned rows");
    }
    throwOnError(rc, "execute " + context);
}

void DatabaseManager::executeQuery(const std::string& sql) {
    Statement stmt = prepare(sql, "query");
    stepDone(stmt.get(), "query");
}

void DatabaseManager::bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    throwOnError(sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT), "bind");
}

void DatabaseManager::bindOptionalText(sqlite3_stmt* stmt, int index, const std::string& value) {
    if (value.empty()) {
        throwOnError(sqlite3_bind_null(stmt, index), "bind");
    } else {
        bindText(stmt, index, value);
    }
}

// Binds ?1..?5: title, description, due_date, priority, completed
void DatabaseManager::bindTaskParameters(sqlite3_stmt* stmt, const Task& task) {
    bindText(stmt, 1, task.get_title());
    bindOptionalText(stmt, 2, task.get_description());
    bindOptionalText(stmt, 3, task.has_due_date() ? format_timestamp(task.get_due_date()) : std::string());
    throwOnError(sqlite3_bind_int(stmt, 4, priority_to_ordinal(task.get_priority())), "bind");
    throwOnError(sqlite3_bind_int(stmt, 5, task.is_completed() ? 1 : 0), "bind");
}

Task DatabaseManager::mapTaskFromRow(sqlite3_stmt* stmt) {
    Task task;

    const Task::Id id = sqlite3_column_int64(stmt, 0);
    task.set_id(id);
    const std::string title = columnText(stmt, 1);
    if (title.empty()) {
        throw StorageError("Task " + std::to_string(id) + " has an empty title");
    }
    task.set_title(title);
    if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
        task.set_description(columnText(stmt, 2));
    }
    // due_date
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        const std::string raw = columnText(stmt, 3);
        const QDateTime due = parse_timestamp(raw);
        if (due.isValid()) {
            task.set_due_date(due);
        } else {
            qWarning() << "Task" << id << "has an unreadable due date" << QString::fromStdString(raw) << "- ignoring it";
        }
    }
    // priority
    // Only an INTEGER 0..2 is a priority; NULL, text, reals and wide values count as Medium,
    // matching kEffectivePriority
    const bool integral = sqlite3_column_type(stmt, 4) == SQLITE_INTEGER;
    const sqlite3_int64 ordinal = integral ? sqlite3_column_int64(stmt, 4) : -1;
    if (ordinal < 0 || ordinal > 2) {
        const bool is_null = sqlite3_column_type(stmt, 4) == SQLITE_NULL;
        qWarning() << "Task" << id << "has unknown priority"
                   << (is_null ? QStringLiteral("NULL") : QString::fromStdString(columnText(stmt, 4)))
                   << "- treating it as MEDIUM";
        task.set_priority(Priority::Medium);
    } else {
        task.set_priority(priority_from_ordinal(static_cast<int>(ordinal)));
    }
    task.mark_completed(sqlite3_column_int(stmt, 5) != 0);
    // timestamps
    const QDateTime created_at = parse_timestamp(columnText(stmt, 6));
    const QDateTime updated_at = parse_timestamp(columnText(stmt, 7));
    if (!created_at.isValid() || !updated_at.isValid()) {
        throw StorageError("Corrupt timestamps in task " + std::to_string(id));
    }
    task.set_created_at(created_at);
    task.set_updated_at(updated_at);

    return task;
}

Task::Id DatabaseManager::createTask(const Task& task) {
    const std::string sql =
        "INSERT INTO tasks (title, description, due_date, priority, completed, created_at, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7);";
    Statement stmt = prepare(sql, "INSERT task");

    bindTaskParameters(stmt.get(), task);
    bindText(stmt.get(), 6, format_timestamp(task.get_created_at()));
    bindText(stmt.get(), 7, format_timestamp(task.get_updated_at()));

    stepDone(stmt.get(), "INSERT task");
    return sqlite3_last_insert_rowid(db_);
}

std::vector<Task> DatabaseManager::getAllTasks(bool include_completed, std::optional<Priority> priority_filter) {
    std::string sql = std::string("SELECT ") + kTaskColumns + " FROM tasks";

    std::vector<std::string> conditions;
    if (!include_completed) {
        conditions.emplace_back("completed = 0");
    }
    if (priority_filter) {
        conditions.emplace_back(std::string(kEffectivePriority) + " = ?1");
    }
    for (size_t i = 0; i < conditions.size(); ++i) {
        sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
    }
    sql += std::string(" ORDER BY ") + kEffectivePriority + " DESC, created_at ASC, id ASC;";

    Statement stmt = prepare(sql, "SELECT tasks");
    if (priority_filter) {
        throwOnError(sqlite3_bind_int(stmt.get(), 1, priority_to_ordinal(*priority_filter)), "bind");
    }

    std::vector<Task> tasks;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        tasks.push_back(mapTaskFromRow(stmt.get()));
    }
    throwOnError(rc, "SELECT tasks");
    return tasks;
}

std::optional<Task> DatabaseManager::getTaskById(Task::Id id) {
    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id = ?;";
    Statement stmt = prepare(sql, "SELECT by id");
    throwOnError(sqlite3_bind_int64(stmt.get(), 1, id), "bind");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return mapTaskFromRow(stmt.get());
    }
    throwOnError(rc, "SELECT by id");
    return std::nullopt;
}

void DatabaseManager::updateTask(Task::Id id, const Task& task) {
    const std::string sql =
        "UPDATE tasks SET "
        "title=?1, description=?2, due_date=?3, priority=?4, completed=?5, updated_at=?6 "
        "WHERE id=?7;";
    Statement stmt = prepare(sql, "UPDATE task");

    bindTaskParameters(stmt.get(), task);
    bindText(stmt.get(), 6, format_timestamp(nextUpdatedAt(id)));
    throwOnError(sqlite3_bind_int64(stmt.get(), 7, id), "bind");

    stepDone(stmt.get(), "UPDATE task");
    if (sqlite3_changes(db_) == 0) {
        throw NotFoundError(id);
    }
}

QDateTime DatabaseManager::nextUpdatedAt(Task::Id id) {
    Statement stmt = prepare("SELECT updated_at FROM tasks WHERE id = ?;", "SELECT updated_at");
    throwOnError(sqlite3_bind_int64(stmt.get(), 1, id), "bind");

    int rc = sqlite3_step(stmt.get());
    throwOnError(rc, "SELECT updated_at");
    if (rc != SQLITE_ROW) {
        throw NotFoundError(id);
    }

    const QDateTime now = clock_.now().toUTC();
    const QDateTime stored = parse_timestamp(columnText(stmt.get(), 0));
    if (stored.isValid() && now <= stored) {
        return stored.addMSecs(1);
    }
    return now;
}

void DatabaseManager::completeTask(Task::Id id) {
    const std::string sql = "UPDATE tasks SET completed = 1, updated_at = ? WHERE id = ?;";
    Statement stmt = prepare(sql, "complete task");

    bindText(stmt.get(), 1, format_timestamp(nextUpdatedAt(id)));
    throwOnError(sqlite3_bind_int64(stmt.get(), 2, id), "bind");

    stepDone(stmt.get(), "complete task");
    if (sqlite3_changes(db_) == 0) {
        throw NotFoundError(id);
    }
}

void DatabaseManager::deleteTask(Task::Id id) {
    const std::string sql = "DELETE FROM tasks WHERE id = ?;";
    Statement stmt = prepare(sql, "DELETE task");
    throwOnError(sqlite3_bind_int64(stmt.get(), 1, id), "bind");

    stepDone(stmt.get(), "DELETE task");
    if (sqlite3_changes(db_) == 0) {
        throw NotFoundError(id);
    }
}

bool DatabaseManager::taskExists(Task::Id id) {
    Statement stmt = prepare("SELECT COUNT(*) FROM tasks WHERE id = ?;", "task exists");
    throwOnError(sqlite3_bind_int64(stmt.get(), 1, id), "bind");

    int rc = sqlite3_step(stmt.get());
    throwOnError(rc, "task exists");
    return rc == SQLITE_ROW && sqlite3_column_int(stmt.get(), 0) > 0;
}

TaskStats DatabaseManager::getTaskStats(const QDateTime& now) {
    const std::string sql =
        "SELECT "
        "COALESCE(SUM(completed = 0), 0), "
        "COALESCE(SUM(completed != 0), 0), "
        "COALESCE(SUM(completed = 0 AND due_date IS NOT NULL AND due_date < ?1), 0) "
        "FROM tasks;";
    Statement stmt = prepare(sql, "task stats");
    bindText(stmt.get(), 1, format_timestamp(now));

    TaskStats stats;
    int rc = sqlite3_step(stmt.get());
    throwOnError(rc, "task stats");
    if (rc == SQLITE_ROW) {
        stats.pending = sqlite3_column_int(stmt.get(), 0);
        stats.completed = sqlite3_column_int(stmt.get(), 1);
        stats.overdue = sqlite3_column_int(stmt.get(), 2);
    }
    return stats;
}
