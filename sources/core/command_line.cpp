#include "command_line.hpp"
#include "config_manager.hpp"
#include "database_manager.hpp"
#include "errors.hpp"
#include <optional>
#include <string>
#include <QCoreApplication>

namespace {

const char* const kSeparator =
    "────────────────────────────────────────"
    "────────────────────────────────────────";

QCommandLineOption priorityOption(const QString& description) {
    return QCommandLineOption(QStringList{"p", "priority"}, description, "low|medium|high");
}

std::optional<std::string> optionalValue(const QCommandLineParser& parser, const QString& name) {
    if (!parser.isSet(name)) {
        return std::nullopt;
    }
    return parser.value(name).toStdString();
}

int priorityOrdinal(const QString& name) {
    const auto priority = priority_from_name(name);
    if (!priority) {
        throw ValidationError("Invalid priority '" + name.toStdString() + "'. Use low, medium or high");
    }
    return priority_to_ordinal(*priority);
}

QString requiredArgument(const QCommandLineParser& parser, int index, const char* name) {
    const QStringList positional = parser.positionalArguments();
    if (positional.size() <= index) {
        throw ValidationError(std::string("Missing argument: ") + name);
    }
    return positional.at(index);
}

Task::Id taskIdArgument(const QCommandLineParser& parser) {
    const QString text = requiredArgument(parser, 1, "id");
    bool ok = false;
    const qlonglong id = text.toLongLong(&ok);
    if (!ok) {
        throw ValidationError("Invalid task ID '" + text.toStdString() + "'");
    }
    return id;
}

// Registers the options and arguments of one sub-command; false for an unknown command
bool configureCommand(const QString& command, QCommandLineParser& parser) {
    parser.clearPositionalArguments();

    if (command == "add") {
        parser.addPositionalArgument("add", "Add a new task.", "add");
        parser.addPositionalArgument("title", "Task title.");
        parser.addOption(QCommandLineOption("description", "Task description.", "text"));
        parser.addOption(QCommandLineOption(QStringList{"d", "due"}, "Due date (YYYY-MM-DD or RFC3339).", "date"));
        parser.addOption(priorityOption("Priority level (default: medium)."));
    } else if (command == "list") {
        parser.addPositionalArgument("list", "List tasks.", "list");
        parser.addOption(QCommandLineOption(QStringList{"c", "completed"}, "Show completed tasks too."));
        parser.addOption(priorityOption("Filter by priority."));
    } else if (command == "complete") {
        parser.addPositionalArgument("complete", "Mark a task as completed.", "complete");
        parser.addPositionalArgument("id", "Task ID.");
    } else if (command == "delete") {
        parser.addPositionalArgument("delete", "Delete a task.", "delete");
        parser.addPositionalArgument("id", "Task ID.");
    } else if (command == "update") {
        parser.addPositionalArgument("update", "Update a task.", "update");
        parser.addPositionalArgument("id", "Task ID.");
        parser.addOption(QCommandLineOption(QStringList{"t", "title"}, "New title.", "text"));
        parser.addOption(QCommandLineOption("description", "New description.", "text"));
        parser.addOption(QCommandLineOption(QStringList{"d", "due"}, "New due date (YYYY-MM-DD or RFC3339).", "date"));
        parser.addOption(priorityOption("New priority level."));
    } else if (command == "show") {
        parser.addPositionalArgument("show", "Show details of a task.", "show");
        parser.addPositionalArgument("id", "Task ID.");
    } else if (command == "stats") {
        parser.addPositionalArgument("stats", "Show task counters.", "stats");
    } else {
        return false;
    }
    return true;
}

} // namespace

CommandLine::CommandLine(std::ostream& out, std::ostream& err, bool color_allowed, const Clock& clock)
    : out_(out), err_(err), color_allowed_(color_allowed), clock_(clock) {}

ExitCode CommandLine::fail(const TaskFormatter& formatter, ExitCode code, const std::string& message) {
    err_ << formatter.error_text("Error: " + message) << std::endl;
    return code;
}

ExitCode CommandLine::run(const QStringList& arguments) {
    QCommandLineParser parser;
    parser.setApplicationDescription("A simple todo CLI tool with SQLite storage");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        QCommandLineOption("db", "Task database file (overrides the config file).", "path"),
        QCommandLineOption("config", "Configuration file (default: ~/.todo.ini).", "file"),
        QCommandLineOption("no-color", "Disable colored output."),
    });
    parser.addPositionalArgument("command", "add, list, complete, delete, update, show or stats.");

    // First pass only locates the command; its own options are not registered yet
    const bool global_ok = parser.parse(arguments);

    const TaskFormatter formatter(clock_, color_allowed_ && !parser.isSet("no-color"));
    const QStringList positional = parser.positionalArguments();
    if (!global_ok && positional.isEmpty()) {
        return fail(formatter, ExitCode::Invalid, parser.errorText().toStdString());
    }

    if (positional.isEmpty()) {
        if (parser.isSet("version")) {
            out_ << QCoreApplication::applicationName().toStdString() << " "
                 << QCoreApplication::applicationVersion().toStdString() << std::endl;
            return ExitCode::Ok;
        }
        if (parser.isSet("help")) {
            out_ << parser.helpText().toStdString();
            return ExitCode::Ok;
        }
        err_ << parser.helpText().toStdString();
        return ExitCode::Invalid;
    }

    const QString command = positional.first();
    if (!configureCommand(command, parser)) {
        return fail(formatter, ExitCode::Invalid, "Unknown command '" + command.toStdString() + "'");
    }
    if (!parser.parse(arguments)) {
        return fail(formatter, ExitCode::Invalid, parser.errorText().toStdString());
    }
    if (parser.isSet("help")) {
        out_ << parser.helpText().toStdString();
        return ExitCode::Ok;
    }

    const QStringList arguments_left = parser.positionalArguments();
    const int expected = (command == "list" || command == "stats") ? 1 : 2;
    if (arguments_left.size() > expected) {
        return fail(formatter, ExitCode::Invalid, "Unexpected argument '" + arguments_left.at(expected).toStdString() + "'");
    }

    try {
        ConfigManager config(optionalValue(parser, "config"));
        const std::string db_path = optionalValue(parser, "db").value_or(config.get_db_path());

        DatabaseManager db(db_path, clock_);
        TaskService service(db, clock_);
        return dispatch(command, parser, service, formatter);
    } catch (const ValidationError& e) {
        return fail(formatter, ExitCode::Invalid, e.what());
    } catch (const NotFoundError& e) {
        return fail(formatter, ExitCode::NotFound, e.what());
    } catch (const StorageError& e) {
        return fail(formatter, ExitCode::Storage, e.what());
    } catch (const ConfigError& e) {
        return fail(formatter, ExitCode::Storage, e.what());
    }
}

ExitCode CommandLine::dispatch(const QString& command, QCommandLineParser& parser,
                               TaskService& service, const TaskFormatter& formatter) {
    if (command == "add") {
        addTask(parser, service);
    } else if (command == "list") {
        listTasks(parser, service, formatter);
    } else if (command == "complete") {
        completeTask(parser, service);
    } else if (command == "delete") {
        deleteTask(parser, service);
    } else if (command == "update") {
        updateTask(parser, service);
    } else if (command == "show") {
        showTask(parser, service, formatter);
    } else {
        showStats(service);
    }
    return ExitCode::Ok;
}

void CommandLine::addTask(QCommandLineParser& parser, TaskService& service) {
    const std::string title = requiredArgument(parser, 1, "title").toStdString();
    const int priority = parser.isSet("priority")
        ? priorityOrdinal(parser.value("priority"))
        : priority_to_ordinal(Priority::Medium);

    const Task::Id id = service.create(title,
                                       optionalValue(parser, "description"),
                                       optionalValue(parser, "due"),
                                       priority);
    out_ << "✅ Task added successfully with ID: " << id << std::endl;
}

void CommandLine::listTasks(QCommandLineParser& parser, TaskService& service, const TaskFormatter& formatter) {
    std::optional<int> priority;
    if (parser.isSet("priority")) {
        priority = priorityOrdinal(parser.value("priority"));
    }

    const std::vector<Task> tasks = service.list(parser.isSet("completed"), priority);
    if (tasks.empty()) {
        out_ << "📝 No tasks found." << std::endl;
        return;
    }

    out_ << "📋 Your tasks:" << std::endl;
    out_ << kSeparator << std::endl;
    for (const Task& task : tasks) {
        out_ << formatter.summary_line(task) << std::endl;
    }
    out_ << kSeparator << std::endl;
    out_ << "Total: " << tasks.size() << " tasks" << std::endl;
}

void CommandLine::completeTask(QCommandLineParser& parser, TaskService& service) {
    const Task::Id id = taskIdArgument(parser);
    service.complete(id);
    out_ << "✅ Task " << id << " marked as completed!" << std::endl;
}

void CommandLine::deleteTask(QCommandLineParser& parser, TaskService& service) {
    const Task::Id id = taskIdArgument(parser);
    service.remove(id);
    out_ << "🗑️  Task " << id << " deleted successfully!" << std::endl;
}

void CommandLine::updateTask(QCommandLineParser& parser, TaskService& service) {
    const Task::Id id = taskIdArgument(parser);

    TaskPatch patch;
    patch.title = optionalValue(parser, "title");
    patch.description = optionalValue(parser, "description");
    patch.due_date = optionalValue(parser, "due");
    if (parser.isSet("priority")) {
        patch.priority = priorityOrdinal(parser.value("priority"));
    }

    service.update(id, patch);
    out_ << "✅ Task " << id << " updated successfully!" << std::endl;
}

void CommandLine::showTask(QCommandLineParser& parser, TaskService& service, const TaskFormatter& formatter) {
    const Task::Id id = taskIdArgument(parser);
    const std::optional<Task> task = service.get(id);
    if (!task) {
        throw NotFoundError(id);
    }

    out_ << "📋 Task Details:" << std::endl;
    out_ << kSeparator << std::endl;
    out_ << formatter.detail_view(*task) << std::endl;
    out_ << kSeparator << std::endl;
}

void CommandLine::showStats(TaskService& service) {
    const TaskStats stats = service.stats();
    out_ << "Pending: " << stats.pending << std::endl;
    out_ << "Completed: " << stats.completed << std::endl;
    out_ << "Overdue: " << stats.overdue << std::endl;
}
