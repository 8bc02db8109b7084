#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <ostream>
#include <QCommandLineParser>
#include <QStringList>
#include "clock.hpp"
#include "task_formatter.hpp"
#include "task_service.hpp"

/**
 * @brief Process exit codes
 */
enum class ExitCode : int {
    Ok = 0,
    Invalid = 1,     ///< Bad arguments or rejected input
    NotFound = 2,
    Storage = 3      ///< Database or configuration failure
};

/**
 * @class CommandLine
 * @brief Parses "todo <command> [options]" and runs the command against the task database
 */
class CommandLine {
public:
    /**
     * @param out Normal output
     * @param err Error output
     * @param color_allowed Terminal supports colors (--no-color still turns them off)
     * @param clock Reference for due-date validation and overdue highlighting
     */
    CommandLine(std::ostream& out, std::ostream& err, bool color_allowed,
                const Clock& clock = SystemClock::instance());

    /**
     * @brief Run one command
     * @param arguments Full argument list, program name first
     * @return Exit code for the process
     */
    ExitCode run(const QStringList& arguments);

private:
    std::ostream& out_;
    std::ostream& err_;
    bool color_allowed_;
    const Clock& clock_;

    ExitCode fail(const TaskFormatter& formatter, ExitCode code, const std::string& message);
    ExitCode dispatch(const QString& command, QCommandLineParser& parser,
                      TaskService& service, const TaskFormatter& formatter);

    void addTask(QCommandLineParser& parser, TaskService& service);
    void listTasks(QCommandLineParser& parser, TaskService& service, const TaskFormatter& formatter);
    void completeTask(QCommandLineParser& parser, TaskService& service);
    void deleteTask(QCommandLineParser& parser, TaskService& service);
    void updateTask(QCommandLineParser& parser, TaskService& service);
    void showTask(QCommandLineParser& parser, TaskService& service, const TaskFormatter& formatter);
    void showStats(TaskService& service);
};

#endif
