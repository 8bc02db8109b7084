#ifndef TASK_FORMATTER_HPP
#define TASK_FORMATTER_HPP

#include <string>
#include "clock.hpp"
#include "task.hpp"

/**
 * @class TaskFormatter
 * @brief Renders tasks as text for the terminal, optionally with ANSI colors
 */
class TaskFormatter {
public:
    /**
     * @param clock Reference for overdue highlighting
     * @param color Emit ANSI color escapes
     */
    explicit TaskFormatter(const Clock& clock = SystemClock::instance(), bool color = false);

    /**
     * @brief One line: "[id] title PRIORITY STATUS due-date"
     */
    std::string summary_line(const Task& task) const;

    /**
     * @brief Multi-line view with description and timestamps
     */
    std::string detail_view(const Task& task) const;

    std::string status_text(const Task& task) const;
    std::string priority_text(const Task& task) const;
    std::string due_text(const Task& task) const;

    /**
     * @brief Wrap text in red when colors are on (used for error messages)
     */
    std::string error_text(const std::string& text) const;

private:
    const Clock& clock_;
    bool color_;

    std::string paint(const std::string& text, const char* code) const;
};

#endif
