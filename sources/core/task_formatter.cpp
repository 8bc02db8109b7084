#include "task_formatter.hpp"
#include <sstream>

namespace {

const char* const kReset = "\033[0m";
const char* const kRed = "\033[31m";
const char* const kGreen = "\033[32m";
const char* const kYellow = "\033[33m";
const char* const kBlue = "\033[34m";
const char* const kWhite = "\033[37m";

std::string format_minutes(const QDateTime& instant) {
    return instant.toUTC().toString(QStringLiteral("yyyy-MM-dd HH:mm")).toStdString();
}

} // namespace

TaskFormatter::TaskFormatter(const Clock& clock, bool color) : clock_(clock), color_(color) {}

std::string TaskFormatter::paint(const std::string& text, const char* code) const {
    if (!color_) {
        return text;
    }
    return code + text + kReset;
}

std::string TaskFormatter::priority_text(const Task& task) const {
    switch (task.get_priority()) {
        case Priority::Low: return paint(task.priority_label(), kBlue);
        case Priority::High: return paint(task.priority_label(), kRed);
        case Priority::Medium: break;
    }
    return paint(task.priority_label(), kYellow);
}

std::string TaskFormatter::status_text(const Task& task) const {
    if (task.is_completed()) {
        return paint("✓ COMPLETED", kGreen);
    }
    return paint("○ PENDING", kWhite);
}

std::string TaskFormatter::due_text(const Task& task) const {
    if (task.is_overdue(clock_.now())) {
        return paint(task.due_date_text(), kRed);
    }
    return paint(task.due_date_text(), kWhite);
}

std::string TaskFormatter::error_text(const std::string& text) const {
    return paint(text, kRed);
}

std::string TaskFormatter::summary_line(const Task& task) const {
    std::ostringstream oss;
    oss << "[" << task.get_id().value_or(0) << "] "
        << task.get_title() << " "
        << priority_text(task) << " "
        << status_text(task) << " "
        << due_text(task);
    return oss.str();
}

std::string TaskFormatter::detail_view(const Task& task) const {
    std::ostringstream oss;
    oss << "Task #" << task.get_id().value_or(0) << ": " << task.get_title() << "\n"
        << "Priority: " << priority_text(task) << "\n"
        << "Status: " << status_text(task) << "\n"
        << "Due: " << due_text(task);
    if (task.has_description()) {
        oss << "\nDescription: " << task.get_description();
    }
    oss << "\nCreated: " << format_minutes(task.get_created_at())
        << "\nUpdated: " << format_minutes(task.get_updated_at());
    return oss.str();
}
