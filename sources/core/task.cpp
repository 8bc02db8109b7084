#include "task.hpp"
#include "errors.hpp"

Task::Task() : priority_(Priority::Medium), is_completed_(false) {}

Task::Task(const std::string& title, const std::string& description, const QDateTime& due_date, Priority priority, const Clock& clock)
    : title_(title),
      description_(description),
      priority_(priority),
      is_completed_(false)
{
    if (title.empty()) {
        throw ValidationError("Task title cannot be empty");
    }

    set_due_date(due_date);

    created_at_ = clock.now().toUTC();
    updated_at_ = created_at_;
}

std::optional<Task::Id> Task::get_id() const noexcept {
    return id_;
}

std::string Task::get_title() const {
    return title_;
}

std::string Task::get_description() const {
    return description_;
}

bool Task::has_description() const noexcept {
    return !description_.empty();
}

QDateTime Task::get_due_date() const {
    return due_date_;
}

bool Task::has_due_date() const noexcept {
    return due_date_.isValid();
}

Priority Task::get_priority() const noexcept {
    return priority_;
}

bool Task::is_completed() const noexcept {
    return is_completed_;
}

QDateTime Task::get_created_at() const {
    return created_at_;
}

QDateTime Task::get_updated_at() const {
    return updated_at_;
}

bool Task::is_overdue(const QDateTime& now) const {
    if (is_completed_) {
        return false;
    }
    return due_date_.isValid() && due_date_ < now;
}

std::string Task::priority_label() const {
    return ::priority_label(priority_);
}

std::string Task::due_date_text() const {
    if (!due_date_.isValid()) {
        return "No due date";
    }
    return due_date_.toUTC().toString(QStringLiteral("yyyy-MM-dd")).toStdString();
}

void Task::set_id(Id id) {
    id_ = id;
}

void Task::set_title(const std::string& title) {
    if (title.empty()) {
        throw ValidationError("Task title cannot be empty");
    }
    title_ = title;
}

void Task::set_description(const std::string& description) {
    description_ = description;
}

void Task::set_due_date(const QDateTime& due_date) {
    due_date_ = due_date.isValid() ? due_date.toUTC() : QDateTime();
}

void Task::clear_due_date() {
    due_date_ = QDateTime();
}

void Task::set_priority(Priority priority) noexcept {
    priority_ = priority;
}

void Task::mark_completed(bool status) noexcept {
    is_completed_ = status;
}

void Task::set_created_at(const QDateTime& created_at) {
    created_at_ = created_at.toUTC();
}

void Task::set_updated_at(const QDateTime& updated_at) {
    updated_at_ = updated_at.toUTC();
}
