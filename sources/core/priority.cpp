#include "priority.hpp"

int priority_to_ordinal(Priority priority) noexcept {
    return static_cast<int>(priority);
}

Priority priority_from_ordinal(int ordinal) noexcept {
    switch (ordinal) {
        case 0: return Priority::Low;
        case 1: return Priority::Medium;
        case 2: return Priority::High;
        default:
            ///< Corrupt or unknown value: treat as Medium
            return Priority::Medium;
    }
}

bool is_valid_priority_ordinal(int ordinal) noexcept {
    return ordinal >= priority_to_ordinal(Priority::Low)
        && ordinal <= priority_to_ordinal(Priority::High);
}

const char* priority_label(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low: return "LOW";
        case Priority::High: return "HIGH";
        case Priority::Medium: break;
    }
    return "MEDIUM";
}

const char* priority_label(int ordinal) noexcept {
    return priority_label(priority_from_ordinal(ordinal));
}

std::optional<Priority> priority_from_name(const QString& name) {
    const QString trimmed = name.trimmed();
    for (Priority priority : {Priority::Low, Priority::Medium, Priority::High}) {
        if (trimmed.compare(QLatin1String(priority_label(priority)), Qt::CaseInsensitive) == 0) {
            return priority;
        }
    }
    return std::nullopt;
}
