#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <QCoreApplication>
#include "command_line.hpp"
#include "database_manager.hpp"
#include "test_support.hpp"
#include <sstream>
#include <string>

namespace {

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

struct Session {
    TempFile db;
    ManualClock clock{utc(2025, 1, 1)};
    std::ostringstream out;
    std::ostringstream err;

    ExitCode run(QStringList args) {
        out.str("");
        err.str("");
        args.prepend("todo");
        args << "--db" << QString::fromStdString(db.path());
        CommandLine cli(out, err, false, clock);
        return cli.run(args);
    }
};

} // namespace

TEST_CASE("Add, list and show") {
    Session s;

    REQUIRE(s.run({"add", "Buy milk", "--description", "2 liters", "-d", "2030-01-01", "-p", "high"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "Task added successfully with ID: 1"));

    s.clock.advance(1000);
    REQUIRE(s.run({"add", "Call mom"}) == ExitCode::Ok);

    REQUIRE(s.run({"list"}) == ExitCode::Ok);
    const std::string listing = s.out.str();
    CHECK(contains(listing, "[1] Buy milk HIGH ○ PENDING 2030-01-01"));
    CHECK(contains(listing, "[2] Call mom MEDIUM ○ PENDING No due date"));
    CHECK(listing.find("Buy milk") < listing.find("Call mom"));
    CHECK(contains(listing, "Total: 2 tasks"));

    REQUIRE(s.run({"show", "1"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "Description: 2 liters"));
}

TEST_CASE("Complete hides the task from the default list") {
    Session s;
    REQUIRE(s.run({"add", "Laundry"}) == ExitCode::Ok);
    REQUIRE(s.run({"complete", "1"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "Task 1 marked as completed!"));

    REQUIRE(s.run({"list"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "No tasks found."));

    REQUIRE(s.run({"list", "--completed"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "✓ COMPLETED"));
}

TEST_CASE("Update and priority filter") {
    Session s;
    REQUIRE(s.run({"add", "Report", "-p", "low"}) == ExitCode::Ok);
    REQUIRE(s.run({"update", "1", "-t", "Final report", "-p", "high"}) == ExitCode::Ok);

    REQUIRE(s.run({"list", "-p", "high"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "[1] Final report HIGH"));

    REQUIRE(s.run({"list", "-p", "low"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "No tasks found."));
}

TEST_CASE("Exit codes") {
    Session s;

    CHECK(s.run({"show", "5"}) == ExitCode::NotFound);
    CHECK(contains(s.err.str(), "Error: Task with ID 5 not found"));

    CHECK(s.run({"delete", "5"}) == ExitCode::NotFound);
    CHECK(s.run({"complete", "5"}) == ExitCode::NotFound);
    CHECK(s.run({"update", "5", "-t", "x"}) == ExitCode::NotFound);

    CHECK(s.run({"add", "Bad", "-d", "not-a-date"}) == ExitCode::Invalid);
    CHECK(contains(s.err.str(), "Invalid date format"));

    CHECK(s.run({"add", "Late", "-d", "2024-12-31"}) == ExitCode::Invalid);
    CHECK(contains(s.err.str(), "must be in the future"));

    CHECK(s.run({"add", "Odd", "-p", "urgent"}) == ExitCode::Invalid);
    CHECK(s.run({"add"}) == ExitCode::Invalid);
    CHECK(s.run({"show", "abc"}) == ExitCode::Invalid);
    CHECK(s.run({"frobnicate"}) == ExitCode::Invalid);
    CHECK(s.run({"list", "--bogus"}) == ExitCode::Invalid);
    CHECK(s.run({"show", "1", "2"}) == ExitCode::Invalid);
}

TEST_CASE("Delete") {
    Session s;
    REQUIRE(s.run({"add", "Temporary"}) == ExitCode::Ok);
    REQUIRE(s.run({"delete", "1"}) == ExitCode::Ok);
    CHECK(s.run({"show", "1"}) == ExitCode::NotFound);
}

TEST_CASE("Stats") {
    Session s;
    REQUIRE(s.run({"add", "One", "-d", "2025-01-02"}) == ExitCode::Ok);
    REQUIRE(s.run({"add", "Two"}) == ExitCode::Ok);
    REQUIRE(s.run({"complete", "2"}) == ExitCode::Ok);

    s.clock.set(utc(2025, 2, 1));
    REQUIRE(s.run({"stats"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "Pending: 1"));
    CHECK(contains(s.out.str(), "Completed: 1"));
    CHECK(contains(s.out.str(), "Overdue: 1"));
}

TEST_CASE("Help does not touch the database") {
    Session s;
    CHECK(s.run({"--help"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "add, list, complete, delete, update, show or stats."));

    CHECK(s.run({"add", "--help"}) == ExitCode::Ok);
    CHECK(contains(s.out.str(), "--due"));
}

TEST_CASE("Unusable database path is a storage error") {
    std::ostringstream out;
    std::ostringstream err;
    CommandLine cli(out, err, false);
    CHECK(cli.run({"todo", "--db", "/nonexistent-dir/sub/tasks.db", "list"}) == ExitCode::Storage);
}

// QCommandLineParser help output reads the application arguments
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("todo");

    doctest::Context context(argc, argv);
    return context.run();
}
