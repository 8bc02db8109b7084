#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "task_service.hpp"
#include "errors.hpp"
#include "test_support.hpp"

TEST_CASE("Create validates input") {
    ManualClock clock(utc(2025, 1, 1));
    DatabaseManager db(":memory:", clock);
    TaskService service(db, clock);

    SUBCASE("Valid task") {
        const Task::Id id = service.create("Plan trip", std::string("Book hotel"), std::string("2030-01-01"), 2);
        auto task = service.get(id);
        REQUIRE(task.has_value());
        CHECK(task->get_title() == "Plan trip");
        CHECK(task->get_description() == "Book hotel");
        CHECK(task->due_date_text() == "2030-01-01");
        CHECK(task->get_priority() == Priority::High);
        CHECK(service.exists(id));
    }

    SUBCASE("Empty title") {
        CHECK_THROWS_AS(service.create("", std::nullopt, std::nullopt, 1), ValidationError);
    }

    SUBCASE("Bad date format") {
        CHECK_THROWS_WITH_AS(service.create("Task", std::nullopt, std::string("not-a-date"), 1),
                             "Invalid date format. Please use YYYY-MM-DD or RFC3339 format",
                             ValidationError);
    }

    SUBCASE("Past date") {
        CHECK_THROWS_WITH_AS(service.create("Task", std::nullopt, std::string("2024-12-31"), 1),
                             "Due date must be in the future", ValidationError);
    }

    SUBCASE("Priority out of range") {
        CHECK_THROWS_AS(service.create("Task", std::nullopt, std::nullopt, 3), ValidationError);
        CHECK_THROWS_AS(service.create("Task", std::nullopt, std::nullopt, -1), ValidationError);
    }
}

TEST_CASE("Create then complete") {
    ManualClock clock(utc(2025, 1, 1));
    DatabaseManager db(":memory:", clock);
    TaskService service(db, clock);

    const Task::Id id = service.create("Water plants", std::nullopt, std::nullopt, 1);
    clock.advance(1000);
    service.complete(id);

    auto pending = service.list(false);
    CHECK(pending.empty());

    auto all = service.list(true);
    REQUIRE(all.size() == 1);
    CHECK(all[0].get_id() == id);
    CHECK(all[0].is_completed());
    CHECK(all[0].get_updated_at() > all[0].get_created_at());
}

TEST_CASE("Complete right after create still moves updated_at forward") {
    ManualClock clock(utc(2025, 1, 1));
    DatabaseManager db(":memory:", clock);
    TaskService service(db, clock);

    const Task::Id id = service.create("Quick one", std::nullopt, std::nullopt, 1);
    service.complete(id);

    auto task = service.get(id);
    REQUIRE(task.has_value());
    CHECK(task->is_completed());
    CHECK(task->get_updated_at() > task->get_created_at());
}

TEST_CASE("List with priority filter") {
    DatabaseManager db(":memory:");
    TaskService service(db);

    service.create("A", std::nullopt, std::nullopt, 2);
    service.create("B", std::nullopt, std::nullopt, 0);

    CHECK(service.list(true, 2).size() == 1);
    CHECK(service.list(true, 0).size() == 1);
    CHECK(service.list(true, 1).empty());
    CHECK_THROWS_AS(service.list(true, 5), ValidationError);
}

TEST_CASE("Update applies only the given fields") {
    ManualClock clock(utc(2025, 1, 1));
    DatabaseManager db(":memory:", clock);
    TaskService service(db, clock);
    const Task::Id id = service.create("Draft", std::string("First pass"), std::string("2030-01-01"), 0);

    clock.advance(2000);

    SUBCASE("Title only") {
        TaskPatch patch;
        patch.title = "Final";
        service.update(id, patch);

        auto task = service.get(id);
        REQUIRE(task.has_value());
        CHECK(task->get_title() == "Final");
        CHECK(task->get_description() == "First pass");
        CHECK(task->due_date_text() == "2030-01-01");
        CHECK(task->get_priority() == Priority::Low);
        CHECK(task->get_updated_at() == utc(2025, 1, 1).addMSecs(2000));
    }

    SUBCASE("All fields") {
        TaskPatch patch;
        patch.title = "Final";
        patch.description = "Second pass";
        patch.due_date = "2031-06-30T12:00:00Z";
        patch.priority = 2;
        service.update(id, patch);

        auto task = service.get(id);
        REQUIRE(task.has_value());
        CHECK(task->get_description() == "Second pass");
        CHECK(task->get_due_date() == utc(2031, 6, 30, 12, 0));
        CHECK(task->get_priority() == Priority::High);
    }

    SUBCASE("Empty patch only refreshes updated_at") {
        service.update(id, TaskPatch{});

        auto task = service.get(id);
        REQUIRE(task.has_value());
        CHECK(task->get_title() == "Draft");
        CHECK(task->get_created_at() == utc(2025, 1, 1));
        CHECK(task->get_updated_at() == utc(2025, 1, 1).addMSecs(2000));
    }

    SUBCASE("Invalid override writes nothing") {
        TaskPatch patch;
        patch.title = "Changed";
        patch.due_date = "2020-01-01";
        CHECK_THROWS_AS(service.update(id, patch), ValidationError);

        TaskPatch empty_title;
        empty_title.title = "";
        CHECK_THROWS_AS(service.update(id, empty_title), ValidationError);

        auto task = service.get(id);
        REQUIRE(task.has_value());
        CHECK(task->get_title() == "Draft");
        CHECK(task->get_updated_at() == utc(2025, 1, 1));
    }
}

TEST_CASE("Operations on a missing task") {
    DatabaseManager db(":memory:");
    TaskService service(db);

    TaskPatch patch;
    patch.title = "Ghost";
    CHECK_THROWS_AS(service.update(99, patch), NotFoundError);
    CHECK_THROWS_AS(service.complete(99), NotFoundError);
    CHECK_THROWS_AS(service.remove(99), NotFoundError);
    CHECK_FALSE(service.get(99).has_value());
    CHECK_FALSE(service.exists(99));
    CHECK(service.list(true).empty());
}

TEST_CASE("Remove") {
    DatabaseManager db(":memory:");
    TaskService service(db);
    const Task::Id id = service.create("Temporary", std::nullopt, std::nullopt, 1);

    service.remove(id);
    CHECK_FALSE(service.get(id).has_value());
    CHECK_FALSE(service.exists(id));
}

TEST_CASE("Stats use the service clock") {
    ManualClock clock(utc(2025, 1, 1));
    DatabaseManager db(":memory:", clock);
    TaskService service(db, clock);

    service.create("Soon", std::nullopt, std::string("2025-01-02"), 1);
    CHECK(service.stats().overdue == 0);

    clock.set(utc(2025, 1, 3));
    const TaskStats stats = service.stats();
    CHECK(stats.pending == 1);
    CHECK(stats.overdue == 1);
}
