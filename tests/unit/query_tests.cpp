#include <doctest/doctest.h>
#include <vtm/query.hpp>

#include "test_support.hpp"

using namespace vtm;
using namespace vtm::test;

namespace {

std::vector<std::string> ids_of(const std::vector<Task>& tasks) {
    std::vector<std::string> ids;
    for (const auto& t : tasks) ids.push_back(t.id);
    return ids;
}

Manifest query_manifest() {
    Task t1 = make_task("TASK-010", TaskStatus::Completed);
    t1.title = "Parser";
    t1.risk = "low";
    t1.estimated_hours = 3;
    t1.adr_source = "adr/ADR-002-parser.md";

    Task t2 = make_task("TASK-002", TaskStatus::Pending);
    t2.title = "Lexer";
    t2.risk = "High";
    t2.estimated_hours = 5;
    t2.test_strategy = "unit";

    Task t3 = make_task("TASK-001", TaskStatus::InProgress);
    t3.title = "Bootstrap";
    t3.risk = "medium";
    t3.estimated_hours = 1;
    t3.spec_source = "specs/spec-009.md";

    Task t4 = make_task("TASK-003", TaskStatus::Blocked);
    t4.title = "Docs";
    t4.risk = "unknown";
    t4.estimated_hours = 5;

    return make_manifest({t1, t2, t3, t4});
}

} // namespace

TEST_CASE("parse_filter accepts known fields and aliases") {
    auto status = parse_filter("status=in-progress");
    REQUIRE(status.isOk());
    CHECK(status.value().field == FilterField::Status);
    CHECK(status.value().status == TaskStatus::InProgress);

    auto adr = parse_filter("adr = ADR-002");
    REQUIRE(adr.isOk());
    CHECK(adr.value().field == FilterField::Source);
    CHECK(adr.value().value == "ADR-002");

    CHECK(parse_filter("spec_source=spec-009").value().field == FilterField::Spec);
    CHECK(parse_filter("strategy=TDD").value().field == FilterField::TestStrategy);
    CHECK(parse_filter("id=TASK-001").value().field == FilterField::Id);
}

TEST_CASE("parse_filter rejects malformed expressions") {
    for (const char* expr : {"status", "=pending", "status=", "owner=me", "status=done"}) {
        CAPTURE(expr);
        auto f = parse_filter(expr);
        REQUIRE(f.isErr());
        CHECK(f.error().code() == ErrorCode::INVALID_FILTER);
        CHECK(exit_code_for(f.error()) == 1);
    }
}

TEST_CASE("filter_tasks combines filters with AND") {
    Manifest m = query_manifest();

    auto by_source = filter_tasks(m.tasks, {parse_filter("source=ADR-002").value()});
    CHECK(ids_of(by_source) == std::vector<std::string>{"TASK-010"});

    auto high = filter_tasks(m.tasks, {parse_filter("risk=high").value()});
    CHECK(ids_of(high) == std::vector<std::string>{"TASK-002"});

    auto none = filter_tasks(m.tasks, {parse_filter("risk=high").value(),
                                       parse_filter("status=completed").value()});
    CHECK(none.empty());

    auto all = filter_tasks(m.tasks, {});
    CHECK(all.size() == 4);
}

TEST_CASE("sort_tasks") {
    Manifest m = query_manifest();

    SUBCASE("id uses numeric order") {
        auto sorted = sort_tasks(m.tasks, "id");
        REQUIRE(sorted.isOk());
        CHECK(ids_of(sorted.value()) ==
              std::vector<std::string>{"TASK-001", "TASK-002", "TASK-003", "TASK-010"});
    }
    SUBCASE("status puts work in flight first") {
        auto sorted = sort_tasks(m.tasks, "status");
        REQUIRE(sorted.isOk());
        CHECK(ids_of(sorted.value()) ==
              std::vector<std::string>{"TASK-001", "TASK-002", "TASK-003", "TASK-010"});
    }
    SUBCASE("risk is highest first and case-insensitive") {
        auto sorted = sort_tasks(m.tasks, "risk");
        REQUIRE(sorted.isOk());
        CHECK(ids_of(sorted.value()) ==
              std::vector<std::string>{"TASK-002", "TASK-001", "TASK-010", "TASK-003"});
    }
    SUBCASE("hours is stable for ties") {
        auto sorted = sort_tasks(m.tasks, "hours");
        REQUIRE(sorted.isOk());
        CHECK(ids_of(sorted.value()) ==
              std::vector<std::string>{"TASK-001", "TASK-010", "TASK-002", "TASK-003"});
    }
    SUBCASE("title") {
        auto sorted = sort_tasks(m.tasks, "title");
        REQUIRE(sorted.isOk());
        CHECK(sorted.value().front().title == "Bootstrap");
        CHECK(sorted.value().back().title == "Parser");
    }
    SUBCASE("unknown field") {
        auto sorted = sort_tasks(m.tasks, "owner");
        REQUIRE(sorted.isErr());
        CHECK(sorted.error().code() == ErrorCode::INVALID_SORT);
    }
}

TEST_CASE("stats_by_source groups by adr_source") {
    auto stats = stats_by_source(query_manifest());
    REQUIRE(stats.size() == 2);
    CHECK(stats["adr/ADR-001.md"].total == 3);
    CHECK(stats["adr/ADR-001.md"].completed == 0);
    CHECK(stats["adr/ADR-002-parser.md"].total == 1);
    CHECK(stats["adr/ADR-002-parser.md"].completed == 1);
}

TEST_CASE("summarize separates open work from completed capabilities") {
    Manifest m = query_manifest();
    m.find_task("TASK-002")->dependencies = {"TASK-010"};

    auto summary = summarize(m);
    CHECK(ids_of(summary.incomplete_tasks) ==
          std::vector<std::string>{"TASK-002", "TASK-001", "TASK-003"});
    CHECK(summary.completed_capabilities == std::vector<std::string>{"Parser"});

    auto j = summary_to_json(summary);
    CHECK(j["incomplete_tasks"].size() == 3);
    CHECK(j["incomplete_tasks"][0]["dependencies"] == nlohmann::json::array({"TASK-010"}));
    CHECK_FALSE(j["incomplete_tasks"][1].contains("dependencies"));
    CHECK(j["incomplete_tasks"][1]["status"] == "in-progress");
    CHECK(j["completed_capabilities"][0] == "Parser");
}
