#include <doctest/doctest.h>
#include <vtm/context.hpp>

#include "test_support.hpp"

using namespace vtm;
using namespace vtm::test;

namespace {

Manifest context_manifest() {
    Task a = make_task("A", TaskStatus::Completed);
    a.title = "Storage layer";
    a.files.create = {"src/storage.cpp", "include/storage.hpp"};

    Task b = make_task("B", TaskStatus::Pending, {"A", "X"});
    b.title = "Query engine";
    b.description = std::string(1200, 'd');
    b.test_strategy_rationale = "Core logic, test first.";
    b.files.create = {"src/query.cpp"};

    Task x = make_task("X", TaskStatus::InProgress);
    Task c = make_task("C", TaskStatus::Pending, {"B"});
    Task d = make_task("D", TaskStatus::Completed, {"B"});

    return make_manifest({a, b, x, c, d});
}

} // namespace

TEST_CASE("extract_context splits dependencies by completion") {
    Manifest m = context_manifest();

    auto payload = extract_context(m, "B");
    REQUIRE(payload.isOk());

    const auto& p = payload.value();
    REQUIRE(p.completed_dependencies.size() == 1);
    CHECK(p.completed_dependencies[0].id == "A");
    CHECK(p.completed_dependencies[0].title == "Storage layer");
    CHECK(p.completed_dependencies[0].files_created.size() == 2);
    CHECK(p.pending_dependencies == std::vector<std::string>{"X"});

    // only pending dependents count as blocked by this task
    REQUIRE(p.blocked_tasks.size() == 1);
    CHECK(p.blocked_tasks[0].id == "C");
}

TEST_CASE("extract_context truncates the description per mode") {
    Manifest m = context_manifest();

    auto minimal = extract_context(m, "B", ContextMode::Minimal);
    REQUIRE(minimal.isOk());
    CHECK(minimal.value().task.description.size() == 1003);
    CHECK(minimal.value().task.description.substr(1000) == "...");

    auto compact = extract_context(m, "B", ContextMode::Compact);
    REQUIRE(compact.isOk());
    CHECK(compact.value().task.description.size() == 163);

    auto full = extract_context(m, "B", ContextMode::Full);
    REQUIRE(full.isOk());
    CHECK(full.value().task.description.size() == 1200);

    // the source manifest is not touched
    CHECK(m.find_task("B")->description.size() == 1200);
}

TEST_CASE("truncation never splits a multi-byte character") {
    const std::string e_acute = "\xC3\xA9";

    Task compact_task = make_task("A");
    compact_task.description = std::string(159, 'x') + e_acute + std::string(10, 'y');
    Task minimal_task = make_task("B");
    minimal_task.description = std::string(999, 'x') + e_acute + std::string(10, 'y');
    Manifest m = make_manifest({compact_task, minimal_task});

    auto compact = extract_context(m, "A", ContextMode::Compact);
    REQUIRE(compact.isOk());
    CHECK(compact.value().task.description == std::string(159, 'x') + "...");
    CHECK_NOTHROW(context_to_json(compact.value()).dump(2));

    auto minimal = extract_context(m, "B", ContextMode::Minimal);
    REQUIRE(minimal.isOk());
    CHECK(minimal.value().task.description == std::string(999, 'x') + "...");
    CHECK_NOTHROW(context_to_json(minimal.value()).dump(2));

    // a character that ends exactly at the limit is kept whole
    Task fits = make_task("C");
    fits.description = std::string(158, 'x') + e_acute + std::string(10, 'y');
    auto kept = extract_context(make_manifest({fits}), "C", ContextMode::Compact);
    REQUIRE(kept.isOk());
    CHECK(kept.value().task.description == std::string(158, 'x') + e_acute + "...");
}

TEST_CASE("extract_context on a missing task") {
    Manifest m = context_manifest();
    auto payload = extract_context(m, "NOPE");
    REQUIRE(payload.isErr());
    CHECK(payload.error().code() == ErrorCode::TASK_NOT_FOUND);
}

TEST_CASE("render_context minimal brief") {
    auto payload = extract_context(context_manifest(), "B");
    REQUIRE(payload.isOk());

    std::string text = render_context(payload.value());
    CHECK(text.find("# Task Context: B") == 0);
    CHECK(text.find("**Title**: Query engine") != std::string::npos);
    CHECK(text.find("- AC1: first criterion") != std::string::npos);
    CHECK(text.find("- AC2: second criterion") != std::string::npos);
    CHECK(text.find("## Dependencies (1 completed)") != std::string::npos);
    CHECK(text.find("- [x] A: Storage layer") != std::string::npos);
    CHECK(text.find("Files created: src/storage.cpp, include/storage.hpp") != std::string::npos);
    CHECK(text.find("## Unfinished Dependencies") != std::string::npos);
    CHECK(text.find("- [ ] X") != std::string::npos);
    CHECK(text.find("- src/query.cpp") != std::string::npos);
    CHECK(text.find("## Test Strategy Rationale") != std::string::npos);
    CHECK(text.find("## Tasks Blocked by This") != std::string::npos);
    CHECK(text.find("## Commits") == std::string::npos);
}

TEST_CASE("render_context compact is short") {
    auto compact = extract_context(context_manifest(), "B", ContextMode::Compact);
    auto minimal = extract_context(context_manifest(), "B", ContextMode::Minimal);
    REQUIRE(compact.isOk());
    REQUIRE(minimal.isOk());

    std::string text = render_context(compact.value());
    CHECK(text.find("Task B: Query engine") == 0);
    CHECK(text.find("ACs: first criterion | second criterion") != std::string::npos);
    CHECK(text.find("Done deps: A") != std::string::npos);
    CHECK(text.find("Waiting on: X") != std::string::npos);

    CHECK(estimate_tokens(text) < estimate_tokens(render_context(minimal.value())));
}

TEST_CASE("render_context full includes progress records") {
    Manifest m = context_manifest();
    Task* a = m.find_task("A");
    a->commits = {"deadbeef"};
    a->started_at = "2026-01-02T10:00:00Z";
    a->completed_at = "2026-01-02T12:00:00Z";

    auto payload = extract_context(m, "A", ContextMode::Full);
    REQUIRE(payload.isOk());

    std::string text = render_context(payload.value());
    CHECK(text.find("## Commits\n- deadbeef") != std::string::npos);
    CHECK(text.find("Started: 2026-01-02T10:00:00Z") != std::string::npos);
    CHECK(text.find("Completed: 2026-01-02T12:00:00Z") != std::string::npos);
}

TEST_CASE("render_context lists an empty file section explicitly") {
    Manifest m = make_manifest({make_task("A")});
    auto payload = extract_context(m, "A");
    REQUIRE(payload.isOk());
    CHECK(render_context(payload.value()).find("## Files to Create\n- (none)") !=
          std::string::npos);
}

TEST_CASE("context_to_json") {
    auto payload = extract_context(context_manifest(), "B", ContextMode::Compact);
    REQUIRE(payload.isOk());

    auto j = context_to_json(payload.value());
    CHECK(j["mode"] == "compact");
    CHECK(j["task"]["id"] == "B");
    CHECK(j["completed_dependencies"][0]["id"] == "A");
    CHECK(j["pending_dependencies"] == nlohmann::json::array({"X"}));
    CHECK(j["blocked_tasks"].size() == 1);
}

TEST_CASE("parse_context_mode") {
    CHECK(parse_context_mode("minimal") == ContextMode::Minimal);
    CHECK(parse_context_mode("COMPACT") == ContextMode::Compact);
    CHECK(parse_context_mode("full") == ContextMode::Full);
    CHECK_FALSE(parse_context_mode("verbose").has_value());
    CHECK(estimate_tokens("") == 0);
    CHECK(estimate_tokens("abcde") == 2);
}
