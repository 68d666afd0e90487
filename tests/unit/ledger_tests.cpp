#include <doctest/doctest.h>
#include <vtm/ledger.hpp>
#include <vtm/platform.hpp>

#include "test_support.hpp"

using namespace vtm;
using namespace vtm::test;

namespace {

std::chrono::system_clock::time_point at(const std::string& ts) {
    auto tp = parse_timestamp(ts);
    REQUIRE(tp.has_value());
    return *tp;
}

// Manifest where batch {B, C} was ingested on top of A, and D depends on C
struct LedgerFixture {
    LedgerFixture()
        : manifest(encode(make_manifest({
              make_task("A", TaskStatus::Completed),
              make_task("B", TaskStatus::Pending, {"A"}),
              make_task("C", TaskStatus::Pending, {"B"}),
          }))),
          now(at("2026-03-04T10:00:00Z")),
          ledger(manifest, history, [this] { return now; }) {}

    MemoryManifestStore manifest;
    MemoryHistoryStore history;
    std::chrono::system_clock::time_point now;
    Ledger ledger;
};

void add_task(MemoryManifestStore& store, const Task& task) {
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    loaded.value().tasks.push_back(task);
    REQUIRE(store.save(loaded.value()).isOk());
}

std::vector<std::string> manifest_ids(MemoryManifestStore& store) {
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    std::vector<std::string> ids;
    for (const auto& t : loaded.value().tasks) ids.push_back(t.id);
    return ids;
}

} // namespace

// ============================================================================
// record / history
// ============================================================================

TEST_CASE_FIXTURE(LedgerFixture, "record numbers transactions per day") {
    auto first = ledger.record({"adr/ADR-001.md", "adr/ADR-001.md", ""}, {"B", "C"});
    REQUIRE(first.isOk());
    CHECK(first.value().id == "2026-03-04-001");
    CHECK(first.value().action == "ingest");
    CHECK(first.value().sources == std::vector<std::string>{"adr/ADR-001.md"});
    CHECK(first.value().timestamp == "2026-03-04T10:00:00Z");
    CHECK_FALSE(first.value().reverted);

    now = at("2026-03-04T11:00:00Z");
    auto second = ledger.record({"manual"}, {"X"});
    REQUIRE(second.isOk());
    CHECK(second.value().id == "2026-03-04-002");

    now = at("2026-03-05T09:00:00Z");
    auto next_day = ledger.record({"manual"}, {"Y"});
    REQUIRE(next_day.isOk());
    CHECK(next_day.value().id == "2026-03-05-001");

    REQUIRE(history.content().has_value());
    auto doc = nlohmann::json::parse(*history.content());
    CHECK(doc["transactions"].size() == 3);
}

TEST_CASE_FIXTURE(LedgerFixture, "history is newest first and honours the limit") {
    REQUIRE(ledger.record({"a"}, {"B"}).isOk());
    now = at("2026-03-06T10:00:00Z");
    REQUIRE(ledger.record({"b"}, {"C"}).isOk());
    now = at("2026-03-05T10:00:00Z");
    REQUIRE(ledger.record({"c"}, {"X"}).isOk());

    auto all = ledger.history();
    REQUIRE(all.isOk());
    REQUIRE(all.value().size() == 3);
    CHECK(all.value()[0].id == "2026-03-06-001");
    CHECK(all.value()[1].id == "2026-03-05-001");
    CHECK(all.value()[2].id == "2026-03-04-001");

    auto limited = ledger.history(1);
    REQUIRE(limited.isOk());
    CHECK(limited.value().size() == 1);

    auto stats = ledger.history_stats();
    REQUIRE(stats.isOk());
    CHECK(stats.value().total_entries == 3);
    CHECK(stats.value().tasks_added == 3);
    CHECK(stats.value().oldest == std::optional<std::string>("2026-03-04T10:00:00Z"));
    CHECK(stats.value().newest == std::optional<std::string>("2026-03-06T10:00:00Z"));
}

TEST_CASE("history orders same-second transactions by sequence past 999") {
    MemoryManifestStore manifest(encode(chain_manifest()));
    MemoryHistoryStore history(R"({"transactions":[
        {"id":"2026-03-04-998","timestamp":"2026-03-04T10:00:00Z","sources":["a"],"tasks_added":[]},
        {"id":"2026-03-04-999","timestamp":"2026-03-04T10:00:00Z","sources":["a"],"tasks_added":[]}
    ]})");
    Ledger ledger(manifest, history, [] { return at("2026-03-04T10:00:00Z"); });

    auto recorded = ledger.record({"manual"}, {"X"});
    REQUIRE(recorded.isOk());
    CHECK(recorded.value().id == "2026-03-04-1000");

    auto all = ledger.history();
    REQUIRE(all.isOk());
    REQUIRE(all.value().size() == 3);
    CHECK(all.value()[0].id == "2026-03-04-1000");
    CHECK(all.value()[1].id == "2026-03-04-999");
    CHECK(all.value()[2].id == "2026-03-04-998");

    auto newest = ledger.history(1);
    REQUIRE(newest.isOk());
    CHECK(newest.value()[0].id == "2026-03-04-1000");
}

TEST_CASE_FIXTURE(LedgerFixture, "find reports unknown transactions") {
    auto tx = ledger.find("2026-01-01-001");
    REQUIRE(tx.isErr());
    CHECK(tx.error().code() == ErrorCode::TRANSACTION_NOT_FOUND);
    CHECK(exit_code_for(tx.error()) == 1);
}

TEST_CASE("corrupt history is a data integrity error") {
    MemoryManifestStore manifest(encode(chain_manifest()));

    SUBCASE("not json") {
        MemoryHistoryStore history("{ nope");
        Ledger ledger(manifest, history);
        auto h = ledger.history();
        REQUIRE(h.isErr());
        CHECK(h.error().code() == ErrorCode::CORRUPT_HISTORY);
        CHECK(exit_code_for(h.error()) == 2);
    }
    SUBCASE("transaction without id") {
        MemoryHistoryStore history(R"({"transactions":[{"tasks_added":["A"]}]})");
        Ledger ledger(manifest, history);
        CHECK(ledger.history().error().code() == ErrorCode::CORRUPT_HISTORY);
    }
}

TEST_CASE("legacy single source string is accepted") {
    auto parsed = parse_history(
        R"({"transactions":[{"id":"2025-10-30-001","source":"adr/ADR-009.md",
            "timestamp":"2025-10-30T08:00:00Z","tasks_added":["TASK-001"]}]})",
        "history");
    REQUIRE(parsed.isOk());
    REQUIRE(parsed.value().size() == 1);
    CHECK(parsed.value()[0].sources == std::vector<std::string>{"adr/ADR-009.md"});
    CHECK(parsed.value()[0].action == "ingest");
}

// ============================================================================
// preview / rollback
// ============================================================================

TEST_CASE_FIXTURE(LedgerFixture, "rollback removes the batch and marks it reverted") {
    auto tx = ledger.record({"adr/ADR-001.md"}, {"B", "C"});
    REQUIRE(tx.isOk());

    now = at("2026-03-04T12:00:00Z");
    auto outcome = ledger.rollback(tx.value().id);
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().removed == std::vector<std::string>{"B", "C"});
    CHECK(outcome.value().transaction.reverted);
    CHECK(outcome.value().transaction.reverted_at ==
          std::optional<std::string>("2026-03-04T12:00:00Z"));

    CHECK(manifest_ids(manifest) == std::vector<std::string>{"A"});

    auto stored = ledger.find(tx.value().id);
    REQUIRE(stored.isOk());
    CHECK(stored.value().reverted);

    auto again = ledger.rollback(tx.value().id);
    REQUIRE(again.isErr());
    CHECK(again.error().code() == ErrorCode::ALREADY_REVERTED);
}

TEST_CASE_FIXTURE(LedgerFixture, "rollback refuses when outside tasks depend on the batch") {
    auto tx = ledger.record({"adr/ADR-001.md"}, {"B"});
    REQUIRE(tx.isOk());
    add_task(manifest, make_task("D", TaskStatus::Pending, {"C"}));
    std::string before = *manifest.content();

    auto preview = ledger.preview(tx.value().id);
    REQUIRE(preview.isOk());
    CHECK(preview.value().tasks_to_remove == std::vector<std::string>{"B"});
    REQUIRE(preview.value().blocking_dependents.size() == 1);
    CHECK(preview.value().blocking_dependents[0].task_id == "C");
    CHECK(preview.value().blocking_dependents[0].depends_on == "B");
    CHECK(*manifest.content() == before);

    auto outcome = ledger.rollback(tx.value().id);
    REQUIRE(outcome.isErr());
    CHECK(outcome.error().code() == ErrorCode::BLOCKED_BY_DEPENDENTS);
    CHECK(outcome.error().message().find("C depends on B") != std::string::npos);
    CHECK(outcome.error().message().find("--cascade") != std::string::npos);

    CHECK(*manifest.content() == before);
    CHECK_FALSE(ledger.find(tx.value().id).value().reverted);
}

TEST_CASE_FIXTURE(LedgerFixture, "cascade rollback removes transitive dependents") {
    auto tx = ledger.record({"adr/ADR-001.md"}, {"B"});
    REQUIRE(tx.isOk());
    add_task(manifest, make_task("D", TaskStatus::Pending, {"C"}));
    add_task(manifest, make_task("E"));

    RollbackOptions cascade;
    cascade.cascade = true;

    auto preview = ledger.preview(tx.value().id, cascade);
    REQUIRE(preview.isOk());
    CHECK(preview.value().cascaded == std::vector<std::string>{"C", "D"});
    CHECK(preview.value().tasks_to_remove == std::vector<std::string>{"B", "C", "D"});

    auto outcome = ledger.rollback(tx.value().id, cascade);
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().removed == std::vector<std::string>{"B", "C", "D"});
    CHECK(manifest_ids(manifest) == std::vector<std::string>{"A", "E"});
}

TEST_CASE_FIXTURE(LedgerFixture, "forced rollback leaves dependents in place") {
    auto tx = ledger.record({"adr/ADR-001.md"}, {"B"});
    REQUIRE(tx.isOk());

    RollbackOptions force;
    force.force = true;
    auto outcome = ledger.rollback(tx.value().id, force);
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().removed == std::vector<std::string>{"B"});
    CHECK(manifest_ids(manifest) == std::vector<std::string>{"A", "C"});
}

TEST_CASE_FIXTURE(LedgerFixture, "rollback succeeds when the tasks are already gone") {
    auto tx = ledger.record({"manual"}, {"GONE-1", "GONE-2"});
    REQUIRE(tx.isOk());
    std::string before = *manifest.content();
    int saves = manifest.save_count();

    auto outcome = ledger.rollback(tx.value().id);
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().removed.empty());
    CHECK(outcome.value().transaction.reverted);
    CHECK(manifest.save_count() == saves);
    CHECK(*manifest.content() == before);
}

TEST_CASE_FIXTURE(LedgerFixture, "rollback of an unknown transaction") {
    auto outcome = ledger.rollback("2026-03-04-042");
    REQUIRE(outcome.isErr());
    CHECK(outcome.error().code() == ErrorCode::TRANSACTION_NOT_FOUND);
}

TEST_CASE("FileHistoryStore round trips through the history directory") {
    TempTestDir dir;
    FileHistoryStore store(dir.path("history"));

    auto empty = store.load();
    REQUIRE(empty.isOk());
    CHECK(empty.value().empty());

    Transaction tx;
    tx.id = "2026-03-04-001";
    tx.sources = {"adr/ADR-001.md"};
    tx.timestamp = "2026-03-04T10:00:00Z";
    tx.tasks_added = {"TASK-001"};
    REQUIRE(store.save({tx}).isOk());

    CHECK(store.location() == dir.path("history/transactions.json"));
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    REQUIRE(loaded.value().size() == 1);
    CHECK(loaded.value()[0].tasks_added == std::vector<std::string>{"TASK-001"});
    CHECK_FALSE(loaded.value()[0].reverted_at.has_value());
}
