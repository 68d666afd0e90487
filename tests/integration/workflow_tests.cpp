#include <doctest/doctest.h>
#include <vtm/context.hpp>
#include <vtm/ingest.hpp>
#include <vtm/ledger.hpp>
#include <vtm/manifest_store.hpp>
#include <vtm/platform.hpp>
#include <vtm/resolver.hpp>
#include <vtm/task_mutator.hpp>

#include "test_support.hpp"

using namespace vtm;
using namespace vtm::test;

namespace {

std::vector<std::string> ready_ids(FileManifestStore& store) {
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    auto ready = resolve_ready(loaded.value().tasks);
    REQUIRE(ready.isOk());
    std::vector<std::string> ids;
    for (const auto& t : ready.value().ready) ids.push_back(t.id);
    return ids;
}

std::vector<std::string> task_ids(FileManifestStore& store) {
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    std::vector<std::string> ids;
    for (const auto& t : loaded.value().tasks) ids.push_back(t.id);
    return ids;
}

} // namespace

TEST_CASE("start and complete unlock the next task") {
    TempTestDir dir;
    FileManifestStore store(dir.path("vtm.json"));
    REQUIRE(store.save(make_manifest({make_task("A"), make_task("B", TaskStatus::Pending, {"A"})}))
                .isOk());

    CHECK(ready_ids(store) == std::vector<std::string>{"A"});

    REQUIRE(start_task(store, "A").isOk());
    CHECK(ready_ids(store).empty());

    CompletionEvidence evidence;
    evidence.tests_pass = true;
    evidence.all_ac_verified = true;
    auto done = complete_task(store, "A", evidence);
    REQUIRE(done.isOk());
    REQUIRE(done.value().newly_ready.size() == 1);
    CHECK(done.value().newly_ready[0].id == "B");

    CHECK(ready_ids(store) == std::vector<std::string>{"B"});

    // the context for B now shows A as a finished dependency
    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    auto context = extract_context(loaded.value(), "B");
    REQUIRE(context.isOk());
    CHECK(context.value().completed_dependencies.size() == 1);
    CHECK(context.value().pending_dependencies.empty());

    // no temp files are left beside the manifest
    CHECK(list_directory(dir.base_path.string()) == std::vector<std::string>{"vtm.json"});
}

TEST_CASE("ingest then roll the batch back") {
    TempTestDir dir;
    FileManifestStore store(dir.path("vtm.json"));
    FileHistoryStore history(dir.path(".vtm-history"));
    Ledger ledger(store, history);
    REQUIRE(store.save(make_manifest({make_task("A", TaskStatus::Completed)})).isOk());

    IngestOptions options;
    options.assign_ids = false;
    auto batch = parse_drafts(R"([
        {"id": "C", "title": "Storage", "description": "storage work", "dependencies": ["A"]},
        {"id": "D", "title": "Queries", "description": "queries work", "dependencies": ["C"]}
    ])");
    REQUIRE(batch.isOk());

    auto ingested = ingest(store, ledger, batch.value(), options);
    REQUIRE(ingested.isOk());
    REQUIRE(ingested.value().transaction.has_value());
    const std::string tx_id = ingested.value().transaction->id;
    CHECK(task_ids(store) == std::vector<std::string>{"A", "C", "D"});

    auto preview = ledger.preview(tx_id);
    REQUIRE(preview.isOk());
    CHECK(preview.value().tasks_to_remove == std::vector<std::string>{"C", "D"});
    CHECK(preview.value().blocking_dependents.empty());
    CHECK(task_ids(store) == std::vector<std::string>{"A", "C", "D"});

    auto rolled = ledger.rollback(tx_id);
    REQUIRE(rolled.isOk());
    CHECK(task_ids(store) == std::vector<std::string>{"A"});

    auto entries = ledger.history();
    REQUIRE(entries.isOk());
    REQUIRE(entries.value().size() == 1);
    CHECK(entries.value()[0].id == tx_id);
    CHECK(entries.value()[0].reverted);
    CHECK(entries.value()[0].reverted_at.has_value());

    // the history file on disk carries the same record
    auto reread = FileHistoryStore(dir.path(".vtm-history")).load();
    REQUIRE(reread.isOk());
    CHECK(reread.value()[0].reverted);
}

TEST_CASE("cascade rollback across two batches") {
    TempTestDir dir;
    FileManifestStore store(dir.path("vtm.json"));
    FileHistoryStore history(dir.path(".vtm-history"));
    Ledger ledger(store, history);
    REQUIRE(store.save(make_manifest({})).isOk());

    auto first = ingest(store, ledger, parse_drafts(R"([{"title":"Base","description":"base work"}])").value());
    REQUIRE(first.isOk());
    auto second = ingest(store, ledger,
                         parse_drafts(R"([{"title":"On top","description":"on top work","dependencies":["TASK-001"]}])").value());
    REQUIRE(second.isOk());
    CHECK(second.value().tasks[0].id == "TASK-002");

    const std::string first_id = first.value().transaction->id;
    auto blocked = ledger.rollback(first_id);
    REQUIRE(blocked.isErr());
    CHECK(blocked.error().code() == ErrorCode::BLOCKED_BY_DEPENDENTS);
    CHECK(task_ids(store) == std::vector<std::string>{"TASK-001", "TASK-002"});

    RollbackOptions cascade;
    cascade.cascade = true;
    auto rolled = ledger.rollback(first_id, cascade);
    REQUIRE(rolled.isOk());
    CHECK(rolled.value().cascaded == std::vector<std::string>{"TASK-002"});
    CHECK(task_ids(store).empty());

    // the second batch's tasks are gone, so its rollback only marks it
    auto second_rollback = ledger.rollback(second.value().transaction->id);
    REQUIRE(second_rollback.isOk());
    CHECK(second_rollback.value().removed.empty());
}

TEST_CASE("a corrupt manifest is reported, never overwritten") {
    TempTestDir dir;
    dir.write("vtm.json", "{\"tasks\": [ truncated");
    FileManifestStore store(dir.path("vtm.json"));

    auto started = start_task(store, "A");
    REQUIRE(started.isErr());
    CHECK(started.error().code() == ErrorCode::CORRUPT_MANIFEST);
    CHECK(exit_code_for(started.error()) == 2);
    CHECK(dir.read("vtm.json") == "{\"tasks\": [ truncated");
}
