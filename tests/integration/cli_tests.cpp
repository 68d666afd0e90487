#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include "test_support.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <string>

using namespace vtm;
using namespace vtm::test;

#ifndef VTM_BINARY
#error "VTM_BINARY must name the built vtm executable"
#endif

namespace {

struct CliRun {
    int exit_code = -1;
    std::string out;

    nlohmann::json json() const {
        INFO("stdout: " << out);
        nlohmann::json j;
        REQUIRE_NOTHROW(j = nlohmann::json::parse(out));
        return j;
    }
};

// Run the vtm binary inside `dir` with JSON output; stdout is captured and
// log lines on stderr are discarded
CliRun run_vtm(const TempTestDir& dir, const std::string& args) {
    std::string cmd = "cd '" + dir.base_path.string() + "' && '" + std::string(VTM_BINARY) +
                      "' --manifest vtm.json --history-dir history --cache-dir cache --json " +
                      args + " 2>/dev/null";

    FILE* pipe = popen(cmd.c_str(), "r");
    REQUIRE(pipe != nullptr);

    CliRun run;
    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        run.out.append(buffer.data(), n);
    }
    int status = pclose(pipe);
    REQUIRE(WIFEXITED(status));
    run.exit_code = WEXITSTATUS(status);
    return run;
}

void check_error(const CliRun& run, int exit_code, const std::string& code) {
    CAPTURE(run.out);
    CHECK(run.exit_code == exit_code);
    auto j = run.json();
    CHECK(j["ok"] == false);
    CHECK(j["code"] == code);
    CHECK(j["error"].is_string());
    CHECK_FALSE(j["error"].get<std::string>().empty());
}

} // namespace

TEST_CASE("cli next lists ready tasks") {
    TempTestDir dir;
    dir.write("vtm.json", encode(chain_manifest()));

    auto run = run_vtm(dir, "next");
    CHECK(run.exit_code == 0);
    auto j = run.json();
    REQUIRE(j["ready"].size() == 1);
    CHECK(j["ready"][0]["id"] == "B");
    CHECK(j["blocked_count"] == 1);
}

TEST_CASE("cli lifecycle refusals exit 1 with an error object") {
    TempTestDir dir;
    dir.write("vtm.json", encode(chain_manifest()));

    SUBCASE("start before dependencies complete") {
        const std::string before = dir.read("vtm.json");
        check_error(run_vtm(dir, "start C"), 1, "NOT_READY");
        CHECK(dir.read("vtm.json") == before);
    }
    SUBCASE("complete a task that was never started") {
        const std::string before = dir.read("vtm.json");
        check_error(run_vtm(dir, "complete C --tests-pass --ac all"), 1, "INVALID_TRANSITION");
        CHECK(dir.read("vtm.json") == before);
    }
    SUBCASE("complete without evidence") {
        REQUIRE(run_vtm(dir, "start B").exit_code == 0);
        const std::string started = dir.read("vtm.json");
        check_error(run_vtm(dir, "complete B"), 1, "VALIDATION_INCOMPLETE");
        CHECK(dir.read("vtm.json") == started);
    }
    SUBCASE("criterion number out of range") {
        REQUIRE(run_vtm(dir, "start B").exit_code == 0);
        check_error(run_vtm(dir, "complete B --tests-pass --ac 99999999999999999999999"), 1,
                    "INVALID_ARGUMENT");
    }
}

TEST_CASE("cli start then complete reports newly ready tasks") {
    TempTestDir dir;
    dir.write("vtm.json", encode(chain_manifest()));

    auto started = run_vtm(dir, "start B");
    CHECK(started.exit_code == 0);
    CHECK(started.json()["task"]["status"] == "in-progress");

    auto completed = run_vtm(dir, "complete B --tests-pass --ac all --commits abc123");
    CHECK(completed.exit_code == 0);
    auto j = completed.json();
    CHECK(j["ok"] == true);
    CHECK(j["task"]["status"] == "completed");
    CHECK(j["newly_ready"] == nlohmann::json::array({"C"}));
}

TEST_CASE("cli corrupt manifest exits 2 and leaves the file alone") {
    TempTestDir dir;
    const std::string corrupt = "{\"tasks\": [ truncated";
    dir.write("vtm.json", corrupt);

    check_error(run_vtm(dir, "next"), 2, "CORRUPT_MANIFEST");
    check_error(run_vtm(dir, "start B"), 2, "CORRUPT_MANIFEST");
    CHECK(dir.read("vtm.json") == corrupt);
}

TEST_CASE("cli rollback dry run previews without writing") {
    TempTestDir dir;
    dir.write("vtm.json", encode(chain_manifest()));
    dir.write("batch.json", R"([
        {"title": "Storage", "description": "storage layer", "dependencies": ["A"]},
        {"title": "Queries", "description": "query layer", "dependencies": [0]}
    ])");

    auto ingested = run_vtm(dir, "ingest batch.json");
    REQUIRE(ingested.exit_code == 0);
    auto added = ingested.json();
    REQUIRE(added["transaction"].is_object());
    const std::string tx_id = added["transaction"]["id"].get<std::string>();
    const std::string manifest_before = dir.read("vtm.json");

    auto preview = run_vtm(dir, "rollback " + tx_id + " --dry-run");
    CHECK(preview.exit_code == 0);
    auto j = preview.json();
    CHECK(j["dry_run"] == true);
    CHECK(j["tasks_to_remove"].size() == 2);
    CHECK(j["transaction"]["reverted"] == false);
    CHECK(dir.read("vtm.json") == manifest_before);

    check_error(run_vtm(dir, "rollback 2000-01-01-001 --dry-run"), 1, "TRANSACTION_NOT_FOUND");
}
