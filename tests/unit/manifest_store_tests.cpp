#include <doctest/doctest.h>
#include <vtm/manifest_store.hpp>

#include "test_support.hpp"

using namespace vtm;
using namespace vtm::test;

TEST_CASE("FileManifestStore reports a missing manifest") {
    TempTestDir tmp;
    FileManifestStore store(tmp.path("vtm.json"));

    CHECK_FALSE(store.exists());
    auto loaded = store.load();
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().code() == ErrorCode::MANIFEST_NOT_FOUND);
    CHECK(loaded.error().kind() == ErrorKind::DataIntegrity);
    CHECK(exit_code_for(loaded.error()) == 2);
}

TEST_CASE("FileManifestStore reports corrupt JSON") {
    TempTestDir tmp;
    tmp.write("vtm.json", "{ \"version\": ");
    FileManifestStore store(tmp.path("vtm.json"));

    auto loaded = store.load();
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().code() == ErrorCode::CORRUPT_MANIFEST);
    CHECK(loaded.error().message().find("vtm.json") != std::string::npos);
}

TEST_CASE("FileManifestStore save recomputes derived fields") {
    TempTestDir tmp;
    FileManifestStore store(tmp.path("vtm.json"));

    Manifest m = chain_manifest();
    m.stats = ManifestStats{};
    m.tasks[0].blocks.clear();

    REQUIRE(store.save(m).isOk());

    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    CHECK(loaded.value().stats.total_tasks == 3);
    CHECK(loaded.value().stats.completed == 1);
    CHECK(loaded.value().tasks[0].blocks == std::vector<std::string>{"B"});

    auto on_disk = nlohmann::json::parse(tmp.read("vtm.json"));
    CHECK(on_disk["stats"]["pending"] == 2);
}

TEST_CASE("FileManifestStore save creates the parent directory") {
    TempTestDir tmp;
    FileManifestStore store(tmp.path("nested/dir/vtm.json"));
    REQUIRE(store.save(chain_manifest()).isOk());
    CHECK(store.exists());
}

TEST_CASE("FileManifestStore does not write on duplicate ids") {
    TempTestDir tmp;
    FileManifestStore store(tmp.path("vtm.json"));
    REQUIRE(store.save(chain_manifest()).isOk());
    std::string before = tmp.read("vtm.json");

    Manifest bad = make_manifest({make_task("X"), make_task("X")});
    auto saved = store.save(bad);
    REQUIRE(saved.isErr());
    CHECK(saved.error().code() == ErrorCode::DUPLICATE_TASK_ID);
    CHECK(tmp.read("vtm.json") == before);
}

TEST_CASE("save(load(save(M))) is byte-identical") {
    TempTestDir tmp;
    FileManifestStore store(tmp.path("vtm.json"));

    REQUIRE(store.save(chain_manifest()).isOk());
    std::string first = tmp.read("vtm.json");

    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    REQUIRE(store.save(loaded.value()).isOk());
    CHECK(tmp.read("vtm.json") == first);
}

TEST_CASE("MemoryManifestStore goes through the same encoding") {
    MemoryManifestStore store;
    CHECK(store.load().isErr());

    REQUIRE(store.save(chain_manifest()).isOk());
    CHECK(store.save_count() == 1);
    REQUIRE(store.content().has_value());
    CHECK(*store.content() == encode(chain_manifest()));

    auto loaded = store.load();
    REQUIRE(loaded.isOk());
    CHECK(loaded.value().tasks.size() == 3);
}
