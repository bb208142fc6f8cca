// tests/test_checkpoint.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentgraph/core/errors.h"
#include "modules/checkpoint/checkpoint_store.h"
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <unistd.h>

using namespace agentgraph;
namespace fs = std::filesystem;

namespace {

Checkpoint sample(const std::string& id, uint64_t seq) {
    Checkpoint cp;
    cp.session_id = id;
    cp.workflow = "coding";
    cp.state = {{"objective", "plot a sine"}, {"iterations", 2}};
    cp.stage_pointer = "coder";
    cp.last_stage = "verifier";
    cp.seq = seq;
    cp.exhausted_scopes = {"retry"};
    return cp;
}

struct TempDir {
    fs::path path;
    TempDir() {
        path = fs::temp_directory_path() /
               ("agentgraph_cp_" + std::to_string(::getpid()) + "_" + CheckpointStore::generate_session_id());
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("Checkpoints survive a save/load cycle", "[checkpoint]") {
    CheckpointStore store(std::make_shared<MemoryBlobStore>());
    Checkpoint cp = sample("abc123", 7);
    store.save(cp);
    REQUIRE(cp.created_at > 0);
    REQUIRE(cp.updated_at >= cp.created_at);

    Checkpoint loaded = store.load("abc123");
    REQUIRE(loaded.workflow == "coding");
    REQUIRE(loaded.state == cp.state);
    REQUIRE(loaded.stage_pointer == "coder");
    REQUIRE(loaded.last_stage == "verifier");
    REQUIRE(loaded.seq == 7);
    REQUIRE(loaded.exhausted_scopes == std::vector<std::string>{"retry"});
    REQUIRE(loaded.created_at == cp.created_at);
}

TEST_CASE("Loading an unknown session throws SessionNotFound", "[checkpoint]") {
    CheckpointStore store(std::make_shared<MemoryBlobStore>());
    REQUIRE_FALSE(store.exists("missing"));
    try {
        store.load("missing");
        FAIL("expected SessionNotFound");
    } catch (const SessionNotFound& e) {
        REQUIRE(e.session_id() == "missing");
    }
}

TEST_CASE("Session ids are restricted to file-name safe characters", "[checkpoint]") {
    CheckpointStore store(std::make_shared<MemoryBlobStore>());
    REQUIRE_THROWS_AS(store.load("../etc/passwd"), WorkflowError);
    REQUIRE_THROWS_AS(store.load(""), WorkflowError);
    REQUIRE_THROWS_AS(store.load(std::string(65, 'a')), WorkflowError);
    REQUIRE_NOTHROW(validate_blob_id("run_2024-01"));
}

TEST_CASE("Generated session ids are 8 hex characters", "[checkpoint]") {
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        std::string id = CheckpointStore::generate_session_id();
        REQUIRE(id.size() == 8);
        REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        ids.insert(id);
    }
    REQUIRE(ids.size() > 40);
}

TEST_CASE("Terminal resume policy parses from config text", "[checkpoint][config]") {
    REQUIRE(parse_terminal_resume_policy("no_op") == TerminalResumePolicy::NO_OP);
    REQUIRE(parse_terminal_resume_policy("reenter_loop") == TerminalResumePolicy::REENTER_LOOP);
    REQUIRE(to_string(TerminalResumePolicy::REENTER_LOOP) == "reenter_loop");
    REQUIRE_THROWS_AS(parse_terminal_resume_policy("restart"), ConfigError);
}

TEST_CASE("Session locks are exclusive and released on scope exit", "[checkpoint]") {
    CheckpointStore store(std::make_shared<MemoryBlobStore>());
    {
        SessionLock lock = store.acquire("s1");
        REQUIRE_THROWS_AS(store.acquire("s1"), SessionLocked);
        SessionLock other = store.acquire("s2");
        REQUIRE(other.session_id() == "s2");

        SessionLock moved = std::move(lock);
        REQUIRE_THROWS_AS(store.acquire("s1"), SessionLocked);
    }
    REQUIRE_NOTHROW(static_cast<void>(store.acquire("s1")));
}

TEST_CASE("Pruning removes a session but not a running one", "[checkpoint]") {
    CheckpointStore store(std::make_shared<MemoryBlobStore>());
    Checkpoint a = sample("keep", 1);
    Checkpoint b = sample("drop", 1);
    store.save(a);
    store.save(b);

    REQUIRE(store.prune("drop"));
    REQUIRE_FALSE(store.exists("drop"));
    REQUIRE_FALSE(store.prune("drop"));

    SessionLock running = store.acquire("keep");
    REQUIRE_THROWS_AS(store.prune("keep"), SessionLocked);
    REQUIRE(store.exists("keep"));
}

TEST_CASE("FileBlobStore persists one json file per session", "[checkpoint][file]") {
    TempDir tmp;
    {
        CheckpointStore store(std::make_shared<FileBlobStore>(tmp.path));
        Checkpoint cp = sample("filed", 3);
        store.save(cp);
        cp.seq = 4;
        store.save(cp);
    }
    REQUIRE(fs::exists(tmp.path / "filed.json"));
    REQUIRE_FALSE(fs::exists(tmp.path / "filed.json.tmp"));

    // 新实例读取同一目录
    CheckpointStore reopened(std::make_shared<FileBlobStore>(tmp.path));
    REQUIRE(reopened.load("filed").seq == 4);

    auto sessions = reopened.list();
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions[0].session_id == "filed");
}

TEST_CASE("Unreadable checkpoint files are skipped when listing", "[checkpoint][file]") {
    TempDir tmp;
    CheckpointStore store(std::make_shared<FileBlobStore>(tmp.path));
    Checkpoint good = sample("good", 1);
    store.save(good);
    std::ofstream(tmp.path / "broken.json") << "{ not json";

    REQUIRE_THROWS_AS(store.load("broken"), WorkflowError);
    auto sessions = store.list();
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions[0].session_id == "good");
}

TEST_CASE("File locks exclude a second store on the same directory", "[checkpoint][file]") {
    TempDir tmp;
    auto first = std::make_shared<FileBlobStore>(tmp.path);
    auto second = std::make_shared<FileBlobStore>(tmp.path);

    REQUIRE(first->try_lock("shared"));
    REQUIRE_FALSE(first->try_lock("shared"));
    REQUIRE_FALSE(second->try_lock("shared"));

    first->unlock("shared");
    REQUIRE(second->try_lock("shared"));
    second->unlock("shared");
}

TEST_CASE("Pruning a file-backed session leaves no lock file behind", "[checkpoint][file]") {
    TempDir tmp;
    CheckpointStore store(std::make_shared<FileBlobStore>(tmp.path));
    Checkpoint cp = sample("gone", 2);
    store.save(cp);
    {
        SessionLock lock = store.acquire("gone");
        REQUIRE(fs::exists(tmp.path / "gone.lock"));
    }

    REQUIRE(store.prune("gone"));
    REQUIRE_FALSE(fs::exists(tmp.path / "gone.json"));
    REQUIRE_FALSE(fs::exists(tmp.path / "gone.lock"));

    // the id is usable again
    Checkpoint again = sample("gone", 0);
    store.save(again);
    REQUIRE_NOTHROW(static_cast<void>(store.acquire("gone")));
}
