// modules/checkpoint/checkpoint_store.h
#ifndef AGENTGRAPH_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
#define AGENTGRAPH_MODULES_CHECKPOINT_CHECKPOINT_STORE_H

#include "agentgraph/core/state.h"
#include "modules/checkpoint/blob_store.h"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {

// What resume does with a session whose pointer is already TERMINAL
enum class TerminalResumePolicy : uint8_t {
    NO_OP,        // return the stored state untouched
    REENTER_LOOP  // re-run the last completed stage once and follow its edges
};

std::string_view to_string(TerminalResumePolicy policy);
TerminalResumePolicy parse_terminal_resume_policy(std::string_view text); // throws ConfigError

struct Checkpoint {
    std::string session_id;
    std::string workflow;                      // workflow name, for listing and resume
    State state = State::object();
    StageId stage_pointer = kTerminal;         // next stage to run
    StageId last_stage = kStart;               // last completed stage
    uint64_t seq = 0;                          // 单调递增
    std::vector<std::string> exhausted_scopes;
    int64_t created_at = 0;                    // unix seconds
    int64_t updated_at = 0;

    nlohmann::json to_json() const;
    static Checkpoint from_json(const nlohmann::json& j);
};

class CheckpointStore;

// Held for the duration of a run; releases the session lock on destruction.
class SessionLock {
public:
    SessionLock(SessionLock&& other) noexcept;
    SessionLock& operator=(SessionLock&& other) noexcept;
    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;
    ~SessionLock();

    const std::string& session_id() const { return session_id_; }

private:
    friend class CheckpointStore;
    SessionLock(BlobStore* store, std::string session_id)
        : store_(store), session_id_(std::move(session_id)) {}

    void release();

    BlobStore* store_ = nullptr;
    std::string session_id_;
};

class CheckpointStore {
public:
    explicit CheckpointStore(std::shared_ptr<BlobStore> blobs);

    // Persists synchronously and stamps created_at/updated_at on `checkpoint`.
    void save(Checkpoint& checkpoint);
    // Throws SessionNotFound.
    Checkpoint load(const std::string& session_id) const;
    bool exists(const std::string& session_id) const;
    std::vector<Checkpoint> list() const;
    bool prune(const std::string& session_id);

    // Throws SessionLocked when another run holds the session.
    [[nodiscard]] SessionLock acquire(const std::string& session_id);

    static std::string generate_session_id(); // 8 hex chars

private:
    std::shared_ptr<BlobStore> blobs_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CHECKPOINT_CHECKPOINT_STORE_H
