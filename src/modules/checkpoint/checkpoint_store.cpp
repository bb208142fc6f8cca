// modules/checkpoint/checkpoint_store.cpp
#include "modules/checkpoint/checkpoint_store.h"
#include "agentgraph/core/errors.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentgraph {

std::string_view to_string(TerminalResumePolicy policy) {
    return policy == TerminalResumePolicy::NO_OP ? "no_op" : "reenter_loop";
}

TerminalResumePolicy parse_terminal_resume_policy(std::string_view text) {
    if (text == "no_op") return TerminalResumePolicy::NO_OP;
    if (text == "reenter_loop") return TerminalResumePolicy::REENTER_LOOP;
    throw ConfigError("Unknown terminal_resume_policy: " + std::string(text) +
                      " (expected no_op or reenter_loop)");
}

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

// --- Checkpoint ---

nlohmann::json Checkpoint::to_json() const {
    nlohmann::json j;
    j["session_id"] = session_id;
    j["workflow"] = workflow;
    j["state"] = state;
    j["stage_pointer"] = stage_pointer;
    j["last_stage"] = last_stage;
    j["seq"] = seq;
    j["exhausted_scopes"] = exhausted_scopes;
    j["created_at"] = created_at;
    j["updated_at"] = updated_at;
    return j;
}

Checkpoint Checkpoint::from_json(const nlohmann::json& j) {
    Checkpoint cp;
    try {
        cp.session_id = j.at("session_id").get<std::string>();
        cp.workflow = j.value("workflow", "");
        cp.state = j.at("state");
        cp.stage_pointer = j.at("stage_pointer").get<std::string>();
        cp.last_stage = j.value("last_stage", kStart);
        cp.seq = j.at("seq").get<uint64_t>();
        cp.exhausted_scopes = j.value("exhausted_scopes", std::vector<std::string>{});
        cp.created_at = j.value("created_at", int64_t{0});
        cp.updated_at = j.value("updated_at", int64_t{0});
    } catch (const nlohmann::json::exception& e) {
        throw WorkflowError("Corrupt checkpoint: " + std::string(e.what()));
    }
    return cp;
}

// --- SessionLock ---

SessionLock::SessionLock(SessionLock&& other) noexcept
    : store_(other.store_), session_id_(std::move(other.session_id_)) {
    other.store_ = nullptr;
}

SessionLock& SessionLock::operator=(SessionLock&& other) noexcept {
    if (this != &other) {
        release();
        store_ = other.store_;
        session_id_ = std::move(other.session_id_);
        other.store_ = nullptr;
    }
    return *this;
}

SessionLock::~SessionLock() {
    release();
}

void SessionLock::release() {
    if (store_) {
        store_->unlock(session_id_);
        store_ = nullptr;
    }
}

// --- CheckpointStore ---

CheckpointStore::CheckpointStore(std::shared_ptr<BlobStore> blobs) : blobs_(std::move(blobs)) {
    if (!blobs_) {
        throw WorkflowError("CheckpointStore requires a blob store");
    }
}

void CheckpointStore::save(Checkpoint& checkpoint) {
    const int64_t now = unix_now();
    if (checkpoint.created_at == 0) checkpoint.created_at = now;
    checkpoint.updated_at = now;

    // 外部输出可能含非法 UTF-8，替换而不是抛出
    blobs_->put(checkpoint.session_id,
                checkpoint.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    spdlog::debug("checkpoint {} seq={} pointer={}", checkpoint.session_id, checkpoint.seq, checkpoint.stage_pointer);
}

Checkpoint CheckpointStore::load(const std::string& session_id) const {
    validate_blob_id(session_id);
    auto blob = blobs_->get(session_id);
    if (!blob) {
        throw SessionNotFound(session_id);
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*blob);
    } catch (const nlohmann::json::parse_error& e) {
        throw WorkflowError("Corrupt checkpoint for " + session_id + ": " + e.what());
    }
    return Checkpoint::from_json(j);
}

bool CheckpointStore::exists(const std::string& session_id) const {
    return blobs_->get(session_id).has_value();
}

std::vector<Checkpoint> CheckpointStore::list() const {
    std::vector<Checkpoint> sessions;
    for (const auto& id : blobs_->list()) {
        try {
            sessions.push_back(load(id));
        } catch (const WorkflowError& e) {
            spdlog::warn("Skipping unreadable session {}: {}", id, e.what());
        }
    }
    return sessions;
}

bool CheckpointStore::prune(const std::string& session_id) {
    validate_blob_id(session_id);
    SessionLock lock = acquire(session_id); // 不删除正在运行的会话
    return blobs_->remove(session_id);
}

SessionLock CheckpointStore::acquire(const std::string& session_id) {
    validate_blob_id(session_id);
    if (!blobs_->try_lock(session_id)) {
        throw SessionLocked(session_id);
    }
    return SessionLock(blobs_.get(), session_id);
}

std::string CheckpointStore::generate_session_id() {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << dist(gen);
    return oss.str();
}

} // namespace agentgraph
