// modules/checkpoint/blob_store.cpp
#include "modules/checkpoint/blob_store.h"
#include "agentgraph/core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace agentgraph {

namespace fs = std::filesystem;

void validate_blob_id(const std::string& id) {
    if (id.empty() || id.size() > 64) {
        throw WorkflowError("Invalid session id (length): '" + id + "'");
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            throw WorkflowError("Invalid session id (character): '" + id + "'");
        }
    }
}

// --- MemoryBlobStore ---

void MemoryBlobStore::put(const std::string& id, const std::string& blob) {
    validate_blob_id(id);
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[id] = blob;
    ++put_count_;
}

std::optional<std::string> MemoryBlobStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(id);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryBlobStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.erase(id) > 0;
}

std::vector<std::string> MemoryBlobStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, _] : blobs_) {
        ids.push_back(id);
    }
    return ids;
}

bool MemoryBlobStore::try_lock(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_.insert(id).second;
}

void MemoryBlobStore::unlock(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    locked_.erase(id);
}

// --- FileBlobStore ---

FileBlobStore::FileBlobStore(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw WorkflowError("Cannot create checkpoint directory " + dir_.string() + ": " + ec.message());
    }
}

FileBlobStore::~FileBlobStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, fd] : lock_fds_) {
        ::flock(fd, LOCK_UN);
        ::close(fd);
    }
}

fs::path FileBlobStore::blob_path(const std::string& id) const {
    return dir_ / (id + ".json");
}

fs::path FileBlobStore::lock_path(const std::string& id) const {
    return dir_ / (id + ".lock");
}

void FileBlobStore::put(const std::string& id, const std::string& blob) {
    validate_blob_id(id);
    const fs::path target = blob_path(id);
    const fs::path tmp = dir_ / (id + ".json.tmp");

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw WorkflowError("Cannot open " + tmp.string() + " for writing");
        }
        out << blob;
        out.flush();
        if (!out) {
            throw WorkflowError("Failed writing checkpoint " + tmp.string());
        }
    }

    // rename(2) 保证读者看到的要么是旧版本要么是新版本
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw WorkflowError("Cannot move checkpoint into place: " + target.string());
    }
}

std::optional<std::string> FileBlobStore::get(const std::string& id) const {
    validate_blob_id(id);
    std::ifstream in(blob_path(id), std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool FileBlobStore::remove(const std::string& id) {
    validate_blob_id(id);
    std::error_code ec;
    bool removed = fs::remove(blob_path(id), ec);
    if (ec) {
        throw WorkflowError("Cannot remove checkpoint " + id + ": " + ec.message());
    }
    if (removed) {
        // 仍持有 flock 时删除锁文件，避免目录中残留
        std::lock_guard<std::mutex> lock(mutex_);
        if (lock_fds_.count(id) > 0 && !fs::remove(lock_path(id), ec) && ec) {
            spdlog::warn("Cannot remove lock file for {}: {}", id, ec.message());
        }
    }
    return removed;
}

std::vector<std::string> FileBlobStore::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        if (p.extension() == ".json") {
            ids.push_back(p.stem().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool FileBlobStore::try_lock(const std::string& id) {
    validate_blob_id(id);
    std::lock_guard<std::mutex> lock(mutex_);
    if (lock_fds_.count(id) > 0) {
        return false; // 本进程已持有
    }

    int fd = ::open(lock_path(id).c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw WorkflowError("Cannot open lock file for " + id + ": " + std::strerror(errno));
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return false;
        }
        throw WorkflowError("flock failed for " + id + ": " + std::strerror(err));
    }
    lock_fds_[id] = fd;
    return true;
}

void FileBlobStore::unlock(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lock_fds_.find(id);
    if (it == lock_fds_.end()) {
        return;
    }
    ::flock(it->second, LOCK_UN);
    ::close(it->second);
    lock_fds_.erase(it);
}

} // namespace agentgraph
