// modules/checkpoint/blob_store.h
#ifndef AGENTGRAPH_MODULES_CHECKPOINT_BLOB_STORE_H
#define AGENTGRAPH_MODULES_CHECKPOINT_BLOB_STORE_H

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentgraph {

// Keyed blob persistence plus an advisory per-key lock.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual void put(const std::string& id, const std::string& blob) = 0;
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& id) const = 0;
    virtual bool remove(const std::string& id) = 0;
    virtual std::vector<std::string> list() const = 0;

    // Non-blocking; false when another holder owns the lock.
    [[nodiscard]] virtual bool try_lock(const std::string& id) = 0;
    virtual void unlock(const std::string& id) = 0;
};

class MemoryBlobStore : public BlobStore {
public:
    void put(const std::string& id, const std::string& blob) override;
    [[nodiscard]] std::optional<std::string> get(const std::string& id) const override;
    bool remove(const std::string& id) override;
    std::vector<std::string> list() const override;
    [[nodiscard]] bool try_lock(const std::string& id) override;
    void unlock(const std::string& id) override;

    size_t put_count() const { return put_count_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> blobs_;
    std::set<std::string> locked_;
    size_t put_count_ = 0;
};

// One "<id>.json" per key under `dir`. Writes go to a temp file that is renamed
// over the target; locks are flock(2) on "<id>.lock".
// remove() also deletes "<id>.lock" when this store holds that lock.
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::filesystem::path dir);
    ~FileBlobStore() override;

    FileBlobStore(const FileBlobStore&) = delete;
    FileBlobStore& operator=(const FileBlobStore&) = delete;

    void put(const std::string& id, const std::string& blob) override;
    [[nodiscard]] std::optional<std::string> get(const std::string& id) const override;
    bool remove(const std::string& id) override;
    std::vector<std::string> list() const override;
    [[nodiscard]] bool try_lock(const std::string& id) override;
    void unlock(const std::string& id) override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::mutex mutex_;
    std::map<std::string, int> lock_fds_; // id -> fd holding the flock

    std::filesystem::path blob_path(const std::string& id) const;
    std::filesystem::path lock_path(const std::string& id) const;
};

// Session ids become file names: [A-Za-z0-9_-], 1..64 chars.
void validate_blob_id(const std::string& id);

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_CHECKPOINT_BLOB_STORE_H
