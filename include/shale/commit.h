/**
 * Commit path
 *
 * Publishing version N+1 is a single atomic step on the object store: a
 * conditional put of {root}/_versions/{N+1}.manifest, or, for stores
 * without one, a plain put under an external commit lock keyed by
 * (root, N+1). The engine never uses an in-process lock across writers.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <shale/manifest.h>
#include <shale/options.h>
#include <shale/status.h>
#include <shale/transaction.h>
#include <shale/version_chain.h>

namespace shale {

class ObjectStore;

// A held external lock for one (root, version).
class CommitLease {
public:
    virtual ~CommitLease() = default;

    // Reports the commit outcome and gives the lock back.
    virtual Status Release(bool success) = 0;
};

// External lock service for stores without conditional writes.
class CommitLock {
public:
    virtual ~CommitLock() = default;

    // ResourceExhausted when the lock cannot be obtained.
    virtual Status Acquire(const std::string& root, uint64_t version,
                           std::unique_ptr<CommitLease>* lease) = 0;
};

class CommitHandler {
public:
    virtual ~CommitHandler() = default;

    /**
     * @brief Publish manifest bytes as version expected_current + 1
     *
     * *published is false when another writer already owns that version.
     * Errors other than a lost race are returned as a status.
     */
    virtual Status TryPublish(ObjectStore* store, const std::string& root,
                              uint64_t expected_current, const std::string& manifest_bytes,
                              bool* published) = 0;

    virtual std::string GetName() const = 0;
};

class ConditionalPutCommitHandler : public CommitHandler {
public:
    Status TryPublish(ObjectStore* store, const std::string& root, uint64_t expected_current,
                      const std::string& manifest_bytes, bool* published) override;

    std::string GetName() const override { return "ConditionalPutCommitHandler"; }
};

class ExternalLockCommitHandler : public CommitHandler {
public:
    explicit ExternalLockCommitHandler(std::shared_ptr<CommitLock> lock) : lock_(std::move(lock)) {}

    Status TryPublish(ObjectStore* store, const std::string& root, uint64_t expected_current,
                      const std::string& manifest_bytes, bool* published) override;

    std::string GetName() const override { return "ExternalLockCommitHandler"; }

private:
    std::shared_ptr<CommitLock> lock_;
};

// Conditional put when the store supports it, else the external lock.
// InvalidArgument when neither is available.
Status CreateCommitHandler(const ObjectStore& store, std::shared_ptr<CommitLock> lock,
                           std::unique_ptr<CommitHandler>* handler);

struct CommitResult {
    Manifest manifest;
    size_t num_retries = 0;  // rebases onto a newer head
    std::string transaction_file;
};

/**
 * Optimistic transaction engine
 *
 * Propose() applies an operation to the base version and tries to publish
 * the result as the next version. On a lost race it checks the operation
 * against every transaction committed since, and if all are compatible
 * rebuilds the operation on the new head and tries again.
 */
class TransactionEngine {
public:
    TransactionEngine(VersionChain chain, std::unique_ptr<CommitHandler> handler,
                      WriteParams write_params = WriteParams());

    const VersionChain& chain() const { return chain_; }

    void set_write_params(const WriteParams& write_params) { write_params_ = write_params; }

    /**
     * @brief Commit an operation read at base_version
     *
     * base_version 0 denotes an empty dataset (Overwrite only).
     *
     * @return WriteConflict on an incompatible concurrent commit,
     *         ResourceExhausted when max_retries rebases were not enough,
     *         Aborted when should_abort fired before publish
     */
    Status Propose(uint64_t base_version, Operation operation, const CommitOptions& options,
                   CommitResult* result);

private:
    Status LoadBase(uint64_t version, Manifest* manifest) const;

    // Checks `transaction` against everything committed in (from, to].
    Status CheckCommittedSince(const Transaction& transaction, uint64_t from, uint64_t to) const;

    BuildOptions MakeBuildOptions(const CommitOptions& options) const;

    void RemoveTransactionFile(const std::string& file_name) const;

    VersionChain chain_;
    std::unique_ptr<CommitHandler> handler_;
    WriteParams write_params_;
};

} // namespace shale
