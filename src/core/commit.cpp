#include <shale/commit.h>
#include <shale/logging.h>
#include <shale/object_store.h>
#include <shale/util.h>

namespace shale {

SHALE_LOG_TAG(Commit);

//==============================================================================
// Commit handlers
//==============================================================================

Status ConditionalPutCommitHandler::TryPublish(ObjectStore* store, const std::string& root,
                                               uint64_t expected_current,
                                               const std::string& manifest_bytes, bool* published) {
    *published = false;
    auto status = store->PutIfNotExists(JoinPath(root, ManifestPath(expected_current + 1)),
                                        manifest_bytes);
    if (status.IsAlreadyExists()) {
        return Status::OK();
    }
    if (!status.ok()) {
        return status;
    }
    *published = true;
    return Status::OK();
}

Status ExternalLockCommitHandler::TryPublish(ObjectStore* store, const std::string& root,
                                             uint64_t expected_current,
                                             const std::string& manifest_bytes, bool* published) {
    *published = false;
    uint64_t version = expected_current + 1;

    std::unique_ptr<CommitLease> lease;
    auto status = lock_->Acquire(root, version, &lease);
    if (!status.ok()) {
        return status;
    }

    std::string path = JoinPath(root, ManifestPath(version));
    ObjectMeta meta;
    status = store->Head(path, &meta);
    if (status.ok()) {
        return lease->Release(false);
    }
    if (!status.IsNotFound()) {
        auto release_status = lease->Release(false);
        if (!release_status.ok()) {
            SHALE_LOG_WARN(Commit) << "Lease release failed: " << release_status.ToString();
        }
        return status;
    }

    status = store->Put(path, manifest_bytes);
    auto release_status = lease->Release(status.ok());
    if (!status.ok()) {
        return status;
    }
    if (!release_status.ok()) {
        return release_status;
    }
    *published = true;
    return Status::OK();
}

Status CreateCommitHandler(const ObjectStore& store, std::shared_ptr<CommitLock> lock,
                           std::unique_ptr<CommitHandler>* handler) {
    if (store.SupportsConditionalPut()) {
        *handler = std::make_unique<ConditionalPutCommitHandler>();
        return Status::OK();
    }
    if (!lock) {
        return Status::InvalidArgument(store.GetName() +
                                       " has no conditional put; a commit lock is required");
    }
    *handler = std::make_unique<ExternalLockCommitHandler>(std::move(lock));
    return Status::OK();
}

//==============================================================================
// TransactionEngine
//==============================================================================

TransactionEngine::TransactionEngine(VersionChain chain, std::unique_ptr<CommitHandler> handler,
                                     WriteParams write_params)
    : chain_(std::move(chain)), handler_(std::move(handler)), write_params_(write_params) {}

Status TransactionEngine::LoadBase(uint64_t version, Manifest* manifest) const {
    if (version == 0) {
        *manifest = Manifest();
        return Status::OK();
    }
    return chain_.Load(version, manifest);
}

BuildOptions TransactionEngine::MakeBuildOptions(const CommitOptions& options) const {
    BuildOptions build;
    build.store = chain_.store();
    build.root = chain_.root();
    build.row_id_inline_limit = write_params_.row_id_inline_limit;
    build.timestamp_nanos = options.timestamp_nanos;
    return build;
}

void TransactionEngine::RemoveTransactionFile(const std::string& file_name) const {
    auto status = chain_.store()->Delete(JoinPath(chain_.root(), TransactionPath(file_name)));
    if (!status.ok() && !status.IsNotFound()) {
        SHALE_LOG_WARN(Commit) << "Could not remove " << file_name << ": " << status.ToString();
    }
}

Status TransactionEngine::CheckCommittedSince(const Transaction& transaction, uint64_t from,
                                              uint64_t to) const {
    for (uint64_t version = from + 1; version <= to; ++version) {
        Manifest committed;
        auto status = chain_.Load(version, &committed);
        if (!status.ok()) {
            return status;
        }
        if (committed.transaction_file.empty()) {
            return Status::WriteConflict("Version " + std::to_string(version) +
                                         " has no transaction record to check against");
        }

        std::string bytes;
        status = chain_.store()->Get(
            JoinPath(chain_.root(), TransactionPath(committed.transaction_file)), &bytes);
        if (status.IsNotFound()) {
            return Status::WriteConflict("Transaction record of version " + std::to_string(version) +
                                         " is missing");
        }
        if (!status.ok()) {
            return status;
        }
        Transaction other;
        status = DeserializeTransaction(bytes, &other);
        if (!status.ok()) {
            return status;
        }

        if (CheckConflict(transaction.operation, other.operation) == ConflictVerdict::kConflict) {
            SHALE_LOG_INFO(Commit) << OperationKindName(KindOf(transaction.operation)) << " "
                                   << transaction.uuid << " conflicts with "
                                   << OperationKindName(KindOf(other.operation))
                                   << " committed at version " << version;
            return Status::WriteConflict(
                std::string(OperationKindName(KindOf(transaction.operation))) +
                " conflicts with " + OperationKindName(KindOf(other.operation)) +
                " committed at version " + std::to_string(version));
        }
    }
    return Status::OK();
}

Status TransactionEngine::Propose(uint64_t base_version, Operation operation,
                                  const CommitOptions& options, CommitResult* result) {
    Transaction transaction;
    transaction.read_version = base_version;
    transaction.uuid = GenerateUuid();
    transaction.tag = options.tag;
    transaction.transaction_properties = options.transaction_properties;
    transaction.operation = std::move(operation);

    BuildOptions build_options = MakeBuildOptions(options);

    Manifest base;
    auto status = LoadBase(base_version, &base);
    if (!status.ok()) {
        return status;
    }
    Manifest next;
    status = BuildManifest(base, transaction, build_options, &next);
    if (!status.ok()) {
        return status;
    }

    std::string txn_bytes;
    status = SerializeTransaction(transaction, &txn_bytes);
    if (!status.ok()) {
        return status;
    }
    std::string file_name = transaction.FileName();
    status = chain_.store()->Put(JoinPath(chain_.root(), TransactionPath(file_name)), txn_bytes);
    if (!status.ok()) {
        return status;
    }

    size_t retries = 0;
    uint64_t checked_version = base_version;
    while (true) {
        if (options.should_abort && options.should_abort()) {
            RemoveTransactionFile(file_name);
            return Status::Aborted("Transaction " + transaction.uuid + " aborted before publish");
        }

        std::string manifest_bytes;
        status = SerializeManifest(next, &manifest_bytes);
        if (!status.ok()) {
            RemoveTransactionFile(file_name);
            return status;
        }

        bool published = false;
        status = handler_->TryPublish(chain_.store(), chain_.root(), next.version - 1,
                                      manifest_bytes, &published);
        if (!status.ok()) {
            RemoveTransactionFile(file_name);
            return status;
        }
        if (published) {
            SHALE_LOG_DEBUG(Commit) << "Committed version " << next.version << " after "
                                    << retries << " retries";
            result->manifest = std::move(next);
            result->num_retries = retries;
            result->transaction_file = file_name;
            return Status::OK();
        }

        uint64_t head = 0;
        status = chain_.HeadVersion(&head);
        if (!status.ok()) {
            RemoveTransactionFile(file_name);
            return status;
        }

        status = CheckCommittedSince(transaction, checked_version, head);
        if (!status.ok()) {
            RemoveTransactionFile(file_name);
            return status;
        }
        checked_version = head;

        if (retries >= options.max_retries) {
            SHALE_LOG_WARN(Commit) << "Giving up on " << transaction.uuid << " after " << retries
                                   << " retries, head is " << head;
            RemoveTransactionFile(file_name);
            return Status::ResourceExhausted("Commit retry budget of " +
                                             std::to_string(options.max_retries) +
                                             " exhausted; retry later");
        }

        Manifest head_manifest;
        status = chain_.Load(head, &head_manifest);
        if (!status.ok()) {
            RemoveTransactionFile(file_name);
            return status;
        }
        status = BuildManifest(head_manifest, transaction, build_options, &next);
        if (!status.ok()) {
            RemoveTransactionFile(file_name);
            return status;
        }
        ++retries;
        SHALE_LOG_DEBUG(Commit) << "Rebased " << transaction.uuid << " onto version " << head;
    }
}

} // namespace shale
