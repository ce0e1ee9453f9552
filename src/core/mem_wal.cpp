#include <shale/mem_wal.h>
#include <shale/logging.h>
#include <shale/object_store.h>

#include <algorithm>

namespace shale {

SHALE_LOG_TAG(MemWal);

std::string WalEntryPath(const std::string& wal_location, uint64_t sequence) {
    return JoinPath(wal_location, std::to_string(sequence) + ".entry");
}

MemWalWriter::MemWalWriter(TransactionEngine* engine, std::string owner_id, CommitOptions options)
    : engine_(engine), owner_id_(std::move(owner_id)), options_(std::move(options)) {}

Status MemWalWriter::LoadHead(Manifest* manifest) const {
    return engine_->chain().LoadLatest(manifest);
}

Status MemWalWriter::FindOpen(const Manifest& manifest, const std::string& region,
                              MemWal* mem_wal) const {
    const MemWalDetails* details = manifest.indices.MemWals();
    const MemWal* open = details ? details->FindOpen(region) : nullptr;
    if (!open) {
        return Status::NotFound("Region " + region + " has no OPEN MemWAL");
    }
    *mem_wal = *open;
    return Status::OK();
}

Status MemWalWriter::Commit(const Manifest& head, Operation operation, CommitResult* result) {
    CommitResult local;
    return engine_->Propose(head.version, std::move(operation), options_,
                            result ? result : &local);
}

Status MemWalWriter::CreateRegion(const std::string& region, const std::string& mem_table_location,
                                  const std::string& wal_location, MemWal* created) {
    if (region.empty()) {
        return Status::InvalidArgument("Region name is empty");
    }
    Manifest head;
    auto status = LoadHead(&head);
    if (!status.ok()) {
        return status;
    }
    const MemWalDetails* details = head.indices.MemWals();
    if (details) {
        for (const auto& existing : details->mem_wal_list) {
            if (existing.id.region == region) {
                return Status::AlreadyExists("Region " + region + " already exists");
            }
        }
    }

    MemWal mem_wal;
    mem_wal.id = MemWalId{region, 0};
    mem_wal.mem_table_location = mem_table_location;
    mem_wal.wal_location = wal_location;
    mem_wal.state = MemWalState::kOpen;
    mem_wal.owner_id = owner_id_;

    UpdateMemWalStateOp op;
    op.added.push_back(mem_wal);
    CommitResult result;
    status = Commit(head, std::move(op), &result);
    if (!status.ok()) {
        return status;
    }
    mem_wal.last_updated_dataset_version = result.manifest.version;
    SHALE_LOG_INFO(MemWal) << "Created region " << region << " at version "
                           << result.manifest.version;
    if (created) *created = std::move(mem_wal);
    return Status::OK();
}

Status MemWalWriter::ClaimOwnership(const std::string& region, MemWal* claimed) {
    Manifest head;
    auto status = LoadHead(&head);
    if (!status.ok()) {
        return status;
    }
    MemWal current;
    status = FindOpen(head, region, &current);
    if (!status.ok()) {
        return status;
    }

    MemWalUpdate update;
    update.id = current.id;
    update.expected_owner_id = current.owner_id;
    update.record = current;
    update.record.owner_id = owner_id_;

    UpdateMemWalStateOp op;
    op.updated.push_back(update);
    CommitResult result;
    status = Commit(head, std::move(op), &result);
    if (!status.ok()) {
        return status;
    }
    SHALE_LOG_INFO(MemWal) << owner_id_ << " claimed " << region << "/" << current.id.generation
                           << " from " << current.owner_id;
    if (claimed) {
        *claimed = update.record;
        claimed->last_updated_dataset_version = result.manifest.version;
    }
    return Status::OK();
}

Status MemWalWriter::AppendEntry(const std::string& region, const std::string& data,
                                 uint64_t* sequence) {
    ObjectStore* store = engine_->chain().store();
    if (!store->SupportsConditionalPut()) {
        return Status::NotImplemented("WAL entry allocation needs conditional puts on " +
                                      store->GetName());
    }

    Manifest head;
    auto status = LoadHead(&head);
    if (!status.ok()) {
        return status;
    }
    MemWal current;
    status = FindOpen(head, region, &current);
    if (!status.ok()) {
        return status;
    }
    if (current.owner_id != owner_id_) {
        return Status::InvariantViolation("Region " + region + " is owned by " + current.owner_id);
    }

    std::vector<uint64_t> ids = current.wal_entries.Values();
    uint64_t candidate = 0;
    for (uint64_t id : ids) {
        candidate = std::max(candidate, id + 1);
    }
    while (true) {
        status = store->PutIfNotExists(WalEntryPath(current.wal_location, candidate), data);
        if (status.ok()) break;
        if (!status.IsAlreadyExists()) {
            return status;
        }
        SHALE_LOG_DEBUG(MemWal) << "WAL id " << candidate << " of " << region
                                << " taken, trying the next one";
        ++candidate;
    }

    // Record the entry, rebasing onto concurrent record updates.
    for (size_t attempt = 0;; ++attempt) {
        std::vector<uint64_t> recorded = current.wal_entries.Values();
        recorded.push_back(candidate);
        std::sort(recorded.begin(), recorded.end());

        MemWalUpdate update;
        update.id = current.id;
        update.expected_owner_id = owner_id_;
        update.record = current;
        update.record.wal_entries = U64Segment::FromValues(recorded);

        UpdateMemWalStateOp op;
        op.updated.push_back(update);
        status = Commit(head, std::move(op), nullptr);
        if (status.ok()) {
            break;
        }
        if (!status.IsWriteConflict() || attempt >= options_.max_retries) {
            return status;
        }

        status = LoadHead(&head);
        if (!status.ok()) {
            return status;
        }
        const MemWalDetails* details = head.indices.MemWals();
        const MemWal* latest = details ? details->Find(current.id) : nullptr;
        if (!latest || latest->state != MemWalState::kOpen) {
            return Status::WriteConflict("MemWAL " + region + "/" +
                                         std::to_string(current.id.generation) +
                                         " is no longer OPEN");
        }
        if (latest->owner_id != owner_id_) {
            return Status::InvariantViolation("Region " + region + " is now owned by " +
                                              latest->owner_id);
        }
        current = *latest;
    }

    *sequence = candidate;
    return Status::OK();
}

Status MemWalWriter::Seal(const std::string& region, const std::string& next_mem_table_location,
                          const std::string& next_wal_location, MemWal* opened) {
    Manifest head;
    auto status = LoadHead(&head);
    if (!status.ok()) {
        return status;
    }
    MemWal current;
    status = FindOpen(head, region, &current);
    if (!status.ok()) {
        return status;
    }
    if (next_wal_location == current.wal_location) {
        return Status::InvalidArgument("Next generation needs its own wal_location");
    }

    MemWalUpdate seal;
    seal.id = current.id;
    seal.expected_owner_id = owner_id_;
    seal.record = current;
    seal.record.state = MemWalState::kSealed;

    MemWal next;
    next.id = MemWalId{region, current.id.generation + 1};
    next.mem_table_location = next_mem_table_location;
    next.wal_location = next_wal_location;
    next.state = MemWalState::kOpen;
    next.owner_id = owner_id_;

    UpdateMemWalStateOp op;
    op.updated.push_back(seal);
    op.added.push_back(next);
    CommitResult result;
    status = Commit(head, std::move(op), &result);
    if (!status.ok()) {
        return status;
    }
    next.last_updated_dataset_version = result.manifest.version;
    SHALE_LOG_INFO(MemWal) << "Sealed " << region << "/" << current.id.generation << ", opened "
                           << next.id.generation << " at version " << result.manifest.version;
    if (opened) *opened = std::move(next);
    return Status::OK();
}

Status MemWalWriter::MarkFlushed(const MemWalId& id, std::vector<Fragment> fragments,
                                 CommitResult* result) {
    Manifest head;
    auto status = LoadHead(&head);
    if (!status.ok()) {
        return status;
    }
    const MemWalDetails* details = head.indices.MemWals();
    const MemWal* sealed = details ? details->Find(id) : nullptr;
    if (!sealed) {
        return Status::NotFound("MemWAL " + id.region + "/" + std::to_string(id.generation) +
                                " does not exist");
    }

    MemWalUpdate flush;
    flush.id = id;
    flush.expected_owner_id = owner_id_;
    flush.record = *sealed;

    AppendOp op;
    op.fragments = std::move(fragments);
    op.mem_wal_to_flush = std::move(flush);
    status = Commit(head, std::move(op), result);
    if (!status.ok()) {
        return status;
    }
    SHALE_LOG_INFO(MemWal) << "Flushed " << id.region << "/" << id.generation;
    return Status::OK();
}

Status MemWalWriter::Cleanup(size_t* removed) {
    Manifest head;
    auto status = LoadHead(&head);
    if (!status.ok()) {
        return status;
    }
    *removed = 0;
    const MemWalDetails* details = head.indices.MemWals();
    if (!details) {
        return Status::OK();
    }

    UpdateMemWalStateOp op;
    std::vector<std::string> wal_locations;
    for (const auto& mem_wal : details->mem_wal_list) {
        if (mem_wal.state != MemWalState::kFlushed) continue;
        MemWalUpdate removal;
        removal.id = mem_wal.id;
        removal.expected_owner_id = owner_id_;
        removal.record = mem_wal;
        op.removed.push_back(std::move(removal));
        wal_locations.push_back(mem_wal.wal_location);
    }
    if (op.removed.empty()) {
        return Status::OK();
    }

    size_t count = op.removed.size();
    status = Commit(head, std::move(op), nullptr);
    if (!status.ok()) {
        return status;
    }

    ObjectStore* store = engine_->chain().store();
    for (const auto& location : wal_locations) {
        if (location.empty()) continue;
        std::vector<ObjectMeta> objects;
        std::string prefix = location.back() == '/' ? location : location + "/";
        status = store->List(prefix, &objects);
        if (!status.ok()) {
            return status;
        }
        for (const auto& object : objects) {
            status = store->Delete(object.path);
            if (!status.ok() && !status.IsNotFound()) {
                return status;
            }
        }
    }
    *removed = count;
    return Status::OK();
}

Status MemWalWriter::ReplayEntries(const MemWalId& id, std::vector<MemWalEntry>* entries) const {
    Manifest head;
    auto status = LoadHead(&head);
    if (!status.ok()) {
        return status;
    }
    const MemWalDetails* details = head.indices.MemWals();
    const MemWal* mem_wal = details ? details->Find(id) : nullptr;
    if (!mem_wal) {
        return Status::NotFound("MemWAL " + id.region + "/" + std::to_string(id.generation) +
                                " does not exist");
    }

    std::vector<uint64_t> ids = mem_wal->wal_entries.Values();
    std::sort(ids.begin(), ids.end());

    ObjectStore* store = engine_->chain().store();
    std::vector<MemWalEntry> result;
    for (uint64_t sequence : ids) {
        MemWalEntry entry;
        entry.sequence = sequence;
        status = store->Get(WalEntryPath(mem_wal->wal_location, sequence), &entry.data);
        if (status.IsNotFound()) {
            return Status::Corruption("WAL entry " + std::to_string(sequence) + " of " + id.region +
                                      " is recorded but missing");
        }
        if (!status.ok()) {
            return status;
        }
        result.push_back(std::move(entry));
    }
    *entries = std::move(result);
    return Status::OK();
}

} // namespace shale
