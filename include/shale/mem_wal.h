/**
 * MemWAL engine
 *
 * A MemWAL pairs an external mem-table with a write-ahead log for one
 * region. Records live in the dataset's __mem_wal system index and move
 * OPEN -> SEALED -> FLUSHED, each step a dataset commit. The owner_id of a
 * record is a compare-and-swap token: every mutation names the owner it
 * expects and fails with InvariantViolation when somebody else took over.
 *
 * WAL entries are objects {wal_location}/{sequence}.entry. A writer claims
 * sequence last + 1 with a conditional put and moves on to + 2, + 3, ...
 * when the id is taken, so a region's WAL may have holes. Replay reads only
 * the ids recorded in the record's wal_entries; a hole is an entry that
 * never existed.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <shale/commit.h>
#include <shale/index.h>
#include <shale/options.h>
#include <shale/status.h>

namespace shale {

struct MemWalEntry {
    uint64_t sequence = 0;
    std::string data;
};

// {wal_location}/{sequence}.entry
std::string WalEntryPath(const std::string& wal_location, uint64_t sequence);

class MemWalWriter {
public:
    MemWalWriter(TransactionEngine* engine, std::string owner_id,
                 CommitOptions options = CommitOptions());

    const std::string& owner_id() const { return owner_id_; }

    // Opens generation 0 of a new region, owned by this writer.
    Status CreateRegion(const std::string& region, const std::string& mem_table_location,
                        const std::string& wal_location, MemWal* created);

    // Takes over the OPEN generation of a region, typically before replay.
    Status ClaimOwnership(const std::string& region, MemWal* claimed);

    /**
     * @brief Append one entry to the region's OPEN WAL
     *
     * Requires the store to support conditional puts.
     */
    Status AppendEntry(const std::string& region, const std::string& data, uint64_t* sequence);

    /**
     * @brief Seal the OPEN generation and open the next one in one commit
     *
     * The new generation keeps this writer as owner.
     */
    Status Seal(const std::string& region, const std::string& next_mem_table_location,
                const std::string& next_wal_location, MemWal* opened);

    // Commits the flushed fragments and marks the SEALED generation FLUSHED
    // in the same version.
    Status MarkFlushed(const MemWalId& id, std::vector<Fragment> fragments, CommitResult* result);

    // Removes FLUSHED records and their WAL objects. Fails with
    // InvariantViolation when a FLUSHED record belongs to another owner.
    Status Cleanup(size_t* removed);

    // Entries of a generation in sequence order.
    Status ReplayEntries(const MemWalId& id, std::vector<MemWalEntry>* entries) const;

private:
    Status LoadHead(Manifest* manifest) const;
    Status FindOpen(const Manifest& manifest, const std::string& region, MemWal* mem_wal) const;
    Status Commit(const Manifest& head, Operation operation, CommitResult* result);

    TransactionEngine* engine_;
    std::string owner_id_;
    CommitOptions options_;
};

} // namespace shale
