/**
 * Transactions
 *
 * A transaction is one operation proposed against a read version. It is
 * recorded in {root}/_transactions/{read_version}-{uuid}.txn and applied
 * to a base manifest to produce the next one. When another writer wins the
 * race for the next version, the committed transactions are checked
 * against this one with CheckConflict and, if compatible, the operation is
 * applied again on the new head.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <shale/fragment.h>
#include <shale/index.h>
#include <shale/manifest.h>
#include <shale/row_ids.h>
#include <shale/schema.h>
#include <shale/status.h>

namespace shale {

class ObjectStore;

enum class OperationKind {
    kAppend,
    kDelete,
    kOverwrite,
    kCreateIndex,
    kRewrite,
    kUpdateConfig,
    kUpdateMemWalState,
};

const char* OperationKindName(OperationKind kind);

// A mutation of one MemWAL record, guarded by the owner the writer last saw.
struct MemWalUpdate {
    MemWalId id;
    std::string expected_owner_id;
    MemWal record;
};

// Fragment ids of new fragments are assigned when the operation is applied;
// ids set by the caller are ignored.
struct AppendOp {
    std::vector<Fragment> fragments;
    // Sealed MemWAL whose contents these fragments flush. Marked FLUSHED in
    // the same commit.
    std::optional<MemWalUpdate> mem_wal_to_flush;
};

struct DeleteOp {
    std::vector<Fragment> updated_fragments;  // with their new deletion files
    std::vector<uint64_t> deleted_fragment_ids;
    std::string predicate;
};

struct OverwriteOp {
    std::vector<Fragment> fragments;
    Schema schema;
    std::map<std::string, std::string> config_upsert_values;
    bool enable_stable_row_ids = false;
};

struct CreateIndexOp {
    std::vector<IndexMetadata> new_indices;
    std::vector<std::string> removed_indices;  // uuids
};

struct RewriteGroup {
    std::vector<Fragment> old_fragments;
    std::vector<Fragment> new_fragments;
};

struct RewriteOp {
    std::vector<RewriteGroup> groups;
};

struct UpdateConfigOp {
    std::map<std::string, std::string> upsert_values;
    std::vector<std::string> delete_keys;
    std::optional<std::map<std::string, std::string>> schema_metadata;
    bool replace_schema_metadata = false;
};

struct UpdateMemWalStateOp {
    std::vector<MemWal> added;
    std::vector<MemWalUpdate> updated;
    std::vector<MemWalUpdate> removed;
};

using Operation = std::variant<AppendOp, DeleteOp, OverwriteOp, CreateIndexOp, RewriteOp,
                               UpdateConfigOp, UpdateMemWalStateOp>;

OperationKind KindOf(const Operation& operation);

struct Transaction {
    uint64_t read_version = 0;
    std::string uuid;
    std::string tag;
    std::map<std::string, std::string> transaction_properties;
    Operation operation;

    // {read_version}-{uuid}.txn
    std::string FileName() const;
};

Status SerializeTransaction(const Transaction& transaction, std::string* bytes);
Status DeserializeTransaction(const std::string& bytes, Transaction* transaction);

//==============================================================================
// Conflict resolution
//==============================================================================

enum class ConflictVerdict {
    kCompatible,  // rebuild on the new head and retry
    kConflict,    // permanent concurrent modification
};

// Symmetric: CheckConflict(a, b) == CheckConflict(b, a) for every pair.
ConflictVerdict CheckConflict(const Operation& a, const Operation& b);

//==============================================================================
// Applying an operation
//==============================================================================

struct BuildOptions {
    ObjectStore* store = nullptr;
    std::string root;
    size_t row_id_inline_limit = kDefaultRowIdInlineLimit;
    uint64_t timestamp_nanos = 0;  // 0 = now
};

/**
 * @brief Apply a transaction to a base manifest
 *
 * Produces the manifest for base.version + 1. Fails with WriteConflict
 * when the operation refers to state the base no longer has (a fragment
 * removed by a concurrent commit, for example), InvariantViolation when it
 * would break a structural invariant, and Incompatible when the base
 * requires a writer feature this build lacks.
 */
Status BuildManifest(const Manifest& base, const Transaction& transaction,
                     const BuildOptions& options, Manifest* next);

//==============================================================================
// Compaction planning
//==============================================================================

struct RewritePlan {
    // Surviving row ids of the old fragments, split across the new fragments.
    std::vector<RowIdSequence> new_row_ids;
    // Old row addresses that survived, in old fragment order.
    RowAddressSet changed_row_addrs;
    uint64_t surviving_rows = 0;
};

/**
 * @brief Plan the row identity of a rewrite
 *
 * Reads the deletion vectors (and, when stable_row_ids is set, the row id
 * sequences) of the old fragments. new_fragment_rows must add up to the
 * number of surviving rows.
 */
Status PlanRewrite(ObjectStore* store, const std::string& root,
                   const std::vector<Fragment>& old_fragments,
                   const std::vector<uint64_t>& new_fragment_rows, bool stable_row_ids,
                   RewritePlan* plan);

} // namespace shale
