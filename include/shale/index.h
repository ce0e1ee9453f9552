/**
 * Index metadata catalog
 *
 * Tracks the indices of one manifest version: what they cover (field ids
 * and a bitmap of fragment ids) and a kind-tagged details payload. Two
 * hidden system indices live in the same catalog: the fragment reuse
 * ledger written by compaction and the MemWAL registry.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <shale/bitmap.h>
#include <shale/fragment.h>
#include <shale/row_ids.h>
#include <shale/status.h>

namespace shale {
namespace format {
class IndexMetadata;
class MemWalIndexDetails_MemWal;
}

constexpr const char* kFragmentReuseIndexName = "__fragment_reuse";
constexpr const char* kMemWalIndexName = "__mem_wal";

// Newest index format version this build can read.
constexpr int32_t kMaxSupportedIndexVersion = 1;

enum class IndexKind {
    kBTree,
    kBitmap,
    kLabelList,
    kInverted,
    kNGram,
    kVector,
    kFragmentReuse,
    kMemWal,
    kUnknown,
};

const char* IndexKindName(IndexKind kind);

//==============================================================================
// Details payloads
//==============================================================================

// Scalar and vector index details are opaque to the catalog: `payload` holds
// the serialized details message exactly as the index writer produced it.
struct BTreeDetails {
    std::string payload;
};
struct BitmapDetails {
    std::string payload;
};
struct LabelListDetails {
    std::string payload;
};
struct InvertedDetails {
    std::string payload;
};
struct NGramDetails {
    std::string payload;
};
struct VectorDetails {
    std::string payload;
};

struct FragmentDigest {
    uint64_t id = 0;
    uint64_t physical_rows = 0;
    uint64_t num_deleted_rows = 0;
};

// One rewrite group: old fragments replaced by new ones. changed_row_addrs
// holds the old row addresses that survived; the i-th surviving address (in
// old fragment order) moved to the i-th row of the new fragments.
struct FragmentReuseGroup {
    RowAddressSet changed_row_addrs;
    std::vector<FragmentDigest> old_fragments;
    std::vector<FragmentDigest> new_fragments;
};

struct FragmentReuseVersion {
    uint64_t dataset_version = 0;
    std::vector<FragmentReuseGroup> groups;
};

// Append-only, ordered by dataset_version.
struct FragmentReuseDetails {
    std::vector<FragmentReuseVersion> versions;
};

enum class MemWalState {
    kOpen = 0,
    kSealed = 1,
    kFlushed = 2,
};

const char* MemWalStateName(MemWalState state);

struct MemWalId {
    std::string region;
    uint64_t generation = 0;

    bool operator==(const MemWalId& other) const {
        return region == other.region && generation == other.generation;
    }
    bool operator<(const MemWalId& other) const {
        return region != other.region ? region < other.region : generation < other.generation;
    }
};

struct MemWal {
    MemWalId id;
    std::string mem_table_location;
    std::string wal_location;  // immutable once set
    U64Segment wal_entries;    // sequence ids present in the WAL
    MemWalState state = MemWalState::kOpen;
    std::string owner_id;
    uint64_t last_updated_dataset_version = 0;
};

struct MemWalDetails {
    std::vector<MemWal> mem_wal_list;

    const MemWal* Find(const MemWalId& id) const;
    MemWal* Find(const MemWalId& id);

    // The OPEN generation of a region, if any.
    const MemWal* FindOpen(const std::string& region) const;
};

// Details of a kind this build does not know; bytes are kept as read.
struct UnknownIndexDetails {
    std::string type_url;
    std::string value;
};

using IndexDetails = std::variant<BTreeDetails, BitmapDetails, LabelListDetails, InvertedDetails,
                                  NGramDetails, VectorDetails, FragmentReuseDetails,
                                  MemWalDetails, UnknownIndexDetails>;

IndexKind DetailsKind(const IndexDetails& details);

//==============================================================================
// Index metadata
//==============================================================================

struct IndexMetadata {
    std::string uuid;
    std::vector<int32_t> fields;
    std::string name;
    uint64_t dataset_version = 0;
    FragmentBitmap fragment_bitmap;
    IndexDetails details;
    std::optional<int32_t> index_version;
    std::optional<uint64_t> created_at;  // millis since epoch

    IndexKind kind() const { return DetailsKind(details); }
    bool IsSystemIndex() const;
};

void MemWalToProto(const MemWal& mem_wal, format::MemWalIndexDetails_MemWal* proto);
Status MemWalFromProto(const format::MemWalIndexDetails_MemWal& proto, MemWal* mem_wal);

void IndexMetadataToProto(const IndexMetadata& index, format::IndexMetadata* proto);
Status IndexMetadataFromProto(const format::IndexMetadata& proto, IndexMetadata* index);

// Refuses indices written by a newer format version.
Status CheckIndexCompatible(const IndexMetadata& index);

// Remaps a fragment coverage bitmap through rewrite groups: a group whose
// old fragments are all covered is replaced by its new fragments; a
// partially covered group drops its old fragments from coverage.
void RemapFragmentBitmapForGroups(const std::vector<FragmentReuseGroup>& groups,
                                  FragmentBitmap* bitmap);

struct IndexCriteria {
    std::optional<std::string> name;
    std::optional<int32_t> field_id;
    std::optional<IndexKind> kind;
    bool include_system = false;
};

struct IndexDescription {
    std::string name;
    std::string uuid;
    IndexKind kind = IndexKind::kUnknown;
    std::string type_url;
    std::vector<int32_t> fields;
    uint64_t dataset_version = 0;
    std::vector<uint64_t> indexed_fragments;
    std::vector<uint64_t> unindexed_fragments;
    std::optional<int32_t> index_version;
    std::optional<uint64_t> created_at;
};

/**
 * Index catalog of one manifest version
 *
 * Names are unique within the catalog; uuids are unique across every
 * version of the dataset.
 */
class IndexCatalog {
public:
    IndexCatalog() = default;
    explicit IndexCatalog(std::vector<IndexMetadata> indices) : indices_(std::move(indices)) {}

    const std::vector<IndexMetadata>& indices() const { return indices_; }
    bool empty() const { return indices_.empty(); }

    /**
     * @brief Add an index to the catalog
     *
     * Generates a uuid when none is set. Fails with AlreadyExists if the
     * name or uuid is already present.
     */
    Status Register(IndexMetadata index, std::string* uuid);

    Status Remove(const std::string& uuid);

    const IndexMetadata* FindByName(const std::string& name) const;
    const IndexMetadata* FindByUuid(const std::string& uuid) const;

    // Coverage is reported relative to `fragments`.
    std::vector<IndexDescription> Describe(const IndexCriteria& criteria,
                                           const std::vector<Fragment>& fragments) const;

    // Drops fragment ids from every user index's coverage.
    void PruneFragments(const FragmentBitmap& removed);

    /**
     * @brief Record a rewrite in the fragment reuse ledger
     *
     * Appends a ledger version and remaps the coverage of every user index.
     * Row-level remapping is left to RemapRowAddress.
     */
    void RecordRewrite(uint64_t dataset_version, std::vector<FragmentReuseGroup> groups);

    // Ledger; null if no rewrite was ever recorded.
    const FragmentReuseDetails* FragmentReuse() const;

    // Applies every ledger version newer than since_version.
    void RemapFragmentBitmap(FragmentBitmap* bitmap, uint64_t since_version) const;

    /**
     * @brief Follow a row address through the ledger
     *
     * Sets *deleted when the row did not survive a rewrite; otherwise
     * *new_address is its current address (unchanged if never rewritten).
     */
    Status RemapRowAddress(uint64_t address, uint64_t since_version, uint64_t* new_address,
                           bool* deleted) const;

    // MemWAL registry; null if none exists yet.
    const MemWalDetails* MemWals() const;

    // Creates the registry on first use.
    MemWalDetails* MutableMemWals(uint64_t dataset_version);

    // Removes the registry once it holds no records.
    void DropEmptyMemWals();

private:
    IndexMetadata* FindSystemIndex(const std::string& name);
    const IndexMetadata* FindSystemIndex(const std::string& name) const;

    std::vector<IndexMetadata> indices_;
};

} // namespace shale
