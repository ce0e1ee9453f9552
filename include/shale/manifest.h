/**
 * Manifest
 *
 * Immutable snapshot of one dataset version: schema, fragments, counters,
 * feature flags, config and the index catalog. A committed manifest is
 * never changed; the transaction engine derives the next one from a copy.
 *
 * On disk: {root}/_versions/{version}.manifest =
 *   [IndexSection block][Manifest block][footer]
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <shale/fragment.h>
#include <shale/index.h>
#include <shale/schema.h>
#include <shale/status.h>
#include "shale/format/table.pb.h"

namespace shale {

constexpr const char* kLibraryName = "shale";
constexpr const char* kLibraryVersion = "0.1.0";

//==============================================================================
// Feature flags
//==============================================================================

constexpr uint64_t kFlagDeletionFiles = 1;
constexpr uint64_t kFlagStableRowIds = 2;
constexpr uint64_t kFlagLegacyFormat = 4;
constexpr uint64_t kFlagTableConfig = 8;
constexpr uint64_t kKnownFeatureFlags =
    kFlagDeletionFiles | kFlagStableRowIds | kFlagLegacyFormat | kFlagTableConfig;

// Incompatible if any bit is unknown to this build.
Status CheckReaderFlags(uint64_t reader_feature_flags);
Status CheckWriterFlags(uint64_t writer_feature_flags);

//==============================================================================
// Writer identity and storage format
//==============================================================================

struct WriterVersion {
    std::string library = kLibraryName;
    std::string version = kLibraryVersion;

    enum class Part { kMajor, kMinor, kPatch };

    // "1.2.3" or "1.2.3-beta.1"; false if not semver.
    bool ParseSemver(uint32_t* major, uint32_t* minor, uint32_t* patch,
                     std::string* tag) const;

    // False when the version is not semver or the library differs.
    bool OlderThan(uint32_t major, uint32_t minor, uint32_t patch) const;

    // Increments one part, zeroing the lower ones.
    WriterVersion Bump(Part part, bool keep_tag) const;

    bool operator==(const WriterVersion& other) const {
        return library == other.library && version == other.version;
    }
};

struct DataStorageFormat {
    static constexpr const char* kLegacyVersion = "0.1";

    std::string file_format = kLibraryName;
    std::string version = "2.0";

    bool IsLegacy() const { return version == kLegacyVersion; }

    bool operator==(const DataStorageFormat& other) const {
        return file_format == other.file_format && version == other.version;
    }
};

struct ManifestSummary {
    uint64_t total_fragments = 0;
    uint64_t total_data_files = 0;
    uint64_t total_deletion_files = 0;
    uint64_t total_data_file_rows = 0;
    uint64_t total_deletion_file_rows = 0;
    uint64_t total_rows = 0;
    uint64_t total_files_size = 0;

    std::string ToJson() const;
};

//==============================================================================
// Manifest
//==============================================================================

struct Manifest {
    Schema schema;  // schema metadata is the manifest metadata map
    std::vector<Fragment> fragments;
    uint64_t version = 0;
    uint64_t version_aux_data = 0;
    WriterVersion writer_version;
    std::optional<uint64_t> index_section;  // set when read from or written to a file
    uint64_t timestamp_nanos = 0;
    std::string tag;
    uint64_t reader_feature_flags = 0;
    uint64_t writer_feature_flags = 0;
    std::optional<uint32_t> max_fragment_id;
    std::string transaction_file;
    uint64_t next_row_id = 0;
    DataStorageFormat data_storage_format;
    std::map<std::string, std::string> config;
    uint64_t blob_dataset_version = 0;
    std::string unknown_fields;  // written by newer writers, carried on rewrite

    IndexCatalog indices;

    bool UsesStableRowIds() const { return (writer_feature_flags & kFlagStableRowIds) != 0; }

    // Highest field id in the schema or referenced by any data file; -1 if none.
    int32_t MaxFieldId() const;

    // Raises the watermark to cover every current fragment. Never lowers it.
    void UpdateMaxFragmentId();

    const Fragment* FragmentById(uint64_t id) const;

    // Fragments whose id is above every fragment id of `older`.
    std::vector<Fragment> FragmentsSince(const Manifest& older) const;

    // (row offset, fragment) pairs overlapping the logical row range
    // [start, end), offsets counting live rows.
    std::vector<std::pair<uint64_t, const Fragment*>> FragmentsByOffsetRange(uint64_t start,
                                                                             uint64_t end) const;

    void UpdateConfig(const std::map<std::string, std::string>& upserts);
    void DeleteConfigKeys(const std::vector<std::string>& keys);
    void ReplaceSchemaMetadata(std::map<std::string, std::string> metadata);
    Status ReplaceFieldMetadata(int32_t field_id, std::map<std::string, std::string> metadata);

    // Derives the flags from the manifest contents. Stable row ids stay on
    // once enabled.
    void RecomputeFeatureFlags(bool enable_stable_row_ids);

    uint64_t NumLiveRows() const;
    ManifestSummary Summary() const;

    // Structural invariants checked before a manifest is published.
    Status Validate() const;
};

// Flattens a schema into pre-order protobuf fields and back.
void SchemaToProto(const Schema& schema,
                   google::protobuf::RepeatedPtrField<format::Field>* fields);
Status SchemaFromProto(const google::protobuf::RepeatedPtrField<format::Field>& fields,
                       std::map<std::string, std::string> metadata, Schema* schema);

Status ManifestToProto(const Manifest& manifest, format::Manifest* proto);
Status ManifestFromProto(const format::Manifest& proto, Manifest* manifest);

// [IndexSection block][Manifest block][footer]
Status SerializeManifest(const Manifest& manifest, std::string* bytes);

// Fails with Incompatible before decoding anything else if the manifest
// requires a reader feature this build lacks.
Status DeserializeManifest(const std::string& bytes, Manifest* manifest);

} // namespace shale
