/**
 * Fragment & DataFile registry
 *
 * A fragment is a horizontal slice of rows. Its data files and row id
 * sequence are written once; only the deletion file reference is replaced
 * when rows are deleted.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <shale/row_ids.h>
#include <shale/schema.h>
#include <shale/status.h>

namespace shale {
namespace format {
class DataFragment;
class DataFile;
class DeletionFile;
}

// File format generation written by default. Generation 2 and later carry
// column indices.
constexpr uint32_t kDefaultFileMajorVersion = 2;
constexpr uint32_t kDefaultFileMinorVersion = 0;

struct DataFile {
    std::string path;                     // relative to the dataset root
    std::vector<int32_t> fields;
    std::vector<int32_t> column_indices;  // empty for the legacy generation
    uint32_t file_major_version = kDefaultFileMajorVersion;
    uint32_t file_minor_version = kDefaultFileMinorVersion;
    uint64_t file_size_bytes = 0;         // 0 = unknown

    // Builds a data file storing every field of an assigned schema, with
    // column indices from the default physical layout.
    static Status Create(const std::string& path, const Schema& schema,
                         uint32_t major_version, uint32_t minor_version,
                         DataFile* file);

    bool UsesColumnIndices() const { return file_major_version >= 2; }

    // No unassigned ids; column indices consistent with the fields.
    Status Validate() const;

    bool operator==(const DataFile& other) const;
};

enum class DeletionFileType {
    kArrowArray,  // sparse list of deleted offsets
    kBitmap,      // dense roaring bitmap
};

struct DeletionFile {
    DeletionFileType type = DeletionFileType::kArrowArray;
    uint64_t read_version = 0;
    uint64_t id = 0;
    uint64_t num_deleted_rows = 0;

    const char* Extension() const {
        return type == DeletionFileType::kArrowArray ? "arrow" : "bin";
    }

    bool operator==(const DeletionFile& other) const {
        return type == other.type && read_version == other.read_version && id == other.id &&
               num_deleted_rows == other.num_deleted_rows;
    }
    bool operator!=(const DeletionFile& other) const { return !(*this == other); }
};

struct Fragment {
    uint64_t id = 0;
    std::vector<DataFile> files;
    std::optional<DeletionFile> deletion_file;
    std::optional<RowIdMeta> row_id_meta;
    uint64_t physical_rows = 0;  // including deleted rows

    uint64_t NumDeletedRows() const {
        return deletion_file ? deletion_file->num_deleted_rows : 0;
    }

    // physical_rows - deleted rows
    uint64_t NumLiveRows() const { return physical_rows - NumDeletedRows(); }

    // Fields ids stored by any of the fragment's files
    std::vector<int32_t> FieldIds() const;

    Status Validate() const;

    bool operator==(const Fragment& other) const;
};

// Hands out fragment ids above the manifest's watermark. The ids are only
// reserved once the manifest that carries them commits.
class FragmentIdAllocator {
public:
    // `max_fragment_id` is the manifest watermark, absent for a dataset that
    // never had a fragment.
    explicit FragmentIdAllocator(std::optional<uint32_t> max_fragment_id)
        : next_id_(max_fragment_id ? static_cast<uint64_t>(*max_fragment_id) + 1 : 0) {}

    uint64_t Allocate() { return next_id_++; }

    // Highest id handed out so far, if any.
    std::optional<uint32_t> MaxAllocated() const {
        if (next_id_ == 0) return std::nullopt;
        return static_cast<uint32_t>(next_id_ - 1);
    }

private:
    uint64_t next_id_;
};

void DataFileToProto(const DataFile& file, format::DataFile* proto);
void DataFileFromProto(const format::DataFile& proto, DataFile* file);

void DeletionFileToProto(const DeletionFile& file, format::DeletionFile* proto);
void DeletionFileFromProto(const format::DeletionFile& proto, DeletionFile* file);

void FragmentToProto(const Fragment& fragment, format::DataFragment* proto);
Status FragmentFromProto(const format::DataFragment& proto, Fragment* fragment);

} // namespace shale
