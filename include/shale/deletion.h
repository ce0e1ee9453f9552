/**
 * Deletion / tombstone manager
 *
 * Deleted rows of a fragment are recorded by offset in a deletion file.
 * Every new delete writes a fresh file holding the union of the previous
 * and the new offsets; the fragment then points at the new file.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <shale/bitmap.h>
#include <shale/fragment.h>
#include <shale/status.h>

namespace shale {

class ObjectStore;

// Deleted/physical ratio at or above which the dense encoding is used.
constexpr double kDefaultDeletionBitmapRatio = 1.0 / 32.0;

// Column name of the ARROW_ARRAY encoding.
constexpr const char* kDeletionRowIdColumn = "row_id";

// _deletions/{fragment_id}-{read_version}-{id}.{arrow|bin}
std::string DeletionFilePath(uint64_t fragment_id, const DeletionFile& file);

// Chooses the encoding for a deletion vector of the given density.
DeletionFileType ChooseDeletionFileType(uint64_t num_deleted, uint64_t physical_rows,
                                        double bitmap_ratio);

/**
 * @brief Record deleted row offsets for a fragment
 *
 * Merges `offsets` with the fragment's existing deletion vector, writes the
 * result under a fresh random id and returns the new deletion file. The
 * fragment itself is not modified; the caller commits the replacement.
 *
 * Offsets beyond physical_rows are InvalidArgument.
 */
Status RecordDeletions(ObjectStore* store, const std::string& root, const Fragment& fragment,
                       const std::vector<uint32_t>& offsets, uint64_t read_version,
                       double bitmap_ratio, DeletionFile* deletion_file);

// Reads the offsets recorded by a deletion file.
Status ReadDeletionVector(ObjectStore* store, const std::string& root, uint64_t fragment_id,
                          const DeletionFile& file, FragmentBitmap* deleted);

// Empty bitmap when the fragment has no deletion file.
Status ReadFragmentDeletions(ObjectStore* store, const std::string& root,
                             const Fragment& fragment, FragmentBitmap* deleted);

inline uint64_t CurrentRowCount(const Fragment& fragment) { return fragment.NumLiveRows(); }

} // namespace shale
