/**
 * Row identity
 *
 * Row ids are drawn from a dataset-wide monotonic counter (the manifest's
 * next_row_id) and never reused. A fragment stores the ids of its rows, in
 * row order, as a RowIdSequence of compact U64Segments.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <shale/bitmap.h>
#include <shale/status.h>

namespace shale {

class ObjectStore;

// Sequences at or below this many encoded bytes are stored inline in the
// fragment record.
constexpr size_t kDefaultRowIdInlineLimit = 200 * 1024;

// Row offsets within a fragment are 32-bit.
constexpr uint64_t kMaxFragmentRows = 1ULL << 32;

class U64Segment {
public:
    enum class Kind {
        kRange,           // [start, end)
        kRangeWithHoles,  // [start, end) minus sorted holes
        kSortedArray,
        kArray,
        kRangeWithBitmap,  // [start, end) filtered by a bitmap of present offsets
    };

    U64Segment() = default;

    static U64Segment Range(uint64_t start, uint64_t end);

    // Picks the smallest representation for the given values.
    static U64Segment FromValues(const std::vector<uint64_t>& values);

    Kind kind() const { return kind_; }
    size_t Length() const;
    bool Contains(uint64_t value) const;
    std::vector<uint64_t> Values() const;

    // For kRange / kRangeWithHoles / kRangeWithBitmap
    uint64_t start() const { return start_; }
    uint64_t end() const { return end_; }

    std::string Serialize() const;
    // Fails with Corruption when the segment would decode to more than
    // max_length values.
    static Status Deserialize(const std::string& bytes, U64Segment* segment,
                              uint64_t max_length = kMaxFragmentRows);

    bool operator==(const U64Segment& other) const;

private:
    friend class RowIdSequence;

    Kind kind_ = Kind::kRange;
    uint64_t start_ = 0;
    uint64_t end_ = 0;
    std::vector<uint64_t> values_;  // holes or explicit values
};

class RowIdSequence {
public:
    RowIdSequence() = default;

    static RowIdSequence FromRange(uint64_t start, uint64_t end);
    static RowIdSequence FromValues(const std::vector<uint64_t>& values);

    void Extend(const RowIdSequence& other);

    size_t Length() const;
    bool Contains(uint64_t row_id) const;
    std::vector<uint64_t> ToVector() const;

    // Drops the rows at the given offsets, keeping order.
    RowIdSequence Filtered(const FragmentBitmap& deleted_offsets) const;

    const std::vector<U64Segment>& segments() const { return segments_; }

    std::string Serialize() const;
    static Status Deserialize(const std::string& bytes, RowIdSequence* sequence,
                              uint64_t max_rows = kMaxFragmentRows);

private:
    std::vector<U64Segment> segments_;
};

struct RowIdRange {
    uint64_t start = 0;
    uint64_t end = 0;  // exclusive

    uint64_t size() const { return end - start; }
};

// Monotonic allocator over the manifest's next_row_id counter. The
// counter only moves forward as part of a committed manifest.
class RowIdAllocator {
public:
    explicit RowIdAllocator(uint64_t next_row_id) : next_row_id_(next_row_id) {}

    RowIdRange Allocate(uint64_t count) {
        RowIdRange range{next_row_id_, next_row_id_ + count};
        next_row_id_ += count;
        return range;
    }

    uint64_t next_row_id() const { return next_row_id_; }

private:
    uint64_t next_row_id_;
};

struct ExternalFile {
    std::string path;
    uint64_t offset = 0;
    uint64_t size = 0;

    bool operator==(const ExternalFile& other) const {
        return path == other.path && offset == other.offset && size == other.size;
    }
};

// Where a fragment's row ids live.
struct RowIdMeta {
    enum class Kind { kInline, kExternal };

    Kind kind = Kind::kInline;
    std::string inline_bytes;
    ExternalFile external;

    bool operator==(const RowIdMeta& other) const {
        return kind == other.kind && inline_bytes == other.inline_bytes &&
               external == other.external;
    }
};

/**
 * @brief Encode a sequence for a fragment record
 *
 * Sequences whose encoding exceeds inline_limit are written to
 * {root}/_row_ids/{fragment_id}-{uuid}.rowids and referenced by offset/size.
 */
Status MakeRowIdMeta(ObjectStore* store, const std::string& root, uint64_t fragment_id,
                     const RowIdSequence& sequence, size_t inline_limit, RowIdMeta* meta);

// max_rows bounds the decoded length; pass the fragment's physical_rows.
Status LoadRowIdSequence(ObjectStore* store, const std::string& root, const RowIdMeta& meta,
                         RowIdSequence* sequence, uint64_t max_rows = kMaxFragmentRows);

} // namespace shale
