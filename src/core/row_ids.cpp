#include <shale/row_ids.h>
#include <shale/object_store.h>
#include <shale/util.h>
#include "shale/format/rowids.pb.h"

#include <algorithm>

namespace shale {

namespace pb = ::shale::format;

namespace {

void ToProto(const U64Segment& segment, pb::U64Segment* proto) {
    switch (segment.kind()) {
        case U64Segment::Kind::kRange: {
            auto* range = proto->mutable_range();
            range->set_start(segment.start());
            range->set_end(segment.end());
            break;
        }
        case U64Segment::Kind::kRangeWithHoles: {
            auto* range = proto->mutable_range_with_holes();
            range->set_start(segment.start());
            range->set_end(segment.end());
            std::vector<uint64_t> all = segment.Values();
            // Holes are the ids of [start, end) missing from the values.
            size_t j = 0;
            for (uint64_t id = segment.start(); id < segment.end(); ++id) {
                if (j < all.size() && all[j] == id) {
                    ++j;
                } else {
                    range->add_holes(id);
                }
            }
            break;
        }
        case U64Segment::Kind::kRangeWithBitmap: {
            auto* range = proto->mutable_range_with_bitmap();
            range->set_start(segment.start());
            range->set_end(segment.end());
            FragmentBitmap present;
            for (uint64_t v : segment.Values()) {
                present.add(static_cast<uint32_t>(v - segment.start()));
            }
            range->set_bitmap(SerializeBitmap(present));
            break;
        }
        case U64Segment::Kind::kSortedArray: {
            for (uint64_t v : segment.Values()) proto->mutable_sorted_array()->add_values(v);
            break;
        }
        case U64Segment::Kind::kArray: {
            for (uint64_t v : segment.Values()) proto->mutable_array()->add_values(v);
            break;
        }
    }
}

// Takes length off the values still allowed for this decode.
Status ChargeLength(uint64_t length, uint64_t* remaining) {
    if (length > *remaining) {
        return Status::Corruption("Row id segment of " + std::to_string(length) +
                                  " values exceeds the " + std::to_string(*remaining) +
                                  " rows left to decode");
    }
    *remaining -= length;
    return Status::OK();
}

Status FromProto(const pb::U64Segment& proto, U64Segment* segment, uint64_t* remaining) {
    switch (proto.segment_case()) {
        case pb::U64Segment::kRange: {
            const auto& range = proto.range();
            if (range.end() < range.start()) {
                return Status::Corruption("Row id range end before start");
            }
            auto status = ChargeLength(range.end() - range.start(), remaining);
            if (!status.ok()) return status;
            *segment = U64Segment::Range(range.start(), range.end());
            return Status::OK();
        }
        case pb::U64Segment::kRangeWithHoles: {
            const auto& range = proto.range_with_holes();
            if (range.end() < range.start()) {
                return Status::Corruption("Row id range end before start");
            }
            uint64_t span = range.end() - range.start();
            uint64_t num_holes = static_cast<uint64_t>(range.holes_size());
            if (num_holes > span) {
                return Status::Corruption("Row id range has more holes than ids");
            }
            auto status = ChargeLength(span - num_holes, remaining);
            if (!status.ok()) return status;

            std::vector<uint64_t> values;
            values.reserve(static_cast<size_t>(span - num_holes));
            size_t h = 0;
            for (uint64_t id = range.start(); id < range.end(); ++id) {
                if (h < static_cast<size_t>(range.holes_size()) && range.holes(static_cast<int>(h)) == id) {
                    ++h;
                    continue;
                }
                values.push_back(id);
            }
            if (h != static_cast<size_t>(range.holes_size())) {
                return Status::Corruption("Row id holes are unsorted or out of range");
            }
            *segment = U64Segment::FromValues(values);
            return Status::OK();
        }
        case pb::U64Segment::kRangeWithBitmap: {
            const auto& range = proto.range_with_bitmap();
            if (range.end() < range.start()) {
                return Status::Corruption("Row id range end before start");
            }
            if (range.end() - range.start() > kMaxFragmentRows) {
                return Status::Corruption("Row id bitmap range exceeds 32-bit offsets");
            }
            FragmentBitmap present;
            auto status = DeserializeBitmap(range.bitmap(), &present);
            if (!status.ok()) return status;
            if (!present.isEmpty() && present.maximum() >= range.end() - range.start()) {
                return Status::Corruption("Row id bitmap offset outside its range");
            }
            status = ChargeLength(present.cardinality(), remaining);
            if (!status.ok()) return status;

            std::vector<uint64_t> values;
            values.reserve(static_cast<size_t>(present.cardinality()));
            for (uint32_t offset : present) {
                values.push_back(range.start() + offset);
            }
            *segment = U64Segment::FromValues(values);
            return Status::OK();
        }
        case pb::U64Segment::kSortedArray:
        case pb::U64Segment::kArray: {
            const auto& list = proto.segment_case() == pb::U64Segment::kSortedArray
                                   ? proto.sorted_array()
                                   : proto.array();
            auto status = ChargeLength(static_cast<uint64_t>(list.values_size()), remaining);
            if (!status.ok()) return status;
            std::vector<uint64_t> values(list.values().begin(), list.values().end());
            *segment = U64Segment::FromValues(values);
            return Status::OK();
        }
        case pb::U64Segment::SEGMENT_NOT_SET:
            break;
    }
    return Status::Corruption("U64Segment without a segment");
}

} // namespace

//==============================================================================
// U64Segment
//==============================================================================

U64Segment U64Segment::Range(uint64_t start, uint64_t end) {
    U64Segment segment;
    segment.kind_ = Kind::kRange;
    segment.start_ = start;
    segment.end_ = std::max(start, end);
    return segment;
}

U64Segment U64Segment::FromValues(const std::vector<uint64_t>& values) {
    if (values.empty()) {
        return Range(0, 0);
    }

    bool sorted = std::is_sorted(values.begin(), values.end()) &&
                  std::adjacent_find(values.begin(), values.end()) == values.end();
    U64Segment segment;
    if (!sorted) {
        segment.kind_ = Kind::kArray;
        segment.values_ = values;
        return segment;
    }

    uint64_t start = values.front();
    uint64_t end = values.back() + 1;
    uint64_t span = end - start;
    uint64_t holes = span - values.size();
    if (holes == 0) {
        return Range(start, end);
    }

    segment.start_ = start;
    segment.end_ = end;
    segment.values_ = values;

    // Rough encoded sizes: 8 bytes per listed value or hole, one bit per
    // id of the span plus a bitmap header.
    uint64_t best = 8 * values.size();
    segment.kind_ = Kind::kSortedArray;
    if (span <= kMaxFragmentRows && 16 + span / 8 < best) {
        best = 16 + span / 8;
        segment.kind_ = Kind::kRangeWithBitmap;
    }
    if (holes < values.size() && 8 * holes <= best) {
        segment.kind_ = Kind::kRangeWithHoles;
    }
    return segment;
}

size_t U64Segment::Length() const {
    if (kind_ == Kind::kRange) {
        return static_cast<size_t>(end_ - start_);
    }
    return values_.size();
}

bool U64Segment::Contains(uint64_t value) const {
    switch (kind_) {
        case Kind::kRange:
            return value >= start_ && value < end_;
        case Kind::kRangeWithHoles:
        case Kind::kRangeWithBitmap:
        case Kind::kSortedArray:
            return std::binary_search(values_.begin(), values_.end(), value);
        case Kind::kArray:
            return std::find(values_.begin(), values_.end(), value) != values_.end();
    }
    return false;
}

std::vector<uint64_t> U64Segment::Values() const {
    if (kind_ != Kind::kRange) {
        return values_;
    }
    std::vector<uint64_t> result;
    result.reserve(Length());
    for (uint64_t id = start_; id < end_; ++id) {
        result.push_back(id);
    }
    return result;
}

std::string U64Segment::Serialize() const {
    pb::U64Segment proto;
    ToProto(*this, &proto);
    return proto.SerializeAsString();
}

Status U64Segment::Deserialize(const std::string& bytes, U64Segment* segment,
                               uint64_t max_length) {
    if (bytes.empty()) {
        *segment = Range(0, 0);
        return Status::OK();
    }
    pb::U64Segment proto;
    if (!proto.ParseFromString(bytes)) {
        return Status::Corruption("Malformed U64Segment");
    }
    return FromProto(proto, segment, &max_length);
}

bool U64Segment::operator==(const U64Segment& other) const {
    return Values() == other.Values();
}

//==============================================================================
// RowIdSequence
//==============================================================================

RowIdSequence RowIdSequence::FromRange(uint64_t start, uint64_t end) {
    RowIdSequence sequence;
    if (end > start) {
        sequence.segments_.push_back(U64Segment::Range(start, end));
    }
    return sequence;
}

RowIdSequence RowIdSequence::FromValues(const std::vector<uint64_t>& values) {
    RowIdSequence sequence;
    if (!values.empty()) {
        sequence.segments_.push_back(U64Segment::FromValues(values));
    }
    return sequence;
}

void RowIdSequence::Extend(const RowIdSequence& other) {
    for (const auto& segment : other.segments_) {
        // Merge adjacent ranges so compaction output stays compact.
        if (!segments_.empty() && segments_.back().kind() == U64Segment::Kind::kRange &&
            segment.kind() == U64Segment::Kind::kRange &&
            segments_.back().end() == segment.start()) {
            segments_.back() = U64Segment::Range(segments_.back().start(), segment.end());
            continue;
        }
        if (segment.Length() > 0) {
            segments_.push_back(segment);
        }
    }
}

size_t RowIdSequence::Length() const {
    size_t length = 0;
    for (const auto& segment : segments_) {
        length += segment.Length();
    }
    return length;
}

bool RowIdSequence::Contains(uint64_t row_id) const {
    for (const auto& segment : segments_) {
        if (segment.Contains(row_id)) return true;
    }
    return false;
}

std::vector<uint64_t> RowIdSequence::ToVector() const {
    std::vector<uint64_t> result;
    result.reserve(Length());
    for (const auto& segment : segments_) {
        auto values = segment.Values();
        result.insert(result.end(), values.begin(), values.end());
    }
    return result;
}

RowIdSequence RowIdSequence::Filtered(const FragmentBitmap& deleted_offsets) const {
    if (deleted_offsets.isEmpty()) {
        return *this;
    }
    RowIdSequence result;
    uint64_t offset = 0;
    for (const auto& segment : segments_) {
        std::vector<uint64_t> kept;
        for (uint64_t id : segment.Values()) {
            if (!deleted_offsets.contains(static_cast<uint32_t>(offset))) {
                kept.push_back(id);
            }
            ++offset;
        }
        result.Extend(FromValues(kept));
    }
    return result;
}

std::string RowIdSequence::Serialize() const {
    pb::RowIdSequence proto;
    for (const auto& segment : segments_) {
        ToProto(segment, proto.add_segments());
    }
    return proto.SerializeAsString();
}

Status RowIdSequence::Deserialize(const std::string& bytes, RowIdSequence* sequence,
                                  uint64_t max_rows) {
    pb::RowIdSequence proto;
    if (!proto.ParseFromString(bytes)) {
        return Status::Corruption("Malformed RowIdSequence");
    }
    RowIdSequence result;
    for (const auto& segment_proto : proto.segments()) {
        U64Segment segment;
        auto status = FromProto(segment_proto, &segment, &max_rows);
        if (!status.ok()) {
            return status;
        }
        result.segments_.push_back(std::move(segment));
    }
    *sequence = std::move(result);
    return Status::OK();
}

//==============================================================================
// Fragment row id metadata
//==============================================================================

Status MakeRowIdMeta(ObjectStore* store, const std::string& root, uint64_t fragment_id,
                     const RowIdSequence& sequence, size_t inline_limit, RowIdMeta* meta) {
    std::string bytes = sequence.Serialize();
    if (bytes.size() <= inline_limit) {
        meta->kind = RowIdMeta::Kind::kInline;
        meta->inline_bytes = std::move(bytes);
        meta->external = ExternalFile();
        return Status::OK();
    }

    if (!store) {
        return Status::InvalidArgument("Row id sequence of " + std::to_string(bytes.size()) +
                                       " bytes needs an object store");
    }
    std::string path = "_row_ids/" + std::to_string(fragment_id) + "-" + GenerateUuid() + ".rowids";
    auto status = store->Put(JoinPath(root, path), bytes);
    if (!status.ok()) {
        return status;
    }
    meta->kind = RowIdMeta::Kind::kExternal;
    meta->inline_bytes.clear();
    meta->external.path = path;
    meta->external.offset = 0;
    meta->external.size = bytes.size();
    return Status::OK();
}

Status LoadRowIdSequence(ObjectStore* store, const std::string& root, const RowIdMeta& meta,
                         RowIdSequence* sequence, uint64_t max_rows) {
    if (meta.kind == RowIdMeta::Kind::kInline) {
        return RowIdSequence::Deserialize(meta.inline_bytes, sequence, max_rows);
    }
    std::string data;
    auto status = store->Get(JoinPath(root, meta.external.path), &data);
    if (!status.ok()) {
        return status;
    }
    if (meta.external.offset + meta.external.size > data.size()) {
        return Status::Corruption("Row id range exceeds " + meta.external.path);
    }
    return RowIdSequence::Deserialize(
        data.substr(static_cast<size_t>(meta.external.offset),
                    static_cast<size_t>(meta.external.size)),
        sequence, max_rows);
}

} // namespace shale
