#pragma once

#include <cstdint>
#include <string>
#include <roaring/roaring.hh>
#include <roaring/roaring64map.hh>
#include <shale/status.h>

namespace shale {

// Fragment id sets are 32-bit roaring bitmaps; row address sets are 64-bit
// treemaps. Both are persisted in the portable roaring format.
using FragmentBitmap = roaring::Roaring;
using RowAddressSet = roaring::Roaring64Map;

// Row address = (fragment_id << 32) | row offset within the fragment.
inline uint64_t MakeRowAddress(uint32_t fragment_id, uint32_t offset) {
    return (static_cast<uint64_t>(fragment_id) << 32) | offset;
}
inline uint32_t RowAddressFragment(uint64_t address) {
    return static_cast<uint32_t>(address >> 32);
}
inline uint32_t RowAddressOffset(uint64_t address) {
    return static_cast<uint32_t>(address & 0xFFFFFFFFULL);
}

std::string SerializeBitmap(const FragmentBitmap& bitmap);
Status DeserializeBitmap(const std::string& bytes, FragmentBitmap* bitmap);

std::string SerializeRowAddresses(const RowAddressSet& addresses);
Status DeserializeRowAddresses(const std::string& bytes, RowAddressSet* addresses);

} // namespace shale
