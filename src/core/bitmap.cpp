#include <shale/bitmap.h>

#include <stdexcept>

namespace shale {

std::string SerializeBitmap(const FragmentBitmap& bitmap) {
    std::string bytes(bitmap.getSizeInBytes(true), '\0');
    bitmap.write(&bytes[0], true);
    return bytes;
}

Status DeserializeBitmap(const std::string& bytes, FragmentBitmap* bitmap) {
    if (bytes.empty()) {
        *bitmap = FragmentBitmap();
        return Status::OK();
    }
    try {
        *bitmap = FragmentBitmap::readSafe(bytes.data(), bytes.size());
    } catch (const std::exception& e) {
        return Status::Corruption(std::string("Malformed fragment bitmap: ") + e.what());
    }
    return Status::OK();
}

std::string SerializeRowAddresses(const RowAddressSet& addresses) {
    std::string bytes(addresses.getSizeInBytes(true), '\0');
    addresses.write(&bytes[0], true);
    return bytes;
}

Status DeserializeRowAddresses(const std::string& bytes, RowAddressSet* addresses) {
    if (bytes.empty()) {
        *addresses = RowAddressSet();
        return Status::OK();
    }
    try {
        *addresses = RowAddressSet::readSafe(bytes.data(), bytes.size());
    } catch (const std::exception& e) {
        return Status::Corruption(std::string("Malformed row address set: ") + e.what());
    }
    return Status::OK();
}

} // namespace shale
