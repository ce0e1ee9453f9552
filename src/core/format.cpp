#include <shale/format.h>

#include <cstring>
#include <google/protobuf/message.h>
#include <google/protobuf/message_lite.h>
#include <google/protobuf/unknown_field_set.h>

namespace shale {

namespace {

void PutFixed(std::string* buffer, uint64_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        buffer->push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

uint64_t GetFixed(const char* data, size_t width) {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(static_cast<uint8_t>(data[i])) << (8 * i);
    }
    return value;
}

} // namespace

void AppendFooter(const Footer& footer, std::string* buffer) {
    PutFixed(buffer, footer.metadata_position, 8);
    PutFixed(buffer, footer.major_version, 2);
    PutFixed(buffer, footer.minor_version, 2);
    buffer->append(kFormatMagic, sizeof(kFormatMagic));
}

Status ReadFooter(const std::string& data, Footer* footer) {
    if (data.size() < kFooterSize) {
        return Status::Corruption("File too small for footer: " + std::to_string(data.size()) +
                                  " bytes");
    }
    const char* tail = data.data() + data.size() - kFooterSize;
    if (std::memcmp(tail + 12, kFormatMagic, sizeof(kFormatMagic)) != 0) {
        return Status::Corruption("Bad magic in footer");
    }
    footer->metadata_position = GetFixed(tail, 8);
    footer->major_version = static_cast<uint16_t>(GetFixed(tail + 8, 2));
    footer->minor_version = static_cast<uint16_t>(GetFixed(tail + 10, 2));
    if (footer->metadata_position >= data.size() - kFooterSize) {
        return Status::Corruption("Metadata position " + std::to_string(footer->metadata_position) +
                                  " is outside the file");
    }
    return Status::OK();
}

Status AppendProtobufBlock(const google::protobuf::MessageLite& message,
                           std::string* buffer, uint64_t* position) {
    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return Status::InvalidArgument("Failed to serialize " + message.GetTypeName());
    }
    if (bytes.size() > UINT32_MAX) {
        return Status::InvalidArgument(message.GetTypeName() + " block exceeds 4 GiB");
    }
    if (position) {
        *position = buffer->size();
    }
    PutFixed(buffer, bytes.size(), 4);
    buffer->append(bytes);
    return Status::OK();
}

Status ReadProtobufBlock(const std::string& data, uint64_t position,
                         google::protobuf::MessageLite* message) {
    if (position + 4 > data.size()) {
        return Status::Corruption("Block position " + std::to_string(position) +
                                  " is past the end of the file");
    }
    uint64_t length = GetFixed(data.data() + position, 4);
    if (position + 4 + length > data.size()) {
        return Status::Corruption("Truncated " + message->GetTypeName() + " block");
    }
    if (!message->ParseFromArray(data.data() + position + 4, static_cast<int>(length))) {
        return Status::Corruption("Malformed " + message->GetTypeName() + " block");
    }
    return Status::OK();
}

Status SaveUnknownFields(const google::protobuf::Message& message, std::string* bytes) {
    bytes->clear();
    const auto& unknown = message.GetReflection()->GetUnknownFields(message);
    if (unknown.empty()) {
        return Status::OK();
    }
    if (!unknown.SerializeToString(bytes)) {
        return Status::Corruption("Cannot serialize unknown fields of " + message.GetTypeName());
    }
    return Status::OK();
}

Status RestoreUnknownFields(const std::string& bytes, google::protobuf::Message* message) {
    if (bytes.empty()) {
        return Status::OK();
    }
    if (!message->MergeFromString(bytes)) {
        return Status::Corruption("Unknown fields of " + message->GetTypeName() + " do not parse");
    }
    return Status::OK();
}

} // namespace shale
