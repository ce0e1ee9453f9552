#pragma once

#include <cstdint>
#include <string>
#include <shale/status.h>

namespace google {
namespace protobuf {
class Message;
class MessageLite;
}
}

namespace shale {

// Trailing footer shared by data files and manifest files:
//   [i64 metadata position][u16 major][u16 minor]["LANC"]
constexpr char kFormatMagic[4] = {'L', 'A', 'N', 'C'};
constexpr size_t kFooterSize = 16;

constexpr uint16_t kManifestMajorVersion = 0;
constexpr uint16_t kManifestMinorVersion = 1;

struct Footer {
    uint64_t metadata_position = 0;
    uint16_t major_version = 0;
    uint16_t minor_version = 0;
};

void AppendFooter(const Footer& footer, std::string* buffer);

// Locates the footer at `data.size() - kFooterSize` and validates the magic.
Status ReadFooter(const std::string& data, Footer* footer);

// Appends a u32-length-prefixed protobuf block, reporting where it starts.
Status AppendProtobufBlock(const google::protobuf::MessageLite& message,
                           std::string* buffer, uint64_t* position);

Status ReadProtobufBlock(const std::string& data, uint64_t position,
                         google::protobuf::MessageLite* message);

// Wire bytes of the fields of `message` this build does not know. Merging
// them back with RestoreUnknownFields lets a rewrite carry them forward.
Status SaveUnknownFields(const google::protobuf::Message& message, std::string* bytes);
Status RestoreUnknownFields(const std::string& bytes, google::protobuf::Message* message);

} // namespace shale
