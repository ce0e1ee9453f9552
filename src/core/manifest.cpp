#include <shale/manifest.h>
#include <shale/format.h>
#include <shale/logging.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <set>
#include <sstream>
#include <tuple>

namespace shale {

namespace pb = ::shale::format;

SHALE_LOG_TAG(Manifest);

namespace {

bool ParseUint(const std::string& text, uint32_t* value) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    *value = static_cast<uint32_t>(std::strtoul(text.c_str(), nullptr, 10));
    return true;
}

void FlattenField(const Field& field, google::protobuf::RepeatedPtrField<pb::Field>* fields) {
    auto* proto = fields->Add();
    proto->set_name(field.name);
    proto->set_id(field.id);
    proto->set_parent_id(field.parent_id);
    proto->set_logical_type(field.logical_type);
    proto->set_nullable(field.nullable);
    for (const auto& [key, value] : field.metadata) {
        (*proto->mutable_metadata())[key] = value;
    }
    for (const auto& child : field.children) {
        FlattenField(child, fields);
    }
}

Field FieldFromProto(const pb::Field& proto) {
    Field field;
    field.name = proto.name();
    field.id = proto.id();
    field.parent_id = proto.parent_id();
    field.logical_type = proto.logical_type();
    field.nullable = proto.nullable();
    for (const auto& [key, value] : proto.metadata()) {
        field.metadata[key] = value;
    }
    return field;
}

void AttachChildren(Field* parent, const std::map<int32_t, std::vector<const pb::Field*>>& by_parent) {
    auto it = by_parent.find(parent->id);
    if (it == by_parent.end()) return;
    for (const pb::Field* child_proto : it->second) {
        Field child = FieldFromProto(*child_proto);
        AttachChildren(&child, by_parent);
        parent->children.push_back(std::move(child));
    }
}

} // namespace

//==============================================================================
// Feature flags
//==============================================================================

Status CheckReaderFlags(uint64_t reader_feature_flags) {
    uint64_t unknown = reader_feature_flags & ~kKnownFeatureFlags;
    if (unknown != 0) {
        return Status::Incompatible("Dataset requires unknown reader feature flags " +
                                    std::to_string(unknown));
    }
    return Status::OK();
}

Status CheckWriterFlags(uint64_t writer_feature_flags) {
    uint64_t unknown = writer_feature_flags & ~kKnownFeatureFlags;
    if (unknown != 0) {
        return Status::Incompatible("Dataset requires unknown writer feature flags " +
                                    std::to_string(unknown));
    }
    return Status::OK();
}

//==============================================================================
// WriterVersion
//==============================================================================

bool WriterVersion::ParseSemver(uint32_t* major, uint32_t* minor, uint32_t* patch,
                                std::string* tag) const {
    std::string core = version;
    std::string suffix;
    size_t dash = version.find('-');
    if (dash != std::string::npos) {
        core = version.substr(0, dash);
        suffix = version.substr(dash + 1);
    }

    std::vector<std::string> parts;
    std::stringstream stream(core);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (parts.size() != 3) {
        return false;
    }
    uint32_t values[3];
    for (size_t i = 0; i < 3; ++i) {
        if (!ParseUint(parts[i], &values[i])) return false;
    }
    *major = values[0];
    *minor = values[1];
    *patch = values[2];
    if (tag) *tag = suffix;
    return true;
}

bool WriterVersion::OlderThan(uint32_t major, uint32_t minor, uint32_t patch) const {
    if (library != kLibraryName) {
        return false;
    }
    uint32_t my_major = 0, my_minor = 0, my_patch = 0;
    if (!ParseSemver(&my_major, &my_minor, &my_patch, nullptr)) {
        return false;
    }
    return std::make_tuple(my_major, my_minor, my_patch) < std::make_tuple(major, minor, patch);
}

WriterVersion WriterVersion::Bump(Part part, bool keep_tag) const {
    uint32_t major = 0, minor = 0, patch = 0;
    std::string tag;
    if (!ParseSemver(&major, &minor, &patch, &tag)) {
        return *this;
    }
    switch (part) {
        case Part::kMajor: ++major; minor = 0; patch = 0; break;
        case Part::kMinor: ++minor; patch = 0; break;
        case Part::kPatch: ++patch; break;
    }
    WriterVersion bumped;
    bumped.library = library;
    bumped.version = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (keep_tag && !tag.empty()) {
        bumped.version += "-" + tag;
    }
    return bumped;
}

std::string ManifestSummary::ToJson() const {
    nlohmann::json json;
    json["total_fragments"] = total_fragments;
    json["total_data_files"] = total_data_files;
    json["total_deletion_files"] = total_deletion_files;
    json["total_data_file_rows"] = total_data_file_rows;
    json["total_deletion_file_rows"] = total_deletion_file_rows;
    json["total_rows"] = total_rows;
    json["total_files_size"] = total_files_size;
    return json.dump();
}

//==============================================================================
// Manifest
//==============================================================================

int32_t Manifest::MaxFieldId() const {
    int32_t max_id = schema.MaxFieldId();
    for (const auto& fragment : fragments) {
        for (const auto& file : fragment.files) {
            for (int32_t id : file.fields) {
                max_id = std::max(max_id, id);
            }
        }
    }
    return max_id;
}

void Manifest::UpdateMaxFragmentId() {
    for (const auto& fragment : fragments) {
        uint32_t id = static_cast<uint32_t>(fragment.id);
        if (!max_fragment_id || id > *max_fragment_id) {
            max_fragment_id = id;
        }
    }
}

const Fragment* Manifest::FragmentById(uint64_t id) const {
    for (const auto& fragment : fragments) {
        if (fragment.id == id) return &fragment;
    }
    return nullptr;
}

std::vector<Fragment> Manifest::FragmentsSince(const Manifest& older) const {
    std::optional<uint64_t> older_max;
    for (const auto& fragment : older.fragments) {
        if (!older_max || fragment.id > *older_max) older_max = fragment.id;
    }
    std::vector<Fragment> result;
    for (const auto& fragment : fragments) {
        if (!older_max || fragment.id > *older_max) {
            result.push_back(fragment);
        }
    }
    return result;
}

std::vector<std::pair<uint64_t, const Fragment*>> Manifest::FragmentsByOffsetRange(
    uint64_t start, uint64_t end) const {
    std::vector<std::pair<uint64_t, const Fragment*>> result;
    uint64_t offset = 0;
    for (const auto& fragment : fragments) {
        uint64_t rows = fragment.NumLiveRows();
        uint64_t fragment_end = offset + rows;
        if (fragment_end > start && offset < end && rows > 0) {
            result.emplace_back(offset, &fragment);
        }
        offset = fragment_end;
        if (offset >= end) break;
    }
    return result;
}

void Manifest::UpdateConfig(const std::map<std::string, std::string>& upserts) {
    for (const auto& [key, value] : upserts) {
        config[key] = value;
    }
}

void Manifest::DeleteConfigKeys(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        config.erase(key);
    }
}

void Manifest::ReplaceSchemaMetadata(std::map<std::string, std::string> metadata) {
    schema.set_metadata(std::move(metadata));
}

Status Manifest::ReplaceFieldMetadata(int32_t field_id, std::map<std::string, std::string> metadata) {
    Field* field = schema.MutableFieldById(field_id);
    if (!field) {
        return Status::NotFound("Field id " + std::to_string(field_id) + " not in schema");
    }
    field->metadata = std::move(metadata);
    return Status::OK();
}

void Manifest::RecomputeFeatureFlags(bool enable_stable_row_ids) {
    bool stable = enable_stable_row_ids || UsesStableRowIds();
    reader_feature_flags = 0;
    writer_feature_flags = 0;

    bool has_deletions = std::any_of(fragments.begin(), fragments.end(),
                                     [](const Fragment& f) { return f.deletion_file.has_value(); });
    if (has_deletions) {
        reader_feature_flags |= kFlagDeletionFiles;
        writer_feature_flags |= kFlagDeletionFiles;
    }
    if (stable) {
        reader_feature_flags |= kFlagStableRowIds;
        writer_feature_flags |= kFlagStableRowIds;
    }
    if (data_storage_format.IsLegacy()) {
        reader_feature_flags |= kFlagLegacyFormat;
        writer_feature_flags |= kFlagLegacyFormat;
    }
    if (!config.empty()) {
        writer_feature_flags |= kFlagTableConfig;
    }
}

uint64_t Manifest::NumLiveRows() const {
    uint64_t rows = 0;
    for (const auto& fragment : fragments) {
        rows += fragment.NumLiveRows();
    }
    return rows;
}

ManifestSummary Manifest::Summary() const {
    ManifestSummary summary;
    summary.total_fragments = fragments.size();
    for (const auto& fragment : fragments) {
        summary.total_data_files += fragment.files.size();
        summary.total_data_file_rows += fragment.physical_rows;
        if (fragment.deletion_file) {
            summary.total_deletion_files += 1;
            summary.total_deletion_file_rows += fragment.deletion_file->num_deleted_rows;
        }
        summary.total_rows += fragment.NumLiveRows();
        for (const auto& file : fragment.files) {
            summary.total_files_size += file.file_size_bytes;
        }
    }
    return summary;
}

Status Manifest::Validate() const {
    auto status = schema.Validate();
    if (!status.ok()) {
        return status;
    }

    std::set<uint64_t> ids;
    for (const auto& fragment : fragments) {
        if (!ids.insert(fragment.id).second) {
            return Status::InvariantViolation("Duplicate fragment id " + std::to_string(fragment.id));
        }
        if (!max_fragment_id || fragment.id > *max_fragment_id) {
            return Status::InvariantViolation("Fragment id " + std::to_string(fragment.id) +
                                              " above max_fragment_id");
        }
        status = fragment.Validate();
        if (!status.ok()) {
            return status;
        }
        if (UsesStableRowIds() && !fragment.row_id_meta) {
            return Status::InvariantViolation("Fragment " + std::to_string(fragment.id) +
                                              " lacks row ids under stable row ids");
        }
    }

    std::set<std::string> names;
    for (const auto& index : indices.indices()) {
        if (!names.insert(index.name).second) {
            return Status::InvariantViolation("Duplicate index name " + index.name);
        }
    }
    return Status::OK();
}

//==============================================================================
// Protobuf conversion
//==============================================================================

void SchemaToProto(const Schema& schema, google::protobuf::RepeatedPtrField<pb::Field>* fields) {
    for (const auto& field : schema.fields()) {
        FlattenField(field, fields);
    }
}

Status SchemaFromProto(const google::protobuf::RepeatedPtrField<pb::Field>& fields,
                       std::map<std::string, std::string> metadata, Schema* schema) {
    std::set<int32_t> ids;
    std::map<int32_t, std::vector<const pb::Field*>> by_parent;
    for (const auto& field : fields) {
        if (field.id() < 0) {
            return Status::Corruption("Persisted field " + field.name() + " has no id");
        }
        if (!ids.insert(field.id()).second) {
            return Status::Corruption("Duplicate field id " + std::to_string(field.id()));
        }
        if (field.parent_id() != -1 && ids.count(field.parent_id()) == 0) {
            return Status::Corruption("Field " + field.name() + " precedes its parent");
        }
        by_parent[field.parent_id()].push_back(&field);
    }

    std::vector<Field> top_level;
    auto it = by_parent.find(-1);
    if (it != by_parent.end()) {
        for (const pb::Field* proto : it->second) {
            Field field = FieldFromProto(*proto);
            AttachChildren(&field, by_parent);
            top_level.push_back(std::move(field));
        }
    }
    *schema = Schema(std::move(top_level), std::move(metadata));
    return Status::OK();
}

Status ManifestToProto(const Manifest& manifest, pb::Manifest* proto) {
    SchemaToProto(manifest.schema, proto->mutable_fields());
    for (const auto& fragment : manifest.fragments) {
        FragmentToProto(fragment, proto->add_fragments());
    }
    proto->set_version(manifest.version);
    proto->set_version_aux_data(manifest.version_aux_data);
    for (const auto& [key, value] : manifest.schema.metadata()) {
        (*proto->mutable_metadata())[key] = value;
    }
    proto->mutable_writer_version()->set_library(manifest.writer_version.library);
    proto->mutable_writer_version()->set_version(manifest.writer_version.version);
    if (manifest.index_section) {
        proto->set_index_section(*manifest.index_section);
    }
    proto->mutable_timestamp()->set_seconds(static_cast<int64_t>(manifest.timestamp_nanos / 1000000000ULL));
    proto->mutable_timestamp()->set_nanos(static_cast<int32_t>(manifest.timestamp_nanos % 1000000000ULL));
    proto->set_tag(manifest.tag);
    proto->set_reader_feature_flags(manifest.reader_feature_flags);
    proto->set_writer_feature_flags(manifest.writer_feature_flags);
    if (manifest.max_fragment_id) {
        proto->set_max_fragment_id(*manifest.max_fragment_id);
    }
    proto->set_transaction_file(manifest.transaction_file);
    proto->set_next_row_id(manifest.next_row_id);
    proto->mutable_data_format()->set_file_format(manifest.data_storage_format.file_format);
    proto->mutable_data_format()->set_version(manifest.data_storage_format.version);
    for (const auto& [key, value] : manifest.config) {
        (*proto->mutable_config())[key] = value;
    }
    proto->set_blob_dataset_version(manifest.blob_dataset_version);
    return RestoreUnknownFields(manifest.unknown_fields, proto);
}

Status ManifestFromProto(const pb::Manifest& proto, Manifest* manifest) {
    auto status = CheckReaderFlags(proto.reader_feature_flags());
    if (!status.ok()) {
        return status;
    }

    Manifest result;
    std::map<std::string, std::string> metadata;
    for (const auto& [key, value] : proto.metadata()) {
        metadata[key] = value;
    }
    status = SchemaFromProto(proto.fields(), std::move(metadata), &result.schema);
    if (!status.ok()) {
        return status;
    }

    for (const auto& fragment_proto : proto.fragments()) {
        Fragment fragment;
        status = FragmentFromProto(fragment_proto, &fragment);
        if (!status.ok()) {
            return status;
        }
        result.fragments.push_back(std::move(fragment));
    }

    result.version = proto.version();
    result.version_aux_data = proto.version_aux_data();
    if (proto.has_writer_version()) {
        result.writer_version.library = proto.writer_version().library();
        result.writer_version.version = proto.writer_version().version();
    }
    if (proto.has_index_section()) {
        result.index_section = proto.index_section();
    }
    result.timestamp_nanos = static_cast<uint64_t>(proto.timestamp().seconds()) * 1000000000ULL +
                             static_cast<uint64_t>(proto.timestamp().nanos());
    result.tag = proto.tag();
    result.reader_feature_flags = proto.reader_feature_flags();
    result.writer_feature_flags = proto.writer_feature_flags();
    if (proto.has_max_fragment_id()) {
        result.max_fragment_id = proto.max_fragment_id();
    }
    result.transaction_file = proto.transaction_file();
    result.next_row_id = proto.next_row_id();
    if (proto.has_data_format()) {
        result.data_storage_format.file_format = proto.data_format().file_format();
        result.data_storage_format.version = proto.data_format().version();
    }
    for (const auto& [key, value] : proto.config()) {
        result.config[key] = value;
    }
    result.blob_dataset_version = proto.blob_dataset_version();
    status = SaveUnknownFields(proto, &result.unknown_fields);
    if (!status.ok()) {
        return status;
    }

    if (result.UsesStableRowIds()) {
        for (const auto& fragment : result.fragments) {
            if (!fragment.row_id_meta) {
                return Status::Corruption("Fragment " + std::to_string(fragment.id) +
                                          " has no row ids in a stable row id dataset");
            }
        }
    }

    *manifest = std::move(result);
    return Status::OK();
}

Status SerializeManifest(const Manifest& manifest, std::string* bytes) {
    std::string buffer;
    std::optional<uint64_t> index_position;

    if (!manifest.indices.empty()) {
        pb::IndexSection section;
        for (const auto& index : manifest.indices.indices()) {
            IndexMetadataToProto(index, section.add_indices());
        }
        uint64_t position = 0;
        auto status = AppendProtobufBlock(section, &buffer, &position);
        if (!status.ok()) {
            return status;
        }
        index_position = position;
    }

    pb::Manifest proto;
    auto status = ManifestToProto(manifest, &proto);
    if (!status.ok()) {
        return status;
    }
    if (index_position) {
        proto.set_index_section(*index_position);
    } else {
        proto.clear_index_section();
    }

    Footer footer;
    status = AppendProtobufBlock(proto, &buffer, &footer.metadata_position);
    if (!status.ok()) {
        return status;
    }
    footer.major_version = kManifestMajorVersion;
    footer.minor_version = kManifestMinorVersion;
    AppendFooter(footer, &buffer);

    *bytes = std::move(buffer);
    return Status::OK();
}

Status DeserializeManifest(const std::string& bytes, Manifest* manifest) {
    Footer footer;
    auto status = ReadFooter(bytes, &footer);
    if (!status.ok()) {
        return status;
    }
    if (footer.major_version > kManifestMajorVersion) {
        return Status::Incompatible("Manifest format " + std::to_string(footer.major_version) + "." +
                                    std::to_string(footer.minor_version) + " is newer than supported");
    }

    pb::Manifest proto;
    status = ReadProtobufBlock(bytes, footer.metadata_position, &proto);
    if (!status.ok()) {
        return status;
    }

    Manifest result;
    status = ManifestFromProto(proto, &result);
    if (!status.ok()) {
        SHALE_LOG_WARN(Manifest) << "Cannot decode manifest: " << status.ToString();
        return status;
    }

    if (proto.has_index_section()) {
        pb::IndexSection section;
        status = ReadProtobufBlock(bytes, proto.index_section(), &section);
        if (!status.ok()) {
            return status;
        }
        std::vector<IndexMetadata> indices;
        for (const auto& index_proto : section.indices()) {
            IndexMetadata index;
            status = IndexMetadataFromProto(index_proto, &index);
            if (!status.ok()) {
                return status;
            }
            indices.push_back(std::move(index));
        }
        result.indices = IndexCatalog(std::move(indices));
    }

    *manifest = std::move(result);
    return Status::OK();
}

} // namespace shale
