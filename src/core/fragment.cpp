#include <shale/fragment.h>
#include "shale/format/table.pb.h"

#include <set>

namespace shale {

namespace pb = ::shale::format;

//==============================================================================
// DataFile
//==============================================================================

Status DataFile::Create(const std::string& path, const Schema& schema,
                        uint32_t major_version, uint32_t minor_version, DataFile* file) {
    if (path.empty()) {
        return Status::InvalidArgument("Data file path is empty");
    }

    DataFile result;
    result.path = path;
    result.fields = schema.FieldIds();
    result.file_major_version = major_version;
    result.file_minor_version = minor_version;

    for (int32_t id : result.fields) {
        if (id < 0) {
            return Status::InvalidArgument("Schema has unassigned fields; assign ids first");
        }
    }

    if (result.UsesColumnIndices()) {
        auto status = ComputeColumnIndices(DefaultPhysicalLayout(schema), &result.column_indices);
        if (!status.ok()) {
            return status;
        }
    }

    auto status = result.Validate();
    if (!status.ok()) {
        return status;
    }
    *file = std::move(result);
    return Status::OK();
}

Status DataFile::Validate() const {
    if (path.empty()) {
        return Status::InvariantViolation("Data file without a path");
    }
    for (int32_t id : fields) {
        if (id == kUnassignedFieldId) {
            return Status::InvariantViolation("Data file " + path + " has an unassigned field id");
        }
        if (id < kTombstonedFieldId) {
            return Status::InvariantViolation("Data file " + path + " has invalid field id " +
                                              std::to_string(id));
        }
    }
    if (!UsesColumnIndices()) {
        return Status::OK();
    }
    return ValidateColumnIndices(fields, column_indices);
}

bool DataFile::operator==(const DataFile& other) const {
    return path == other.path && fields == other.fields &&
           column_indices == other.column_indices &&
           file_major_version == other.file_major_version &&
           file_minor_version == other.file_minor_version &&
           file_size_bytes == other.file_size_bytes;
}

//==============================================================================
// Fragment
//==============================================================================

std::vector<int32_t> Fragment::FieldIds() const {
    std::vector<int32_t> ids;
    for (const auto& file : files) {
        for (int32_t id : file.fields) {
            if (id >= 0) ids.push_back(id);
        }
    }
    return ids;
}

Status Fragment::Validate() const {
    if (deletion_file && deletion_file->num_deleted_rows > physical_rows) {
        return Status::InvariantViolation(
            "Fragment " + std::to_string(id) + " deletes " +
            std::to_string(deletion_file->num_deleted_rows) + " of " +
            std::to_string(physical_rows) + " rows");
    }

    std::set<int32_t> seen;
    for (const auto& file : files) {
        auto status = file.Validate();
        if (!status.ok()) {
            return status;
        }
        for (int32_t field_id : file.fields) {
            if (field_id < 0) continue;
            if (!seen.insert(field_id).second) {
                return Status::InvariantViolation("Field id " + std::to_string(field_id) +
                                                  " stored twice in fragment " +
                                                  std::to_string(id));
            }
        }
    }
    return Status::OK();
}

bool Fragment::operator==(const Fragment& other) const {
    return id == other.id && files == other.files && deletion_file == other.deletion_file &&
           row_id_meta == other.row_id_meta && physical_rows == other.physical_rows;
}

//==============================================================================
// Protobuf conversion
//==============================================================================

void DataFileToProto(const DataFile& file, pb::DataFile* proto) {
    proto->set_path(file.path);
    for (int32_t id : file.fields) proto->add_fields(id);
    for (int32_t index : file.column_indices) proto->add_column_indices(index);
    proto->set_file_major_version(file.file_major_version);
    proto->set_file_minor_version(file.file_minor_version);
    proto->set_file_size_bytes(file.file_size_bytes);
}

void DataFileFromProto(const pb::DataFile& proto, DataFile* file) {
    file->path = proto.path();
    file->fields.assign(proto.fields().begin(), proto.fields().end());
    file->column_indices.assign(proto.column_indices().begin(), proto.column_indices().end());
    file->file_major_version = proto.file_major_version();
    file->file_minor_version = proto.file_minor_version();
    file->file_size_bytes = proto.file_size_bytes();
}

void DeletionFileToProto(const DeletionFile& file, pb::DeletionFile* proto) {
    proto->set_file_type(file.type == DeletionFileType::kBitmap ? pb::DeletionFile::BITMAP
                                                                 : pb::DeletionFile::ARROW_ARRAY);
    proto->set_read_version(file.read_version);
    proto->set_id(file.id);
    proto->set_num_deleted_rows(file.num_deleted_rows);
}

void DeletionFileFromProto(const pb::DeletionFile& proto, DeletionFile* file) {
    file->type = proto.file_type() == pb::DeletionFile::BITMAP ? DeletionFileType::kBitmap
                                                                : DeletionFileType::kArrowArray;
    file->read_version = proto.read_version();
    file->id = proto.id();
    file->num_deleted_rows = proto.num_deleted_rows();
}

void FragmentToProto(const Fragment& fragment, pb::DataFragment* proto) {
    proto->set_id(fragment.id);
    for (const auto& file : fragment.files) {
        DataFileToProto(file, proto->add_files());
    }
    if (fragment.deletion_file) {
        DeletionFileToProto(*fragment.deletion_file, proto->mutable_deletion_file());
    }
    if (fragment.row_id_meta) {
        const auto& meta = *fragment.row_id_meta;
        if (meta.kind == RowIdMeta::Kind::kInline) {
            proto->set_inline_row_ids(meta.inline_bytes);
        } else {
            auto* external = proto->mutable_external_row_ids();
            external->set_path(meta.external.path);
            external->set_offset(meta.external.offset);
            external->set_size(meta.external.size);
        }
    }
    proto->set_physical_rows(fragment.physical_rows);
}

Status FragmentFromProto(const pb::DataFragment& proto, Fragment* fragment) {
    Fragment result;
    result.id = proto.id();
    result.physical_rows = proto.physical_rows();
    for (const auto& file_proto : proto.files()) {
        DataFile file;
        DataFileFromProto(file_proto, &file);
        result.files.push_back(std::move(file));
    }
    if (proto.has_deletion_file()) {
        DeletionFile deletion;
        DeletionFileFromProto(proto.deletion_file(), &deletion);
        result.deletion_file = deletion;
    }
    switch (proto.row_id_sequence_case()) {
        case pb::DataFragment::kInlineRowIds: {
            RowIdMeta meta;
            meta.kind = RowIdMeta::Kind::kInline;
            meta.inline_bytes = proto.inline_row_ids();
            result.row_id_meta = std::move(meta);
            break;
        }
        case pb::DataFragment::kExternalRowIds: {
            RowIdMeta meta;
            meta.kind = RowIdMeta::Kind::kExternal;
            meta.external.path = proto.external_row_ids().path();
            meta.external.offset = proto.external_row_ids().offset();
            meta.external.size = proto.external_row_ids().size();
            result.row_id_meta = std::move(meta);
            break;
        }
        case pb::DataFragment::ROW_ID_SEQUENCE_NOT_SET:
            break;
    }

    if (result.deletion_file && result.deletion_file->num_deleted_rows > result.physical_rows) {
        return Status::Corruption("Fragment " + std::to_string(result.id) +
                                  " records more deleted rows than physical rows");
    }
    *fragment = std::move(result);
    return Status::OK();
}

} // namespace shale
