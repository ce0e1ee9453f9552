#include <shale/deletion.h>
#include <shale/logging.h>
#include <shale/object_store.h>
#include <shale/util.h>

#include <arrow/api.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>

#include <cstring>

namespace shale {

SHALE_LOG_TAG(Deletion);

namespace {

Status WriteArrowDeletions(const FragmentBitmap& deleted, std::string* data) {
    arrow::UInt32Builder builder;
    auto append_status = builder.Reserve(static_cast<int64_t>(deleted.cardinality()));
    if (!append_status.ok()) {
        return Status::IOError("Failed to reserve deletion array: " + append_status.ToString());
    }
    for (uint32_t offset : deleted) {
        builder.UnsafeAppend(offset);
    }
    std::shared_ptr<arrow::Array> array;
    auto finish_status = builder.Finish(&array);
    if (!finish_status.ok()) {
        return Status::IOError("Failed to build deletion array: " + finish_status.ToString());
    }

    auto schema = arrow::schema({arrow::field(kDeletionRowIdColumn, arrow::uint32(), false)});
    auto batch = arrow::RecordBatch::Make(schema, array->length(), {array});

    auto output_stream = arrow::io::BufferOutputStream::Create();
    if (!output_stream.ok()) {
        return Status::IOError("Failed to create output stream: " + output_stream.status().ToString());
    }

    auto writer_result = arrow::ipc::MakeFileWriter(output_stream.ValueOrDie(), schema);
    if (!writer_result.ok()) {
        return Status::IOError("Failed to create IPC writer: " + writer_result.status().ToString());
    }
    auto writer = writer_result.ValueOrDie();

    auto write_status = writer->WriteRecordBatch(*batch);
    if (!write_status.ok()) {
        return Status::IOError("Failed to write deletion batch: " + write_status.ToString());
    }
    auto close_status = writer->Close();
    if (!close_status.ok()) {
        return Status::IOError("Failed to close writer: " + close_status.ToString());
    }

    auto finish_result = output_stream.ValueOrDie()->Finish();
    if (!finish_result.ok()) {
        return Status::IOError("Failed to finish stream: " + finish_result.status().ToString());
    }
    auto buffer = finish_result.ValueOrDie();
    data->assign(reinterpret_cast<const char*>(buffer->data()), buffer->size());
    return Status::OK();
}

Status ReadArrowDeletions(const std::string& data, FragmentBitmap* deleted) {
    // Copy so the buffer outlives the caller's string.
    auto buffer_result = arrow::AllocateBuffer(static_cast<int64_t>(data.size()));
    if (!buffer_result.ok()) {
        return Status::IOError("Failed to allocate buffer: " + buffer_result.status().ToString());
    }
    std::shared_ptr<arrow::Buffer> buffer = std::move(buffer_result).ValueOrDie();
    std::memcpy(buffer->mutable_data(), data.data(), data.size());
    auto input = std::make_shared<arrow::io::BufferReader>(buffer);

    auto reader_result = arrow::ipc::RecordBatchFileReader::Open(input);
    if (!reader_result.ok()) {
        return Status::Corruption("Unreadable deletion file: " + reader_result.status().ToString());
    }
    auto reader = reader_result.ValueOrDie();

    FragmentBitmap result;
    for (int i = 0; i < reader->num_record_batches(); ++i) {
        auto batch_result = reader->ReadRecordBatch(i);
        if (!batch_result.ok()) {
            return Status::Corruption("Unreadable deletion batch: " +
                                      batch_result.status().ToString());
        }
        auto batch = batch_result.ValueOrDie();
        auto column = batch->GetColumnByName(kDeletionRowIdColumn);
        if (!column || column->type_id() != arrow::Type::UINT32) {
            return Status::Corruption("Deletion file lacks a uint32 row_id column");
        }
        auto offsets = std::static_pointer_cast<arrow::UInt32Array>(column);
        for (int64_t j = 0; j < offsets->length(); ++j) {
            if (offsets->IsValid(j)) {
                result.add(offsets->Value(j));
            }
        }
    }
    *deleted = std::move(result);
    return Status::OK();
}

} // namespace

std::string DeletionFilePath(uint64_t fragment_id, const DeletionFile& file) {
    return "_deletions/" + std::to_string(fragment_id) + "-" + std::to_string(file.read_version) +
           "-" + std::to_string(file.id) + "." + file.Extension();
}

DeletionFileType ChooseDeletionFileType(uint64_t num_deleted, uint64_t physical_rows,
                                        double bitmap_ratio) {
    if (physical_rows == 0) {
        return DeletionFileType::kArrowArray;
    }
    double ratio = static_cast<double>(num_deleted) / static_cast<double>(physical_rows);
    return ratio < bitmap_ratio ? DeletionFileType::kArrowArray : DeletionFileType::kBitmap;
}

Status RecordDeletions(ObjectStore* store, const std::string& root, const Fragment& fragment,
                       const std::vector<uint32_t>& offsets, uint64_t read_version,
                       double bitmap_ratio, DeletionFile* deletion_file) {
    if (!store) {
        return Status::InvalidArgument("Null object store");
    }

    FragmentBitmap deleted;
    auto status = ReadFragmentDeletions(store, root, fragment, &deleted);
    if (!status.ok()) {
        return status;
    }

    for (uint32_t offset : offsets) {
        if (offset >= fragment.physical_rows) {
            return Status::InvalidArgument("Row offset " + std::to_string(offset) +
                                           " out of range for fragment " +
                                           std::to_string(fragment.id) + " with " +
                                           std::to_string(fragment.physical_rows) + " rows");
        }
        deleted.add(offset);
    }

    DeletionFile file;
    file.num_deleted_rows = deleted.cardinality();
    if (file.num_deleted_rows > fragment.physical_rows) {
        return Status::InvariantViolation("Deleted rows exceed physical rows in fragment " +
                                          std::to_string(fragment.id));
    }
    file.read_version = read_version;
    file.id = RandomU64();
    file.type = ChooseDeletionFileType(file.num_deleted_rows, fragment.physical_rows, bitmap_ratio);

    std::string data;
    if (file.type == DeletionFileType::kArrowArray) {
        status = WriteArrowDeletions(deleted, &data);
        if (!status.ok()) {
            return status;
        }
    } else {
        data = SerializeBitmap(deleted);
    }

    std::string path = DeletionFilePath(fragment.id, file);
    status = store->Put(JoinPath(root, path), data);
    if (!status.ok()) {
        return status;
    }

    SHALE_LOG_DEBUG(Deletion) << "Fragment " << fragment.id << ": " << file.num_deleted_rows
                              << " of " << fragment.physical_rows << " rows deleted, wrote "
                              << path;
    *deletion_file = file;
    return Status::OK();
}

Status ReadDeletionVector(ObjectStore* store, const std::string& root, uint64_t fragment_id,
                          const DeletionFile& file, FragmentBitmap* deleted) {
    std::string data;
    auto status = store->Get(JoinPath(root, DeletionFilePath(fragment_id, file)), &data);
    if (!status.ok()) {
        return status;
    }

    FragmentBitmap result;
    if (file.type == DeletionFileType::kBitmap) {
        status = DeserializeBitmap(data, &result);
    } else {
        status = ReadArrowDeletions(data, &result);
    }
    if (!status.ok()) {
        return status;
    }
    if (result.cardinality() != file.num_deleted_rows) {
        return Status::Corruption("Deletion file for fragment " + std::to_string(fragment_id) +
                                  " holds " + std::to_string(result.cardinality()) +
                                  " offsets, expected " + std::to_string(file.num_deleted_rows));
    }
    *deleted = std::move(result);
    return Status::OK();
}

Status ReadFragmentDeletions(ObjectStore* store, const std::string& root,
                             const Fragment& fragment, FragmentBitmap* deleted) {
    if (!fragment.deletion_file) {
        *deleted = FragmentBitmap();
        return Status::OK();
    }
    return ReadDeletionVector(store, root, fragment.id, *fragment.deletion_file, deleted);
}

} // namespace shale
