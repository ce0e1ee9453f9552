#include <shale/dataset.h>
#include <shale/deletion.h>
#include <shale/logging.h>
#include <shale/object_store.h>
#include <shale/util.h>

#include <nlohmann/json.hpp>

namespace shale {

SHALE_LOG_TAG(Dataset);

Status MakeFragment(const Schema& schema, const FragmentSource& source, const WriteParams& params,
                    Fragment* fragment) {
    DataFile file;
    auto status = DataFile::Create(source.path, schema, params.file_major_version,
                                   params.file_minor_version, &file);
    if (!status.ok()) {
        return status;
    }
    file.file_size_bytes = source.file_size_bytes;

    Fragment result;
    result.files.push_back(std::move(file));
    result.physical_rows = source.physical_rows;
    *fragment = std::move(result);
    return Status::OK();
}

Dataset::Dataset(VersionChain chain, std::unique_ptr<TransactionEngine> engine, Manifest manifest,
                 DatasetOptions options, std::shared_ptr<CommitLock> lock)
    : chain_(std::move(chain)),
      engine_(std::move(engine)),
      manifest_(std::move(manifest)),
      base_options_(options),
      options_(DatasetOptions::FromConfig(manifest_.config, std::move(options))),
      lock_(std::move(lock)) {
    engine_->set_write_params(options_.write);
}

Status Dataset::Create(std::shared_ptr<ObjectStore> store, const std::string& root, Schema schema,
                       const std::vector<FragmentSource>& sources, const DatasetOptions& options,
                       std::shared_ptr<CommitLock> lock, std::unique_ptr<Dataset>* dataset) {
    if (!store) {
        return Status::InvalidArgument("Null object store");
    }
    VersionChain chain(store, root);
    uint64_t head = 0;
    auto status = chain.HeadVersion(&head);
    if (status.ok()) {
        return Status::AlreadyExists("Dataset at " + root + " already has version " +
                                     std::to_string(head));
    }
    if (!status.IsNotFound()) {
        return status;
    }

    AssignFieldIds(&schema, -1);

    std::unique_ptr<CommitHandler> handler;
    status = CreateCommitHandler(*store, lock, &handler);
    if (!status.ok()) {
        return status;
    }
    auto engine = std::make_unique<TransactionEngine>(chain, std::move(handler), options.write);

    OverwriteOp op;
    for (const auto& source : sources) {
        Fragment fragment;
        status = MakeFragment(schema, source, options.write, &fragment);
        if (!status.ok()) {
            return status;
        }
        op.fragments.push_back(std::move(fragment));
    }
    op.schema = std::move(schema);
    op.enable_stable_row_ids = options.write.enable_stable_row_ids;

    CommitResult result;
    status = engine->Propose(0, std::move(op), options.commit, &result);
    if (!status.ok()) {
        return status;
    }
    SHALE_LOG_INFO(Dataset) << "Created dataset at " << root << " with "
                            << result.manifest.fragments.size() << " fragments";
    dataset->reset(new Dataset(std::move(chain), std::move(engine), std::move(result.manifest),
                               options, std::move(lock)));
    return Status::OK();
}

Status Dataset::Open(std::shared_ptr<ObjectStore> store, const std::string& root,
                     const VersionRef& ref, const DatasetOptions& options,
                     std::shared_ptr<CommitLock> lock, std::unique_ptr<Dataset>* dataset) {
    if (!store) {
        return Status::InvalidArgument("Null object store");
    }
    VersionChain chain(store, root);
    Manifest manifest;
    auto status = chain.Load(ref, &manifest);
    if (!status.ok()) {
        return status;
    }

    std::unique_ptr<CommitHandler> handler;
    status = CreateCommitHandler(*store, lock, &handler);
    if (!status.ok()) {
        return status;
    }
    auto engine = std::make_unique<TransactionEngine>(chain, std::move(handler), options.write);
    dataset->reset(new Dataset(std::move(chain), std::move(engine), std::move(manifest), options,
                               std::move(lock)));
    return Status::OK();
}

Status Dataset::Checkout(const VersionRef& ref, std::unique_ptr<Dataset>* dataset) const {
    return Open(chain_.shared_store(), chain_.root(), ref, base_options_, lock_, dataset);
}

Status Dataset::Refresh() {
    Manifest latest;
    auto status = chain_.LoadLatest(&latest);
    if (!status.ok()) {
        return status;
    }
    manifest_ = std::move(latest);
    options_ = DatasetOptions::FromConfig(manifest_.config, base_options_);
    engine_->set_write_params(options_.write);
    return Status::OK();
}

Status Dataset::Commit(Operation operation, CommitResult* result) {
    CommitResult local;
    CommitResult* out = result ? result : &local;
    auto status = engine_->Propose(manifest_.version, std::move(operation), options_.commit, out);
    if (!status.ok()) {
        return status;
    }
    manifest_ = out->manifest;
    options_ = DatasetOptions::FromConfig(manifest_.config, base_options_);
    engine_->set_write_params(options_.write);
    return Status::OK();
}

Status Dataset::Append(const std::vector<FragmentSource>& sources, CommitResult* result) {
    AppendOp op;
    for (const auto& source : sources) {
        Fragment fragment;
        auto status = MakeFragment(manifest_.schema, source, options_.write, &fragment);
        if (!status.ok()) {
            return status;
        }
        op.fragments.push_back(std::move(fragment));
    }
    return Commit(std::move(op), result);
}

Status Dataset::Overwrite(Schema schema, const std::vector<FragmentSource>& sources,
                          CommitResult* result) {
    AssignFieldIds(&schema, manifest_.MaxFieldId());

    OverwriteOp op;
    for (const auto& source : sources) {
        Fragment fragment;
        auto status = MakeFragment(schema, source, options_.write, &fragment);
        if (!status.ok()) {
            return status;
        }
        op.fragments.push_back(std::move(fragment));
    }
    op.schema = std::move(schema);
    return Commit(std::move(op), result);
}

Status Dataset::DeleteRows(const std::map<uint64_t, std::vector<uint32_t>>& offsets_by_fragment,
                           const std::string& predicate, CommitResult* result) {
    DeleteOp op;
    op.predicate = predicate;
    for (const auto& [fragment_id, offsets] : offsets_by_fragment) {
        const Fragment* fragment = manifest_.FragmentById(fragment_id);
        if (!fragment) {
            return Status::NotFound("Fragment " + std::to_string(fragment_id) + " not in version " +
                                    std::to_string(manifest_.version));
        }
        if (offsets.empty()) continue;

        DeletionFile file;
        auto status = RecordDeletions(chain_.store(), chain_.root(), *fragment, offsets,
                                      manifest_.version, options_.write.deletion_bitmap_ratio, &file);
        if (!status.ok()) {
            return status;
        }
        if (file.num_deleted_rows == fragment->physical_rows) {
            op.deleted_fragment_ids.push_back(fragment_id);
            status = chain_.store()->Delete(JoinPath(chain_.root(), DeletionFilePath(fragment_id, file)));
            if (!status.ok() && !status.IsNotFound()) {
                return status;
            }
            continue;
        }
        Fragment updated = *fragment;
        updated.deletion_file = file;
        op.updated_fragments.push_back(std::move(updated));
    }
    if (op.updated_fragments.empty() && op.deleted_fragment_ids.empty()) {
        return Status::InvalidArgument("Nothing to delete");
    }
    return Commit(std::move(op), result);
}

Status Dataset::Compact(const std::vector<CompactionGroup>& groups, CommitResult* result) {
    bool stable = manifest_.UsesStableRowIds();
    RewriteOp op;
    for (const auto& group : groups) {
        RewriteGroup rewrite;
        for (uint64_t id : group.old_fragment_ids) {
            const Fragment* fragment = manifest_.FragmentById(id);
            if (!fragment) {
                return Status::NotFound("Fragment " + std::to_string(id) + " not in version " +
                                        std::to_string(manifest_.version));
            }
            rewrite.old_fragments.push_back(*fragment);
        }
        if (rewrite.old_fragments.empty()) {
            return Status::InvalidArgument("Compaction group without fragments");
        }

        std::vector<uint64_t> rows;
        for (const auto& source : group.new_files) {
            rows.push_back(source.physical_rows);
        }
        RewritePlan plan;
        auto status = PlanRewrite(chain_.store(), chain_.root(), rewrite.old_fragments, rows,
                                  stable, &plan);
        if (!status.ok()) {
            return status;
        }

        for (size_t i = 0; i < group.new_files.size(); ++i) {
            Fragment fragment;
            status = MakeFragment(manifest_.schema, group.new_files[i], options_.write, &fragment);
            if (!status.ok()) {
                return status;
            }
            if (stable) {
                RowIdMeta meta;
                status = MakeRowIdMeta(chain_.store(), chain_.root(), rewrite.old_fragments.front().id,
                                       plan.new_row_ids[i], options_.write.row_id_inline_limit, &meta);
                if (!status.ok()) {
                    return status;
                }
                fragment.row_id_meta = std::move(meta);
            }
            rewrite.new_fragments.push_back(std::move(fragment));
        }
        op.groups.push_back(std::move(rewrite));
    }
    return Commit(std::move(op), result);
}

Status Dataset::CreateIndex(const std::string& name, const std::vector<int32_t>& field_ids,
                            IndexDetails details, std::optional<int32_t> index_version,
                            std::string* uuid) {
    IndexMetadata index;
    index.uuid = GenerateUuid();
    index.name = name;
    index.fields = field_ids;
    index.dataset_version = manifest_.version;
    for (const auto& fragment : manifest_.fragments) {
        index.fragment_bitmap.add(static_cast<uint32_t>(fragment.id));
    }
    index.details = std::move(details);
    index.index_version = index_version;
    index.created_at = NowMillis();
    std::string created = index.uuid;

    CreateIndexOp op;
    op.new_indices.push_back(std::move(index));
    auto status = Commit(std::move(op), nullptr);
    if (!status.ok()) {
        return status;
    }
    if (uuid) *uuid = created;
    return Status::OK();
}

Status Dataset::DropIndex(const std::string& name) {
    const IndexMetadata* index = manifest_.indices.FindByName(name);
    if (!index || index->IsSystemIndex()) {
        return Status::NotFound("Index " + name + " not found");
    }
    CreateIndexOp op;
    op.removed_indices.push_back(index->uuid);
    return Commit(std::move(op), nullptr);
}

std::vector<IndexDescription> Dataset::DescribeIndices(const IndexCriteria& criteria) const {
    return manifest_.indices.Describe(criteria, manifest_.fragments);
}

Status Dataset::UpdateConfig(const std::map<std::string, std::string>& upserts,
                             const std::vector<std::string>& delete_keys) {
    UpdateConfigOp op;
    op.upsert_values = upserts;
    op.delete_keys = delete_keys;
    return Commit(std::move(op), nullptr);
}

Status Dataset::UpdateSchemaMetadata(std::map<std::string, std::string> metadata, bool replace) {
    UpdateConfigOp op;
    op.schema_metadata = std::move(metadata);
    op.replace_schema_metadata = replace;
    return Commit(std::move(op), nullptr);
}

Status Dataset::CreateTag(const std::string& name, uint64_t version) {
    return chain_.CreateTag(name, version);
}

Status Dataset::DeleteTag(const std::string& name) {
    return chain_.DeleteTag(name);
}

Status Dataset::ListTags(std::vector<TagInfo>* tags) const {
    return chain_.ListTags(tags);
}

Status Dataset::ListVersions(std::vector<VersionInfo>* versions) const {
    return chain_.ListVersions(versions);
}

std::string Dataset::StatsJson() const {
    nlohmann::json json;
    json["version"] = manifest_.version;
    json["num_rows"] = manifest_.NumLiveRows();
    json["max_fragment_id"] = manifest_.max_fragment_id ? nlohmann::json(*manifest_.max_fragment_id)
                                                        : nlohmann::json(nullptr);
    json["next_row_id"] = manifest_.next_row_id;
    json["summary"] = nlohmann::json::parse(manifest_.Summary().ToJson());
    return json.dump();
}

} // namespace shale
