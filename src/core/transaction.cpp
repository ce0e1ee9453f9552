#include <shale/transaction.h>
#include <shale/deletion.h>
#include <shale/logging.h>
#include <shale/object_store.h>
#include <shale/util.h>
#include <shale/version_chain.h>
#include "shale/format/transaction.pb.h"

#include <algorithm>
#include <map>
#include <set>

namespace shale {

namespace pb = ::shale::format;

SHALE_LOG_TAG(Transaction);

namespace {

//==============================================================================
// Protobuf conversion helpers
//==============================================================================

template <typename ProtoMap>
std::map<std::string, std::string> ToStdMap(const ProtoMap& proto_map) {
    std::map<std::string, std::string> result;
    for (const auto& [key, value] : proto_map) {
        result[key] = value;
    }
    return result;
}

template <typename ProtoMap>
void FillProtoMap(const std::map<std::string, std::string>& values, ProtoMap* proto_map) {
    for (const auto& [key, value] : values) {
        (*proto_map)[key] = value;
    }
}

template <typename ProtoFragments>
Status FragmentsFromProto(const ProtoFragments& protos, std::vector<Fragment>* fragments) {
    for (const auto& proto : protos) {
        Fragment fragment;
        auto status = FragmentFromProto(proto, &fragment);
        if (!status.ok()) {
            return status;
        }
        fragments->push_back(std::move(fragment));
    }
    return Status::OK();
}

void MemWalUpdateToProto(const MemWalUpdate& update, pb::Transaction::MemWalUpdate* proto) {
    proto->mutable_id()->set_region(update.id.region);
    proto->mutable_id()->set_generation(update.id.generation);
    proto->set_expected_owner_id(update.expected_owner_id);
    MemWalToProto(update.record, proto->mutable_record());
}

Status MemWalUpdateFromProto(const pb::Transaction::MemWalUpdate& proto, MemWalUpdate* update) {
    update->id.region = proto.id().region();
    update->id.generation = proto.id().generation();
    update->expected_owner_id = proto.expected_owner_id();
    return MemWalFromProto(proto.record(), &update->record);
}

void OperationToProto(const Operation& operation, pb::Transaction* proto) {
    switch (KindOf(operation)) {
        case OperationKind::kAppend: {
            const auto& op = std::get<AppendOp>(operation);
            auto* append = proto->mutable_append();
            for (const auto& fragment : op.fragments) {
                FragmentToProto(fragment, append->add_fragments());
            }
            if (op.mem_wal_to_flush) {
                MemWalUpdateToProto(*op.mem_wal_to_flush, append->mutable_mem_wal_to_flush());
            }
            break;
        }
        case OperationKind::kDelete: {
            const auto& op = std::get<DeleteOp>(operation);
            auto* deletion = proto->mutable_deletion();
            for (const auto& fragment : op.updated_fragments) {
                FragmentToProto(fragment, deletion->add_updated_fragments());
            }
            for (uint64_t id : op.deleted_fragment_ids) {
                deletion->add_deleted_fragment_ids(id);
            }
            deletion->set_predicate(op.predicate);
            break;
        }
        case OperationKind::kOverwrite: {
            const auto& op = std::get<OverwriteOp>(operation);
            auto* overwrite = proto->mutable_overwrite();
            for (const auto& fragment : op.fragments) {
                FragmentToProto(fragment, overwrite->add_fragments());
            }
            SchemaToProto(op.schema, overwrite->mutable_schema());
            FillProtoMap(op.schema.metadata(), overwrite->mutable_schema_metadata());
            FillProtoMap(op.config_upsert_values, overwrite->mutable_config_upsert_values());
            overwrite->set_enable_stable_row_ids(op.enable_stable_row_ids);
            break;
        }
        case OperationKind::kCreateIndex: {
            const auto& op = std::get<CreateIndexOp>(operation);
            auto* create = proto->mutable_create_index();
            for (const auto& index : op.new_indices) {
                IndexMetadataToProto(index, create->add_new_indices());
            }
            for (const auto& uuid : op.removed_indices) {
                create->add_removed_indices()->set_uuid(UuidToBytes(uuid));
            }
            break;
        }
        case OperationKind::kRewrite: {
            const auto& op = std::get<RewriteOp>(operation);
            auto* rewrite = proto->mutable_rewrite();
            for (const auto& group : op.groups) {
                auto* group_proto = rewrite->add_groups();
                for (const auto& fragment : group.old_fragments) {
                    FragmentToProto(fragment, group_proto->add_old_fragments());
                }
                for (const auto& fragment : group.new_fragments) {
                    FragmentToProto(fragment, group_proto->add_new_fragments());
                }
            }
            break;
        }
        case OperationKind::kUpdateConfig: {
            const auto& op = std::get<UpdateConfigOp>(operation);
            auto* update = proto->mutable_update_config();
            FillProtoMap(op.upsert_values, update->mutable_upsert_values());
            for (const auto& key : op.delete_keys) {
                update->add_delete_keys(key);
            }
            if (op.schema_metadata) {
                FillProtoMap(*op.schema_metadata, update->mutable_schema_metadata());
            }
            update->set_replace_schema_metadata(op.replace_schema_metadata);
            break;
        }
        case OperationKind::kUpdateMemWalState: {
            const auto& op = std::get<UpdateMemWalStateOp>(operation);
            auto* update = proto->mutable_update_mem_wal_state();
            for (const auto& mem_wal : op.added) {
                MemWalToProto(mem_wal, update->add_added());
            }
            for (const auto& entry : op.updated) {
                MemWalUpdateToProto(entry, update->add_updated());
            }
            for (const auto& entry : op.removed) {
                MemWalUpdateToProto(entry, update->add_removed());
            }
            break;
        }
    }
}

Status OperationFromProto(const pb::Transaction& proto, Operation* operation) {
    Status status;
    switch (proto.operation_case()) {
        case pb::Transaction::kAppend: {
            AppendOp op;
            status = FragmentsFromProto(proto.append().fragments(), &op.fragments);
            if (!status.ok()) return status;
            if (proto.append().has_mem_wal_to_flush()) {
                MemWalUpdate update;
                status = MemWalUpdateFromProto(proto.append().mem_wal_to_flush(), &update);
                if (!status.ok()) return status;
                op.mem_wal_to_flush = std::move(update);
            }
            *operation = std::move(op);
            return Status::OK();
        }
        case pb::Transaction::kDeletion: {
            DeleteOp op;
            status = FragmentsFromProto(proto.deletion().updated_fragments(), &op.updated_fragments);
            if (!status.ok()) return status;
            op.deleted_fragment_ids.assign(proto.deletion().deleted_fragment_ids().begin(),
                                           proto.deletion().deleted_fragment_ids().end());
            op.predicate = proto.deletion().predicate();
            *operation = std::move(op);
            return Status::OK();
        }
        case pb::Transaction::kOverwrite: {
            OverwriteOp op;
            const auto& overwrite = proto.overwrite();
            status = FragmentsFromProto(overwrite.fragments(), &op.fragments);
            if (!status.ok()) return status;
            status = SchemaFromProto(overwrite.schema(), ToStdMap(overwrite.schema_metadata()), &op.schema);
            if (!status.ok()) return status;
            op.config_upsert_values = ToStdMap(overwrite.config_upsert_values());
            op.enable_stable_row_ids = overwrite.enable_stable_row_ids();
            *operation = std::move(op);
            return Status::OK();
        }
        case pb::Transaction::kCreateIndex: {
            CreateIndexOp op;
            for (const auto& index_proto : proto.create_index().new_indices()) {
                IndexMetadata index;
                status = IndexMetadataFromProto(index_proto, &index);
                if (!status.ok()) return status;
                op.new_indices.push_back(std::move(index));
            }
            for (const auto& uuid : proto.create_index().removed_indices()) {
                op.removed_indices.push_back(UuidFromBytes(uuid.uuid()));
            }
            *operation = std::move(op);
            return Status::OK();
        }
        case pb::Transaction::kRewrite: {
            RewriteOp op;
            for (const auto& group_proto : proto.rewrite().groups()) {
                RewriteGroup group;
                status = FragmentsFromProto(group_proto.old_fragments(), &group.old_fragments);
                if (!status.ok()) return status;
                status = FragmentsFromProto(group_proto.new_fragments(), &group.new_fragments);
                if (!status.ok()) return status;
                op.groups.push_back(std::move(group));
            }
            *operation = std::move(op);
            return Status::OK();
        }
        case pb::Transaction::kUpdateConfig: {
            UpdateConfigOp op;
            const auto& update = proto.update_config();
            op.upsert_values = ToStdMap(update.upsert_values());
            op.delete_keys.assign(update.delete_keys().begin(), update.delete_keys().end());
            if (update.schema_metadata_size() > 0 || update.replace_schema_metadata()) {
                op.schema_metadata = ToStdMap(update.schema_metadata());
            }
            op.replace_schema_metadata = update.replace_schema_metadata();
            *operation = std::move(op);
            return Status::OK();
        }
        case pb::Transaction::kUpdateMemWalState: {
            UpdateMemWalStateOp op;
            const auto& update = proto.update_mem_wal_state();
            for (const auto& record : update.added()) {
                MemWal mem_wal;
                status = MemWalFromProto(record, &mem_wal);
                if (!status.ok()) return status;
                op.added.push_back(std::move(mem_wal));
            }
            for (const auto& entry : update.updated()) {
                MemWalUpdate parsed;
                status = MemWalUpdateFromProto(entry, &parsed);
                if (!status.ok()) return status;
                op.updated.push_back(std::move(parsed));
            }
            for (const auto& entry : update.removed()) {
                MemWalUpdate parsed;
                status = MemWalUpdateFromProto(entry, &parsed);
                if (!status.ok()) return status;
                op.removed.push_back(std::move(parsed));
            }
            *operation = std::move(op);
            return Status::OK();
        }
        case pb::Transaction::OPERATION_NOT_SET:
            break;
    }
    return Status::Corruption("Transaction " + proto.uuid() + " has no operation");
}

//==============================================================================
// Conflict helpers
//==============================================================================

std::set<uint64_t> TouchedByDelete(const DeleteOp& op) {
    std::set<uint64_t> ids(op.deleted_fragment_ids.begin(), op.deleted_fragment_ids.end());
    for (const auto& fragment : op.updated_fragments) {
        ids.insert(fragment.id);
    }
    return ids;
}

std::set<uint64_t> RewrittenIds(const RewriteOp& op) {
    std::set<uint64_t> ids;
    for (const auto& group : op.groups) {
        for (const auto& fragment : group.old_fragments) {
            ids.insert(fragment.id);
        }
    }
    return ids;
}

bool Intersects(const std::set<uint64_t>& a, const std::set<uint64_t>& b) {
    for (uint64_t id : a) {
        if (b.count(id)) return true;
    }
    return false;
}

std::set<std::string> MemWalRegions(const UpdateMemWalStateOp& op) {
    std::set<std::string> regions;
    for (const auto& mem_wal : op.added) regions.insert(mem_wal.id.region);
    for (const auto& update : op.updated) regions.insert(update.id.region);
    for (const auto& update : op.removed) regions.insert(update.id.region);
    return regions;
}

std::set<std::string> ConfigKeys(const UpdateConfigOp& op) {
    std::set<std::string> keys(op.delete_keys.begin(), op.delete_keys.end());
    for (const auto& [key, value] : op.upsert_values) {
        keys.insert(key);
    }
    return keys;
}

ConflictVerdict Verdict(bool conflict) {
    return conflict ? ConflictVerdict::kConflict : ConflictVerdict::kCompatible;
}

// a's kind <= b's kind
ConflictVerdict CheckOrdered(const Operation& a, const Operation& b) {
    OperationKind kind_a = KindOf(a);
    OperationKind kind_b = KindOf(b);

    if (kind_a == OperationKind::kOverwrite || kind_b == OperationKind::kOverwrite) {
        return ConflictVerdict::kConflict;
    }

    switch (kind_a) {
        case OperationKind::kAppend: {
            const auto& append = std::get<AppendOp>(a);
            if (!append.mem_wal_to_flush) {
                return ConflictVerdict::kCompatible;
            }
            const std::string& region = append.mem_wal_to_flush->id.region;
            if (kind_b == OperationKind::kAppend) {
                const auto& other = std::get<AppendOp>(b);
                return Verdict(other.mem_wal_to_flush && other.mem_wal_to_flush->id.region == region);
            }
            if (kind_b == OperationKind::kUpdateMemWalState) {
                return Verdict(MemWalRegions(std::get<UpdateMemWalStateOp>(b)).count(region) > 0);
            }
            return ConflictVerdict::kCompatible;
        }
        case OperationKind::kDelete: {
            const auto& deletion = std::get<DeleteOp>(a);
            if (kind_b == OperationKind::kDelete) {
                return Verdict(Intersects(TouchedByDelete(deletion),
                                          TouchedByDelete(std::get<DeleteOp>(b))));
            }
            if (kind_b == OperationKind::kRewrite) {
                return Verdict(Intersects(TouchedByDelete(deletion),
                                          RewrittenIds(std::get<RewriteOp>(b))));
            }
            return ConflictVerdict::kCompatible;
        }
        case OperationKind::kCreateIndex: {
            const auto& create = std::get<CreateIndexOp>(a);
            if (kind_b == OperationKind::kCreateIndex) {
                const auto& other = std::get<CreateIndexOp>(b);
                for (const auto& index : create.new_indices) {
                    for (const auto& other_index : other.new_indices) {
                        if (index.name == other_index.name) return ConflictVerdict::kConflict;
                    }
                }
                for (const auto& uuid : create.removed_indices) {
                    if (std::find(other.removed_indices.begin(), other.removed_indices.end(),
                                  uuid) != other.removed_indices.end()) {
                        return ConflictVerdict::kConflict;
                    }
                }
                return ConflictVerdict::kCompatible;
            }
            if (kind_b == OperationKind::kRewrite) {
                auto rewritten = RewrittenIds(std::get<RewriteOp>(b));
                for (const auto& index : create.new_indices) {
                    for (uint64_t id : rewritten) {
                        if (index.fragment_bitmap.contains(static_cast<uint32_t>(id))) {
                            return ConflictVerdict::kConflict;
                        }
                    }
                }
            }
            return ConflictVerdict::kCompatible;
        }
        case OperationKind::kRewrite: {
            if (kind_b == OperationKind::kRewrite) {
                return Verdict(Intersects(RewrittenIds(std::get<RewriteOp>(a)),
                                          RewrittenIds(std::get<RewriteOp>(b))));
            }
            return ConflictVerdict::kCompatible;
        }
        case OperationKind::kUpdateConfig: {
            if (kind_b == OperationKind::kUpdateConfig) {
                const auto& config_a = std::get<UpdateConfigOp>(a);
                const auto& config_b = std::get<UpdateConfigOp>(b);
                if (config_a.schema_metadata && config_b.schema_metadata) {
                    return ConflictVerdict::kConflict;
                }
                auto keys_a = ConfigKeys(config_a);
                for (const auto& key : ConfigKeys(config_b)) {
                    if (keys_a.count(key)) return ConflictVerdict::kConflict;
                }
            }
            return ConflictVerdict::kCompatible;
        }
        case OperationKind::kUpdateMemWalState: {
            // b is also UpdateMemWalState here.
            auto regions = MemWalRegions(std::get<UpdateMemWalStateOp>(a));
            for (const auto& region : MemWalRegions(std::get<UpdateMemWalStateOp>(b))) {
                if (regions.count(region)) return ConflictVerdict::kConflict;
            }
            return ConflictVerdict::kCompatible;
        }
        case OperationKind::kOverwrite:
            break;
    }
    return ConflictVerdict::kConflict;
}

//==============================================================================
// Build state
//==============================================================================

struct BuildState {
    const BuildOptions& options;
    uint64_t new_version;
    bool stable_row_ids;
    FragmentIdAllocator fragment_ids;
    RowIdAllocator row_ids;
};

Status CheckFieldsInSchema(const Schema& schema, const Fragment& fragment) {
    for (const auto& file : fragment.files) {
        for (int32_t id : file.fields) {
            if (id < 0) continue;
            if (!schema.FieldById(id)) {
                return Status::InvalidArgument("Data file " + file.path + " stores field id " +
                                               std::to_string(id) + " missing from the schema");
            }
        }
    }
    return Status::OK();
}

// Gives a new fragment its id and, under stable row ids, fresh row ids.
Status PrepareNewFragment(Fragment* fragment, BuildState* state, bool allocate_row_ids) {
    fragment->id = state->fragment_ids.Allocate();
    if (fragment->files.empty()) {
        return Status::InvalidArgument("New fragment has no data files");
    }
    if (!state->stable_row_ids) {
        return Status::OK();
    }
    if (!allocate_row_ids) {
        if (!fragment->row_id_meta) {
            return Status::InvalidArgument("Rewritten fragment lacks row ids under stable row ids");
        }
        return Status::OK();
    }
    RowIdRange range = state->row_ids.Allocate(fragment->physical_rows);
    RowIdMeta meta;
    auto status = MakeRowIdMeta(state->options.store, state->options.root, fragment->id,
                                RowIdSequence::FromRange(range.start, range.end),
                                state->options.row_id_inline_limit, &meta);
    if (!status.ok()) {
        return status;
    }
    fragment->row_id_meta = std::move(meta);
    return Status::OK();
}

Status ReadDeletions(const BuildOptions& options, const Fragment& fragment, FragmentBitmap* deleted) {
    if (fragment.deletion_file && !options.store) {
        return Status::InvalidArgument("Reading deletions of fragment " + std::to_string(fragment.id) +
                                       " needs an object store");
    }
    return ReadFragmentDeletions(options.store, options.root, fragment, deleted);
}

Status ApplyMemWalUpdate(const MemWalUpdate& update, uint64_t new_version, MemWalDetails* details) {
    MemWal* existing = details->Find(update.id);
    if (!existing) {
        return Status::NotFound("MemWAL " + update.id.region + "/" +
                                std::to_string(update.id.generation) + " does not exist");
    }
    if (existing->owner_id != update.expected_owner_id) {
        return Status::InvariantViolation("MemWAL " + update.id.region + "/" +
                                          std::to_string(update.id.generation) + " is owned by " +
                                          existing->owner_id + ", not " + update.expected_owner_id);
    }
    if (!(update.record.id == update.id)) {
        return Status::InvalidArgument("MemWAL update changes the record id");
    }
    if (existing->state == MemWalState::kFlushed) {
        return Status::InvariantViolation("MemWAL " + update.id.region + "/" +
                                          std::to_string(update.id.generation) + " is already FLUSHED");
    }
    if (static_cast<int>(update.record.state) < static_cast<int>(existing->state)) {
        return Status::InvariantViolation(std::string("MemWAL state cannot move from ") +
                                          MemWalStateName(existing->state) + " to " +
                                          MemWalStateName(update.record.state));
    }
    if (!existing->wal_location.empty() && update.record.wal_location != existing->wal_location) {
        return Status::InvariantViolation("MemWAL wal_location is immutable");
    }
    *existing = update.record;
    existing->last_updated_dataset_version = new_version;
    return Status::OK();
}

// Every region that still has unflushed generations has exactly one OPEN one.
Status CheckOpenGenerations(const MemWalDetails& details) {
    std::map<std::string, size_t> open_count;
    for (const auto& mem_wal : details.mem_wal_list) {
        if (mem_wal.state == MemWalState::kFlushed) continue;
        size_t& count = open_count[mem_wal.id.region];
        if (mem_wal.state == MemWalState::kOpen) ++count;
    }
    for (const auto& [region, count] : open_count) {
        if (count > 1) {
            return Status::InvariantViolation("Region " + region +
                                              " would have two OPEN MemWAL generations");
        }
        if (count == 0) {
            return Status::InvariantViolation("Region " + region +
                                              " would have no OPEN MemWAL generation");
        }
    }
    return Status::OK();
}

//==============================================================================
// Operations
//==============================================================================

Status ApplyAppend(const AppendOp& op, const Manifest& base, BuildState* state, Manifest* next) {
    if (op.fragments.empty() && !op.mem_wal_to_flush) {
        return Status::InvalidArgument("Append without fragments");
    }
    for (const auto& input : op.fragments) {
        Fragment fragment = input;
        auto status = CheckFieldsInSchema(base.schema, fragment);
        if (!status.ok()) return status;
        status = PrepareNewFragment(&fragment, state, true);
        if (!status.ok()) return status;
        next->fragments.push_back(std::move(fragment));
    }

    if (op.mem_wal_to_flush) {
        const MemWalUpdate& flush = *op.mem_wal_to_flush;
        MemWalDetails* details = next->indices.MutableMemWals(state->new_version);
        const MemWal* existing = details->Find(flush.id);
        if (existing && existing->state != MemWalState::kSealed) {
            return Status::InvariantViolation(std::string("Only a SEALED MemWAL can be flushed, ") +
                                              flush.id.region + " is " + MemWalStateName(existing->state));
        }
        MemWalUpdate update = flush;
        update.record.state = MemWalState::kFlushed;
        auto status = ApplyMemWalUpdate(update, state->new_version, details);
        if (!status.ok()) return status;
        status = CheckOpenGenerations(*details);
        if (!status.ok()) return status;
    }
    return Status::OK();
}

Status ApplyDelete(const DeleteOp& op, const Manifest& base, BuildState*, Manifest* next) {
    std::set<uint64_t> removed(op.deleted_fragment_ids.begin(), op.deleted_fragment_ids.end());
    for (uint64_t id : removed) {
        if (!base.FragmentById(id)) {
            return Status::WriteConflict("Fragment " + std::to_string(id) + " no longer exists");
        }
    }

    std::map<uint64_t, const Fragment*> updated;
    for (const auto& fragment : op.updated_fragments) {
        if (!base.FragmentById(fragment.id)) {
            return Status::WriteConflict("Fragment " + std::to_string(fragment.id) + " no longer exists");
        }
        if (removed.count(fragment.id)) {
            return Status::InvalidArgument("Fragment " + std::to_string(fragment.id) +
                                           " is both updated and removed");
        }
        updated[fragment.id] = &fragment;
    }

    std::vector<Fragment> fragments;
    FragmentBitmap removed_bitmap;
    for (const auto& fragment : base.fragments) {
        if (removed.count(fragment.id)) {
            removed_bitmap.add(static_cast<uint32_t>(fragment.id));
            continue;
        }
        Fragment copy = fragment;
        auto it = updated.find(fragment.id);
        if (it != updated.end()) {
            copy.deletion_file = it->second->deletion_file;
            if (copy.NumDeletedRows() > copy.physical_rows) {
                return Status::InvariantViolation("Deletion file of fragment " +
                                                  std::to_string(copy.id) +
                                                  " exceeds its physical rows");
            }
        }
        fragments.push_back(std::move(copy));
    }
    next->fragments = std::move(fragments);
    next->indices.PruneFragments(removed_bitmap);
    return Status::OK();
}

Status ApplyOverwrite(const OverwriteOp& op, const Manifest& base, BuildState* state, Manifest* next) {
    int32_t base_max_field = base.MaxFieldId();
    for (const Field* field : op.schema.AllFields()) {
        if (field->id < 0) {
            return Status::InvalidArgument("Overwrite schema field " + field->name + " has no id");
        }
        if (!base.schema.FieldById(field->id) && field->id <= base_max_field) {
            return Status::InvariantViolation("Field id " + std::to_string(field->id) +
                                              " reuses an id below the dataset maximum " +
                                              std::to_string(base_max_field));
        }
    }
    auto status = op.schema.Validate();
    if (!status.ok()) return status;

    Manifest fresh;
    fresh.schema = op.schema;
    fresh.config = base.config;
    fresh.UpdateConfig(op.config_upsert_values);
    if (base.version > 0) {
        fresh.data_storage_format = base.data_storage_format;
        fresh.writer_feature_flags = base.writer_feature_flags & kFlagStableRowIds;
    }
    *next = std::move(fresh);

    for (const auto& input : op.fragments) {
        Fragment fragment = input;
        status = CheckFieldsInSchema(next->schema, fragment);
        if (!status.ok()) return status;
        status = PrepareNewFragment(&fragment, state, true);
        if (!status.ok()) return status;
        next->fragments.push_back(std::move(fragment));
    }
    return Status::OK();
}

Status ApplyCreateIndex(const CreateIndexOp& op, const Manifest& base, BuildState*, Manifest* next) {
    for (const auto& uuid : op.removed_indices) {
        auto status = next->indices.Remove(uuid);
        if (status.IsNotFound()) {
            return Status::WriteConflict("Index " + uuid + " was removed concurrently");
        }
        if (!status.ok()) return status;
    }

    FragmentBitmap live;
    for (const auto& fragment : base.fragments) {
        live.add(static_cast<uint32_t>(fragment.id));
    }

    for (const auto& input : op.new_indices) {
        if (input.IsSystemIndex()) {
            return Status::InvalidArgument("Index name " + input.name + " is reserved");
        }
        auto status = CheckIndexCompatible(input);
        if (!status.ok()) return status;
        for (int32_t field_id : input.fields) {
            if (!base.schema.FieldById(field_id)) {
                return Status::InvalidArgument("Index " + input.name + " covers unknown field " +
                                               std::to_string(field_id));
            }
        }
        IndexMetadata index = input;
        // Coverage built against an older fragment set follows later rewrites.
        base.indices.RemapFragmentBitmap(&index.fragment_bitmap, index.dataset_version);
        index.fragment_bitmap &= live;
        status = next->indices.Register(std::move(index), nullptr);
        if (!status.ok()) return status;
    }
    return Status::OK();
}

Status ApplyRewrite(const RewriteOp& op, const Manifest& base, BuildState* state, Manifest* next) {
    std::map<uint64_t, size_t> group_of;  // old fragment id -> group
    std::vector<FragmentReuseGroup> ledger_groups;
    std::vector<std::vector<Fragment>> new_fragments(op.groups.size());

    for (size_t g = 0; g < op.groups.size(); ++g) {
        const auto& group = op.groups[g];
        if (group.old_fragments.empty()) {
            return Status::InvalidArgument("Rewrite group without old fragments");
        }

        FragmentReuseGroup ledger;
        std::vector<uint64_t> old_row_ids;
        for (const auto& old_fragment : group.old_fragments) {
            const Fragment* current = base.FragmentById(old_fragment.id);
            if (!current) {
                return Status::WriteConflict("Fragment " + std::to_string(old_fragment.id) +
                                             " no longer exists");
            }
            if (current->deletion_file != old_fragment.deletion_file) {
                return Status::WriteConflict("Fragment " + std::to_string(old_fragment.id) +
                                             " was modified concurrently");
            }
            if (!group_of.emplace(old_fragment.id, g).second) {
                return Status::InvalidArgument("Fragment " + std::to_string(old_fragment.id) +
                                               " rewritten twice");
            }

            FragmentBitmap deleted;
            auto status = ReadDeletions(state->options, *current, &deleted);
            if (!status.ok()) return status;
            for (uint64_t offset = 0; offset < current->physical_rows; ++offset) {
                if (!deleted.contains(static_cast<uint32_t>(offset))) {
                    ledger.changed_row_addrs.add(MakeRowAddress(static_cast<uint32_t>(current->id),
                                                                static_cast<uint32_t>(offset)));
                }
            }
            ledger.old_fragments.push_back(
                FragmentDigest{current->id, current->physical_rows, current->NumDeletedRows()});

            if (state->stable_row_ids) {
                RowIdSequence sequence;
                status = LoadRowIdSequence(state->options.store, state->options.root,
                                           *current->row_id_meta, &sequence, current->physical_rows);
                if (!status.ok()) return status;
                auto survivors = sequence.Filtered(deleted).ToVector();
                old_row_ids.insert(old_row_ids.end(), survivors.begin(), survivors.end());
            }
        }

        uint64_t new_rows = 0;
        std::vector<uint64_t> new_row_ids;
        for (const auto& input : group.new_fragments) {
            Fragment fragment = input;
            fragment.deletion_file.reset();
            auto status = CheckFieldsInSchema(base.schema, fragment);
            if (!status.ok()) return status;
            status = PrepareNewFragment(&fragment, state, false);
            if (!status.ok()) return status;
            new_rows += fragment.physical_rows;
            if (state->stable_row_ids) {
                RowIdSequence sequence;
                status = LoadRowIdSequence(state->options.store, state->options.root,
                                           *fragment.row_id_meta, &sequence, fragment.physical_rows);
                if (!status.ok()) return status;
                if (sequence.Length() != fragment.physical_rows) {
                    return Status::InvalidArgument("Row id count of a rewritten fragment differs from its rows");
                }
                auto ids = sequence.ToVector();
                new_row_ids.insert(new_row_ids.end(), ids.begin(), ids.end());
            }
            ledger.new_fragments.push_back(FragmentDigest{fragment.id, fragment.physical_rows, 0});
            new_fragments[g].push_back(std::move(fragment));
        }

        if (new_rows != ledger.changed_row_addrs.cardinality()) {
            return Status::InvalidArgument("Rewrite group produces " + std::to_string(new_rows) +
                                           " rows from " +
                                           std::to_string(ledger.changed_row_addrs.cardinality()) +
                                           " surviving rows");
        }
        if (state->stable_row_ids) {
            std::sort(old_row_ids.begin(), old_row_ids.end());
            std::sort(new_row_ids.begin(), new_row_ids.end());
            if (old_row_ids != new_row_ids) {
                return Status::InvariantViolation("Rewrite does not preserve the row ids of surviving rows");
            }
        }
        ledger_groups.push_back(std::move(ledger));
    }

    std::vector<Fragment> fragments;
    std::set<size_t> emitted;
    for (const auto& fragment : base.fragments) {
        auto it = group_of.find(fragment.id);
        if (it == group_of.end()) {
            fragments.push_back(fragment);
            continue;
        }
        if (emitted.insert(it->second).second) {
            for (auto& replacement : new_fragments[it->second]) {
                fragments.push_back(std::move(replacement));
            }
        }
    }
    next->fragments = std::move(fragments);
    next->indices.RecordRewrite(state->new_version, std::move(ledger_groups));
    return Status::OK();
}

Status ApplyUpdateConfig(const UpdateConfigOp& op, BuildState*, Manifest* next) {
    next->UpdateConfig(op.upsert_values);
    next->DeleteConfigKeys(op.delete_keys);
    if (op.schema_metadata) {
        if (op.replace_schema_metadata) {
            next->ReplaceSchemaMetadata(*op.schema_metadata);
        } else {
            auto metadata = next->schema.metadata();
            for (const auto& [key, value] : *op.schema_metadata) {
                metadata[key] = value;
            }
            next->ReplaceSchemaMetadata(std::move(metadata));
        }
    }
    return Status::OK();
}

Status ApplyUpdateMemWalState(const UpdateMemWalStateOp& op, BuildState* state, Manifest* next) {
    MemWalDetails* details = next->indices.MutableMemWals(state->new_version);

    std::vector<MemWalId> sealed;
    for (const auto& update : op.updated) {
        if (update.record.state == MemWalState::kFlushed) {
            return Status::InvariantViolation("MemWAL " + update.id.region + "/" +
                                              std::to_string(update.id.generation) +
                                              " can only become FLUSHED through a flush append");
        }
        const MemWal* existing = details->Find(update.id);
        bool seals = existing && existing->state == MemWalState::kOpen &&
                     update.record.state == MemWalState::kSealed;
        auto status = ApplyMemWalUpdate(update, state->new_version, details);
        if (!status.ok()) return status;
        if (seals) sealed.push_back(update.id);
    }

    for (const auto& update : op.removed) {
        const MemWal* existing = details->Find(update.id);
        if (!existing) {
            return Status::NotFound("MemWAL " + update.id.region + "/" +
                                    std::to_string(update.id.generation) + " does not exist");
        }
        if (existing->owner_id != update.expected_owner_id) {
            return Status::InvariantViolation("MemWAL " + update.id.region + " is owned by " +
                                              existing->owner_id);
        }
        if (existing->state != MemWalState::kFlushed) {
            return Status::InvariantViolation("Only FLUSHED MemWALs can be removed, " +
                                              update.id.region + " is " +
                                              MemWalStateName(existing->state));
        }
        auto& list = details->mem_wal_list;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const MemWal& m) { return m.id == update.id; }),
                   list.end());
    }

    for (const auto& input : op.added) {
        if (details->Find(input.id)) {
            return Status::AlreadyExists("MemWAL " + input.id.region + "/" +
                                         std::to_string(input.id.generation) + " already exists");
        }
        if (input.state != MemWalState::kOpen) {
            return Status::InvalidArgument("New MemWAL must be OPEN");
        }
        if (input.wal_location.empty()) {
            return Status::InvalidArgument("New MemWAL needs a wal_location");
        }
        for (const auto& mem_wal : details->mem_wal_list) {
            if (mem_wal.id.region == input.id.region && mem_wal.id.generation >= input.id.generation) {
                return Status::InvariantViolation("MemWAL generation " +
                                                  std::to_string(input.id.generation) +
                                                  " is not above existing generations of " +
                                                  input.id.region);
            }
        }
        MemWal mem_wal = input;
        mem_wal.last_updated_dataset_version = state->new_version;
        details->mem_wal_list.push_back(std::move(mem_wal));
    }

    // Sealing hands the region over to the next generation in the same commit.
    for (const auto& id : sealed) {
        MemWalId successor{id.region, id.generation + 1};
        bool opened = std::any_of(op.added.begin(), op.added.end(),
                                  [&](const MemWal& m) { return m.id == successor; });
        if (!opened) {
            return Status::InvariantViolation("Sealing " + id.region + "/" +
                                              std::to_string(id.generation) +
                                              " must open generation " +
                                              std::to_string(successor.generation));
        }
    }

    auto status = CheckOpenGenerations(*details);
    if (!status.ok()) return status;
    next->indices.DropEmptyMemWals();
    return Status::OK();
}

} // namespace

const char* OperationKindName(OperationKind kind) {
    switch (kind) {
        case OperationKind::kAppend: return "Append";
        case OperationKind::kDelete: return "Delete";
        case OperationKind::kOverwrite: return "Overwrite";
        case OperationKind::kCreateIndex: return "CreateIndex";
        case OperationKind::kRewrite: return "Rewrite";
        case OperationKind::kUpdateConfig: return "UpdateConfig";
        case OperationKind::kUpdateMemWalState: return "UpdateMemWalState";
    }
    return "Unknown";
}

OperationKind KindOf(const Operation& operation) {
    return static_cast<OperationKind>(operation.index());
}

std::string Transaction::FileName() const {
    return TransactionFileName(read_version, uuid);
}

Status SerializeTransaction(const Transaction& transaction, std::string* bytes) {
    pb::Transaction proto;
    proto.set_read_version(transaction.read_version);
    proto.set_uuid(transaction.uuid);
    proto.set_tag(transaction.tag);
    FillProtoMap(transaction.transaction_properties, proto.mutable_transaction_properties());
    OperationToProto(transaction.operation, &proto);
    if (!proto.SerializeToString(bytes)) {
        return Status::InternalError("Failed to serialize transaction " + transaction.uuid);
    }
    return Status::OK();
}

Status DeserializeTransaction(const std::string& bytes, Transaction* transaction) {
    pb::Transaction proto;
    if (!proto.ParseFromString(bytes)) {
        return Status::Corruption("Malformed transaction file");
    }
    Transaction result;
    result.read_version = proto.read_version();
    result.uuid = proto.uuid();
    result.tag = proto.tag();
    result.transaction_properties = ToStdMap(proto.transaction_properties());
    auto status = OperationFromProto(proto, &result.operation);
    if (!status.ok()) {
        return status;
    }
    *transaction = std::move(result);
    return Status::OK();
}

ConflictVerdict CheckConflict(const Operation& a, const Operation& b) {
    if (static_cast<int>(KindOf(a)) <= static_cast<int>(KindOf(b))) {
        return CheckOrdered(a, b);
    }
    return CheckOrdered(b, a);
}

Status BuildManifest(const Manifest& base, const Transaction& transaction,
                     const BuildOptions& options, Manifest* next) {
    auto status = CheckWriterFlags(base.writer_feature_flags);
    if (!status.ok()) {
        return status;
    }

    OperationKind kind = KindOf(transaction.operation);
    if (base.version == 0 && kind != OperationKind::kOverwrite) {
        return Status::InvalidArgument(std::string(OperationKindName(kind)) +
                                       " needs an existing dataset");
    }

    bool stable = base.UsesStableRowIds();
    if (kind == OperationKind::kOverwrite) {
        stable = stable || std::get<OverwriteOp>(transaction.operation).enable_stable_row_ids;
    }

    BuildState state{options, base.version + 1, stable,
                     FragmentIdAllocator(base.max_fragment_id), RowIdAllocator(base.next_row_id)};

    Manifest result = base;
    switch (kind) {
        case OperationKind::kAppend:
            status = ApplyAppend(std::get<AppendOp>(transaction.operation), base, &state, &result);
            break;
        case OperationKind::kDelete:
            status = ApplyDelete(std::get<DeleteOp>(transaction.operation), base, &state, &result);
            break;
        case OperationKind::kOverwrite:
            status = ApplyOverwrite(std::get<OverwriteOp>(transaction.operation), base, &state, &result);
            break;
        case OperationKind::kCreateIndex:
            status = ApplyCreateIndex(std::get<CreateIndexOp>(transaction.operation), base, &state, &result);
            break;
        case OperationKind::kRewrite:
            status = ApplyRewrite(std::get<RewriteOp>(transaction.operation), base, &state, &result);
            break;
        case OperationKind::kUpdateConfig:
            status = ApplyUpdateConfig(std::get<UpdateConfigOp>(transaction.operation), &state, &result);
            break;
        case OperationKind::kUpdateMemWalState:
            status = ApplyUpdateMemWalState(std::get<UpdateMemWalStateOp>(transaction.operation),
                                            &state, &result);
            break;
    }
    if (!status.ok()) {
        return status;
    }

    result.version = state.new_version;
    result.timestamp_nanos = options.timestamp_nanos != 0 ? options.timestamp_nanos : NowNanos();
    result.tag = transaction.tag;
    result.transaction_file = transaction.FileName();
    result.writer_version = WriterVersion();
    result.version_aux_data = 0;
    result.index_section.reset();
    result.max_fragment_id = state.fragment_ids.MaxAllocated();
    result.UpdateMaxFragmentId();
    result.next_row_id = state.row_ids.next_row_id();
    result.RecomputeFeatureFlags(stable);

    status = result.Validate();
    if (!status.ok()) {
        return status;
    }

    SHALE_LOG_DEBUG(Transaction) << OperationKindName(kind) << " " << transaction.uuid
                                 << " builds version " << result.version << " with "
                                 << result.fragments.size() << " fragments";
    *next = std::move(result);
    return Status::OK();
}

Status PlanRewrite(ObjectStore* store, const std::string& root,
                   const std::vector<Fragment>& old_fragments,
                   const std::vector<uint64_t>& new_fragment_rows, bool stable_row_ids,
                   RewritePlan* plan) {
    RewritePlan result;
    std::vector<uint64_t> survivors;
    for (const auto& fragment : old_fragments) {
        FragmentBitmap deleted;
        if (fragment.deletion_file && !store) {
            return Status::InvalidArgument("Reading deletions needs an object store");
        }
        auto status = ReadFragmentDeletions(store, root, fragment, &deleted);
        if (!status.ok()) {
            return status;
        }
        for (uint64_t offset = 0; offset < fragment.physical_rows; ++offset) {
            if (!deleted.contains(static_cast<uint32_t>(offset))) {
                result.changed_row_addrs.add(MakeRowAddress(static_cast<uint32_t>(fragment.id),
                                                            static_cast<uint32_t>(offset)));
            }
        }
        if (stable_row_ids) {
            if (!fragment.row_id_meta) {
                return Status::InvalidArgument("Fragment " + std::to_string(fragment.id) +
                                               " has no row ids");
            }
            RowIdSequence sequence;
            status = LoadRowIdSequence(store, root, *fragment.row_id_meta, &sequence,
                                       fragment.physical_rows);
            if (!status.ok()) {
                return status;
            }
            auto kept = sequence.Filtered(deleted).ToVector();
            survivors.insert(survivors.end(), kept.begin(), kept.end());
        }
    }
    result.surviving_rows = result.changed_row_addrs.cardinality();

    uint64_t total = 0;
    for (uint64_t rows : new_fragment_rows) total += rows;
    if (total != result.surviving_rows) {
        return Status::InvalidArgument("New fragments hold " + std::to_string(total) +
                                       " rows, " + std::to_string(result.surviving_rows) +
                                       " rows survive");
    }

    if (stable_row_ids) {
        size_t position = 0;
        for (uint64_t rows : new_fragment_rows) {
            std::vector<uint64_t> slice(survivors.begin() + static_cast<std::ptrdiff_t>(position),
                                        survivors.begin() + static_cast<std::ptrdiff_t>(position + rows));
            result.new_row_ids.push_back(RowIdSequence::FromValues(slice));
            position += rows;
        }
    }
    *plan = std::move(result);
    return Status::OK();
}

} // namespace shale
