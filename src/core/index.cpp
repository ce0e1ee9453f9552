#include <shale/index.h>
#include <shale/logging.h>
#include <shale/util.h>
#include "shale/format/table.pb.h"

#include <algorithm>
#include <set>

namespace shale {

namespace pb = ::shale::format;

SHALE_LOG_TAG(Index);

namespace {

void DigestToProto(const FragmentDigest& digest, pb::FragmentReuseIndexDetails::FragmentDigest* proto) {
    proto->set_id(digest.id);
    proto->set_physical_rows(digest.physical_rows);
    proto->set_num_deleted_rows(digest.num_deleted_rows);
}

FragmentDigest DigestFromProto(const pb::FragmentReuseIndexDetails::FragmentDigest& proto) {
    FragmentDigest digest;
    digest.id = proto.id();
    digest.physical_rows = proto.physical_rows();
    digest.num_deleted_rows = proto.num_deleted_rows();
    return digest;
}

void FragmentReuseToProto(const FragmentReuseDetails& details, pb::FragmentReuseIndexDetails* proto) {
    auto* content = proto->mutable_inline_content();
    for (const auto& version : details.versions) {
        auto* version_proto = content->add_versions();
        version_proto->set_dataset_version(version.dataset_version);
        for (const auto& group : version.groups) {
            auto* group_proto = version_proto->add_groups();
            group_proto->set_changed_row_addrs(SerializeRowAddresses(group.changed_row_addrs));
            for (const auto& digest : group.old_fragments) {
                DigestToProto(digest, group_proto->add_old_fragments());
            }
            for (const auto& digest : group.new_fragments) {
                DigestToProto(digest, group_proto->add_new_fragments());
            }
        }
    }
}

Status FragmentReuseFromProto(const pb::FragmentReuseIndexDetails& proto, FragmentReuseDetails* details) {
    if (proto.content_case() == pb::FragmentReuseIndexDetails::kExternal) {
        return Status::NotImplemented("Fragment reuse ledger stored in " + proto.external().path());
    }
    FragmentReuseDetails result;
    for (const auto& version_proto : proto.inline_content().versions()) {
        FragmentReuseVersion version;
        version.dataset_version = version_proto.dataset_version();
        for (const auto& group_proto : version_proto.groups()) {
            FragmentReuseGroup group;
            auto status = DeserializeRowAddresses(group_proto.changed_row_addrs(), &group.changed_row_addrs);
            if (!status.ok()) {
                return status;
            }
            for (const auto& digest : group_proto.old_fragments()) {
                group.old_fragments.push_back(DigestFromProto(digest));
            }
            for (const auto& digest : group_proto.new_fragments()) {
                group.new_fragments.push_back(DigestFromProto(digest));
            }
            version.groups.push_back(std::move(group));
        }
        result.versions.push_back(std::move(version));
    }
    *details = std::move(result);
    return Status::OK();
}

pb::MemWalIndexDetails::MemWal::State StateToProto(MemWalState state) {
    switch (state) {
        case MemWalState::kOpen: return pb::MemWalIndexDetails::MemWal::OPEN;
        case MemWalState::kSealed: return pb::MemWalIndexDetails::MemWal::SEALED;
        case MemWalState::kFlushed: return pb::MemWalIndexDetails::MemWal::FLUSHED;
    }
    return pb::MemWalIndexDetails::MemWal::OPEN;
}

void MemWalDetailsToProto(const MemWalDetails& details, pb::MemWalIndexDetails* proto) {
    for (const auto& mem_wal : details.mem_wal_list) {
        MemWalToProto(mem_wal, proto->add_mem_wal_list());
    }
}

Status MemWalDetailsFromProto(const pb::MemWalIndexDetails& proto, MemWalDetails* details) {
    MemWalDetails result;
    for (const auto& record : proto.mem_wal_list()) {
        MemWal mem_wal;
        auto status = MemWalFromProto(record, &mem_wal);
        if (!status.ok()) {
            return status;
        }
        result.mem_wal_list.push_back(std::move(mem_wal));
    }
    *details = std::move(result);
    return Status::OK();
}

template <typename Proto>
bool UnpackAs(const google::protobuf::Any& any, Proto* proto) {
    return any.Is<Proto>() && any.UnpackTo(proto);
}

// Tags the Any with Proto's type while keeping the writer's bytes untouched.
template <typename Proto>
void PackPayload(const std::string& payload, google::protobuf::Any* any) {
    any->PackFrom(Proto());
    any->set_value(payload);
}

} // namespace

void MemWalToProto(const MemWal& mem_wal, pb::MemWalIndexDetails::MemWal* proto) {
    proto->mutable_id()->set_region(mem_wal.id.region);
    proto->mutable_id()->set_generation(mem_wal.id.generation);
    proto->set_mem_table_location(mem_wal.mem_table_location);
    proto->set_wal_location(mem_wal.wal_location);
    proto->set_wal_entries(mem_wal.wal_entries.Serialize());
    proto->set_state(StateToProto(mem_wal.state));
    proto->set_owner_id(mem_wal.owner_id);
    proto->set_last_updated_dataset_version(mem_wal.last_updated_dataset_version);
}

Status MemWalFromProto(const pb::MemWalIndexDetails::MemWal& proto, MemWal* mem_wal) {
    MemWal result;
    result.id.region = proto.id().region();
    result.id.generation = proto.id().generation();
    result.mem_table_location = proto.mem_table_location();
    result.wal_location = proto.wal_location();
    auto status = U64Segment::Deserialize(proto.wal_entries(), &result.wal_entries);
    if (!status.ok()) {
        return status;
    }
    switch (proto.state()) {
        case pb::MemWalIndexDetails::MemWal::OPEN: result.state = MemWalState::kOpen; break;
        case pb::MemWalIndexDetails::MemWal::SEALED: result.state = MemWalState::kSealed; break;
        case pb::MemWalIndexDetails::MemWal::FLUSHED: result.state = MemWalState::kFlushed; break;
        default:
            return Status::Corruption("Unknown MemWAL state " + std::to_string(proto.state()));
    }
    result.owner_id = proto.owner_id();
    result.last_updated_dataset_version = proto.last_updated_dataset_version();
    *mem_wal = std::move(result);
    return Status::OK();
}

const char* IndexKindName(IndexKind kind) {
    switch (kind) {
        case IndexKind::kBTree: return "BTree";
        case IndexKind::kBitmap: return "Bitmap";
        case IndexKind::kLabelList: return "LabelList";
        case IndexKind::kInverted: return "Inverted";
        case IndexKind::kNGram: return "NGram";
        case IndexKind::kVector: return "Vector";
        case IndexKind::kFragmentReuse: return "FragmentReuse";
        case IndexKind::kMemWal: return "MemWal";
        case IndexKind::kUnknown: return "Unknown";
    }
    return "Unknown";
}

const char* MemWalStateName(MemWalState state) {
    switch (state) {
        case MemWalState::kOpen: return "OPEN";
        case MemWalState::kSealed: return "SEALED";
        case MemWalState::kFlushed: return "FLUSHED";
    }
    return "UNKNOWN";
}

IndexKind DetailsKind(const IndexDetails& details) {
    switch (details.index()) {
        case 0: return IndexKind::kBTree;
        case 1: return IndexKind::kBitmap;
        case 2: return IndexKind::kLabelList;
        case 3: return IndexKind::kInverted;
        case 4: return IndexKind::kNGram;
        case 5: return IndexKind::kVector;
        case 6: return IndexKind::kFragmentReuse;
        case 7: return IndexKind::kMemWal;
        default: return IndexKind::kUnknown;
    }
}

//==============================================================================
// MemWalDetails
//==============================================================================

const MemWal* MemWalDetails::Find(const MemWalId& id) const {
    for (const auto& mem_wal : mem_wal_list) {
        if (mem_wal.id == id) return &mem_wal;
    }
    return nullptr;
}

MemWal* MemWalDetails::Find(const MemWalId& id) {
    for (auto& mem_wal : mem_wal_list) {
        if (mem_wal.id == id) return &mem_wal;
    }
    return nullptr;
}

const MemWal* MemWalDetails::FindOpen(const std::string& region) const {
    for (const auto& mem_wal : mem_wal_list) {
        if (mem_wal.id.region == region && mem_wal.state == MemWalState::kOpen) return &mem_wal;
    }
    return nullptr;
}

//==============================================================================
// IndexMetadata
//==============================================================================

bool IndexMetadata::IsSystemIndex() const {
    return name == kFragmentReuseIndexName || name == kMemWalIndexName;
}

void IndexMetadataToProto(const IndexMetadata& index, pb::IndexMetadata* proto) {
    proto->mutable_uuid()->set_uuid(UuidToBytes(index.uuid));
    for (int32_t field : index.fields) proto->add_fields(field);
    proto->set_name(index.name);
    proto->set_dataset_version(index.dataset_version);
    proto->set_fragment_bitmap(SerializeBitmap(index.fragment_bitmap));
    if (index.index_version) proto->set_index_version(*index.index_version);
    if (index.created_at) proto->set_created_at(*index.created_at);

    auto* any = proto->mutable_index_details();
    switch (index.kind()) {
        case IndexKind::kBTree:
            PackPayload<pb::BTreeIndexDetails>(std::get<BTreeDetails>(index.details).payload, any);
            break;
        case IndexKind::kBitmap:
            PackPayload<pb::BitmapIndexDetails>(std::get<BitmapDetails>(index.details).payload, any);
            break;
        case IndexKind::kLabelList:
            PackPayload<pb::LabelListIndexDetails>(std::get<LabelListDetails>(index.details).payload, any);
            break;
        case IndexKind::kInverted:
            PackPayload<pb::InvertedIndexDetails>(std::get<InvertedDetails>(index.details).payload, any);
            break;
        case IndexKind::kNGram:
            PackPayload<pb::NGramIndexDetails>(std::get<NGramDetails>(index.details).payload, any);
            break;
        case IndexKind::kVector:
            PackPayload<pb::VectorIndexDetails>(std::get<VectorDetails>(index.details).payload, any);
            break;
        case IndexKind::kFragmentReuse: {
            pb::FragmentReuseIndexDetails details;
            FragmentReuseToProto(std::get<FragmentReuseDetails>(index.details), &details);
            any->PackFrom(details);
            break;
        }
        case IndexKind::kMemWal: {
            pb::MemWalIndexDetails details;
            MemWalDetailsToProto(std::get<MemWalDetails>(index.details), &details);
            any->PackFrom(details);
            break;
        }
        case IndexKind::kUnknown: {
            const auto& unknown = std::get<UnknownIndexDetails>(index.details);
            any->set_type_url(unknown.type_url);
            any->set_value(unknown.value);
            break;
        }
    }
}

Status IndexMetadataFromProto(const pb::IndexMetadata& proto, IndexMetadata* index) {
    IndexMetadata result;
    if (proto.uuid().uuid().size() != 16) {
        return Status::Corruption("Index " + proto.name() + " has a malformed uuid");
    }
    result.uuid = UuidFromBytes(proto.uuid().uuid());
    result.fields.assign(proto.fields().begin(), proto.fields().end());
    result.name = proto.name();
    result.dataset_version = proto.dataset_version();
    auto status = DeserializeBitmap(proto.fragment_bitmap(), &result.fragment_bitmap);
    if (!status.ok()) {
        return status;
    }
    if (proto.has_index_version()) result.index_version = proto.index_version();
    if (proto.has_created_at()) result.created_at = proto.created_at();

    const auto& any = proto.index_details();
    pb::FragmentReuseIndexDetails reuse;
    pb::MemWalIndexDetails mem_wal;
    if (any.Is<pb::BTreeIndexDetails>()) {
        result.details = BTreeDetails{any.value()};
    } else if (any.Is<pb::BitmapIndexDetails>()) {
        result.details = BitmapDetails{any.value()};
    } else if (any.Is<pb::LabelListIndexDetails>()) {
        result.details = LabelListDetails{any.value()};
    } else if (any.Is<pb::InvertedIndexDetails>()) {
        result.details = InvertedDetails{any.value()};
    } else if (any.Is<pb::NGramIndexDetails>()) {
        result.details = NGramDetails{any.value()};
    } else if (any.Is<pb::VectorIndexDetails>()) {
        result.details = VectorDetails{any.value()};
    } else if (UnpackAs(any, &reuse)) {
        FragmentReuseDetails details;
        status = FragmentReuseFromProto(reuse, &details);
        if (!status.ok()) {
            return status;
        }
        result.details = std::move(details);
    } else if (UnpackAs(any, &mem_wal)) {
        MemWalDetails details;
        status = MemWalDetailsFromProto(mem_wal, &details);
        if (!status.ok()) {
            return status;
        }
        result.details = std::move(details);
    } else if (any.Is<pb::FragmentReuseIndexDetails>() || any.Is<pb::MemWalIndexDetails>()) {
        return Status::Corruption("Malformed details for index " + proto.name());
    } else {
        result.details = UnknownIndexDetails{any.type_url(), any.value()};
    }

    *index = std::move(result);
    return Status::OK();
}

Status CheckIndexCompatible(const IndexMetadata& index) {
    if (index.kind() == IndexKind::kUnknown) {
        return Status::OK();
    }
    if (index.index_version && *index.index_version > kMaxSupportedIndexVersion) {
        return Status::Incompatible("Index " + index.name + " requires index version " +
                                    std::to_string(*index.index_version) + ", this build reads up to " +
                                    std::to_string(kMaxSupportedIndexVersion));
    }
    return Status::OK();
}

void RemapFragmentBitmapForGroups(const std::vector<FragmentReuseGroup>& groups,
                                  FragmentBitmap* bitmap) {
    for (const auto& group : groups) {
        size_t covered = 0;
        for (const auto& old_fragment : group.old_fragments) {
            if (bitmap->contains(static_cast<uint32_t>(old_fragment.id))) ++covered;
        }
        if (covered == 0) {
            continue;
        }
        for (const auto& old_fragment : group.old_fragments) {
            bitmap->remove(static_cast<uint32_t>(old_fragment.id));
        }
        if (covered == group.old_fragments.size()) {
            for (const auto& new_fragment : group.new_fragments) {
                bitmap->add(static_cast<uint32_t>(new_fragment.id));
            }
        }
    }
}

//==============================================================================
// IndexCatalog
//==============================================================================

Status IndexCatalog::Register(IndexMetadata index, std::string* uuid) {
    if (index.name.empty()) {
        return Status::InvalidArgument("Index name is empty");
    }
    if (index.uuid.empty()) {
        index.uuid = GenerateUuid();
    }
    for (const auto& existing : indices_) {
        if (existing.name == index.name) {
            return Status::AlreadyExists("Index named " + index.name + " already exists");
        }
        if (existing.uuid == index.uuid) {
            return Status::AlreadyExists("Index uuid " + index.uuid + " already exists");
        }
    }
    if (!index.created_at) {
        index.created_at = NowMillis();
    }
    if (uuid) *uuid = index.uuid;
    indices_.push_back(std::move(index));
    return Status::OK();
}

Status IndexCatalog::Remove(const std::string& uuid) {
    auto it = std::find_if(indices_.begin(), indices_.end(),
                           [&](const IndexMetadata& index) { return index.uuid == uuid; });
    if (it == indices_.end()) {
        return Status::NotFound("Index " + uuid + " not found");
    }
    indices_.erase(it);
    return Status::OK();
}

const IndexMetadata* IndexCatalog::FindByName(const std::string& name) const {
    for (const auto& index : indices_) {
        if (index.name == name) return &index;
    }
    return nullptr;
}

const IndexMetadata* IndexCatalog::FindByUuid(const std::string& uuid) const {
    for (const auto& index : indices_) {
        if (index.uuid == uuid) return &index;
    }
    return nullptr;
}

std::vector<IndexDescription> IndexCatalog::Describe(const IndexCriteria& criteria,
                                                     const std::vector<Fragment>& fragments) const {
    std::vector<IndexDescription> descriptions;
    for (const auto& index : indices_) {
        if (index.IsSystemIndex() && !criteria.include_system) continue;
        if (criteria.name && index.name != *criteria.name) continue;
        if (criteria.kind && index.kind() != *criteria.kind) continue;
        if (criteria.field_id &&
            std::find(index.fields.begin(), index.fields.end(), *criteria.field_id) ==
                index.fields.end()) {
            continue;
        }

        IndexDescription description;
        description.name = index.name;
        description.uuid = index.uuid;
        description.kind = index.kind();
        if (description.kind == IndexKind::kUnknown) {
            description.type_url = std::get<UnknownIndexDetails>(index.details).type_url;
        } else {
            description.type_url = std::string("type.googleapis.com/shale.format.") +
                                   IndexKindName(description.kind) + "IndexDetails";
        }
        description.fields = index.fields;
        description.dataset_version = index.dataset_version;
        description.index_version = index.index_version;
        description.created_at = index.created_at;
        for (const auto& fragment : fragments) {
            if (index.fragment_bitmap.contains(static_cast<uint32_t>(fragment.id))) {
                description.indexed_fragments.push_back(fragment.id);
            } else {
                description.unindexed_fragments.push_back(fragment.id);
            }
        }
        descriptions.push_back(std::move(description));
    }
    return descriptions;
}

void IndexCatalog::PruneFragments(const FragmentBitmap& removed) {
    for (auto& index : indices_) {
        if (index.IsSystemIndex()) continue;
        index.fragment_bitmap -= removed;
    }
}

IndexMetadata* IndexCatalog::FindSystemIndex(const std::string& name) {
    for (auto& index : indices_) {
        if (index.name == name) return &index;
    }
    return nullptr;
}

const IndexMetadata* IndexCatalog::FindSystemIndex(const std::string& name) const {
    return FindByName(name);
}

void IndexCatalog::RecordRewrite(uint64_t dataset_version, std::vector<FragmentReuseGroup> groups) {
    if (groups.empty()) {
        return;
    }

    for (auto& index : indices_) {
        if (index.IsSystemIndex()) continue;
        RemapFragmentBitmapForGroups(groups, &index.fragment_bitmap);
    }

    IndexMetadata* ledger = FindSystemIndex(kFragmentReuseIndexName);
    if (!ledger) {
        IndexMetadata index;
        index.uuid = GenerateUuid();
        index.name = kFragmentReuseIndexName;
        index.details = FragmentReuseDetails();
        index.created_at = NowMillis();
        indices_.push_back(std::move(index));
        ledger = &indices_.back();
    }
    ledger->dataset_version = dataset_version;

    auto& details = std::get<FragmentReuseDetails>(ledger->details);
    FragmentReuseVersion version;
    version.dataset_version = dataset_version;
    version.groups = std::move(groups);
    details.versions.push_back(std::move(version));
    SHALE_LOG_DEBUG(Index) << "Recorded " << details.versions.back().groups.size()
                           << " rewrite groups at version " << dataset_version;
}

const FragmentReuseDetails* IndexCatalog::FragmentReuse() const {
    const IndexMetadata* ledger = FindSystemIndex(kFragmentReuseIndexName);
    if (!ledger) return nullptr;
    return std::get_if<FragmentReuseDetails>(&ledger->details);
}

void IndexCatalog::RemapFragmentBitmap(FragmentBitmap* bitmap, uint64_t since_version) const {
    const FragmentReuseDetails* ledger = FragmentReuse();
    if (!ledger) return;
    for (const auto& version : ledger->versions) {
        if (version.dataset_version <= since_version) continue;
        RemapFragmentBitmapForGroups(version.groups, bitmap);
    }
}

Status IndexCatalog::RemapRowAddress(uint64_t address, uint64_t since_version,
                                     uint64_t* new_address, bool* deleted) const {
    *deleted = false;
    *new_address = address;
    const FragmentReuseDetails* ledger = FragmentReuse();
    if (!ledger) {
        return Status::OK();
    }

    uint64_t current = address;
    for (const auto& version : ledger->versions) {
        if (version.dataset_version <= since_version) continue;
        for (const auto& group : version.groups) {
            uint64_t fragment_id = RowAddressFragment(current);
            bool in_group = std::any_of(group.old_fragments.begin(), group.old_fragments.end(),
                                        [&](const FragmentDigest& d) { return d.id == fragment_id; });
            if (!in_group) continue;

            if (!group.changed_row_addrs.contains(current)) {
                *deleted = true;
                return Status::OK();
            }
            // Position among surviving rows, then locate it in the new fragments.
            uint64_t position = group.changed_row_addrs.rank(current) - 1;
            bool found = false;
            for (const auto& new_fragment : group.new_fragments) {
                if (position < new_fragment.physical_rows) {
                    current = MakeRowAddress(static_cast<uint32_t>(new_fragment.id),
                                             static_cast<uint32_t>(position));
                    found = true;
                    break;
                }
                position -= new_fragment.physical_rows;
            }
            if (!found) {
                return Status::Corruption("Fragment reuse group at version " +
                                          std::to_string(version.dataset_version) +
                                          " has fewer new rows than surviving addresses");
            }
            break;
        }
    }
    *new_address = current;
    return Status::OK();
}

const MemWalDetails* IndexCatalog::MemWals() const {
    const IndexMetadata* index = FindSystemIndex(kMemWalIndexName);
    if (!index) return nullptr;
    return std::get_if<MemWalDetails>(&index->details);
}

MemWalDetails* IndexCatalog::MutableMemWals(uint64_t dataset_version) {
    IndexMetadata* index = FindSystemIndex(kMemWalIndexName);
    if (!index) {
        IndexMetadata created;
        created.uuid = GenerateUuid();
        created.name = kMemWalIndexName;
        created.details = MemWalDetails();
        created.created_at = NowMillis();
        indices_.push_back(std::move(created));
        index = &indices_.back();
    }
    index->dataset_version = dataset_version;
    return std::get_if<MemWalDetails>(&index->details);
}

void IndexCatalog::DropEmptyMemWals() {
    indices_.erase(std::remove_if(indices_.begin(), indices_.end(),
                                  [](const IndexMetadata& index) {
                                      if (index.name != kMemWalIndexName) return false;
                                      const auto* details = std::get_if<MemWalDetails>(&index.details);
                                      return details && details->mem_wal_list.empty();
                                  }),
                   indices_.end());
}

} // namespace shale
