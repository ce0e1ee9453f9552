#include <gtest/gtest.h>
#include <shale/commit.h>
#include <shale/index.h>
#include <shale/manifest.h>
#include <shale/transaction.h>
#include "shale/format/table.pb.h"

#include "test_util.h"

namespace shale {

namespace {

IndexMetadata MakeIndex(const std::string& name, std::vector<int32_t> fields,
                        std::vector<uint32_t> covered, IndexDetails details = BTreeDetails()) {
    IndexMetadata index;
    index.name = name;
    index.fields = std::move(fields);
    for (uint32_t id : covered) index.fragment_bitmap.add(id);
    index.details = std::move(details);
    return index;
}

Fragment Digestible(uint64_t id, uint64_t rows) {
    Fragment fragment;
    fragment.id = id;
    fragment.physical_rows = rows;
    return fragment;
}

} // namespace

TEST(IndexCatalogTest, RegisterEnforcesUniqueNames) {
    IndexCatalog catalog;
    std::string uuid;
    ASSERT_OK(catalog.Register(MakeIndex("by_id", {0}, {0, 1}), &uuid));
    EXPECT_EQ(uuid.size(), 36u);
    EXPECT_TRUE(catalog.Register(MakeIndex("by_id", {1}, {}), nullptr).IsAlreadyExists());

    IndexMetadata same_uuid = MakeIndex("other", {1}, {});
    same_uuid.uuid = uuid;
    EXPECT_TRUE(catalog.Register(same_uuid, nullptr).IsAlreadyExists());
    EXPECT_TRUE(catalog.Register(MakeIndex("", {1}, {}), nullptr).IsInvalidArgument());

    ASSERT_NE(catalog.FindByUuid(uuid), nullptr);
    EXPECT_TRUE(catalog.FindByName("by_id")->created_at.has_value());
    ASSERT_OK(catalog.Remove(uuid));
    EXPECT_TRUE(catalog.Remove(uuid).IsNotFound());
    EXPECT_EQ(catalog.FindByName("by_id"), nullptr);
}

TEST(IndexCatalogTest, DescribeReportsCoverage) {
    IndexCatalog catalog;
    ASSERT_OK(catalog.Register(MakeIndex("by_id", {0}, {0, 1}), nullptr));
    ASSERT_OK(catalog.Register(MakeIndex("by_name", {1}, {0}, InvertedDetails()), nullptr));
    catalog.MutableMemWals(3);

    std::vector<Fragment> fragments = {Digestible(0, 10), Digestible(1, 10), Digestible(2, 10)};

    auto all = catalog.Describe(IndexCriteria(), fragments);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].indexed_fragments, (std::vector<uint64_t>{0, 1}));
    EXPECT_EQ(all[0].unindexed_fragments, (std::vector<uint64_t>{2}));
    EXPECT_EQ(all[0].type_url, "type.googleapis.com/shale.format.BTreeIndexDetails");

    IndexCriteria by_field;
    by_field.field_id = 1;
    auto matched = catalog.Describe(by_field, fragments);
    ASSERT_EQ(matched.size(), 1u);
    EXPECT_EQ(matched[0].name, "by_name");
    EXPECT_EQ(matched[0].kind, IndexKind::kInverted);

    IndexCriteria system;
    system.include_system = true;
    system.kind = IndexKind::kMemWal;
    auto hidden = catalog.Describe(system, fragments);
    ASSERT_EQ(hidden.size(), 1u);
    EXPECT_EQ(hidden[0].name, kMemWalIndexName);
}

TEST(IndexCatalogTest, PruneSkipsSystemIndices) {
    IndexCatalog catalog;
    ASSERT_OK(catalog.Register(MakeIndex("by_id", {0}, {0, 1, 2}), nullptr));
    FragmentBitmap removed;
    removed.add(1);
    catalog.PruneFragments(removed);
    EXPECT_FALSE(catalog.FindByName("by_id")->fragment_bitmap.contains(1u));
    EXPECT_TRUE(catalog.FindByName("by_id")->fragment_bitmap.contains(2u));
}

TEST(IndexCatalogTest, RewriteRemapsCoverageAndRows) {
    IndexCatalog catalog;
    ASSERT_OK(catalog.Register(MakeIndex("full", {0}, {0, 1}), nullptr));
    ASSERT_OK(catalog.Register(MakeIndex("partial", {0}, {0}), nullptr));

    // Fragments 0 (4 rows, offset 1 deleted) and 1 (3 rows) become 5 (6 rows).
    FragmentReuseGroup group;
    for (uint32_t offset : {0u, 2u, 3u}) group.changed_row_addrs.add(MakeRowAddress(0, offset));
    for (uint32_t offset : {0u, 1u, 2u}) group.changed_row_addrs.add(MakeRowAddress(1, offset));
    group.old_fragments = {FragmentDigest{0, 4, 1}, FragmentDigest{1, 3, 0}};
    group.new_fragments = {FragmentDigest{5, 6, 0}};
    catalog.RecordRewrite(8, {group});

    const auto& full = catalog.FindByName("full")->fragment_bitmap;
    EXPECT_TRUE(full.contains(5u));
    EXPECT_FALSE(full.contains(0u));
    const auto& partial = catalog.FindByName("partial")->fragment_bitmap;
    EXPECT_TRUE(partial.isEmpty());

    ASSERT_NE(catalog.FragmentReuse(), nullptr);
    EXPECT_EQ(catalog.FragmentReuse()->versions.size(), 1u);

    uint64_t moved = 0;
    bool deleted = false;
    ASSERT_OK(catalog.RemapRowAddress(MakeRowAddress(0, 3), 7, &moved, &deleted));
    EXPECT_FALSE(deleted);
    EXPECT_EQ(moved, MakeRowAddress(5, 2));

    ASSERT_OK(catalog.RemapRowAddress(MakeRowAddress(1, 2), 7, &moved, &deleted));
    EXPECT_EQ(moved, MakeRowAddress(5, 5));

    ASSERT_OK(catalog.RemapRowAddress(MakeRowAddress(0, 1), 7, &moved, &deleted));
    EXPECT_TRUE(deleted);

    // Rows indexed after the rewrite are already current.
    ASSERT_OK(catalog.RemapRowAddress(MakeRowAddress(0, 3), 8, &moved, &deleted));
    EXPECT_FALSE(deleted);
    EXPECT_EQ(moved, MakeRowAddress(0, 3));

    FragmentBitmap stale;
    stale.add(0);
    stale.add(1);
    stale.add(2);
    catalog.RemapFragmentBitmap(&stale, 7);
    EXPECT_TRUE(stale.contains(5u));
    EXPECT_TRUE(stale.contains(2u));
    EXPECT_FALSE(stale.contains(1u));
}

TEST(IndexCatalogTest, MemWalRegistryLifecycle) {
    IndexCatalog catalog;
    EXPECT_EQ(catalog.MemWals(), nullptr);
    MemWalDetails* details = catalog.MutableMemWals(2);
    MemWal mem_wal;
    mem_wal.id = MemWalId{"r1", 0};
    details->mem_wal_list.push_back(mem_wal);
    ASSERT_NE(catalog.MemWals(), nullptr);
    EXPECT_NE(catalog.MemWals()->FindOpen("r1"), nullptr);

    catalog.DropEmptyMemWals();
    EXPECT_NE(catalog.MemWals(), nullptr);
    catalog.MutableMemWals(3)->mem_wal_list.clear();
    catalog.DropEmptyMemWals();
    EXPECT_EQ(catalog.MemWals(), nullptr);
}

TEST(IndexMetadataTest, ProtoKeepsUnknownDetails) {
    IndexMetadata index = MakeIndex("custom", {2}, {0, 4},
                                    UnknownIndexDetails{"type.googleapis.com/acme.Custom", "\x01\x02"});
    index.uuid = GenerateUuid();
    index.dataset_version = 9;
    index.index_version = 3;

    format::IndexMetadata proto;
    IndexMetadataToProto(index, &proto);
    IndexMetadata restored;
    ASSERT_OK(IndexMetadataFromProto(proto, &restored));
    EXPECT_EQ(restored.uuid, index.uuid);
    EXPECT_EQ(restored.kind(), IndexKind::kUnknown);
    EXPECT_EQ(std::get<UnknownIndexDetails>(restored.details).type_url,
              "type.googleapis.com/acme.Custom");
    EXPECT_TRUE(restored.fragment_bitmap == index.fragment_bitmap);
    // Opaque indices are never refused.
    EXPECT_OK(CheckIndexCompatible(restored));

    proto.mutable_uuid()->set_uuid("short");
    EXPECT_TRUE(IndexMetadataFromProto(proto, &restored).IsCorruption());
}

TEST(IndexMetadataTest, NewerIndexVersionIsIncompatible) {
    IndexMetadata index = MakeIndex("vec", {0}, {}, VectorDetails());
    index.index_version = kMaxSupportedIndexVersion + 1;
    EXPECT_TRUE(CheckIndexCompatible(index).IsIncompatible());
    index.index_version = kMaxSupportedIndexVersion;
    EXPECT_OK(CheckIndexCompatible(index));
}

//==============================================================================
// Index commits
//==============================================================================

class IndexCommitTest : public test::ShaleTestBase {
protected:
    void SetUp() override {
        engine_ = MakeEngine();
        ASSERT_OK(CreateTable(engine_.get(), 3, 100, false, &created_));
    }

    CreateIndexOp NewIndex(const std::string& name, std::vector<uint32_t> covered,
                           uint64_t dataset_version) {
        CreateIndexOp op;
        IndexMetadata index = MakeIndex(name, {0}, std::move(covered));
        index.dataset_version = dataset_version;
        op.new_indices.push_back(index);
        return op;
    }

    RewriteOp Rewrite(std::vector<uint64_t> ids) {
        RewriteOp op;
        RewriteGroup group;
        for (uint64_t id : ids) group.old_fragments.push_back(*created_.manifest.FragmentById(id));
        group.new_fragments.push_back(test::MakeTestFragment(schema_, "data/compacted", 100 * ids.size()));
        op.groups.push_back(group);
        return op;
    }

    std::unique_ptr<TransactionEngine> engine_;
    CommitResult created_;
};

TEST_F(IndexCommitTest, IndexSurvivesManifestRoundTrip) {
    CommitResult result;
    ASSERT_OK(engine_->Propose(1, NewIndex("by_id", {0, 1, 2}, 1), CommitOptions(), &result));

    Manifest loaded;
    ASSERT_OK(VersionChain(store_, root_).Load(2, &loaded));
    const IndexMetadata* index = loaded.indices.FindByName("by_id");
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(index->fragment_bitmap.cardinality(), 3u);
    EXPECT_EQ(index->kind(), IndexKind::kBTree);
}

TEST_F(IndexCommitTest, SystemNamesAreReserved) {
    CommitResult result;
    EXPECT_TRUE(engine_->Propose(1, NewIndex(kFragmentReuseIndexName, {}, 1), CommitOptions(), &result)
                    .IsInvalidArgument());
}

TEST_F(IndexCommitTest, UnknownFieldIsRejected) {
    CreateIndexOp op = NewIndex("bad", {0}, 1);
    op.new_indices[0].fields = {42};
    CommitResult result;
    EXPECT_TRUE(engine_->Propose(1, op, CommitOptions(), &result).IsInvalidArgument());
}

TEST_F(IndexCommitTest, CoverageFollowsLaterRewrite) {
    CommitResult indexed;
    ASSERT_OK(engine_->Propose(1, NewIndex("by_id", {0, 1, 2}, 1), CommitOptions(), &indexed));
    CommitResult compacted;
    ASSERT_OK(engine_->Propose(2, Rewrite({0, 1}), CommitOptions(), &compacted));

    const IndexMetadata* index = compacted.manifest.indices.FindByName("by_id");
    ASSERT_NE(index, nullptr);
    EXPECT_TRUE(index->fragment_bitmap.contains(3u));
    EXPECT_TRUE(index->fragment_bitmap.contains(2u));
    EXPECT_FALSE(index->fragment_bitmap.contains(0u));
    EXPECT_NE(compacted.manifest.indices.FragmentReuse(), nullptr);

    // An index trained on version 1 lands after the rewrite.
    CommitResult late;
    ASSERT_OK(engine_->Propose(3, NewIndex("late", {0, 1, 2}, 1), CommitOptions(), &late));
    const IndexMetadata* remapped = late.manifest.indices.FindByName("late");
    EXPECT_EQ(remapped->fragment_bitmap.cardinality(), 2u);
    EXPECT_TRUE(remapped->fragment_bitmap.contains(3u));
}

TEST_F(IndexCommitTest, IndexOverRewrittenFragmentsConflicts) {
    CommitResult compacted;
    ASSERT_OK(engine_->Propose(1, Rewrite({0, 1}), CommitOptions(), &compacted));
    CommitResult result;
    EXPECT_TRUE(engine_->Propose(1, NewIndex("by_id", {0, 1, 2}, 1), CommitOptions(), &result)
                    .IsWriteConflict());
    ASSERT_OK(engine_->Propose(1, NewIndex("tail", {2}, 1), CommitOptions(), &result));
    EXPECT_EQ(result.num_retries, 1u);
}

TEST_F(IndexCommitTest, ConcurrentDropOfSameIndexConflicts) {
    CommitResult indexed;
    ASSERT_OK(engine_->Propose(1, NewIndex("by_id", {0}, 1), CommitOptions(), &indexed));
    std::string uuid = indexed.manifest.indices.FindByName("by_id")->uuid;

    CreateIndexOp drop;
    drop.removed_indices.push_back(uuid);
    CommitResult first;
    ASSERT_OK(engine_->Propose(2, drop, CommitOptions(), &first));
    CommitResult second;
    EXPECT_TRUE(engine_->Propose(2, drop, CommitOptions(), &second).IsWriteConflict());
}

TEST_F(IndexCommitTest, DeletedFragmentsLeaveCoverage) {
    CommitResult indexed;
    ASSERT_OK(engine_->Propose(1, NewIndex("by_id", {0, 1, 2}, 1), CommitOptions(), &indexed));
    DeleteOp remove;
    remove.deleted_fragment_ids = {1};
    CommitResult removed;
    ASSERT_OK(engine_->Propose(2, remove, CommitOptions(), &removed));
    EXPECT_FALSE(removed.manifest.indices.FindByName("by_id")->fragment_bitmap.contains(1u));
}

} // namespace shale
