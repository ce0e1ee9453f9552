#include <gtest/gtest.h>
#include <shale/dataset.h>
#include <shale/deletion.h>
#include <shale/mem_wal.h>
#include <shale/object_store.h>
#include <shale/row_ids.h>

#include <nlohmann/json.hpp>

#include "test_util.h"

namespace shale {

class DatasetTest : public test::ShaleTestBase {
protected:
    Status CreateDataset(std::vector<FragmentSource> sources, std::unique_ptr<Dataset>* dataset,
                         DatasetOptions options = DatasetOptions()) {
        return Dataset::Create(store_, root_, schema_, sources, options, lock_, dataset);
    }

    std::vector<uint32_t> Offsets(uint32_t begin, uint32_t end) {
        std::vector<uint32_t> offsets;
        for (uint32_t i = begin; i < end; ++i) offsets.push_back(i);
        return offsets;
    }
};

TEST_F(DatasetTest, CreateOnceOnly) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));
    EXPECT_EQ(dataset->version(), 1u);
    EXPECT_EQ(dataset->CountRows(), 10u);
    EXPECT_EQ(dataset->schema().MaxFieldId(), 4);

    std::unique_ptr<Dataset> again;
    EXPECT_TRUE(CreateDataset({test::MakeSource("data/b", 10)}, &again).IsAlreadyExists());
}

TEST_F(DatasetTest, DeletingFiftyOfAThousandRows) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10), test::MakeSource("data/b", 10),
                             test::MakeSource("data/c", 10), test::MakeSource("data/d", 1000)},
                            &dataset));
    ASSERT_EQ(dataset->manifest().fragments[3].id, 3u);

    ASSERT_OK(dataset->DeleteRows({{3, Offsets(0, 50)}}, "id < 50", nullptr));
    const Fragment* fragment = dataset->manifest().FragmentById(3);
    ASSERT_NE(fragment, nullptr);
    ASSERT_TRUE(fragment->deletion_file.has_value());
    EXPECT_EQ(fragment->deletion_file->num_deleted_rows, 50u);
    EXPECT_EQ(fragment->deletion_file->read_version, 1u);
    EXPECT_EQ(CurrentRowCount(*fragment), 950u);
    EXPECT_EQ(dataset->CountRows(), 980u);
    EXPECT_TRUE(dataset->manifest().reader_feature_flags & kFlagDeletionFiles);
}

TEST_F(DatasetTest, FullyDeletedFragmentIsDropped) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10), test::MakeSource("data/b", 20)},
                            &dataset));
    ASSERT_OK(dataset->DeleteRows({{0, Offsets(0, 10)}}, "", nullptr));
    ASSERT_EQ(dataset->manifest().fragments.size(), 1u);
    EXPECT_EQ(dataset->manifest().fragments[0].id, 1u);

    std::vector<ObjectMeta> objects;
    ASSERT_OK(store_->List(JoinPath(root_, "_deletions/"), &objects));
    EXPECT_TRUE(objects.empty());

    EXPECT_TRUE(dataset->DeleteRows({{0, {1}}}, "", nullptr).IsNotFound());
    EXPECT_TRUE(dataset->DeleteRows({{1, Offsets(20, 21)}}, "", nullptr).IsInvalidArgument());
}

TEST_F(DatasetTest, AppendAfterWatermark) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));
    CommitResult result;
    ASSERT_OK(dataset->Append({test::MakeSource("data/b", 5), test::MakeSource("data/c", 5)},
                              &result));
    EXPECT_EQ(result.manifest.version, 2u);
    EXPECT_EQ(*result.manifest.max_fragment_id, 2u);
    EXPECT_EQ(dataset->CountRows(), 20u);
}

TEST_F(DatasetTest, CompactionKeepsStableRowIds) {
    DatasetOptions options;
    options.write.enable_stable_row_ids = true;
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 100), test::MakeSource("data/b", 100)},
                            &dataset, options));
    EXPECT_EQ(dataset->manifest().next_row_id, 200u);

    ASSERT_OK(dataset->DeleteRows({{0, {0, 1}}}, "", nullptr));
    CompactionGroup group;
    group.old_fragment_ids = {0, 1};
    group.new_files = {test::MakeSource("data/compacted", 198)};
    CommitResult result;
    ASSERT_OK(dataset->Compact({group}, &result));

    const Manifest& manifest = dataset->manifest();
    ASSERT_EQ(manifest.fragments.size(), 1u);
    const Fragment& compacted = manifest.fragments[0];
    EXPECT_EQ(compacted.id, 2u);
    EXPECT_FALSE(compacted.deletion_file.has_value());
    EXPECT_EQ(manifest.next_row_id, 200u);

    RowIdSequence sequence;
    ASSERT_OK(LoadRowIdSequence(store_.get(), root_, *compacted.row_id_meta, &sequence));
    ASSERT_EQ(sequence.Length(), 198u);
    EXPECT_EQ(sequence.ToVector().front(), 2u);
    EXPECT_EQ(sequence.ToVector().back(), 199u);

    uint64_t moved = 0;
    bool deleted = false;
    ASSERT_OK(manifest.indices.RemapRowAddress(MakeRowAddress(0, 5), 2, &moved, &deleted));
    EXPECT_FALSE(deleted);
    EXPECT_EQ(moved, MakeRowAddress(2, 3));
    ASSERT_OK(manifest.indices.RemapRowAddress(MakeRowAddress(1, 0), 2, &moved, &deleted));
    EXPECT_EQ(moved, MakeRowAddress(2, 98));
    ASSERT_OK(manifest.indices.RemapRowAddress(MakeRowAddress(0, 1), 2, &moved, &deleted));
    EXPECT_TRUE(deleted);
}

TEST_F(DatasetTest, CompactionRowCountMustMatch) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));
    CompactionGroup group;
    group.old_fragment_ids = {0};
    group.new_files = {test::MakeSource("data/c", 11)};
    EXPECT_TRUE(dataset->Compact({group}, nullptr).IsInvalidArgument());
}

TEST_F(DatasetTest, IndexLifecycle) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10), test::MakeSource("data/b", 10)},
                            &dataset));
    std::string uuid;
    ASSERT_OK(dataset->CreateIndex("by_name", {1}, InvertedDetails(), 1, &uuid));
    EXPECT_FALSE(uuid.empty());
    EXPECT_TRUE(dataset->CreateIndex("by_name", {0}, BTreeDetails(), std::nullopt, nullptr)
                    .IsAlreadyExists());

    ASSERT_OK(dataset->Append({test::MakeSource("data/c", 10)}, nullptr));
    IndexCriteria criteria;
    criteria.name = "by_name";
    auto described = dataset->DescribeIndices(criteria);
    ASSERT_EQ(described.size(), 1u);
    EXPECT_EQ(described[0].uuid, uuid);
    EXPECT_EQ(described[0].indexed_fragments, (std::vector<uint64_t>{0, 1}));
    EXPECT_EQ(described[0].unindexed_fragments, (std::vector<uint64_t>{2}));

    ASSERT_OK(dataset->DropIndex("by_name"));
    EXPECT_TRUE(dataset->DescribeIndices(IndexCriteria()).empty());
    EXPECT_TRUE(dataset->DropIndex("by_name").IsNotFound());
    EXPECT_TRUE(dataset->DropIndex(kMemWalIndexName).IsNotFound());
}

TEST_F(DatasetTest, ConfigDrivesOptions) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));
    ASSERT_OK(dataset->UpdateConfig({{kConfigCommitMaxRetries, "3"},
                                     {kConfigDeletionBitmapRatio, "not-a-number"},
                                     {"team", "search"}},
                                    {}));
    EXPECT_EQ(dataset->options().commit.max_retries, 3u);
    EXPECT_DOUBLE_EQ(dataset->options().write.deletion_bitmap_ratio, kDefaultDeletionBitmapRatio);
    EXPECT_TRUE(dataset->manifest().writer_feature_flags & kFlagTableConfig);

    ASSERT_OK(dataset->UpdateConfig({}, {kConfigCommitMaxRetries}));
    EXPECT_EQ(dataset->options().commit.max_retries, CommitOptions().max_retries);
    EXPECT_EQ(dataset->manifest().config.count("team"), 1u);
}

TEST_F(DatasetTest, SchemaMetadataMergeOrReplace) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));
    ASSERT_OK(dataset->UpdateSchemaMetadata({{"a", "1"}}, false));
    ASSERT_OK(dataset->UpdateSchemaMetadata({{"b", "2"}}, false));
    EXPECT_EQ(dataset->schema().metadata().size(), 2u);
    ASSERT_OK(dataset->UpdateSchemaMetadata({{"c", "3"}}, true));
    EXPECT_EQ(dataset->schema().metadata(), (std::map<std::string, std::string>{{"c", "3"}}));
}

TEST_F(DatasetTest, OverwriteGetsFreshFieldIds) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));

    Schema replacement = test::MakeFlatSchema({"key", "value"});
    std::vector<Field> fields = replacement.fields();
    for (auto& field : fields) field.id = kUnassignedFieldId;
    ASSERT_OK(dataset->Overwrite(Schema(fields), {test::MakeSource("data/new", 3)}, nullptr));

    EXPECT_EQ(dataset->schema().FieldByPath("key")->id, 5);
    EXPECT_EQ(dataset->schema().FieldByPath("value")->id, 6);
    EXPECT_EQ(dataset->CountRows(), 3u);
    EXPECT_EQ(dataset->manifest().fragments[0].id, 1u);
}

TEST_F(DatasetTest, TagsAndCheckout) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));
    ASSERT_OK(dataset->CreateTag("initial", 1));
    ASSERT_OK(dataset->Append({test::MakeSource("data/b", 10)}, nullptr));

    std::unique_ptr<Dataset> old;
    ASSERT_OK(dataset->Checkout(VersionRef::Tag("initial"), &old));
    EXPECT_EQ(old->version(), 1u);
    EXPECT_EQ(old->CountRows(), 10u);

    std::vector<TagInfo> tags;
    ASSERT_OK(dataset->ListTags(&tags));
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].version, 1u);
    ASSERT_OK(dataset->DeleteTag("initial"));

    std::vector<VersionInfo> versions;
    ASSERT_OK(dataset->ListVersions(&versions));
    EXPECT_EQ(versions.size(), 2u);
}

TEST_F(DatasetTest, TwoHandlesRebaseOntoEachOther) {
    std::unique_ptr<Dataset> first;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &first));
    std::unique_ptr<Dataset> second;
    ASSERT_OK(Dataset::Open(store_, root_, VersionRef::Latest(), DatasetOptions(), lock_, &second));

    ASSERT_OK(first->Append({test::MakeSource("data/b", 10)}, nullptr));
    CommitResult result;
    ASSERT_OK(second->Append({test::MakeSource("data/c", 10)}, &result));
    EXPECT_EQ(result.num_retries, 1u);
    EXPECT_EQ(second->CountRows(), 30u);

    EXPECT_EQ(first->CountRows(), 20u);
    ASSERT_OK(first->Refresh());
    EXPECT_EQ(first->version(), 3u);
    EXPECT_EQ(first->CountRows(), 30u);
}

TEST_F(DatasetTest, StatsJson) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10), test::MakeSource("data/b", 5)},
                            &dataset));
    auto json = nlohmann::json::parse(dataset->StatsJson());
    EXPECT_EQ(json["version"].get<uint64_t>(), 1u);
    EXPECT_EQ(json["num_rows"].get<uint64_t>(), 15u);
    EXPECT_EQ(json["max_fragment_id"].get<uint32_t>(), 1u);
    EXPECT_EQ(json["summary"]["total_fragments"].get<uint64_t>(), 2u);
}

TEST_F(DatasetTest, SealedRegionScenario) {
    std::unique_ptr<Dataset> dataset;
    ASSERT_OK(CreateDataset({test::MakeSource("data/a", 10)}, &dataset));
    MemWalWriter writer(dataset->engine(), "node-1");
    ASSERT_OK(writer.CreateRegion("r1", "mem/r1/0", "wal/r1/0", nullptr));
    ASSERT_OK(writer.Seal("r1", "mem/r1/1", "wal/r1/1", nullptr));

    ASSERT_OK(dataset->Refresh());
    const MemWalDetails* details = dataset->manifest().indices.MemWals();
    ASSERT_NE(details, nullptr);
    ASSERT_EQ(details->mem_wal_list.size(), 2u);
    EXPECT_EQ(details->Find(MemWalId{"r1", 0})->state, MemWalState::kSealed);
    EXPECT_EQ(details->Find(MemWalId{"r1", 1})->state, MemWalState::kOpen);

    // Every version in between has exactly one OPEN generation for r1.
    for (uint64_t version = 2; version <= dataset->version(); ++version) {
        std::unique_ptr<Dataset> snapshot;
        ASSERT_OK(dataset->Checkout(VersionRef::Version(version), &snapshot));
        const MemWalDetails* at = snapshot->manifest().indices.MemWals();
        ASSERT_NE(at, nullptr);
        size_t open = 0;
        for (const auto& mem_wal : at->mem_wal_list) {
            if (mem_wal.id.region == "r1" && mem_wal.state == MemWalState::kOpen) ++open;
        }
        EXPECT_EQ(open, 1u) << "version " << version;
    }
}

TEST(DatasetOptionsTest, MalformedValuesKeepDefaults) {
    DatasetOptions defaults;
    defaults.commit.max_retries = 7;
    auto options = DatasetOptions::FromConfig({{kConfigCommitMaxRetries, "-1"},
                                               {kConfigRowIdInlineLimit, "4096"},
                                               {kConfigDeletionBitmapRatio, "2.5"}},
                                              defaults);
    EXPECT_EQ(options.commit.max_retries, 7u);
    EXPECT_EQ(options.write.row_id_inline_limit, 4096u);
    EXPECT_DOUBLE_EQ(options.write.deletion_bitmap_ratio, kDefaultDeletionBitmapRatio);
}

} // namespace shale
