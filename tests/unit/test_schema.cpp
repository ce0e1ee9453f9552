#include <gtest/gtest.h>
#include <shale/fragment.h>
#include <shale/schema.h>
#include <arrow/api.h>

#include "test_util.h"

namespace shale {

TEST(SchemaTest, AssignsIdsInPreOrder) {
    Schema schema = test::MakeTestSchema();
    EXPECT_EQ(schema.FieldIds(), (std::vector<int32_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(schema.MaxFieldId(), 4);

    const Field* lat = schema.FieldByPath("location.lat");
    ASSERT_NE(lat, nullptr);
    EXPECT_EQ(lat->id, 3);
    EXPECT_EQ(lat->parent_id, 2);
    EXPECT_EQ(schema.FieldById(1)->name, "name");
    EXPECT_EQ(schema.FieldByPath("location.alt"), nullptr);
    EXPECT_OK(schema.Validate());
}

TEST(SchemaTest, NewFieldsContinueAfterMaximum) {
    Schema schema = test::MakeTestSchema();
    std::vector<Field> fields = schema.fields();
    Field extra;
    extra.name = "score";
    extra.logical_type = "double";
    fields.push_back(extra);
    Schema evolved(fields, schema.metadata());

    auto assigned = AssignFieldIds(&evolved, 9);
    EXPECT_EQ(assigned, (std::vector<int32_t>{10}));
    EXPECT_EQ(evolved.FieldByPath("score")->id, 10);
    EXPECT_EQ(evolved.FieldByPath("id")->id, 0);
}

TEST(SchemaTest, ValidateRejectsUnassignedAndDuplicates) {
    Field a;
    a.name = "a";
    Schema unassigned({a});
    EXPECT_TRUE(unassigned.Validate().IsInvariantViolation());

    Field b = a;
    a.id = 3;
    b.id = 3;
    b.name = "b";
    Schema duplicate({a, b});
    EXPECT_TRUE(duplicate.Validate().IsInvariantViolation());
}

TEST(SchemaTest, FromArrowKeepsFixedSizeListsAsLeaves) {
    auto arrow_schema = arrow::schema({
        arrow::field("id", arrow::int64(), false),
        arrow::field("embedding", arrow::fixed_size_list(arrow::float32(), 8)),
        arrow::field("tags", arrow::list(arrow::utf8())),
    });
    Schema schema;
    ASSERT_OK(Schema::FromArrow(*arrow_schema, &schema));
    AssignFieldIds(&schema, -1);

    EXPECT_EQ(schema.FieldByPath("embedding")->logical_type, "fixed_size_list:float:8");
    EXPECT_TRUE(schema.FieldByPath("embedding")->children.empty());
    EXPECT_EQ(schema.FieldByPath("tags")->children.size(), 1u);
    EXPECT_FALSE(schema.FieldByPath("id")->nullable);
    EXPECT_EQ(schema.MaxFieldId(), 3);
}

TEST(SchemaTest, FromArrowRejectsDuplicateNames) {
    auto arrow_schema = arrow::schema({arrow::field("x", arrow::int32()),
                                       arrow::field("x", arrow::int64())});
    Schema schema;
    EXPECT_TRUE(Schema::FromArrow(*arrow_schema, &schema).IsInvalidArgument());
}

TEST(ColumnIndicesTest, PackedStructOwnsOneColumn) {
    Schema schema = test::MakeTestSchema();
    Field* location = schema.MutableFieldById(2);
    ASSERT_NE(location, nullptr);
    location->metadata["packed"] = "true";

    std::vector<int32_t> indices;
    ASSERT_OK(ComputeColumnIndices(DefaultPhysicalLayout(schema), &indices));
    EXPECT_EQ(indices, (std::vector<int32_t>{0, 1, 2, -1, -1}));
    EXPECT_OK(ValidateColumnIndices(schema.FieldIds(), indices));
}

TEST(ColumnIndicesTest, ValidateCatchesMismatches) {
    EXPECT_TRUE(ValidateColumnIndices({0, 1}, {0}).IsInvariantViolation());
    EXPECT_TRUE(ValidateColumnIndices({0, 1}, {1, 1}).IsInvariantViolation());
    EXPECT_OK(ValidateColumnIndices({0, 1, 2}, {0, -1, -1}));
    EXPECT_OK(ValidateColumnIndices({0, 1}, {}));
}

TEST(DataFileTest, CreateUsesDefaultLayout) {
    Schema schema = test::MakeTestSchema();
    DataFile file;
    ASSERT_OK(DataFile::Create("data/a.shale", schema, 2, 0, &file));
    EXPECT_EQ(file.fields, schema.FieldIds());
    EXPECT_EQ(file.column_indices, (std::vector<int32_t>{0, 1, 2, 3, 4}));
    EXPECT_OK(file.Validate());

    DataFile legacy;
    ASSERT_OK(DataFile::Create("data/b.shale", schema, 0, 1, &legacy));
    EXPECT_FALSE(legacy.UsesColumnIndices());
    EXPECT_TRUE(legacy.column_indices.empty());
}

TEST(FragmentTest, SharedFieldIdsAreInvalid) {
    Schema schema = test::MakeFlatSchema({"a", "b"});
    Fragment fragment = test::MakeTestFragment(schema, "data/one.shale", 10);
    EXPECT_OK(fragment.Validate());

    fragment.files.push_back(fragment.files.front());
    fragment.files.back().path = "data/two.shale";
    EXPECT_FALSE(fragment.Validate().ok());
}

TEST(FragmentTest, LiveRowsSubtractDeletions) {
    Schema schema = test::MakeFlatSchema({"a"});
    Fragment fragment = test::MakeTestFragment(schema, "data/one.shale", 100);
    EXPECT_EQ(fragment.NumLiveRows(), 100u);

    DeletionFile deletion;
    deletion.num_deleted_rows = 30;
    fragment.deletion_file = deletion;
    EXPECT_EQ(fragment.NumLiveRows(), 70u);

    fragment.deletion_file->num_deleted_rows = 101;
    EXPECT_FALSE(fragment.Validate().ok());
}

TEST(FragmentIdAllocatorTest, StartsAboveWatermark) {
    FragmentIdAllocator fresh(std::nullopt);
    EXPECT_FALSE(fresh.MaxAllocated().has_value());
    EXPECT_EQ(fresh.Allocate(), 0u);
    EXPECT_EQ(*fresh.MaxAllocated(), 0u);

    FragmentIdAllocator existing(7u);
    EXPECT_EQ(existing.Allocate(), 8u);
    EXPECT_EQ(existing.Allocate(), 9u);
    EXPECT_EQ(*existing.MaxAllocated(), 9u);
}

} // namespace shale
