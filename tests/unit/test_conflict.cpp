#include <gtest/gtest.h>
#include <shale/transaction.h>

#include "test_util.h"

namespace shale {

namespace {

Fragment FragmentWithId(uint64_t id) {
    Fragment fragment;
    fragment.id = id;
    fragment.physical_rows = 10;
    return fragment;
}

Operation Append(std::optional<std::string> flush_region = std::nullopt) {
    AppendOp op;
    op.fragments.push_back(FragmentWithId(0));
    if (flush_region) {
        MemWalUpdate flush;
        flush.id = MemWalId{*flush_region, 0};
        flush.record.id = flush.id;
        op.mem_wal_to_flush = flush;
    }
    return op;
}

Operation Delete(std::vector<uint64_t> updated, std::vector<uint64_t> removed = {}) {
    DeleteOp op;
    for (uint64_t id : updated) op.updated_fragments.push_back(FragmentWithId(id));
    op.deleted_fragment_ids = std::move(removed);
    return op;
}

Operation Overwrite() {
    return OverwriteOp();
}

Operation CreateIndex(const std::string& name, std::vector<uint32_t> covered,
                      std::vector<std::string> removed = {}) {
    CreateIndexOp op;
    if (!name.empty()) {
        IndexMetadata index;
        index.name = name;
        for (uint32_t id : covered) index.fragment_bitmap.add(id);
        op.new_indices.push_back(index);
    }
    op.removed_indices = std::move(removed);
    return op;
}

Operation Rewrite(std::vector<uint64_t> old_ids) {
    RewriteOp op;
    RewriteGroup group;
    for (uint64_t id : old_ids) group.old_fragments.push_back(FragmentWithId(id));
    op.groups.push_back(group);
    return op;
}

Operation Config(std::vector<std::string> upserts, std::vector<std::string> deletes = {},
                 bool schema_metadata = false) {
    UpdateConfigOp op;
    for (const auto& key : upserts) op.upsert_values[key] = "v";
    op.delete_keys = std::move(deletes);
    if (schema_metadata) op.schema_metadata = std::map<std::string, std::string>{{"k", "v"}};
    return op;
}

Operation MemWalOp(const std::string& region) {
    UpdateMemWalStateOp op;
    MemWal added;
    added.id = MemWalId{region, 1};
    op.added.push_back(added);
    return op;
}

bool Conflicts(const Operation& a, const Operation& b) {
    return CheckConflict(a, b) == ConflictVerdict::kConflict;
}

} // namespace

TEST(ConflictTest, SymmetricForEveryPair) {
    std::vector<Operation> ops = {
        Append(), Append("r1"), Append("r2"),
        Delete({1}), Delete({2}, {3}), Delete({}, {1}),
        Overwrite(),
        CreateIndex("a", {1, 2}), CreateIndex("b", {5}), CreateIndex("", {}, {"u1"}),
        Rewrite({1}), Rewrite({3, 4}), Rewrite({5}),
        Config({"x"}), Config({"y"}, {"x"}), Config({}, {}, true),
        MemWalOp("r1"), MemWalOp("r2"),
    };
    for (size_t i = 0; i < ops.size(); ++i) {
        for (size_t j = 0; j < ops.size(); ++j) {
            EXPECT_EQ(CheckConflict(ops[i], ops[j]), CheckConflict(ops[j], ops[i]))
                << OperationKindName(KindOf(ops[i])) << " #" << i << " vs "
                << OperationKindName(KindOf(ops[j])) << " #" << j;
        }
    }
}

TEST(ConflictTest, OverwriteConflictsWithEverything) {
    for (const auto& other : {Append(), Delete({1}), Overwrite(), CreateIndex("a", {}),
                              Rewrite({1}), Config({"x"}), MemWalOp("r")}) {
        EXPECT_TRUE(Conflicts(Overwrite(), other)) << OperationKindName(KindOf(other));
    }
}

TEST(ConflictTest, AppendsAreCompatible) {
    EXPECT_FALSE(Conflicts(Append(), Append()));
    EXPECT_FALSE(Conflicts(Append(), Delete({1})));
    EXPECT_FALSE(Conflicts(Append(), Rewrite({1})));
    EXPECT_FALSE(Conflicts(Append(), CreateIndex("a", {1})));
    EXPECT_FALSE(Conflicts(Append(), Config({"x"})));
    EXPECT_FALSE(Conflicts(Append(), MemWalOp("r1")));
}

TEST(ConflictTest, FlushConflictsOnSameRegionOnly) {
    EXPECT_TRUE(Conflicts(Append("r1"), Append("r1")));
    EXPECT_FALSE(Conflicts(Append("r1"), Append("r2")));
    EXPECT_TRUE(Conflicts(Append("r1"), MemWalOp("r1")));
    EXPECT_FALSE(Conflicts(Append("r1"), MemWalOp("r2")));
    EXPECT_FALSE(Conflicts(Append("r1"), Append()));
}

TEST(ConflictTest, DeletesConflictOnTouchedFragments) {
    EXPECT_TRUE(Conflicts(Delete({1}), Delete({1})));
    EXPECT_TRUE(Conflicts(Delete({1}), Delete({}, {1})));
    EXPECT_FALSE(Conflicts(Delete({1}), Delete({2}, {3})));
    EXPECT_TRUE(Conflicts(Delete({2}, {3}), Rewrite({3, 4})));
    EXPECT_FALSE(Conflicts(Delete({1}), Rewrite({3, 4})));
    EXPECT_FALSE(Conflicts(Delete({1}), CreateIndex("a", {1})));
    EXPECT_FALSE(Conflicts(Delete({1}), Config({"x"})));
}

TEST(ConflictTest, RewritesConflictOnSharedFragments) {
    EXPECT_TRUE(Conflicts(Rewrite({1, 2}), Rewrite({2, 3})));
    EXPECT_FALSE(Conflicts(Rewrite({1}), Rewrite({3, 4})));
}

TEST(ConflictTest, IndexCreation) {
    EXPECT_TRUE(Conflicts(CreateIndex("a", {1}), CreateIndex("a", {7})));
    EXPECT_FALSE(Conflicts(CreateIndex("a", {1}), CreateIndex("b", {1})));
    EXPECT_TRUE(Conflicts(CreateIndex("", {}, {"u1"}), CreateIndex("", {}, {"u1"})));
    EXPECT_TRUE(Conflicts(CreateIndex("a", {1, 2}), Rewrite({2})));
    EXPECT_FALSE(Conflicts(CreateIndex("a", {1, 2}), Rewrite({5})));
}

TEST(ConflictTest, ConfigUpdates) {
    EXPECT_TRUE(Conflicts(Config({"x"}), Config({}, {"x"})));
    EXPECT_FALSE(Conflicts(Config({"x"}), Config({"y"})));
    EXPECT_TRUE(Conflicts(Config({}, {}, true), Config({"z"}, {}, true)));
    EXPECT_FALSE(Conflicts(Config({"x"}), MemWalOp("r1")));
}

TEST(ConflictTest, MemWalUpdatesConflictPerRegion) {
    EXPECT_TRUE(Conflicts(MemWalOp("r1"), MemWalOp("r1")));
    EXPECT_FALSE(Conflicts(MemWalOp("r1"), MemWalOp("r2")));
}

} // namespace shale
