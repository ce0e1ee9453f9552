#include <gtest/gtest.h>
#include <shale/mem_wal.h>
#include <shale/object_store.h>
#include <shale/version_chain.h>

#include "test_util.h"

namespace shale {

class MemWalTest : public test::ShaleTestBase {
protected:
    void SetUp() override {
        engine_ = MakeEngine();
        CommitResult created;
        ASSERT_OK(CreateTable(engine_.get(), 1, 10, false, &created));
        writer_ = std::make_unique<MemWalWriter>(engine_.get(), "writer-a");
        ASSERT_OK(writer_->CreateRegion("r1", "mem/r1/0", "wal/r1/0", nullptr));
    }

    Manifest Head() {
        Manifest manifest;
        EXPECT_OK(VersionChain(store_, root_).LoadLatest(&manifest));
        return manifest;
    }

    const MemWal* Record(const Manifest& manifest, const std::string& region, uint64_t generation) {
        const MemWalDetails* details = manifest.indices.MemWals();
        return details ? details->Find(MemWalId{region, generation}) : nullptr;
    }

    MemWal NextGeneration(const MemWal& current) {
        MemWal next;
        next.id = MemWalId{current.id.region, current.id.generation + 1};
        next.wal_location = "wal/" + current.id.region + "/" + std::to_string(next.id.generation);
        next.owner_id = current.owner_id;
        return next;
    }

    std::unique_ptr<TransactionEngine> engine_;
    std::unique_ptr<MemWalWriter> writer_;
};

TEST_F(MemWalTest, CreateRegionOpensGenerationZero) {
    Manifest head = Head();
    const MemWal* record = Record(head, "r1", 0);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->state, MemWalState::kOpen);
    EXPECT_EQ(record->owner_id, "writer-a");
    EXPECT_EQ(record->last_updated_dataset_version, head.version);

    EXPECT_TRUE(writer_->CreateRegion("r1", "m", "w", nullptr).IsAlreadyExists());
    EXPECT_TRUE(writer_->CreateRegion("", "m", "w", nullptr).IsInvalidArgument());

    IndexCriteria hidden;
    EXPECT_TRUE(head.indices.Describe(hidden, head.fragments).empty());
}

TEST_F(MemWalTest, AppendAndReplay) {
    uint64_t sequence = 99;
    ASSERT_OK(writer_->AppendEntry("r1", "put k1", &sequence));
    EXPECT_EQ(sequence, 0u);
    ASSERT_OK(writer_->AppendEntry("r1", "put k2", &sequence));
    EXPECT_EQ(sequence, 1u);

    std::vector<MemWalEntry> entries;
    ASSERT_OK(writer_->ReplayEntries(MemWalId{"r1", 0}, &entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].data, "put k1");
    EXPECT_EQ(entries[1].sequence, 1u);
}

TEST_F(MemWalTest, TakenSequenceLeavesHole) {
    // Another writer claimed id 0 but never recorded it.
    ASSERT_OK(store_->Put(WalEntryPath("wal/r1/0", 0), "orphan"));

    uint64_t sequence = 0;
    ASSERT_OK(writer_->AppendEntry("r1", "first", &sequence));
    EXPECT_EQ(sequence, 1u);
    ASSERT_OK(writer_->AppendEntry("r1", "second", &sequence));
    EXPECT_EQ(sequence, 2u);

    std::vector<MemWalEntry> entries;
    ASSERT_OK(writer_->ReplayEntries(MemWalId{"r1", 0}, &entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].data, "first");
    EXPECT_EQ(entries[1].data, "second");
}

TEST_F(MemWalTest, RecordedButMissingEntryIsCorruption) {
    uint64_t sequence = 0;
    ASSERT_OK(writer_->AppendEntry("r1", "entry", &sequence));
    ASSERT_OK(store_->Delete(WalEntryPath("wal/r1/0", sequence)));

    std::vector<MemWalEntry> entries;
    EXPECT_TRUE(writer_->ReplayEntries(MemWalId{"r1", 0}, &entries).IsCorruption());
}

TEST_F(MemWalTest, SealOpensNextGenerationAtomically) {
    Manifest before = Head();
    MemWal opened;
    ASSERT_OK(writer_->Seal("r1", "mem/r1/1", "wal/r1/1", &opened));
    EXPECT_EQ(opened.id.generation, 1u);

    Manifest after = Head();
    EXPECT_EQ(after.version, before.version + 1);
    EXPECT_EQ(Record(after, "r1", 0)->state, MemWalState::kSealed);
    EXPECT_EQ(Record(after, "r1", 1)->state, MemWalState::kOpen);
    EXPECT_EQ(after.indices.MemWals()->FindOpen("r1")->id.generation, 1u);

    // The sealed generation no longer takes entries; the open one does.
    uint64_t sequence = 0;
    ASSERT_OK(writer_->AppendEntry("r1", "after seal", &sequence));
    EXPECT_EQ(sequence, 0u);
    ObjectMeta meta;
    EXPECT_OK(store_->Head(WalEntryPath("wal/r1/1", 0), &meta));
}

TEST_F(MemWalTest, SealNeedsFreshWalLocation) {
    EXPECT_TRUE(writer_->Seal("r1", "mem/r1/1", "wal/r1/0", nullptr).IsInvalidArgument());
    EXPECT_TRUE(writer_->Seal("missing", "m", "w", nullptr).IsNotFound());
}

TEST_F(MemWalTest, StatesOnlyMoveForward) {
    Manifest head = Head();
    MemWal record = *Record(head, "r1", 0);

    MemWalUpdate seal;
    seal.id = record.id;
    seal.expected_owner_id = "writer-a";
    seal.record = record;
    seal.record.state = MemWalState::kSealed;
    UpdateMemWalStateOp op;
    op.updated.push_back(seal);
    op.added.push_back(NextGeneration(record));
    CommitResult sealed;
    ASSERT_OK(engine_->Propose(head.version, op, CommitOptions(), &sealed));

    MemWalUpdate reopen = seal;
    reopen.record.state = MemWalState::kOpen;
    UpdateMemWalStateOp back;
    back.updated.push_back(reopen);
    CommitResult result;
    EXPECT_TRUE(engine_->Propose(sealed.manifest.version, back, CommitOptions(), &result)
                    .IsInvariantViolation());

    MemWalUpdate move = seal;
    move.record.wal_location = "wal/elsewhere";
    UpdateMemWalStateOp relocate;
    relocate.updated.push_back(move);
    EXPECT_TRUE(engine_->Propose(sealed.manifest.version, relocate, CommitOptions(), &result)
                    .IsInvariantViolation());
}

TEST_F(MemWalTest, FlushedOnlyThroughFlushAppend) {
    Manifest head = Head();
    MemWalUpdate flush;
    flush.id = MemWalId{"r1", 0};
    flush.expected_owner_id = "writer-a";
    flush.record = *Record(head, "r1", 0);
    flush.record.state = MemWalState::kFlushed;
    UpdateMemWalStateOp skip;
    skip.updated.push_back(flush);
    CommitResult result;
    EXPECT_TRUE(engine_->Propose(head.version, skip, CommitOptions(), &result).IsInvariantViolation());

    // A SEALED generation cannot be marked FLUSHED without its data either.
    ASSERT_OK(writer_->Seal("r1", "mem/r1/1", "wal/r1/1", nullptr));
    head = Head();
    flush.record = *Record(head, "r1", 0);
    flush.record.state = MemWalState::kFlushed;
    UpdateMemWalStateOp sealed_skip;
    sealed_skip.updated.push_back(flush);
    EXPECT_TRUE(engine_->Propose(head.version, sealed_skip, CommitOptions(), &result)
                    .IsInvariantViolation());
    EXPECT_EQ(Record(Head(), "r1", 0)->state, MemWalState::kSealed);
}

TEST_F(MemWalTest, SealMustOpenTheNextGeneration) {
    Manifest head = Head();
    MemWal record = *Record(head, "r1", 0);
    MemWalUpdate seal;
    seal.id = record.id;
    seal.expected_owner_id = "writer-a";
    seal.record = record;
    seal.record.state = MemWalState::kSealed;

    UpdateMemWalStateOp alone;
    alone.updated.push_back(seal);
    CommitResult result;
    EXPECT_TRUE(engine_->Propose(head.version, alone, CommitOptions(), &result).IsInvariantViolation());

    MemWal skipped = NextGeneration(record);
    skipped.id.generation = 2;
    UpdateMemWalStateOp gap;
    gap.updated.push_back(seal);
    gap.added.push_back(skipped);
    EXPECT_TRUE(engine_->Propose(head.version, gap, CommitOptions(), &result).IsInvariantViolation());

    EXPECT_EQ(Record(Head(), "r1", 0)->state, MemWalState::kOpen);
    EXPECT_EQ(Head().version, head.version);
}

TEST_F(MemWalTest, SecondOpenGenerationIsRejected) {
    MemWal extra;
    extra.id = MemWalId{"r1", 5};
    extra.wal_location = "wal/r1/5";
    extra.owner_id = "writer-a";
    UpdateMemWalStateOp op;
    op.added.push_back(extra);
    CommitResult result;
    EXPECT_TRUE(engine_->Propose(Head().version, op, CommitOptions(), &result).IsInvariantViolation());

    MemWal older = extra;
    older.id.generation = 0;
    older.id.region = "r1";
    UpdateMemWalStateOp duplicate;
    duplicate.added.push_back(older);
    EXPECT_TRUE(engine_->Propose(Head().version, duplicate, CommitOptions(), &result)
                    .IsAlreadyExists());
}

TEST_F(MemWalTest, OwnerMismatchIsInvariantViolation) {
    MemWalWriter other(engine_.get(), "writer-b");
    uint64_t sequence = 0;
    EXPECT_TRUE(other.AppendEntry("r1", "intruder", &sequence).IsInvariantViolation());

    MemWal claimed;
    ASSERT_OK(other.ClaimOwnership("r1", &claimed));
    EXPECT_EQ(claimed.owner_id, "writer-b");
    ASSERT_OK(other.AppendEntry("r1", "recovered", &sequence));

    // The previous owner is fenced out.
    EXPECT_TRUE(writer_->AppendEntry("r1", "stale", &sequence).IsInvariantViolation());
    EXPECT_TRUE(writer_->Seal("r1", "m", "wal/r1/1", nullptr).IsInvariantViolation());
}

TEST_F(MemWalTest, FlushCommitsFragmentsAndState) {
    EXPECT_TRUE(writer_->MarkFlushed(MemWalId{"r1", 0}, {}, nullptr).IsInvariantViolation());

    ASSERT_OK(writer_->Seal("r1", "mem/r1/1", "wal/r1/1", nullptr));
    std::vector<Fragment> flushed = {test::MakeTestFragment(schema_, "data/flush-0", 25)};
    CommitResult result;
    ASSERT_OK(writer_->MarkFlushed(MemWalId{"r1", 0}, flushed, &result));

    EXPECT_EQ(result.manifest.fragments.size(), 2u);
    EXPECT_EQ(result.manifest.NumLiveRows(), 35u);
    EXPECT_EQ(Record(result.manifest, "r1", 0)->state, MemWalState::kFlushed);

    EXPECT_TRUE(writer_->MarkFlushed(MemWalId{"r1", 0}, {}, nullptr).IsInvariantViolation());
}

TEST_F(MemWalTest, CleanupRemovesFlushedRecordsAndEntries) {
    uint64_t sequence = 0;
    ASSERT_OK(writer_->AppendEntry("r1", "a", &sequence));
    ASSERT_OK(writer_->AppendEntry("r1", "b", &sequence));
    ASSERT_OK(writer_->Seal("r1", "mem/r1/1", "wal/r1/1", nullptr));
    ASSERT_OK(writer_->AppendEntry("r1", "c", &sequence));

    size_t removed = 99;
    ASSERT_OK(writer_->Cleanup(&removed));
    EXPECT_EQ(removed, 0u);

    ASSERT_OK(writer_->MarkFlushed(MemWalId{"r1", 0}, {}, nullptr));
    ASSERT_OK(writer_->Cleanup(&removed));
    EXPECT_EQ(removed, 1u);

    Manifest head = Head();
    EXPECT_EQ(Record(head, "r1", 0), nullptr);
    ASSERT_NE(Record(head, "r1", 1), nullptr);

    std::vector<ObjectMeta> objects;
    ASSERT_OK(store_->List("wal/r1/0/", &objects));
    EXPECT_TRUE(objects.empty());
    ASSERT_OK(store_->List("wal/r1/1/", &objects));
    EXPECT_EQ(objects.size(), 1u);
}

TEST_F(MemWalTest, CleanupChecksOwner) {
    ASSERT_OK(writer_->Seal("r1", "mem/r1/1", "wal/r1/1", nullptr));
    ASSERT_OK(writer_->MarkFlushed(MemWalId{"r1", 0}, {}, nullptr));

    MemWalWriter other(engine_.get(), "writer-b");
    ASSERT_OK(other.ClaimOwnership("r1", nullptr));
    size_t removed = 99;
    EXPECT_TRUE(other.Cleanup(&removed).IsInvariantViolation());
    ASSERT_NE(Record(Head(), "r1", 0), nullptr);

    ASSERT_OK(writer_->Cleanup(&removed));
    EXPECT_EQ(removed, 1u);
    EXPECT_EQ(Record(Head(), "r1", 0), nullptr);
}

TEST_F(MemWalTest, RegionsAreIndependent) {
    MemWalWriter other(engine_.get(), "writer-b");
    ASSERT_OK(other.CreateRegion("r2", "mem/r2/0", "wal/r2/0", nullptr));

    uint64_t sequence = 0;
    ASSERT_OK(writer_->AppendEntry("r1", "x", &sequence));
    ASSERT_OK(other.AppendEntry("r2", "y", &sequence));
    ASSERT_OK(writer_->Seal("r1", "mem/r1/1", "wal/r1/1", nullptr));

    Manifest head = Head();
    EXPECT_EQ(Record(head, "r2", 0)->state, MemWalState::kOpen);
    EXPECT_EQ(Record(head, "r2", 0)->wal_entries.Length(), 1u);
}

TEST(MemWalStoreTest, AppendNeedsConditionalPut) {
    auto store = std::make_shared<MemoryObjectStore>(false);
    auto lock = std::make_shared<test::FakeCommitLock>();
    std::unique_ptr<CommitHandler> handler;
    ASSERT_OK(CreateCommitHandler(*store, lock, &handler));
    TransactionEngine engine(VersionChain(store, "t"), std::move(handler));

    Schema schema = test::MakeFlatSchema({"a"});
    OverwriteOp create;
    create.schema = schema;
    create.fragments.push_back(test::MakeTestFragment(schema, "data/a", 1));
    CommitResult created;
    ASSERT_OK(engine.Propose(0, create, CommitOptions(), &created));

    MemWalWriter writer(&engine, "w");
    ASSERT_OK(writer.CreateRegion("r", "m", "wal/r/0", nullptr));
    uint64_t sequence = 0;
    EXPECT_EQ(writer.AppendEntry("r", "x", &sequence).code(), StatusCode::kNotImplemented);
}

} // namespace shale
