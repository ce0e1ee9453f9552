#include <gtest/gtest.h>
#include <shale/commit.h>
#include <shale/version_chain.h>

#include "test_util.h"

namespace shale {

class VersionChainTest : public test::ShaleTestBase {
protected:
    void SetUp() override {
        engine_ = MakeEngine();
        CommitResult result;
        ASSERT_OK(CreateTable(engine_.get(), 2, 100, false, &result));
        for (int i = 0; i < 2; ++i) {
            AppendOp op;
            op.fragments.push_back(test::MakeTestFragment(schema_, "data/more-" + std::to_string(i), 10));
            ASSERT_OK(engine_->Propose(result.manifest.version, std::move(op), CommitOptions(), &result));
        }
    }

    VersionChain chain() { return VersionChain(store_, root_); }

    std::unique_ptr<TransactionEngine> engine_;
};

TEST_F(VersionChainTest, PathConventions) {
    EXPECT_EQ(ManifestPath(12), "_versions/12.manifest");
    EXPECT_EQ(TransactionFileName(3, "abc"), "3-abc.txn");
    EXPECT_EQ(TransactionPath("3-abc.txn"), "_transactions/3-abc.txn");
    EXPECT_EQ(TagPath("prod"), "_refs/tags/prod.json");
}

TEST_F(VersionChainTest, HeadAndHistory) {
    VersionChain versions = chain();
    uint64_t head = 0;
    ASSERT_OK(versions.HeadVersion(&head));
    EXPECT_EQ(head, 3u);

    std::vector<VersionInfo> infos;
    ASSERT_OK(versions.ListVersions(&infos));
    ASSERT_EQ(infos.size(), 3u);
    EXPECT_EQ(infos[0].version, 1u);
    EXPECT_EQ(infos[0].summary.total_rows, 200u);
    EXPECT_EQ(infos[2].summary.total_rows, 220u);

    Manifest first;
    ASSERT_OK(versions.Load(VersionRef::Version(1), &first));
    EXPECT_EQ(first.fragments.size(), 2u);
    Manifest latest;
    ASSERT_OK(versions.Load(VersionRef::Latest(), &latest));
    EXPECT_EQ(latest.version, 3u);
    EXPECT_EQ(latest.fragments.size(), 4u);
}

TEST_F(VersionChainTest, MissingVersionAndEmptyDataset) {
    Manifest manifest;
    EXPECT_TRUE(chain().Load(9, &manifest).IsNotFound());

    VersionChain empty(store_, "tables/none");
    uint64_t head = 0;
    EXPECT_TRUE(empty.HeadVersion(&head).IsNotFound());
}

TEST_F(VersionChainTest, MisplacedManifestIsCorruption) {
    std::string bytes;
    ASSERT_OK(store_->Get(JoinPath(root_, ManifestPath(2)), &bytes));
    ASSERT_OK(store_->Put(JoinPath(root_, ManifestPath(7)), bytes));

    Manifest manifest;
    EXPECT_TRUE(chain().Load(7, &manifest).IsCorruption());
}

TEST_F(VersionChainTest, TagsPointAtVersions) {
    VersionChain versions = chain();
    ASSERT_OK(versions.CreateTag("release-1.0", 2));
    EXPECT_TRUE(versions.CreateTag("release-1.0", 3).IsAlreadyExists());
    EXPECT_TRUE(versions.CreateTag("ghost", 42).IsNotFound());
    EXPECT_TRUE(versions.CreateTag("bad/name", 1).IsInvalidArgument());
    EXPECT_TRUE(versions.CreateTag(".hidden", 1).IsInvalidArgument());

    Manifest tagged;
    ASSERT_OK(versions.Load(VersionRef::Tag("release-1.0"), &tagged));
    EXPECT_EQ(tagged.version, 2u);

    TagInfo info;
    ASSERT_OK(versions.GetTag("release-1.0", &info));
    EXPECT_EQ(info.version, 2u);
    EXPECT_GT(info.manifest_size, 0u);

    ASSERT_OK(versions.CreateTag("latest_good", 3));
    std::vector<TagInfo> tags;
    ASSERT_OK(versions.ListTags(&tags));
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0].name, "latest_good");
    EXPECT_EQ(tags[1].name, "release-1.0");

    ASSERT_OK(versions.DeleteTag("release-1.0"));
    EXPECT_TRUE(versions.DeleteTag("release-1.0").IsNotFound());
    EXPECT_TRUE(versions.Load(VersionRef::Tag("release-1.0"), &tagged).IsNotFound());
}

TEST_F(VersionChainTest, MalformedTagIsCorruption) {
    ASSERT_OK(store_->Put(JoinPath(root_, TagPath("broken")), "{\"version\": \"two\"}"));
    TagInfo info;
    EXPECT_TRUE(chain().GetTag("broken", &info).IsCorruption());
}

TEST_F(VersionChainTest, TagsWithoutConditionalPut) {
    auto plain = std::make_shared<MemoryObjectStore>(false);
    std::string bytes;
    ASSERT_OK(store_->Get(JoinPath(root_, ManifestPath(1)), &bytes));
    ASSERT_OK(plain->Put(JoinPath(root_, ManifestPath(1)), bytes));

    VersionChain versions(plain, root_);
    ASSERT_OK(versions.CreateTag("v1", 1));
    EXPECT_TRUE(versions.CreateTag("v1", 1).IsAlreadyExists());
}

} // namespace shale
