#include <gtest/gtest.h>
#include <shale/status.h>

namespace shale {

class StatusTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StatusTest, DefaultConstructor) {
    Status status;
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.code(), StatusCode::kOk);
    EXPECT_TRUE(status.message().empty());
}

TEST_F(StatusTest, StatusWithMessage) {
    Status status(StatusCode::kInvalidArgument, "bad field id");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "bad field id");
}

TEST_F(StatusTest, CommitOutcomes) {
    EXPECT_TRUE(Status::WriteConflict("x").IsWriteConflict());
    EXPECT_TRUE(Status::ResourceExhausted("x").IsResourceExhausted());
    EXPECT_TRUE(Status::Aborted("x").IsAborted());
    EXPECT_TRUE(Status::InvariantViolation("x").IsInvariantViolation());
    EXPECT_TRUE(Status::Incompatible("x").IsIncompatible());
    EXPECT_TRUE(Status::AlreadyExists("x").IsAlreadyExists());
    EXPECT_FALSE(Status::WriteConflict("x").IsAborted());
}

TEST_F(StatusTest, ToString) {
    EXPECT_EQ(Status::OK().ToString(), "OK");
    EXPECT_EQ(Status::Corruption("data corrupted").ToString(), "Corruption: data corrupted");
}

} // namespace shale
