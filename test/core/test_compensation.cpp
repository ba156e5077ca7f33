#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/CompensationStack.hpp"

using namespace baretree;

// Test: Inverses run newest first
TEST(CompensationStackTest, UnwindRunsInReverseOrder) {
    CompensationStack stack;
    std::vector<int> order;
    for (int i = 1; i <= 3; ++i) {
        stack.push("step " + std::to_string(i), [&order, i]() -> Expected<void> {
            order.push_back(i);
            return {};
        });
    }
    ASSERT_EQ(stack.size(), 3u);

    auto res = stack.unwind();
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(order, (std::vector<int>{3, 2, 1}));
    EXPECT_TRUE(stack.empty());
}

// Test: Each inverse runs exactly once, even if unwind is called again
TEST(CompensationStackTest, UnwindIsOneShot) {
    CompensationStack stack;
    int runs = 0;
    stack.push("count", [&runs]() -> Expected<void> {
        ++runs;
        return {};
    });
    ASSERT_TRUE(stack.unwind().has_value());
    ASSERT_TRUE(stack.unwind().has_value());
    EXPECT_EQ(runs, 1);
}

// Test: A failing inverse does not stop the others
TEST(CompensationStackTest, FailuresAreCollected) {
    CompensationStack stack;
    bool firstRan = false;
    stack.push("first", [&firstRan]() -> Expected<void> {
        firstRan = true;
        return {};
    });
    stack.push("second", []() -> Expected<void> {
        return Error{ErrorCode::IoError, "disk gone"};
    });

    auto res = stack.unwind();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::RollbackFailed);
    EXPECT_NE(res.error().message.find("second: disk gone"), std::string::npos);
    EXPECT_TRUE(firstRan);
}

TEST(CompensationStackTest, CommitDropsInverses) {
    CompensationStack stack;
    bool ran = false;
    stack.push("never", [&ran]() -> Expected<void> {
        ran = true;
        return {};
    });
    EXPECT_EQ(stack.pending(), std::vector<std::string>{"never"});
    stack.commit();
    EXPECT_TRUE(stack.empty());
    ASSERT_TRUE(stack.unwind().has_value());
    EXPECT_FALSE(ran);
}

// Test: rollBack keeps the forward error code when the rollback succeeds
TEST(CompensationStackTest, RollBackKeepsForwardCode) {
    CompensationStack stack;
    stack.push("noop", []() -> Expected<void> { return {}; });
    Error err = rollBack(stack, Error{ErrorCode::LinkFailed, "cannot write HEAD"});
    EXPECT_EQ(err.code, ErrorCode::LinkFailed);
    EXPECT_NE(err.message.find("cannot write HEAD"), std::string::npos);
    EXPECT_NE(err.message.find("rolled back"), std::string::npos);
}

// Test: A double failure reports both errors
TEST(CompensationStackTest, RollBackReportsDoubleFailure) {
    CompensationStack stack;
    stack.push("restore", []() -> Expected<void> {
        return Error{ErrorCode::IoError, "read-only filesystem"};
    });
    Error err = rollBack(stack, Error{ErrorCode::TransplantFailed, "rename failed"});
    EXPECT_EQ(err.code, ErrorCode::RollbackFailed);
    EXPECT_NE(err.message.find("rename failed"), std::string::npos);
    EXPECT_NE(err.message.find("read-only filesystem"), std::string::npos);
}

TEST(CompensationStackTest, RollBackOnEmptyStackReturnsForwardError) {
    CompensationStack stack;
    Error err = rollBack(stack, Error{ErrorCode::VcsFailed, "git failed"});
    EXPECT_EQ(err.code, ErrorCode::VcsFailed);
    EXPECT_EQ(err.message, "git failed");
}
