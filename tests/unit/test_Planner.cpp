#include <gtest/gtest.h>
#include "sync/Differ.hpp"
#include "sync/Planner.hpp"
#include "support/MemoryClient.hpp"

#include <vector>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;
using ms::concurrency::Channel;
using ms::test::MemoryClient;

namespace {

std::vector<WorkItem> plan(const MemoryClient& source, const MemoryClient& target, const Policy& policy) {
    Channel<WorkItem> out;
    Tally tally;
    std::atomic<bool> interrupt{false};
    Planner planner(policy, tally, out, interrupt);
    Differ differ(source, target, true);
    EXPECT_TRUE(planner.prepare(differ, source.location(), target.location(), 0));
    out.close();

    std::vector<WorkItem> items;
    while (auto item = out.pop()) items.push_back(std::move(*item));
    return items;
}

}

class PlannerTest : public ::testing::Test {
protected:
    MemoryClient source{"/src"};
    MemoryClient target{"/dst"};

    void SetUp() override {
        source.addFile("a/1.txt", 10);
        source.addFile("a/2.txt", 20);
        target.addFile("a/2.txt", 25);
        target.addFile("a/stale.txt", 3);
        target.addFile("old/deep.txt", 3);
    }
};

TEST_F(PlannerTest, NoDeletesUnlessRemoveAndForce) {
    for (const bool force : {false, true})
        for (const bool fake : {false, true})
            for (const bool remove : {false, true}) {
                Policy policy{force, fake, remove, false};
                size_t deletes = 0;
                for (const auto& item : plan(source, target, policy))
                    if (item.isDelete()) ++deletes;

                if (remove && force) EXPECT_EQ(deletes, 2u);
                else EXPECT_EQ(deletes, 0u) << "force=" << force << " fake=" << fake << " remove=" << remove;
            }
}

TEST_F(PlannerTest, SizeMismatchWithoutForceIsAnErrorRecord) {
    const auto items = plan(source, target, Policy{});
    ASSERT_EQ(items.size(), 2u);

    EXPECT_TRUE(items[0].isCopy());
    EXPECT_EQ(items[0].source->entry.path, "a/1.txt");

    ASSERT_TRUE(items[1].error.has_value());
    EXPECT_EQ(items[1].error->kind, ErrorKind::OverwriteNotAllowed);
    EXPECT_NE(items[1].error->message.find("overwrite not allowed"), std::string::npos);
    EXPECT_EQ(items[1].size(), 20u);
}

TEST_F(PlannerTest, ForceOverwritesSizeMismatch) {
    const auto items = plan(source, target, Policy{true, false, false, false});
    ASSERT_EQ(items.size(), 2u);
    EXPECT_TRUE(items[1].isCopy());
    EXPECT_EQ(items[1].target.entry.path, "a/2.txt");
}

TEST_F(PlannerTest, TotalsAccumulateOverWorkItemsOnly) {
    const auto items = plan(source, target, Policy{});
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].seq, 1u);
    EXPECT_EQ(items[0].totalCount, 1u);
    EXPECT_EQ(items[0].totalBytes, 10u);
    // the error record does not add to the totals
    EXPECT_EQ(items[1].seq, 2u);
    EXPECT_EQ(items[1].totalCount, 1u);
    EXPECT_EQ(items[1].totalBytes, 10u);
}

TEST_F(PlannerTest, TimeOnlyDifferenceNeverActs) {
    MemoryClient src{"/s"}, dst{"/d"};
    src.addFile("f", std::string(3, 'a'), 100);
    dst.addFile("f", std::string(3, 'a'), 999);
    for (const bool force : {false, true})
        EXPECT_TRUE(plan(src, dst, Policy{force, false, force, false}).empty());
}

TEST_F(PlannerTest, TypeMismatchIsInvalidTarget) {
    MemoryClient src{"/s"}, dst{"/d"};
    src.addFile("x/inner", 1);
    dst.addFile("x", 1);
    const auto items = plan(src, dst, Policy{true, false, true, false});
    ASSERT_EQ(items.size(), 1u);
    ASSERT_TRUE(items.front().error.has_value());
    EXPECT_EQ(items.front().error->kind, ErrorKind::InvalidTarget);
}

TEST_F(PlannerTest, TypeMismatchLeavesTargetDirectoryAlone) {
    MemoryClient src{"/s"}, dst{"/d"};
    src.addFile("x", 1);
    dst.addFile("x/keep.txt", 4);
    dst.addFile("x/sub/keep.txt", 4);
    const auto items = plan(src, dst, Policy{true, false, true, false});
    ASSERT_EQ(items.size(), 1u);
    ASSERT_TRUE(items.front().error.has_value());
    EXPECT_EQ(items.front().error->kind, ErrorKind::InvalidTarget);
}

TEST_F(PlannerTest, UnlistableTargetSubtreeIsNeverOverwritten) {
    MemoryClient src{"/s"}, dst{"/d"};
    src.addFile("a/1.txt", 10);
    src.addFile("b.txt", 2);
    dst.addFile("a/1.txt", 10);
    dst.failListing("a", Error{ErrorKind::Transport, "", "connection reset"});

    Channel<WorkItem> out;
    Tally tally;
    std::atomic<bool> interrupt{false};
    const Policy policy{};
    Planner planner(policy, tally, out, interrupt);
    Differ differ(src, dst, true);
    ASSERT_TRUE(planner.prepare(differ, src.location(), dst.location(), 0));
    out.close();

    std::vector<WorkItem> items;
    while (auto item = out.pop()) items.push_back(std::move(*item));

    EXPECT_EQ(planner.listingErrors(), 1u);
    ASSERT_EQ(items.size(), 2u);
    ASSERT_TRUE(items[0].error.has_value());
    EXPECT_EQ(items[0].error->kind, ErrorKind::Transport);
    EXPECT_EQ(items[0].error->path, "a");
    EXPECT_TRUE(items[1].isCopy());
    EXPECT_EQ(items[1].source->entry.path, "b.txt");
}

TEST_F(PlannerTest, UnlistableSourceSubtreeIsNeverDeleted) {
    MemoryClient src{"/s"}, dst{"/d"};
    src.addDir("a");
    src.failListing("a", Error{ErrorKind::Transport, "", "connection reset"});
    dst.addFile("a/keep.txt", 3);
    dst.addFile("a/deep/keep.txt", 3);
    dst.addFile("gone.txt", 3);

    const auto items = plan(src, dst, Policy{true, false, true, false});
    size_t deletes = 0, errors = 0;
    for (const auto& item : items) {
        if (item.error) ++errors;
        if (item.isDelete()) {
            ++deletes;
            EXPECT_EQ(item.target.entry.path, "gone.txt");
        }
    }
    EXPECT_EQ(errors, 1u);
    EXPECT_EQ(deletes, 1u);
}

TEST_F(PlannerTest, StopsWhenInterrupted) {
    Channel<WorkItem> out;
    Tally tally;
    std::atomic<bool> interrupt{true};
    const Policy policy{};
    Planner planner(policy, tally, out, interrupt);
    Differ differ(source, target, true);
    EXPECT_FALSE(planner.prepare(differ, source.location(), target.location(), 0));
    EXPECT_EQ(planner.emitted(), 0u);
}

TEST(PolicyTest, RemoveRequiresForce) {
    EXPECT_THROW((Policy{false, false, true, false}.validate()), std::invalid_argument);
    EXPECT_NO_THROW((Policy{true, false, true, false}.validate()));
    EXPECT_FALSE((Policy{false, false, true, false}.allowsDelete()));
}
