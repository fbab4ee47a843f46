#include <gtest/gtest.h>
#include "sync/Session.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;

namespace fs = std::filesystem;

class SessionTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("mirrorsync-session-" + std::to_string(::getpid()) + "-" +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    static WorkItem copyItem(const uint64_t seq, const std::string& path, const uint64_t size) {
        const Location src{std::nullopt, "/src", "/src", ClientType::Local};
        const Location dst{std::nullopt, "/dst", "/dst", ClientType::Local};
        auto item = WorkItem::copy(Endpoint{src, ms::storage::model::Entry{path, size}}, Endpoint{dst, ms::storage::model::Entry{path, size}}, 0);
        item.seq = seq;
        item.totalCount = seq;
        item.totalBytes = seq * size;
        return item;
    }

    static SessionHeader header(const std::string& id) {
        SessionHeader h;
        h.id = id;
        h.source = "/src";
        h.targets = {"/dst"};
        return h;
    }
};

TEST_F(SessionTest, IdDependsOnArgumentsAndPolicy) {
    const auto a = Session::makeId("/src", {"/dst"}, Policy{});
    EXPECT_EQ(a, Session::makeId("/src", {"/dst"}, Policy{}));
    EXPECT_NE(a, Session::makeId("/src", {"/other"}, Policy{}));
    EXPECT_NE(a, Session::makeId("/src", {"/dst"}, Policy{true, false, false, false}));
    EXPECT_EQ(a.size(), 32u);
}

TEST_F(SessionTest, LoadMissingReturnsNull) {
    EXPECT_EQ(Session::load(dir, "nope"), nullptr);
}

TEST_F(SessionTest, RoundTripsPlannedAndCompletedItems) {
    {
        auto s = Session::create(dir, header("abc"));
        s->append(copyItem(1, "a/1.txt", 10));
        s->append(copyItem(2, "a/2.txt", 20));
        s->append(copyItem(3, "b.txt", 5));
        s->markDone(copyItem(1, "a/1.txt", 10));
        s->markDone(copyItem(3, "b.txt", 5));
        s->setPrepared(3, 35);
    }

    const auto loaded = Session::load(dir, "abc");
    ASSERT_NE(loaded, nullptr);
    EXPECT_TRUE(loaded->header().prepared);
    EXPECT_EQ(loaded->header().totalObjects, 3u);
    EXPECT_EQ(loaded->header().totalBytes, 35u);
    EXPECT_EQ(loaded->maxSeq(), 3u);

    const auto items = loaded->items();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_TRUE(items[0].replay);
    EXPECT_FALSE(items[1].replay);
    EXPECT_TRUE(items[2].replay);
    EXPECT_EQ(items[1].source->entry.path, "a/2.txt");
    EXPECT_EQ(items[1].target.location.resolved, "/dst");
}

TEST_F(SessionTest, TornFinalLineIsIgnored) {
    {
        auto s = Session::create(dir, header("torn"));
        s->append(copyItem(1, "x", 1));
        s->setPrepared(1, 1);
    }
    {
        std::ofstream data(dir / "torn.data", std::ios::app);
        data << "{\"seq\": 2, \"targ";
    }

    const auto loaded = Session::load(dir, "torn");
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->items().size(), 1u);
}

TEST_F(SessionTest, RemoveDeletesAllFiles) {
    auto s = Session::create(dir, header("gone"));
    s->append(copyItem(1, "x", 1));
    s->remove();
    EXPECT_FALSE(fs::exists(dir / "gone.json"));
    EXPECT_FALSE(fs::exists(dir / "gone.data"));
    EXPECT_FALSE(fs::exists(dir / "gone.done"));
    EXPECT_FALSE(Session::exists(dir, "gone"));
}

TEST_F(SessionTest, ErrorItemsSurviveTheLog) {
    {
        auto s = Session::create(dir, header("err"));
        auto item = WorkItem::failure(Error{ErrorKind::OverwriteNotAllowed, "/dst/x", "overwrite not allowed"}, 0);
        item.seq = 1;
        s->append(item);
    }
    const auto loaded = Session::load(dir, "err");
    ASSERT_NE(loaded, nullptr);
    const auto items = loaded->items();
    ASSERT_EQ(items.size(), 1u);
    ASSERT_TRUE(items[0].error.has_value());
    EXPECT_EQ(items[0].error->kind, ErrorKind::OverwriteNotAllowed);
    EXPECT_FALSE(loaded->header().prepared);
}
