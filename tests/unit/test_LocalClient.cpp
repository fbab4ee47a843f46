#include <gtest/gtest.h>
#include "storage/local/LocalClient.hpp"
#include "storage/local/InotifyWatch.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace ms::storage;
namespace fs = std::filesystem;

class LocalClientTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("mirrorsync-local-" + std::to_string(::getpid()) + "-" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override { fs::remove_all(root); }

    void write(const std::string& rel, const std::string& data) const {
        fs::create_directories((root / rel).parent_path());
        std::ofstream(root / rel, std::ios::binary) << data;
    }

    [[nodiscard]] LocalClient client(const fs::path& at) const {
        return LocalClient(Location{std::nullopt, at.string(), at.string(), ClientType::Local});
    }

    static std::vector<std::string> paths(Lister& lister) {
        std::vector<std::string> out;
        while (auto item = lister.next()) {
            EXPECT_FALSE(item->error.has_value());
            if (item->entry) out.push_back(item->entry->path);
        }
        return out;
    }
};

TEST_F(LocalClientTest, ListsDepthFirstInPathOrder) {
    write("b.txt", "b");
    write("a-x", "x");
    write("a/2", "22");
    write("a/1/z", "z");

    const auto c = client(root);
    const auto withDirs = c.list("", true, true);
    EXPECT_EQ(paths(*withDirs), (std::vector<std::string>{"a", "a/1", "a/1/z", "a/2", "a-x", "b.txt"}));

    const auto filesOnly = c.list("", true, false);
    EXPECT_EQ(paths(*filesOnly), (std::vector<std::string>{"a/1/z", "a/2", "a-x", "b.txt"}));

    const auto shallow = c.list("", false, true);
    EXPECT_EQ(paths(*shallow), (std::vector<std::string>{"a", "a-x", "b.txt"}));
}

TEST_F(LocalClientTest, MissingRootListsNotFound) {
    const auto c = client(root / "absent");
    const auto lister = c.list("", true, true);
    const auto item = lister->next();
    ASSERT_TRUE(item.has_value());
    ASSERT_TRUE(item->error.has_value());
    EXPECT_EQ(item->error->kind, ErrorKind::NotFound);
    EXPECT_TRUE(item->error->path.empty());
}

TEST_F(LocalClientTest, PutCreatesParentsAndReplacesAtomically) {
    const auto c = client(root);
    std::istringstream in("hello");
    c.put("deep/er/f.txt", 5, in);

    const auto st = c.stat("deep/er/f.txt");
    EXPECT_EQ(st.size, 5u);
    EXPECT_FALSE(st.isDir);
    EXPECT_TRUE(c.stat("deep").isDir);

    // no temporary files left behind
    size_t count = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(root / "deep/er")) ++count;
    EXPECT_EQ(count, 1u);

    const auto back = c.get("deep/er/f.txt");
    std::ostringstream out;
    out << back->rdbuf();
    EXPECT_EQ(out.str(), "hello");
}

TEST_F(LocalClientTest, MissingPathsRaiseNotFound) {
    const auto c = client(root);
    try {
        (void) c.stat("nope");
        FAIL() << "expected NotFound";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    EXPECT_THROW((void) c.get("nope"), StorageError);
    EXPECT_THROW(c.remove("nope"), StorageError);
}

TEST_F(LocalClientTest, InotifyReportsClosedFilesAndRemovals) {
    fs::create_directories(root / "sub");
    InotifyWatch watch(root, true);
    EXPECT_EQ(watch.watchCount(), 2u);

    write("sub/new.txt", "abc");
    fs::remove(root / "sub/new.txt");

    bool created = false, removed = false;
    for (int i = 0; i < 40 && !(created && removed); ++i) {
        const auto item = watch.poll(std::chrono::milliseconds(50));
        if (!item || !item->event) continue;
        if (item->event->path != "sub/new.txt") continue;
        if (item->event->type == model::EventType::Create) created = true;
        if (item->event->type == model::EventType::Remove) removed = true;
    }
    EXPECT_TRUE(created);
    EXPECT_TRUE(removed);
}
