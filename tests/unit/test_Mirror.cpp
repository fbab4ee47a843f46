#include <gtest/gtest.h>
#include "sync/Controller.hpp"
#include "sync/Session.hpp"
#include "progress/Sink.hpp"
#include "config/Config.hpp"
#include "storage/model/Event.hpp"
#include "support/MemoryClient.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::progress;

namespace fs = std::filesystem;

namespace {

class RecordingSink final : public Sink {
public:
    std::vector<WorkItem> successes;
    std::vector<WorkItem> errors;
    std::vector<std::string> messages;

protected:
    void onSuccess(const WorkItem& item, const Summary&) override { successes.push_back(item); }
    void onError(const WorkItem& item, const Summary&) override { errors.push_back(item); }
    void onMessage(const std::string& text) override { messages.push_back(text); }
};

void writeFile(const fs::path& p, const size_t size, const char fill = 'x') {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << std::string(size, fill);
}

std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

bool waitFor(const std::function<bool()>& cond, const std::chrono::milliseconds limit = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!cond()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

bool headerIsPrepared(const fs::path& header) {
    std::ifstream in(header);
    if (!in) return false;
    try {
        return nlohmann::json::parse(in).value("prepared", false);
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

}

class MirrorTest : public ::testing::Test {
protected:
    fs::path root, src, dst;
    ms::config::Config config;
    std::atomic<bool> interrupt{false};

    void SetUp() override {
        root = fs::temp_directory_path() / ("mirrorsync-mirror-" + std::to_string(::getpid()) + "-" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        src = root / "src";
        dst = root / "dst";
        fs::create_directories(src);

        config = ms::config::defaultConfig();
        config.mirror.session_dir = root / "session";
        config.mirror.max_workers = 2;
        config.mirror.queue_capacity = 4;
    }

    void TearDown() override { fs::remove_all(root); }

    int mirror(const Policy& policy, RecordingSink& sink, std::vector<std::string> targets = {}) {
        if (targets.empty()) targets.push_back(dst.string());
        Controller controller(config, interrupt);
        return controller.run(MirrorRequest{src.string(), std::move(targets), policy}, sink);
    }

    [[nodiscard]] size_t sessionFiles() const {
        if (!fs::exists(config.mirror.session_dir)) return 0;
        return static_cast<size_t>(std::distance(fs::directory_iterator(config.mirror.session_dir),
                                                 fs::directory_iterator{}));
    }
};

TEST_F(MirrorTest, CopiesIntoEmptyTarget) {
    writeFile(src / "a/1.txt", 10);
    writeFile(src / "a/2.txt", 20);

    RecordingSink sink;
    EXPECT_EQ(mirror(Policy{}, sink), Controller::EXIT_OK);

    const auto summary = sink.finish();
    EXPECT_EQ(summary.objects, 2u);
    EXPECT_EQ(summary.totalObjects, 2u);
    EXPECT_EQ(summary.totalBytes, 30u);
    EXPECT_EQ(summary.bytes, 30u);
    EXPECT_EQ(summary.errors, 0u);

    EXPECT_EQ(fs::file_size(dst / "a/1.txt"), 10u);
    EXPECT_EQ(fs::file_size(dst / "a/2.txt"), 20u);
    for (const auto& item : sink.successes) EXPECT_TRUE(item.isCopy());
    EXPECT_EQ(sessionFiles(), 0u);
}

TEST_F(MirrorTest, RemovesStaleEntriesWithForceAndRemove) {
    writeFile(src / "a/1.txt", 10);
    writeFile(dst / "a/1.txt", 10);
    writeFile(dst / "a/stale.txt", 7);

    RecordingSink sink;
    EXPECT_EQ(mirror(Policy{true, false, true, false}, sink), Controller::EXIT_OK);

    const auto summary = sink.finish();
    EXPECT_EQ(summary.totalObjects, 1u);
    EXPECT_EQ(summary.totalBytes, 0u);
    ASSERT_EQ(sink.successes.size(), 1u);
    EXPECT_TRUE(sink.successes[0].isDelete());
    EXPECT_FALSE(fs::exists(dst / "a/stale.txt"));
    EXPECT_TRUE(fs::exists(dst / "a/1.txt"));
}

TEST_F(MirrorTest, RefusesToOverwriteWithoutForce) {
    writeFile(src / "a/1.txt", 10, 's');
    writeFile(dst / "a/1.txt", 5, 't');

    RecordingSink sink;
    EXPECT_NE(mirror(Policy{}, sink), Controller::EXIT_OK);

    const auto summary = sink.finish();
    EXPECT_EQ(summary.bytes, 0u);
    ASSERT_EQ(sink.errors.size(), 1u);
    ASSERT_TRUE(sink.errors[0].error.has_value());
    EXPECT_EQ(sink.errors[0].error->kind, ms::storage::ErrorKind::OverwriteNotAllowed);
    EXPECT_NE(sink.errors[0].error->message.find("overwrite not allowed"), std::string::npos);
    EXPECT_EQ(readFile(dst / "a/1.txt"), std::string(5, 't'));
}

TEST_F(MirrorTest, FakeRunTouchesNothing) {
    writeFile(src / "x.bin", 64);

    RecordingSink sink;
    EXPECT_EQ(mirror(Policy{false, true, false, false}, sink), Controller::EXIT_OK);
    EXPECT_EQ(sink.finish().objects, 1u);
    EXPECT_FALSE(fs::exists(dst / "x.bin"));
}

TEST_F(MirrorTest, MirrorsToSeveralTargets) {
    writeFile(src / "d/f.txt", 12);
    const auto second = root / "dst2";

    RecordingSink sink;
    EXPECT_EQ(mirror(Policy{}, sink, {dst.string(), second.string()}), Controller::EXIT_OK);
    EXPECT_EQ(fs::file_size(dst / "d/f.txt"), 12u);
    EXPECT_EQ(fs::file_size(second / "d/f.txt"), 12u);
    EXPECT_EQ(sink.finish().objects, 2u);
}

TEST_F(MirrorTest, RejectsMissingSourceAndSameLocation) {
    RecordingSink sink;
    Controller controller(config, interrupt);
    EXPECT_THROW(controller.run(MirrorRequest{(root / "nope").string(), {dst.string()}, Policy{}}, sink),
                 std::invalid_argument);
    EXPECT_THROW(controller.run(MirrorRequest{src.string(), {src.string() + "/"}, Policy{}}, sink),
                 std::invalid_argument);
    EXPECT_THROW(controller.run(MirrorRequest{src.string(), {dst.string()}, Policy{false, false, true, false}}, sink),
                 std::invalid_argument);
}

TEST_F(MirrorTest, ResumeSkipsCompletedItems) {
    writeFile(src / "a/1.txt", 10);
    writeFile(src / "a/2.txt", 20);
    writeFile(src / "b.txt", 5);

    // a prepared session where a/1.txt already completed
    const std::vector<std::string> targets{dst.string()};
    const Policy policy{};
    const auto id = Session::makeId(src.string(), targets, policy);
    {
        const ms::storage::Location srcLoc{std::nullopt, src.string(), src.string(), ms::storage::ClientType::Local};
        const ms::storage::Location dstLoc{std::nullopt, dst.string(), dst.string(), ms::storage::ClientType::Local};
        SessionHeader header;
        header.id = id;
        header.source = src.string();
        header.targets = targets;
        auto session = Session::create(config.mirror.session_dir, header);

        uint64_t seq = 0, bytes = 0;
        for (const auto& [path, size] : std::vector<std::pair<std::string, uint64_t>>{{"a/1.txt", 10}, {"a/2.txt", 20}, {"b.txt", 5}}) {
            auto item = WorkItem::copy(Endpoint{srcLoc, {path, size}}, Endpoint{dstLoc, {path, size}}, 0);
            item.seq = ++seq;
            bytes += size;
            item.totalCount = seq;
            item.totalBytes = bytes;
            session->append(item);
            if (path == "a/1.txt") session->markDone(item);
        }
        session->setPrepared(seq, bytes);
    }

    RecordingSink sink;
    EXPECT_EQ(mirror(policy, sink, targets), Controller::EXIT_OK);

    // the completed item is replayed, not copied again
    EXPECT_FALSE(fs::exists(dst / "a/1.txt"));
    EXPECT_EQ(fs::file_size(dst / "a/2.txt"), 20u);
    EXPECT_EQ(fs::file_size(dst / "b.txt"), 5u);

    const auto summary = sink.finish();
    EXPECT_EQ(summary.objects, 3u);
    EXPECT_EQ(summary.totalBytes, 35u);
    EXPECT_EQ(summary.bytes, 35u);
    EXPECT_FALSE(Session::exists(config.mirror.session_dir, id));
}

TEST_F(MirrorTest, InterruptBeforeStartExitsWith130) {
    writeFile(src / "a.txt", 3);
    interrupt = true;

    RecordingSink sink;
    EXPECT_EQ(mirror(Policy{}, sink), Controller::EXIT_INTERRUPTED);
    EXPECT_FALSE(fs::exists(dst / "a.txt"));
    // interrupted before planning finished: nothing left to resume
    EXPECT_EQ(sessionFiles(), 0u);
}

class PipelineTest : public ::testing::Test {
protected:
    const std::string srcUrl = "/mem/src";
    const std::string dstUrl = "/mem/dst";
    std::shared_ptr<ms::test::MemoryClient> source = std::make_shared<ms::test::MemoryClient>(srcUrl);
    std::shared_ptr<ms::test::MemoryClient> target = std::make_shared<ms::test::MemoryClient>(dstUrl);
    fs::path root;
    ms::config::Config config;
    std::atomic<bool> interrupt{false};

    void SetUp() override {
        root = fs::temp_directory_path() / ("mirrorsync-pipeline-" + std::to_string(::getpid()) + "-" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        config = ms::config::defaultConfig();
        config.mirror.session_dir = root / "session";
        config.mirror.max_workers = 1;
        config.mirror.queue_capacity = 8;
        config.mirror.watch_poll_interval_ms = 10;
    }

    void TearDown() override { fs::remove_all(root); }

    int run(const Policy& policy, RecordingSink& sink) {
        Controller controller(config, interrupt, [this](const ms::storage::Location& loc)
                                  -> std::shared_ptr<ms::storage::Client> {
            if (loc.path == srcUrl) return source;
            return target;
        });
        return controller.run(MirrorRequest{srcUrl, {dstUrl}, policy}, sink);
    }

    [[nodiscard]] std::string sessionId(const Policy& policy) const {
        return Session::makeId(srcUrl, {dstUrl}, policy);
    }
};

TEST_F(PipelineTest, InterruptAfterPlanningSavesSessionAndRerunResumes) {
    source->addFile("a/1.txt", 10);
    source->addFile("a/2.txt", 20);
    source->addFile("b.txt", 5);

    const Policy policy{};
    const auto header = config.mirror.session_dir / (sessionId(policy) + ".json");

    // the first transfer waits for the plan to reach disk, then stops the run
    target->onPut([&](const std::string&) {
        EXPECT_TRUE(waitFor([&] { return headerIsPrepared(header); }));
        interrupt = true;
    });

    RecordingSink first;
    EXPECT_EQ(run(policy, first), Controller::EXIT_INTERRUPTED);
    EXPECT_EQ(target->puts(), 1u);
    ASSERT_TRUE(Session::exists(config.mirror.session_dir, sessionId(policy)));
    EXPECT_NE(std::find_if(first.messages.begin(), first.messages.end(),
                           [](const std::string& m) { return m.find("saved") != std::string::npos; }),
              first.messages.end());

    target->onPut({});
    interrupt = false;

    RecordingSink second;
    EXPECT_EQ(run(policy, second), Controller::EXIT_OK);

    // only the two unfinished items are written again
    EXPECT_EQ(target->puts(), 3u);
    EXPECT_EQ(target->fileCount(), 3u);
    EXPECT_EQ(target->data("a/2.txt").size(), 20u);
    const auto summary = second.finish();
    EXPECT_EQ(summary.objects, 3u);
    EXPECT_EQ(summary.bytes, 35u);
    EXPECT_FALSE(Session::exists(config.mirror.session_dir, sessionId(policy)));
}

TEST_F(PipelineTest, TransientFailureKeepsSessionUntilRerunSucceeds) {
    source->addFile("a.txt", 3);
    source->addFile("b.txt", 4);
    target->failOn("b.txt", ms::storage::ErrorKind::Transport);

    const Policy policy{};
    RecordingSink first;
    EXPECT_EQ(run(policy, first), Controller::EXIT_FAILED);
    ASSERT_EQ(first.errors.size(), 1u);
    EXPECT_EQ(first.errors[0].error->kind, ms::storage::ErrorKind::Transport);
    EXPECT_TRUE(target->has("a.txt"));
    EXPECT_FALSE(target->has("b.txt"));
    ASSERT_TRUE(Session::exists(config.mirror.session_dir, sessionId(policy)));

    target->clearFailures();

    RecordingSink second;
    EXPECT_EQ(run(policy, second), Controller::EXIT_OK);
    EXPECT_TRUE(target->has("b.txt"));
    // a.txt is replayed from the session, not written twice
    EXPECT_EQ(target->puts(), 2u);
    EXPECT_FALSE(Session::exists(config.mirror.session_dir, sessionId(policy)));
}

TEST_F(PipelineTest, UnlistedSubtreeIsPlannedAgainOnRerun) {
    source->addFile("a/1.txt", 10);
    source->addFile("b.txt", 4);
    target->addDir("a");
    target->failListing("a", ms::storage::Error{ms::storage::ErrorKind::Transport, "", "connection reset"});

    const Policy policy{};
    RecordingSink first;
    EXPECT_EQ(run(policy, first), Controller::EXIT_FAILED);
    EXPECT_TRUE(target->has("b.txt"));
    EXPECT_FALSE(target->has("a/1.txt"));
    // an incomplete plan is not resumable
    EXPECT_FALSE(Session::exists(config.mirror.session_dir, sessionId(policy)));

    target->clearFailures();

    RecordingSink second;
    EXPECT_EQ(run(policy, second), Controller::EXIT_OK);
    EXPECT_EQ(target->data("a/1.txt").size(), 10u);
    EXPECT_EQ(target->puts(), 2u);
    EXPECT_TRUE(second.errors.empty());
}

TEST_F(PipelineTest, WatchModeCopiesNewFilesAndStopsCleanly) {
    source->addFile("a.txt", 3);

    std::thread feeder([&] {
        waitFor([&] { return target->has("a.txt"); });
        source->addFile("w.txt", 6);
        source->events().push({ms::storage::model::Event{ms::storage::model::EventType::Create, "w.txt", 0}, std::nullopt});
        waitFor([&] { return target->has("w.txt"); });
        interrupt = true;
    });

    RecordingSink sink;
    const int code = run(Policy{false, false, false, true}, sink);
    feeder.join();

    EXPECT_EQ(code, Controller::EXIT_OK);
    EXPECT_EQ(target->data("a.txt").size(), 3u);
    EXPECT_EQ(target->data("w.txt").size(), 6u);
    EXPECT_EQ(sink.finish().objects, 2u);
    EXPECT_FALSE(fs::exists(config.mirror.session_dir));
}
