#include <gtest/gtest.h>
#include "sync/Status.hpp"
#include "sync/ProxyReader.hpp"
#include "progress/JsonSink.hpp"
#include "progress/QuietSink.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;
using ms::concurrency::Channel;

namespace {

WorkItem copyOf(const uint64_t seq, const std::string& path, const uint64_t size) {
    const Location src{std::nullopt, "/s", "/s", ClientType::Local};
    const Location dst{std::nullopt, "/d", "/d", ClientType::Local};
    auto item = WorkItem::copy(Endpoint{src, {path, size}}, Endpoint{dst, {path, size}}, 0);
    item.seq = seq;
    item.totalCount = seq;
    item.totalBytes = size * seq;
    return item;
}

std::vector<nlohmann::json> lines(const std::string& text) {
    std::vector<nlohmann::json> out;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) out.push_back(nlohmann::json::parse(line));
    return out;
}

}

TEST(StatusTest, DoneTopsUpBytesOnceAndCountsFailures) {
    std::ostringstream out;
    ms::progress::JsonSink sink(out);
    Status status(sink, nullptr);
    Channel<Message> ch;

    ch.push(msg::Progress{1, 4});
    ch.push(msg::Done{copyOf(1, "a", 10)});
    ch.push(msg::Done{copyOf(2, "b", 10)});
    auto failed = copyOf(3, "c", 10);
    failed.error = Error{ErrorKind::Transport, "/d/c", "connection reset"};
    ch.push(msg::Failed{failed});
    ch.push(msg::Vanished{copyOf(4, "d", 10)});
    ch.push(msg::Prepared{4, 40});
    ch.close();

    status.run(ch);
    const auto summary = sink.finish();

    EXPECT_EQ(summary.bytes, 20u);
    EXPECT_EQ(summary.objects, 2u);
    EXPECT_EQ(summary.errors, 1u);
    EXPECT_EQ(summary.totalObjects, 4u);
    EXPECT_EQ(summary.totalBytes, 40u);

    const auto& o = status.outcome();
    EXPECT_EQ(o.done, 2u);
    EXPECT_EQ(o.failures, 1u);
    EXPECT_EQ(o.transient, 1u);
    EXPECT_EQ(o.vanished, 1u);
    EXPECT_TRUE(o.prepared);

    const auto records = lines(out.str());
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0]["status"], "success");
    EXPECT_EQ(records[0]["source"], "/s/a");
    EXPECT_EQ(records[0]["size"], 10);
    EXPECT_EQ(records[2]["status"], "error");
    EXPECT_EQ(records[2]["path"], "/d/c");
    EXPECT_EQ(records[2]["error"]["kind"], "transport");
    EXPECT_EQ(records[3]["status"], "summary");
}

TEST(StatusTest, FailedCopyGivesBackItsPartialBytes) {
    std::ostringstream out;
    ms::progress::JsonSink sink(out);
    Status status(sink, nullptr);
    Channel<Message> ch;

    ch.push(msg::Progress{1, 6});
    ch.push(msg::Progress{2, 3});
    ch.push(msg::Progress{2, 4});
    auto failed = copyOf(2, "b", 10);
    failed.error = Error{ErrorKind::Transport, "/d/b", "connection reset"};
    ch.push(msg::Failed{failed});
    ch.push(msg::Done{copyOf(1, "a", 10)});
    ch.close();

    status.run(ch);
    const auto summary = sink.finish();

    EXPECT_EQ(summary.bytes, 10u);
    EXPECT_EQ(summary.objects, 1u);
    EXPECT_EQ(summary.errors, 1u);
}

TEST(StatusTest, QuietSinkStillCounts) {
    ms::progress::QuietSink sink(false, stderr);
    sink.reportProgress(5);
    sink.reportSuccess(copyOf(1, "a", 5));
    const auto summary = sink.finish();
    EXPECT_EQ(summary.objects, 1u);
    EXPECT_EQ(summary.bytes, 5u);
    // finishing twice keeps the first summary
    EXPECT_EQ(sink.finish().objects, 1u);
}

TEST(ProxyReaderTest, ReportsEveryByteInBatches) {
    std::istringstream inner(std::string(10000, 'z'));
    std::vector<uint64_t> reports;
    ProxyReader proxy(inner, [&](const uint64_t n) { reports.push_back(n); }, 1024, 4096);
    std::istream in(&proxy);

    std::ostringstream sink;
    sink << in.rdbuf();

    EXPECT_EQ(sink.str().size(), 10000u);
    EXPECT_EQ(proxy.total(), 10000u);
    uint64_t sum = 0;
    for (const auto r : reports) sum += r;
    EXPECT_EQ(sum, 10000u);
    EXPECT_LE(reports.size(), 4u);
}
