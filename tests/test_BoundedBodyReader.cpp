/**
 * BoundedBodyReader: size limit at exactly max / max+1, single settlement,
 * events after settlement are ignored.
 */
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "mcp/BoundedBodyReader.h"
#include "mcp/PendingCall.h"
#include "utils/Logger.h"

using Outcome = BoundedBodyReader::Outcome;

namespace {
class BoundedBodyReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
    }
};
} // namespace

TEST_F(BoundedBodyReaderTest, BodyOfExactlyMaxIsAccepted) {
    BoundedBodyReader reader(16);
    std::string chunk(8, 'a');
    EXPECT_TRUE(reader.onData(chunk.data(), chunk.size()));
    EXPECT_TRUE(reader.onData(chunk.data(), chunk.size()));
    reader.onEnd();

    EXPECT_EQ(reader.outcome(), Outcome::Complete);
    EXPECT_EQ(reader.take(), std::string(16, 'a'));
}

TEST_F(BoundedBodyReaderTest, BodyOfMaxPlusOneIsRejectedWithoutBuffering) {
    BoundedBodyReader reader(16);
    std::string first(16, 'a');
    EXPECT_TRUE(reader.onData(first.data(), first.size()));
    EXPECT_FALSE(reader.onData("b", 1));

    EXPECT_EQ(reader.outcome(), Outcome::SizeExceeded);
    EXPECT_TRUE(reader.take().empty());

    // further chunks are refused and not counted
    std::string more(1024, 'c');
    EXPECT_FALSE(reader.onData(more.data(), more.size()));
    EXPECT_EQ(reader.received(), 17u);
}

TEST_F(BoundedBodyReaderTest, SettlesExactlyOnce) {
    BoundedBodyReader reader(100);
    reader.onData("{}", 2);
    reader.onEnd();
    reader.onError("late error");
    reader.onClose();
    reader.onEnd();

    EXPECT_EQ(reader.outcome(), Outcome::Complete);
    EXPECT_TRUE(reader.errorReason().empty());
    EXPECT_EQ(reader.take(), "{}");
}

TEST_F(BoundedBodyReaderTest, TransportErrorAndClientClose) {
    BoundedBodyReader broken(100);
    broken.onData("{\"a\"", 4);
    broken.onError("connection reset");
    broken.onEnd();
    EXPECT_EQ(broken.outcome(), Outcome::TransportError);
    EXPECT_EQ(broken.errorReason(), "connection reset");

    BoundedBodyReader closed(100);
    closed.onData("{", 1);
    closed.onClose();
    EXPECT_EQ(closed.outcome(), Outcome::ClientClosed);
    EXPECT_FALSE(closed.onData("}", 1));
}

TEST_F(BoundedBodyReaderTest, ConcurrentEventsProduceOneOutcome) {
    for (int round = 0; round < 50; ++round) {
        BoundedBodyReader reader(1000);
        std::vector<std::thread> threads;
        threads.emplace_back([&] { reader.onEnd(); });
        threads.emplace_back([&] { reader.onError("reset"); });
        threads.emplace_back([&] { reader.onClose(); });
        for (auto& t : threads) t.join();

        Outcome o = reader.outcome();
        EXPECT_TRUE(o == Outcome::Complete || o == Outcome::TransportError || o == Outcome::ClientClosed);
        EXPECT_TRUE(reader.settled());
    }
}

TEST(PendingCall, TerminalTransitionHappensOnce) {
    PendingCall call(10, std::chrono::steady_clock::now() + std::chrono::seconds(1));
    EXPECT_EQ(call.terminal(), PendingCall::Terminal::Open);
    EXPECT_TRUE(call.reject());
    EXPECT_FALSE(call.resolve());
    EXPECT_EQ(call.terminal(), PendingCall::Terminal::Rejected);
}

TEST(PendingCall, Deadline) {
    auto now = std::chrono::steady_clock::now();
    PendingCall call(10, now + std::chrono::milliseconds(100));
    EXPECT_FALSE(call.expired(now));
    EXPECT_TRUE(call.expired(now + std::chrono::milliseconds(100)));
    EXPECT_EQ(call.reader().limit(), 10u);
}
