#include <gtest/gtest.h>

#include <vector>

#include "TransitCore.h"

using namespace TransitEngine::Core::IO;

TEST(ProgressChannel, WithoutCallbackAlwaysContinues) {
    ProgressChannel channel;
    EXPECT_FALSE(channel.hasCallback());
    EXPECT_TRUE(channel.begin(100));
    EXPECT_TRUE(channel.advance(50, 100));
    EXPECT_TRUE(channel.advance(100, 100));
    EXPECT_FALSE(channel.aborted());
    EXPECT_EQ(channel.invocationCount(), 0u);
}

TEST(ProgressChannel, ReportsAreCumulative) {
    std::vector<ProgressReport> seen;
    ProgressChannel channel([&](const ProgressReport& r) {
        seen.push_back(r);
        return ProgressResult::Continue;
    });
    EXPECT_TRUE(channel.begin(30));
    EXPECT_TRUE(channel.advance(10, 30));
    EXPECT_TRUE(channel.advance(20, 30));
    EXPECT_TRUE(channel.advance(30, 30));

    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0].bytesTransferred, 0u);
    EXPECT_EQ(seen[3].bytesTransferred, 30u);
    for (const auto& r : seen) {
        EXPECT_EQ(r.totalBytes, 30u);
        EXPECT_EQ(r.streamIndex, 0u);
    }
}

TEST(ProgressChannel, CancelAbortsAndStopsReporting) {
    int calls = 0;
    ProgressChannel channel([&](const ProgressReport& r) {
        ++calls;
        return r.bytesTransferred >= 20 ? ProgressResult::Cancel : ProgressResult::Continue;
    });
    EXPECT_TRUE(channel.begin(40));
    EXPECT_TRUE(channel.advance(10, 40));
    EXPECT_FALSE(channel.advance(20, 40));
    EXPECT_TRUE(channel.aborted());
    EXPECT_EQ(channel.abortReason(), ProgressResult::Cancel);
    EXPECT_FALSE(channel.advance(30, 40));
    EXPECT_EQ(calls, 3);
}

TEST(ProgressChannel, QuietSuppressesLaterReports) {
    int calls = 0;
    ProgressChannel channel([&](const ProgressReport&) {
        ++calls;
        return ProgressResult::Quiet;
    });
    EXPECT_TRUE(channel.begin(10));
    EXPECT_TRUE(channel.quiet());
    EXPECT_TRUE(channel.advance(5, 10));
    EXPECT_TRUE(channel.advance(10, 10));
    EXPECT_FALSE(channel.aborted());
    EXPECT_EQ(calls, 1);
}

TEST(ProgressChannel, StopAndQuietAbortsSilently) {
    int calls = 0;
    ProgressChannel channel([&](const ProgressReport&) {
        ++calls;
        return ProgressResult::StopAndQuiet;
    });
    EXPECT_FALSE(channel.begin(10));
    EXPECT_TRUE(channel.aborted());
    EXPECT_TRUE(channel.quiet());
    EXPECT_EQ(channel.abortReason(), ProgressResult::StopAndQuiet);
    EXPECT_FALSE(channel.advance(10, 10));
    EXPECT_EQ(calls, 1);
}

TEST(ProgressChannel, MinimumIntervalStillReportsCompletion) {
    std::vector<uint64_t> seen;
    ProgressChannel channel([&](const ProgressReport& r) {
        seen.push_back(r.bytesTransferred);
        return ProgressResult::Continue;
    }, 100);
    EXPECT_TRUE(channel.begin(250));
    for (uint64_t done = 10; done <= 250; done += 10) {
        EXPECT_TRUE(channel.advance(done, 250));
    }
    EXPECT_EQ(seen, (std::vector<uint64_t>{0, 100, 200, 250}));
}
