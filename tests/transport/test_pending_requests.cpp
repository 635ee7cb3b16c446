/*
 * test_pending_requests.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Tests for the outstanding request table

**************************************************/

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "exception/exception.hpp"
#include "transport/pending_requests.hpp"

using namespace sweeplink;
using namespace sweeplink::transport;

class PendingRequestsTest : public ::testing::Test {
protected:
    PendingRequests<uint32_t, std::string> pending_;
};

TEST_F(PendingRequestsTest, ResolveDeliversValue) {
    auto future = pending_.start(1);
    EXPECT_TRUE(pending_.contains(1));

    EXPECT_TRUE(pending_.resolve(1, "done"));

    EXPECT_EQ(future.get(), "done");
    EXPECT_FALSE(pending_.contains(1));
}

TEST_F(PendingRequestsTest, DuplicateStartThrows) {
    auto future = pending_.start(5);
    EXPECT_THROW((void)pending_.start(5), DuplicateRequestId);
    EXPECT_FALSE(pending_.tryStart(5).has_value());
    EXPECT_EQ(pending_.size(), 1u);
}

TEST_F(PendingRequestsTest, KeyReusableAfterCompletion) {
    auto first = pending_.start(9);
    pending_.resolve(9, "a");
    auto second = pending_.start(9);
    pending_.resolve(9, "b");

    EXPECT_EQ(first.get(), "a");
    EXPECT_EQ(second.get(), "b");
}

TEST_F(PendingRequestsTest, LateResolveIsRejected) {
    EXPECT_FALSE(pending_.resolve(42, "late"));

    auto future = pending_.start(42);
    EXPECT_TRUE(pending_.pop(42));
    EXPECT_FALSE(pending_.resolve(42, "late"));
    EXPECT_FALSE(pending_.pop(42));
}

TEST_F(PendingRequestsTest, PopLeavesWaiterCancelled) {
    auto future = pending_.start(3);
    pending_.pop(3);
    EXPECT_THROW(future.get(), RequestCancelled);
}

TEST_F(PendingRequestsTest, FailDeliversGivenError) {
    auto future = pending_.start(3);
    EXPECT_TRUE(pending_.fail(
        3, std::make_exception_ptr(ConnectivityFailure("gone"))));
    EXPECT_THROW(future.get(), ConnectivityFailure);
}

TEST_F(PendingRequestsTest, FailAllDrainsEverything) {
    std::vector<std::future<std::string>> futures;
    for (uint32_t id = 1; id <= 4; ++id) {
        futures.push_back(pending_.start(id));
    }

    auto failed = pending_.failAll(
        std::make_exception_ptr(ConnectivityFailure("broker lost")));

    EXPECT_EQ(failed, 4u);
    EXPECT_EQ(pending_.size(), 0u);
    for (auto& future : futures) {
        EXPECT_THROW(future.get(), ConnectivityFailure);
    }
}

TEST_F(PendingRequestsTest, ConcurrentResolveFromOtherThreads) {
    std::vector<std::future<std::string>> futures;
    for (uint32_t id = 0; id < 32; ++id) {
        futures.push_back(pending_.start(id));
    }

    std::vector<std::thread> threads;
    for (uint32_t id = 0; id < 32; ++id) {
        threads.emplace_back(
            [this, id] { pending_.resolve(id, std::to_string(id)); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (uint32_t id = 0; id < 32; ++id) {
        EXPECT_EQ(futures[id].get(), std::to_string(id));
    }
}
