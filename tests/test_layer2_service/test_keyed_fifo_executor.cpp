/**
 * @file test_keyed_fifo_executor.cpp
 * @brief Layer 2 tests for KeyedFifoExecutor: per-key FIFO, cross-key independence,
 *        failure isolation, dispose semantics and idle-key pruning.
 */
#include "dgt_service.hpp"
#include "shared_test_helpers.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using docgate::utils::KeyedFifoExecutor;
using docgate::tests::helper::wait_until;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace
{

/// Thread-safe record of completion tags.
class CompletionLog
{
  public:
    void add(int tag)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tags.push_back(tag);
    }
    std::vector<int> tags() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tags;
    }

  private:
    mutable std::mutex m_mutex;
    std::vector<int> m_tags;
};

} // namespace

TEST(KeyedFifoExecutorTest, DelaysDoNotReorderOneKey)
{
    KeyedFifoExecutor<std::string> executor;
    CompletionLog log;
    const std::vector<std::pair<int, std::chrono::milliseconds>> plan = {
        {0, 30ms}, {1, 10ms}, {2, 5ms}, {3, 0ms}};

    std::vector<std::future<int>> futures;
    for (const auto &[tag, delay] : plan)
    {
        futures.push_back(executor.with_lock("k",
                                             [&log, tag = tag, delay = delay]()
                                             {
                                                 std::this_thread::sleep_for(delay);
                                                 log.add(tag);
                                                 return tag;
                                             }));
    }
    for (size_t i = 0; i < futures.size(); ++i)
        EXPECT_EQ(futures[i].get(), static_cast<int>(i));

    EXPECT_THAT(log.tags(), ElementsAre(0, 1, 2, 3));
}

TEST(KeyedFifoExecutorTest, RandomDelaysKeepSubmissionOrder)
{
    KeyedFifoExecutor<std::string> executor;
    CompletionLog log;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> delay_ms(0, 5);

    constexpr int kActions = 25;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < kActions; ++i)
    {
        auto delay = std::chrono::milliseconds(delay_ms(rng));
        futures.push_back(executor.with_lock("doc",
                                             [&log, i, delay]()
                                             {
                                                 std::this_thread::sleep_for(delay);
                                                 log.add(i);
                                             }));
    }
    for (auto &f : futures)
        f.get();

    auto tags = log.tags();
    ASSERT_EQ(tags.size(), static_cast<size_t>(kActions));
    for (int i = 0; i < kActions; ++i)
        EXPECT_EQ(tags[i], i);
}

TEST(KeyedFifoExecutorTest, SlowKeyDoesNotBlockOtherKey)
{
    KeyedFifoExecutor<std::string> executor;
    CompletionLog log;

    auto slow = executor.with_lock("A",
                                   [&log]()
                                   {
                                       std::this_thread::sleep_for(150ms);
                                       log.add(1);
                                   });
    auto fast = executor.with_lock("B", [&log]() { log.add(2); });

    fast.get();
    slow.get();
    EXPECT_THAT(log.tags(), ElementsAre(2, 1));
}

TEST(KeyedFifoExecutorTest, EveryActionRunsExactlyOnce)
{
    KeyedFifoExecutor<int> executor;
    std::atomic<int> runs{0};
    constexpr int kActions = 200;

    std::vector<std::future<void>> futures;
    std::vector<std::thread> submitters;
    std::mutex futures_mutex;
    for (int t = 0; t < 4; ++t)
    {
        submitters.emplace_back(
            [&]()
            {
                for (int i = 0; i < kActions / 4; ++i)
                {
                    auto f = executor.with_lock(7, [&runs]() { ++runs; });
                    std::lock_guard<std::mutex> lock(futures_mutex);
                    futures.push_back(std::move(f));
                }
            });
    }
    for (auto &t : submitters)
        t.join();
    for (auto &f : futures)
        f.get();

    EXPECT_EQ(runs.load(), kActions);
}

TEST(KeyedFifoExecutorTest, FailureReachesOnlyItsOwnCaller)
{
    KeyedFifoExecutor<std::string> executor;
    CompletionLog log;

    auto first = executor.with_lock("k", [&log]() { log.add(0); });
    auto failing = executor.with_lock("k",
                                      [&log]() -> int
                                      {
                                          log.add(1);
                                          throw std::runtime_error("write rejected");
                                      });
    auto after = executor.with_lock("k",
                                    [&log]()
                                    {
                                        log.add(2);
                                        return std::string("ok");
                                    });

    EXPECT_NO_THROW(first.get());
    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(after.get(), "ok");
    EXPECT_THAT(log.tags(), ElementsAre(0, 1, 2));
}

TEST(KeyedFifoExecutorTest, NestedDifferentKeyIsSupported)
{
    KeyedFifoExecutor<std::string> executor;

    auto outer = executor.with_lock("outer",
                                    [&executor]()
                                    {
                                        auto inner = executor.with_lock("inner", []() { return 21; });
                                        return inner.get() * 2;
                                    });
    EXPECT_EQ(outer.get(), 42);
}

TEST(KeyedFifoExecutorTest, IdleKeysArePruned)
{
    KeyedFifoExecutor<std::string> executor;
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();

    auto blocked = executor.with_lock("busy", [gate_future]() { gate_future.wait(); });
    auto queued = executor.with_lock("busy", []() {});
    EXPECT_EQ(executor.pending("busy"), 2u);
    EXPECT_EQ(executor.active_keys(), 1u);

    gate.set_value();
    blocked.get();
    queued.get();

    EXPECT_TRUE(wait_until([&]() { return executor.active_keys() == 0; }));
    EXPECT_EQ(executor.pending("busy"), 0u);
}

TEST(KeyedFifoExecutorTest, DisposeIsIdempotentAndDoesNotCancel)
{
    KeyedFifoExecutor<std::string> executor;
    std::atomic<bool> finished{false};

    auto in_flight = executor.with_lock("k",
                                        [&finished]()
                                        {
                                            std::this_thread::sleep_for(50ms);
                                            finished = true;
                                        });
    executor.dispose();
    executor.dispose();
    EXPECT_TRUE(executor.is_disposed());

    in_flight.get();
    EXPECT_TRUE(finished.load());
}

TEST(KeyedFifoExecutorTest, AfterDisposeActionsStartWithoutWaiting)
{
    KeyedFifoExecutor<std::string> executor;
    std::promise<void> release_first;
    auto release_future = release_first.get_future().share();
    std::atomic<bool> first_running{false};

    auto first = executor.with_lock("k",
                                    [&first_running, release_future]()
                                    {
                                        first_running = true;
                                        release_future.wait();
                                    });
    ASSERT_TRUE(wait_until([&]() { return first_running.load(); }));

    executor.dispose();

    // Would deadlock if it were still chained behind `first`.
    auto overlapping = executor.with_lock("k", []() { return 5; });
    EXPECT_EQ(overlapping.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(overlapping.get(), 5);

    release_first.set_value();
    first.get();
}

TEST(KeyedFifoExecutorTest, DestructorWaitsForQueuedWork)
{
    std::atomic<int> completed{0};
    {
        KeyedFifoExecutor<std::string> executor;
        for (int i = 0; i < 5; ++i)
        {
            (void)executor.with_lock("k",
                                     [&completed]()
                                     {
                                         std::this_thread::sleep_for(5ms);
                                         ++completed;
                                     });
        }
    }
    EXPECT_EQ(completed.load(), 5);
}
