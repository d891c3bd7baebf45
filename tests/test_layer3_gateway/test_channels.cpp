/**
 * @file test_channels.cpp
 * @brief Layer 3 tests for WatchView, SharedKeyedChannel and ChannelRegistry.
 *
 * Channels are driven by a real InMemoryDocumentStore with a plain mapping that
 * forwards payloads unchanged.
 */
#include "dgt_gateway.hpp"
#include "shared_test_helpers.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace docgate::gateway;
using namespace std::chrono_literals;
using nlohmann::json;

namespace
{

ChannelMapping passthrough_mapping()
{
    ChannelMapping m;
    m.on_payload = [](const json &p) { return DocEvent::ok(p); };
    m.on_error = [](std::exception_ptr e)
    { return DefaultErrorMapper().from_exception(e, "test.watch:onError"); };
    m.on_closed = []() { return DatabaseErrorItems::stream_closed(); };
    return m;
}

json next_value(WatchView &view)
{
    auto ev = view.next(1s);
    if (!ev)
        throw std::runtime_error("no event");
    if (ev->is_error())
        throw std::runtime_error("unexpected error event: " + ev->error().to_string());
    return ev->content();
}

} // namespace

// ============================================================================
// WatchView
// ============================================================================

TEST(WatchViewTest, ClosedWithHoldsOneEvent)
{
    auto view = WatchView::closed_with(DocEvent::error(DatabaseErrorItems::unavailable()));
    EXPECT_TRUE(view->is_closed());
    auto ev = view->try_next();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->error().code, "DB_UNAVAILABLE");
    EXPECT_FALSE(view->next(10ms).has_value());
}

TEST(WatchViewTest, NextTimesOutWhenIdle)
{
    WatchView view;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(view.next(20ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
}

// ============================================================================
// SharedKeyedChannel
// ============================================================================

class SharedKeyedChannelTest : public ::testing::Test
{
  protected:
    std::shared_ptr<InMemoryDocumentStore> store = std::make_shared<InMemoryDocumentStore>();

    std::shared_ptr<SharedKeyedChannel> make(const std::string &key)
    {
        return std::make_shared<SharedKeyedChannel>(key, store, passthrough_mapping());
    }
};

TEST_F(SharedKeyedChannelTest, ViewStartsWithBootstrapThenBackend)
{
    store->write("doc", json{{"v", 1}});
    auto channel = make("doc");
    auto view = channel->attach();
    channel->ensure_subscribed();

    EXPECT_EQ(next_value(*view), json::object());
    EXPECT_EQ(next_value(*view), (json{{"v", 1}}));

    store->write("doc", json{{"v", 2}});
    EXPECT_EQ(next_value(*view), (json{{"v", 2}}));
    EXPECT_TRUE(channel->is_subscribed());
}

TEST_F(SharedKeyedChannelTest, SubscribesOnlyOnce)
{
    auto channel = make("doc");
    auto a = channel->attach();
    channel->ensure_subscribed();
    auto b = channel->attach();
    channel->ensure_subscribed();

    EXPECT_EQ(store->subscribe_calls(), 1u);
    EXPECT_EQ(channel->view_count(), 2u);
}

TEST_F(SharedKeyedChannelTest, LateViewSeesBootstrapAndLaterUpdatesOnly)
{
    auto channel = make("doc");
    auto early = channel->attach();
    channel->ensure_subscribed();
    store->write("doc", json{{"v", 1}});

    auto late = channel->attach();
    store->write("doc", json{{"v", 2}});

    EXPECT_EQ(next_value(*late), json::object());
    EXPECT_EQ(next_value(*late), (json{{"v", 2}}));
    EXPECT_FALSE(late->try_next().has_value());

    auto last = channel->last_value();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->content(), (json{{"v", 2}}));
}

TEST_F(SharedKeyedChannelTest, CancelledViewStopsButChannelContinues)
{
    auto channel = make("doc");
    auto a = channel->attach();
    auto b = channel->attach();
    channel->ensure_subscribed();

    a->cancel();
    store->write("doc", json{{"v", 1}});

    EXPECT_FALSE(a->try_next().has_value());
    EXPECT_EQ(next_value(*b), json::object()); // bootstrap
    EXPECT_EQ(next_value(*b), json::object()); // backend initial: missing document
    EXPECT_EQ(next_value(*b), (json{{"v", 1}}));
    EXPECT_EQ(channel->view_count(), 1u);
}

TEST_F(SharedKeyedChannelTest, FeedErrorAndCompletionBecomeFailures)
{
    auto channel = make("doc");
    auto view = channel->attach();
    channel->ensure_subscribed();
    (void)view->try_next();
    (void)view->try_next();

    store->fail_feed("doc", std::make_exception_ptr(std::runtime_error("link down")));
    auto err = view->next(1s);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(err->is_error());
    EXPECT_EQ(err->error().description, "link down");
    EXPECT_EQ(err->error().meta.at("location"), "test.watch:onError");

    store->close_feeds("doc");
    auto closed = view->next(1s);
    ASSERT_TRUE(closed.has_value());
    ASSERT_TRUE(closed->is_error());
    EXPECT_EQ(closed->error().code, "DB_STREAM_CLOSED");
}

TEST_F(SharedKeyedChannelTest, SubscribeFailureIsPublishedNotThrown)
{
    store->dispose();
    auto channel = make("doc");
    auto view = channel->attach();
    EXPECT_NO_THROW(channel->ensure_subscribed());

    EXPECT_EQ(next_value(*view), json::object());
    auto err = view->next(1s);
    ASSERT_TRUE(err.has_value());
    ASSERT_TRUE(err->is_error());
    EXPECT_EQ(err->error().code, "ERR_UNEXPECTED");
    EXPECT_FALSE(channel->is_subscribed());
}

TEST_F(SharedKeyedChannelTest, DisposeCancelsAndClosesViews)
{
    auto channel = make("doc");
    auto view = channel->attach();
    channel->ensure_subscribed();

    channel->dispose();
    channel->dispose();
    EXPECT_TRUE(channel->is_disposed());
    EXPECT_TRUE(view->is_closed());
    EXPECT_EQ(store->cancel_calls(), 1u);
    EXPECT_EQ(store->subscriber_count("doc"), 0u);
    EXPECT_FALSE(channel->last_value().has_value());

    auto late = channel->attach();
    EXPECT_TRUE(late->is_closed());
    EXPECT_FALSE(late->try_next().has_value());
}

TEST_F(SharedKeyedChannelTest, RetainReleaseNeverNegative)
{
    auto channel = make("doc");
    EXPECT_EQ(channel->retain(), 1);
    EXPECT_EQ(channel->retain(), 2);
    EXPECT_EQ(channel->release(), 1);
    EXPECT_EQ(channel->release(), 0);
    EXPECT_EQ(channel->release(), 0);
    EXPECT_FALSE(channel->is_disposed());
}

// ============================================================================
// ChannelRegistry
// ============================================================================

class ChannelRegistryTest : public SharedKeyedChannelTest
{
  protected:
    int created = 0;
    ChannelRegistry registry{[this](const std::string &key)
                             {
                                 ++created;
                                 return make(key);
                             }};
};

TEST_F(ChannelRegistryTest, AcquireCreatesOncePerKey)
{
    auto a = registry.acquire("doc");
    auto b = registry.acquire("doc");
    auto c = registry.acquire("other");

    EXPECT_EQ(created, 2);
    EXPECT_EQ(a.channel, b.channel);
    EXPECT_NE(a.view, b.view);
    EXPECT_EQ(registry.ref_count("doc"), 2);
    EXPECT_EQ(registry.ref_count("other"), 1);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(store->subscribe_calls(), 2u);
    EXPECT_TRUE(a.channel->is_subscribed());
}

TEST_F(ChannelRegistryTest, ReleaseDisposesAtZero)
{
    auto a = registry.acquire("doc");
    auto b = registry.acquire("doc");

    registry.release("doc");
    EXPECT_TRUE(registry.contains("doc"));
    EXPECT_FALSE(a.channel->is_disposed());

    registry.release("doc");
    EXPECT_FALSE(registry.contains("doc"));
    EXPECT_TRUE(a.channel->is_disposed());
    EXPECT_TRUE(b.view->is_closed());
    EXPECT_EQ(store->cancel_calls(), 1u);

    EXPECT_NO_THROW(registry.release("doc"));
    EXPECT_NO_THROW(registry.release("never-seen"));
}

TEST_F(ChannelRegistryTest, ReacquireAfterDisposeCreatesFreshChannel)
{
    auto first = registry.acquire("doc");
    registry.release("doc");
    auto second = registry.acquire("doc");

    EXPECT_NE(first.channel, second.channel);
    EXPECT_EQ(created, 2);
    EXPECT_EQ(store->subscribe_calls(), 2u);
}

TEST_F(ChannelRegistryTest, ForceReleaseIgnoresCount)
{
    auto a = registry.acquire("doc");
    (void)registry.acquire("doc");
    registry.force_release("doc");

    EXPECT_FALSE(registry.contains("doc"));
    EXPECT_TRUE(a.channel->is_disposed());
    EXPECT_NO_THROW(registry.force_release("doc"));
}

TEST_F(ChannelRegistryTest, DisposeAllIsTerminal)
{
    auto a = registry.acquire("a");
    auto b = registry.acquire("b");
    registry.dispose_all();
    registry.dispose_all();

    EXPECT_TRUE(registry.is_disposed());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(a.channel->is_disposed());
    EXPECT_TRUE(b.channel->is_disposed());
    EXPECT_NO_THROW(registry.release("a"));
    EXPECT_DEBUG_DEATH((void)registry.acquire("c"), "after dispose_all");
}

TEST_F(ChannelRegistryTest, KeysListsLiveChannels)
{
    (void)registry.acquire("x");
    (void)registry.acquire("y");
    EXPECT_THAT(registry.keys(), ::testing::UnorderedElementsAre("x", "y"));
    EXPECT_EQ(registry.find("z"), nullptr);
}
