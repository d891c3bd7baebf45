#pragma once
/**
 * @file shared_keyed_channel.hpp
 * @brief Per-key shared live feed: one backend subscription, one last-value cell,
 *        one reference count, any number of watcher views.
 */
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"
#include "gateway/document_store.hpp"
#include "gateway/error_item.hpp"
#include "gateway/watch_view.hpp"

namespace docgate::gateway
{

/**
 * @brief How raw backend feed signals become watcher events. Supplied by the
 *        owner (the gateway), so identity injection and error mapping happen in
 *        one place.
 */
struct ChannelMapping
{
    std::function<DocEvent(const nlohmann::json &)> on_payload;
    std::function<ErrorItem(std::exception_ptr)> on_error;
    std::function<ErrorItem()> on_closed;
};

/**
 * @class SharedKeyedChannel
 * @brief Fans one backend feed for a key out to every attached WatchView.
 *
 * Every view starts with a bootstrap empty-object success and then receives each
 * mapped emission in the single order the channel publishes them. The backend
 * feed is subscribed at most once per channel; a failed subscribe attempt is
 * published as a failure and not retried.
 *
 * The reference count is maintained by ChannelRegistry; the channel itself never
 * disposes on a zero count.
 */
class DOCGATE_UTILS_EXPORT SharedKeyedChannel
    : public std::enable_shared_from_this<SharedKeyedChannel>
{
  public:
    SharedKeyedChannel(std::string key, std::shared_ptr<DocumentStore> store,
                       ChannelMapping mapping);
    ~SharedKeyedChannel();

    SharedKeyedChannel(const SharedKeyedChannel &) = delete;
    SharedKeyedChannel &operator=(const SharedKeyedChannel &) = delete;

    /// New view seeded with the bootstrap value. A disposed channel returns a closed view.
    std::shared_ptr<WatchView> attach();

    /**
     * @brief Opens the backend feed if no attempt was made yet. Never throws: a
     *        subscribe failure is mapped and published.
     */
    void ensure_subscribed();

    /// @return The new reference count.
    int retain();
    /// @return The new reference count (never below zero).
    int release();

    /// Cancels the backend feed, drops the last value and closes every view. Idempotent.
    void dispose();

    const std::string &key() const noexcept { return m_key; }
    int ref_count() const;
    bool is_disposed() const;
    bool is_subscribed() const;
    size_t view_count() const;

    /// Last published event (the bootstrap value before any backend emission).
    std::optional<DocEvent> last_value() const;

  private:
    void publish(DocEvent event);

    const std::string m_key;
    std::shared_ptr<DocumentStore> m_store;
    ChannelMapping m_mapping;

    mutable std::mutex m_mutex; // views, last value, refs, disposal, subscription handle
    std::vector<std::shared_ptr<WatchView>> m_views;
    std::optional<DocEvent> m_last;
    std::unique_ptr<FeedSubscription> m_subscription;
    int m_refs{0};
    bool m_disposed{false};

    std::mutex m_subscribe_mutex; // held across the backend watch() call only
    bool m_subscribe_attempted{false};
};

} // namespace docgate::gateway
