#pragma once
/**
 * @file channel_registry.hpp
 * @brief Key to SharedKeyedChannel map with caller-managed reference counting.
 *
 * acquire() and release() are two separate, explicit operations. Cancelling a
 * WatchView never releases anything; every acquire() must be matched by one
 * release() (or the channel must be force-released).
 */
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "docgate_utils_export.h"
#include "gateway/shared_keyed_channel.hpp"
#include "gateway/watch_view.hpp"

namespace docgate::gateway
{

/// Builds the channel for a key the first time it is acquired.
using ChannelFactory = std::function<std::shared_ptr<SharedKeyedChannel>(const std::string &)>;

/// What one acquire() hands out: the shared channel and a fresh view of it.
struct ChannelLease
{
    std::shared_ptr<SharedKeyedChannel> channel;
    std::shared_ptr<WatchView> view;
};

/**
 * @class ChannelRegistry
 * @brief Holds at most one channel per key.
 *
 * A channel is created and subscribed on the first acquire() of its key, retained
 * on every acquire(), and disposed and removed when release() brings its count to
 * zero, on force_release(), or on dispose_all().
 *
 * After dispose_all() the registry is terminal: acquire() is a precondition
 * violation, release() and force_release() are no-ops.
 */
class DOCGATE_UTILS_EXPORT ChannelRegistry
{
  public:
    explicit ChannelRegistry(ChannelFactory factory);
    ~ChannelRegistry();

    ChannelRegistry(const ChannelRegistry &) = delete;
    ChannelRegistry &operator=(const ChannelRegistry &) = delete;

    /**
     * @brief Retains the channel for @p key (creating and subscribing it if absent)
     *        and attaches a new view.
     * @return An empty lease if the registry was disposed (release builds only).
     */
    ChannelLease acquire(const std::string &key);

    /// Drops one reference; disposes the channel at zero. No-op for an absent key.
    void release(const std::string &key);

    /// Disposes the channel regardless of its count. No-op for an absent key.
    void force_release(const std::string &key);

    /// Disposes every channel and marks the registry terminal. Idempotent.
    void dispose_all();

    bool is_disposed() const;
    size_t size() const;
    bool contains(const std::string &key) const;
    /// Reference count of @p key, 0 when absent.
    int ref_count(const std::string &key) const;
    std::vector<std::string> keys() const;
    /// Channel for @p key, or nullptr.
    std::shared_ptr<SharedKeyedChannel> find(const std::string &key) const;

  private:
    ChannelFactory m_factory;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<SharedKeyedChannel>> m_channels;
    bool m_disposed{false};
};

} // namespace docgate::gateway
