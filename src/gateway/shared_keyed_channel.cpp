#include "dgt_service.hpp"
#include "gateway/shared_keyed_channel.hpp"

#include <algorithm>

namespace docgate::gateway
{

namespace
{

DocEvent bootstrap_event()
{
    return DocEvent::ok(nlohmann::json::object());
}

} // namespace

SharedKeyedChannel::SharedKeyedChannel(std::string key, std::shared_ptr<DocumentStore> store,
                                       ChannelMapping mapping)
    : m_key(std::move(key)), m_store(std::move(store)), m_mapping(std::move(mapping))
{
}

SharedKeyedChannel::~SharedKeyedChannel()
{
    dispose();
}

std::shared_ptr<WatchView> SharedKeyedChannel::attach()
{
    auto view = std::make_shared<WatchView>();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_disposed)
    {
        view->close();
        return view;
    }
    // Every view starts from the bootstrap value, warm channel or not.
    view->push(bootstrap_event());
    m_views.push_back(view);
    if (!m_last)
        m_last = bootstrap_event();
    return view;
}

void SharedKeyedChannel::ensure_subscribed()
{
    std::lock_guard<std::mutex> subscribe_lock(m_subscribe_mutex);
    if (m_subscribe_attempted)
        return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed)
            return;
    }
    m_subscribe_attempted = true;

    std::weak_ptr<SharedKeyedChannel> weak = weak_from_this();
    FeedHandlers handlers;
    handlers.on_next = [weak](const nlohmann::json &payload)
    {
        auto self = weak.lock();
        if (!self)
            return;
        try
        {
            self->publish(self->m_mapping.on_payload(payload));
        }
        catch (...)
        {
            self->publish(DocEvent::error(self->m_mapping.on_error(std::current_exception())));
        }
    };
    handlers.on_error = [weak](std::exception_ptr error)
    {
        if (auto self = weak.lock())
        {
            LOGGER_WARN("SharedKeyedChannel '{}': backend feed error", self->m_key);
            self->publish(DocEvent::error(self->m_mapping.on_error(error)));
        }
    };
    handlers.on_done = [weak]()
    {
        if (auto self = weak.lock())
        {
            LOGGER_DEBUG("SharedKeyedChannel '{}': backend feed completed", self->m_key);
            self->publish(DocEvent::error(self->m_mapping.on_closed()));
        }
    };

    std::unique_ptr<FeedSubscription> subscription;
    try
    {
        subscription = m_store->watch(m_key, std::move(handlers));
    }
    catch (...)
    {
        LOGGER_WARN("SharedKeyedChannel '{}': subscribe failed", m_key);
        publish(DocEvent::error(m_mapping.on_error(std::current_exception())));
        return;
    }
    LOGGER_DEBUG("SharedKeyedChannel '{}': subscribed", m_key);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_disposed)
        {
            m_subscription = std::move(subscription);
            return;
        }
    }
    // Disposed while subscribing.
    subscription->cancel();
}

int SharedKeyedChannel::retain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return ++m_refs;
}

int SharedKeyedChannel::release()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_refs > 0)
        --m_refs;
    return m_refs;
}

void SharedKeyedChannel::dispose()
{
    std::unique_ptr<FeedSubscription> subscription;
    std::vector<std::shared_ptr<WatchView>> views;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed)
            return;
        m_disposed = true;
        subscription = std::move(m_subscription);
        views.swap(m_views);
        m_last.reset();
    }
    if (subscription)
    {
        try
        {
            subscription->cancel();
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("SharedKeyedChannel '{}': cancel failed: {}", m_key, e.what());
        }
        catch (...)
        {
            LOGGER_WARN("SharedKeyedChannel '{}': cancel failed: non-standard exception", m_key);
        }
    }
    for (auto &view : views)
        view->close();
    LOGGER_DEBUG("SharedKeyedChannel '{}': disposed ({} view(s))", m_key, views.size());
}

int SharedKeyedChannel::ref_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_refs;
}

bool SharedKeyedChannel::is_disposed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disposed;
}

bool SharedKeyedChannel::is_subscribed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscription != nullptr;
}

size_t SharedKeyedChannel::view_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_views.size();
}

std::optional<DocEvent> SharedKeyedChannel::last_value() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_last)
        return std::nullopt;
    return m_last->clone();
}

void SharedKeyedChannel::publish(DocEvent event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_disposed)
        return;
    m_views.erase(std::remove_if(m_views.begin(), m_views.end(),
                                 [](const std::shared_ptr<WatchView> &v) { return v->is_cancelled(); }),
                  m_views.end());
    for (auto &view : m_views)
        view->push(event);
    m_last = std::move(event);
}

} // namespace docgate::gateway
