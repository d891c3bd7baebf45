#include "dgt_service.hpp"
#include "gateway/channel_registry.hpp"

namespace docgate::gateway
{

ChannelRegistry::ChannelRegistry(ChannelFactory factory) : m_factory(std::move(factory)) {}

ChannelRegistry::~ChannelRegistry()
{
    dispose_all();
}

ChannelLease ChannelRegistry::acquire(const std::string &key)
{
    ChannelLease lease;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        DGT_PRECONDITION(!m_disposed, "ChannelRegistry::acquire('{}') after dispose_all()", key);
        if (m_disposed)
            return lease;

        auto it = m_channels.find(key);
        if (it == m_channels.end())
        {
            it = m_channels.emplace(key, m_factory(key)).first;
            LOGGER_DEBUG("ChannelRegistry: channel '{}' created", key);
        }
        lease.channel = it->second;
        lease.channel->retain();
        lease.view = lease.channel->attach();
    }
    // The backend call stays outside the map lock; other keys are not blocked by it.
    lease.channel->ensure_subscribed();
    return lease;
}

void ChannelRegistry::release(const std::string &key)
{
    std::shared_ptr<SharedKeyedChannel> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(key);
        if (it == m_channels.end())
            return;
        if (it->second->release() > 0)
            return;
        doomed = std::move(it->second);
        m_channels.erase(it);
    }
    doomed->dispose();
    LOGGER_DEBUG("ChannelRegistry: channel '{}' released", key);
}

void ChannelRegistry::force_release(const std::string &key)
{
    std::shared_ptr<SharedKeyedChannel> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(key);
        if (it == m_channels.end())
            return;
        doomed = std::move(it->second);
        m_channels.erase(it);
    }
    doomed->dispose();
    LOGGER_DEBUG("ChannelRegistry: channel '{}' force-released", key);
}

void ChannelRegistry::dispose_all()
{
    std::unordered_map<std::string, std::shared_ptr<SharedKeyedChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed)
            return;
        m_disposed = true;
        channels.swap(m_channels);
    }
    for (auto &[key, channel] : channels)
        channel->dispose();
    LOGGER_DEBUG("ChannelRegistry: disposed ({} channel(s))", channels.size());
}

bool ChannelRegistry::is_disposed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disposed;
}

size_t ChannelRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.size();
}

bool ChannelRegistry::contains(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels.count(key) != 0;
}

int ChannelRegistry::ref_count(const std::string &key) const
{
    auto channel = find(key);
    return channel ? channel->ref_count() : 0;
}

std::vector<std::string> ChannelRegistry::keys() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_channels.size());
    for (const auto &entry : m_channels)
        out.push_back(entry.first);
    return out;
}

std::shared_ptr<SharedKeyedChannel> ChannelRegistry::find(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_channels.find(key);
    return it == m_channels.end() ? nullptr : it->second;
}

} // namespace docgate::gateway
