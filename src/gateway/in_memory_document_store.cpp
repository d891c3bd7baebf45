#include "dgt_service.hpp"
#include "gateway/in_memory_document_store.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

namespace docgate::gateway
{

namespace
{

struct Feed
{
    uint64_t id{0};
    std::string key;
    FeedHandlers handlers;
    std::optional<nlohmann::json> last; // touched only while holding the delivery turn
    std::atomic<bool> active{true};
};

using FeedList = std::vector<std::shared_ptr<Feed>>;

void validate_key(const std::string &key)
{
    if (key.empty())
        throw std::invalid_argument("InMemoryDocumentStore: document key must not be empty");
}

template <typename T> T json_field(const nlohmann::json &j, const char *name, T fallback)
{
    auto it = j.find(name);
    if (it == j.end() || it->is_null())
        return fallback;
    try
    {
        return it->get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("Store config: invalid '{}': {}", name, e.what()));
    }
}

} // namespace

StoreConfig store_config_from_json(const nlohmann::json &j)
{
    StoreConfig cfg;
    if (j.is_null())
        return cfg;
    if (!j.is_object())
        throw std::runtime_error("Store config: 'store' must be an object");
    cfg.latency_ms = json_field<int>(j, "latency_ms", cfg.latency_ms);
    if (cfg.latency_ms < 0)
        throw std::runtime_error("Store config: 'latency_ms' must not be negative");
    cfg.throw_on_save = json_field<bool>(j, "throw_on_save", cfg.throw_on_save);
    cfg.throw_on_delete = json_field<bool>(j, "throw_on_delete", cfg.throw_on_delete);
    cfg.emit_initial = json_field<bool>(j, "emit_initial", cfg.emit_initial);
    cfg.dedupe_by_content = json_field<bool>(j, "dedupe_by_content", cfg.dedupe_by_content);
    return cfg;
}

// ============================================================================
// State
// ============================================================================

struct InMemoryDocumentStore::State
{
    mutable std::mutex data_mutex;
    StoreConfig config;
    std::unordered_map<std::string, nlohmann::json> docs;
    std::unordered_map<uint64_t, std::shared_ptr<Feed>> feeds;
    uint64_t next_feed_id{1};
    bool disposed{false};
    std::atomic<bool> disposed_flag{false};
    std::atomic<size_t> subscribe_calls{0};
    std::atomic<size_t> cancel_calls{0};

    // Delivery turns. A ticket is issued under data_mutex, so handlers observe
    // changes in the order they were applied without holding data_mutex.
    std::mutex order_mutex;
    std::condition_variable order_cv;
    uint64_t tickets_issued{0};    // guarded by data_mutex
    uint64_t tickets_completed{0}; // guarded by order_mutex

    void ensure_not_disposed_locked() const
    {
        if (disposed)
            throw std::logic_error("InMemoryDocumentStore has been disposed");
    }

    FeedList feeds_for_locked(const std::string &key) const
    {
        FeedList out;
        for (const auto &[id, feed] : feeds)
        {
            if (feed->key == key)
                out.push_back(feed);
        }
        return out;
    }

    FeedList take_feeds_locked(const std::string &key)
    {
        FeedList out;
        for (auto it = feeds.begin(); it != feeds.end();)
        {
            if (it->second->key == key)
            {
                it->second->active.store(false);
                out.push_back(std::move(it->second));
                it = feeds.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return out;
    }

    void sleep_latency() const
    {
        int latency_ms = 0;
        {
            std::lock_guard<std::mutex> lock(data_mutex);
            latency_ms = config.latency_ms;
        }
        if (latency_ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms));
    }

    // Runs fn once every earlier ticket has been delivered.
    template <typename Fn> void deliver_in_turn(uint64_t ticket, Fn &&fn)
    {
        {
            std::unique_lock<std::mutex> lock(order_mutex);
            order_cv.wait(lock, [&] { return tickets_completed == ticket - 1; });
        }
        auto complete = basics::make_scope_guard(
            [this, ticket]()
            {
                {
                    std::lock_guard<std::mutex> lock(order_mutex);
                    tickets_completed = ticket;
                }
                order_cv.notify_all();
            });
        fn();
    }

    void emit_next(Feed &feed, const nlohmann::json &value, bool dedupe)
    {
        if (!feed.active.load() || !feed.handlers.on_next)
            return;
        if (dedupe)
        {
            if (feed.last && *feed.last == value)
                return;
            feed.last = value;
        }
        try
        {
            feed.handlers.on_next(value);
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("InMemoryDocumentStore: feed handler for '{}' threw: {}", feed.key,
                        e.what());
        }
    }

    static void emit_done(Feed &feed)
    {
        if (!feed.handlers.on_done)
            return;
        try
        {
            feed.handlers.on_done();
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("InMemoryDocumentStore: completion handler for '{}' threw: {}", feed.key,
                        e.what());
        }
    }

    void cancel_feed(uint64_t id)
    {
        std::lock_guard<std::mutex> lock(data_mutex);
        auto it = feeds.find(id);
        if (it == feeds.end())
            return;
        it->second->active.store(false);
        feeds.erase(it);
    }
};

// ============================================================================
// Subscription
// ============================================================================

class InMemoryDocumentStore::Subscription : public FeedSubscription
{
  public:
    Subscription(std::weak_ptr<State> state, uint64_t id) : m_state(std::move(state)), m_id(id) {}
    ~Subscription() override = default;

    void cancel() override
    {
        if (m_cancelled.exchange(true))
            return;
        if (auto state = m_state.lock())
        {
            state->cancel_calls.fetch_add(1);
            state->cancel_feed(m_id);
        }
    }

  private:
    std::weak_ptr<State> m_state;
    uint64_t m_id;
    std::atomic<bool> m_cancelled{false};
};

// ============================================================================
// InMemoryDocumentStore
// ============================================================================

InMemoryDocumentStore::InMemoryDocumentStore(StoreConfig config)
    : m_state(std::make_shared<State>())
{
    m_state->config = config;
}

InMemoryDocumentStore::~InMemoryDocumentStore()
{
    dispose();
}

nlohmann::json InMemoryDocumentStore::read(const std::string &key)
{
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        validate_key(key);
    }
    m_state->sleep_latency();

    std::lock_guard<std::mutex> lock(m_state->data_mutex);
    m_state->ensure_not_disposed_locked();
    auto it = m_state->docs.find(key);
    if (it == m_state->docs.end())
        throw DocumentNotFound(key);
    return it->second;
}

nlohmann::json InMemoryDocumentStore::write(const std::string &key, const nlohmann::json &doc)
{
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        validate_key(key);
        if (m_state->config.throw_on_save)
            throw std::runtime_error("Simulated save error");
    }
    m_state->sleep_latency();

    FeedList targets;
    uint64_t ticket = 0;
    bool dedupe = false;
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        m_state->docs[key] = doc;
        targets = m_state->feeds_for_locked(key);
        dedupe = m_state->config.dedupe_by_content;
        ticket = ++m_state->tickets_issued;
    }
    m_state->deliver_in_turn(ticket,
                             [&]()
                             {
                                 for (auto &feed : targets)
                                     m_state->emit_next(*feed, doc, dedupe);
                             });
    return doc;
}

void InMemoryDocumentStore::remove(const std::string &key)
{
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        validate_key(key);
        if (m_state->config.throw_on_delete)
            throw std::runtime_error("Simulated delete error");
    }
    m_state->sleep_latency();

    FeedList targets;
    uint64_t ticket = 0;
    bool dedupe = false;
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        if (m_state->docs.erase(key) == 0)
            return; // absent: nothing changed, nothing to announce
        targets = m_state->feeds_for_locked(key);
        dedupe = m_state->config.dedupe_by_content;
        ticket = ++m_state->tickets_issued;
    }
    const auto empty = nlohmann::json::object();
    m_state->deliver_in_turn(ticket,
                             [&]()
                             {
                                 for (auto &feed : targets)
                                     m_state->emit_next(*feed, empty, dedupe);
                             });
}

std::unique_ptr<FeedSubscription> InMemoryDocumentStore::watch(const std::string &key,
                                                               FeedHandlers handlers)
{
    std::shared_ptr<Feed> feed;
    std::optional<nlohmann::json> initial;
    uint64_t ticket = 0;
    bool dedupe = false;
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        validate_key(key);
        feed = std::make_shared<Feed>();
        feed->id = m_state->next_feed_id++;
        feed->key = key;
        feed->handlers = std::move(handlers);
        m_state->feeds.emplace(feed->id, feed);
        m_state->subscribe_calls.fetch_add(1);
        if (m_state->config.emit_initial)
        {
            auto it = m_state->docs.find(key);
            initial = (it != m_state->docs.end()) ? it->second : nlohmann::json::object();
            dedupe = m_state->config.dedupe_by_content;
            ticket = ++m_state->tickets_issued;
        }
    }
    auto subscription = std::make_unique<Subscription>(m_state, feed->id);
    if (initial)
    {
        m_state->deliver_in_turn(ticket, [&]() { m_state->emit_next(*feed, *initial, dedupe); });
    }
    return subscription;
}

void InMemoryDocumentStore::dispose()
{
    FeedList all;
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        if (m_state->disposed)
            return;
        m_state->disposed = true;
        m_state->disposed_flag.store(true);
        for (auto &[id, feed] : m_state->feeds)
        {
            feed->active.store(false);
            all.push_back(std::move(feed));
        }
        m_state->feeds.clear();
        m_state->docs.clear();
        ticket = ++m_state->tickets_issued;
    }
    m_state->deliver_in_turn(ticket,
                             [&]()
                             {
                                 for (auto &feed : all)
                                     State::emit_done(*feed);
                             });
}

bool InMemoryDocumentStore::is_disposed() const noexcept
{
    return m_state->disposed_flag.load();
}

void InMemoryDocumentStore::set_config(const StoreConfig &config)
{
    std::lock_guard<std::mutex> lock(m_state->data_mutex);
    m_state->config = config;
}

StoreConfig InMemoryDocumentStore::config() const
{
    std::lock_guard<std::mutex> lock(m_state->data_mutex);
    return m_state->config;
}

void InMemoryDocumentStore::fail_feed(const std::string &key, std::exception_ptr error)
{
    FeedList targets;
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        targets = m_state->feeds_for_locked(key);
        ticket = ++m_state->tickets_issued;
    }
    m_state->deliver_in_turn(ticket,
                             [&]()
                             {
                                 for (auto &feed : targets)
                                 {
                                     if (!feed->active.load() || !feed->handlers.on_error)
                                         continue;
                                     try
                                     {
                                         feed->handlers.on_error(error);
                                     }
                                     catch (const std::exception &e)
                                     {
                                         LOGGER_WARN("InMemoryDocumentStore: error handler for "
                                                     "'{}' threw: {}",
                                                     key, e.what());
                                     }
                                 }
                             });
}

void InMemoryDocumentStore::close_feeds(const std::string &key)
{
    FeedList targets;
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(m_state->data_mutex);
        m_state->ensure_not_disposed_locked();
        targets = m_state->take_feeds_locked(key);
        ticket = ++m_state->tickets_issued;
    }
    m_state->deliver_in_turn(ticket,
                             [&]()
                             {
                                 for (auto &feed : targets)
                                     State::emit_done(*feed);
                             });
}

size_t InMemoryDocumentStore::subscriber_count(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(m_state->data_mutex);
    return m_state->feeds_for_locked(key).size();
}

size_t InMemoryDocumentStore::subscribe_calls() const noexcept
{
    return m_state->subscribe_calls.load();
}

size_t InMemoryDocumentStore::cancel_calls() const noexcept
{
    return m_state->cancel_calls.load();
}

size_t InMemoryDocumentStore::size() const
{
    std::lock_guard<std::mutex> lock(m_state->data_mutex);
    return m_state->docs.size();
}

} // namespace docgate::gateway
