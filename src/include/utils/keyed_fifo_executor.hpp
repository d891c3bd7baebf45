#pragma once
/**
 * @file keyed_fifo_executor.hpp
 * @brief Serializes actions per key; different keys run concurrently.
 *
 * Each key owns an explicit task queue. The front task is the in-flight marker:
 * it stays in the queue while it runs and is popped when it settles, whatever
 * its outcome. The first submission for an idle key starts a drain worker for
 * that key; the worker runs tasks one at a time and exits (removing the key)
 * when the queue is empty, so idle keys cost nothing.
 *
 * Every caller gets its own std::future carrying the action's value or exception.
 * A failing action is delivered only to its caller and never stalls the queue.
 *
 * Re-entrancy: an action may call with_lock() for a different key. Calling it
 * for its own key and waiting on the result deadlocks.
 */
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

namespace docgate::utils
{

template <typename K, typename Hash = std::hash<K>>
class KeyedFifoExecutor
{
  public:
    KeyedFifoExecutor() = default;

    /**
     * @brief Waits for every worker, i.e. for all in-flight and queued actions.
     */
    ~KeyedFifoExecutor()
    {
        while (true)
        {
            std::list<Worker> workers;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                workers.swap(m_workers);
            }
            if (workers.empty())
                break;
            for (auto &w : workers)
            {
                if (w.thread.joinable())
                    w.thread.join();
            }
        }
    }

    KeyedFifoExecutor(const KeyedFifoExecutor &) = delete;
    KeyedFifoExecutor &operator=(const KeyedFifoExecutor &) = delete;

    /**
     * @brief Queues @p action behind every earlier action for @p key.
     * @return Future for this action's own outcome.
     *
     * After dispose() the action starts at once on its own worker, without waiting
     * for earlier work on the key.
     */
    template <typename F>
    [[nodiscard]] auto with_lock(const K &key, F &&action) -> std::future<std::invoke_result_t<F &>>
    {
        using R = std::invoke_result_t<F &>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(action));
        auto future = task->get_future();
        std::function<void()> run = [task]() { (*task)(); };

        std::lock_guard<std::mutex> lock(m_mutex);
        reap_finished_locked();
        if (m_disposed)
        {
            spawn_locked(std::move(run));
            return future;
        }

        auto &queue = m_queues[key];
        if (!queue)
            queue = std::make_shared<KeyQueue>();
        queue->tasks.push_back(std::move(run));
        if (!queue->draining)
        {
            queue->draining = true;
            spawn_locked([this, key, queue]() { drain(key, queue); });
        }
        return future;
    }

    /**
     * @brief Stops chaining new work. Already queued actions still drain in order;
     *        nothing is cancelled or awaited. Idempotent.
     */
    void dispose()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed)
            return;
        m_disposed = true;
        LOGGER_DEBUG("KeyedFifoExecutor: disposed with {} active key(s)", m_queues.size());
        m_queues.clear(); // workers keep their own reference to the detached queues
    }

    bool is_disposed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_disposed;
    }

    /// @brief Queued plus in-flight actions for @p key (0 for an idle key).
    size_t pending(const K &key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_queues.find(key);
        return it == m_queues.end() ? 0 : it->second->tasks.size();
    }

    /// @brief Number of keys that currently have queued or in-flight work.
    size_t active_keys() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queues.size();
    }

  private:
    struct KeyQueue
    {
        std::deque<std::function<void()>> tasks; // front() is the in-flight task
        bool draining{false};
    };

    struct Worker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void drain(const K &key, const std::shared_ptr<KeyQueue> &queue)
    {
        while (true)
        {
            std::function<void()> task;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (queue->tasks.empty())
                {
                    queue->draining = false;
                    auto it = m_queues.find(key);
                    if (it != m_queues.end() && it->second == queue)
                        m_queues.erase(it); // idle key pruned
                    return;
                }
                task = queue->tasks.front();
            }
            // The queue advances whether the task settles normally or not.
            auto advance = basics::make_scope_guard(
                [this, &queue]()
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    queue->tasks.pop_front();
                });
            task();
        }
    }

    void spawn_locked(std::function<void()> body)
    {
        auto done = std::make_shared<std::atomic<bool>>(false);
        Worker w;
        w.done = done;
        w.thread = std::thread(
            [body = std::move(body), done]()
            {
                auto mark_done = basics::make_scope_guard([&done]() { done->store(true); });
                body();
            });
        m_workers.push_back(std::move(w));
    }

    // Joins workers that already finished; they no longer touch m_mutex.
    void reap_finished_locked()
    {
        for (auto it = m_workers.begin(); it != m_workers.end();)
        {
            if (it->done->load())
            {
                if (it->thread.joinable())
                    it->thread.join();
                it = m_workers.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    mutable std::mutex m_mutex;
    std::unordered_map<K, std::shared_ptr<KeyQueue>, Hash> m_queues;
    std::list<Worker> m_workers;
    bool m_disposed{false};
};

} // namespace docgate::utils
