#pragma once
/**
 * @file watch_view.hpp
 * @brief One watcher's view of a shared document channel.
 */
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"
#include "gateway/error_item.hpp"

namespace docgate::gateway
{

/// One emission of a watched document.
using DocEvent = DocResult<nlohmann::json>;

class SharedKeyedChannel;

/**
 * @class WatchView
 * @brief Thread-safe FIFO of the events a channel fanned out to this watcher.
 *
 * cancel() stops this view only; it does not release the channel reference taken
 * by the watch call (detach_watch() does). A view is closed when its channel is
 * disposed; events already queued stay readable after close.
 */
class DOCGATE_UTILS_EXPORT WatchView
{
  public:
    WatchView() = default;
    WatchView(const WatchView &) = delete;
    WatchView &operator=(const WatchView &) = delete;

    /// Already-closed view holding @p final_event as its only event.
    static std::shared_ptr<WatchView> closed_with(DocEvent final_event);

    /**
     * @brief Waits up to @p timeout for the next event.
     * @return nullopt on timeout, on a cancelled view, or on a closed and drained view.
     */
    std::optional<DocEvent> next(std::chrono::milliseconds timeout);

    /// Next event if one is queued.
    std::optional<DocEvent> try_next();

    /// Drops queued events and stops further delivery to this view. Idempotent.
    void cancel();

    bool is_cancelled() const;
    bool is_closed() const;
    size_t pending() const;

  private:
    friend class SharedKeyedChannel;

    /// Queues a copy of @p event; ignored once cancelled or closed.
    void push(const DocEvent &event);
    void close();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<DocEvent> m_events;
    bool m_cancelled{false};
    bool m_closed{false};
};

} // namespace docgate::gateway
