#include "gateway/watch_view.hpp"

namespace docgate::gateway
{

std::shared_ptr<WatchView> WatchView::closed_with(DocEvent final_event)
{
    auto view = std::make_shared<WatchView>();
    view->m_events.push_back(std::move(final_event));
    view->m_closed = true;
    return view;
}

std::optional<DocEvent> WatchView::next(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_events.empty() || m_closed || m_cancelled; });
    if (m_cancelled || m_events.empty())
        return std::nullopt;
    DocEvent ev = std::move(m_events.front());
    m_events.pop_front();
    return ev;
}

std::optional<DocEvent> WatchView::try_next()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled || m_events.empty())
        return std::nullopt;
    DocEvent ev = std::move(m_events.front());
    m_events.pop_front();
    return ev;
}

void WatchView::cancel()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
        m_events.clear();
    }
    m_cv.notify_all();
}

bool WatchView::is_cancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool WatchView::is_closed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t WatchView::pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

void WatchView::push(const DocEvent &event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled || m_closed)
            return;
        m_events.push_back(event.clone());
    }
    m_cv.notify_all();
}

void WatchView::close()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

} // namespace docgate::gateway
