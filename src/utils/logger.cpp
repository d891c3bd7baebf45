/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "dgt_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace docgate::utils
{

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand, SetErrorCallbackCommand>;

namespace
{

// A promise is fulfilled exactly once by its owner; set_value on a satisfied
// promise is a logic error that is reported, not rethrown, from the worker.
void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value) noexcept
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &e)
    {
        DGT_DEBUG("Logger promise already satisfied: {}", e.what());
    }
}

LogMessage make_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

struct Logger::Impl
{
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void report_error(const std::string &msg) noexcept;

    std::function<void(const std::string &)> error_callback_; // worker thread only
    std::unique_ptr<Sink> sink_{std::make_unique<ConsoleSink>()};
    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex lifecycle_mutex_;
    size_t m_max_queue_size{10000};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> running_{false};
    bool shutdown_requested_{false}; // guarded by queue_mutex_
    std::atomic<size_t> m_messages_dropped{0};
};

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_ || !running_.load(std::memory_order_acquire))
        {
            std::visit(
                [](auto &&arg)
                {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (!std::is_same_v<T, LogMessage>)
                        promise_set_safe(arg.promise, false);
                },
                cmd);
            return false;
        }
        // Only plain messages are dropped on overflow; control commands always go through.
        if (queue_.size() >= m_max_queue_size && std::holds_alternative<LogMessage>(cmd))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &msg) noexcept
{
    if (!error_callback_)
    {
        DGT_DEBUG("Logger sink error with no callback registered: {}", msg);
        return;
    }
    try
    {
        error_callback_(msg);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[DOCGATE] Logger error callback threw: {}\n", e.what());
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_; });
            local_queue.swap(queue_);
            // Enqueue is refused once shutdown is requested, so an empty queue here is final.
            stopping = shutdown_requested_ && local_queue.empty();
        }

        const size_t dropped = m_messages_dropped.exchange(0, std::memory_order_relaxed);
        if (dropped > 0)
        {
            local_queue.insert(local_queue.begin(),
                               make_message(Logger::Level::L_WARNING,
                                            format_tools::make_buffer(
                                                "Logger queue overflow: {} messages dropped.", dropped)));
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                        sink_->write(*msg);
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_->description();
                            sink_->flush();
                            sink_ = std::move(arg.new_sink);
                            sink_->write(make_message(
                                Logger::Level::L_SYSTEM,
                                format_tools::make_buffer("Log sink switched from: {}", old_desc)));
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            sink_->flush();
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                // A failed control command still releases its waiter.
                std::visit(
                    [](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (!std::is_same_v<T, LogMessage>)
                            promise_set_safe(arg.promise, false);
                    },
                    cmd);
            }
        }
        local_queue.clear();

        if (stopping)
        {
            try
            {
                sink_->write(make_message(Logger::Level::L_SYSTEM,
                                          format_tools::make_buffer("Logger is shutting down.")));
                sink_->flush();
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger final flush failed: {}", e.what()));
            }
            return;
        }
    }
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    shutdown();
}

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

void Logger::start()
{
    std::lock_guard<std::mutex> lifecycle(pImpl->lifecycle_mutex_);
    if (pImpl->running_.load(std::memory_order_acquire))
        return;
    {
        std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
        pImpl->shutdown_requested_ = false;
        pImpl->running_.store(true, std::memory_order_release);
    }
    pImpl->worker_thread_ = std::thread(&Logger::Impl::worker_loop, pImpl.get());
}

void Logger::shutdown()
{
    std::lock_guard<std::mutex> lifecycle(pImpl->lifecycle_mutex_);
    if (!pImpl->running_.load(std::memory_order_acquire))
        return;
    {
        std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
        pImpl->shutdown_requested_ = true;
        pImpl->running_.store(false, std::memory_order_release);
    }
    pImpl->cv_.notify_one();
    if (pImpl->worker_thread_.joinable())
        pImpl->worker_thread_.join();
}

bool Logger::is_running() const noexcept
{
    return pImpl->running_.load(std::memory_order_acquire);
}

bool Logger::set_console()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> sink;
    std::string creation_error;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        creation_error = fmt::format("Failed to create FileSink: {}", e.what());
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (sink)
        pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    else
        pImpl->enqueue_command(SinkCreationErrorCommand{std::move(creation_error), promise});
    return future.get();
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get(); // false when not running; nothing to wait for then
}

void Logger::set_level(Level lvl) noexcept
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const noexcept
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return pImpl->running_.load(std::memory_order_acquire) &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        (void)pImpl->enqueue_command(make_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        // Allocation failure while queueing; nothing sensible left to log to.
        std::fprintf(stderr, "[DOCGATE] Logger enqueue failed: %s\n", e.what());
    }
}

void Logger::enqueue_log(Level lvl, std::string_view body) noexcept
{
    try
    {
        enqueue_log(lvl, format_tools::make_buffer("[FORMAT ERROR] {}", body));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DOCGATE] Logger enqueue failed: %s\n", e.what());
    }
}

} // namespace docgate::utils
