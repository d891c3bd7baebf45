#pragma once
/**
 * @file serializing_repository.hpp
 * @brief Typed repository over ReactiveDocumentGateway with optional per-document
 *        write serialization.
 *
 * Entities are converted with nlohmann ADL (`to_json` / `from_json` for T), or with
 * a caller-supplied decoder. A payload that fails to decode becomes an ErrorItem
 * mapped with location `SerializingRepository.decode`.
 *
 * With serialization on, write() and remove() for one document id run strictly in
 * submission order on a KeyedFifoExecutor; different ids still run concurrently.
 * With it off they run on the calling thread and the returned future is ready.
 */
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "gateway/database_error_items.hpp"
#include "gateway/document_gateway.hpp"
#include "gateway/error_mapper.hpp"
#include "gateway/watch_view.hpp"
#include "utils/debug_info.hpp"
#include "utils/keyed_fifo_executor.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"

namespace docgate::gateway
{

inline constexpr std::string_view kDecodeLocation = "SerializingRepository.decode";

namespace detail
{

template <typename T>
DocResult<T> decode_event(const DocEvent &event,
                          const std::function<T(const nlohmann::json &)> &decoder,
                          const ErrorMapper &mapper)
{
    if (event.is_error())
        return DocResult<T>::error(event.error());
    try
    {
        return DocResult<T>::ok(decoder(event.content()));
    }
    catch (const std::exception &e)
    {
        LOGGER_DEBUG("SerializingRepository: decode failed: {}", e.what());
        return DocResult<T>::error(mapper.from_exception(std::current_exception(), kDecodeLocation));
    }
    catch (...)
    {
        LOGGER_DEBUG("SerializingRepository: decode failed: non-standard exception");
        return DocResult<T>::error(mapper.from_exception(std::current_exception(), kDecodeLocation));
    }
}

} // namespace detail

/**
 * @class TypedWatchView
 * @brief Decoding wrapper around a WatchView. Cancelling it cancels the view only.
 */
template <typename T> class TypedWatchView
{
  public:
    using Decoder = std::function<T(const nlohmann::json &)>;

    TypedWatchView(std::shared_ptr<WatchView> view, Decoder decoder,
                   std::shared_ptr<const ErrorMapper> mapper)
        : m_view(std::move(view)), m_decoder(std::move(decoder)), m_mapper(std::move(mapper))
    {
    }

    std::optional<DocResult<T>> next(std::chrono::milliseconds timeout)
    {
        return decode(m_view->next(timeout));
    }

    std::optional<DocResult<T>> try_next() { return decode(m_view->try_next()); }

    void cancel() { m_view->cancel(); }
    bool is_cancelled() const { return m_view->is_cancelled(); }
    bool is_closed() const { return m_view->is_closed(); }

    const std::shared_ptr<WatchView> &raw() const noexcept { return m_view; }

  private:
    std::optional<DocResult<T>> decode(std::optional<DocEvent> event) const
    {
        if (!event)
            return std::nullopt;
        return detail::decode_event<T>(*event, m_decoder, *m_mapper);
    }

    std::shared_ptr<WatchView> m_view;
    Decoder m_decoder;
    std::shared_ptr<const ErrorMapper> m_mapper;
};

template <typename T> class SerializingRepository
{
  public:
    using Decoder = std::function<T(const nlohmann::json &)>;

    /**
     * @param gateway          Shared gateway; dispose() disposes it too.
     * @param serialize_writes Route write/remove through a per-id FIFO. Off by default;
     *                         GatewayConfig::serialize_writes turns it on for applications.
     * @param decoder          Payload → entity; defaults to `json.get<T>()`.
     */
    explicit SerializingRepository(std::shared_ptr<ReactiveDocumentGateway> gateway,
                                   bool serialize_writes = false, Decoder decoder = nullptr,
                                   std::shared_ptr<const ErrorMapper> mapper = nullptr)
        : m_gateway(std::move(gateway)),
          m_decoder(decoder ? std::move(decoder)
                            : Decoder([](const nlohmann::json &j) { return j.get<T>(); })),
          m_mapper(mapper ? std::move(mapper) : std::make_shared<DefaultErrorMapper>())
    {
        if (!m_gateway)
            throw std::invalid_argument("SerializingRepository: gateway must not be null");
        if (serialize_writes)
            m_executor = std::make_unique<utils::KeyedFifoExecutor<std::string>>();
    }

    ~SerializingRepository() = default;

    SerializingRepository(const SerializingRepository &) = delete;
    SerializingRepository &operator=(const SerializingRepository &) = delete;

    DocResult<T> read(const std::string &key)
    {
        DGT_PRECONDITION(!is_disposed(), "SerializingRepository::read('{}') after dispose()", key);
        if (is_disposed())
            return DocResult<T>::error(DatabaseErrorItems::unavailable());
        return decode(m_gateway->read(key));
    }

    /// The result is the stored document decoded back into T.
    std::future<DocResult<T>> write(const std::string &key, const T &entity)
    {
        DGT_PRECONDITION(!is_disposed(), "SerializingRepository::write('{}') after dispose()", key);
        if (is_disposed())
            return ready(DocResult<T>::error(DatabaseErrorItems::unavailable()));

        nlohmann::json payload;
        try
        {
            payload = entity;
        }
        catch (const std::exception &e)
        {
            LOGGER_DEBUG("SerializingRepository: encode of '{}' failed: {}", key, e.what());
            return ready(DocResult<T>::error(DatabaseErrorItems::serialization_error().with_meta(
                "reason", std::string(e.what()))));
        }
        catch (...)
        {
            LOGGER_DEBUG("SerializingRepository: encode of '{}' failed: non-standard exception", key);
            return ready(DocResult<T>::error(DatabaseErrorItems::serialization_error().with_meta(
                "reason", "non-standard exception")));
        }
        return submit(key,
                      [this, key, payload = std::move(payload)]()
                      { return decode(m_gateway->try_write(key, payload)); });
    }

    std::future<DocResult<Unit>> remove(const std::string &key)
    {
        DGT_PRECONDITION(!is_disposed(), "SerializingRepository::remove('{}') after dispose()", key);
        if (is_disposed())
            return ready(DocResult<Unit>::error(DatabaseErrorItems::unavailable()));
        return submit(key,
                      [this, key]() { return m_gateway->try_remove(key); });
    }

    TypedWatchView<T> watch(const std::string &key)
    {
        DGT_PRECONDITION(!is_disposed(), "SerializingRepository::watch('{}') after dispose()", key);
        return TypedWatchView<T>(m_gateway->watch(key), m_decoder, m_mapper);
    }

    void detach_watch(const std::string &key) { m_gateway->detach_watch(key); }
    void release_doc(const std::string &key) { m_gateway->release_doc(key); }

    /**
     * @brief Stops write serialization and disposes the gateway. Idempotent.
     *
     * Writes still queued at that point complete with DB_UNAVAILABLE, including one
     * that was already dequeued when dispose() ran on another thread.
     */
    void dispose()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_disposed)
                return;
            m_disposed = true;
        }
        if (m_executor)
            m_executor->dispose();
        m_gateway->dispose();
        LOGGER_DEBUG("SerializingRepository: disposed");
    }

    bool is_disposed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_disposed;
    }

    bool serializes_writes() const noexcept { return m_executor != nullptr; }

    /// Pending serialized writes/removes for @p key (0 when not serializing).
    size_t pending(const std::string &key) const { return m_executor ? m_executor->pending(key) : 0; }

  private:
    DocResult<T> decode(DocResult<nlohmann::json> raw) const
    {
        return detail::decode_event<T>(raw, m_decoder, *m_mapper);
    }

    template <typename R> static std::future<R> ready(R value)
    {
        std::promise<R> promise;
        promise.set_value(std::move(value));
        return promise.get_future();
    }

    template <typename F> auto submit(const std::string &key, F &&fn)
        -> std::future<std::invoke_result_t<F &>>
    {
        if (m_executor)
            return m_executor->with_lock(key, std::forward<F>(fn));
        return ready(fn());
    }

    std::shared_ptr<ReactiveDocumentGateway> m_gateway;
    Decoder m_decoder;
    std::shared_ptr<const ErrorMapper> m_mapper;

    mutable std::mutex m_mutex;
    bool m_disposed{false};

    // Declared last: destroyed first, so queued writes finish while the gateway is alive.
    std::unique_ptr<utils::KeyedFifoExecutor<std::string>> m_executor;
};

} // namespace docgate::gateway
