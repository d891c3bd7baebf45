#include "dgt_service.hpp"
#include "gateway/database_error_items.hpp"
#include "gateway/document_gateway.hpp"

namespace docgate::gateway
{

namespace
{

constexpr std::string_view kReadLocation = "ReactiveDocumentGateway.read";
constexpr std::string_view kWriteLocation = "ReactiveDocumentGateway.write";
constexpr std::string_view kDeleteLocation = "ReactiveDocumentGateway.delete";
constexpr std::string_view kWatchLocation = "ReactiveDocumentGateway.watch";
constexpr std::string_view kWatchErrorLocation = "ReactiveDocumentGateway.watch:onError";

bool is_empty_payload(const nlohmann::json &payload)
{
    return payload.is_null() || (payload.is_object() && payload.empty());
}

/// The backend's own identity field wins over the key.
nlohmann::json with_id(const GatewayOptions &options, const std::string &key,
                       const nlohmann::json &payload)
{
    if (payload.is_null())
        return nlohmann::json{{options.id_key, key}};
    if (!payload.is_object() || payload.contains(options.id_key))
        return payload;
    nlohmann::json out = payload;
    out[options.id_key] = key;
    return out;
}

DocEvent map_payload(const ErrorMapper &mapper, const GatewayOptions &options,
                     const std::string &key, const nlohmann::json &payload,
                     std::string_view location)
{
    if (auto business_error = mapper.from_payload(payload, location))
        return DocEvent::error(std::move(*business_error));
    if (options.treat_empty_as_missing && is_empty_payload(payload))
        return DocEvent::error(DatabaseErrorItems::not_found());
    return DocEvent::ok(with_id(options, key, payload));
}

} // namespace

ReactiveDocumentGateway::ReactiveDocumentGateway(std::shared_ptr<DocumentStore> store,
                                                 std::shared_ptr<const ErrorMapper> mapper,
                                                 GatewayOptions options)
    : m_store(std::move(store)),
      m_mapper(mapper ? std::move(mapper) : std::make_shared<DefaultErrorMapper>()),
      m_options(std::move(options)),
      m_registry([this](const std::string &key) { return make_channel(key); })
{
    if (!m_store)
        throw std::invalid_argument("ReactiveDocumentGateway: store must not be null");
    if (m_options.id_key.empty())
        throw std::invalid_argument("ReactiveDocumentGateway: id_key must not be empty");
    LOGGER_DEBUG("ReactiveDocumentGateway[{}]: created (id_key='{}', read_after_write={}, "
                 "treat_empty_as_missing={})",
                 m_options.collection, m_options.id_key, m_options.read_after_write,
                 m_options.treat_empty_as_missing);
}

ReactiveDocumentGateway::~ReactiveDocumentGateway()
{
    dispose();
}

DocResult<nlohmann::json> ReactiveDocumentGateway::read(const std::string &key)
{
    DGT_PRECONDITION(!is_disposed(), "ReactiveDocumentGateway::read('{}') after dispose()", key);
    return read_impl(key);
}

DocResult<nlohmann::json> ReactiveDocumentGateway::write(const std::string &key,
                                                         const nlohmann::json &payload)
{
    DGT_PRECONDITION(!is_disposed(), "ReactiveDocumentGateway::write('{}') after dispose()", key);
    return write_impl(key, payload);
}

DocResult<Unit> ReactiveDocumentGateway::remove(const std::string &key)
{
    DGT_PRECONDITION(!is_disposed(), "ReactiveDocumentGateway::remove('{}') after dispose()", key);
    return remove_impl(key);
}

DocResult<nlohmann::json> ReactiveDocumentGateway::try_write(const std::string &key,
                                                             const nlohmann::json &payload)
{
    return write_impl(key, payload);
}

DocResult<Unit> ReactiveDocumentGateway::try_remove(const std::string &key)
{
    return remove_impl(key);
}

template <typename T, typename Fn>
DocResult<T> ReactiveDocumentGateway::guarded(std::string_view location, const std::string &key,
                                              Fn &&fn) const
{
    try
    {
        return fn();
    }
    catch (const std::exception &e)
    {
        LOGGER_DEBUG("{}[{}]: '{}' failed: {}", location, m_options.collection, key,
                     format_tools::truncate_for_log(e.what()));
        return DocResult<T>::error(m_mapper->from_exception(std::current_exception(), location));
    }
    catch (...)
    {
        LOGGER_DEBUG("{}[{}]: '{}' failed: non-standard exception", location,
                     m_options.collection, key);
        return DocResult<T>::error(m_mapper->from_exception(std::current_exception(), location));
    }
}

DocResult<nlohmann::json> ReactiveDocumentGateway::read_impl(const std::string &key)
{
    if (is_disposed())
        return DocResult<nlohmann::json>::error(DatabaseErrorItems::unavailable());
    return guarded<nlohmann::json>(
        kReadLocation, key,
        [&]() { return map_payload(*m_mapper, m_options, key, m_store->read(key), kReadLocation); });
}

DocResult<nlohmann::json> ReactiveDocumentGateway::write_impl(const std::string &key,
                                                              const nlohmann::json &payload)
{
    if (is_disposed())
        return DocResult<nlohmann::json>::error(DatabaseErrorItems::unavailable());
    if (!payload.is_object())
    {
        return DocResult<nlohmann::json>::error(
            DatabaseErrorItems::validation_failed()
                .with_meta("location", std::string(kWriteLocation))
                .with_meta("reason", "payload must be a JSON object"));
    }
    return guarded<nlohmann::json>(
        kWriteLocation, key,
        [&]()
        {
            nlohmann::json ack = m_store->write(key, payload);
            if (!m_options.read_after_write)
                return DocResult<nlohmann::json>::ok(with_id(m_options, key, payload));
            // The stored document gets the same checks as read(); a null ack costs one read.
            const nlohmann::json stored = ack.is_null() ? m_store->read(key) : std::move(ack);
            return map_payload(*m_mapper, m_options, key, stored, kWriteLocation);
        });
}

DocResult<Unit> ReactiveDocumentGateway::remove_impl(const std::string &key)
{
    if (is_disposed())
        return DocResult<Unit>::error(DatabaseErrorItems::unavailable());
    return guarded<Unit>(kDeleteLocation, key,
                         [&]()
                         {
                             m_store->remove(key);
                             return DocResult<Unit>::ok(Unit{});
                         });
}

std::shared_ptr<WatchView> ReactiveDocumentGateway::watch(const std::string &key)
{
    DGT_PRECONDITION(!is_disposed(), "ReactiveDocumentGateway::watch('{}') after dispose()", key);
    ChannelLease lease = m_registry.acquire(key);
    if (!lease.view)
        return WatchView::closed_with(DocEvent::error(DatabaseErrorItems::unavailable()));
    return lease.view;
}

void ReactiveDocumentGateway::detach_watch(const std::string &key)
{
    m_registry.release(key);
}

void ReactiveDocumentGateway::release_doc(const std::string &key)
{
    m_registry.force_release(key);
}

void ReactiveDocumentGateway::dispose()
{
    if (m_registry.is_disposed())
        return;
    m_registry.dispose_all();
    LOGGER_INFO("ReactiveDocumentGateway[{}]: disposed", m_options.collection);
}

bool ReactiveDocumentGateway::is_disposed() const
{
    return m_registry.is_disposed();
}

size_t ReactiveDocumentGateway::channel_count() const
{
    return m_registry.size();
}

bool ReactiveDocumentGateway::has_channel(const std::string &key) const
{
    return m_registry.contains(key);
}

int ReactiveDocumentGateway::ref_count(const std::string &key) const
{
    return m_registry.ref_count(key);
}

std::optional<DocEvent> ReactiveDocumentGateway::peek(const std::string &key) const
{
    auto channel = m_registry.find(key);
    if (!channel)
        return std::nullopt;
    return channel->last_value();
}

std::shared_ptr<SharedKeyedChannel> ReactiveDocumentGateway::make_channel(const std::string &key) const
{
    // The mapping owns what it uses; a late backend callback never touches the gateway.
    ChannelMapping mapping;
    mapping.on_payload = [mapper = m_mapper, options = m_options, key](const nlohmann::json &payload)
    { return map_payload(*mapper, options, key, payload, kWatchLocation); };
    mapping.on_error = [mapper = m_mapper](std::exception_ptr error)
    { return mapper->from_exception(error, kWatchErrorLocation); };
    mapping.on_closed = []() { return DatabaseErrorItems::stream_closed(); };
    return std::make_shared<SharedKeyedChannel>(key, m_store, std::move(mapping));
}

} // namespace docgate::gateway
