#pragma once
/**
 * @file document_gateway.hpp
 * @brief ReactiveDocumentGateway: the Result-returning front of a DocumentStore.
 */
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"
#include "gateway/channel_registry.hpp"
#include "gateway/document_store.hpp"
#include "gateway/error_item.hpp"
#include "gateway/error_mapper.hpp"
#include "gateway/watch_view.hpp"
#include "utils/result.hpp"

namespace docgate::gateway
{

struct GatewayOptions
{
    /// Collection name; used for logging only, the store is already scoped.
    std::string collection = "documents";
    /// Identity field injected into payloads that lack it.
    std::string id_key = "id";
    /// write() returns the backend acknowledgement instead of the input.
    bool read_after_write = false;
    /// `{}` coming from the backend becomes DatabaseErrorItems::not_found().
    bool treat_empty_as_missing = false;
};

/**
 * @class ReactiveDocumentGateway
 * @brief read / write / remove / watch over an injected DocumentStore.
 *
 * No operation throws. Exceptions raised by the store and business errors encoded
 * in payloads are both turned into ErrorItems by the injected ErrorMapper.
 *
 * Every success payload carries the document key under `id_key` unless the
 * backend already supplied that field, in which case the backend value is kept.
 *
 * watch() shares one backend feed per key among all watchers. Each watch() call
 * takes a reference that only detach_watch() gives back; cancelling the returned
 * view does not. The first event of every view is a bootstrap `{}` success.
 *
 * dispose() is terminal; calling read/write/remove/watch afterwards is a
 * precondition violation.
 */
class DOCGATE_UTILS_EXPORT ReactiveDocumentGateway
{
  public:
    explicit ReactiveDocumentGateway(std::shared_ptr<DocumentStore> store,
                                     std::shared_ptr<const ErrorMapper> mapper = nullptr,
                                     GatewayOptions options = {});
    ~ReactiveDocumentGateway();

    ReactiveDocumentGateway(const ReactiveDocumentGateway &) = delete;
    ReactiveDocumentGateway &operator=(const ReactiveDocumentGateway &) = delete;

    [[nodiscard]] DocResult<nlohmann::json> read(const std::string &key);
    [[nodiscard]] DocResult<nlohmann::json> write(const std::string &key,
                                                  const nlohmann::json &payload);
    /// Removing an absent document succeeds.
    [[nodiscard]] DocResult<Unit> remove(const std::string &key);

    /// write() for callers that may race with dispose(): a disposed gateway yields
    /// DB_UNAVAILABLE instead of failing the precondition.
    [[nodiscard]] DocResult<nlohmann::json> try_write(const std::string &key,
                                                      const nlohmann::json &payload);
    [[nodiscard]] DocResult<Unit> try_remove(const std::string &key);

    /// Retains the shared channel of @p key and returns a new view of it.
    std::shared_ptr<WatchView> watch(const std::string &key);
    /// Gives back one watch() reference; the channel is disposed at zero.
    void detach_watch(const std::string &key);
    /// Disposes the channel of @p key regardless of its reference count.
    void release_doc(const std::string &key);
    /// Disposes every channel. Idempotent.
    void dispose();

    bool is_disposed() const;

    // Diagnostics
    size_t channel_count() const;
    bool has_channel(const std::string &key) const;
    int ref_count(const std::string &key) const;
    /// Last event published on the channel of @p key, if it is being watched.
    std::optional<DocEvent> peek(const std::string &key) const;

    const GatewayOptions &options() const noexcept { return m_options; }
    const ErrorMapper &mapper() const noexcept { return *m_mapper; }

  private:
    /// Runs @p fn and converts anything it throws into an error mapped at @p location.
    template <typename T, typename Fn>
    DocResult<T> guarded(std::string_view location, const std::string &key, Fn &&fn) const;

    DocResult<nlohmann::json> read_impl(const std::string &key);
    DocResult<nlohmann::json> write_impl(const std::string &key, const nlohmann::json &payload);
    DocResult<Unit> remove_impl(const std::string &key);

    std::shared_ptr<SharedKeyedChannel> make_channel(const std::string &key) const;

    std::shared_ptr<DocumentStore> m_store;
    std::shared_ptr<const ErrorMapper> m_mapper;
    GatewayOptions m_options;
    ChannelRegistry m_registry;
};

} // namespace docgate::gateway
