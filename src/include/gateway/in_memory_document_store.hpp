#pragma once
/**
 * @file in_memory_document_store.hpp
 * @brief Thread-safe in-memory DocumentStore with failure injection hooks.
 *
 * Backs tests, examples and local runs. Feeds receive the current document on
 * subscribe (when `emit_initial`) and then every change of that document; a
 * removed document is delivered as `{}`.
 *
 * Feed handlers run outside the store's data lock, serialized per store, so all
 * feeds observe changes in write order. Handlers may read from the store but must
 * not write to or remove from it.
 */
#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"
#include "gateway/document_store.hpp"

namespace docgate::gateway
{

struct StoreConfig
{
    int latency_ms{0};              ///< Artificial delay before every read/write/remove.
    bool throw_on_save{false};      ///< write() throws std::runtime_error.
    bool throw_on_delete{false};    ///< remove() throws std::runtime_error.
    bool emit_initial{true};        ///< New feeds first receive the current document (or `{}`).
    bool dedupe_by_content{false};  ///< Feeds skip a payload equal to the last one delivered.
};

/// Parses the "store" section of a gateway config. Unknown keys are ignored.
/// @throws std::runtime_error naming the field on a type mismatch.
DOCGATE_UTILS_EXPORT StoreConfig store_config_from_json(const nlohmann::json &j);

class DOCGATE_UTILS_EXPORT InMemoryDocumentStore : public DocumentStore
{
  public:
    explicit InMemoryDocumentStore(StoreConfig config = {});
    ~InMemoryDocumentStore() override;

    InMemoryDocumentStore(const InMemoryDocumentStore &) = delete;
    InMemoryDocumentStore &operator=(const InMemoryDocumentStore &) = delete;

    /// @throws DocumentNotFound if @p key is absent.
    nlohmann::json read(const std::string &key) override;
    /// @return The stored document.
    nlohmann::json write(const std::string &key, const nlohmann::json &doc) override;
    void remove(const std::string &key) override;
    std::unique_ptr<FeedSubscription> watch(const std::string &key, FeedHandlers handlers) override;

    /// Completes every feed; any later call throws std::logic_error. Idempotent.
    void dispose();
    bool is_disposed() const noexcept;

    void set_config(const StoreConfig &config);
    StoreConfig config() const;

    // --- Test hooks ---

    /// Delivers @p error to every live feed of @p key (feeds stay open).
    void fail_feed(const std::string &key, std::exception_ptr error);
    /// Completes and drops every live feed of @p key.
    void close_feeds(const std::string &key);

    size_t subscriber_count(const std::string &key) const;
    size_t subscribe_calls() const noexcept;
    size_t cancel_calls() const noexcept;
    size_t size() const;

  private:
    struct State;
    class Subscription;
    std::shared_ptr<State> m_state;
};

} // namespace docgate::gateway
