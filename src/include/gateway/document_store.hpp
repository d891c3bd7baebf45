#pragma once
/**
 * @file document_store.hpp
 * @brief Backend document store interface consumed by the gateway.
 *
 * Every call may throw; the gateway converts exceptions into ErrorItems.
 */
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"

namespace docgate::gateway
{

/// Thrown by stores when a read targets a document that does not exist.
class DOCGATE_UTILS_EXPORT DocumentNotFound : public std::runtime_error
{
  public:
    explicit DocumentNotFound(const std::string &key)
        : std::runtime_error("document not found: " + key), m_key(key)
    {
    }
    const std::string &key() const noexcept { return m_key; }

  private:
    std::string m_key;
};

/**
 * @brief Callbacks of one live feed. on_error and on_done may each be called at
 *        most once; nothing is delivered after on_done.
 */
struct FeedHandlers
{
    std::function<void(const nlohmann::json &)> on_next;
    std::function<void(std::exception_ptr)> on_error;
    std::function<void()> on_done;
};

/// Handle of one live feed. cancel() stops delivery and is idempotent.
class DOCGATE_UTILS_EXPORT FeedSubscription
{
  public:
    virtual ~FeedSubscription() = default;
    virtual void cancel() = 0;
};

class DOCGATE_UTILS_EXPORT DocumentStore
{
  public:
    virtual ~DocumentStore() = default;

    /// Current document under @p key.
    virtual nlohmann::json read(const std::string &key) = 0;

    /**
     * @brief Stores @p doc under @p key.
     * @return The stored document as the backend acknowledges it, or null when
     *         the backend acknowledges without content.
     */
    virtual nlohmann::json write(const std::string &key, const nlohmann::json &doc) = 0;

    /// Removes @p key. Removing an absent key is not an error.
    virtual void remove(const std::string &key) = 0;

    /**
     * @brief Opens a live feed of the document under @p key.
     *
     * Handlers may be invoked from any thread, including synchronously from
     * within this call.
     */
    virtual std::unique_ptr<FeedSubscription> watch(const std::string &key,
                                                    FeedHandlers handlers) = 0;
};

} // namespace docgate::gateway
