#pragma once
/**
 * @file error_mapper.hpp
 * @brief Converts thrown exceptions and business-error payloads into ErrorItems.
 */
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"
#include "gateway/error_item.hpp"

namespace docgate::gateway
{

/**
 * @class ErrorMapper
 * @brief Injected error translation used by the gateway and the repository.
 *
 * Implementations must be pure and must not throw.
 */
class DOCGATE_UTILS_EXPORT ErrorMapper
{
  public:
    virtual ~ErrorMapper() = default;

    /// Map a caught exception. @p location names the operation that failed.
    virtual ErrorItem from_exception(std::exception_ptr error,
                                     std::string_view location) const noexcept = 0;

    /// Extract a business error encoded in a successful payload, or nullopt.
    virtual std::optional<ErrorItem> from_payload(const nlohmann::json &payload,
                                                  std::string_view location) const noexcept = 0;
};

/// JSON key names and fallback codes understood by DefaultErrorMapper.
struct ErrorMapperKeys
{
    std::string error_key = "error";
    std::string code_key = "code";
    std::string title_key = "title";
    std::string description_key = "description";
    std::string message_key = "message";
    std::string meta_key = "meta";
    std::string error_level_key = "errorLevel";
    std::string ok_key = "ok";
    std::string success_key = "success";
    std::string unexpected_code = "ERR_UNEXPECTED";
    std::string payload_code = "ERR_PAYLOAD";
};

/**
 * @class DefaultErrorMapper
 * @brief Conservative mapper.
 *
 * A payload is treated as a business error when, checked in this order:
 *  1. it has a nested object under `error`;
 *  2. it has a top-level `code` together with `message` or `description`;
 *  3. it has `ok: false` or `success: false`.
 *
 * Exceptions become `Unexpected error` / `ERR_UNEXPECTED` at Severe level with
 * `meta = {location, type}`.
 */
class DOCGATE_UTILS_EXPORT DefaultErrorMapper : public ErrorMapper
{
  public:
    DefaultErrorMapper() = default;
    explicit DefaultErrorMapper(ErrorMapperKeys keys);

    ErrorItem from_exception(std::exception_ptr error,
                             std::string_view location) const noexcept override;

    std::optional<ErrorItem> from_payload(const nlohmann::json &payload,
                                          std::string_view location) const noexcept override;

    const ErrorMapperKeys &keys() const noexcept { return m_keys; }

  private:
    ErrorMapperKeys m_keys;
};

} // namespace docgate::gateway
