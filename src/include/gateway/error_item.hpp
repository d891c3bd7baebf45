#pragma once
/**
 * @file error_item.hpp
 * @brief Structured error record returned (never thrown) across the gateway boundary.
 */
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"
#include "utils/result.hpp"

namespace docgate::gateway
{

/// Severity of an ErrorItem, lowest first.
enum class ErrorLevel
{
    SystemInfo,
    Warning,
    Severe,
    Danger,
};

/// "systemInfo" | "warning" | "severe" | "danger".
DOCGATE_UTILS_EXPORT const char *to_string(ErrorLevel level) noexcept;

/// Inverse of to_string(); unknown names map to SystemInfo.
DOCGATE_UTILS_EXPORT ErrorLevel error_level_from_string(std::string_view name) noexcept;

/**
 * @struct ErrorItem
 * @brief title / code / description plus a severity and a free-form JSON meta object.
 */
struct DOCGATE_UTILS_EXPORT ErrorItem
{
    std::string title;
    std::string code;
    std::string description;
    ErrorLevel level{ErrorLevel::SystemInfo};
    nlohmann::json meta = nlohmann::json::object();

    /// Copy with meta[key] = value added (or replaced).
    [[nodiscard]] ErrorItem with_meta(const std::string &key, nlohmann::json value) const;

    /// `title (code): description | Meta: {...} | Level: name`; the meta segment is
    /// omitted when meta is empty.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ErrorItem &, const ErrorItem &) = default;
};

DOCGATE_UTILS_EXPORT void to_json(nlohmann::json &j, const ErrorItem &e);
DOCGATE_UTILS_EXPORT void from_json(const nlohmann::json &j, ErrorItem &e);

/// Success value or structured error; the result type of every gateway operation.
template <typename T> using DocResult = Result<T, ErrorItem>;

} // namespace docgate::gateway
