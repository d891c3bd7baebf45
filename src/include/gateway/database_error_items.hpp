#pragma once
/**
 * @file database_error_items.hpp
 * @brief Catalog of database-related ErrorItems (codes prefixed `DB_`).
 *
 * Every entry carries `meta.source == "Database"` so logs can be filtered by origin.
 */
#include <string>
#include <string_view>

#include "docgate_utils_export.h"
#include "gateway/error_item.hpp"

namespace docgate::gateway
{

struct DOCGATE_UTILS_EXPORT DatabaseErrorItems
{
    static constexpr const char *kSourceKey = "source";
    static constexpr const char *kSourceValue = "Database";

    static ErrorItem connection_failed();
    static ErrorItem unavailable();
    static ErrorItem unauthorized();
    static ErrorItem forbidden();
    static ErrorItem not_found();
    static ErrorItem already_exists();
    static ErrorItem conflict();
    static ErrorItem constraint_violation();
    static ErrorItem validation_failed();
    static ErrorItem serialization_error();
    static ErrorItem timeout();
    static ErrorItem quota_exceeded();
    static ErrorItem transaction_failed();
    static ErrorItem deadlock();
    static ErrorItem stream_closed();

    /// Fallback entry (`DB_UNKNOWN`); @p reason replaces the default description.
    static ErrorItem unknown(std::string_view reason = {});

    /// Catalog lookup by code; unrecognized codes yield unknown() naming the code.
    static ErrorItem from_code(std::string_view code);
};

} // namespace docgate::gateway
