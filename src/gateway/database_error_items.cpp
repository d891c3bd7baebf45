#include "dgt_base.hpp"
#include "gateway/database_error_items.hpp"

#include <array>
#include <utility>

namespace docgate::gateway
{

namespace
{

ErrorItem db_item(const char *title, const char *code, const char *description, ErrorLevel level)
{
    return ErrorItem{title, code, description, level,
                     nlohmann::json{{DatabaseErrorItems::kSourceKey,
                                     DatabaseErrorItems::kSourceValue}}};
}

} // namespace

ErrorItem DatabaseErrorItems::connection_failed()
{
    return db_item("Database Connection Failed", "DB_CONN_FAILED",
                   "Unable to establish a connection with the database.", ErrorLevel::Danger);
}

ErrorItem DatabaseErrorItems::unavailable()
{
    return db_item("Database Unavailable", "DB_UNAVAILABLE",
                   "The database service is temporarily unavailable.", ErrorLevel::Severe);
}

ErrorItem DatabaseErrorItems::unauthorized()
{
    return db_item("Database Unauthorized", "DB_UNAUTHORIZED",
                   "Authentication failed when accessing the database.", ErrorLevel::Severe);
}

ErrorItem DatabaseErrorItems::forbidden()
{
    return db_item("Database Forbidden", "DB_FORBIDDEN",
                   "You do not have permission to perform this operation.", ErrorLevel::Severe);
}

ErrorItem DatabaseErrorItems::not_found()
{
    return db_item("Record Not Found", "DB_NOT_FOUND",
                   "The requested record does not exist in the database.", ErrorLevel::Warning);
}

ErrorItem DatabaseErrorItems::already_exists()
{
    return db_item("Record Already Exists", "DB_ALREADY_EXISTS",
                   "A record with the same identifier already exists.", ErrorLevel::Warning);
}

ErrorItem DatabaseErrorItems::conflict()
{
    return db_item("Concurrency Conflict", "DB_CONFLICT",
                   "The record was modified concurrently by another process.", ErrorLevel::Warning);
}

ErrorItem DatabaseErrorItems::constraint_violation()
{
    return db_item("Constraint Violation", "DB_CONSTRAINT_VIOLATION",
                   "The operation violates a database constraint.", ErrorLevel::Warning);
}

ErrorItem DatabaseErrorItems::validation_failed()
{
    return db_item("Validation Failed", "DB_VALIDATION_FAILED",
                   "The provided data is invalid or does not match the schema.", ErrorLevel::Warning);
}

ErrorItem DatabaseErrorItems::serialization_error()
{
    return db_item("Serialization Error", "DB_SERIALIZATION_ERROR",
                   "Failed to serialize or deserialize the data.", ErrorLevel::Severe);
}

ErrorItem DatabaseErrorItems::timeout()
{
    return db_item("Database Timeout", "DB_TIMEOUT", "The database operation timed out.",
                   ErrorLevel::Warning);
}

ErrorItem DatabaseErrorItems::quota_exceeded()
{
    return db_item("Quota Exceeded", "DB_QUOTA_EXCEEDED",
                   "The operation failed due to exceeded storage or quota limits.",
                   ErrorLevel::Severe);
}

ErrorItem DatabaseErrorItems::transaction_failed()
{
    return db_item("Transaction Failed", "DB_TRANSACTION_FAILED",
                   "The database transaction could not be completed and was rolled back.",
                   ErrorLevel::Severe);
}

ErrorItem DatabaseErrorItems::deadlock()
{
    return db_item("Deadlock Detected", "DB_DEADLOCK",
                   "The operation was aborted due to a detected deadlock.", ErrorLevel::Severe);
}

ErrorItem DatabaseErrorItems::stream_closed()
{
    return db_item("Stream Closed", "DB_STREAM_CLOSED",
                   "The database stream was closed unexpectedly.", ErrorLevel::Warning);
}

ErrorItem DatabaseErrorItems::unknown(std::string_view reason)
{
    auto item = db_item("Unknown Database Error", "DB_UNKNOWN",
                        "An unknown database error has occurred.", ErrorLevel::SystemInfo);
    if (!reason.empty())
        item.description = std::string(reason);
    return item;
}

ErrorItem DatabaseErrorItems::from_code(std::string_view code)
{
    using Factory = ErrorItem (*)();
    static constexpr std::array<std::pair<std::string_view, Factory>, 15> kByCode{{
        {"DB_CONN_FAILED", &DatabaseErrorItems::connection_failed},
        {"DB_UNAVAILABLE", &DatabaseErrorItems::unavailable},
        {"DB_UNAUTHORIZED", &DatabaseErrorItems::unauthorized},
        {"DB_FORBIDDEN", &DatabaseErrorItems::forbidden},
        {"DB_NOT_FOUND", &DatabaseErrorItems::not_found},
        {"DB_ALREADY_EXISTS", &DatabaseErrorItems::already_exists},
        {"DB_CONFLICT", &DatabaseErrorItems::conflict},
        {"DB_CONSTRAINT_VIOLATION", &DatabaseErrorItems::constraint_violation},
        {"DB_VALIDATION_FAILED", &DatabaseErrorItems::validation_failed},
        {"DB_SERIALIZATION_ERROR", &DatabaseErrorItems::serialization_error},
        {"DB_TIMEOUT", &DatabaseErrorItems::timeout},
        {"DB_QUOTA_EXCEEDED", &DatabaseErrorItems::quota_exceeded},
        {"DB_TRANSACTION_FAILED", &DatabaseErrorItems::transaction_failed},
        {"DB_DEADLOCK", &DatabaseErrorItems::deadlock},
        {"DB_STREAM_CLOSED", &DatabaseErrorItems::stream_closed},
    }};
    for (const auto &[known, factory] : kByCode)
    {
        if (known == code)
            return factory();
    }
    return unknown(fmt::format("Unrecognized Database code: {}", code));
}

} // namespace docgate::gateway
