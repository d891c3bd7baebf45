#pragma once
/**
 * @file gateway_config.hpp
 * @brief Gateway configuration: defaults, JSON file, environment overrides.
 *
 * Loading order (low → high priority):
 *  1. Built-in defaults (the field initializers below)
 *  2. The JSON config file, when one is given
 *  3. DOCGATE_COLLECTION / DOCGATE_ID_KEY / DOCGATE_LOG_LEVEL
 *
 * Example file:
 * @code{.json}
 * {
 *   "collection": "users",
 *   "id_key": "id",
 *   "read_after_write": true,
 *   "treat_empty_as_missing": true,
 *   "serialize_writes": true,
 *   "log_level": "debug",
 *   "log_file": "logs/docgate.log",
 *   "store": { "latency_ms": 0, "emit_initial": true }
 * }
 * @endcode
 */
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "docgate_utils_export.h"
#include "gateway/document_gateway.hpp"
#include "gateway/in_memory_document_store.hpp"

namespace docgate::gateway
{

struct GatewayConfig
{
    std::string collection = "documents";
    std::string id_key = "id";
    bool read_after_write = false;
    bool treat_empty_as_missing = false;
    bool serialize_writes = true;
    std::string log_level = "info";
    std::string log_file; ///< Empty: log to the console.
    StoreConfig store;
};

/**
 * @brief Builds a config from a parsed JSON document layered over the defaults.
 *        Environment overrides are not applied.
 * @throws std::runtime_error naming the offending field.
 */
DOCGATE_UTILS_EXPORT GatewayConfig gateway_config_from_json(const nlohmann::json &j);

/**
 * @brief Reads @p path (skipped when empty), then applies the environment overrides.
 * @throws std::runtime_error if the file cannot be read or parsed, or a value is invalid.
 */
DOCGATE_UTILS_EXPORT GatewayConfig load_gateway_config(const std::filesystem::path &path);

/// Sets the logger level and, when `log_file` is set, switches to a file sink.
/// @return false if the file sink could not be installed.
DOCGATE_UTILS_EXPORT bool apply_logging_config(const GatewayConfig &cfg);

DOCGATE_UTILS_EXPORT GatewayOptions to_gateway_options(const GatewayConfig &cfg);

} // namespace docgate::gateway
