#pragma once
/**
 * @file dgt_gateway.hpp
 * @brief Layer 3: Document gateway built on dgt_service.
 *
 * Structured errors and their mapping, the backend store interface with its
 * in-memory implementation, the shared per-key watch channels, the reactive
 * gateway itself, its configuration and the typed repository on top.
 */
#include "dgt_service.hpp"

#include <nlohmann/json.hpp>

#include "gateway/error_item.hpp"
#include "gateway/database_error_items.hpp"
#include "gateway/error_mapper.hpp"
#include "gateway/document_store.hpp"
#include "gateway/in_memory_document_store.hpp"
#include "gateway/watch_view.hpp"
#include "gateway/shared_keyed_channel.hpp"
#include "gateway/channel_registry.hpp"
#include "gateway/gateway_config.hpp"
#include "gateway/document_gateway.hpp"
#include "gateway/serializing_repository.hpp"
