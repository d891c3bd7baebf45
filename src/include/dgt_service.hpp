#pragma once
/**
 * @file dgt_service.hpp
 * @brief Layer 2: Service modules built on dgt_base.
 *
 * Provides the asynchronous Logger and the per-key FIFO executor.
 */
#include "dgt_base.hpp"

#include "utils/logger.hpp"
#include "utils/keyed_fifo_executor.hpp"
