#pragma once
/**
 * @file hbl_service.hpp
 * @brief Layer 2: Service modules built on hbl_base.
 *
 * Provides logging, retry backoff strategies and the persistent key-value store.
 */
#include "hbl_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/key_value_store.hpp"
#include "utils/logger.hpp"
