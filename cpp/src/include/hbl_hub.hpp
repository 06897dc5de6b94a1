#pragma once
/**
 * @file hbl_hub.hpp
 * @brief Layer 3: Hub session and command execution engine.
 *
 * Data model, error taxonomy, transport interfaces, cache, discovery,
 * connection management, the command queue, the session facade and its
 * configuration. Concrete ZeroMQ transports live in hub/zmq_transport.hpp and
 * are included only by the composition root.
 */
#include "hbl_service.hpp"

#include "hub/hub_types.hpp"
#include "hub/hub_error.hpp"
#include "hub/hub_messages.hpp"
#include "hub/hub_transport.hpp"
#include "hub/cache_store.hpp"
#include "hub/discovery_coordinator.hpp"
#include "hub/connection_manager.hpp"
#include "hub/command_queue.hpp"
#include "hub/session_config.hpp"
#include "hub/hub_session.hpp"
