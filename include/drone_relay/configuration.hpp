// === Configuration ===========================================================
//
// Strongly-typed configuration for the relay: logging, simulator, broadcast
// hub and hardware settings. `ConfigurationLoader` translates environment
// variables into these structures so downstream modules never touch
// `std::getenv` directly.

#pragma once

#include <string>

#include "drone_relay/broadcast_hub.hpp"
#include "drone_relay/hardware_adapter.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/state_simulator.hpp"

namespace drone_relay {

/**
 * @brief Runtime knobs for one relay process.
 *
 * Every field is populated by ConfigurationLoader; consumers treat the values
 * as authoritative.
 */
struct Configuration final {
    LoggingOptions logging{};     /**< Log directory and per-sink verbosity. */
    SimulatorConfig simulator{};  /**< State simulator settings. */
    HubConfig hub{};              /**< Channel queues and cadences. */
    HardwareConfig hardware{};    /**< Adapter selection and mock generator. */
};

/** @brief Hydrates Configuration from environment variables. */
class ConfigurationLoader final {
  public:
    static Configuration load();
};

}  // namespace drone_relay
